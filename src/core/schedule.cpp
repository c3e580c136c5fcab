#include "schedule.hpp"
#include "constants.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <sstream>

static const std::set<Weekday> kWeekdays = {
    Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday, Weekday::Thursday, Weekday::Friday};
static const std::set<Weekday> kWeekend = {Weekday::Saturday, Weekday::Sunday};
static const std::set<Weekday> kAllDays = {
    Weekday::Sunday, Weekday::Monday, Weekday::Tuesday, Weekday::Wednesday,
    Weekday::Thursday, Weekday::Friday, Weekday::Saturday};

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<TimePoint> next_run_at(const SchedulePolicy& policy, TimePoint now,
                                     std::optional<TimePoint> last_run) {
    switch (policy.type) {
    case ScheduleType::Disabled:
        return std::nullopt;

    case ScheduleType::Interval: {
        int hours = clamp_int(policy.interval_hours, MIN_INTERVAL_HOURS, MAX_INTERVAL_HOURS);
        TimePoint base = last_run ? *last_run : now;
        return base + std::chrono::hours(hours);
    }

    case ScheduleType::Weekly: {
        if (policy.days.empty()) return std::nullopt;

        std::time_t now_t = std::chrono::system_clock::to_time_t(now);
        struct tm today;
        localtime_r(&now_t, &today);

        for (int offset = 0; offset <= WEEKLY_LOOKAHEAD_DAYS; ++offset) {
            struct tm tm = today;
            tm.tm_mday += offset;
            tm.tm_hour = clamp_int(policy.hour, 0, 23);
            tm.tm_min = clamp_int(policy.minute, 0, 59);
            tm.tm_sec = 0;
            tm.tm_isdst = -1;
            std::time_t t = std::mktime(&tm);   // normalizes date and fills tm_wday
            if (t == static_cast<std::time_t>(-1)) continue;
            if (!policy.days.count(static_cast<Weekday>(tm.tm_wday))) continue;

            TimePoint candidate = std::chrono::system_clock::from_time_t(t);
            if (candidate > now) return candidate;
        }
        return std::nullopt;
    }
    }
    return std::nullopt;
}

std::string describe(const SchedulePolicy& policy) {
    switch (policy.type) {
    case ScheduleType::Disabled:
        return "Backups are not scheduled";
    case ScheduleType::Interval:
        return fmt::format("Every {} hour{}", policy.interval_hours,
                           policy.interval_hours == 1 ? "" : "s");
    case ScheduleType::Weekly:
        break;
    }

    std::string time = fmt::format("{:02d}:{:02d}", policy.hour, policy.minute);
    if (policy.days.empty()) return "No days selected";
    if (policy.days.size() == 7) return "Daily at " + time;
    if (policy.days == kWeekdays) return "Weekdays at " + time;
    if (policy.days == kWeekend) return "Weekends at " + time;

    std::string names;
    for (auto d : policy.days) {
        if (!names.empty()) names += ", ";
        names += weekday_short_name(d);
    }
    return names + " at " + time;
}

SchedulePolicy clamp_policy(SchedulePolicy policy) {
    policy.interval_hours = clamp_int(policy.interval_hours, MIN_INTERVAL_HOURS, MAX_INTERVAL_HOURS);
    policy.hour = clamp_int(policy.hour, 0, 23);
    policy.minute = clamp_int(policy.minute, 0, 59);
    return policy;
}

// ── Names ────────────────────────────────────────────────────

std::string weekday_short_name(Weekday day) {
    static const char* names[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    return names[static_cast<int>(day)];
}

std::string weekday_key(Weekday day) {
    return lower(weekday_short_name(day));
}

std::optional<Weekday> parse_weekday(const std::string& s) {
    std::string key = lower(s);
    trim(key);
    static const char* full[] = {"sunday", "monday", "tuesday", "wednesday",
                                 "thursday", "friday", "saturday"};
    for (auto d : kAllDays) {
        if (key == weekday_key(d) || key == full[static_cast<int>(d)]) return d;
    }
    return std::nullopt;
}

Result<std::set<Weekday>> parse_weekday_list(const std::string& s) {
    std::string key = lower(s);
    trim(key);
    if (key == "daily" || key == "all") return Result<std::set<Weekday>>::Ok(kAllDays);
    if (key == "weekdays") return Result<std::set<Weekday>>::Ok(kWeekdays);
    if (key == "weekends") return Result<std::set<Weekday>>::Ok(kWeekend);

    std::set<Weekday> days;
    std::istringstream iss(key);
    std::string token;
    while (std::getline(iss, token, ',')) {
        trim(token);
        if (token.empty()) continue;
        auto day = parse_weekday(token);
        if (!day) {
            return Result<std::set<Weekday>>::Err("Unknown day: " + token);
        }
        days.insert(*day);
    }
    if (days.empty()) {
        return Result<std::set<Weekday>>::Err("No days given");
    }
    return Result<std::set<Weekday>>::Ok(days);
}

std::string schedule_type_name(ScheduleType type) {
    switch (type) {
    case ScheduleType::Disabled: return "disabled";
    case ScheduleType::Interval: return "interval";
    case ScheduleType::Weekly:   return "weekly";
    }
    return "disabled";
}

std::optional<ScheduleType> parse_schedule_type(const std::string& s) {
    std::string key = lower(s);
    if (key == "disabled" || key == "off" || key == "none") return ScheduleType::Disabled;
    if (key == "interval") return ScheduleType::Interval;
    if (key == "weekly" || key == "scheduled") return ScheduleType::Weekly;
    return std::nullopt;
}

// ── Command-line edits ───────────────────────────────────────

std::optional<std::pair<int, int>> parse_time_of_day(const std::string& s) {
    auto colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon == s.size() - 1) return std::nullopt;
    std::string hh = s.substr(0, colon);
    std::string mm = s.substr(colon + 1);
    for (char c : hh + mm) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    int hour = safe_stoi(hh, -1);
    int minute = safe_stoi(mm, -1);
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) return std::nullopt;
    return std::make_pair(hour, minute);
}

Result<SchedulePolicy> apply_schedule_args(SchedulePolicy policy,
                                           const std::vector<std::string>& args) {
    using R = Result<SchedulePolicy>;
    if (args.empty()) return R::Err("Missing schedule arguments");

    std::string verb = lower(args[0]);
    if (verb == "off" || verb == "disabled") {
        policy.type = ScheduleType::Disabled;
        return R::Ok(policy);
    }

    if (verb == "interval") {
        if (args.size() < 2) return R::Err("Usage: schedule interval <hours>");
        int hours = safe_stoi(args[1], 0);
        if (hours < MIN_INTERVAL_HOURS || hours > MAX_INTERVAL_HOURS) {
            return R::Err(fmt::format("Interval must be {}-{} hours", MIN_INTERVAL_HOURS,
                                      MAX_INTERVAL_HOURS));
        }
        policy.type = ScheduleType::Interval;
        policy.interval_hours = hours;
        return R::Ok(policy);
    }

    if (verb == "weekly") {
        if (args.size() < 2) return R::Err("Usage: schedule weekly <HH:MM> [days]");
        auto tod = parse_time_of_day(args[1]);
        if (!tod) return R::Err("Invalid time: " + args[1] + " (expected HH:MM)");
        if (args.size() >= 3) {
            auto days = parse_weekday_list(args[2]);
            if (days.is_err()) return R::Err(days.error);
            policy.days = days.value;
        }
        policy.type = ScheduleType::Weekly;
        policy.hour = tod->first;
        policy.minute = tod->second;
        return R::Ok(policy);
    }

    if (verb == "battery") {
        std::string v = args.size() >= 2 ? lower(args[1]) : "";
        if (v == "on" || v == "skip") {
            policy.skip_on_battery = true;
        } else if (v == "off" || v == "allow") {
            policy.skip_on_battery = false;
        } else {
            return R::Err("Usage: schedule battery on|off");
        }
        return R::Ok(policy);
    }

    return R::Err("Unknown schedule option: " + args[0]);
}
