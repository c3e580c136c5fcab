#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <ctime>

// Local broken-down time for an ISO string; false if it does not parse.
static bool local_tm(const std::string& iso, struct tm& out) {
    std::time_t t = parse_iso_time(iso);
    if (t == 0) return false;
    return localtime_r(&t, &out) != nullptr;
}

// Largest two units only: "2h15m", "4m10s", "9s"
static std::string compact_span(long long seconds) {
    if (seconds < 0) seconds = 0;
    long long h = seconds / 3600;
    long long m = seconds / 60 % 60;
    long long s = seconds % 60;
    if (h > 0) return fmt::format("{}h{}m", h, m);
    if (m > 0) return fmt::format("{}m{}s", m, s);
    return fmt::format("{}s", s);
}

// 12-hour clock without a leading zero: "8:13pm"
static std::string clock_12h(const struct tm& when) {
    int hour = when.tm_hour % 12;
    if (hour == 0) hour = 12;
    return fmt::format("{}:{:02d}{}", hour, when.tm_min, when.tm_hour < 12 ? "am" : "pm");
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    std::time_t start = parse_iso_time(start_time);
    if (start == 0) return "?";

    std::time_t end = std::time(nullptr);
    if (!end_time.empty()) {
        end = parse_iso_time(end_time);
        if (end == 0) return "?";
    }
    return compact_span(static_cast<long long>(std::difftime(end, start)));
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";
    struct tm when = {};
    if (!local_tm(iso_time, when)) return "?";
    return clock_12h(when);
}

std::string format_short_datetime(const std::string& iso_time) {
    if (iso_time.empty()) return "-";
    struct tm when = {};
    if (!local_tm(iso_time, when)) return "?";
    return fmt::format("{}/{}/{:02d} {}", when.tm_mon + 1, when.tm_mday,
                       when.tm_year % 100, clock_12h(when));
}

std::string format_until(TimePoint target, TimePoint now) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(target - now).count();
    if (secs <= 0) return "now";
    return "in " + compact_span(secs);
}
