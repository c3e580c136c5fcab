#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>
#include <core/utils.hpp>

// Next time a backup should run under `policy`.
//   Disabled  -> nullopt
//   Interval  -> last_run + h, or now + h when there is no previous run
//   Weekly    -> first hour:minute on a selected day that is strictly after now,
//                scanning today and the following 7 days; nullopt if no days
// Pure: the same inputs always give the same answer.
std::optional<TimePoint> next_run_at(const SchedulePolicy& policy, TimePoint now,
                                     std::optional<TimePoint> last_run);

// Human summary: "Every 6 hours", "Weekdays at 02:00", "Mon, Wed, Fri at 02:00"...
std::string describe(const SchedulePolicy& policy);

// Pull out-of-range fields back into their valid ranges.
SchedulePolicy clamp_policy(SchedulePolicy policy);

// ── Weekday / type names ────────────────────────────────────

std::string weekday_short_name(Weekday day);             // "Mon"
std::string weekday_key(Weekday day);                    // "mon" (config spelling)
std::optional<Weekday> parse_weekday(const std::string& s);

// Accepts "mon,wed,fri", "daily", "weekdays" or "weekends".
Result<std::set<Weekday>> parse_weekday_list(const std::string& s);

std::string schedule_type_name(ScheduleType type);
std::optional<ScheduleType> parse_schedule_type(const std::string& s);

// ── Command-line edits ───────────────────────────────────────

// "02:30" -> {2, 30}; nullopt when malformed or out of range.
std::optional<std::pair<int, int>> parse_time_of_day(const std::string& s);

// Apply `schedule ...` arguments to a policy:
//   off | interval <hours> | weekly <HH:MM> [days] | battery on|off
Result<SchedulePolicy> apply_schedule_args(SchedulePolicy policy,
                                           const std::vector<std::string>& args);
