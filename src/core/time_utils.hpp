#pragma once

#include <string>
#include <core/utils.hpp>

// Human-readable renderings of the ISO local timestamps keepsake stores.
// Empty input renders as "-", unparseable input as "?".

// Elapsed time between two timestamps, "2h35m" / "14m22s" / "8s".
// An empty end_time means "until now" (a run still in progress).
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Clock time only, "2:35pm".
std::string format_timestamp(const std::string& iso_time);

// "1/15/25 2:35pm", used for resumable-session info.
std::string format_short_datetime(const std::string& iso_time);

// "in 2h15m", "in 45s", or "now" once due.
std::string format_until(TimePoint target, TimePoint now);
