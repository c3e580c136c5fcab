#pragma once

#include <string>
#include <chrono>
#include <ctime>

using TimePoint = std::chrono::system_clock::time_point;

// Timestamps are stored as local time, "YYYY-MM-DDTHH:MM:SS", no zone.
std::string to_iso(TimePoint tp);
std::string now_iso();

// 0 when `iso` is not in the stored format.
std::time_t parse_iso_time(const std::string& iso);

// Random RFC 4122 version-4 identifier, used for session and device ids.
std::string generate_uuid();

// Whole-string decimal parse; `fallback` for empty, partial or out-of-range input.
int safe_stoi(const std::string& s, int fallback = 0);

inline int clamp_int(int v, int lo, int hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

// In-place strip of spaces, tabs and line endings.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
