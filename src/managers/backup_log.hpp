#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <filesystem>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::mutex& keepsake_log_mutex() {
    static std::mutex m;
    return m;
}

inline std::string keepsake_log_path() {
    static std::string path = (platform::temp_dir() / "keepsake_debug.log").string();
    return path;
}

// Persistent session log path: ~/.keepsake/logs/{session_id}.log
inline std::string session_log_path(const std::string& session_id) {
    return (platform::home_dir() / ".keepsake" / "logs" / (session_id + ".log")).string();
}

// Append a timestamped line to a session's persistent log file.
inline void append_session_log(const std::string& session_id, const std::string& msg) {
    if (session_id.empty()) return;
    std::lock_guard<std::mutex> lock(keepsake_log_mutex());
    std::string path = session_log_path(session_id);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void keepsake_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(keepsake_log_mutex());
    std::ofstream out(keepsake_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] ", tm_buf.tm_hour, tm_buf.tm_min,
                       tm_buf.tm_sec, static_cast<int>(ms.count()))
        << msg << "\n";
}
