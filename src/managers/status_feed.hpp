#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>

// Observable run state, without the log feeds.
struct RunStatus {
    std::string status_text = "Idle";
    int progress_value = 0;
    int progress_total = 0;
    SessionStats stats;
    bool running = false;
    bool paused = false;
    std::string resumable_info;     // "" when there is nothing to resume
};

struct StatusSnapshot {
    RunStatus status;
    std::vector<std::string> log_tail;      // most recent lines, oldest first
    std::vector<std::string> error_lines;
};

// Bounded log and error rings plus the latest RunStatus, delivered to
// observers at most once per refresh interval and only while visible.
class StatusFeed {
public:
    using Observer = std::function<void(const StatusSnapshot&)>;

    explicit StatusFeed(LogSettings settings = LogSettings{});
    ~StatusFeed();

    StatusFeed(const StatusFeed&) = delete;
    StatusFeed& operator=(const StatusFeed&) = delete;

    // ── Producers (any thread) ────────────────────────────────
    void set_status(const RunStatus& status);
    void append_log(const std::string& line);
    void append_error(const std::string& line);
    void clear_logs();

    // ── Consumers ─────────────────────────────────────────────
    StatusSnapshot snapshot() const;
    RunStatus status() const;
    std::vector<std::string> log_lines() const;     // full ring
    std::vector<std::string> error_lines() const;

    int subscribe(Observer observer);
    void unsubscribe(int token);

    // No deliveries while invisible; becoming visible forces one.
    void set_visible(bool visible);
    bool visible() const { return visible_; }

    // Background coalescing delivery.
    void start();
    void stop();

    // Deliver now if anything changed (used when no flusher thread runs).
    void flush();

private:
    void mark_dirty_locked();
    StatusSnapshot snapshot_locked() const;
    void deliver(const StatusSnapshot& snap);
    void flusher_loop();

    LogSettings settings_;
    int log_trim_batch_;
    int error_trim_batch_;

    mutable std::mutex mutex_;
    RunStatus status_;
    std::deque<std::string> log_;
    std::deque<std::string> errors_;
    bool dirty_ = false;

    std::mutex observers_mutex_;
    std::map<int, Observer> observers_;
    int next_token_ = 1;

    std::atomic<bool> visible_{true};
    std::atomic<bool> running_{false};
    std::condition_variable cv_;
    std::thread thread_;
};
