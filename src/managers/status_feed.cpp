#include "status_feed.hpp"
#include "backup_log.hpp"
#include <core/constants.hpp>
#include <algorithm>
#include <chrono>

static int trim_batch_for(int cap, int batch) {
    return std::max(1, std::min(batch, cap / 20));
}

static void push_bounded(std::deque<std::string>& ring, const std::string& line,
                         int cap, int batch) {
    ring.push_back(line);
    if (static_cast<int>(ring.size()) > cap) {
        // Drop a batch at once so trimming is rare
        size_t drop = std::min(ring.size(), static_cast<size_t>(ring.size() - cap + batch));
        ring.erase(ring.begin(), ring.begin() + static_cast<long>(drop));
    }
}

StatusFeed::StatusFeed(LogSettings settings)
    : settings_(settings),
      log_trim_batch_(trim_batch_for(settings.max_lines, LOG_TRIM_BATCH)),
      error_trim_batch_(trim_batch_for(settings.max_error_lines, ERROR_TRIM_BATCH)) {}

StatusFeed::~StatusFeed() {
    stop();
}

// ── Producers ───────────────────────────────────────────────

void StatusFeed::set_status(const RunStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
    mark_dirty_locked();
}

void StatusFeed::append_log(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_bounded(log_, line, settings_.max_lines, log_trim_batch_);
    mark_dirty_locked();
}

void StatusFeed::append_error(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    push_bounded(errors_, line, settings_.max_error_lines, error_trim_batch_);
    mark_dirty_locked();
}

void StatusFeed::clear_logs() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.clear();
    errors_.clear();
    mark_dirty_locked();
}

void StatusFeed::mark_dirty_locked() {
    dirty_ = true;
}

// ── Consumers ───────────────────────────────────────────────

StatusSnapshot StatusFeed::snapshot_locked() const {
    StatusSnapshot snap;
    snap.status = status_;
    size_t tail = std::min(log_.size(), static_cast<size_t>(DISPLAY_LOG_LINES));
    snap.log_tail.assign(log_.end() - static_cast<long>(tail), log_.end());
    snap.error_lines.assign(errors_.begin(), errors_.end());
    return snap;
}

StatusSnapshot StatusFeed::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

RunStatus StatusFeed::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::vector<std::string> StatusFeed::log_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(log_.begin(), log_.end());
}

std::vector<std::string> StatusFeed::error_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(errors_.begin(), errors_.end());
}

int StatusFeed::subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    int token = next_token_++;
    observers_[token] = std::move(observer);
    return token;
}

void StatusFeed::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(token);
}

void StatusFeed::set_visible(bool visible) {
    bool was = visible_.exchange(visible);
    if (visible && !was) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dirty_ = true;
        }
        flush();
    }
}

// ── Delivery ────────────────────────────────────────────────

void StatusFeed::deliver(const StatusSnapshot& snap) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    for (auto& [token, observer] : observers_) {
        try {
            observer(snap);
        } catch (const std::exception& e) {
            keepsake_log("status_feed: observer " + std::to_string(token) + " threw: " + e.what());
        }
    }
}

void StatusFeed::flush() {
    if (!visible_) return;
    StatusSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!dirty_) return;
        dirty_ = false;
        snap = snapshot_locked();
    }
    deliver(snap);
}

void StatusFeed::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&StatusFeed::flusher_loop, this);
}

void StatusFeed::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    flush();
}

void StatusFeed::flusher_loop() {
    auto interval = std::chrono::milliseconds(std::max(1, settings_.refresh_ms));
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval, [this] { return !running_; });
        }
        if (!running_) break;
        flush();
    }
}
