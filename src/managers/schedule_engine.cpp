#include "schedule_engine.hpp"
#include "backup_log.hpp"
#include <core/schedule.hpp>
#include <fmt/format.h>
#include <algorithm>

// Upper bound on one timer sleep, so wall-clock steps are noticed.
static constexpr auto kMaxTimerSleep = std::chrono::seconds(60);

const char* trigger_result_name(TriggerResult r) {
    switch (r) {
        case TriggerResult::Started:        return "started";
        case TriggerResult::Resumed:        return "resumed";
        case TriggerResult::SkippedRunning: return "skipped (already running)";
        case TriggerResult::SkippedBattery: return "skipped (on battery)";
        case TriggerResult::Failed:         return "failed";
    }
    return "unknown";
}

static std::string describe_time(const std::optional<TimePoint>& tp) {
    return tp ? to_iso(*tp) : std::string("never");
}

ScheduleEngine::ScheduleEngine(SchedulePolicy policy, RunController& runs, PowerSource& power,
                               Notifier& notifier, StateStore& state, Clock clock)
    : runs_(runs), power_(power), notifier_(notifier), state_(state),
      clock_(std::move(clock)), policy_(clamp_policy(policy)) {
    AppState app = state_.load();
    if (!app.last_run_at.empty()) {
        std::time_t t = parse_iso_time(app.last_run_at);
        if (t != 0) last_run_ = std::chrono::system_clock::from_time_t(t);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    rearm_locked(clock_());
}

ScheduleEngine::~ScheduleEngine() {
    stop();
}

// ── Timer thread ──────────────────────────────────────────────

void ScheduleEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&ScheduleEngine::timer_loop, this);
}

void ScheduleEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ScheduleEngine::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (!armed_ || !next_run_ || firing_) {
            cv_.wait(lock);
            continue;
        }
        TimePoint now = clock_();
        if (*next_run_ <= now) {
            lock.unlock();
            fire();
            lock.lock();
            continue;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*next_run_ - now);
        cv_.wait_for(lock, std::min<std::chrono::milliseconds>(remaining, kMaxTimerSleep));
    }
}

void ScheduleEngine::fire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!claim_due_locked(clock_())) return;
    }
    TriggerResult r = trigger();
    keepsake_log(fmt::format("schedule: fired, {}", trigger_result_name(r)));
    std::lock_guard<std::mutex> lock(mutex_);
    firing_ = false;
    cv_.notify_all();
}

bool ScheduleEngine::claim_due_locked(TimePoint now) {
    if (firing_ || !armed_ || !next_run_ || *next_run_ > now) return false;
    armed_ = false;
    firing_ = true;
    return true;
}

// ── Arming ────────────────────────────────────────────────────

void ScheduleEngine::rearm_locked(TimePoint now) {
    next_run_ = ::next_run_at(policy_, now, last_run_);
    armed_ = next_run_.has_value();
    keepsake_log(fmt::format("schedule: armed next={} last={}", describe_time(next_run_),
                             describe_time(last_run_)));
    cv_.notify_all();
}

void ScheduleEngine::rearm_after_skip_locked(TimePoint now, bool consume_occurrence) {
    auto next = ::next_run_at(policy_, now, last_run_);
    if (next && *next <= now) {
        // Stale interval deadline: firing again now would loop.
        if (consume_occurrence) {
            next = now + std::chrono::hours(policy_.interval_hours);
        } else {
            next_run_ = next;
            armed_ = false;
            keepsake_log("schedule: disarmed until the active run finishes");
            return;
        }
    }
    next_run_ = next;
    armed_ = next.has_value();
    keepsake_log(fmt::format("schedule: re-armed after skip, next={}", describe_time(next_run_)));
    cv_.notify_all();
}

void ScheduleEngine::rearm_on_wake_locked(TimePoint now) {
    auto next = ::next_run_at(policy_, now, last_run_);
    if (armed_ && next_run_ && next && *next <= now && *next < *next_run_) {
        // A skip already consumed the stale occurrence; keep its deadline.
        keepsake_log(fmt::format("schedule: wake, keeping next={}", describe_time(next_run_)));
        cv_.notify_all();
        return;
    }
    rearm_locked(now);
}

void ScheduleEngine::set_policy(const SchedulePolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = clamp_policy(policy);
    rearm_locked(clock_());
}

SchedulePolicy ScheduleEngine::policy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

// ── Triggers ──────────────────────────────────────────────────

TriggerResult ScheduleEngine::trigger() {
    TimePoint now = clock_();

    if (runs_.is_running()) {
        keepsake_log("schedule: occurrence skipped, a backup is already running");
        std::lock_guard<std::mutex> lock(mutex_);
        rearm_after_skip_locked(now, false);
        return TriggerResult::SkippedRunning;
    }

    SchedulePolicy current = policy();
    if (current.skip_on_battery && !power_.on_external_power()) {
        keepsake_log("schedule: occurrence skipped, on battery power");
        notifier_.backup_skipped("on battery power");
        std::lock_guard<std::mutex> lock(mutex_);
        rearm_after_skip_locked(now, true);
        return TriggerResult::SkippedBattery;
    }

    {
        // The completion hook re-arms; it may run before start() returns.
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = false;
    }

    notifier_.backup_started();
    bool resumable = runs_.has_resumable_session();
    auto started = resumable ? runs_.resume() : runs_.start();
    if (started.is_err()) {
        keepsake_log("schedule: could not start backup: " + started.error);
        notifier_.backup_error(started.error);
        std::lock_guard<std::mutex> lock(mutex_);
        rearm_after_skip_locked(now, true);
        return TriggerResult::Failed;
    }
    return resumable ? TriggerResult::Resumed : TriggerResult::Started;
}

Result<void> ScheduleEngine::trigger_manual() {
    if (runs_.is_running()) {
        return Result<void>::Err("A backup is already running");
    }
    return runs_.has_resumable_session() ? runs_.resume() : runs_.start();
}

void ScheduleEngine::handle_wake() {
    bool due = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_();
        due = claim_due_locked(now);
        if (!due && !firing_) {
            rearm_on_wake_locked(now);
        }
    }
    if (!due) return;

    keepsake_log("schedule: missed occurrence during sleep, firing now");
    trigger();
    std::lock_guard<std::mutex> lock(mutex_);
    firing_ = false;
    cv_.notify_all();
}

void ScheduleEngine::handle_run_finished(const RunOutcome& outcome) {
    TimePoint now = clock_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_run_ = now;
        rearm_locked(now);
    }

    state_.set_last_run_at(to_iso(now));

    if (outcome.dry_run) return;
    if (outcome.phase == SessionPhase::Errored) {
        notifier_.backup_error(outcome.error);
    } else {
        notifier_.backup_completed(outcome.stats);
    }
}

// ── Queries ───────────────────────────────────────────────────

std::optional<TimePoint> ScheduleEngine::next_run_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_run_;
}

std::optional<TimePoint> ScheduleEngine::last_run_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_run_;
}

bool ScheduleEngine::armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}
