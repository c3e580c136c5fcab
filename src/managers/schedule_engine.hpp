#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <platform/power.hpp>
#include "notifier.hpp"
#include "run_controller.hpp"
#include "session_orchestrator.hpp"
#include "state_store.hpp"

enum class TriggerResult {
    Started,
    Resumed,
    SkippedRunning,     // a run was already active
    SkippedBattery,     // skip_on_battery and no external power
    Failed,             // start/resume refused
};

const char* trigger_result_name(TriggerResult r);

// Fires unattended backups according to a SchedulePolicy.
//
// One timer thread sleeps until the armed deadline and performs every
// scheduled firing. The deadline is recomputed with next_run_at() on policy
// changes, run completion and wake from sleep. last_run_at is persisted in
// the app state; next_run_at never is.
class ScheduleEngine {
public:
    using Clock = std::function<TimePoint()>;

    ScheduleEngine(SchedulePolicy policy, RunController& runs, PowerSource& power,
                   Notifier& notifier, StateStore& state,
                   Clock clock = [] { return std::chrono::system_clock::now(); });
    ~ScheduleEngine();

    ScheduleEngine(const ScheduleEngine&) = delete;
    ScheduleEngine& operator=(const ScheduleEngine&) = delete;

    // Start/stop the timer thread. The engine is armed from construction;
    // without the thread nothing fires on its own.
    void start();
    void stop();

    void set_policy(const SchedulePolicy& policy);
    SchedulePolicy policy() const;

    // A scheduled occurrence: runs the guard chain, then resumes or starts.
    TriggerResult trigger();

    // User-initiated: no battery check, no notifications.
    Result<void> trigger_manual();

    // Fire a missed occurrence, or re-arm.
    void handle_wake();

    // Completion hook: record last_run_at, notify, re-arm.
    void handle_run_finished(const RunOutcome& outcome);

    std::optional<TimePoint> next_run_at() const;
    std::optional<TimePoint> last_run_at() const;
    bool armed() const;

private:
    void rearm_locked(TimePoint now);
    void rearm_after_skip_locked(TimePoint now, bool consume_occurrence);
    void rearm_on_wake_locked(TimePoint now);
    bool claim_due_locked(TimePoint now);
    void fire();
    void timer_loop();

    RunController& runs_;
    PowerSource& power_;
    Notifier& notifier_;
    StateStore& state_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SchedulePolicy policy_;
    std::optional<TimePoint> last_run_;
    std::optional<TimePoint> next_run_;
    bool armed_ = false;
    bool firing_ = false;
    bool running_ = false;
    std::thread thread_;
};
