#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <platform/power.hpp>
#include <platform/instance_lock.hpp>
#include <platform/wake_monitor.hpp>
#include "checkpoint_store.hpp"
#include "folder_mirror_engine.hpp"
#include "notifier.hpp"
#include "schedule_engine.hpp"
#include "session_orchestrator.hpp"
#include "state_store.hpp"
#include "status_feed.hpp"

// UI-ready view of the scheduler.
struct ScheduleSummary {
    std::string description;  // "Weekdays at 02:00"
    std::string next_run;     // "1/15/25 2:00am (in 5h10m)" or "-"
    std::string last_run;     // "1/14/25 2:03am" or "-"
    bool skip_on_battery = true;
};

// Headless service facade: owns every manager, can be used by any frontend.
class BackupService {
public:
    BackupService();
    explicit BackupService(Config config);
    ~BackupService();

    BackupService(const BackupService&) = delete;
    BackupService& operator=(const BackupService&) = delete;

    // ── Lifecycle ─────────────────────────────────────────────

    // Takes the instance lock and builds the managers.
    Result<void> init();
    bool initialized() const { return orchestrator_ != nullptr; }

    // Schedule timer, wake monitor and coalesced status delivery.
    void start_background();
    void stop_background();

    // Pause any active run, wait for its checkpoint, stop background threads.
    void shutdown();

    // ── Run control ───────────────────────────────────────────

    Result<void> start_backup();
    Result<void> start_dry_run();
    Result<void> resume();
    Result<void> run_now();         // resume if resumable, else start
    void pause();
    void stop();
    Result<void> reset(bool wipe_manifest);
    void wait_for_idle();

    bool is_running() const;
    SessionPhase phase() const;

    // ── Observation ───────────────────────────────────────────

    StatusSnapshot snapshot() const;
    std::vector<std::string> log_lines() const;
    std::vector<std::string> error_lines() const;
    int subscribe(StatusFeed::Observer observer);
    void unsubscribe(int token);
    void set_visible(bool visible);
    void set_notification_sink(Notifier::Sink sink);

    // ── Schedule ──────────────────────────────────────────────

    // Apply and persist to the config file.
    Result<void> set_schedule(const SchedulePolicy& policy);
    SchedulePolicy schedule() const;
    ScheduleSummary schedule_summary() const;

    // ── State queries ─────────────────────────────────────────

    const Config& config() const { return config_; }
    std::string device_id();

private:
    void on_run_finished(const RunOutcome& outcome);

    Config config_;
    std::string config_error_;
    std::unique_ptr<InstanceLock> lock_;
    std::unique_ptr<StateStore> state_;
    std::unique_ptr<FileCheckpointStore> checkpoints_;
    std::unique_ptr<FolderMirrorEngine> engine_;
    std::unique_ptr<StatusFeed> feed_;
    std::unique_ptr<Notifier> notifier_;
    std::unique_ptr<SystemPowerSource> power_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
    std::unique_ptr<ScheduleEngine> schedule_;
    std::unique_ptr<WakeMonitor> wake_;
    bool background_ = false;
};
