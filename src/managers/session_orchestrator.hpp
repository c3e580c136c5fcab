#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/types.hpp>
#include "checkpoint_store.hpp"
#include "event_classifier.hpp"
#include "run_controller.hpp"
#include "run_state.hpp"
#include "state_store.hpp"
#include "status_feed.hpp"
#include "transfer_engine.hpp"

namespace fs = std::filesystem;

enum class SessionPhase { Idle, Running, Paused, Completed, Cancelled, Errored };

const char* session_phase_name(SessionPhase phase);

// How a run ended, handed to the on_run_finished hook.
struct RunOutcome {
    SessionPhase phase = SessionPhase::Idle;
    bool dry_run = false;
    SessionStats stats;
    std::string error;              // Errored only
};

// Drives backup runs: owns the run-state flag, the classifier and the
// session being run, persists a checkpoint when a run pauses and publishes
// everything observable through the StatusFeed.
//
// The run itself executes on one background thread. Engine events, run
// completion and the public operations are serialized by one mutex, so the
// classifier and the session never see concurrent updates.
class SessionOrchestrator : public RunController {
public:
    // Builds engine options from current settings for a device id.
    using OptionsBuilder = std::function<TransferOptions(const std::string& device_id, bool dry_run)>;
    using FinishedHook = std::function<void(const RunOutcome&)>;

    SessionOrchestrator(TransferEngine& engine, CheckpointStore& checkpoints,
                        StateStore& state, StatusFeed& feed, OptionsBuilder options,
                        fs::path cache_dir);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // ── Run control ───────────────────────────────────────────

    // Fresh run: discards any checkpoint first.
    Result<void> start() override;

    // Plan-only run; leaves an existing checkpoint alone.
    Result<void> start_dry_run();

    // Continue the checkpointed session. Refused when the saved settings no
    // longer match; the checkpoint is kept in that case.
    Result<void> resume() override;

    void pause();

    // Graceful stop: finishes the current item and keeps the session resumable.
    void cancel();

    // Delete the checkpoint, clear caches and counters, mint a new device id.
    // Only allowed while idle.
    Result<void> reset(bool wipe_manifest = false);

    // Pause any active run and wait until it has written its checkpoint.
    void shutdown();

    // Block until the background run (if any) has finished.
    void wait_for_idle();

    // ── Queries ───────────────────────────────────────────────

    bool is_running() const override;
    bool has_resumable_session() override;

    // Reload the checkpoint and refresh the resumable summary.
    void check_for_resumable_session();

    SessionPhase phase() const;
    SessionStats stats() const;
    RunStatus status() const;
    std::string device_id();

    void set_on_run_finished(FinishedHook hook);

private:
    enum class RunKind { Fresh, Resume, DryRun };

    Result<void> launch_locked(RunKind kind, SessionCheckpoint session,
                               std::optional<SessionCheckpoint> resume_from);
    void run_task(RunKind kind, TransferOptions options,
                  std::optional<SessionCheckpoint> resume_from);
    RunOutcome finish_run(RunKind kind, const TransferResult& result,
                          const std::optional<std::string>& failure);
    void handle_event(const ProgressEvent& event);
    void reap_worker();

    // Caller holds mutex_.
    void append_log_locked(const std::string& line);
    void refresh_resumable_locked();
    void publish_locked();

    TransferEngine& engine_;
    CheckpointStore& checkpoints_;
    StateStore& state_;
    StatusFeed& feed_;
    OptionsBuilder options_;
    fs::path cache_dir_;

    RunStateFlag run_state_;

    mutable std::mutex mutex_;
    SessionPhase phase_ = SessionPhase::Idle;
    EventClassifier classifier_;
    SessionCheckpoint session_;
    std::string status_text_ = "Idle";
    bool paused_ = false;
    std::string resumable_info_;
    FinishedHook on_finished_;
    std::thread worker_;
};
