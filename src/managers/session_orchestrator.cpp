#include "session_orchestrator.hpp"
#include "backup_log.hpp"
#include <core/config.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <system_error>
#include <vector>

const char* session_phase_name(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle:      return "idle";
        case SessionPhase::Running:   return "running";
        case SessionPhase::Paused:    return "paused";
        case SessionPhase::Completed: return "completed";
        case SessionPhase::Cancelled: return "cancelled";
        case SessionPhase::Errored:   return "errored";
    }
    return "unknown";
}

SessionOrchestrator::SessionOrchestrator(TransferEngine& engine, CheckpointStore& checkpoints,
                                         StateStore& state, StatusFeed& feed,
                                         OptionsBuilder options, fs::path cache_dir)
    : engine_(engine), checkpoints_(checkpoints), state_(state), feed_(feed),
      options_(std::move(options)), cache_dir_(std::move(cache_dir)) {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_resumable_locked();
    publish_locked();
}

SessionOrchestrator::~SessionOrchestrator() {
    shutdown();
}

// ── Run control ───────────────────────────────────────────────

Result<void> SessionOrchestrator::start() {
    reap_worker();
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == SessionPhase::Running) {
        return Result<void>::Err("A backup is already running");
    }

    auto cleared = checkpoints_.clear();
    if (cleared.is_err()) {
        keepsake_log("start: could not clear checkpoint: " + cleared.error);
    }

    SessionCheckpoint session;
    session.session_id = generate_uuid();
    session.started_at = now_iso();
    session.last_updated_at = session.started_at;
    return launch_locked(RunKind::Fresh, std::move(session), std::nullopt);
}

Result<void> SessionOrchestrator::start_dry_run() {
    reap_worker();
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == SessionPhase::Running) {
        return Result<void>::Err("A backup is already running");
    }

    SessionCheckpoint session;
    session.session_id = generate_uuid();
    session.started_at = now_iso();
    session.last_updated_at = session.started_at;
    return launch_locked(RunKind::DryRun, std::move(session), std::nullopt);
}

Result<void> SessionOrchestrator::resume() {
    reap_worker();
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == SessionPhase::Running) {
        return Result<void>::Err("A backup is already running");
    }

    auto saved = checkpoints_.load();
    if (!saved) {
        resumable_info_.clear();
        publish_locked();
        return Result<void>::Err("No paused session to resume");
    }

    auto current = options_(state_.ensure_device_id(), false);
    if (auto field = snapshot_mismatch(saved->config, current.snapshot)) {
        std::string msg = fmt::format(
            "Cannot resume: {} changed since the session was paused. Reset to start over.", *field);
        append_log_locked(msg);
        publish_locked();
        return Result<void>::Err(msg);
    }

    SessionCheckpoint session = *saved;
    return launch_locked(RunKind::Resume, std::move(session), std::move(saved));
}

Result<void> SessionOrchestrator::launch_locked(RunKind kind, SessionCheckpoint session,
                                                std::optional<SessionCheckpoint> resume_from) {
    TransferOptions options = options_(state_.ensure_device_id(), kind == RunKind::DryRun);
    if (kind != RunKind::Resume) {
        session.config = options.snapshot;
    }

    if (worker_.joinable()) {
        return Result<void>::Err("The previous run is still finishing; try again");
    }

    phase_ = SessionPhase::Running;
    paused_ = false;
    run_state_.store(RunState::Running);
    feed_.clear_logs();

    if (kind == RunKind::Resume) {
        classifier_.reset();
        classifier_.seed(session.processed_item_ids, session.stats);
        status_text_ = "Resuming...";
    } else {
        classifier_.reset();
        status_text_ = "Starting...";
    }
    session_ = std::move(session);

    switch (kind) {
        case RunKind::Fresh:
            append_log_locked(fmt::format("Starting backup session {}", session_.session_id));
            break;
        case RunKind::Resume:
            append_log_locked(fmt::format("Resuming session {} ({} items already processed)",
                                          session_.session_id,
                                          session_.processed_item_ids.size()));
            break;
        case RunKind::DryRun:
            append_log_locked("Starting dry run (nothing will be copied)");
            break;
    }
    keepsake_log(fmt::format("orchestrator: launch session={} resume={} dry_run={}",
                             session_.session_id, kind == RunKind::Resume,
                             kind == RunKind::DryRun));
    publish_locked();

    try {
        worker_ = std::thread(&SessionOrchestrator::run_task, this, kind, std::move(options),
                              std::move(resume_from));
    } catch (const std::system_error& e) {
        phase_ = SessionPhase::Errored;
        run_state_.store(RunState::Cancelled);
        status_text_ = fmt::format("Error: {}", e.what());
        append_log_locked(fmt::format("ERROR: {}", e.what()));
        publish_locked();
        return Result<void>::Err(e.what());
    }
    return Result<void>::Ok();
}

void SessionOrchestrator::run_task(RunKind kind, TransferOptions options,
                                   std::optional<SessionCheckpoint> resume_from) {
    TransferResult result;
    std::optional<std::string> failure;
    try {
        result = engine_.run(
            options, [this](const ProgressEvent& e) { handle_event(e); },
            run_state_.poller(), resume_from);
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "transfer engine failed with an unknown exception";
    }

    RunOutcome outcome = finish_run(kind, result, failure);

    FinishedHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = on_finished_;
    }
    if (hook) {
        try {
            hook(outcome);
        } catch (const std::exception& e) {
            keepsake_log(fmt::format("orchestrator: finished hook threw: {}", e.what()));
        }
    }
}

RunOutcome SessionOrchestrator::finish_run(RunKind kind, const TransferResult& result,
                                           const std::optional<std::string>& failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    RunState requested = run_state_.load();
    run_state_.store(RunState::Cancelled);

    RunOutcome outcome;
    outcome.dry_run = kind == RunKind::DryRun;

    if (failure) {
        // The checkpoint from an earlier pause stays usable.
        phase_ = SessionPhase::Errored;
        status_text_ = fmt::format("Error: {}", *failure);
        std::string line = fmt::format("ERROR: {}", *failure);
        append_log_locked(line);
        feed_.append_error(line);
        outcome.error = *failure;
        refresh_resumable_locked();
    } else if (kind == RunKind::DryRun) {
        classifier_.merge_error_total(result.errors);
        DryRunPlan plan = result.dry_run_plan.value_or(DryRunPlan{});
        int would_upload = std::max(0, plan.planned_uploads - plan.would_skip_existing -
                                           plan.would_replace_existing);
        classifier_.set_planned_counts(would_upload, plan.would_skip_existing);
        status_text_ = fmt::format("Dry run: would upload {}, skip {}, replace {} ({} items scanned)",
                                   would_upload, plan.would_skip_existing,
                                   plan.would_replace_existing, plan.items_scanned);
        append_log_locked(fmt::format(
            "Dry run complete: planned {} uploads - would upload {}, skip {}, replace {}",
            plan.planned_uploads, would_upload, plan.would_skip_existing,
            plan.would_replace_existing));
        for (const auto& note : plan.notes) {
            append_log_locked("Dry run note: " + note);
        }
        phase_ = SessionPhase::Completed;
        refresh_resumable_locked();
    } else {
        classifier_.merge_error_total(result.errors);
        if (result.was_paused) {
            std::string now = now_iso();
            session_.last_updated_at = now;
            session_.paused_at = now;
            session_.processed_item_ids.insert(result.processed_item_ids.begin(),
                                               result.processed_item_ids.end());
            session_.error_item_ids.insert(result.error_item_ids.begin(),
                                           result.error_item_ids.end());
            session_.pause_index = result.pause_index;
            session_.total_items_at_pause = classifier_.progress_total();
            session_.stats = classifier_.stats();

            auto saved = checkpoints_.save(session_);
            if (saved.is_err()) {
                std::string line = "ERROR saving session state: " + saved.error;
                append_log_locked(line);
                feed_.append_error(line);
            }
            phase_ = SessionPhase::Paused;
            status_text_ = fmt::format("Paused. {} completed.", result.completed);
            refresh_resumable_locked();
        } else if (requested == RunState::Cancelled) {
            // Abandoned without a pause: nothing new is retained.
            phase_ = SessionPhase::Cancelled;
            status_text_ = "Cancelled.";
            refresh_resumable_locked();
        } else {
            auto cleared = checkpoints_.clear();
            if (cleared.is_err()) {
                keepsake_log("orchestrator: could not clear checkpoint: " + cleared.error);
            }
            phase_ = SessionPhase::Completed;
            status_text_ = fmt::format("Done. Completed {}, skipped {}, errors {}.",
                                       result.completed, result.skipped,
                                       classifier_.stats().error_count);
            resumable_info_.clear();
        }
        append_log_locked(status_text_);
    }

    paused_ = false;
    outcome.phase = phase_;
    outcome.stats = classifier_.stats();
    keepsake_log(fmt::format("orchestrator: session={} finished phase={}", session_.session_id,
                             session_phase_name(phase_)));
    publish_locked();
    return outcome;
}

void SessionOrchestrator::handle_event(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClassifiedEvent c = classifier_.handle(event);
    if (c.status) status_text_ = *c.status;
    if (c.paused) paused_ = true;
    for (const auto& line : c.log_lines) {
        append_log_locked(line);
    }
    for (const auto& line : c.error_lines) {
        feed_.append_error(line);
    }
    publish_locked();
}

void SessionOrchestrator::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != SessionPhase::Running) return;
    run_state_.store(RunState::Paused);
    paused_ = true;
    status_text_ = "Pausing...";
    publish_locked();
}

void SessionOrchestrator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != SessionPhase::Running) return;
    run_state_.store(RunState::Paused);
    paused_ = true;
    status_text_ = "Stopping...";
    append_log_locked("Stop requested: will pause after current item to allow resume.");
    publish_locked();
}

Result<void> SessionOrchestrator::reset(bool wipe_manifest) {
    reap_worker();
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == SessionPhase::Running) {
        return Result<void>::Err("Cannot reset while a backup is running; pause it first");
    }

    std::vector<std::string> messages;
    bool failed = false;

    bool had_checkpoint = checkpoints_.load().has_value();
    auto cleared = checkpoints_.clear();
    if (cleared.is_err()) {
        messages.push_back("ERROR Reset: could not remove session state: " + cleared.error);
        failed = true;
    } else if (had_checkpoint) {
        messages.push_back("Reset: removed session state");
    }

    std::error_code ec;
    if (!cache_dir_.empty() && fs::exists(cache_dir_, ec)) {
        fs::remove_all(cache_dir_, ec);
        if (ec) {
            messages.push_back("ERROR Reset: could not clear temp cache: " + ec.message());
            failed = true;
        } else {
            fs::create_directories(cache_dir_, ec);
            messages.push_back("Reset: cleared temp cache");
        }
    }

    if (wipe_manifest) {
        auto options = options_(state_.ensure_device_id(), false);
        if (options.destination.empty()) {
            messages.push_back("Reset: no folder destination configured, nothing to wipe");
        } else {
            auto wiped = engine_.clear_destination_state(options);
            if (wiped.is_err()) {
                messages.push_back("ERROR Reset: " + wiped.error);
                failed = true;
            } else {
                messages.push_back("Reset: wiped manifest in destination");
            }
        }
    }

    state_.regenerate_device_id();
    messages.push_back("Reset: regenerated device id");

    classifier_.reset();
    session_ = SessionCheckpoint{};
    phase_ = SessionPhase::Idle;
    paused_ = false;
    status_text_ = "Idle";
    resumable_info_.clear();
    run_state_.store(RunState::Cancelled);

    feed_.clear_logs();
    for (const auto& msg : messages) {
        feed_.append_log(msg);
        if (starts_with(msg, "ERROR")) feed_.append_error(msg);
        keepsake_log("orchestrator: " + msg);
    }
    publish_locked();

    if (failed) {
        return Result<void>::Err("Reset finished with errors; see the log");
    }
    return Result<void>::Ok();
}

void SessionOrchestrator::shutdown() {
    pause();
    wait_for_idle();
}

void SessionOrchestrator::wait_for_idle() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void SessionOrchestrator::reap_worker() {
    std::thread done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == SessionPhase::Running) return;
        done = std::move(worker_);
    }
    if (done.joinable()) {
        done.join();
    }
}

// ── Queries ───────────────────────────────────────────────────

bool SessionOrchestrator::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == SessionPhase::Running;
}

bool SessionOrchestrator::has_resumable_session() {
    return checkpoints_.load().has_value();
}

void SessionOrchestrator::check_for_resumable_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    refresh_resumable_locked();
    publish_locked();
}

SessionPhase SessionOrchestrator::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

SessionStats SessionOrchestrator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return classifier_.stats();
}

RunStatus SessionOrchestrator::status() const {
    return feed_.status();
}

std::string SessionOrchestrator::device_id() {
    return state_.ensure_device_id();
}

void SessionOrchestrator::set_on_run_finished(FinishedHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_finished_ = std::move(hook);
}

// ── Internals ─────────────────────────────────────────────────

void SessionOrchestrator::append_log_locked(const std::string& line) {
    feed_.append_log(line);
    append_session_log(session_.session_id, line);
}

void SessionOrchestrator::refresh_resumable_locked() {
    auto saved = checkpoints_.load();
    if (!saved) {
        resumable_info_.clear();
        return;
    }
    const std::string& when = saved->paused_at.empty() ? saved->last_updated_at : saved->paused_at;
    int remaining = std::max(0, saved->total_items_at_pause -
                                    static_cast<int>(saved->processed_item_ids.size()));
    resumable_info_ = fmt::format("Paused {} - {} remaining", format_short_datetime(when), remaining);
}

void SessionOrchestrator::publish_locked() {
    RunStatus s;
    s.status_text = status_text_;
    s.progress_value = classifier_.progress_value();
    s.progress_total = classifier_.progress_total();
    s.stats = classifier_.stats();
    s.running = phase_ == SessionPhase::Running;
    s.paused = paused_;
    s.resumable_info = resumable_info_;
    feed_.set_status(s);
}
