#include "backup_service.hpp"
#include "backup_log.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/schedule.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

BackupService::BackupService() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config_ = config_result.value;
    } else {
        config_error_ = config_result.error;
    }
}

BackupService::BackupService(Config config) : config_(std::move(config)) {}

BackupService::~BackupService() {
    shutdown();
}

// ── Lifecycle ─────────────────────────────────────────────────

Result<void> BackupService::init() {
    if (initialized()) return Result<void>::Ok();
    if (!config_error_.empty()) {
        return Result<void>::Err(config_error_);
    }

    ensure_keepsake_directory_structure();
    std::string holder;
    lock_ = InstanceLock::try_acquire(get_keepsake_root() / LOCK_FILE_NAME, &holder);
    if (!lock_) {
        return Result<void>::Err(holder.empty()
            ? "Another keepsake process is already running"
            : fmt::format("Another keepsake process is already running (pid {})", holder));
    }

    state_ = std::make_unique<StateStore>();
    checkpoints_ = std::make_unique<FileCheckpointStore>(get_state_dir() / CHECKPOINT_FILE_NAME);
    engine_ = std::make_unique<FolderMirrorEngine>();
    feed_ = std::make_unique<StatusFeed>(config_.log());
    notifier_ = std::make_unique<Notifier>(config_.notifications());
    power_ = std::make_unique<SystemPowerSource>();

    orchestrator_ = std::make_unique<SessionOrchestrator>(
        *engine_, *checkpoints_, *state_, *feed_,
        [this](const std::string& device_id, bool dry_run) {
            return config_.transfer_options(device_id, dry_run);
        },
        get_cache_dir());

    schedule_ = std::make_unique<ScheduleEngine>(config_.schedule(), *orchestrator_, *power_,
                                                 *notifier_, *state_);
    orchestrator_->set_on_run_finished([this](const RunOutcome& o) { on_run_finished(o); });

    wake_ = std::make_unique<WakeMonitor>([this]() { schedule_->handle_wake(); },
                                          WAKE_CHECK_INTERVAL_MS, WAKE_GAP_THRESHOLD_SECS);

    keepsake_log(fmt::format("service: initialized, config={}, device={}",
                             config_.path().string(), state_->ensure_device_id()));
    return Result<void>::Ok();
}

void BackupService::start_background() {
    if (!initialized() || background_) return;
    feed_->start();
    schedule_->start();
    wake_->start();
    background_ = true;
}

void BackupService::stop_background() {
    if (!background_) return;
    wake_->stop();
    schedule_->stop();
    feed_->stop();
    background_ = false;
}

void BackupService::shutdown() {
    if (!initialized()) return;
    if (wake_) wake_->stop();
    if (schedule_) schedule_->stop();

    // The completion hook still reaches the schedule engine here.
    orchestrator_->shutdown();
    orchestrator_->set_on_run_finished(nullptr);

    stop_background();
    wake_.reset();
    schedule_.reset();
    orchestrator_.reset();
    power_.reset();
    notifier_.reset();
    feed_.reset();
    engine_.reset();
    checkpoints_.reset();
    state_.reset();
    lock_.reset();
}

void BackupService::on_run_finished(const RunOutcome& outcome) {
    keepsake_log(fmt::format("service: run finished phase={} dry_run={}",
                             session_phase_name(outcome.phase), outcome.dry_run));
    schedule_->handle_run_finished(outcome);
}

// ── Run control ───────────────────────────────────────────────

Result<void> BackupService::start_backup() {
    if (!orchestrator_) return Result<void>::Err("Not initialized");
    return orchestrator_->start();
}

Result<void> BackupService::start_dry_run() {
    if (!orchestrator_) return Result<void>::Err("Not initialized");
    return orchestrator_->start_dry_run();
}

Result<void> BackupService::resume() {
    if (!orchestrator_) return Result<void>::Err("Not initialized");
    return orchestrator_->resume();
}

Result<void> BackupService::run_now() {
    if (!schedule_) return Result<void>::Err("Not initialized");
    return schedule_->trigger_manual();
}

void BackupService::pause() {
    if (orchestrator_) orchestrator_->pause();
}

void BackupService::stop() {
    if (orchestrator_) orchestrator_->cancel();
}

Result<void> BackupService::reset(bool wipe_manifest) {
    if (!orchestrator_) return Result<void>::Err("Not initialized");
    return orchestrator_->reset(wipe_manifest);
}

void BackupService::wait_for_idle() {
    if (orchestrator_) orchestrator_->wait_for_idle();
}

bool BackupService::is_running() const {
    return orchestrator_ && orchestrator_->is_running();
}

SessionPhase BackupService::phase() const {
    return orchestrator_ ? orchestrator_->phase() : SessionPhase::Idle;
}

// ── Observation ───────────────────────────────────────────────

StatusSnapshot BackupService::snapshot() const {
    return feed_ ? feed_->snapshot() : StatusSnapshot{};
}

std::vector<std::string> BackupService::log_lines() const {
    return feed_ ? feed_->log_lines() : std::vector<std::string>{};
}

std::vector<std::string> BackupService::error_lines() const {
    return feed_ ? feed_->error_lines() : std::vector<std::string>{};
}

int BackupService::subscribe(StatusFeed::Observer observer) {
    if (!feed_) return 0;
    return feed_->subscribe(std::move(observer));
}

void BackupService::unsubscribe(int token) {
    if (feed_) feed_->unsubscribe(token);
}

void BackupService::set_visible(bool visible) {
    if (feed_) feed_->set_visible(visible);
}

void BackupService::set_notification_sink(Notifier::Sink sink) {
    if (notifier_) notifier_->set_sink(std::move(sink));
}

// ── Schedule ──────────────────────────────────────────────────

Result<void> BackupService::set_schedule(const SchedulePolicy& policy) {
    SchedulePolicy clamped = clamp_policy(policy);
    auto saved = save_schedule_policy(config_.path(), clamped);
    if (saved.is_err()) return saved;

    config_.set_schedule(clamped);
    if (schedule_) schedule_->set_policy(clamped);
    return Result<void>::Ok();
}

SchedulePolicy BackupService::schedule() const {
    return schedule_ ? schedule_->policy() : config_.schedule();
}

ScheduleSummary BackupService::schedule_summary() const {
    ScheduleSummary s;
    SchedulePolicy policy = schedule();
    s.description = describe(policy);
    s.skip_on_battery = policy.skip_on_battery;
    s.next_run = "-";
    s.last_run = "-";
    if (!schedule_) return s;

    if (auto next = schedule_->next_run_at()) {
        auto now = std::chrono::system_clock::now();
        s.next_run = fmt::format("{} ({})", format_short_datetime(to_iso(*next)),
                                 format_until(*next, now));
    }
    if (auto last = schedule_->last_run_at()) {
        s.last_run = format_short_datetime(to_iso(*last));
    }
    return s;
}

std::string BackupService::device_id() {
    return state_ ? state_->ensure_device_id() : std::string();
}
