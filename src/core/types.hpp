#pragma once

#include <string>
#include <optional>
#include <vector>
#include <set>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Logical item identifier ("Photos/IMG_0001.HEIC", "Photos/IMG_0001.HEIC:pairedVideo")
using ItemId = std::string;

// ── Configuration structures ────────────────────────────────

enum class DestinationMode { Folder, Server, Both };
enum class ItemMode { Originals, Edited, Both };
enum class MediaFilter { All, Images, Videos };
enum class SortOrder { Oldest, Newest };
enum class BackupMode { Incremental, Full, Mirror };

struct SourceConfig {
    std::vector<std::string> paths;   // local folders to back up
    bool include_hidden = false;
};

struct DestinationConfig {
    DestinationMode mode = DestinationMode::Folder;
    std::string folder;               // local mirror root
    std::string server_url;           // remote asset server (consumed externally)
};

struct TransferConfig {
    ItemMode mode = ItemMode::Originals;
    MediaFilter media = MediaFilter::All;
    SortOrder order = SortOrder::Oldest;
    BackupMode backup_mode = BackupMode::Incremental;
    int timeout_seconds = 300;
};

// Days match tm_wday (Sunday = 0)
enum class Weekday { Sunday = 0, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday };

enum class ScheduleType { Disabled, Interval, Weekly };

struct SchedulePolicy {
    ScheduleType type = ScheduleType::Disabled;
    int interval_hours = 6;           // 1..48
    int hour = 2;                     // 0..23
    int minute = 0;                   // 0..59
    std::set<Weekday> days = {Weekday::Sunday, Weekday::Monday, Weekday::Tuesday,
                              Weekday::Wednesday, Weekday::Thursday, Weekday::Friday,
                              Weekday::Saturday};
    bool skip_on_battery = true;

    bool operator==(const SchedulePolicy& o) const {
        return type == o.type && interval_hours == o.interval_hours && hour == o.hour &&
               minute == o.minute && days == o.days && skip_on_battery == o.skip_on_battery;
    }
    bool operator!=(const SchedulePolicy& o) const { return !(*this == o); }
};

struct NotificationSettings {
    bool on_start = false;
    bool on_completion = true;
    bool on_error = true;             // also gates skip notices
};

struct LogSettings {
    int max_lines = 10000;
    int max_error_lines = 5000;
    int refresh_ms = 150;
};

// ── Session / checkpoint ────────────────────────────────────

// Tri-state signal polled by the transfer engine between items.
enum class RunState { Running = 0, Paused = 1, Cancelled = 2 };

// Minimal description of a run's parameters, used to refuse stale resumes.
struct ConfigSnapshot {
    std::string mode;
    std::string media;
    std::string sort_order;
    std::string destination;          // folder destination path
    std::string server_url;
    std::string device_id;
};

struct SessionStats {
    int uploaded_count = 0;
    int skipped_count = 0;
    int error_count = 0;
};

struct SessionCheckpoint {
    std::string session_id;
    std::string started_at;           // ISO timestamp
    std::string last_updated_at;      // ISO timestamp
    std::string paused_at;            // "" if never paused
    ConfigSnapshot config;
    std::set<ItemId> processed_item_ids;
    std::set<ItemId> error_item_ids;
    int pause_index = 0;
    int total_items_at_pause = 0;
    SessionStats stats;
};

// ── Transfer engine contract ────────────────────────────────

enum class ProgressKind {
    Scanning,
    WillProcess,
    Processing,
    ItemUploaded,
    ItemSkipped,
    ItemFailed,
    Message,
    Retrying,
    Paused,
};

struct ProgressEvent {
    ProgressKind kind = ProgressKind::Message;
    int index = 0;                    // Processing / Paused: position
    int total = 0;                    // WillProcess / Processing / Paused: item count
    ItemId item_id;                   // "" when the engine has no id to report
    std::string name;                 // display name of the current item
    std::string message;              // Message text, failure or retry reason
    int attempt = 0;
    int max_attempts = 0;

    static ProgressEvent scanning() { return {ProgressKind::Scanning}; }
    static ProgressEvent will_process(int total) {
        ProgressEvent e{ProgressKind::WillProcess};
        e.total = total;
        return e;
    }
    static ProgressEvent processing(int index, int total, const ItemId& id, const std::string& name) {
        ProgressEvent e{ProgressKind::Processing};
        e.index = index;
        e.total = total;
        e.item_id = id;
        e.name = name;
        return e;
    }
    static ProgressEvent uploaded(const ItemId& id) {
        ProgressEvent e{ProgressKind::ItemUploaded};
        e.item_id = id;
        return e;
    }
    static ProgressEvent skipped(const ItemId& id) {
        ProgressEvent e{ProgressKind::ItemSkipped};
        e.item_id = id;
        return e;
    }
    static ProgressEvent failed(const ItemId& id, const std::string& message) {
        ProgressEvent e{ProgressKind::ItemFailed};
        e.item_id = id;
        e.message = message;
        return e;
    }
    static ProgressEvent text(const std::string& message) {
        ProgressEvent e{ProgressKind::Message};
        e.message = message;
        return e;
    }
    static ProgressEvent retrying(const std::string& name, int attempt, int max_attempts,
                                  const std::string& reason) {
        ProgressEvent e{ProgressKind::Retrying};
        e.name = name;
        e.attempt = attempt;
        e.max_attempts = max_attempts;
        e.message = reason;
        return e;
    }
    static ProgressEvent paused(int at, int total) {
        ProgressEvent e{ProgressKind::Paused};
        e.index = at;
        e.total = total;
        return e;
    }
};

struct TransferOptions {
    ConfigSnapshot snapshot;
    std::vector<std::string> sources;
    bool include_hidden = false;
    std::string destination;          // folder destination root
    BackupMode backup_mode = BackupMode::Incremental;
    SortOrder order = SortOrder::Oldest;
    MediaFilter media = MediaFilter::All;
    bool dry_run = false;
    std::string temp_dir;
    int timeout_seconds = 300;
};

struct DryRunPlan {
    int items_scanned = 0;
    int planned_uploads = 0;
    int would_skip_existing = 0;
    int would_replace_existing = 0;
    std::vector<std::string> notes;
};

struct TransferResult {
    int attempted = 0;
    int completed = 0;
    int skipped = 0;
    int errors = 0;
    bool was_paused = false;
    int pause_index = 0;
    std::set<ItemId> processed_item_ids;
    std::set<ItemId> error_item_ids;
    std::optional<DryRunPlan> dry_run_plan;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
using EventCallback = std::function<void(const ProgressEvent&)>;
using RunStatePoll = std::function<RunState()>;
