#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.keepsake/config.yaml, creating it with defaults on first use.
    static Result<Config> load();

    // Load a specific config file.
    static Result<Config> load_file(const fs::path& path);

    // Accessors
    const SourceConfig& sources() const { return sources_; }
    const DestinationConfig& destination() const { return destination_; }
    const TransferConfig& transfer() const { return transfer_; }
    const SchedulePolicy& schedule() const { return schedule_; }
    const NotificationSettings& notifications() const { return notifications_; }
    const LogSettings& log() const { return log_; }
    const fs::path& path() const { return path_; }

    void set_schedule(const SchedulePolicy& policy) { schedule_ = policy; }

    // Parameters that must match for a checkpoint to be resumable.
    ConfigSnapshot snapshot(const std::string& device_id) const;

    // Options handed to the transfer engine for a run.
    TransferOptions transfer_options(const std::string& device_id, bool dry_run) const;

public:
    Config() = default;

private:
    SourceConfig sources_;
    DestinationConfig destination_;
    TransferConfig transfer_;
    SchedulePolicy schedule_;
    NotificationSettings notifications_;
    LogSettings log_;
    fs::path path_;
};

// Name of the first field that differs, or nullopt if the snapshots are compatible.
std::optional<std::string> snapshot_mismatch(const ConfigSnapshot& saved,
                                             const ConfigSnapshot& current);

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (never overwrites)
Result<void> create_default_global_config();
Result<void> create_default_config(const fs::path& path);

// Rewrite only the `schedule:` section of a config file.
Result<void> save_schedule_policy(const fs::path& path, const SchedulePolicy& policy);

// ── Enum spellings used in config files and snapshots ───────

std::string to_string(DestinationMode m);
std::string to_string(ItemMode m);
std::string to_string(MediaFilter m);
std::string to_string(SortOrder o);
std::string to_string(BackupMode m);

std::optional<DestinationMode> parse_destination_mode(const std::string& s);
std::optional<ItemMode> parse_item_mode(const std::string& s);
std::optional<MediaFilter> parse_media_filter(const std::string& s);
std::optional<SortOrder> parse_sort_order(const std::string& s);
std::optional<BackupMode> parse_backup_mode(const std::string& s);
