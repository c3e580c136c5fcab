#include "config.hpp"
#include "constants.hpp"
#include "directory_structure.hpp"
#include "schedule.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

// "~/Pictures" -> "/home/me/Pictures"
static std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.size() > 1 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

// Parse an enum-valued key, failing loudly on unknown spellings so a typo in
// config.yaml never silently changes what gets backed up.
template <typename E, typename Parser>
static E parse_enum(const YAML::Node& node, const char* key, E fallback,
                    Parser parse, const std::string& section) {
    if (!node[key]) return fallback;
    std::string raw = node[key].as<std::string>("");
    auto v = parse(raw);
    if (!v) {
        throw std::runtime_error(fmt::format("Invalid value for {}.{}: '{}'", section, key, raw));
    }
    return *v;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return get_keepsake_root();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    return create_default_config(get_global_config_path());
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);

    const char* default_config = R"(# keepsake configuration
# Edit this file to choose what gets backed up and where.

sources:
  paths:
    - "~/Pictures"
  include_hidden: false

destination:
  mode: folder                     # folder | server | both
  folder: "~/Backups/keepsake"
  server_url: ""                   # used by the remote uploader only

transfer:
  items: originals                 # originals | edited | both
  media: all                       # all | images | videos
  order: oldest                    # oldest | newest
  backup_mode: incremental         # incremental | full | mirror
  timeout_seconds: 300

schedule:
  type: disabled                   # disabled | interval | weekly
  interval_hours: 6                # 1..48
  hour: 2
  minute: 0
  days: [sun, mon, tue, wed, thu, fri, sat]
  skip_on_battery: true

notifications:
  on_start: false
  on_completion: true
  on_error: true

log:
  max_lines: 10000
  max_error_lines: 5000
  refresh_ms: 150
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// ── Section parsers ─────────────────────────────────────────

static SourceConfig parse_sources(const YAML::Node& node) {
    SourceConfig s;
    if (node["paths"]) {
        if (node["paths"].IsSequence()) {
            for (const auto& p : node["paths"]) {
                s.paths.push_back(expand_home(p.as<std::string>("")));
            }
        } else if (node["paths"].IsScalar()) {
            s.paths.push_back(expand_home(node["paths"].as<std::string>()));
        }
    }
    s.include_hidden = node["include_hidden"].as<bool>(false);
    return s;
}

static DestinationConfig parse_destination(const YAML::Node& node) {
    DestinationConfig d;
    d.mode = parse_enum(node, "mode", DestinationMode::Folder, parse_destination_mode, "destination");
    d.folder = expand_home(node["folder"].as<std::string>(""));
    d.server_url = node["server_url"].as<std::string>("");
    return d;
}

static TransferConfig parse_transfer(const YAML::Node& node) {
    TransferConfig t;
    t.mode = parse_enum(node, "items", ItemMode::Originals, parse_item_mode, "transfer");
    t.media = parse_enum(node, "media", MediaFilter::All, parse_media_filter, "transfer");
    t.order = parse_enum(node, "order", SortOrder::Oldest, parse_sort_order, "transfer");
    t.backup_mode = parse_enum(node, "backup_mode", BackupMode::Incremental, parse_backup_mode, "transfer");
    t.timeout_seconds = std::max(1, node["timeout_seconds"].as<int>(300));
    return t;
}

static SchedulePolicy parse_schedule(const YAML::Node& node) {
    SchedulePolicy p;
    p.type = parse_enum(node, "type", ScheduleType::Disabled, parse_schedule_type, "schedule");
    p.interval_hours = node["interval_hours"].as<int>(6);
    p.hour = node["hour"].as<int>(2);
    p.minute = node["minute"].as<int>(0);
    p.skip_on_battery = node["skip_on_battery"].as<bool>(true);

    if (node["days"]) {
        p.days.clear();
        if (node["days"].IsSequence()) {
            for (const auto& d : node["days"]) {
                std::string raw = d.as<std::string>("");
                auto day = parse_weekday(raw);
                if (!day) throw std::runtime_error("Invalid value in schedule.days: '" + raw + "'");
                p.days.insert(*day);
            }
        } else if (node["days"].IsScalar()) {
            auto parsed = parse_weekday_list(node["days"].as<std::string>());
            if (parsed.is_err()) throw std::runtime_error("Invalid schedule.days: " + parsed.error);
            p.days = parsed.value;
        }
    }
    return clamp_policy(p);
}

static NotificationSettings parse_notifications(const YAML::Node& node) {
    NotificationSettings n;
    n.on_start = node["on_start"].as<bool>(false);
    n.on_completion = node["on_completion"].as<bool>(true);
    n.on_error = node["on_error"].as<bool>(true);
    return n;
}

static LogSettings parse_log(const YAML::Node& node) {
    LogSettings l;
    l.max_lines = std::max(LOG_TRIM_BATCH, node["max_lines"].as<int>(DEFAULT_MAX_LOG_LINES));
    l.max_error_lines = std::max(ERROR_TRIM_BATCH, node["max_error_lines"].as<int>(DEFAULT_MAX_ERROR_LINES));
    l.refresh_ms = std::max(10, node["refresh_ms"].as<int>(DEFAULT_REFRESH_MS));
    return l;
}

// ── Loading ─────────────────────────────────────────────────

Result<Config> Config::load() {
    auto created = create_default_global_config();
    if (created.is_err()) {
        return Result<Config>::Err(created.error);
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto section = [&](const char* key) {
            return root[key] ? root[key] : YAML::Node();
        };

        Config config;
        config.sources_ = parse_sources(section("sources"));
        config.destination_ = parse_destination(section("destination"));
        config.transfer_ = parse_transfer(section("transfer"));
        config.schedule_ = parse_schedule(section("schedule"));
        config.notifications_ = parse_notifications(section("notifications"));
        config.log_ = parse_log(section("log"));
        config.path_ = path;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

// ── Snapshots ───────────────────────────────────────────────

ConfigSnapshot Config::snapshot(const std::string& device_id) const {
    ConfigSnapshot s;
    s.mode = to_string(transfer_.mode);
    s.media = to_string(transfer_.media);
    s.sort_order = to_string(transfer_.order);
    if (destination_.mode != DestinationMode::Server) {
        s.destination = destination_.folder;
    }
    if (destination_.mode != DestinationMode::Folder) {
        s.server_url = destination_.server_url;
    }
    s.device_id = device_id;
    return s;
}

TransferOptions Config::transfer_options(const std::string& device_id, bool dry_run) const {
    TransferOptions o;
    o.snapshot = snapshot(device_id);
    o.sources = sources_.paths;
    o.include_hidden = sources_.include_hidden;
    // Server mode has no folder target; the engine refuses an empty one.
    o.destination = o.snapshot.destination;
    o.backup_mode = transfer_.backup_mode;
    o.order = transfer_.order;
    o.media = transfer_.media;
    o.dry_run = dry_run;
    o.temp_dir = get_cache_dir().string();
    o.timeout_seconds = transfer_.timeout_seconds;
    return o;
}

std::optional<std::string> snapshot_mismatch(const ConfigSnapshot& saved,
                                             const ConfigSnapshot& current) {
    if (saved.mode != current.mode) return std::string("mode");
    if (saved.media != current.media) return std::string("media");
    if (saved.sort_order != current.sort_order) return std::string("sort_order");
    if (saved.destination != current.destination) return std::string("destination");
    if (saved.server_url != current.server_url) return std::string("server_url");
    if (saved.device_id != current.device_id) return std::string("device_id");
    return std::nullopt;
}

// ── Persisting the schedule ─────────────────────────────────

Result<void> save_schedule_policy(const fs::path& path, const SchedulePolicy& policy) {
    try {
        YAML::Node root = fs::exists(path) ? YAML::LoadFile(path.string()) : YAML::Node();

        YAML::Node sched;
        sched["type"] = schedule_type_name(policy.type);
        sched["interval_hours"] = policy.interval_hours;
        sched["hour"] = policy.hour;
        sched["minute"] = policy.minute;
        YAML::Node days(YAML::NodeType::Sequence);
        for (auto d : policy.days) days.push_back(weekday_key(d));
        days.SetStyle(YAML::EmitterStyle::Flow);
        sched["days"] = days;
        sched["skip_on_battery"] = policy.skip_on_battery;
        root["schedule"] = sched;

        YAML::Emitter out;
        out << root;
        platform::write_file_atomic(path, std::string(out.c_str()) + "\n");
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to save schedule: ") + e.what());
    }
}

// ── Enum spellings ──────────────────────────────────────────

std::string to_string(DestinationMode m) {
    switch (m) {
    case DestinationMode::Folder: return "folder";
    case DestinationMode::Server: return "server";
    case DestinationMode::Both:   return "both";
    }
    return "folder";
}

std::string to_string(ItemMode m) {
    switch (m) {
    case ItemMode::Originals: return "originals";
    case ItemMode::Edited:    return "edited";
    case ItemMode::Both:      return "both";
    }
    return "originals";
}

std::string to_string(MediaFilter m) {
    switch (m) {
    case MediaFilter::All:    return "all";
    case MediaFilter::Images: return "images";
    case MediaFilter::Videos: return "videos";
    }
    return "all";
}

std::string to_string(SortOrder o) {
    return o == SortOrder::Newest ? "newest" : "oldest";
}

std::string to_string(BackupMode m) {
    switch (m) {
    case BackupMode::Incremental: return "incremental";
    case BackupMode::Full:        return "full";
    case BackupMode::Mirror:      return "mirror";
    }
    return "incremental";
}

std::optional<DestinationMode> parse_destination_mode(const std::string& s) {
    if (s == "folder") return DestinationMode::Folder;
    if (s == "server") return DestinationMode::Server;
    if (s == "both") return DestinationMode::Both;
    return std::nullopt;
}

std::optional<ItemMode> parse_item_mode(const std::string& s) {
    if (s == "originals") return ItemMode::Originals;
    if (s == "edited") return ItemMode::Edited;
    if (s == "both") return ItemMode::Both;
    return std::nullopt;
}

std::optional<MediaFilter> parse_media_filter(const std::string& s) {
    if (s == "all") return MediaFilter::All;
    if (s == "images") return MediaFilter::Images;
    if (s == "videos") return MediaFilter::Videos;
    return std::nullopt;
}

std::optional<SortOrder> parse_sort_order(const std::string& s) {
    if (s == "oldest") return SortOrder::Oldest;
    if (s == "newest") return SortOrder::Newest;
    return std::nullopt;
}

std::optional<BackupMode> parse_backup_mode(const std::string& s) {
    if (s == "incremental") return BackupMode::Incremental;
    if (s == "full") return BackupMode::Full;
    if (s == "mirror") return BackupMode::Mirror;
    return std::nullopt;
}
