#include "folder_mirror_engine.hpp"
#include "backup_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

// ── File classification ─────────────────────────────────────

static std::string lower_ext(const fs::path& p) {
    std::string ext = p.extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool FolderMirrorEngine::is_image_file(const fs::path& p) {
    static const std::set<std::string> exts = {
        "jpg", "jpeg", "png", "heic", "heif", "gif", "tif", "tiff", "bmp", "webp",
        "dng", "raw", "cr2", "cr3", "nef", "arw", "orf", "rw2"};
    return exts.count(lower_ext(p)) > 0;
}

bool FolderMirrorEngine::is_video_file(const fs::path& p) {
    static const std::set<std::string> exts = {
        "mov", "mp4", "m4v", "avi", "mkv", "3gp", "mts", "webm"};
    return exts.count(lower_ext(p)) > 0;
}

static bool is_hidden_name(const fs::path& p) {
    std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

static int64_t mtime_seconds(const fs::path& p, std::error_code& ec) {
    auto t = fs::last_write_time(p, ec);
    if (ec) return 0;
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

// Directory name used to namespace a source root inside the destination.
static std::string root_label(const fs::path& root) {
    fs::path r = root.lexically_normal();
    if (r.filename().empty()) r = r.parent_path();
    std::string name = r.filename().string();
    return name.empty() ? "root" : name;
}

// ── Scanning ────────────────────────────────────────────────

static void scan_root(const fs::path& root, const std::string& label, bool include_hidden,
                      std::vector<SourceItem>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        keepsake_log(fmt::format("mirror: cannot scan {}: {}", root.string(), ec.message()));
        return;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            keepsake_log(fmt::format("mirror: scan of {} stopped: {}", root.string(), ec.message()));
            break;
        }
        const auto& entry = *it;
        std::error_code entry_ec;

        if (!include_hidden && is_hidden_name(entry.path())) {
            if (entry.is_directory(entry_ec)) it.disable_recursion_pending();
            continue;
        }
        // Symlinks are never followed
        if (entry.is_symlink(entry_ec)) continue;
        if (!entry.is_regular_file(entry_ec)) continue;

        SourceItem item;
        item.source = entry.path();
        item.dest_rel = label + "/" + entry.path().lexically_relative(root).generic_string();
        item.id = item.dest_rel;
        item.size = static_cast<int64_t>(entry.file_size(entry_ec));
        if (entry_ec) item.size = 0;
        item.mtime = mtime_seconds(entry.path(), entry_ec);
        out.push_back(std::move(item));
    }
}

// A clip next to a still with the same stem is the still's paired video.
static void pair_videos(std::vector<SourceItem>& items) {
    auto key_of = [](const fs::path& p) {
        std::string stem = p.stem().string();
        std::transform(stem.begin(), stem.end(), stem.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return p.parent_path().string() + "/" + stem;
    };

    std::map<std::string, ItemId> stills;
    for (const auto& item : items) {
        if (FolderMirrorEngine::is_image_file(item.source)) {
            stills.emplace(key_of(item.source), item.id);
        }
    }
    for (auto& item : items) {
        if (!FolderMirrorEngine::is_video_file(item.source)) continue;
        auto it = stills.find(key_of(item.source));
        if (it != stills.end()) {
            item.id = it->second + ":pairedVideo";
        }
    }
}

std::vector<SourceItem> FolderMirrorEngine::scan_sources(const TransferOptions& options,
                                                         std::vector<std::string>& missing) {
    std::vector<SourceItem> items;
    std::set<std::string> labels;

    for (const auto& src : options.sources) {
        fs::path root(src);
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            missing.push_back(src);
            continue;
        }

        std::string label = root_label(root);
        for (int n = 2; labels.count(label); ++n) {
            label = fmt::format("{}-{}", root_label(root), n);
        }
        labels.insert(label);

        std::vector<SourceItem> found;
        scan_root(root, label, options.include_hidden, found);
        pair_videos(found);

        for (auto& item : found) {
            bool image = is_image_file(item.source);
            bool video = is_video_file(item.source);
            if (options.media == MediaFilter::Images && !image) continue;
            if (options.media == MediaFilter::Videos && !video) continue;
            items.push_back(std::move(item));
        }
    }

    bool newest_first = options.order == SortOrder::Newest;
    std::sort(items.begin(), items.end(), [newest_first](const SourceItem& a, const SourceItem& b) {
        if (a.mtime != b.mtime) return newest_first ? a.mtime > b.mtime : a.mtime < b.mtime;
        return a.dest_rel < b.dest_rel;
    });
    return items;
}

// ── Manifest ────────────────────────────────────────────────

fs::path FolderMirrorEngine::manifest_path(const fs::path& dest_root) {
    return dest_root / DEST_META_DIR / DEST_MANIFEST_FILE;
}

MirrorManifest FolderMirrorEngine::load_manifest(const fs::path& dest_root,
                                                 const std::string& device_id) {
    MirrorManifest manifest;
    manifest.device_id = device_id;

    fs::path path = manifest_path(dest_root);
    std::error_code ec;
    if (!fs::exists(path, ec)) return manifest;

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        std::string stored = root["device_id"].as<std::string>("");
        if (stored != device_id) {
            // Written for another device identity (e.g. before a reset): full resync
            keepsake_log(fmt::format("mirror: manifest belongs to device '{}', ignoring", stored));
            return manifest;
        }

        if (root["entries"] && root["entries"].IsSequence()) {
            for (const auto& n : root["entries"]) {
                MirrorManifestEntry e;
                e.path = n["path"].as<std::string>("");
                e.size = n["size"].as<int64_t>(0);
                e.mtime = n["mtime"].as<int64_t>(0);
                if (!e.path.empty()) manifest.entries[e.path] = e;
            }
        }
    } catch (const std::exception& e) {
        keepsake_log("mirror: unreadable manifest, starting fresh: " + std::string(e.what()));
        manifest.entries.clear();
    }
    return manifest;
}

void FolderMirrorEngine::save_manifest(const fs::path& dest_root, const MirrorManifest& manifest) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "device_id" << YAML::Value << manifest.device_id;
    out << YAML::Key << "entries" << YAML::Value << YAML::BeginSeq;
    for (const auto& [path, e] : manifest.entries) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << e.path;
        out << YAML::Key << "size" << YAML::Value << e.size;
        out << YAML::Key << "mtime" << YAML::Value << e.mtime;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    platform::write_file_atomic(manifest_path(dest_root), std::string(out.c_str()) + "\n");
}

Result<void> FolderMirrorEngine::clear_destination_state(const TransferOptions& options) {
    if (options.destination.empty()) return Result<void>::Ok();

    fs::path dest(options.destination);
    std::error_code ec;
    fs::remove(manifest_path(dest), ec);
    if (ec) {
        return Result<void>::Err("could not remove destination manifest: " + ec.message());
    }
    fs::remove_all(dest / DEST_META_DIR / DEST_TMP_DIR, ec);
    if (ec) {
        return Result<void>::Err("could not clear destination temp files: " + ec.message());
    }
    return Result<void>::Ok();
}

// ── Copy ────────────────────────────────────────────────────

// Copy into <dest>/.keepsake/tmp first, then rename over the target, so an
// interrupted copy never leaves a truncated file at the final path.
static void copy_into_place(const SourceItem& item, const fs::path& dest_root, const fs::path& target) {
    fs::path tmp_dir = dest_root / DEST_META_DIR / DEST_TMP_DIR;
    fs::create_directories(tmp_dir);
    fs::create_directories(target.parent_path());

    fs::path tmp = tmp_dir / (".tmp-" + generate_uuid());
    try {
        fs::copy_file(item.source, tmp, fs::copy_options::overwrite_existing);
        fs::last_write_time(tmp, fs::last_write_time(item.source));
        fs::rename(tmp, target);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

// ── Run ─────────────────────────────────────────────────────

TransferResult FolderMirrorEngine::run(const TransferOptions& options,
                                       const EventCallback& on_event,
                                       const RunStatePoll& poll_run_state,
                                       const std::optional<SessionCheckpoint>& resume_from) {
    if (options.destination.empty()) {
        throw std::runtime_error("no destination folder configured");
    }

    TransferResult result;
    fs::path dest(options.destination);

    on_event(ProgressEvent::scanning());
    std::vector<std::string> missing;
    auto items = scan_sources(options, missing);
    for (const auto& m : missing) {
        result.errors++;
        on_event(ProgressEvent::text(fmt::format("ERROR Files: source not found: {}", m)));
    }

    std::set<ItemId> already;
    if (resume_from) already = resume_from->processed_item_ids;

    std::set<std::string> present;
    for (const auto& item : items) present.insert(item.dest_rel);

    int total = static_cast<int>(items.size());
    on_event(ProgressEvent::will_process(total));
    keepsake_log(fmt::format("mirror: {} item(s) found, {} already processed, mode {}",
                             total, already.size(), static_cast<int>(options.backup_mode)));

    MirrorManifest manifest = load_manifest(dest, options.snapshot.device_id);
    DryRunPlan plan;
    plan.items_scanned = total;

    int index = 0;
    int copied_since_save = 0;
    bool stopped = false;

    auto save_progress = [&]() {
        try {
            save_manifest(dest, manifest);
        } catch (const std::exception& e) {
            result.errors++;
            on_event(ProgressEvent::text(fmt::format("ERROR Files: manifest update failed: {}", e.what())));
        }
    };

    for (const auto& item : items) {
        ++index;
        if (already.count(item.id)) continue;

        RunState state = poll_run_state();
        if (state != RunState::Running) {
            stopped = true;
            if (state == RunState::Paused) {
                result.was_paused = true;
                result.pause_index = index - 1;
                on_event(ProgressEvent::paused(index - 1, total));
            }
            break;
        }

        on_event(ProgressEvent::processing(index, total, item.id, item.source.filename().string()));
        result.attempted++;

        fs::path target = dest / item.dest_rel;
        std::error_code ec;
        bool target_exists = fs::exists(target, ec);
        auto known = manifest.entries.find(item.dest_rel);
        bool unchanged = options.backup_mode != BackupMode::Full &&
                         known != manifest.entries.end() &&
                         known->second.size == item.size &&
                         known->second.mtime == item.mtime &&
                         target_exists;

        if (options.dry_run) {
            plan.planned_uploads++;
            if (unchanged) {
                plan.would_skip_existing++;
            } else if (target_exists) {
                plan.would_replace_existing++;
            }
            continue;
        }

        if (unchanged) {
            result.skipped++;
            result.processed_item_ids.insert(item.id);
            on_event(ProgressEvent::skipped(item.id));
            continue;
        }

        try {
            copy_into_place(item, dest, target);
            manifest.entries[item.dest_rel] = MirrorManifestEntry{item.dest_rel, item.size, item.mtime};
            result.completed++;
            result.processed_item_ids.insert(item.id);
            on_event(ProgressEvent::uploaded(item.id));
            if (++copied_since_save >= PROGRESS_LOG_EVERY) {
                save_progress();
                copied_since_save = 0;
            }
        } catch (const std::exception& e) {
            result.errors++;
            result.error_item_ids.insert(item.id);
            result.processed_item_ids.insert(item.id);
            on_event(ProgressEvent::failed(item.id, fmt::format("copy failed for {}: {}",
                                                                item.dest_rel, e.what())));
        }
    }

    if (options.dry_run) {
        if (options.backup_mode == BackupMode::Mirror) {
            int stale = 0;
            for (const auto& [rel, e] : manifest.entries) {
                if (!present.count(rel)) stale++;
            }
            if (stale > 0) {
                plan.notes.push_back(fmt::format("mirror would delete {} file(s) no longer in any source", stale));
            }
        }
        if (!missing.empty()) {
            plan.notes.push_back(fmt::format("{} source folder(s) not found", missing.size()));
        }
        result.dry_run_plan = plan;
        return result;
    }

    if (options.backup_mode == BackupMode::Mirror && !stopped) {
        if (!missing.empty()) {
            on_event(ProgressEvent::text("Files: mirror deletions skipped because a source was unavailable"));
        } else {
            std::vector<std::string> gone;
            for (const auto& [rel, e] : manifest.entries) {
                if (!present.count(rel)) gone.push_back(rel);
            }
            for (const auto& rel : gone) {
                std::error_code ec;
                fs::remove(dest / rel, ec);
                if (ec) {
                    result.errors++;
                    on_event(ProgressEvent::text(fmt::format("ERROR Files: delete failed for {}: {}",
                                                             rel, ec.message())));
                    continue;
                }
                manifest.entries.erase(rel);
                on_event(ProgressEvent::text("Files: deleted " + rel));
            }
        }
    }

    save_progress();
    return result;
}
