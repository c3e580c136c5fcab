#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "transfer_engine.hpp"

namespace fs = std::filesystem;

// What the destination folder is known to hold, keyed by relative path.
struct MirrorManifestEntry {
    std::string path;               // relative to the destination root
    int64_t size = 0;
    int64_t mtime = 0;              // seconds, source file's mtime when copied
};

struct MirrorManifest {
    std::string device_id;
    std::map<std::string, MirrorManifestEntry> entries;
};

// One candidate file found under a source root.
struct SourceItem {
    ItemId id;                      // "<root name>/<rel>", ":pairedVideo" for paired clips
    fs::path source;
    std::string dest_rel;           // "<root name>/<rel>"
    int64_t size = 0;
    int64_t mtime = 0;
};

// Backs up local source trees into a local destination folder.
//   incremental: skip files whose size and mtime match the manifest
//   full:        copy everything
//   mirror:      incremental, then delete destination files no longer in any source
class FolderMirrorEngine : public TransferEngine {
public:
    FolderMirrorEngine() = default;

    TransferResult run(const TransferOptions& options,
                       const EventCallback& on_event,
                       const RunStatePoll& poll_run_state,
                       const std::optional<SessionCheckpoint>& resume_from) override;

    Result<void> clear_destination_state(const TransferOptions& options) override;

    // ── Exposed for tests ─────────────────────────────────────

    // Enumerate, filter and order the files of every source root.
    // Missing roots are reported through `missing`.
    static std::vector<SourceItem> scan_sources(const TransferOptions& options,
                                                std::vector<std::string>& missing);

    static fs::path manifest_path(const fs::path& dest_root);
    static MirrorManifest load_manifest(const fs::path& dest_root, const std::string& device_id);
    static void save_manifest(const fs::path& dest_root, const MirrorManifest& manifest);

    static bool is_image_file(const fs::path& p);
    static bool is_video_file(const fs::path& p);
};
