#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Single-slot persistence for the one resumable session.
// save() overwrites atomically; load() treats a missing or unreadable slot as
// "no resumable session"; clear() empties the slot.
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    virtual Result<void> save(const SessionCheckpoint& checkpoint) = 0;
    virtual std::optional<SessionCheckpoint> load() = 0;
    virtual Result<void> clear() = 0;
};

// ~/.keepsake/state/session_v1.json
class FileCheckpointStore : public CheckpointStore {
public:
    explicit FileCheckpointStore(fs::path path);

    Result<void> save(const SessionCheckpoint& checkpoint) override;
    std::optional<SessionCheckpoint> load() override;
    Result<void> clear() override;

    const fs::path& path() const { return path_; }

private:
    std::mutex mutex_;
    fs::path path_;
};

class MemoryCheckpointStore : public CheckpointStore {
public:
    Result<void> save(const SessionCheckpoint& checkpoint) override;
    std::optional<SessionCheckpoint> load() override;
    Result<void> clear() override;

    // Make subsequent saves fail, as a full disk would.
    void set_fail_saves(bool fail);
    int save_count() const;

private:
    mutable std::mutex mutex_;
    std::optional<SessionCheckpoint> slot_;
    bool fail_saves_ = false;
    int save_count_ = 0;
};

// JSON encoding of a checkpoint (carries a "version" field).
std::string checkpoint_to_json(const SessionCheckpoint& checkpoint);
Result<SessionCheckpoint> checkpoint_from_json(const std::string& text);

// Lossless text escaping for ids and paths that are not valid UTF-8.
std::string escape_checkpoint_text(const std::string& raw);
std::string unescape_checkpoint_text(const std::string& text);
