#pragma once

#include <string>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

// Small pieces of state that outlive a single run.
struct AppState {
    std::string device_id;          // destination-side dedup identity; regenerated by reset
    std::string last_run_at;        // ISO timestamp of the last finished run, "" if never
};

class StateStore {
public:
    // Defaults to ~/.keepsake/state/app_state.yaml
    StateStore();
    explicit StateStore(fs::path state_path);

    AppState load();
    void save(const AppState& state);

    // Returns the stored device id, minting and persisting one if absent.
    std::string ensure_device_id();

    // Replace the device id with a fresh one; returns it.
    std::string regenerate_device_id();

    void set_last_run_at(const std::string& iso);

    const fs::path& path() const { return state_path_; }

private:
    AppState load_locked();
    void save_locked(const AppState& state);

    std::mutex mutex_;
    fs::path state_path_;
};
