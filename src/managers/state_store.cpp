#include "state_store.hpp"
#include "backup_log.hpp"
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

StateStore::StateStore() : state_path_(get_state_dir() / "app_state.yaml") {}

StateStore::StateStore(fs::path state_path) : state_path_(std::move(state_path)) {}

AppState StateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked();
}

AppState StateStore::load_locked() {
    AppState state;

    if (!fs::exists(state_path_)) {
        return state;
    }

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());
        state.device_id = root["device_id"].as<std::string>("");
        state.last_run_at = root["last_run_at"].as<std::string>("");
    } catch (const std::exception& e) {
        // Corrupted state file, start fresh
        keepsake_log("state_store: ignoring unreadable " + state_path_.string() + ": " + e.what());
        return AppState{};
    }

    return state;
}

void StateStore::save(const AppState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    save_locked(state);
}

void StateStore::save_locked(const AppState& state) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "device_id" << YAML::Value << state.device_id;
    out << YAML::Key << "last_run_at" << YAML::Value << state.last_run_at;
    out << YAML::EndMap;

    try {
        platform::write_file_atomic(state_path_, std::string(out.c_str()) + "\n");
    } catch (const std::exception& e) {
        keepsake_log("state_store: save failed: " + std::string(e.what()));
    }
}

std::string StateStore::ensure_device_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    AppState state = load_locked();
    if (state.device_id.empty()) {
        state.device_id = generate_uuid();
        save_locked(state);
        keepsake_log("state_store: minted device id " + state.device_id);
    }
    return state.device_id;
}

std::string StateStore::regenerate_device_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    AppState state = load_locked();
    state.device_id = generate_uuid();
    save_locked(state);
    keepsake_log("state_store: regenerated device id " + state.device_id);
    return state.device_id;
}

void StateStore::set_last_run_at(const std::string& iso) {
    std::lock_guard<std::mutex> lock(mutex_);
    AppState state = load_locked();
    state.last_run_at = iso;
    save_locked(state);
}
