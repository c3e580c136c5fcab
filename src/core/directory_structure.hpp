#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Ensures the base ~/.keepsake directory structure exists
// Creates directories as needed but does not overwrite files
void ensure_keepsake_directory_structure();

// Get the base ~/.keepsake path
fs::path get_keepsake_root();

// ~/.keepsake/state: app state and the session checkpoint
fs::path get_state_dir();

// ~/.keepsake/tmp: transient per-run cache, cleared by reset
fs::path get_cache_dir();
