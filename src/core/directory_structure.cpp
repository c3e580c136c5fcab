#include "directory_structure.hpp"
#include <platform/platform.hpp>

fs::path get_keepsake_root() {
    return platform::home_dir() / ".keepsake";
}

fs::path get_state_dir() {
    return get_keepsake_root() / "state";
}

fs::path get_cache_dir() {
    return get_keepsake_root() / "tmp";
}

void ensure_keepsake_directory_structure() {
    fs::path root = get_keepsake_root();

    // Create base directories
    fs::create_directories(root);
    fs::create_directories(root / "state");
    fs::create_directories(root / "logs");
    fs::create_directories(root / "tmp");
}
