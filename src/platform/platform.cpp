#include "platform.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void write_file_atomic(const fs::path& path, const std::string& contents) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(static_cast<long>(getpid()));

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        }
        out << contents;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("short write to " + tmp.string());
        }
    }

    // rename(2) replaces the target atomically on the same filesystem
    fs::rename(tmp, path);
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
