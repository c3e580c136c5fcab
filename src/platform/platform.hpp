#pragma once

#include <string>
#include <filesystem>

namespace platform {

// $HOME, or the temp directory when it is unset (service accounts, CI).
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

// Writes `contents` to a sibling temp file and renames it over `path`.
// Readers see either the old file or the new one, never a partial write.
// Throws std::filesystem::filesystem_error / std::runtime_error on failure.
void write_file_atomic(const std::filesystem::path& path, const std::string& contents);

void sleep_ms(int ms);

} // namespace platform
