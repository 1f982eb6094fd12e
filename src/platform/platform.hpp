#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Unique, not-yet-existing path in the temp directory: <prefix>_<random><extension>.
std::filesystem::path temp_file(const std::string& prefix, const std::string& extension = "");

// Size of a local regular file, or -1 if it cannot be stat'ed.
int64_t local_file_size(const std::filesystem::path& path);

// Remove a local file, ignoring errors. Returns true if something was removed.
bool remove_quietly(const std::filesystem::path& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
