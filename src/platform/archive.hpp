#pragma once

#include <string>
#include <functional>
#include <filesystem>

namespace platform {

// (entries written so far, total entries)
using ArchiveProgress = std::function<void(size_t done, size_t total)>;

// Create a zip archive at zip_path containing source_dir itself as the
// top-level entry (source_dir "/a/proj" yields "proj/...", like `zip -r`).
// Directories are stored so empty folders survive; symlinks are stored as
// links. Throws std::runtime_error on failure. An exception thrown by
// `progress` abandons the archive and propagates.
void create_zip(const std::filesystem::path& zip_path,
                const std::filesystem::path& source_dir,
                const ArchiveProgress& progress = nullptr);

// Number of entries create_zip would write for source_dir.
size_t count_archive_entries(const std::filesystem::path& source_dir);

} // namespace platform
