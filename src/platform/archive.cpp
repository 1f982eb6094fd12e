#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace platform {

static std::vector<fs::path> collect_entries(const fs::path& source_dir) {
    std::vector<fs::path> entries;
    entries.push_back(source_dir);
    for (auto it = fs::recursive_directory_iterator(
             source_dir, fs::directory_options::skip_permission_denied);
         it != fs::recursive_directory_iterator(); ++it) {
        entries.push_back(it->path());
    }
    return entries;
}

size_t count_archive_entries(const fs::path& source_dir) {
    return collect_entries(source_dir).size();
}

void create_zip(const fs::path& zip_path,
                const fs::path& source_dir,
                const ArchiveProgress& progress) {
    if (!fs::is_directory(source_dir)) {
        throw std::runtime_error("Not a directory: " + source_dir.string());
    }

    auto entries = collect_entries(source_dir);
    fs::path base = source_dir.parent_path();

    struct archive* a = archive_write_new();
    if (!a) throw std::runtime_error("Failed to create archive writer");

    archive_write_set_format_zip(a);

    if (archive_write_open_filename(a, zip_path.string().c_str()) != ARCHIVE_OK) {
        std::string err = archive_error_string(a);
        archive_write_free(a);
        throw std::runtime_error("Failed to open zip file: " + err);
    }

    struct archive_entry* entry = archive_entry_new();
    size_t done = 0;

    for (const auto& full_path : entries) {
        std::error_code ec;
        auto status = fs::symlink_status(full_path, ec);
        if (ec) continue;

        std::string rel = fs::relative(full_path, base, ec).generic_string();
        if (ec || rel.empty()) continue;

        archive_entry_clear(entry);

        auto mtime = fs::last_write_time(full_path, ec);
        if (!ec) {
            auto mtime_sec = std::chrono::duration_cast<std::chrono::seconds>(
                mtime.time_since_epoch()).count();
            archive_entry_set_mtime(entry, mtime_sec, 0);
        }

        bool is_file = false;
        if (fs::is_symlink(status)) {
            archive_entry_set_pathname(entry, rel.c_str());
            archive_entry_set_filetype(entry, AE_IFLNK);
            archive_entry_set_perm(entry, 0777);
            archive_entry_set_symlink(entry, fs::read_symlink(full_path, ec).generic_string().c_str());
        } else if (fs::is_directory(status)) {
            std::string dir_name = rel + "/";
            archive_entry_set_pathname(entry, dir_name.c_str());
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
        } else if (fs::is_regular_file(status)) {
            archive_entry_set_pathname(entry, rel.c_str());
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_size(entry, static_cast<int64_t>(fs::file_size(full_path, ec)));
            auto perms = static_cast<int>(status.permissions() & fs::perms::mask);
            archive_entry_set_perm(entry, perms ? perms : 0644);
            is_file = true;
        } else {
            continue;  // sockets, fifos, devices
        }

        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            std::string err = archive_error_string(a);
            archive_entry_free(entry);
            archive_write_free(a);
            throw std::runtime_error("Failed to add " + rel + ": " + err);
        }

        if (is_file) {
            std::ifstream in(full_path, std::ios::binary);
            if (!in) {
                archive_entry_free(entry);
                archive_write_free(a);
                throw std::runtime_error("Cannot read file: " + full_path.string());
            }
            char buf[65536];
            while (in) {
                in.read(buf, sizeof(buf));
                auto bytes_read = in.gcount();
                if (bytes_read > 0 &&
                    archive_write_data(a, buf, static_cast<size_t>(bytes_read)) < 0) {
                    std::string err = archive_error_string(a);
                    archive_entry_free(entry);
                    archive_write_free(a);
                    throw std::runtime_error("Failed to write " + rel + ": " + err);
                }
            }
        }

        ++done;
        if (progress) {
            // The callback may throw to abandon the archive.
            try {
                progress(done, entries.size());
            } catch (...) {
                archive_entry_free(entry);
                archive_write_free(a);
                throw;
            }
        }
    }

    archive_entry_free(entry);
    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string err = archive_error_string(a);
        archive_write_free(a);
        throw std::runtime_error("Failed to finalize zip: " + err);
    }
    archive_write_free(a);
}

} // namespace platform
