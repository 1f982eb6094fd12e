#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "dir_lister.hpp"
#include "file_session_manager.hpp"

// Create every missing segment of an absolute (or relative) remote path.
// A segment that already exists, or that a concurrent mkdir created, is fine.
void sftp_mkdir_recursive(SftpChannel& sftp, const std::string& path);

// Whole-file helpers over SftpChannel::open.
std::string sftp_read_all(SftpChannel& sftp, const std::string& path);
void sftp_write_all(SftpChannel& sftp, const std::string& path, const std::string& data);

// Keep lines [offset, offset + limit) (1-based), each prefixed "<n>\t".
std::string number_lines(const std::string& content, std::optional<int> offset,
                         std::optional<int> limit);

// Parse `grep -rn` output lines of the form file:line:text.
std::vector<GrepMatch> parse_grep_output(const std::string& output);

// File operations on a connection's File Session. Every call goes through
// FileSessionManager::with_session and throws on failure; mutations
// invalidate the listing cache of the directories they touch.
class RemoteOps {
public:
    RemoteOps(FileSessionManager& sessions, DirLister& lister);

    std::string home_dir(const std::string& connection_id);

    std::string read_file(const std::string& connection_id, const std::string& path,
                          std::optional<int> offset = std::nullopt,
                          std::optional<int> limit = std::nullopt);
    void write_file(const std::string& connection_id, const std::string& path,
                    const std::string& content);

    // Payloads are base64 encoded.
    std::string read_file_binary(const std::string& connection_id, const std::string& path);
    void write_file_binary(const std::string& connection_id, const std::string& path,
                           const std::string& base64_data);

    void mkdir(const std::string& connection_id, const std::string& path);
    void remove(const std::string& connection_id, const std::string& path);
    void move(const std::string& connection_id, const std::string& from, const std::string& to);

    std::vector<std::string> glob(const std::string& connection_id, const std::string& pattern,
                                  const std::optional<std::string>& path = std::nullopt);
    std::vector<GrepMatch> grep(const std::string& connection_id, const std::string& pattern,
                                const std::optional<std::string>& path = std::nullopt,
                                const std::optional<std::string>& include = std::nullopt);

    // Zip a remote directory into /tmp on the remote host; returns the archive path.
    std::string zip_dir(const std::string& connection_id, const std::string& dir_path);

    SSHResult exec(const std::string& connection_id, const std::string& command,
                   int timeout_ms = EXEC_DEFAULT_TIMEOUT_MS);

private:
    FileSessionManager& sessions_;
    DirLister& lister_;

    void invalidate_parent(const std::string& connection_id, const std::string& path);
};
