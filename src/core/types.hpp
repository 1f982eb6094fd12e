#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// ── Connection configuration ───────────────────────────────

enum class AuthType {
    Password,
    PrivateKey,
    Agent,
};

struct ConnectionDescriptor {
    std::string id;
    std::optional<std::string> group_id;
    std::string name;
    std::string host;
    int port = 22;
    std::string username;
    AuthType auth_type = AuthType::Password;
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> passphrase;
    std::optional<std::string> startup_command;
    std::optional<std::string> default_directory;
    std::optional<std::string> proxy_jump;       // [user@]host[:port]
    int keep_alive_interval = 60;                // seconds
    int sort_order = 0;
    std::optional<int64_t> last_connected_at;    // epoch ms
    int64_t created_at = 0;
    int64_t updated_at = 0;

    // True when the fields used to open a connection match.
    bool same_endpoint(const ConnectionDescriptor& other) const;
};

struct ConnectionGroup {
    std::string id;
    std::string name;
    int sort_order = 0;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

const char* auth_type_name(AuthType type);
AuthType parse_auth_type(const std::string& value);

// ── Remote listing ─────────────────────────────────────────

enum class EntryType {
    File,
    Directory,
    Symlink,
};

struct SftpListEntry {
    std::string name;
    std::string path;         // absolute remote path
    EntryType type = EntryType::File;
    uint64_t size = 0;
    int64_t modify_time = 0;  // epoch ms

    bool operator==(const SftpListEntry& other) const {
        return name == other.name && path == other.path && type == other.type &&
               size == other.size && modify_time == other.modify_time;
    }
};

const char* entry_type_name(EntryType type);

struct ListDirOptions {
    std::optional<std::string> cursor;
    std::optional<int> limit;
    bool refresh = false;
};

struct DirPage {
    bool has_more = false;
    std::optional<std::string> next_cursor;
};

// Unpaginated listings leave page empty.
struct DirListing {
    std::vector<SftpListEntry> entries;
    std::optional<DirPage> page;
};

struct GrepMatch {
    std::string file;
    int line = 0;
    std::string text;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
