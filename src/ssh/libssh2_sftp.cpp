#include "libssh2_sftp.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <atomic>
#include <chrono>
#include <fmt/format.h>
#include <platform/platform.hpp>

static EntryType entry_type_of(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    if (!(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) return EntryType::File;
    switch (attrs.permissions & LIBSSH2_SFTP_S_IFMT) {
    case LIBSSH2_SFTP_S_IFDIR: return EntryType::Directory;
    case LIBSSH2_SFTP_S_IFLNK: return EntryType::Symlink;
    default:                   return EntryType::File;
    }
}

static RemoteAttrs to_remote_attrs(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteAttrs out;
    out.type = entry_type_of(attrs);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) out.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        out.modify_time = static_cast<int64_t>(attrs.mtime) * 1000;
    }
    return out;
}

// Closing a handle on a closed or failed link is a no-op: the session
// reclaims it on disconnect.
static void close_sftp_handle(Libssh2Link& link, LIBSSH2_SFTP_HANDLE* handle,
                              const std::string& what) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(CHANNEL_CLOSE_TIMEOUT_MS);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            if (link.closed || link.broken) return;
            int rc = libssh2_sftp_close_handle(handle);
            if (rc == 0) return;
            if (rc != LIBSSH2_ERROR_EAGAIN) raise_session_error(link, rc, what);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw TimeoutError(fmt::format("{} timed out after {}ms", what, CHANNEL_CLOSE_TIMEOUT_MS));
        }
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

static LIBSSH2_SFTP_HANDLE* open_handle(Libssh2Link& link, const std::string& path,
                                        unsigned long flags, long mode, int open_type,
                                        const std::string& what) {
    return with_link(link, SFTP_OP_TIMEOUT_MS, what,
        [&]() -> std::optional<LIBSSH2_SFTP_HANDLE*> {
            if (!link.sftp) throw TransportError(what + ": SFTP channel not open");
            LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(
                link.sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                flags, mode, open_type);
            if (h) return h;
            int err = libssh2_session_last_errno(link.session);
            if (err == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            raise_session_error(link, err, what);
        });
}

// ── Directory handle ────────────────────────────────────────

namespace {

class Libssh2Dir : public RemoteDir {
public:
    Libssh2Dir(std::shared_ptr<Libssh2Link> link, LIBSSH2_SFTP_HANDLE* handle, std::string path)
        : link_(std::move(link)), handle_(handle), path_(std::move(path)) {}

    ~Libssh2Dir() override {
        try {
            close();
        } catch (const std::exception& e) {
            hostlink_log(fmt::format("Dropping SFTP handle for {}: {}", path_, e.what()));
        }
    }

    DirRound read_round() override {
        if (!handle_) throw SshError("readdir " + path_ + ": handle is closed");

        DirRound round;
        std::string what = "readdir " + path_;
        char name[512];
        LIBSSH2_SFTP_ATTRIBUTES attrs;

        // Wait for the first reply, then drain whatever is already buffered.
        bool first = true;
        while (static_cast<int>(round.entries.size()) < READDIR_ROUND_ENTRIES) {
            int rc;
            if (first) {
                rc = with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<int> {
                    int n = libssh2_sftp_readdir_ex(handle_, name, sizeof(name), nullptr, 0, &attrs);
                    if (n == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
                    if (n < 0) raise_session_error(*link_, n, what);
                    return n;
                });
                first = false;
            } else {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                if (link_->closed) throw TransportError(what + ": SSH session is not connected");
                rc = libssh2_sftp_readdir_ex(handle_, name, sizeof(name), nullptr, 0, &attrs);
                if (rc == LIBSSH2_ERROR_EAGAIN) break;
                if (rc < 0) raise_session_error(*link_, rc, what);
            }

            if (rc == 0) {
                round.eof = true;
                break;
            }
            std::string entry_name(name, static_cast<size_t>(rc));
            if (entry_name == "." || entry_name == "..") continue;

            auto remote = to_remote_attrs(attrs);
            SftpListEntry entry;
            entry.name = entry_name;
            entry.path = posix_join(path_, entry_name);
            entry.type = remote.type;
            entry.size = remote.size;
            entry.modify_time = remote.modify_time;
            round.entries.push_back(std::move(entry));
        }
        return round;
    }

    void close() override {
        if (!handle_) return;
        auto* handle = handle_;
        handle_ = nullptr;
        close_sftp_handle(*link_, handle, "closedir " + path_);
    }

private:
    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};

// ── File handle ─────────────────────────────────────────────

class Libssh2File : public RemoteFile {
public:
    Libssh2File(std::shared_ptr<Libssh2Link> link, LIBSSH2_SFTP_HANDLE* handle, std::string path)
        : link_(std::move(link)), handle_(handle), path_(std::move(path)) {}

    ~Libssh2File() override {
        try {
            close();
        } catch (const std::exception& e) {
            hostlink_log(fmt::format("Dropping SFTP handle for {}: {}", path_, e.what()));
        }
    }

    size_t read(char* buf, size_t len) override {
        if (!handle_) throw SshError("read " + path_ + ": handle is closed");
        std::string what = "read " + path_;
        return with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<size_t> {
            if (aborted_) throw SshError(what + ": aborted");
            ssize_t n = libssh2_sftp_read(handle_, buf, len);
            if (n == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            if (n < 0) raise_session_error(*link_, static_cast<int>(n), what);
            return static_cast<size_t>(n);
        });
    }

    void write(const char* data, size_t len) override {
        if (!handle_) throw SshError("write " + path_ + ": handle is closed");
        std::string what = "write " + path_;
        size_t sent = 0;
        while (sent < len) {
            sent += with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<size_t> {
                if (aborted_) throw SshError(what + ": aborted");
                ssize_t n = libssh2_sftp_write(handle_, data + sent, len - sent);
                if (n == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
                if (n < 0) raise_session_error(*link_, static_cast<int>(n), what);
                return static_cast<size_t>(n);
            });
        }
    }

    void close() override {
        if (!handle_) return;
        auto* handle = handle_;
        handle_ = nullptr;
        close_sftp_handle(*link_, handle, "close " + path_);
    }

    void abort() override { aborted_ = true; }

private:
    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
    std::atomic<bool> aborted_{false};
};

} // namespace

// ── Libssh2Sftp ─────────────────────────────────────────────

Libssh2Sftp::Libssh2Sftp(std::shared_ptr<Libssh2Link> link)
    : link_(std::move(link)) {
}

std::string Libssh2Sftp::realpath(const std::string& path) {
    std::string what = "realpath " + path;
    char buf[4096];
    int len = with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<int> {
        int rc = libssh2_sftp_symlink_ex(link_->sftp, path.c_str(),
                                         static_cast<unsigned int>(path.size()),
                                         buf, sizeof(buf), LIBSSH2_SFTP_REALPATH);
        if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        if (rc < 0) raise_session_error(*link_, rc, what);
        return rc;
    });
    return std::string(buf, static_cast<size_t>(len));
}

std::optional<RemoteAttrs> Libssh2Sftp::stat(const std::string& path) {
    std::string what = "stat " + path;
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    bool found = with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<bool> {
        int rc = libssh2_sftp_stat_ex(link_->sftp, path.c_str(),
                                      static_cast<unsigned int>(path.size()),
                                      LIBSSH2_SFTP_STAT, &attrs);
        if (rc == 0) return true;
        if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            libssh2_sftp_last_error(link_->sftp) == LIBSSH2_FX_NO_SUCH_FILE) {
            return false;
        }
        raise_session_error(*link_, rc, what);
    });
    if (!found) return std::nullopt;
    return to_remote_attrs(attrs);
}

void Libssh2Sftp::mkdir(const std::string& path, int mode) {
    std::string what = "mkdir " + path;
    with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<bool> {
        int rc = libssh2_sftp_mkdir_ex(link_->sftp, path.c_str(),
                                       static_cast<unsigned int>(path.size()), mode);
        if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        if (rc < 0) raise_session_error(*link_, rc, what);
        return true;
    });
}

void Libssh2Sftp::unlink(const std::string& path) {
    std::string what = "unlink " + path;
    with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<bool> {
        int rc = libssh2_sftp_unlink_ex(link_->sftp, path.c_str(),
                                        static_cast<unsigned int>(path.size()));
        if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        if (rc < 0) raise_session_error(*link_, rc, what);
        return true;
    });
}

void Libssh2Sftp::rmdir(const std::string& path) {
    std::string what = "rmdir " + path;
    with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<bool> {
        int rc = libssh2_sftp_rmdir_ex(link_->sftp, path.c_str(),
                                       static_cast<unsigned int>(path.size()));
        if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        if (rc < 0) raise_session_error(*link_, rc, what);
        return true;
    });
}

void Libssh2Sftp::rename(const std::string& from, const std::string& to) {
    std::string what = fmt::format("rename {} -> {}", from, to);
    with_link(*link_, SFTP_OP_TIMEOUT_MS, what, [&]() -> std::optional<bool> {
        int rc = libssh2_sftp_rename_ex(link_->sftp,
                                        from.c_str(), static_cast<unsigned int>(from.size()),
                                        to.c_str(), static_cast<unsigned int>(to.size()),
                                        LIBSSH2_SFTP_RENAME_OVERWRITE |
                                        LIBSSH2_SFTP_RENAME_ATOMIC |
                                        LIBSSH2_SFTP_RENAME_NATIVE);
        if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        if (rc < 0) raise_session_error(*link_, rc, what);
        return true;
    });
}

std::unique_ptr<RemoteDir> Libssh2Sftp::opendir(const std::string& path) {
    auto* handle = open_handle(*link_, path, 0, 0, LIBSSH2_SFTP_OPENDIR, "opendir " + path);
    return std::make_unique<Libssh2Dir>(link_, handle, path);
}

std::unique_ptr<RemoteFile> Libssh2Sftp::open(const std::string& path, OpenMode mode) {
    unsigned long flags = LIBSSH2_FXF_READ;
    long perms = 0;
    if (mode == OpenMode::WriteTruncate) {
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
        perms = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH;
    }
    auto* handle = open_handle(*link_, path, flags, perms, LIBSSH2_SFTP_OPENFILE, "open " + path);
    return std::make_unique<Libssh2File>(link_, handle, path);
}
