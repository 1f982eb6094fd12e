#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Seams between the managers and the SSH library. Every call may throw
// SshError (or a subclass); a closed transport throws TransportError.

struct RemoteAttrs {
    EntryType type = EntryType::File;
    uint64_t size = 0;
    int64_t modify_time = 0;   // epoch ms
};

struct DirRound {
    std::vector<SftpListEntry> entries;   // "." and ".." already filtered
    bool eof = false;
};

// One open remote directory handle.
class RemoteDir {
public:
    virtual ~RemoteDir() = default;

    // One protocol read round. An empty round without eof is legal.
    virtual DirRound read_round() = 0;

    // Idempotent.
    virtual void close() = 0;
};

enum class OpenMode {
    Read,
    WriteTruncate,
};

class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns 0 at end of file.
    virtual size_t read(char* buf, size_t len) = 0;
    virtual void write(const char* data, size_t len) = 0;
    virtual void close() = 0;

    // May be called from another thread. A pending or later read/write
    // fails promptly with SshError; the owner still calls close().
    virtual void abort() = 0;
};

class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    virtual std::string realpath(const std::string& path) = 0;

    // std::nullopt when the path does not exist.
    virtual std::optional<RemoteAttrs> stat(const std::string& path) = 0;

    virtual void mkdir(const std::string& path, int mode = 0755) = 0;
    virtual void unlink(const std::string& path) = 0;
    virtual void rmdir(const std::string& path) = 0;
    virtual void rename(const std::string& from, const std::string& to) = 0;

    virtual std::unique_ptr<RemoteDir> opendir(const std::string& path) = 0;
    virtual std::unique_ptr<RemoteFile> open(const std::string& path, OpenMode mode) = 0;
};

struct PtyRequest {
    std::string term;
    int cols = 0;
    int rows = 0;
};

struct ShellRead {
    std::string data;      // stdout and stderr, in arrival order
    bool closed = false;   // remote side hung up
};

class ShellStream {
public:
    virtual ~ShellStream() = default;

    virtual void write(const std::string& data) = 0;
    virtual void resize(int cols, int rows) = 0;

    // Wait up to wait_ms for output.
    virtual ShellRead read(int wait_ms) = 0;
    virtual void close() = 0;
};

class SshTransport {
public:
    virtual ~SshTransport() = default;

    // False once closed or once the socket has failed.
    virtual bool is_writable() const = 0;

    // Opened on first use, then reused.
    virtual std::shared_ptr<SftpChannel> sftp() = 0;

    // Non-interactive command on a fresh exec channel. Once `abort` reads
    // true the channel is closed and SshError("Command aborted") thrown.
    virtual SSHResult exec(const std::string& command, int timeout_ms,
                           const std::atomic<bool>* abort = nullptr) = 0;

    virtual std::shared_ptr<ShellStream> open_shell(const PtyRequest& pty) = 0;

    // Idempotent.
    virtual void close() = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual std::shared_ptr<SshTransport> connect(const ConnectionDescriptor& desc,
                                                  int timeout_ms) = 0;
};
