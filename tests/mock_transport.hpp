#pragma once

// In-memory stand-ins for the SSH transport: a fake remote filesystem with
// scriptable directory paging, exec handlers, shells and failures.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/connection_store.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <ssh/transport.hpp>

struct MockNode {
    EntryType type = EntryType::File;
    std::string data;
    int64_t mtime = 0;
};

// Shared remote host state. Tests poke the public fields directly; the mock
// objects lock `mutex` around every access.
class MockRemote {
public:
    std::mutex mutex;
    std::map<std::string, MockNode> nodes;
    std::string home = "/home/tester";

    // Directory paging
    size_t round_size = 128;
    bool send_eof = true;             // false: never report EOF, only empty rounds
    int empty_rounds_between = 0;     // empty rounds after each data round
    std::optional<int> fail_round;    // throw on this (0-based) read round
    bool fail_round_transport = false;
    std::function<void(int round)> on_read_round;

    // File I/O
    std::function<void(size_t total_written)> on_write;
    std::optional<size_t> fail_write_after;
    bool stall_writes = false;        // writes hang until the handle is aborted
    std::atomic<int> stalled_writes{0};

    // Exec: default handler answers 0 with no output.
    std::function<SSHResult(const std::string&)> exec_handler;
    std::vector<std::string> exec_log;
    std::string stall_exec;           // commands containing this hang until aborted
    std::atomic<int> stalled_execs{0};

    std::atomic<int> opendir_count{0};
    std::atomic<int> open_dirs{0};
    std::atomic<int> dir_close_calls{0};
    std::atomic<int> readdir_rounds{0};

    MockRemote() {
        add_dir("/");
        add_dir(home);
    }

    void add_dir(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        add_dir_locked(path);
    }

    void add_file(const std::string& path, const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex);
        add_dir_locked(posix_dirname(path));
        nodes[path] = MockNode{EntryType::File, data, 1700000000000};
    }

    // Create `count` files named f0000, f0001, ... under dir.
    void add_files(const std::string& dir, int count) {
        for (int i = 0; i < count; ++i) {
            char name[16];
            std::snprintf(name, sizeof(name), "f%04d", i);
            add_file(posix_join(dir, name), std::to_string(i));
        }
    }

    bool exists(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        return nodes.count(path) > 0;
    }

    std::string read(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = nodes.find(path);
        return it == nodes.end() ? std::string() : it->second.data;
    }

    std::vector<SftpListEntry> children_locked(const std::string& dir) {
        std::vector<SftpListEntry> out;
        std::string prefix = dir == "/" ? "/" : dir + "/";
        for (const auto& [path, node] : nodes) {
            if (path == dir || path.rfind(prefix, 0) != 0) continue;
            std::string rest = path.substr(prefix.size());
            if (rest.empty() || rest.find('/') != std::string::npos) continue;
            SftpListEntry e;
            e.name = rest;
            e.path = path;
            e.type = node.type;
            e.size = node.data.size();
            e.modify_time = node.mtime;
            out.push_back(e);
        }
        return out;
    }

    SSHResult run(const std::string& command) {
        std::function<SSHResult(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            exec_log.push_back(command);
            handler = exec_handler;
        }
        if (handler) return handler(command);
        return SSHResult{0, "", ""};
    }

    // Spin until `stop` reads true; false when the safety limit ran out.
    static bool wait_until(const std::function<bool()>& stop) {
        auto limit = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!stop()) {
            if (std::chrono::steady_clock::now() >= limit) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    bool ran(const std::string& fragment) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& c : exec_log) {
            if (c.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

private:
    void add_dir_locked(const std::string& path) {
        if (path.empty() || path == ".") return;
        if (path != "/") add_dir_locked(posix_dirname(path));
        auto& node = nodes[path];
        node.type = EntryType::Directory;
    }
};

// ── SFTP objects ─────────────────────────────────────────────

class MockTransport;

class MockDir : public RemoteDir {
public:
    MockDir(std::shared_ptr<MockRemote> remote, std::vector<SftpListEntry> entries,
            std::function<void()> check)
        : remote_(std::move(remote)), entries_(std::move(entries)), check_(std::move(check)) {
        remote_->open_dirs++;
    }

    ~MockDir() override { close(); }

    DirRound read_round() override {
        check_();
        int round = rounds_++;
        remote_->readdir_rounds++;
        if (remote_->on_read_round) remote_->on_read_round(round);
        if (remote_->fail_round && *remote_->fail_round == round) {
            if (remote_->fail_round_transport) throw TransportError("readdir: socket disconnect");
            throw SftpError(SFTP_STATUS_PERMISSION, "readdir: permission denied");
        }
        DirRound out;
        if (pending_empty_ > 0) {
            --pending_empty_;
            return out;
        }
        if (pos_ < entries_.size()) {
            size_t end = std::min(entries_.size(), pos_ + remote_->round_size);
            out.entries.assign(entries_.begin() + static_cast<std::ptrdiff_t>(pos_),
                               entries_.begin() + static_cast<std::ptrdiff_t>(end));
            pos_ = end;
            pending_empty_ = remote_->empty_rounds_between;
            return out;
        }
        out.eof = remote_->send_eof;
        return out;
    }

    void close() override {
        remote_->dir_close_calls++;
        if (closed_) return;
        closed_ = true;
        remote_->open_dirs--;
    }

private:
    std::shared_ptr<MockRemote> remote_;
    std::vector<SftpListEntry> entries_;
    std::function<void()> check_;
    size_t pos_ = 0;
    int rounds_ = 0;
    int pending_empty_ = 0;
    bool closed_ = false;
};

class MockFile : public RemoteFile {
public:
    MockFile(std::shared_ptr<MockRemote> remote, std::string path, std::function<void()> check)
        : remote_(std::move(remote)), path_(std::move(path)), check_(std::move(check)) {}

    size_t read(char* buf, size_t len) override {
        check_();
        std::lock_guard<std::mutex> lock(remote_->mutex);
        const std::string& data = remote_->nodes[path_].data;
        if (offset_ >= data.size()) return 0;
        size_t n = std::min(len, data.size() - offset_);
        data.copy(buf, n, offset_);
        offset_ += n;
        return n;
    }

    void write(const char* data, size_t len) override {
        check_();
        if (aborted_) throw SshError("write " + path_ + ": aborted");
        bool stall;
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            stall = remote_->stall_writes;
        }
        if (stall) {
            remote_->stalled_writes++;
            if (MockRemote::wait_until([this] { return aborted_.load(); })) {
                throw SshError("write " + path_ + ": aborted");
            }
        }
        std::function<void(size_t)> hook;
        size_t total;
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            if (remote_->fail_write_after && written_ + len > *remote_->fail_write_after) {
                throw SftpError(SFTP_STATUS_FAILURE, "write " + path_ + ": failure");
            }
            remote_->nodes[path_].data.append(data, len);
            written_ += len;
            total = written_;
            hook = remote_->on_write;
        }
        if (hook) hook(total);
    }

    void close() override {}

    void abort() override { aborted_ = true; }

private:
    std::shared_ptr<MockRemote> remote_;
    std::string path_;
    std::function<void()> check_;
    size_t offset_ = 0;
    size_t written_ = 0;
    std::atomic<bool> aborted_{false};
};

class MockSftp : public SftpChannel {
public:
    MockSftp(std::shared_ptr<MockRemote> remote, std::function<void()> check)
        : remote_(std::move(remote)), check_(std::move(check)) {}

    std::string realpath(const std::string& path) override {
        check_();
        if (path == ".") return remote_->home;
        return path;
    }

    std::optional<RemoteAttrs> stat(const std::string& path) override {
        check_();
        std::lock_guard<std::mutex> lock(remote_->mutex);
        auto it = remote_->nodes.find(path);
        if (it == remote_->nodes.end()) return std::nullopt;
        return RemoteAttrs{it->second.type, it->second.data.size(), it->second.mtime};
    }

    void mkdir(const std::string& path, int) override {
        check_();
        std::lock_guard<std::mutex> lock(remote_->mutex);
        if (remote_->nodes.count(path)) throw SftpError(SFTP_STATUS_FAILURE, "mkdir " + path + ": failure");
        if (!remote_->nodes.count(posix_dirname(path))) {
            throw SftpError(SFTP_STATUS_NO_SUCH_FILE, "mkdir " + path + ": no such file");
        }
        remote_->nodes[path] = MockNode{EntryType::Directory, "", 0};
    }

    void unlink(const std::string& path) override {
        check_();
        std::lock_guard<std::mutex> lock(remote_->mutex);
        auto it = remote_->nodes.find(path);
        if (it == remote_->nodes.end() || it->second.type == EntryType::Directory) {
            throw SftpError(SFTP_STATUS_NO_SUCH_FILE, "unlink " + path + ": no such file");
        }
        remote_->nodes.erase(it);
    }

    void rmdir(const std::string& path) override {
        check_();
        std::lock_guard<std::mutex> lock(remote_->mutex);
        if (!remote_->children_locked(path).empty()) {
            throw SftpError(SFTP_STATUS_FAILURE, "rmdir " + path + ": not empty");
        }
        remote_->nodes.erase(path);
    }

    void rename(const std::string& from, const std::string& to) override {
        check_();
        std::lock_guard<std::mutex> lock(remote_->mutex);
        auto it = remote_->nodes.find(from);
        if (it == remote_->nodes.end()) {
            throw SftpError(SFTP_STATUS_NO_SUCH_FILE, "rename " + from + ": no such file");
        }
        remote_->nodes[to] = it->second;
        remote_->nodes.erase(from);
    }

    std::unique_ptr<RemoteDir> opendir(const std::string& path) override {
        check_();
        std::vector<SftpListEntry> entries;
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            auto it = remote_->nodes.find(path);
            if (it == remote_->nodes.end() || it->second.type != EntryType::Directory) {
                throw SftpError(SFTP_STATUS_NO_SUCH_FILE, "opendir " + path + ": no such file");
            }
            entries = remote_->children_locked(path);
        }
        remote_->opendir_count++;
        return std::make_unique<MockDir>(remote_, std::move(entries), check_);
    }

    std::unique_ptr<RemoteFile> open(const std::string& path, OpenMode mode) override {
        check_();
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            auto it = remote_->nodes.find(path);
            if (mode == OpenMode::Read) {
                if (it == remote_->nodes.end() || it->second.type != EntryType::File) {
                    throw SftpError(SFTP_STATUS_NO_SUCH_FILE, "open " + path + ": no such file");
                }
            } else {
                if (!remote_->nodes.count(posix_dirname(path))) {
                    throw SftpError(SFTP_STATUS_NO_SUCH_FILE, "open " + path + ": no such file");
                }
                remote_->nodes[path] = MockNode{EntryType::File, "", 0};
            }
        }
        return std::make_unique<MockFile>(remote_, path, check_);
    }

private:
    std::shared_ptr<MockRemote> remote_;
    std::function<void()> check_;
};

// ── Shell ────────────────────────────────────────────────────

class MockShell : public ShellStream {
public:
    void write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        written_ += data;
    }

    void resize(int cols, int rows) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cols_ = cols;
        rows_ = rows;
    }

    ShellRead read(int wait_ms) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!output_.empty()) {
                ShellRead r;
                r.data = output_.front();
                output_.pop_front();
                return r;
            }
            if (hung_up_ || closed_) return ShellRead{"", true};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(wait_ms, 5)));
        return ShellRead{};
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    // Test side
    void push_output(const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_.push_back(data);
    }
    void hang_up() {
        std::lock_guard<std::mutex> lock(mutex_);
        hung_up_ = true;
    }
    std::string written() {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }
    std::pair<int, int> size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return {cols_, rows_};
    }
    bool closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::mutex mutex_;
    std::deque<std::string> output_;
    std::string written_;
    int cols_ = 0;
    int rows_ = 0;
    bool hung_up_ = false;
    bool closed_ = false;
};

// ── Transport and factory ────────────────────────────────────

class MockTransport : public SshTransport, public std::enable_shared_from_this<MockTransport> {
public:
    MockTransport(std::shared_ptr<MockRemote> remote, ConnectionDescriptor desc)
        : remote_(std::move(remote)), desc_(std::move(desc)) {}

    bool is_writable() const override { return !closed_ && !broken_; }

    std::shared_ptr<SftpChannel> sftp() override {
        check();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sftp_) {
            sftp_ = std::make_shared<MockSftp>(remote_, [this] { check(); });
        }
        return sftp_;
    }

    SSHResult exec(const std::string& command, int,
                   const std::atomic<bool>* abort = nullptr) override {
        check();
        std::string stall;
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            stall = remote_->stall_exec;
        }
        if (!stall.empty() && command.find(stall) != std::string::npos) {
            {
                std::lock_guard<std::mutex> lock(remote_->mutex);
                remote_->exec_log.push_back(command);
            }
            remote_->stalled_execs++;
            if (abort && MockRemote::wait_until([abort] { return abort->load(); })) {
                throw SshError("Command aborted");
            }
            return SSHResult{0, "", ""};
        }
        return remote_->run(command);
    }

    std::shared_ptr<ShellStream> open_shell(const PtyRequest& pty) override {
        check();
        auto shell = std::make_shared<MockShell>();
        shell->resize(pty.cols, pty.rows);
        std::lock_guard<std::mutex> lock(mutex_);
        pty_ = pty;
        shell_ = shell;
        return shell;
    }

    void close() override { closed_ = true; }

    // Simulate a dropped socket.
    void break_link() { broken_ = true; }

    bool closed() const { return closed_; }
    const ConnectionDescriptor& descriptor() const { return desc_; }
    std::shared_ptr<MockShell> shell() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shell_;
    }
    PtyRequest pty() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pty_;
    }

private:
    std::shared_ptr<MockRemote> remote_;
    ConnectionDescriptor desc_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> broken_{false};
    std::mutex mutex_;
    std::shared_ptr<SftpChannel> sftp_;
    std::shared_ptr<MockShell> shell_;
    PtyRequest pty_;

    void check() const {
        if (closed_) throw TransportError("SSH session is not connected");
        if (broken_) throw TransportError("Socket disconnect");
    }
};

class MockTransportFactory : public TransportFactory {
public:
    std::shared_ptr<MockRemote> remote = std::make_shared<MockRemote>();

    std::atomic<int> connects{0};
    int connect_delay_ms = 0;
    std::function<void(const ConnectionDescriptor&)> before_connect;   // may throw

    std::shared_ptr<SshTransport> connect(const ConnectionDescriptor& desc, int) override {
        connects++;
        if (connect_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(connect_delay_ms));
        }
        if (before_connect) before_connect(desc);
        auto t = std::make_shared<MockTransport>(remote, desc);
        std::lock_guard<std::mutex> lock(mutex_);
        transports_.push_back(t);
        return t;
    }

    std::vector<std::shared_ptr<MockTransport>> transports() {
        std::lock_guard<std::mutex> lock(mutex_);
        return transports_;
    }

    std::shared_ptr<MockTransport> last() {
        std::lock_guard<std::mutex> lock(mutex_);
        return transports_.empty() ? nullptr : transports_.back();
    }

private:
    std::mutex mutex_;
    std::vector<std::shared_ptr<MockTransport>> transports_;
};

// ── Store ────────────────────────────────────────────────────

class MemoryConnectionStore : public ConnectionStore {
public:
    void put(const ConnectionDescriptor& c) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connections_[c.id] = c;
        }
        notify();
    }

    std::vector<ConnectionDescriptor> list_connections() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ConnectionDescriptor> out;
        for (const auto& [id, c] : connections_) out.push_back(c);
        return out;
    }

    std::optional<ConnectionDescriptor> get_connection(const std::string& id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<ConnectionGroup> list_groups() const override { return {}; }

    Result<void> create_connection(const ConnectionDescriptor& c) override {
        put(c);
        return Result<void>::Ok();
    }
    Result<void> update_connection(const ConnectionDescriptor& c) override {
        put(c);
        return Result<void>::Ok();
    }
    Result<void> delete_connection(const std::string& id) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connections_.erase(id)) return Result<void>::Err("Connection not found");
        }
        notify();
        return Result<void>::Ok();
    }
    Result<void> create_group(const ConnectionGroup&) override { return Result<void>::Ok(); }
    Result<void> delete_group(const std::string&) override { return Result<void>::Ok(); }

    Result<void> record_connected(const std::string& id, int64_t when_ms) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connections_.find(id);
            if (it == connections_.end()) return Result<void>::Err("Connection not found");
            it->second.last_connected_at = when_ms;
        }
        notify();
        return Result<void>::Ok();
    }

    void on_change(ChangeListener listener) override {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ConnectionDescriptor> connections_;
    std::vector<ChangeListener> listeners_;

    void notify() {
        std::vector<ChangeListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners = listeners_;
        }
        for (auto& l : listeners) l();
    }
};

inline ConnectionDescriptor make_descriptor(const std::string& id, const std::string& host = "example.test") {
    ConnectionDescriptor c;
    c.id = id;
    c.name = id;
    c.host = host;
    c.username = "tester";
    c.password = "secret";
    return c;
}
