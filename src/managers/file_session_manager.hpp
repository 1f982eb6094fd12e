#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <core/connection_store.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// One reusable SSH connection (plus its lazily opened SFTP channel) for file
// operations on a connection id.
class FileSession {
public:
    FileSession(std::string connection_id, ConnectionDescriptor descriptor,
                std::shared_ptr<SshTransport> transport);

    const std::string& connection_id() const { return connection_id_; }
    const ConnectionDescriptor& descriptor() const { return descriptor_; }
    SshTransport& transport() { return *transport_; }

    // Opens the SFTP subsystem on first use.
    std::shared_ptr<SftpChannel> sftp() { return transport_->sftp(); }

    bool is_writable() const { return transport_->is_writable(); }

    // Remote home directory via realpath("."), cached after the first
    // success. std::nullopt when the server refuses; transport errors throw.
    std::optional<std::string> home_dir();

    // Expand "~" and "~/..." against the home directory. Other paths, and
    // every path when the home directory is unknown, come back unchanged.
    std::string resolve_path(const std::string& path);

    std::optional<std::string> cached_home() const;
    void cache_home(const std::string& home);

    int64_t last_used() const;
    void touch();

    void close();

private:
    std::string connection_id_;
    ConnectionDescriptor descriptor_;
    std::shared_ptr<SshTransport> transport_;
    mutable std::mutex mutex_;
    std::optional<std::string> home_dir_;
    int64_t last_used_ = 0;
};

class FileSessionManager {
public:
    // Called with the connection id whenever its session is torn down, before
    // the transport closes.
    using PurgeHook = std::function<void(const std::string& connection_id)>;

    FileSessionManager(ConnectionStore& store, TransportFactory& factory);
    ~FileSessionManager();

    FileSessionManager(const FileSessionManager&) = delete;
    FileSessionManager& operator=(const FileSessionManager&) = delete;

    void add_purge_hook(PurgeHook hook);

    // Existing writable session, the in-flight connect, or a fresh connect.
    // Concurrent callers for the same id share one connect attempt.
    std::shared_ptr<FileSession> acquire(const std::string& connection_id);

    // Run fn(FileSession&). A transport-class failure tears the session down
    // and is rethrown; other failures leave the session in place. No retry.
    template <typename Fn>
    auto with_session(const std::string& connection_id, Fn&& fn)
        -> decltype(fn(std::declval<FileSession&>())) {
        auto session = acquire(connection_id);
        try {
            return fn(*session);
        } catch (const std::exception& e) {
            if (is_transport_error(e)) {
                hostlink_log("File session " + connection_id + " torn down: " + e.what());
                reset_session(connection_id, session);
            }
            throw;
        }
    }

    // Tear down whatever session is registered for the id.
    void reset(const std::string& connection_id);

    bool has_session(const std::string& connection_id) const;
    std::vector<std::string> connection_ids() const;
    std::optional<ConnectionDescriptor> descriptor_of(const std::string& connection_id) const;

    void close_all();

private:
    using PendingConnect = std::shared_future<std::shared_ptr<FileSession>>;

    ConnectionStore& store_;
    TransportFactory& factory_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FileSession>> sessions_;
    std::map<std::string, PendingConnect> pending_;
    std::vector<PurgeHook> purge_hooks_;
    bool shut_down_ = false;

    // Only removes and purges `expected`; a newer session registered meanwhile
    // survives along with its cursors.
    void reset_session(const std::string& connection_id,
                       const std::shared_ptr<FileSession>& expected);
    void retire(const std::shared_ptr<FileSession>& session);
    std::shared_ptr<FileSession> open_session(const std::string& connection_id);
};
