#include "file_session_manager.hpp"
#include <core/constants.hpp>
#include <core/deadline.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// ── FileSession ───────────────────────────────────────────────

FileSession::FileSession(std::string connection_id, ConnectionDescriptor descriptor,
                         std::shared_ptr<SshTransport> transport)
    : connection_id_(std::move(connection_id)),
      descriptor_(std::move(descriptor)),
      transport_(std::move(transport)),
      last_used_(now_ms()) {
}

std::optional<std::string> FileSession::cached_home() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return home_dir_;
}

void FileSession::cache_home(const std::string& home) {
    std::lock_guard<std::mutex> lock(mutex_);
    home_dir_ = home;
}

std::optional<std::string> FileSession::home_dir() {
    if (auto cached = cached_home()) return cached;
    try {
        std::string home = sftp()->realpath(".");
        cache_home(home);
        return home;
    } catch (const std::exception& e) {
        if (is_transport_error(e)) throw;
        hostlink_log(fmt::format("realpath(.) failed on {}: {}", connection_id_, e.what()));
        return std::nullopt;
    }
}

std::string FileSession::resolve_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path != "~" && path.rfind("~/", 0) != 0) return path;   // ~user stays as is
    auto home = home_dir();
    if (!home) return path;
    if (path == "~") return *home;
    return posix_join(*home, path.substr(2));
}

int64_t FileSession::last_used() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_used_;
}

void FileSession::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_used_ = now_ms();
}

void FileSession::close() {
    transport_->close();
}

// ── FileSessionManager ────────────────────────────────────────

FileSessionManager::FileSessionManager(ConnectionStore& store, TransportFactory& factory)
    : store_(store), factory_(factory) {
}

FileSessionManager::~FileSessionManager() {
    close_all();
}

void FileSessionManager::add_purge_hook(PurgeHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_hooks_.push_back(std::move(hook));
}

std::shared_ptr<FileSession> FileSessionManager::acquire(const std::string& connection_id) {
    std::shared_ptr<FileSession> stale;
    std::shared_ptr<std::promise<std::shared_ptr<FileSession>>> promise;
    PendingConnect pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) throw TransportError("File sessions are shut down");

        auto it = sessions_.find(connection_id);
        if (it != sessions_.end()) {
            if (it->second->is_writable()) {
                it->second->touch();
                return it->second;
            }
            stale = it->second;
            sessions_.erase(it);
        }

        auto p = pending_.find(connection_id);
        if (p != pending_.end()) {
            pending = p->second;
        } else {
            promise = std::make_shared<std::promise<std::shared_ptr<FileSession>>>();
            pending = promise->get_future().share();
            pending_[connection_id] = pending;
        }
    }

    if (stale) {
        hostlink_log(fmt::format("File session {} no longer writable, reconnecting", connection_id));
        retire(stale);
    }

    if (!promise) {
        return await_with_timeout(pending, CONNECT_TIMEOUT_MS + CHANNEL_CLOSE_TIMEOUT_MS,
                                  "File session connect");
    }

    try {
        auto session = open_session(connection_id);
        promise->set_value(session);
        return session;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(connection_id);
        }
        hostlink_log(fmt::format("File session {} connect failed: {}", connection_id, e.what()));
        promise->set_exception(std::current_exception());
        throw;
    }
}

std::shared_ptr<FileSession> FileSessionManager::open_session(const std::string& connection_id) {
    auto desc = store_.get_connection(connection_id);
    if (!desc) throw std::runtime_error("Connection not found");

    auto transport = factory_.connect(*desc, CONNECT_TIMEOUT_MS);
    auto session = std::make_shared<FileSession>(connection_id, *desc, transport);

    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(connection_id);
        if (shut_down_) {
            closed = true;
        } else {
            sessions_[connection_id] = session;
        }
    }
    if (closed) {
        transport->close();
        throw TransportError("File sessions are shut down");
    }
    hostlink_log(fmt::format("File session {} connected to {}", connection_id, desc->host));
    return session;
}

void FileSessionManager::retire(const std::shared_ptr<FileSession>& session) {
    std::vector<PurgeHook> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks = purge_hooks_;
    }
    for (auto& hook : hooks) hook(session->connection_id());
    session->close();
}

void FileSessionManager::reset_session(const std::string& connection_id,
                                       const std::shared_ptr<FileSession>& expected) {
    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(connection_id);
        if (it != sessions_.end() && it->second == expected) {
            sessions_.erase(it);
            registered = true;
        }
    }
    if (registered) {
        retire(expected);
        return;
    }
    // The cache and cursors under this id now belong to the newer session.
    expected->close();
}

void FileSessionManager::reset(const std::string& connection_id) {
    std::shared_ptr<FileSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(connection_id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }
    hostlink_log(fmt::format("File session {} reset", connection_id));
    retire(session);
}

bool FileSessionManager::has_session(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(connection_id) > 0;
}

std::vector<std::string> FileSessionManager::connection_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, session] : sessions_) ids.push_back(id);
    return ids;
}

std::optional<ConnectionDescriptor> FileSessionManager::descriptor_of(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(connection_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second->descriptor();
}

void FileSessionManager::close_all() {
    std::vector<std::shared_ptr<FileSession>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        for (auto& [id, session] : sessions_) all.push_back(session);
        sessions_.clear();
    }
    for (auto& session : all) retire(session);
}
