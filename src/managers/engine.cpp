#include "engine.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <type_traits>

namespace {

// Run fn and fold any exception into Result::Err.
template <typename T, typename Fn>
Result<T> guarded(const char* what, Fn&& fn) {
    try {
        if constexpr (std::is_void_v<T>) {
            fn();
            return Result<void>::Ok();
        } else {
            return Result<T>::Ok(fn());
        }
    } catch (const std::exception& e) {
        hostlink_log(fmt::format("{} failed: {}", what, e.what()));
        return Result<T>::Err(e.what());
    }
}

} // namespace

HostlinkEngine::HostlinkEngine(const Config& config, ConnectionStore& store,
                               TransportFactory& factory, EventSink& events)
    : store_(store),
      sessions_(store, factory),
      lister_(sessions_),
      ops_(sessions_, lister_),
      transfers_(sessions_, lister_, events, config.remote_tmp_dir()),
      terminals_(store, factory, events, config.terminal()),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    sessions_.add_purge_hook([this](const std::string& connection_id) {
        lister_.purge(connection_id);
    });

    std::weak_ptr<std::atomic<bool>> alive = alive_;
    store_.on_change([this, alive]() {
        auto flag = alive.lock();
        if (flag && *flag) on_store_change();
    });
}

HostlinkEngine::~HostlinkEngine() {
    shutdown();
}

// ── Terminal sessions ─────────────────────────────────────────

Result<std::string> HostlinkEngine::terminal_connect(const std::string& connection_id) {
    return terminals_.connect(connection_id);
}

Result<void> HostlinkEngine::terminal_disconnect(const std::string& session_id) {
    return terminals_.disconnect(session_id);
}

void HostlinkEngine::terminal_send(const std::string& session_id, const std::string& data) {
    terminals_.send(session_id, data);
}

void HostlinkEngine::terminal_resize(const std::string& session_id, int cols, int rows) {
    terminals_.resize(session_id, cols, rows);
}

std::vector<TerminalSessionInfo> HostlinkEngine::list_sessions() {
    return terminals_.list_sessions();
}

Result<OutputSnapshot> HostlinkEngine::read_output_buffer(const std::string& session_id,
                                                          uint64_t since_seq) {
    return terminals_.read_output_buffer(session_id, since_seq);
}

Result<void> HostlinkEngine::test_connection(const std::string& connection_id) {
    return terminals_.test_connection(connection_id);
}

// ── File operations ───────────────────────────────────────────

Result<DirListing> HostlinkEngine::list_dir(const std::string& connection_id, const std::string& path,
                                            const ListDirOptions& options) {
    return guarded<DirListing>("list_dir", [&] { return lister_.list(connection_id, path, options); });
}

Result<std::string> HostlinkEngine::home_dir(const std::string& connection_id) {
    return guarded<std::string>("home_dir", [&] { return ops_.home_dir(connection_id); });
}

Result<std::string> HostlinkEngine::read_file(const std::string& connection_id, const std::string& path,
                                              std::optional<int> offset, std::optional<int> limit) {
    return guarded<std::string>("read_file", [&] {
        return ops_.read_file(connection_id, path, offset, limit);
    });
}

Result<void> HostlinkEngine::write_file(const std::string& connection_id, const std::string& path,
                                        const std::string& content) {
    return guarded<void>("write_file", [&] { ops_.write_file(connection_id, path, content); });
}

Result<std::string> HostlinkEngine::read_file_binary(const std::string& connection_id,
                                                     const std::string& path) {
    return guarded<std::string>("read_file_binary", [&] {
        return ops_.read_file_binary(connection_id, path);
    });
}

Result<void> HostlinkEngine::write_file_binary(const std::string& connection_id, const std::string& path,
                                               const std::string& base64_data) {
    return guarded<void>("write_file_binary", [&] {
        ops_.write_file_binary(connection_id, path, base64_data);
    });
}

Result<void> HostlinkEngine::mkdir(const std::string& connection_id, const std::string& path) {
    return guarded<void>("mkdir", [&] { ops_.mkdir(connection_id, path); });
}

Result<void> HostlinkEngine::remove(const std::string& connection_id, const std::string& path) {
    return guarded<void>("delete", [&] { ops_.remove(connection_id, path); });
}

Result<void> HostlinkEngine::move(const std::string& connection_id, const std::string& from,
                                  const std::string& to) {
    return guarded<void>("move", [&] { ops_.move(connection_id, from, to); });
}

Result<std::vector<std::string>> HostlinkEngine::glob(const std::string& connection_id,
                                                      const std::string& pattern,
                                                      const std::optional<std::string>& path) {
    return guarded<std::vector<std::string>>("glob", [&] {
        return ops_.glob(connection_id, pattern, path);
    });
}

Result<std::vector<GrepMatch>> HostlinkEngine::grep(const std::string& connection_id,
                                                    const std::string& pattern,
                                                    const std::optional<std::string>& path,
                                                    const std::optional<std::string>& include) {
    return guarded<std::vector<GrepMatch>>("grep", [&] {
        return ops_.grep(connection_id, pattern, path, include);
    });
}

Result<std::string> HostlinkEngine::zip_dir(const std::string& connection_id,
                                            const std::string& dir_path) {
    return guarded<std::string>("zip_dir", [&] { return ops_.zip_dir(connection_id, dir_path); });
}

Result<SSHResult> HostlinkEngine::exec(const std::string& connection_id, const std::string& command,
                                       int timeout_ms) {
    return guarded<SSHResult>("exec", [&] { return ops_.exec(connection_id, command, timeout_ms); });
}

// ── Transfers ─────────────────────────────────────────────────

Result<std::string> HostlinkEngine::upload_start(const std::string& connection_id,
                                                 const std::string& remote_dir,
                                                 const std::string& local_path,
                                                 std::optional<UploadKind> kind) {
    return guarded<std::string>("upload_start", [&] {
        return transfers_.upload_start(connection_id, remote_dir, local_path, kind);
    });
}

Result<void> HostlinkEngine::upload_cancel(const std::string& task_id) {
    if (!transfers_.upload_cancel(task_id)) {
        return Result<void>::Err("Upload task not found: " + task_id);
    }
    return Result<void>::Ok();
}

Result<void> HostlinkEngine::download(const std::string& connection_id, const std::string& remote_path,
                                      const std::string& local_path) {
    return guarded<void>("download", [&] {
        transfers_.download(connection_id, remote_path, local_path);
    });
}

// ── Connections ───────────────────────────────────────────────

std::vector<ConnectionDescriptor> HostlinkEngine::list_connections() const {
    return store_.list_connections();
}

Result<void> HostlinkEngine::delete_connection(const std::string& connection_id) {
    hostlink_log(fmt::format("Deleting connection {}", connection_id));
    terminals_.disconnect_connection(connection_id);
    sessions_.reset(connection_id);
    lister_.purge(connection_id);
    return store_.delete_connection(connection_id);
}

void HostlinkEngine::on_store_change() {
    for (const auto& id : sessions_.connection_ids()) {
        auto current = sessions_.descriptor_of(id);
        if (!current) continue;
        auto saved = store_.get_connection(id);
        if (!saved || !saved->same_endpoint(*current)) {
            hostlink_log(fmt::format("Connection {} changed, resetting its file session", id));
            sessions_.reset(id);
        }
    }
}

void HostlinkEngine::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    *alive_ = false;

    hostlink_log("Engine shutting down");
    transfers_.shutdown();
    terminals_.close_all();
    sessions_.close_all();
    lister_.clear();
}
