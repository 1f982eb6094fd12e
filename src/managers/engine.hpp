#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/connection_store.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "dir_lister.hpp"
#include "events.hpp"
#include "file_session_manager.hpp"
#include "remote_ops.hpp"
#include "terminal_manager.hpp"
#include "transfer_manager.hpp"

// Headless engine facade: owns every manager and exposes the full operation
// set. Nothing below this boundary escapes as an exception; failures come
// back as Result::Err with the error message.
class HostlinkEngine {
public:
    HostlinkEngine(const Config& config, ConnectionStore& store,
                   TransportFactory& factory, EventSink& events);
    ~HostlinkEngine();

    HostlinkEngine(const HostlinkEngine&) = delete;
    HostlinkEngine& operator=(const HostlinkEngine&) = delete;

    // ── Terminal sessions ─────────────────────────────────────

    Result<std::string> terminal_connect(const std::string& connection_id);
    Result<void> terminal_disconnect(const std::string& session_id);
    void terminal_send(const std::string& session_id, const std::string& data);
    void terminal_resize(const std::string& session_id, int cols, int rows);
    std::vector<TerminalSessionInfo> list_sessions();
    Result<OutputSnapshot> read_output_buffer(const std::string& session_id, uint64_t since_seq = 0);
    Result<void> test_connection(const std::string& connection_id);

    // ── File operations ───────────────────────────────────────

    Result<DirListing> list_dir(const std::string& connection_id, const std::string& path,
                                const ListDirOptions& options = {});
    Result<std::string> home_dir(const std::string& connection_id);
    Result<std::string> read_file(const std::string& connection_id, const std::string& path,
                                  std::optional<int> offset = std::nullopt,
                                  std::optional<int> limit = std::nullopt);
    Result<void> write_file(const std::string& connection_id, const std::string& path,
                            const std::string& content);
    Result<std::string> read_file_binary(const std::string& connection_id, const std::string& path);
    Result<void> write_file_binary(const std::string& connection_id, const std::string& path,
                                   const std::string& base64_data);
    Result<void> mkdir(const std::string& connection_id, const std::string& path);
    Result<void> remove(const std::string& connection_id, const std::string& path);
    Result<void> move(const std::string& connection_id, const std::string& from,
                      const std::string& to);
    Result<std::vector<std::string>> glob(const std::string& connection_id,
                                          const std::string& pattern,
                                          const std::optional<std::string>& path = std::nullopt);
    Result<std::vector<GrepMatch>> grep(const std::string& connection_id,
                                        const std::string& pattern,
                                        const std::optional<std::string>& path = std::nullopt,
                                        const std::optional<std::string>& include = std::nullopt);
    Result<std::string> zip_dir(const std::string& connection_id, const std::string& dir_path);
    Result<SSHResult> exec(const std::string& connection_id, const std::string& command,
                           int timeout_ms = EXEC_DEFAULT_TIMEOUT_MS);

    // ── Transfers ─────────────────────────────────────────────

    Result<std::string> upload_start(const std::string& connection_id, const std::string& remote_dir,
                                     const std::string& local_path,
                                     std::optional<UploadKind> kind = std::nullopt);
    Result<void> upload_cancel(const std::string& task_id);
    Result<void> download(const std::string& connection_id, const std::string& remote_path,
                          const std::string& local_path);

    // ── Connections ───────────────────────────────────────────

    std::vector<ConnectionDescriptor> list_connections() const;

    // Disconnect terminals, reset the File Session, purge cache and cursors,
    // then remove the connection from the store.
    Result<void> delete_connection(const std::string& connection_id);

    // Stop uploads, close every terminal and File Session, clear caches.
    void shutdown();

    // Accessors for tests and the CLI
    FileSessionManager& file_sessions() { return sessions_; }
    DirLister& dir_lister() { return lister_; }
    TransferManager& transfers() { return transfers_; }
    TerminalManager& terminals() { return terminals_; }

private:
    ConnectionStore& store_;
    FileSessionManager sessions_;
    DirLister lister_;
    RemoteOps ops_;
    TransferManager transfers_;
    TerminalManager terminals_;
    std::shared_ptr<std::atomic<bool>> alive_;
    bool shut_down_ = false;

    // Reset File Sessions whose descriptor changed or disappeared.
    void on_store_change();
};
