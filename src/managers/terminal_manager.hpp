#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/connection_store.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "events.hpp"
#include "output_ring.hpp"

struct TerminalSessionInfo {
    std::string id;
    std::string connection_id;
    TerminalStatus status;
    std::optional<std::string> error;
};

// Interactive shells, one per terminal tab. Each session owns a dedicated
// SSH connection (never shared with file operations) and a reader thread
// that is the only producer of that session's output and end-of-stream
// events.
class TerminalManager {
public:
    TerminalManager(ConnectionStore& store, TransportFactory& factory,
                    EventSink& events, TerminalConfig terminal);
    ~TerminalManager();

    TerminalManager(const TerminalManager&) = delete;
    TerminalManager& operator=(const TerminalManager&) = delete;

    // Open a connection and an interactive PTY shell. Returns the session id.
    Result<std::string> connect(const std::string& connection_id);

    // Fire-and-forget; ignored unless the session is connected.
    void send(const std::string& session_id, const std::string& data);
    void resize(const std::string& session_id, int cols, int rows);

    Result<void> disconnect(const std::string& session_id);

    // Disconnect every session opened for a connection id.
    void disconnect_connection(const std::string& connection_id);

    std::vector<TerminalSessionInfo> list_sessions();

    // Output chunks newer than since_seq plus the latest sequence number.
    Result<OutputSnapshot> read_output_buffer(const std::string& session_id, uint64_t since_seq = 0);

    // Connect with the standard timeout and hang up again.
    Result<void> test_connection(const std::string& connection_id);

    void close_all();

private:
    struct Session {
        std::string id;
        std::string connection_id;
        TerminalStatus status = TerminalStatus::Connecting;
        std::optional<std::string> error;
        std::shared_ptr<SshTransport> transport;
        std::shared_ptr<ShellStream> shell;
        OutputRing output;
        std::atomic<bool> started{false};
        std::atomic<bool> stop{false};
        std::thread reader;
    };

    ConnectionStore& store_;
    TransportFactory& factory_;
    EventSink& events_;
    TerminalConfig terminal_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::vector<std::shared_ptr<Session>> finished_;   // readers awaiting join
    uint64_t next_id_ = 1;

    void reader_loop(std::shared_ptr<Session> session);
    void end_session(const std::shared_ptr<Session>& session);
    void reap_finished();
    void emit_status(const Session& session, TerminalStatus status,
                     const std::optional<std::string>& error = std::nullopt);
};

// Keystrokes that change into a configured default directory. A leading "~"
// stays unquoted so the remote shell expands it.
std::string default_directory_command(const std::string& dir);
