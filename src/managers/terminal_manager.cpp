#include "terminal_manager.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

std::string default_directory_command(const std::string& dir) {
    if (dir == "~") return "cd ~\n";
    if (dir.rfind("~/", 0) == 0) {
        std::string rest = dir.substr(2);
        if (rest.empty()) return "cd ~/\n";
        return "cd ~/" + shell_escape(rest) + "\n";
    }
    return "cd " + shell_escape(dir) + "\n";
}

static std::string connect_error_message(const std::exception& e) {
    if (dynamic_cast<const TimeoutError*>(&e)) {
        return fmt::format("Connection timeout ({}s)", CONNECT_TIMEOUT_MS / 1000);
    }
    return e.what();
}

TerminalManager::TerminalManager(ConnectionStore& store, TransportFactory& factory,
                                 EventSink& events, TerminalConfig terminal)
    : store_(store), factory_(factory), events_(events), terminal_(std::move(terminal)) {
}

TerminalManager::~TerminalManager() {
    close_all();
}

void TerminalManager::emit_status(const Session& session, TerminalStatus status,
                                  const std::optional<std::string>& error) {
    events_.on_terminal_status({session.id, session.connection_id, status, error});
}

// ── Connect ───────────────────────────────────────────────────

Result<std::string> TerminalManager::connect(const std::string& connection_id) {
    reap_finished();

    auto desc = store_.get_connection(connection_id);
    if (!desc) return Result<std::string>::Err("Connection not found");

    auto session = std::make_shared<Session>();
    session->connection_id = connection_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->id = fmt::format("ssh-{}", next_id_++);
        sessions_[session->id] = session;
    }
    emit_status(*session, TerminalStatus::Connecting);
    hostlink_log(fmt::format("Terminal {} connecting to {} ({})",
                             session->id, desc->name, desc->host));

    std::shared_ptr<SshTransport> transport;
    std::shared_ptr<ShellStream> shell;
    try {
        transport = factory_.connect(*desc, CONNECT_TIMEOUT_MS);
        shell = transport->open_shell({terminal_.term, terminal_.cols, terminal_.rows});
    } catch (const std::exception& e) {
        std::string message = connect_error_message(e);
        if (transport) transport->close();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.erase(session->id);
            session->status = TerminalStatus::Error;
            session->error = message;
        }
        hostlink_log(fmt::format("Terminal {} failed: {}", session->id, e.what()));
        emit_status(*session, TerminalStatus::Error, message);
        return Result<std::string>::Err(message);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sessions_.count(session->id)) {
            // disconnect() raced the handshake
            shell->close();
            transport->close();
            return Result<std::string>::Err("Session closed while connecting");
        }
        session->transport = transport;
        session->shell = shell;
        session->status = TerminalStatus::Connected;
        session->reader = std::thread(&TerminalManager::reader_loop, this, session);
    }

    auto recorded = store_.record_connected(connection_id, now_ms());
    if (recorded.is_err()) {
        hostlink_log("Failed to record lastConnectedAt: " + recorded.error);
    }

    emit_status(*session, TerminalStatus::Connected);

    try {
        if (desc->startup_command && !desc->startup_command->empty()) {
            shell->write(*desc->startup_command + "\n");
        }
        if (desc->default_directory && !desc->default_directory->empty()) {
            shell->write(default_directory_command(*desc->default_directory));
        }
    } catch (const std::exception& e) {
        hostlink_log(fmt::format("Terminal {} startup keystrokes failed: {}", session->id, e.what()));
    }

    session->started = true;
    return Result<std::string>::Ok(session->id);
}

// ── Reader ────────────────────────────────────────────────────

void TerminalManager::reader_loop(std::shared_ptr<Session> session) {
    // Hold output until connect() has published the connected status.
    while (!session->started.load() && !session->stop.load()) {
        platform::sleep_ms(1);
    }

    while (!session->stop.load()) {
        ShellRead chunk;
        try {
            chunk = session->shell->read(SHELL_POLL_MS);
        } catch (const std::exception& e) {
            hostlink_log(fmt::format("Terminal {} read failed: {}", session->id, e.what()));
            chunk.closed = true;
        }

        if (!chunk.data.empty()) {
            uint64_t seq;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                seq = session->output.append(chunk.data);
            }
            events_.on_terminal_output({session->id, seq, std::move(chunk.data)});
        }
        if (chunk.closed) break;
    }

    if (session->stop.load()) return;   // disconnect() owns teardown

    bool owned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session->id);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
            session->status = TerminalStatus::Disconnected;
            finished_.push_back(session);
            owned = true;
        }
    }
    if (!owned) return;

    hostlink_log(fmt::format("Terminal {} stream closed", session->id));
    session->shell->close();
    session->transport->close();
    emit_status(*session, TerminalStatus::Disconnected);
}

void TerminalManager::end_session(const std::shared_ptr<Session>& session) {
    session->stop = true;
    if (session->shell) session->shell->close();
    if (session->transport) session->transport->close();

    if (session->reader.joinable()) {
        if (session->reader.get_id() == std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_.push_back(session);
        } else {
            session->reader.join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->status = TerminalStatus::Disconnected;
    }
    emit_status(*session, TerminalStatus::Disconnected);
}

void TerminalManager::reap_finished() {
    std::vector<std::shared_ptr<Session>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done.swap(finished_);
    }
    std::vector<std::shared_ptr<Session>> keep;
    for (auto& session : done) {
        if (!session->reader.joinable()) continue;
        if (session->reader.get_id() == std::this_thread::get_id()) {
            keep.push_back(session);
            continue;
        }
        session->reader.join();
    }
    if (!keep.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_.insert(finished_.end(), keep.begin(), keep.end());
    }
}

// ── Input ─────────────────────────────────────────────────────

void TerminalManager::send(const std::string& session_id, const std::string& data) {
    std::shared_ptr<ShellStream> shell;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second->status != TerminalStatus::Connected) return;
        shell = it->second->shell;
    }
    try {
        shell->write(data);
    } catch (const std::exception& e) {
        hostlink_log(fmt::format("Terminal {} write failed: {}", session_id, e.what()));
    }
}

void TerminalManager::resize(const std::string& session_id, int cols, int rows) {
    if (cols <= 0 || rows <= 0) return;
    std::shared_ptr<ShellStream> shell;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second->status != TerminalStatus::Connected) return;
        shell = it->second->shell;
    }
    try {
        shell->resize(cols, rows);
    } catch (const std::exception& e) {
        hostlink_log(fmt::format("Terminal {} resize failed: {}", session_id, e.what()));
    }
}

// ── Teardown ──────────────────────────────────────────────────

Result<void> TerminalManager::disconnect(const std::string& session_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return Result<void>::Err("Session not found");
        session = it->second;
        sessions_.erase(it);
    }
    hostlink_log(fmt::format("Terminal {} disconnect requested", session_id));
    end_session(session);
    reap_finished();
    return Result<void>::Ok();
}

void TerminalManager::disconnect_connection(const std::string& connection_id) {
    std::vector<std::shared_ptr<Session>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->connection_id == connection_id) {
                victims.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& session : victims) end_session(session);
    reap_finished();
}

void TerminalManager::close_all() {
    std::vector<std::shared_ptr<Session>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, session] : sessions_) victims.push_back(session);
        sessions_.clear();
    }
    for (auto& session : victims) end_session(session);
    reap_finished();
}

// ── Queries ───────────────────────────────────────────────────

std::vector<TerminalSessionInfo> TerminalManager::list_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TerminalSessionInfo> out;
    for (const auto& [id, session] : sessions_) {
        out.push_back({session->id, session->connection_id, session->status, session->error});
    }
    return out;
}

Result<OutputSnapshot> TerminalManager::read_output_buffer(const std::string& session_id,
                                                           uint64_t since_seq) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return Result<OutputSnapshot>::Err("Session not found");
    return Result<OutputSnapshot>::Ok(it->second->output.since(since_seq));
}

Result<void> TerminalManager::test_connection(const std::string& connection_id) {
    auto desc = store_.get_connection(connection_id);
    if (!desc) return Result<void>::Err("Connection not found");
    try {
        auto transport = factory_.connect(*desc, CONNECT_TIMEOUT_MS);
        transport->close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(connect_error_message(e));
    }
}
