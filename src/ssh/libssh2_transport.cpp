#include "libssh2_transport.hpp"
#include "libssh2_link.hpp"
#include "libssh2_sftp.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fmt/format.h>
#ifndef _WIN32
#  include <unistd.h>
#endif

using Clock = std::chrono::steady_clock;

static void ensure_libssh2_init() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) throw SshError("Failed to initialize libssh2");
}

static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return static_cast<int>(std::max<long long>(left, 1));
}

ConnectionDescriptor parse_proxy_jump(const std::string& jump,
                                      const ConnectionDescriptor& target) {
    ConnectionDescriptor hop = target;
    hop.proxy_jump.reset();
    hop.port = 22;

    std::string rest = jump;
    trim(rest);
    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        hop.username = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }
    // [v6addr]:port or host:port
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close != std::string::npos) {
            hop.host = rest.substr(1, close - 1);
            if (close + 1 < rest.size() && rest[close + 1] == ':') {
                hop.port = safe_stoi(rest.substr(close + 2), 22);
            }
            return hop;
        }
    }
    auto colon = rest.rfind(':');
    if (colon != std::string::npos && rest.find(':') == colon) {
        hop.host = rest.substr(0, colon);
        hop.port = safe_stoi(rest.substr(colon + 1), 22);
    } else {
        hop.host = rest;
    }
    return hop;
}

// ── Authentication ──────────────────────────────────────────

// Answers every keyboard-interactive prompt with the saved password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    const std::string* password = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(password->c_str());
        responses[i].length = static_cast<unsigned int>(password->size());
    }
}

static bool auth_password(Libssh2Link& link, const ConnectionDescriptor& desc,
                          const std::string& methods, Clock::time_point deadline) {
    std::string password = desc.password.value_or("");
    const std::string& user = desc.username;

    if (methods.empty() || methods.find("password") != std::string::npos) {
        int rc = with_link(link, remaining_ms(deadline), "password authentication",
            [&]() -> std::optional<int> {
                int r = libssh2_userauth_password_ex(link.session,
                    user.c_str(), static_cast<unsigned int>(user.size()),
                    password.c_str(), static_cast<unsigned int>(password.size()), nullptr);
                if (r == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
                return r;
            });
        if (rc == 0) return true;
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        int rc = with_link(link, remaining_ms(deadline), "keyboard-interactive authentication",
            [&]() -> std::optional<int> {
                *libssh2_session_abstract(link.session) = &password;
                int r = libssh2_userauth_keyboard_interactive_ex(link.session,
                    user.c_str(), static_cast<unsigned int>(user.size()), kbd_callback);
                if (r == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
                *libssh2_session_abstract(link.session) = nullptr;
                return r;
            });
        if (rc == 0) return true;
    }
    return false;
}

static bool auth_private_key(Libssh2Link& link, const ConnectionDescriptor& desc,
                             Clock::time_point deadline) {
    if (!desc.private_key_path || desc.private_key_path->empty()) {
        throw SshError("Private key authentication selected but no key path is configured");
    }
    std::string key = expand_local_home(*desc.private_key_path).string();
    if (platform::local_file_size(key) < 0) {
        throw SshError("Private key not found: " + key);
    }
    const char* passphrase = desc.passphrase ? desc.passphrase->c_str() : nullptr;
    const std::string& user = desc.username;

    int rc = with_link(link, remaining_ms(deadline), "public key authentication",
        [&]() -> std::optional<int> {
            int r = libssh2_userauth_publickey_fromfile_ex(link.session,
                user.c_str(), static_cast<unsigned int>(user.size()),
                nullptr, key.c_str(), passphrase);
            if (r == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            return r;
        });
    return rc == 0;
}

static bool auth_agent(Libssh2Link& link, const ConnectionDescriptor& desc,
                       Clock::time_point deadline) {
    struct AgentGuard {
        Libssh2Link& link;
        LIBSSH2_AGENT* agent = nullptr;
        ~AgentGuard() {
            if (!agent) return;
            std::lock_guard<std::mutex> lock(link.io_mutex);
            libssh2_agent_disconnect(agent);
            libssh2_agent_free(agent);
        }
    } guard{link};

    {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        guard.agent = libssh2_agent_init(link.session);
        if (!guard.agent) throw SshError("Failed to initialize ssh-agent support");
        if (libssh2_agent_connect(guard.agent) != 0) {
            throw SshError("Could not connect to ssh-agent (is SSH_AUTH_SOCK set?)");
        }
        if (libssh2_agent_list_identities(guard.agent) != 0) {
            throw SshError("Could not list ssh-agent identities");
        }
    }

    struct libssh2_agent_publickey* prev = nullptr;
    while (true) {
        struct libssh2_agent_publickey* identity = nullptr;
        int rc;
        {
            std::lock_guard<std::mutex> lock(link.io_mutex);
            rc = libssh2_agent_get_identity(guard.agent, &identity, prev);
        }
        if (rc == 1) return false;   // no identity left
        if (rc < 0) throw SshError("Failed to read ssh-agent identity");

        int auth = with_link(link, remaining_ms(deadline), "agent authentication",
            [&]() -> std::optional<int> {
                int r = libssh2_agent_userauth(guard.agent, desc.username.c_str(), identity);
                if (r == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
                return r;
            });
        if (auth == 0) return true;
        prev = identity;
    }
}

static void authenticate(Libssh2Link& link, const ConnectionDescriptor& desc,
                         Clock::time_point deadline) {
    const std::string& user = desc.username;
    std::string methods = with_link(link, remaining_ms(deadline), "auth method query",
        [&]() -> std::optional<std::string> {
            char* list = libssh2_userauth_list(link.session, user.c_str(),
                                               static_cast<unsigned int>(user.size()));
            if (list) return std::string(list);
            if (libssh2_session_last_errno(link.session) == LIBSSH2_ERROR_EAGAIN) {
                return std::nullopt;
            }
            return std::string();
        });

    {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        if (libssh2_userauth_authenticated(link.session)) return;   // "none" accepted
    }

    bool ok = false;
    switch (desc.auth_type) {
    case AuthType::Password:   ok = auth_password(link, desc, methods, deadline); break;
    case AuthType::PrivateKey: ok = auth_private_key(link, desc, deadline); break;
    case AuthType::Agent:      ok = auth_agent(link, desc, deadline); break;
    }
    if (!ok) {
        throw SshError(fmt::format("Authentication failed for {} ({})",
                                   link.label, auth_type_name(desc.auth_type)));
    }
}

// Handshake, keepalive and auth on a link whose socket is already connected.
static void start_session(Libssh2Link& link, const ConnectionDescriptor& desc,
                          Clock::time_point deadline) {
    {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        link.session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
        if (!link.session) throw SshError("Failed to create SSH session");
        libssh2_session_set_blocking(link.session, 0);
    }

    with_link(link, remaining_ms(deadline), "SSH handshake with " + link.label,
        [&]() -> std::optional<bool> {
            int rc = libssh2_session_handshake(link.session, link.sock);
            if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            if (rc != 0) raise_session_error(link, rc, "SSH handshake with " + link.label);
            return true;
        });

    {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        int interval = desc.keep_alive_interval > 0 ? desc.keep_alive_interval : 60;
        libssh2_keepalive_config(link.session, 1, static_cast<unsigned int>(interval));
    }

    authenticate(link, desc, deadline);
}

static std::string link_label(const ConnectionDescriptor& desc) {
    return fmt::format("{}@{}:{}", desc.username, desc.host, desc.port);
}

static std::shared_ptr<Libssh2Link> open_direct(const ConnectionDescriptor& desc,
                                                Clock::time_point deadline) {
    auto link = std::make_shared<Libssh2Link>();
    link->label = link_label(desc);

    std::string err;
    link->sock = platform::connect_tcp(desc.host, desc.port, remaining_ms(deadline), err);
    if (link->sock == HOSTLINK_INVALID_SOCKET) {
        if (err.find("timed out") != std::string::npos) throw TimeoutError(err);
        throw TransportError(err);
    }
    platform::enable_tcp_keepalive(link->sock, desc.keep_alive_interval);

    start_session(*link, desc, deadline);
    return link;
}

// ── Proxy jump ──────────────────────────────────────────────

static bool write_local(socket_t sock, const char* data, int len) {
    int sent = 0;
    while (sent < len) {
#ifdef _WIN32
        int w = ::send(sock, data + sent, len - sent, 0);
#else
        int w = static_cast<int>(::write(sock, data + sent, static_cast<size_t>(len - sent)));
#endif
        if (w > 0) {
            sent += w;
            continue;
        }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            platform::poll_socket(sock, POLLOUT, SHELL_POLL_MS);
            continue;
        }
        return false;
    }
    return true;
}

// Shovels bytes between the direct-tcpip channel on the jump session and
// the local end of the socket pair the inner session talks through.
static void pump_tunnel(std::shared_ptr<Libssh2Link> jump, LIBSSH2_CHANNEL* tunnel,
                        socket_t local_sock, Libssh2Link* inner) {
    char buf[SSH_READ_BUF_SIZE];
    bool alive = true;

    while (alive && !inner->stop_pump.load()) {
        struct pollfd fds[2];
        fds[0] = {jump->sock, POLLIN, 0};
        fds[1] = {local_sock, POLLIN, 0};
#ifdef _WIN32
        WSAPoll(fds, 2, SHELL_POLL_MS);
#else
        poll(fds, 2, SHELL_POLL_MS);
#endif

        // Always drain the channel: libssh2 may hold data already read off the socket.
        for (;;) {
            ssize_t n;
            bool eof = false;
            {
                std::lock_guard<std::mutex> lock(jump->io_mutex);
                if (jump->closed) { alive = false; break; }
                n = libssh2_channel_read(tunnel, buf, sizeof(buf));
                if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) eof = libssh2_channel_eof(tunnel) != 0;
                keepalive_tick(*jump);
            }
            if (n > 0) {
                if (!write_local(local_sock, buf, static_cast<int>(n))) { alive = false; break; }
                continue;
            }
            if (eof || (n < 0 && n != LIBSSH2_ERROR_EAGAIN)) alive = false;
            break;
        }
        if (!alive) break;

        if (fds[1].revents & (POLLIN | POLLHUP)) {
#ifdef _WIN32
            int n = ::recv(local_sock, buf, sizeof(buf), 0);
#else
            int n = static_cast<int>(::read(local_sock, buf, sizeof(buf)));
#endif
            if (n == 0) break;
            if (n > 0) {
                int sent = 0;
                while (sent < n && !inner->stop_pump.load()) {
                    ssize_t w;
                    {
                        std::lock_guard<std::mutex> lock(jump->io_mutex);
                        if (jump->closed) { alive = false; break; }
                        w = libssh2_channel_write(tunnel, buf + sent, static_cast<size_t>(n - sent));
                    }
                    if (w == LIBSSH2_ERROR_EAGAIN) { platform::sleep_ms(1); continue; }
                    if (w < 0) { alive = false; break; }
                    sent += static_cast<int>(w);
                }
            }
        }
    }

    if (!inner->stop_pump.load()) {
        hostlink_log(fmt::format("Proxy tunnel to {} ended", inner->label));
        inner->broken = true;
        platform::shutdown_socket(local_sock);
    }
}

static std::shared_ptr<Libssh2Link> open_tunneled(const ConnectionDescriptor& desc,
                                                  Clock::time_point deadline) {
    auto hop = parse_proxy_jump(*desc.proxy_jump, desc);
    if (hop.host.empty()) throw SshError("Invalid proxy jump: " + *desc.proxy_jump);

    auto jump = open_direct(hop, deadline);
    hostlink_log(fmt::format("Proxy jump {} connected, tunneling to {}:{}",
                             jump->label, desc.host, desc.port));

    auto link = std::make_shared<Libssh2Link>();
    link->label = link_label(desc) + " via " + jump->label;
    link->jump = jump;

    link->tunnel = with_link(*jump, remaining_ms(deadline),
        fmt::format("proxy tunnel to {}:{}", desc.host, desc.port),
        [&]() -> std::optional<LIBSSH2_CHANNEL*> {
            LIBSSH2_CHANNEL* ch = libssh2_channel_direct_tcpip(jump->session,
                                                               desc.host.c_str(), desc.port);
            if (ch) return ch;
            int err = libssh2_session_last_errno(jump->session);
            if (err == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            raise_session_error(*jump, err, "Proxy tunnel to " + desc.host);
        });

    socket_t pair[2];
    if (!platform::make_socket_pair(pair)) {
        throw TransportError("Failed to create local socket pair for proxy jump");
    }
    link->pump_sock = pair[0];
    link->sock = pair[1];
    platform::set_nonblocking(pair[0]);
    platform::set_nonblocking(pair[1]);
    link->pump = std::thread(pump_tunnel, jump, link->tunnel, pair[0], link.get());

    start_session(*link, desc, deadline);
    return link;
}

// ── Channels ────────────────────────────────────────────────

static LIBSSH2_CHANNEL* open_channel(Libssh2Link& link, int timeout_ms, const std::string& what) {
    return with_link(link, timeout_ms, what, [&]() -> std::optional<LIBSSH2_CHANNEL*> {
        LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(link.session);
        if (ch) return ch;
        int err = libssh2_session_last_errno(link.session);
        if (err == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        raise_session_error(link, err, what);
    });
}

// Close and free a channel; skipped once the link itself is gone.
static void release_channel(Libssh2Link& link, LIBSSH2_CHANNEL* ch) {
    auto deadline = Clock::now() + std::chrono::milliseconds(CHANNEL_CLOSE_TIMEOUT_MS);
    std::lock_guard<std::mutex> lock(link.io_mutex);
    if (link.closed) return;
    while (libssh2_channel_close(ch) == LIBSSH2_ERROR_EAGAIN && Clock::now() < deadline) {
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
    libssh2_channel_free(ch);
}

namespace {

struct ChannelGuard {
    Libssh2Link& link;
    LIBSSH2_CHANNEL* ch;
    ~ChannelGuard() { if (ch) release_channel(link, ch); }
};

class Libssh2Shell : public ShellStream {
public:
    Libssh2Shell(std::shared_ptr<Libssh2Link> link, LIBSSH2_CHANNEL* channel)
        : link_(std::move(link)), channel_(channel) {}

    ~Libssh2Shell() override { close(); }

    void write(const std::string& data) override {
        size_t sent = 0;
        while (sent < data.size()) {
            sent += with_link(*link_, SFTP_OP_TIMEOUT_MS, "shell write",
                [&]() -> std::optional<size_t> {
                    if (!channel_) throw TransportError("shell write: channel not open");
                    ssize_t w = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
                    if (w == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
                    if (w < 0) raise_session_error(*link_, static_cast<int>(w), "shell write");
                    return static_cast<size_t>(w);
                });
        }
    }

    void resize(int cols, int rows) override {
        with_link(*link_, SFTP_OP_TIMEOUT_MS, "shell resize", [&]() -> std::optional<bool> {
            if (!channel_) throw TransportError("shell resize: channel not open");
            int rc = libssh2_channel_request_pty_size(channel_, cols, rows);
            if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            if (rc < 0) raise_session_error(*link_, rc, "shell resize");
            return true;
        });
    }

    ShellRead read(int wait_ms) override {
        ShellRead out;
        auto deadline = Clock::now() + std::chrono::milliseconds(wait_ms);
        char buf[SSH_READ_BUF_SIZE];

        while (true) {
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                if (link_->closed || !channel_ || link_->broken) {
                    out.closed = true;
                    return out;
                }
                keepalive_tick(*link_);

                for (int stream : {0, SSH_EXTENDED_DATA_STDERR}) {
                    for (;;) {
                        ssize_t n = libssh2_channel_read_ex(channel_, stream, buf, sizeof(buf));
                        if (n > 0) {
                            out.data.append(buf, static_cast<size_t>(n));
                            continue;
                        }
                        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                            hostlink_log(fmt::format("Shell read on {} failed ({})", link_->label, n));
                            out.closed = true;
                        }
                        break;
                    }
                }
                if (libssh2_channel_eof(channel_)) out.closed = true;
            }
            if (!out.data.empty() || out.closed || Clock::now() >= deadline) return out;
            platform::sleep_ms(EAGAIN_SLEEP_MS);
        }
    }

    void close() override {
        LIBSSH2_CHANNEL* ch = nullptr;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            ch = channel_;
            channel_ = nullptr;
        }
        if (ch) release_channel(*link_, ch);
    }

private:
    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_CHANNEL* channel_;
};

class Libssh2Transport : public SshTransport {
public:
    explicit Libssh2Transport(std::shared_ptr<Libssh2Link> link)
        : link_(std::move(link)) {}

    ~Libssh2Transport() override { close(); }

    bool is_writable() const override {
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        return !link_->closed && !link_->broken && link_->session != nullptr;
    }

    std::shared_ptr<SftpChannel> sftp() override {
        std::lock_guard<std::mutex> lock(sftp_mutex_);
        if (sftp_) return sftp_;

        with_link(*link_, SFTP_OPEN_TIMEOUT_MS, "SFTP subsystem start on " + link_->label,
            [&]() -> std::optional<bool> {
                LIBSSH2_SFTP* s = libssh2_sftp_init(link_->session);
                if (s) {
                    link_->sftp = s;
                    return true;
                }
                int err = libssh2_session_last_errno(link_->session);
                if (err == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
                raise_session_error(*link_, err, "SFTP subsystem start");
            });
        sftp_ = std::make_shared<Libssh2Sftp>(link_);
        return sftp_;
    }

    SSHResult exec(const std::string& command, int timeout_ms,
                   const std::atomic<bool>* abort = nullptr) override {
        ChannelGuard guard{*link_, open_channel(*link_, CHANNEL_OPEN_TIMEOUT_MS, "exec channel open")};
        LIBSSH2_CHANNEL* ch = guard.ch;
        auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

        // Unwinding releases the channel through the guard.
        auto check_abort = [&]() {
            if (abort && abort->load()) throw SshError("Command aborted");
        };

        with_link(*link_, remaining_ms(deadline), "exec", [&]() -> std::optional<bool> {
            check_abort();
            int rc = libssh2_channel_process_startup(ch, "exec", 4, command.c_str(),
                                                     static_cast<unsigned int>(command.size()));
            if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            if (rc < 0) raise_session_error(*link_, rc, "exec");
            return true;
        });

        SSHResult result{-1, "", ""};
        char buf[SSH_READ_BUF_SIZE];
        while (true) {
            check_abort();
            bool progressed = false;
            bool eof = false;
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                if (link_->closed) throw TransportError("exec: SSH session is not connected");
                ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
                if (n > 0) {
                    result.stdout_data.append(buf, static_cast<size_t>(n));
                    progressed = true;
                } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                    raise_session_error(*link_, static_cast<int>(n), "exec read");
                }
                n = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
                if (n > 0) {
                    result.stderr_data.append(buf, static_cast<size_t>(n));
                    progressed = true;
                } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                    raise_session_error(*link_, static_cast<int>(n), "exec read");
                }
                if (!progressed) eof = libssh2_channel_eof(ch) != 0;
            }
            if (eof) break;
            if (progressed) continue;
            if (Clock::now() >= deadline) {
                throw TimeoutError(fmt::format("Command timed out after {}ms", timeout_ms));
            }
            platform::sleep_ms(EAGAIN_SLEEP_MS);
        }

        with_link(*link_, CHANNEL_CLOSE_TIMEOUT_MS, "exec channel close", [&]() -> std::optional<bool> {
            int rc = libssh2_channel_close(ch);
            if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            if (rc < 0) raise_session_error(*link_, rc, "exec channel close");
            result.exit_code = libssh2_channel_get_exit_status(ch);
            return true;
        });
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            if (!link_->closed) libssh2_channel_free(ch);
            guard.ch = nullptr;
        }

        hostlink_log_ssh("exec", command, result);
        return result;
    }

    std::shared_ptr<ShellStream> open_shell(const PtyRequest& pty) override {
        ChannelGuard guard{*link_, open_channel(*link_, SHELL_OPEN_TIMEOUT_MS, "shell channel open")};
        LIBSSH2_CHANNEL* ch = guard.ch;
        auto deadline = Clock::now() + std::chrono::milliseconds(SHELL_OPEN_TIMEOUT_MS);

        with_link(*link_, remaining_ms(deadline), "pty request", [&]() -> std::optional<bool> {
            int rc = libssh2_channel_request_pty_ex(ch, pty.term.c_str(),
                                                    static_cast<unsigned int>(pty.term.size()),
                                                    nullptr, 0, pty.cols, pty.rows, 0, 0);
            if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            if (rc < 0) raise_session_error(*link_, rc, "pty request");
            return true;
        });
        with_link(*link_, remaining_ms(deadline), "shell request", [&]() -> std::optional<bool> {
            int rc = libssh2_channel_shell(ch);
            if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
            if (rc < 0) raise_session_error(*link_, rc, "shell request");
            return true;
        });

        guard.ch = nullptr;
        return std::make_shared<Libssh2Shell>(link_, ch);
    }

    void close() override {
        close_link(*link_);
    }

private:
    std::shared_ptr<Libssh2Link> link_;
    std::mutex sftp_mutex_;
    std::shared_ptr<Libssh2Sftp> sftp_;
};

} // namespace

std::shared_ptr<SshTransport> Libssh2TransportFactory::connect(const ConnectionDescriptor& desc,
                                                               int timeout_ms) {
    ensure_libssh2_init();
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    std::shared_ptr<Libssh2Link> link;
    if (desc.proxy_jump && !desc.proxy_jump->empty()) {
        link = open_tunneled(desc, deadline);
    } else {
        link = open_direct(desc, deadline);
    }
    hostlink_log(fmt::format("SSH connected: {}", link->label));
    return std::make_shared<Libssh2Transport>(link);
}
