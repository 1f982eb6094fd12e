#include "socket_util.hpp"
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

void shutdown_socket(socket_t sock) {
#ifdef _WIN32
    shutdown(sock, SD_BOTH);
#else
    shutdown(sock, SHUT_RDWR);
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        err = "Failed to resolve host: " + host;
        return HOSTLINK_INVALID_SOCKET;
    }

    err.clear();
    socket_t sock = HOSTLINK_INVALID_SOCKET;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == HOSTLINK_INVALID_SOCKET) continue;

        set_nonblocking(sock);
        int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        if (ret == 0) break;

#ifdef _WIN32
        bool in_progress = WSAGetLastError() == WSAEWOULDBLOCK;
#else
        bool in_progress = errno == EINPROGRESS;
#endif
        if (!in_progress) {
            err = "Failed to connect: " + std::string(strerror(errno));
            close_socket(sock);
            sock = HOSTLINK_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            err = "Connection timed out: " + host;
            close_socket(sock);
            sock = HOSTLINK_INVALID_SOCKET;
            continue;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            err = "Connection failed: " + std::string(strerror(sock_err));
            close_socket(sock);
            sock = HOSTLINK_INVALID_SOCKET;
            continue;
        }
        break;
    }
    freeaddrinfo(res);

    if (sock == HOSTLINK_INVALID_SOCKET && err.empty()) {
        err = "Failed to create socket";
    }
    return sock;
}

void enable_tcp_keepalive(socket_t sock, int idle_secs) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&on), sizeof(on));
    int keepidle = idle_secs > 0 ? idle_secs : 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&keepintvl), sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&keepcnt), sizeof(keepcnt));
#endif
    (void)keepidle;
    (void)keepintvl;
    (void)keepcnt;
}

bool make_socket_pair(socket_t out[2]) {
#ifdef _WIN32
    // No AF_UNIX socketpair on older Windows; proxy jump is POSIX-only.
    (void)out;
    return false;
#else
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return false;
    out[0] = fds[0];
    out[1] = fds[1];
    return true;
#endif
}

} // namespace platform
