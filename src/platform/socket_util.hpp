#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define HOSTLINK_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define HOSTLINK_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Shut down both directions so the peer sees end-of-stream.
void shutdown_socket(socket_t sock);

// Resolve host (IPv4 or IPv6) and connect with a deadline. The returned socket
// is non-blocking. On failure returns HOSTLINK_INVALID_SOCKET and fills err.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err);

// Enable TCP keepalive probing on a connected socket.
void enable_tcp_keepalive(socket_t sock, int idle_secs);

// Connected local stream pair (used to feed a tunneled channel to libssh2).
bool make_socket_pair(socket_t out[2]);

} // namespace platform
