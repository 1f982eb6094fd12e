#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/deadline.hpp>
#include <core/errors.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// Shared state of one authenticated SSH session. Transport, SFTP wrapper and
// every handle opened from them hold a shared_ptr to the link, so a handle
// outliving close() sees `closed` instead of freed libssh2 state.
struct Libssh2Link {
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;
    socket_t sock = HOSTLINK_INVALID_SOCKET;
    std::string label;                 // user@host:port

    std::mutex io_mutex;               // serializes every libssh2 call
    bool closed = false;               // guarded by io_mutex
    std::atomic<bool> broken{false};   // socket-level failure seen

    // Proxy jump: the outer session carrying this one through `tunnel`,
    // bridged to `sock` by a pump thread over a local socket pair.
    std::shared_ptr<Libssh2Link> jump;
    LIBSSH2_CHANNEL* tunnel = nullptr;
    socket_t pump_sock = HOSTLINK_INVALID_SOCKET;
    std::thread pump;
    std::atomic<bool> stop_pump{false};

    ~Libssh2Link();
};

// Run `fn` under the link's I/O mutex until it yields a value or the budget
// runs out. `fn` returns std::nullopt on EAGAIN and throws on hard failure.
template <typename Fn>
auto with_link(Libssh2Link& link, int timeout_ms, const std::string& what, Fn&& fn)
    -> typename decltype(fn())::value_type {
    return poll_until(timeout_ms, what, [&]() {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        if (link.closed) {
            throw TransportError(what + ": SSH session is not connected");
        }
        return fn();
    });
}

// Translate a libssh2 return code into the error taxonomy. Call with the
// I/O mutex held.
[[noreturn]] void raise_session_error(Libssh2Link& link, int rc, const std::string& what);

// Human-readable SFTP status.
std::string sftp_status_text(unsigned long status);

// Send SSH keepalive if one is due. Call with the I/O mutex held.
void keepalive_tick(Libssh2Link& link);

// Tear down the session (and any proxy jump beneath it). Idempotent.
void close_link(Libssh2Link& link);
