#include "libssh2_link.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <chrono>
#include <fmt/format.h>

Libssh2Link::~Libssh2Link() {
    close_link(*this);
}

std::string sftp_status_text(unsigned long status) {
    switch (status) {
    case LIBSSH2_FX_EOF:                 return "end of file";
    case LIBSSH2_FX_NO_SUCH_FILE:        return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED:   return "permission denied";
    case LIBSSH2_FX_FAILURE:             return "failure";
    case LIBSSH2_FX_BAD_MESSAGE:         return "bad message";
    case LIBSSH2_FX_NO_CONNECTION:       return "no connection";
    case LIBSSH2_FX_CONNECTION_LOST:     return "connection lost";
    case LIBSSH2_FX_OP_UNSUPPORTED:      return "operation unsupported";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
    case LIBSSH2_FX_WRITE_PROTECT:       return "write protected";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left on device";
    case LIBSSH2_FX_QUOTA_EXCEEDED:      return "quota exceeded";
    case LIBSSH2_FX_DIR_NOT_EMPTY:       return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:     return "not a directory";
    case LIBSSH2_FX_INVALID_FILENAME:    return "invalid filename";
    case LIBSSH2_FX_LINK_LOOP:           return "too many symbolic links";
    default:                             return fmt::format("sftp status {}", status);
    }
}

void raise_session_error(Libssh2Link& link, int rc, const std::string& what) {
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && link.sftp) {
        unsigned long status = libssh2_sftp_last_error(link.sftp);
        throw SftpError(static_cast<int>(status),
                        fmt::format("{}: {}", what, sftp_status_text(status)));
    }

    char* msg = nullptr;
    if (link.session) {
        libssh2_session_last_error(link.session, &msg, nullptr, 0);
    }
    std::string detail = fmt::format("{}: {} ({})", what,
                                     (msg && *msg) ? msg : "unknown error", rc);

    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
    case LIBSSH2_ERROR_BAD_SOCKET:
        link.broken = true;
        throw TransportError(detail);
    default:
        throw SshError(detail);
    }
}

void keepalive_tick(Libssh2Link& link) {
    if (!link.session || link.closed) return;
    int seconds_to_next = 0;
    int rc = libssh2_keepalive_send(link.session, &seconds_to_next);
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
        link.broken = true;
    }
}

void close_link(Libssh2Link& link) {
    {
        std::lock_guard<std::mutex> lock(link.io_mutex);
        if (link.closed) return;
        link.closed = true;

        // Each step gets its own budget; a dead peer must not hang shutdown.
        auto step_deadline = [] {
            return std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(CHANNEL_CLOSE_TIMEOUT_MS);
        };

        if (link.sftp) {
            auto deadline = step_deadline();
            while (libssh2_sftp_shutdown(link.sftp) == LIBSSH2_ERROR_EAGAIN &&
                   std::chrono::steady_clock::now() < deadline) {
                platform::sleep_ms(EAGAIN_SLEEP_MS);
            }
            link.sftp = nullptr;
        }
        if (link.session) {
            auto deadline = step_deadline();
            while (libssh2_session_disconnect(link.session, "Normal shutdown") == LIBSSH2_ERROR_EAGAIN &&
                   std::chrono::steady_clock::now() < deadline) {
                platform::sleep_ms(EAGAIN_SLEEP_MS);
            }
            deadline = step_deadline();
            while (libssh2_session_free(link.session) == LIBSSH2_ERROR_EAGAIN &&
                   std::chrono::steady_clock::now() < deadline) {
                platform::sleep_ms(EAGAIN_SLEEP_MS);
            }
            link.session = nullptr;
        }
        if (link.sock != HOSTLINK_INVALID_SOCKET) {
            platform::close_socket(link.sock);
            link.sock = HOSTLINK_INVALID_SOCKET;
        }
    }

    if (link.pump.joinable()) {
        link.stop_pump = true;
        link.pump.join();
    }
    if (link.pump_sock != HOSTLINK_INVALID_SOCKET) {
        platform::close_socket(link.pump_sock);
        link.pump_sock = HOSTLINK_INVALID_SOCKET;
    }
    if (link.jump) {
        {
            std::lock_guard<std::mutex> lock(link.jump->io_mutex);
            if (!link.jump->closed && link.tunnel) {
                auto deadline = std::chrono::steady_clock::now() +
                                std::chrono::milliseconds(CHANNEL_CLOSE_TIMEOUT_MS);
                while (libssh2_channel_close(link.tunnel) == LIBSSH2_ERROR_EAGAIN &&
                       std::chrono::steady_clock::now() < deadline) {
                    platform::sleep_ms(EAGAIN_SLEEP_MS);
                }
                libssh2_channel_free(link.tunnel);
            }
            link.tunnel = nullptr;
        }
        close_link(*link.jump);
        link.jump.reset();
    }

    hostlink_log(fmt::format("SSH link closed: {}", link.label));
}
