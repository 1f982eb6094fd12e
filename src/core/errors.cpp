#include "errors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

bool is_transport_message(const std::string& msg) {
    std::string lower(msg);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const char* const kMarkers[] = {
        "timeout",
        "timed out",
        "not connected",
        "no connection",
        "connection lost",
        "channel not open",
        "econnreset",
        "connection reset",
        "hang up",
        "hangup",
        "epipe",
        "broken pipe",
        "write after end",
        "no longer writable",
        "socket disconnect",
        "socket send",
        "socket recv",
    };
    for (const char* marker : kMarkers) {
        if (lower.find(marker) != std::string::npos) return true;
    }
    return false;
}

bool is_transport_error(const std::exception& e) {
    if (dynamic_cast<const TimeoutError*>(&e)) return true;
    if (dynamic_cast<const TransportError*>(&e)) return true;
    if (const auto* sftp = dynamic_cast<const SftpError*>(&e)) {
        return sftp->status() == SFTP_STATUS_NO_CONNECTION ||
               sftp->status() == SFTP_STATUS_CONN_LOST;
    }
    if (dynamic_cast<const CursorError*>(&e)) return false;
    if (dynamic_cast<const ToolMissingError*>(&e)) return false;
    return is_transport_message(e.what());
}

std::string tool_install_hint(const std::string& tool) {
    return fmt::format(
        "Remote host is missing '{0}'. Install it on the server "
        "(e.g. 'sudo apt install {0}' or 'sudo yum install {0}') and try again.",
        tool);
}
