#pragma once

#include <stdexcept>
#include <string>

// Base for every failure raised by the SSH layer.
class SshError : public std::runtime_error {
public:
    explicit SshError(const std::string& msg) : std::runtime_error(msg) {}
};

// Connection-level failure: the session behind it is no longer usable.
class TransportError : public SshError {
public:
    explicit TransportError(const std::string& msg) : SshError(msg) {}
};

// The server never answered within the budget.
class TimeoutError : public SshError {
public:
    explicit TimeoutError(const std::string& msg) : SshError(msg) {}
};

// SFTP status codes (draft-ietf-secsh-filexfer-02 plus common extensions)
constexpr int SFTP_STATUS_EOF            = 1;
constexpr int SFTP_STATUS_NO_SUCH_FILE   = 2;
constexpr int SFTP_STATUS_PERMISSION     = 3;
constexpr int SFTP_STATUS_FAILURE        = 4;
constexpr int SFTP_STATUS_NO_CONNECTION  = 6;
constexpr int SFTP_STATUS_CONN_LOST      = 7;
constexpr int SFTP_STATUS_FILE_EXISTS    = 11;

// Application-level SFTP failure (missing file, permission denied, ...).
class SftpError : public SshError {
public:
    SftpError(int status, const std::string& msg) : SshError(msg), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// Expired, unknown or mismatched pagination cursor.
class CursorError : public std::runtime_error {
public:
    explicit CursorError(const std::string& msg) : std::runtime_error(msg) {}
};

// Remote host lacks a required tool (zip/unzip).
class ToolMissingError : public std::runtime_error {
public:
    ToolMissingError(const std::string& tool, const std::string& msg)
        : std::runtime_error(msg), tool_(tool) {}

    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

// Message used when a session was deliberately retired.
constexpr const char* NOT_WRITABLE_MESSAGE = "SSH session is no longer writable";

// Decides whether a failure means the underlying connection must be torn down.
bool is_transport_error(const std::exception& e);
bool is_transport_message(const std::string& msg);

// Human-readable install hint for a missing remote tool.
std::string tool_install_hint(const std::string& tool);
