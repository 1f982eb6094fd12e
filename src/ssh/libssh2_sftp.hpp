#pragma once

#include <memory>
#include "transport.hpp"
#include "libssh2_link.hpp"

// SftpChannel over an initialized libssh2 SFTP subsystem. The link owns the
// LIBSSH2_SFTP pointer; this wrapper only borrows it.
class Libssh2Sftp : public SftpChannel {
public:
    explicit Libssh2Sftp(std::shared_ptr<Libssh2Link> link);

    std::string realpath(const std::string& path) override;
    std::optional<RemoteAttrs> stat(const std::string& path) override;
    void mkdir(const std::string& path, int mode = 0755) override;
    void unlink(const std::string& path) override;
    void rmdir(const std::string& path) override;
    void rename(const std::string& from, const std::string& to) override;
    std::unique_ptr<RemoteDir> opendir(const std::string& path) override;
    std::unique_ptr<RemoteFile> open(const std::string& path, OpenMode mode) override;

private:
    std::shared_ptr<Libssh2Link> link_;
};
