#pragma once

#include "transport.hpp"

// Opens real SSH connections with libssh2: TCP (or a proxy-jump tunnel),
// handshake, authentication by password, private key or ssh-agent.
class Libssh2TransportFactory : public TransportFactory {
public:
    std::shared_ptr<SshTransport> connect(const ConnectionDescriptor& desc,
                                          int timeout_ms) override;
};

// Split "[user@]host[:port]" into a descriptor for the jump host, inheriting
// credentials from `target`.
ConnectionDescriptor parse_proxy_jump(const std::string& jump,
                                      const ConnectionDescriptor& target);
