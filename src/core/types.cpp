#include "types.hpp"

bool ConnectionDescriptor::same_endpoint(const ConnectionDescriptor& other) const {
    return host == other.host && port == other.port && username == other.username &&
           auth_type == other.auth_type && password == other.password &&
           private_key_path == other.private_key_path && passphrase == other.passphrase &&
           proxy_jump == other.proxy_jump && keep_alive_interval == other.keep_alive_interval;
}

const char* auth_type_name(AuthType type) {
    switch (type) {
        case AuthType::PrivateKey: return "privateKey";
        case AuthType::Agent:      return "agent";
        case AuthType::Password:   break;
    }
    return "password";
}

AuthType parse_auth_type(const std::string& value) {
    if (value == "privateKey") return AuthType::PrivateKey;
    if (value == "agent") return AuthType::Agent;
    return AuthType::Password;
}

const char* entry_type_name(EntryType type) {
    switch (type) {
        case EntryType::Directory: return "directory";
        case EntryType::Symlink:   return "symlink";
        case EntryType::File:      break;
    }
    return "file";
}
