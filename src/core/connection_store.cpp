#include "connection_store.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>

// ── Node helpers ──────────────────────────────────────────────

static std::optional<std::string> opt_string(const YAML::Node& node, const char* key) {
    auto v = node[key];
    if (!v || !v.IsScalar()) return std::nullopt;
    return v.as<std::string>();
}

static std::optional<ConnectionGroup> parse_group(const YAML::Node& n) {
    if (!n.IsMap()) return std::nullopt;
    auto id = opt_string(n, "id");
    auto name = opt_string(n, "name");
    if (!id || !name || id->empty()) return std::nullopt;

    ConnectionGroup g;
    g.id = *id;
    g.name = *name;
    g.sort_order = n["sortOrder"].as<int>(0);
    g.created_at = n["createdAt"].as<int64_t>(now_ms());
    g.updated_at = n["updatedAt"].as<int64_t>(g.created_at);
    return g;
}

static std::optional<ConnectionDescriptor> parse_connection(const YAML::Node& n) {
    if (!n.IsMap()) return std::nullopt;
    auto id = opt_string(n, "id");
    auto name = opt_string(n, "name");
    auto host = opt_string(n, "host");
    auto username = opt_string(n, "username");
    if (!id || !name || !host || !username || id->empty()) return std::nullopt;

    ConnectionDescriptor c;
    c.id = *id;
    c.group_id = opt_string(n, "groupId");
    c.name = *name;
    c.host = *host;
    c.port = n["port"].as<int>(22);
    c.username = *username;
    c.auth_type = parse_auth_type(n["authType"].as<std::string>("password"));
    c.password = opt_string(n, "password");
    c.private_key_path = opt_string(n, "privateKeyPath");
    c.passphrase = opt_string(n, "passphrase");
    c.startup_command = opt_string(n, "startupCommand");
    c.default_directory = opt_string(n, "defaultDirectory");
    c.proxy_jump = opt_string(n, "proxyJump");
    c.keep_alive_interval = n["keepAliveInterval"].as<int>(60);
    c.sort_order = n["sortOrder"].as<int>(0);
    if (n["lastConnectedAt"] && n["lastConnectedAt"].IsScalar()) {
        c.last_connected_at = n["lastConnectedAt"].as<int64_t>(0);
    }
    c.created_at = n["createdAt"].as<int64_t>(now_ms());
    c.updated_at = n["updatedAt"].as<int64_t>(c.created_at);
    return c;
}

static void emit_opt(YAML::Emitter& out, const char* key, const std::optional<std::string>& value) {
    if (!value) return;
    out << YAML::Key << key << YAML::Value << *value;
}

// ── FileConnectionStore ───────────────────────────────────────

FileConnectionStore::FileConnectionStore(const fs::path& path) : path_(path) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();
}

void FileConnectionStore::load_locked() {
    groups_.clear();
    connections_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) return;
    loaded_mtime_ = fs::last_write_time(path_, ec);

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_.string());
    } catch (const YAML::Exception& e) {
        // Keep an empty view rather than half-parsed data
        hostlink_log(fmt::format("ConnectionStore: failed to parse {}: {}", path_.string(), e.what()));
        return;
    }

    auto ssh = root["ssh"];
    if (!ssh || !ssh.IsMap()) return;

    std::set<std::string> seen_groups;
    if (ssh["groups"] && ssh["groups"].IsSequence()) {
        for (const auto& n : ssh["groups"]) {
            auto g = parse_group(n);
            if (!g || !seen_groups.insert(g->id).second) continue;
            groups_.push_back(*g);
        }
    }

    std::set<std::string> seen_connections;
    if (ssh["connections"] && ssh["connections"].IsSequence()) {
        for (const auto& n : ssh["connections"]) {
            auto c = parse_connection(n);
            if (!c || !seen_connections.insert(c->id).second) continue;
            connections_.push_back(*c);
        }
    }
}

Result<void> FileConnectionStore::save_locked() {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    // Control characters get JSON escapes; the YAML default is not valid JSON
    out.SetOutputCharset(YAML::EscapeAsJson);

    out << YAML::BeginMap << YAML::Key << "ssh" << YAML::Value << YAML::BeginMap;

    out << YAML::Key << "groups" << YAML::Value << YAML::BeginSeq;
    for (const auto& g : groups_) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << g.id;
        out << YAML::Key << "name" << YAML::Value << g.name;
        out << YAML::Key << "sortOrder" << YAML::Value << g.sort_order;
        out << YAML::Key << "createdAt" << YAML::Value << g.created_at;
        out << YAML::Key << "updatedAt" << YAML::Value << g.updated_at;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "connections" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : connections_) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << c.id;
        emit_opt(out, "groupId", c.group_id);
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "host" << YAML::Value << c.host;
        out << YAML::Key << "port" << YAML::Value << c.port;
        out << YAML::Key << "username" << YAML::Value << c.username;
        out << YAML::Key << "authType" << YAML::Value << std::string(auth_type_name(c.auth_type));
        emit_opt(out, "password", c.password);
        emit_opt(out, "privateKeyPath", c.private_key_path);
        emit_opt(out, "passphrase", c.passphrase);
        emit_opt(out, "startupCommand", c.startup_command);
        emit_opt(out, "defaultDirectory", c.default_directory);
        emit_opt(out, "proxyJump", c.proxy_jump);
        out << YAML::Key << "keepAliveInterval" << YAML::Value << c.keep_alive_interval;
        out << YAML::Key << "sortOrder" << YAML::Value << c.sort_order;
        if (c.last_connected_at) {
            out << YAML::Key << "lastConnectedAt" << YAML::Value << *c.last_connected_at;
        }
        out << YAML::Key << "createdAt" << YAML::Value << c.created_at;
        out << YAML::Key << "updatedAt" << YAML::Value << c.updated_at;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap << YAML::EndMap;

    if (!out.good()) {
        return Result<void>::Err("Failed to serialize connections: " + out.GetLastError());
    }

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) {
            return Result<void>::Err("Cannot write " + tmp.string());
        }
        f << out.c_str() << "\n";
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot replace {}: {}", path_.string(), ec.message()));
    }
    loaded_mtime_ = fs::last_write_time(path_, ec);
    return Result<void>::Ok();
}

void FileConnectionStore::notify() {
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (auto& listener : listeners) {
        if (listener) listener();
    }
}

std::vector<ConnectionDescriptor> FileConnectionStore::list_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
}

std::optional<ConnectionDescriptor> FileConnectionStore::get_connection(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : connections_) {
        if (c.id == id) return c;
    }
    return std::nullopt;
}

std::vector<ConnectionGroup> FileConnectionStore::list_groups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_;
}

Result<void> FileConnectionStore::create_connection(const ConnectionDescriptor& connection) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection.id.empty() || connection.host.empty() || connection.username.empty()) {
            return Result<void>::Err("Connection requires id, host and username");
        }
        for (const auto& c : connections_) {
            if (c.id == connection.id) {
                return Result<void>::Err("Connection already exists: " + connection.id);
            }
        }
        connections_.push_back(connection);
        auto saved = save_locked();
        if (saved.is_err()) return saved;
    }
    notify();
    return Result<void>::Ok();
}

Result<void> FileConnectionStore::update_connection(const ConnectionDescriptor& connection) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(connections_.begin(), connections_.end(),
                               [&](const ConnectionDescriptor& c) { return c.id == connection.id; });
        if (it == connections_.end()) {
            return Result<void>::Err("Connection not found");
        }
        *it = connection;
        it->updated_at = now_ms();
        auto saved = save_locked();
        if (saved.is_err()) return saved;
    }
    notify();
    return Result<void>::Ok();
}

Result<void> FileConnectionStore::delete_connection(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto before = connections_.size();
        connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                          [&](const ConnectionDescriptor& c) { return c.id == id; }),
                           connections_.end());
        if (connections_.size() == before) {
            return Result<void>::Err("Connection not found");
        }
        auto saved = save_locked();
        if (saved.is_err()) return saved;
    }
    notify();
    return Result<void>::Ok();
}

Result<void> FileConnectionStore::create_group(const ConnectionGroup& group) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (group.id.empty() || group.name.empty()) {
            return Result<void>::Err("Group requires id and name");
        }
        for (const auto& g : groups_) {
            if (g.id == group.id) return Result<void>::Err("Group already exists: " + group.id);
        }
        groups_.push_back(group);
        auto saved = save_locked();
        if (saved.is_err()) return saved;
    }
    notify();
    return Result<void>::Ok();
}

Result<void> FileConnectionStore::delete_group(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto before = groups_.size();
        groups_.erase(std::remove_if(groups_.begin(), groups_.end(),
                                     [&](const ConnectionGroup& g) { return g.id == id; }),
                      groups_.end());
        if (groups_.size() == before) {
            return Result<void>::Err("Group not found");
        }
        // Orphaned connections fall back to "ungrouped"
        for (auto& c : connections_) {
            if (c.group_id && *c.group_id == id) c.group_id.reset();
        }
        auto saved = save_locked();
        if (saved.is_err()) return saved;
    }
    notify();
    return Result<void>::Ok();
}

Result<void> FileConnectionStore::record_connected(const std::string& id, int64_t when_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& c : connections_) {
        if (c.id == id) {
            c.last_connected_at = when_ms;
            c.updated_at = when_ms;
            return save_locked();
        }
    }
    return Result<void>::Err("Connection not found");
}

void FileConnectionStore::on_change(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

bool FileConnectionStore::reload_if_changed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        bool exists = fs::exists(path_, ec);
        if (exists) {
            auto mtime = fs::last_write_time(path_, ec);
            if (ec || mtime == loaded_mtime_) return false;
        } else if (connections_.empty() && groups_.empty()) {
            return false;
        }
        load_locked();
    }
    hostlink_log(fmt::format("ConnectionStore: reloaded {}", path_.string()));
    notify();
    return true;
}
