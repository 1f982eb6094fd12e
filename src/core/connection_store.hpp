#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Read-mostly contract to the saved-connection configuration.
class ConnectionStore {
public:
    using ChangeListener = std::function<void()>;

    virtual ~ConnectionStore() = default;

    virtual std::vector<ConnectionDescriptor> list_connections() const = 0;
    virtual std::optional<ConnectionDescriptor> get_connection(const std::string& id) const = 0;
    virtual std::vector<ConnectionGroup> list_groups() const = 0;

    virtual Result<void> create_connection(const ConnectionDescriptor& connection) = 0;
    virtual Result<void> update_connection(const ConnectionDescriptor& connection) = 0;
    virtual Result<void> delete_connection(const std::string& id) = 0;
    virtual Result<void> create_group(const ConnectionGroup& group) = 0;
    virtual Result<void> delete_group(const std::string& id) = 0;

    // lastConnectedAt bookkeeping after a successful terminal connect
    virtual Result<void> record_connected(const std::string& id, int64_t when_ms) = 0;

    virtual void on_change(ChangeListener listener) = 0;
};

// JSON document on disk: {"ssh": {"groups": [...], "connections": [...]}}.
class FileConnectionStore : public ConnectionStore {
public:
    explicit FileConnectionStore(const fs::path& path);

    std::vector<ConnectionDescriptor> list_connections() const override;
    std::optional<ConnectionDescriptor> get_connection(const std::string& id) const override;
    std::vector<ConnectionGroup> list_groups() const override;

    Result<void> create_connection(const ConnectionDescriptor& connection) override;
    Result<void> update_connection(const ConnectionDescriptor& connection) override;
    Result<void> delete_connection(const std::string& id) override;
    Result<void> create_group(const ConnectionGroup& group) override;
    Result<void> delete_group(const std::string& id) override;
    Result<void> record_connected(const std::string& id, int64_t when_ms) override;

    void on_change(ChangeListener listener) override;

    // Re-read the file if its modification time moved; fires listeners on change.
    // Returns true when a reload happened.
    bool reload_if_changed();

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    mutable std::mutex mutex_;
    std::vector<ConnectionGroup> groups_;
    std::vector<ConnectionDescriptor> connections_;
    fs::file_time_type loaded_mtime_{};
    std::vector<ChangeListener> listeners_;

    void load_locked();
    Result<void> save_locked();
    void notify();
};
