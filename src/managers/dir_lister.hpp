#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "file_session_manager.hpp"

// Snapshot of one remote directory. `complete` once fully enumerated.
struct DirCacheEntry {
    std::vector<SftpListEntry> entries;
    bool complete = false;
    int64_t created_at = 0;
    int64_t last_access = 0;
};

// Pages served from an in-memory snapshot of a complete cache entry.
struct CacheCursor {
    std::string connection_id;
    std::string path;
    std::vector<SftpListEntry> snapshot;
    size_t offset = 0;
};

// Pages pulled from an open remote directory handle.
struct SftpCursor {
    std::string connection_id;
    std::string path;
    std::unique_ptr<RemoteDir> dir;
    std::deque<SftpListEntry> pending;        // read but not yet returned
    std::vector<SftpListEntry> collected;     // already returned, in order
    int empty_rounds = 0;
    bool exhausted = false;
};

using DirCursor = std::variant<CacheCursor, SftpCursor>;

// Directory listing cache plus paginated cursors, keyed by
// (connection id, resolved absolute path without trailing slash). One mutex
// guards both tables;
// remote reads happen outside it, with the cursor taken out of the table for
// the duration of the read.
class DirLister {
public:
    using Clock = std::function<int64_t()>;

    explicit DirLister(FileSessionManager& sessions, Clock clock = nullptr);
    ~DirLister();

    DirLister(const DirLister&) = delete;
    DirLister& operator=(const DirLister&) = delete;

    // Full listing when neither cursor nor limit is given, otherwise one page.
    // Throws CursorError for unknown, expired or mismatched cursors.
    DirListing list(const std::string& connection_id, const std::string& path,
                    const ListDirOptions& options = {});

    // Drop cache entry and cursors for one resolved path.
    void invalidate(const std::string& connection_id, const std::string& path);

    // Drop everything for a connection and close its open handles.
    void purge(const std::string& connection_id);

    void clear();

    // Introspection
    size_t cache_size() const;
    size_t cursor_count() const;
    std::optional<DirCacheEntry> cache_entry(const std::string& connection_id,
                                             const std::string& path) const;

private:
    using Key = std::pair<std::string, std::string>;

    // (connection generation, path generation) when a read started. Results
    // of a read whose stamp went stale are neither cached nor re-registered.
    using Stamp = std::pair<uint64_t, uint64_t>;

    struct CursorSlot {
        DirCursor cursor;
        int limit = DEFAULT_PAGE_LIMIT;
        int64_t last_access = 0;
        Stamp stamp;
    };

    FileSessionManager& sessions_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<Key, DirCacheEntry> cache_;
    std::map<std::string, std::unique_ptr<CursorSlot>> cursors_;
    std::map<std::string, uint64_t> generations_;   // bumped on purge
    std::map<Key, uint64_t> path_generations_;      // bumped on invalidate and refresh
    uint64_t next_cursor_ = 1;

    DirListing list_in_session(FileSession& session, const std::string& connection_id,
                               const std::string& path, const ListDirOptions& options);

    DirListing read_full(FileSession& session, const Key& key);
    DirListing first_page(FileSession& session, const Key& key, int limit);
    DirListing continue_cursor(const Key& key, const std::string& cursor_id,
                               std::optional<int> limit);

    DirListing serve_cache_cursor(std::string cursor_id, std::unique_ptr<CursorSlot> slot, int limit);
    DirListing drain_sftp_cursor(std::string cursor_id, std::unique_ptr<CursorSlot> slot, int limit);

    // Remove expired entries; returns handles to close outside the lock.
    std::vector<std::unique_ptr<RemoteDir>> prune_locked(int64_t now);
    std::vector<std::unique_ptr<RemoteDir>> drop_key_locked(const Key& key);

    Stamp stamp_locked(const Key& key);
    std::string new_cursor_id_locked();

    static void close_quietly(std::unique_ptr<RemoteDir>& dir, const std::string& path);
    static void close_all_quietly(std::vector<std::unique_ptr<RemoteDir>>& dirs);
};

// Clamp a requested page size into [1, MAX_LIST_LIMIT].
int clamp_list_limit(int limit);

// Cache key form of a directory path: trailing slashes dropped, "/" kept.
std::string normalize_dir_path(const std::string& path);
