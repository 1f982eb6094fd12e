#include "dir_lister.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>

int clamp_list_limit(int limit) {
    return std::max(1, std::min(limit, MAX_LIST_LIMIT));
}

std::string normalize_dir_path(const std::string& path) {
    size_t end = path.size();
    while (end > 1 && path[end - 1] == '/') --end;
    return path.substr(0, end);
}

DirLister::DirLister(FileSessionManager& sessions, Clock clock)
    : sessions_(sessions), clock_(clock ? std::move(clock) : Clock(now_ms)) {
}

DirLister::~DirLister() {
    clear();
}

// ── Public entry ──────────────────────────────────────────────

DirListing DirLister::list(const std::string& connection_id, const std::string& path,
                           const ListDirOptions& options) {
    return sessions_.with_session(connection_id, [&](FileSession& session) {
        return list_in_session(session, connection_id, path, options);
    });
}

DirListing DirLister::list_in_session(FileSession& session, const std::string& connection_id,
                                      const std::string& path, const ListDirOptions& options) {
    Key key{connection_id, normalize_dir_path(session.resolve_path(path))};

    std::vector<std::unique_ptr<RemoteDir>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_close = prune_locked(clock_());
        // A refresh also drops cursors, so a refresh with a cursor reports it expired.
        if (options.refresh) {
            auto dropped = drop_key_locked(key);
            for (auto& d : dropped) to_close.push_back(std::move(d));
        }
    }
    close_all_quietly(to_close);

    if (options.cursor) return continue_cursor(key, *options.cursor, options.limit);
    if (!options.limit) return read_full(session, key);
    return first_page(session, key, clamp_list_limit(*options.limit));
}

// ── Unpaginated ───────────────────────────────────────────────

DirListing DirLister::read_full(FileSession& session, const Key& key) {
    Stamp stamp;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();
        auto it = cache_.find(key);
        if (it != cache_.end() && it->second.complete &&
            now - it->second.created_at < DIR_CACHE_TTL_MS) {
            it->second.last_access = now;
            return DirListing{it->second.entries, std::nullopt};
        }
        stamp = stamp_locked(key);
    }

    auto dir = session.sftp()->opendir(key.second);
    std::vector<SftpListEntry> entries;
    int empty_rounds = 0;
    try {
        while (true) {
            auto round = dir->read_round();
            if (round.entries.empty()) {
                if (round.eof || ++empty_rounds >= MAX_EMPTY_READDIR_ROUNDS) break;
                continue;
            }
            empty_rounds = 0;
            entries.insert(entries.end(),
                           std::make_move_iterator(round.entries.begin()),
                           std::make_move_iterator(round.entries.end()));
            if (round.eof) break;
        }
    } catch (const std::exception&) {
        close_quietly(dir, key.second);
        throw;
    }
    close_quietly(dir, key.second);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stamp == stamp_locked(key)) {
            int64_t now = clock_();
            cache_[key] = DirCacheEntry{entries, true, now, now};
        }
    }
    return DirListing{std::move(entries), std::nullopt};
}

// ── Paginated ─────────────────────────────────────────────────

DirListing DirLister::first_page(FileSession& session, const Key& key, int limit) {
    std::string cursor_id;
    Stamp stamp;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();
        cursor_id = new_cursor_id_locked();
        stamp = stamp_locked(key);

        auto it = cache_.find(key);
        if (it != cache_.end() && it->second.complete &&
            now - it->second.created_at < DIR_CACHE_TTL_MS) {
            it->second.last_access = now;
            auto slot = std::make_unique<CursorSlot>();
            slot->cursor = CacheCursor{key.first, key.second, it->second.entries, 0};
            slot->limit = limit;
            slot->last_access = now;
            slot->stamp = stamp;
            // No I/O involved: serve straight from the snapshot below.
            return serve_cache_cursor(cursor_id, std::move(slot), limit);
        }
    }

    auto slot = std::make_unique<CursorSlot>();
    SftpCursor cursor;
    cursor.connection_id = key.first;
    cursor.path = key.second;
    cursor.dir = session.sftp()->opendir(key.second);
    slot->cursor = std::move(cursor);
    slot->limit = limit;
    slot->last_access = clock_();
    slot->stamp = stamp;
    return drain_sftp_cursor(cursor_id, std::move(slot), limit);
}

DirListing DirLister::continue_cursor(const Key& key, const std::string& cursor_id,
                                      std::optional<int> limit) {
    std::unique_ptr<CursorSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cursors_.find(cursor_id);
        if (it == cursors_.end()) {
            throw CursorError("Directory cursor expired or not found: " + cursor_id);
        }
        const auto& cursor = it->second->cursor;
        const std::string& conn = std::visit([](const auto& c) -> const std::string& { return c.connection_id; }, cursor);
        const std::string& path = std::visit([](const auto& c) -> const std::string& { return c.path; }, cursor);
        if (conn != key.first || path != key.second) {
            throw CursorError(fmt::format("Directory cursor {} does not belong to {}", cursor_id, key.second));
        }
        slot = std::move(it->second);
        cursors_.erase(it);
    }

    int page = limit ? clamp_list_limit(*limit) : slot->limit;
    slot->limit = page;
    slot->last_access = clock_();

    if (std::holds_alternative<CacheCursor>(slot->cursor)) {
        std::lock_guard<std::mutex> lock(mutex_);
        return serve_cache_cursor(cursor_id, std::move(slot), page);
    }
    return drain_sftp_cursor(cursor_id, std::move(slot), page);
}

// Caller holds mutex_.
DirListing DirLister::serve_cache_cursor(std::string cursor_id, std::unique_ptr<CursorSlot> slot,
                                         int limit) {
    auto& cursor = std::get<CacheCursor>(slot->cursor);
    size_t end = std::min(cursor.snapshot.size(), cursor.offset + static_cast<size_t>(limit));

    DirListing out;
    out.entries.assign(cursor.snapshot.begin() + static_cast<std::ptrdiff_t>(cursor.offset),
                       cursor.snapshot.begin() + static_cast<std::ptrdiff_t>(end));
    cursor.offset = end;

    DirPage page;
    page.has_more = cursor.offset < cursor.snapshot.size();
    if (page.has_more) {
        page.next_cursor = cursor_id;
        if (slot->stamp == stamp_locked({cursor.connection_id, cursor.path})) {
            slot->last_access = clock_();
            cursors_[cursor_id] = std::move(slot);
        }
    }
    out.page = page;
    return out;
}

DirListing DirLister::drain_sftp_cursor(std::string cursor_id, std::unique_ptr<CursorSlot> slot,
                                        int limit) {
    auto& cursor = std::get<SftpCursor>(slot->cursor);
    Key key{cursor.connection_id, cursor.path};

    try {
        while (static_cast<int>(cursor.pending.size()) < limit && !cursor.exhausted) {
            auto round = cursor.dir->read_round();
            if (round.entries.empty()) {
                if (round.eof || ++cursor.empty_rounds >= MAX_EMPTY_READDIR_ROUNDS) {
                    cursor.exhausted = true;
                }
                continue;
            }
            cursor.empty_rounds = 0;
            for (auto& entry : round.entries) cursor.pending.push_back(std::move(entry));
            if (round.eof) cursor.exhausted = true;
        }
    } catch (const std::exception& e) {
        hostlink_log(fmt::format("Directory cursor on {} aborted: {}", cursor.path, e.what()));
        // Close the handle first, then leave a partial entry behind.
        close_quietly(cursor.dir, cursor.path);
        std::vector<SftpListEntry> partial = cursor.collected;
        partial.insert(partial.end(), cursor.pending.begin(), cursor.pending.end());
        std::lock_guard<std::mutex> lock(mutex_);
        if (!partial.empty() && slot->stamp == stamp_locked(key)) {
            auto it = cache_.find(key);
            if (it == cache_.end() || !it->second.complete) {
                int64_t now = clock_();
                cache_[key] = DirCacheEntry{std::move(partial), false, now, now};
            }
        }
        throw;
    }

    DirListing out;
    size_t take = std::min(cursor.pending.size(), static_cast<size_t>(limit));
    for (size_t i = 0; i < take; ++i) {
        out.entries.push_back(cursor.pending.front());
        cursor.collected.push_back(std::move(cursor.pending.front()));
        cursor.pending.pop_front();
    }

    DirPage page;
    page.has_more = !cursor.pending.empty() || !cursor.exhausted;

    if (!page.has_more) {
        close_quietly(cursor.dir, cursor.path);
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->stamp == stamp_locked(key)) {
            int64_t now = clock_();
            cache_[key] = DirCacheEntry{std::move(cursor.collected), true, now, now};
        }
        out.page = page;
        return out;
    }

    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->stamp == stamp_locked(key)) {
            slot->last_access = clock_();
            cursors_[cursor_id] = std::move(slot);
            registered = true;
        }
    }
    if (!registered) {
        // Purged or invalidated while we were reading; the next call reports
        // an expired cursor.
        close_quietly(cursor.dir, cursor.path);
    }
    page.next_cursor = cursor_id;
    out.page = page;
    return out;
}

// ── Maintenance ───────────────────────────────────────────────

std::vector<std::unique_ptr<RemoteDir>> DirLister::prune_locked(int64_t now) {
    std::vector<std::unique_ptr<RemoteDir>> to_close;

    for (auto it = cache_.begin(); it != cache_.end();) {
        if (now - it->second.created_at >= DIR_CACHE_TTL_MS) {
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = cursors_.begin(); it != cursors_.end();) {
        if (now - it->second->last_access >= DIR_CURSOR_TTL_MS) {
            if (auto* sftp = std::get_if<SftpCursor>(&it->second->cursor)) {
                hostlink_log(fmt::format("Directory cursor {} on {} expired", it->first, sftp->path));
                if (sftp->dir) to_close.push_back(std::move(sftp->dir));
            }
            it = cursors_.erase(it);
        } else {
            ++it;
        }
    }
    return to_close;
}

std::vector<std::unique_ptr<RemoteDir>> DirLister::drop_key_locked(const Key& key) {
    std::vector<std::unique_ptr<RemoteDir>> to_close;
    ++path_generations_[key];
    cache_.erase(key);
    for (auto it = cursors_.begin(); it != cursors_.end();) {
        auto& cursor = it->second->cursor;
        bool match = std::visit([&](const auto& c) {
            return c.connection_id == key.first && c.path == key.second;
        }, cursor);
        if (match) {
            if (auto* sftp = std::get_if<SftpCursor>(&cursor)) {
                if (sftp->dir) to_close.push_back(std::move(sftp->dir));
            }
            it = cursors_.erase(it);
        } else {
            ++it;
        }
    }
    return to_close;
}

void DirLister::invalidate(const std::string& connection_id, const std::string& path) {
    std::vector<std::unique_ptr<RemoteDir>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_close = drop_key_locked({connection_id, normalize_dir_path(path)});
    }
    close_all_quietly(to_close);
}

void DirLister::purge(const std::string& connection_id) {
    std::vector<std::unique_ptr<RemoteDir>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generations_[connection_id];
        for (auto it = path_generations_.begin(); it != path_generations_.end();) {
            if (it->first.first == connection_id) {
                it = path_generations_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = cache_.begin(); it != cache_.end();) {
            if (it->first.first == connection_id) {
                it = cache_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = cursors_.begin(); it != cursors_.end();) {
            auto& cursor = it->second->cursor;
            bool match = std::visit([&](const auto& c) { return c.connection_id == connection_id; }, cursor);
            if (match) {
                if (auto* sftp = std::get_if<SftpCursor>(&cursor)) {
                    if (sftp->dir) to_close.push_back(std::move(sftp->dir));
                }
                it = cursors_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (!to_close.empty()) {
        hostlink_log(fmt::format("Closing {} directory handle(s) for {}", to_close.size(), connection_id));
    }
    close_all_quietly(to_close);
}

void DirLister::clear() {
    std::vector<std::unique_ptr<RemoteDir>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, slot] : cursors_) {
            if (auto* sftp = std::get_if<SftpCursor>(&slot->cursor)) {
                if (sftp->dir) to_close.push_back(std::move(sftp->dir));
            }
        }
        for (auto& [conn, gen] : generations_) ++gen;
        cursors_.clear();
        cache_.clear();
    }
    close_all_quietly(to_close);
}

size_t DirLister::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

size_t DirLister::cursor_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursors_.size();
}

std::optional<DirCacheEntry> DirLister::cache_entry(const std::string& connection_id,
                                                    const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find({connection_id, normalize_dir_path(path)});
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

DirLister::Stamp DirLister::stamp_locked(const Key& key) {
    Stamp stamp{generations_[key.first], 0};
    auto it = path_generations_.find(key);
    if (it != path_generations_.end()) stamp.second = it->second;
    return stamp;
}

std::string DirLister::new_cursor_id_locked() {
    return fmt::format("dir-{}-{}", next_cursor_++, random_token(4));
}

void DirLister::close_quietly(std::unique_ptr<RemoteDir>& dir, const std::string& path) {
    if (!dir) return;
    try {
        dir->close();
    } catch (const std::exception& e) {
        hostlink_log(fmt::format("Closing directory handle for {} failed: {}", path, e.what()));
    }
    dir.reset();
}

void DirLister::close_all_quietly(std::vector<std::unique_ptr<RemoteDir>>& dirs) {
    for (auto& dir : dirs) close_quietly(dir, "expired cursor");
    dirs.clear();
}
