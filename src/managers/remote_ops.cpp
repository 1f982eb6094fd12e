#include "remote_ops.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <regex>
#include <sstream>
#include <fmt/format.h>

// ── SFTP helpers ──────────────────────────────────────────────

void sftp_mkdir_recursive(SftpChannel& sftp, const std::string& path) {
    std::string current = (!path.empty() && path[0] == '/') ? "/" : "";
    std::istringstream parts(path);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part.empty()) continue;
        current = current.empty() ? part : posix_join(current, part);
        if (sftp.stat(current)) continue;
        try {
            sftp.mkdir(current);
        } catch (const SftpError& e) {
            // Lost a race with another mkdir, or the server reports EEXIST as
            // a generic failure.
            if (e.status() != SFTP_STATUS_FAILURE && e.status() != SFTP_STATUS_FILE_EXISTS) throw;
        }
    }
}

std::string sftp_read_all(SftpChannel& sftp, const std::string& path) {
    auto file = sftp.open(path, OpenMode::Read);
    std::string out;
    std::vector<char> buf(TRANSFER_CHUNK_SIZE);
    while (true) {
        size_t n = file->read(buf.data(), buf.size());
        if (n == 0) break;
        out.append(buf.data(), n);
    }
    file->close();
    return out;
}

void sftp_write_all(SftpChannel& sftp, const std::string& path, const std::string& data) {
    auto file = sftp.open(path, OpenMode::WriteTruncate);
    size_t pos = 0;
    while (pos < data.size()) {
        size_t n = std::min(TRANSFER_CHUNK_SIZE, data.size() - pos);
        file->write(data.data() + pos, n);
        pos += n;
    }
    file->close();
}

std::string number_lines(const std::string& content, std::optional<int> offset,
                         std::optional<int> limit) {
    if (!offset && !limit) return content;

    // Split on '\n' only, keeping a trailing empty line like the file has.
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }

    size_t first = static_cast<size_t>(std::max(1, offset.value_or(1)) - 1);
    size_t last = lines.size();
    if (limit && *limit > 0) last = std::min(last, first + static_cast<size_t>(*limit));

    std::string out;
    for (size_t i = first; i < last; ++i) {
        if (!out.empty()) out += '\n';
        out += fmt::format("{}\t{}", i + 1, lines[i]);
    }
    return out;
}

std::vector<GrepMatch> parse_grep_output(const std::string& output) {
    static const std::regex line_re(R"(^(.+?):(\d+):(.*)$)");
    std::vector<GrepMatch> matches;
    for (const auto& line : split_lines(output)) {
        std::smatch m;
        if (!std::regex_match(line, m, line_re)) continue;
        matches.push_back(GrepMatch{m[1].str(), safe_stoi(m[2].str()), m[3].str()});
    }
    return matches;
}

// ── RemoteOps ─────────────────────────────────────────────────

RemoteOps::RemoteOps(FileSessionManager& sessions, DirLister& lister)
    : sessions_(sessions), lister_(lister) {
}

void RemoteOps::invalidate_parent(const std::string& connection_id, const std::string& path) {
    lister_.invalidate(connection_id, posix_dirname(path));
}

std::string RemoteOps::home_dir(const std::string& connection_id) {
    return sessions_.with_session(connection_id, [&](FileSession& s) {
        auto home = s.home_dir();
        if (!home) throw SshError("Could not resolve remote home directory");
        return *home;
    });
}

std::string RemoteOps::read_file(const std::string& connection_id, const std::string& path,
                                 std::optional<int> offset, std::optional<int> limit) {
    return sessions_.with_session(connection_id, [&](FileSession& s) {
        std::string resolved = s.resolve_path(path);
        return number_lines(sftp_read_all(*s.sftp(), resolved), offset, limit);
    });
}

void RemoteOps::write_file(const std::string& connection_id, const std::string& path,
                           const std::string& content) {
    std::string resolved = sessions_.with_session(connection_id, [&](FileSession& s) {
        std::string target = s.resolve_path(path);
        auto sftp = s.sftp();
        sftp_mkdir_recursive(*sftp, posix_dirname(target));
        sftp_write_all(*sftp, target, content);
        return target;
    });
    invalidate_parent(connection_id, resolved);
}

std::string RemoteOps::read_file_binary(const std::string& connection_id, const std::string& path) {
    return sessions_.with_session(connection_id, [&](FileSession& s) {
        return base64_encode(sftp_read_all(*s.sftp(), s.resolve_path(path)));
    });
}

void RemoteOps::write_file_binary(const std::string& connection_id, const std::string& path,
                                  const std::string& base64_data) {
    write_file(connection_id, path, base64_decode(base64_data));
}

void RemoteOps::mkdir(const std::string& connection_id, const std::string& path) {
    std::string resolved = sessions_.with_session(connection_id, [&](FileSession& s) {
        std::string target = s.resolve_path(path);
        sftp_mkdir_recursive(*s.sftp(), target);
        return target;
    });
    invalidate_parent(connection_id, resolved);
}

void RemoteOps::remove(const std::string& connection_id, const std::string& path) {
    std::string resolved = sessions_.with_session(connection_id, [&](FileSession& s) {
        std::string target = s.resolve_path(path);
        auto sftp = s.sftp();
        auto attrs = sftp->stat(target);
        if (attrs && attrs->type == EntryType::Directory) {
            auto r = s.transport().exec("rm -rf " + shell_escape(target), EXEC_DEFAULT_TIMEOUT_MS);
            hostlink_log_ssh(connection_id, "rm -rf", r);
            if (r.failed()) {
                throw SshError(fmt::format("rm -rf {} failed: {}", target, r.get_output()));
            }
        } else {
            sftp->unlink(target);
        }
        return target;
    });
    lister_.invalidate(connection_id, resolved);
    invalidate_parent(connection_id, resolved);
}

void RemoteOps::move(const std::string& connection_id, const std::string& from,
                     const std::string& to) {
    std::pair<std::string, std::string> resolved =
        sessions_.with_session(connection_id, [&](FileSession& s) {
            std::string src = s.resolve_path(from);
            std::string dst = s.resolve_path(to);
            s.sftp()->rename(src, dst);
            return std::make_pair(src, dst);
        });
    lister_.invalidate(connection_id, resolved.first);
    invalidate_parent(connection_id, resolved.first);
    invalidate_parent(connection_id, resolved.second);
}

std::vector<std::string> RemoteOps::glob(const std::string& connection_id, const std::string& pattern,
                                         const std::optional<std::string>& path) {
    return sessions_.with_session(connection_id, [&](FileSession& s) {
        std::string cwd = s.resolve_path(path && !path->empty() ? *path : ".");
        std::string cmd = fmt::format("find {} -name {} -maxdepth {} 2>/dev/null | head -{}",
                                      shell_escape(cwd), shell_escape(pattern),
                                      GLOB_MAX_DEPTH, SEARCH_RESULT_CAP);
        auto r = s.transport().exec(cmd, EXEC_DEFAULT_TIMEOUT_MS);
        std::vector<std::string> out;
        if (r.failed()) return out;
        for (auto line : split_lines(r.stdout_data)) {
            trim(line);
            if (!line.empty()) out.push_back(line);
        }
        return out;
    });
}

std::vector<GrepMatch> RemoteOps::grep(const std::string& connection_id, const std::string& pattern,
                                       const std::optional<std::string>& path,
                                       const std::optional<std::string>& include) {
    return sessions_.with_session(connection_id, [&](FileSession& s) {
        std::string cwd = s.resolve_path(path && !path->empty() ? *path : ".");
        std::string cmd = fmt::format("grep -rn {} {}", shell_escape(pattern), shell_escape(cwd));
        if (include && !include->empty()) cmd += " --include=" + shell_escape(*include);
        cmd += fmt::format(" 2>/dev/null | head -{}", SEARCH_RESULT_CAP);

        auto r = s.transport().exec(cmd, EXEC_DEFAULT_TIMEOUT_MS);
        // grep exits 1 when nothing matched
        if (r.exit_code != 0 && r.exit_code != 1) {
            throw SshError(r.stderr_data.empty() ? "grep failed" : r.stderr_data);
        }
        return parse_grep_output(r.stdout_data);
    });
}

std::string RemoteOps::zip_dir(const std::string& connection_id, const std::string& dir_path) {
    return sessions_.with_session(connection_id, [&](FileSession& s) {
        std::string dir = s.resolve_path(dir_path);
        auto probe = s.transport().exec("command -v zip", TOOL_PROBE_TIMEOUT_MS);
        if (probe.failed()) throw ToolMissingError("zip", tool_install_hint("zip"));

        std::string name = posix_basename(dir);
        std::string output = fmt::format("/tmp/{}-{}.zip", name, random_token(4));
        std::string cmd = fmt::format("cd {} && zip -r -q {} {}",
                                      shell_escape(posix_dirname(dir)),
                                      shell_escape(output), shell_escape(name));
        auto r = s.transport().exec(cmd, REMOTE_ARCHIVE_TIMEOUT_MS);
        hostlink_log_ssh(connection_id, cmd, r);
        if (r.failed()) {
            throw SshError(fmt::format("zip of {} failed (exit {}): {}", dir, r.exit_code,
                                       r.get_output()));
        }
        return output;
    });
}

SSHResult RemoteOps::exec(const std::string& connection_id, const std::string& command,
                          int timeout_ms) {
    return sessions_.with_session(connection_id, [&](FileSession& s) {
        auto r = s.transport().exec(command, timeout_ms);
        hostlink_log_ssh(connection_id, command, r);
        return r;
    });
}
