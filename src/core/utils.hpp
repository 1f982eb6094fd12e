#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Milliseconds since the Unix epoch (wall clock).
int64_t now_ms();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::vector<std::string> split_lines(const std::string& text);

std::string base64_encode(const std::string& input);

// Skips whitespace; stops at '=' or the first invalid character.
std::string base64_decode(const std::string& input);

// Wrap a value in single quotes for a POSIX shell: ' becomes '\''.
std::string shell_escape(const std::string& value);

// ── POSIX remote paths ──────────────────────────────────────

std::string posix_join(const std::string& base, const std::string& name);
std::string posix_dirname(const std::string& path);
std::string posix_basename(const std::string& path);

// Short random hex token for ids.
std::string random_token(size_t bytes = 6);
