#pragma once

#include <cstdint>
#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
// Every remote round trip draws its budget from this catalog.
constexpr int CONNECT_TIMEOUT_MS          = 30000;     // TCP + handshake + auth
constexpr int CHANNEL_OPEN_TIMEOUT_MS     = 30000;     // exec / direct-tcpip channels
constexpr int CHANNEL_CLOSE_TIMEOUT_MS    = 5000;
constexpr int SFTP_OPEN_TIMEOUT_MS        = 30000;     // SFTP subsystem startup
constexpr int SFTP_OP_TIMEOUT_MS          = 30000;     // stat, readdir, read, write, ...
constexpr int SHELL_OPEN_TIMEOUT_MS       = 30000;     // channel + pty + shell request
constexpr int EXEC_DEFAULT_TIMEOUT_MS     = 60000;
constexpr int TOOL_PROBE_TIMEOUT_MS       = 15000;     // `command -v zip`
constexpr int REMOTE_ARCHIVE_TIMEOUT_MS   = 30 * 60 * 1000;  // remote zip/unzip of large trees
constexpr int EAGAIN_SLEEP_MS             = 10;
constexpr int SHELL_POLL_MS               = 50;

// ── Directory cache / cursors ───────────────────────────────
constexpr int64_t DIR_CACHE_TTL_MS        = 30000;
constexpr int64_t DIR_CURSOR_TTL_MS       = 30000;
constexpr int MAX_EMPTY_READDIR_ROUNDS    = 5;
constexpr int MAX_LIST_LIMIT              = 1000;
constexpr int DEFAULT_PAGE_LIMIT          = 200;
constexpr int READDIR_ROUND_ENTRIES       = 128;

// ── Terminal ────────────────────────────────────────────────
constexpr size_t MAX_OUTPUT_BUFFER_BYTES  = 1024 * 1024;
constexpr int DEFAULT_TERM_COLS           = 120;
constexpr int DEFAULT_TERM_ROWS           = 30;
constexpr const char* DEFAULT_TERM_TYPE   = "xterm-256color";

// ── Transfers ───────────────────────────────────────────────
constexpr int PROGRESS_THROTTLE_MS        = 200;
constexpr size_t TRANSFER_CHUNK_SIZE      = 32 * 1024;
constexpr const char* DEFAULT_REMOTE_TMP_DIR = ".hostlink-upload-tmp";

// ── Remote search ───────────────────────────────────────────
constexpr int SEARCH_RESULT_CAP           = 100;
constexpr int GLOB_MAX_DEPTH              = 5;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE           = 16384;
