#pragma once

namespace platform {

struct TermSize {
    int cols;
    int rows;
};

// Size of the controlling terminal, or 80x24 when stdout is not a tty.
TermSize term_size();

bool stdin_is_tty();

// Puts stdin into raw mode for the lifetime of the guard so keystrokes
// (including Ctrl-C) reach the remote shell untouched.
class RawModeGuard {
public:
    RawModeGuard();
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// True if stdin becomes readable within timeout_ms.
bool poll_stdin(int timeout_ms);

// Raw read from stdin; returns bytes read, 0 at end of input.
int read_stdin(char* buf, int len);

// Track window-size changes. take_resize() returns true once per change.
void watch_resize();
void unwatch_resize();
bool take_resize();

} // namespace platform
