#include "terminal.hpp"

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <sys/ioctl.h>
#  include <termios.h>
#  include <unistd.h>
#  include <poll.h>
#  include <signal.h>
#endif

namespace platform {

#ifdef _WIN32

TermSize term_size() {
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi)) {
        return {csbi.srWindow.Right - csbi.srWindow.Left + 1,
                csbi.srWindow.Bottom - csbi.srWindow.Top + 1};
    }
    return {80, 24};
}

bool stdin_is_tty() {
    return _isatty(_fileno(stdin)) != 0;
}

RawModeGuard::RawModeGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    DWORD mode = old_mode_ & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT);
    SetConsoleMode(h, mode | ENABLE_VIRTUAL_TERMINAL_INPUT);
}

RawModeGuard::~RawModeGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

bool poll_stdin(int timeout_ms) {
    return WaitForSingleObject(GetStdHandle(STD_INPUT_HANDLE), timeout_ms) == WAIT_OBJECT_0;
}

int read_stdin(char* buf, int len) {
    DWORD n = 0;
    if (!ReadFile(GetStdHandle(STD_INPUT_HANDLE), buf, static_cast<DWORD>(len), &n, nullptr)) {
        return 0;
    }
    return static_cast<int>(n);
}

// Console resize events arrive through ReadConsoleInput; the shell loop
// compares term_size() instead.
void watch_resize() {}
void unwatch_resize() {}
bool take_resize() { return false; }

#else

TermSize term_size() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return {ws.ws_col, ws.ws_row};
    }
    return {80, 24};
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) != 0;
}

struct RawModeGuard::Impl {
    struct termios saved;
    bool active = false;
};

RawModeGuard::RawModeGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->saved) != 0) return;
    struct termios raw = impl_->saved;
    cfmakeraw(&raw);
    impl_->active = tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0;
}

RawModeGuard::~RawModeGuard() {
    if (impl_->active) tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->saved);
    delete impl_;
}

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

int read_stdin(char* buf, int len) {
    ssize_t n = ::read(STDIN_FILENO, buf, static_cast<size_t>(len));
    return n > 0 ? static_cast<int>(n) : 0;
}

static volatile sig_atomic_t g_resized = 0;
static struct sigaction g_prev_winch;

static void on_sigwinch(int) {
    g_resized = 1;
}

void watch_resize() {
    struct sigaction sa;
    sa.sa_handler = on_sigwinch;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGWINCH, &sa, &g_prev_winch);
}

void unwatch_resize() {
    sigaction(SIGWINCH, &g_prev_winch, nullptr);
}

bool take_resize() {
    if (!g_resized) return false;
    g_resized = 0;
    return true;
}

#endif

} // namespace platform
