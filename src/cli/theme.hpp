#pragma once

#include <string>

namespace theme {

namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string SAND      = "\033[38;2;233;196;106m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string teal(const std::string& s)   { return color::TEAL + s + color::RESET; }
inline std::string sand(const std::string& s)   { return color::SAND + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + color::SAND + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status lines ────────────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SAND + "    > " + color::RESET + msg + "\n";
}

} // namespace theme
