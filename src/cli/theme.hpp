#pragma once

#include <string>
#include <unistd.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string RESET     = "\033[0m";
}

// Colors are only worth it on a terminal
inline bool use_color() { return isatty(STDERR_FILENO) != 0; }

inline std::string paint(const std::string& code, const std::string& s) {
    return use_color() ? code + s + color::RESET : s;
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "x ") + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return paint(color::BROWN, "> ") + msg + "\n";
}

} // namespace theme
