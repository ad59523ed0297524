#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Just the horizontal line (no extra spacing; callers control gaps)
inline std::string rule() {
    return color::DIM + "  \xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80" + color::RESET + "\n";
}

// Banner: clears screen, then title + rule
inline std::string banner(const std::string& version) {
    return
        "\033[2J\033[H\n"
        + color::BLUE + color::BOLD
        + "  Delta Node Pool\n"
        + color::RESET + color::DIM + "  v" + version + "\n"
        + "  deploy, run and watch remote nodes"
        + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// Divider: blank line, rule, blank line
inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string check(const std::string& msg) {
    return color::GREEN + "    \xe2\x9c\x93 " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// Boolean flag rendered as a colored yes/no
inline std::string flag(bool value) {
    return value ? green("yes") : dim("no");
}

} // namespace theme
