#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escapes. BLUE is #3E78B2, AMBER #B07A1E.
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string AMBER     = "\033[38;2;176;122;30m";
    const std::string FAINT     = "\033[38;2;80;80;80m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// 44-wide box-drawing line
inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Banner: title + version + rule
inline std::string banner(const std::string& version) {
    return
        "\n" + color::BLUE + color::BOLD
        + "  MPC Dev Environment Daemon\n"
        + color::RESET + color::DIM + "  v" + version
        + color::RESET + "\n\n"
        + rule();
}

// Section header, blank line before and after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
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

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

// Progress line from a long wait, fainter than results
inline std::string log(const std::string& msg) {
    return color::FAINT + "    \xc2\xb7 " + msg + color::RESET + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<16}", key) + color::RESET + value + "\n";
}

// Usage row: command, argument placeholder, description
inline std::string usage_row(const std::string& cmd, const std::string& arg,
                             const std::string& desc) {
    std::string left = cmd + (arg.empty() ? "" : " " + arg);
    std::string pad = left.size() < 28 ? std::string(28 - left.size(), ' ') : " ";
    return color::BLUE + "    " + cmd + color::RESET
         + (arg.empty() ? "" : " " + color::AMBER + arg + color::RESET)
         + color::DIM + pad + desc + color::RESET + "\n";
}

} // namespace theme
