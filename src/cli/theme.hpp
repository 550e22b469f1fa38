#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string TEAL      = "\033[38;2;0;128;128m";
    const std::string AMBER     = "\033[38;2;214;140;30m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::TEAL + color::BOLD + "  mcpcore server\n"
        + color::RESET + color::DIM + "  v" + MCPCORE_VERSION
        + color::RESET + "\n\n" + rule();
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

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

// One usage line: command, optional argument hint, description
inline std::string usage(const std::string& cmd, const std::string& args, const std::string& desc) {
    std::string left = cmd + (args.empty() ? "" : " " + args);
    return color::TEAL + fmt::format("    {:<44}", left) + color::RESET
        + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
