#pragma once

#include <string>
#include <fmt/format.h>

// Output styling for the lines rzterm prints itself, before the remote shell
// takes the screen and after it gives it back. Nothing here is used while
// the terminal is in raw mode.
namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string FAINT     = "\033[38;2;80;80;80m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)  { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line = color::DIM + "  ";
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";   // U+2500
    return line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD + "  rzterm" + color::RESET
         + color::DIM + "  v0.1.0  ssh with rz/sz passthrough" + color::RESET + "\n"
         + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// "    rzterm exec <host> <cmd>     Run one command"
inline std::string usage_row(const std::string& command, const std::string& args,
                             const std::string& what) {
    return color::BLUE + "    rzterm " + command + color::RESET + " "
         + color::BROWN + fmt::format("{:<{}}", args, 22 - static_cast<int>(command.size()))
         + color::RESET + dim(what) + "\n";
}

// ── Status lines ────────────────────────────────────────

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
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Pointer to the debug log and similar asides
inline std::string aside(const std::string& msg) {
    return color::FAINT + "    \xc2\xb7 " + msg + color::RESET + "\n";
}

// Host listing row
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
