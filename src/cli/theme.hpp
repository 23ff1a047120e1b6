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
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Global switch, decided once at startup from the color mode
inline bool colors_on = true;

inline void set_color_enabled(bool on) { colors_on = on; }
inline bool color_enabled() { return colors_on; }

// code if colors are on, "" otherwise
inline std::string esc(const std::string& code) {
    return colors_on ? code : std::string();
}

inline std::string paint(const std::string& code, const std::string& s) {
    return colors_on ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string blue(const std::string& s)   { return paint(color::BLUE, s); }
inline std::string bold(const std::string& s)   { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }
inline std::string green(const std::string& s)  { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)    { return paint(color::RED, s); }
inline std::string yellow(const std::string& s) { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + esc(color::BROWN) + esc(color::BOLD) + "  " + title + esc(color::RESET) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return esc(color::GREEN) + "    + " + esc(color::RESET) + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return esc(color::RED) + "    x " + esc(color::RESET) + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return esc(color::YELLOW) + "    ! " + esc(color::RESET) + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return esc(color::BLUE) + "    ~ " + esc(color::RESET) + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return esc(color::BROWN) + "    > " + esc(color::RESET) + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    if (!colors_on) return "    \xc2\xb7 " + msg + "\n";
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for summaries
inline std::string kv(const std::string& key, const std::string& value) {
    return esc(color::DIM) + fmt::format("    {:<12}", key) + esc(color::RESET) + value + "\n";
}

} // namespace theme
