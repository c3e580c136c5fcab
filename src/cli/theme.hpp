#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

// Terminal styling for the keepsake shell and one-shot commands.
namespace theme {

// 24-bit palette: slate #4A7A96, amber #B07A2A
namespace color {
    const std::string BLUE      = "\033[38;2;74;122;150m";
    const std::string BROWN     = "\033[38;2;176;122;42m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string RED       = "\033[91m";
    const std::string FAINT     = "\033[38;2;80;80;80m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string paint(const std::string& code, const std::string& s) {
    return code + s + color::RESET;
}

inline std::string blue(const std::string& s)  { return paint(color::BLUE, s); }
inline std::string brown(const std::string& s) { return paint(color::BROWN, s); }
inline std::string red(const std::string& s)   { return paint(color::RED, s); }
inline std::string bold(const std::string& s)  { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)   { return paint(color::DIM, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line = "  ";
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";   // U+2500
    return dim(line) + "\n";
}

// Clears the screen before the REPL greeting
inline std::string banner() {
    return "\033[2J\033[H\n"
         + paint(color::BLUE + color::BOLD, "  Keepsake") + "\n"
         + dim(fmt::format("  v{}\n  Resumable folder backups", KEEPSAKE_VERSION)) + "\n\n"
         + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, "  " + title) + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status lines ────────────────────────────────────────

// "    + message" with the marker in `code`
inline std::string marked(const std::string& code, char marker, const std::string& msg) {
    return paint(code, fmt::format("    {} ", marker)) + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return marked(color::GREEN, '+', msg); }
inline std::string fail(const std::string& msg) { return marked(color::RED, 'x', msg); }
inline std::string info(const std::string& msg) { return marked(color::BLUE, '~', msg); }
inline std::string step(const std::string& msg) { return marked(color::BROWN, '>', msg); }

// Session log line, quieter than command output
inline std::string log(const std::string& msg) {
    return paint(color::FAINT, "    \xc2\xb7 " + msg) + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<12}", key)) + value + "\n";
}

// "[#########...........]  45%"
inline std::string progress_bar(int value, int total, int width = 30) {
    if (total <= 0) return dim("[" + std::string(width, '.') + "]");
    long long v = value < 0 ? 0 : (value > total ? total : value);
    int filled = static_cast<int>(v * width / total);
    int pct = static_cast<int>(v * 100 / total);
    return blue("[" + std::string(filled, '#')) + dim(std::string(width - filled, '.') + "]")
         + fmt::format(" {:>3}%", pct);
}

} // namespace theme
