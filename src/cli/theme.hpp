#pragma once

#include <string>
#include <fmt/format.h>

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

inline std::string paint(const std::string& code, const std::string& s) {
    return code + s + color::RESET;
}

inline std::string dim(const std::string& s)   { return paint(color::DIM, s); }
inline std::string green(const std::string& s) { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)   { return paint(color::RED, s); }

// Indented horizontal rule of `width` box-drawing dashes.
inline std::string rule(int width = 44) {
    std::string line;
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";
    return "  " + dim(line) + "\n";
}

inline std::string banner() {
    return "\n  " + paint(color::BLUE + color::BOLD, "ktun") + "\n"
         + "  " + dim("SSH tunnels and kubeconfigs for Kubernetes profiles") + "\n\n"
         + rule();
}

inline std::string section(const std::string& title) {
    return "\n  " + paint(color::BROWN + color::BOLD, title) + "\n\n";
}

// ── Status lines: "    <mark> message" ──────────────────

inline std::string status_line(const std::string& code, const char* mark, const std::string& msg) {
    return fmt::format("    {} {}\n", paint(code, mark), msg);
}

inline std::string ok(const std::string& msg)   { return status_line(color::GREEN, "+", msg); }
inline std::string fail(const std::string& msg) { return status_line(color::RED, "x", msg); }
inline std::string info(const std::string& msg) { return status_line(color::BLUE, "~", msg); }
inline std::string step(const std::string& msg) { return status_line(color::BROWN, ">", msg); }

// Progress from managers; fainter than command output.
inline std::string log(const std::string& msg) {
    return paint(color::FAINT, "    \xc2\xb7 " + msg) + "\n";
}

// "key       value" row under a status line.
inline std::string kv(const std::string& key, const std::string& value) {
    return "    " + dim(fmt::format("{:<10}", key)) + value + "\n";
}

} // namespace theme
