#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Expand a leading "~/" to the user's home directory.
std::filesystem::path expand_user(const std::string& path);

// Quote a single argument for display in a shell-like command line.
std::string shell_quote(const std::string& arg);

// Join arguments with spaces, quoting where needed.
std::string join_command(const std::vector<std::string>& argv);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
