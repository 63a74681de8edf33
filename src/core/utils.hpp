#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Lowercase hex SHA-256 of the input.
std::string sha256_hex(const std::string& input);

// Quote a word for a POSIX shell ('...' with embedded quotes escaped).
std::string shell_quote(const std::string& s);

// Join argv into one shell-safe command string.
std::string shell_join(const std::vector<std::string>& words);

// Join with single spaces, no quoting. For log lines only.
std::string join_words(const std::vector<std::string>& words);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
