#pragma once

#include <string>
#include <optional>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse "true/false/yes/no/1/0/on/off". Returns nullopt for anything else.
std::optional<bool> parse_bool(const std::string& s);

// Human readable byte count ("512 B", "1.4 KB", ...).
std::string format_bytes(long long bytes);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
