#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (...) {
        return fallback;
    }
}

std::optional<bool> parse_bool(const std::string& s) {
    std::string v = s;
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    return std::nullopt;
}

std::string format_bytes(long long bytes) {
    if (bytes < 0) return "?";
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double v = bytes / 1024.0;
    if (v < 1024.0) return fmt::format("{:.1f} KB", v);
    v /= 1024.0;
    if (v < 1024.0) return fmt::format("{:.1f} MB", v);
    return fmt::format("{:.1f} GB", v / 1024.0);
}
