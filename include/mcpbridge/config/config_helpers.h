#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Time parsing
inline std::chrono::milliseconds parse_ms(std::string_view s) {
    try {
        return std::chrono::milliseconds(std::stol(std::string(s)));
    } catch (const std::exception&) {
        return std::chrono::milliseconds(0);
    }
}

// Environment lookup; empty values count as unset
inline std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) {
        return std::nullopt;
    }
    return std::string(v);
}

inline std::string env_or(const char* name, std::string fallback) {
    if (auto v = env_value(name)) {
        return *v;
    }
    return fallback;
}

// Comma separated list; entries are trimmed and empty entries dropped
inline std::vector<std::string> split_csv(std::string_view raw) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= raw.size()) {
        auto comma = raw.find(',', start);
        if (comma == std::string_view::npos) {
            comma = raw.size();
        }
        std::string item(raw.substr(start, comma - start));
        trim(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        start = comma + 1;
    }
    return out;
}

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/mcpbridge or ~/.config/mcpbridge
std::filesystem::path get_config_dir();

} // namespace mcpbridge::config
