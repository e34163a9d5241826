// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace namesmith::config {

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

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// "true/false", "yes/no", "on/off", "1/0" (case-insensitive); nullopt for anything else.
std::optional<bool> parse_bool(std::string_view value);

/**
 * Parse a simple TOML file into a flat key-value map.
 *
 * Supports [section] headers (flattened as "section.key"), key = value assignments with
 * single- or double-quoted strings, and # comments outside quotes. Nested tables, arrays and
 * multi-line strings are not supported. A missing file yields an empty map.
 */
std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path);

/**
 * Config file location, first hit wins:
 *  1. override_path when non-empty
 *  2. NAMESMITH_CONFIG environment variable
 *  3. $XDG_CONFIG_HOME/namesmith/config.toml
 *  4. $HOME/.config/namesmith/config.toml
 * The returned path may not exist.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace namesmith::config
