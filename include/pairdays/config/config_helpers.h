#pragma once

#include <pairdays/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pairdays::config {

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

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
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

// Tilde expansion for "~" and "~/..."; "~user" forms are returned unchanged
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }
    if (path.size() <= 2) {
        return std::filesystem::path(home);
    }
    return std::filesystem::path(home) / path.substr(2);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "1/true/yes/on" and "0/false/no/off", case-insensitive
std::optional<bool> parse_bool(std::string_view value);

// Single-character delimiter; accepts the escapes "\t" and "tab"
Result<char> parse_delimiter(std::string_view value);

// Flatten a TOML-subset file into "section.key" -> value. Missing file yields an empty map.
std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path);

/// Returns the user config directory: $XDG_CONFIG_HOME/pairdays or ~/.config/pairdays
std::filesystem::path get_config_dir();

// Resolution order: override > PAIRDAYS_CONFIG > get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace pairdays::config
