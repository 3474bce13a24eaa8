#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace regdoc::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from a TOML config file. Accepts both `[section] key = v` and
// `section.key = v`. Returns an empty string when the key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Config file location: override, then REGDOC_CONFIG, then
/// $XDG_CONFIG_HOME/regdoc/config.toml or ~/.config/regdoc/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Default data directory: $XDG_DATA_HOME/regdoc or ~/.local/share/regdoc
std::filesystem::path get_data_dir();

// Data directory resolution (env → config → defaults)
std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path);

} // namespace regdoc::config
