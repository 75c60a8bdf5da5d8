#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace fetchd::config {

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
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/**
 * Read a TOML file into "section.key" -> value. Only the subset the config file uses is
 * understood: [section] headers, key = value lines, quoted strings, # comments outside
 * quotes. Returns an empty map when the file cannot be opened.
 */
std::map<std::string, std::string> parse_toml_flat(const std::filesystem::path& path);

// Explicit override, then FETCHD_CONFIG, then $XDG_CONFIG_HOME/fetchd/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_CONFIG_HOME/fetchd or ~/.config/fetchd
std::filesystem::path get_config_dir();

/// $XDG_DATA_HOME/fetchd or ~/.local/share/fetchd
std::filesystem::path get_data_dir();

/// $XDG_CACHE_HOME/fetchd or ~/.cache/fetchd
std::filesystem::path get_cache_dir();

/// $XDG_DOWNLOAD_DIR or ~/Downloads
std::filesystem::path get_download_dir();

} // namespace fetchd::config
