#pragma once

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rangeio::config {

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
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Time parsing; nullopt when `s` is not a non-negative integer
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Parse a value from TOML config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Every key of a TOML config file, keyed "section.key" (top-level keys keep their bare name).
// Returns nullopt when the file cannot be opened.
std::optional<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path);

// Config file location: override, $RANGEIO_CONFIG, $XDG_CONFIG_HOME/rangeio/config.toml,
// ~/.config/rangeio/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace rangeio::config
