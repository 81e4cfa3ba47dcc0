#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::config {

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

// Flattened "section.key" -> raw (unquoted) value
using ConfigMap = std::map<std::string, std::string>;

// Parse a whole TOML-style file: [section] headers, key = value, '#' comments.
// Missing or unreadable files yield an empty map.
ConfigMap parse_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of strings: "a,b" or ["a", "b"]
std::vector<std::string> parse_list(const std::string& raw);

// Strict scalar parsing; std::nullopt when the whole string is not a valid value
std::optional<double> parse_double(std::string_view raw);
std::optional<long long> parse_integer(std::string_view raw);
std::optional<bool> parse_bool(std::string_view raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/recall or ~/.config/recall
std::filesystem::path get_config_dir();

// Get standard config path: override, else $RECALL_CONFIG, else <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace recall::config
