#pragma once

#include <ferry/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::config {

// Section name -> (key -> raw value)
using TomlSections = std::map<std::string, std::map<std::string, std::string>>;

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
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Environment lookup; empty variables count as unset
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Parse a TOML subset: [section] headers, key = value pairs, '#' comments.
// Values are returned unquoted; arrays are kept verbatim for parse_list().
Result<TomlSections> parse_toml_file(const std::filesystem::path& path);

// Parse a comma- or TOML-array-separated list: "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

// Lenient scalar parsers; nullopt when the value does not parse.
std::optional<long long> parse_integer(std::string_view raw);
std::optional<double> parse_double(std::string_view raw);
std::optional<bool> parse_bool(std::string_view raw);

// Get standard config path
// $XDG_CONFIG_HOME/ferry/config.toml or ~/.config/ferry/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace ferry::config
