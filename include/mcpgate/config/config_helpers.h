#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mcpgate::config {

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

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            if (path[1] == '/')
                return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v)
        return std::string(v);
    return std::nullopt;
}

// Accepts true/false, yes/no, on/off, 1/0 (case-insensitive)
std::optional<bool> parse_bool(std::string_view raw);

// Parse a value from a TOML config file. Returns empty when the file, section or key is
// missing. Supports "[section] key = value" and "section.key = value" forms.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Config file: override, else $MCPGATE_CONFIG, else $XDG_CONFIG_HOME/mcpgate/config.toml,
/// else ~/.config/mcpgate/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory
/// $XDG_DATA_HOME/mcpgate or ~/.local/share/mcpgate
std::filesystem::path get_data_dir();

// Resolution order: env -> config -> defaults
std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path);
std::filesystem::path resolve_runtime_bin_dir_from_config(const std::filesystem::path& config_path,
                                                          const std::filesystem::path& data_dir);

} // namespace mcpgate::config
