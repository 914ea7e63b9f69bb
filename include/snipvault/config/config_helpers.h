#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace snipvault::config {

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// "~" and "~/x" resolve against $HOME; anything else is returned unchanged
std::filesystem::path expand_tilde(const std::string& path);

/**
 * @brief Flat view of a TOML-style file, keyed by "section.key"
 *
 * Only the subset the store needs is understood: [section] headers,
 * key = value lines, quoted strings and trailing # comments. Keys written
 * as "section.key" at top level land under the same name.
 */
using ConfigValues = std::map<std::string, std::string>;

ConfigValues parse_config_file(const std::filesystem::path& config_path);

// Single lookup; empty when the file, section or key is missing
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

std::optional<bool> parse_bool(std::string_view value);
std::optional<int> parse_int(std::string_view value);

// $SNIPVAULT_CONFIG, then $XDG_CONFIG_HOME/snipvault/config.toml, then ~/.config/snipvault
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Unix: $XDG_CONFIG_HOME/snipvault or ~/.config/snipvault
std::filesystem::path get_config_dir();

/// Unix: $XDG_DATA_HOME/snipvault or ~/.local/share/snipvault
std::filesystem::path get_data_dir();

} // namespace snipvault::config
