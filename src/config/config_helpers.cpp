#include <snipvault/config/config_helpers.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace snipvault::config {

namespace {

std::filesystem::path home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home);
    }
    return {};
}

std::string strip_inline_comment(std::string value) {
    // A '#' inside a quoted string is part of the value
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            value.erase(i);
            break;
        }
    }
    trim(value);
    return value;
}

} // namespace

std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user is not supported
        return path;
    }
    auto home = home_dir();
    if (home.empty()) {
        return path;
    }
    return path.size() > 2 ? home / path.substr(2) : home;
}

ConfigValues parse_config_file(const std::filesystem::path& config_path) {
    ConfigValues values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        trim(key);
        if (key.empty()) {
            continue;
        }
        std::string value = unquote(strip_inline_comment(line.substr(eq + 1)));

        if (currentSection.empty() || key.find('.') != std::string::npos) {
            values[key] = std::move(value);
        } else {
            values[currentSection + "." + key] = std::move(value);
        }
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    const auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it != values.end() ? it->second : std::string{};
}

std::optional<bool> parse_bool(std::string_view value) {
    std::string lowered(value);
    trim(lowered);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on")
        return true;
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off")
        return false;
    return std::nullopt;
}

std::optional<int> parse_int(std::string_view value) {
    std::string text(value);
    trim(text);
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return parsed;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "snipvault";
    }
    if (auto home = home_dir(); !home.empty()) {
        return home / ".config" / "snipvault";
    }
    return std::filesystem::current_path() / ".snipvault";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "snipvault";
    }
    if (auto home = home_dir(); !home.empty()) {
        return home / ".local" / "share" / "snipvault";
    }
    return std::filesystem::current_path() / "snipvault_data";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("SNIPVAULT_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace snipvault::config
