#include <snipvault/config/config_helpers.h>
#include <snipvault/config/store_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace snipvault::config {

namespace {

const std::string* lookup(const ConfigValues& values, const char* key) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

StoreConfig defaultStoreConfig() {
    StoreConfig config;
    const auto dataDir = get_data_dir();
    config.databasePath = dataDir / "snipvault.db";
    config.keyFile = dataDir / "content.key";
    return config;
}

Result<StoreConfig> loadStoreConfig(const std::filesystem::path& configPath) {
    StoreConfig config = defaultStoreConfig();

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        spdlog::debug("No config file at {}, using defaults", configPath.string());
        return config;
    }

    const auto values = parse_config_file(configPath);

    if (auto* v = lookup(values, "store.database_path")) {
        config.databasePath = expand_tilde(*v);
    }
    if (auto* v = lookup(values, "store.busy_timeout_ms")) {
        auto parsed = parse_int(*v);
        if (!parsed || *parsed < 0) {
            return Error{ErrorCode::InvalidArgument,
                         "store.busy_timeout_ms must be a non-negative integer, got '" + *v + "'"};
        }
        config.busyTimeoutMs = *parsed;
    }
    if (auto* v = lookup(values, "store.enable_wal")) {
        auto parsed = parse_bool(*v);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument,
                         "store.enable_wal must be true or false, got '" + *v + "'"};
        }
        config.enableWal = *parsed;
    }
    if (auto* v = lookup(values, "crypto.key_file")) {
        config.keyFile = expand_tilde(*v);
    }
    if (auto* v = lookup(values, "logging.level")) {
        if (!logging::parseLevel(*v)) {
            return Error{ErrorCode::InvalidArgument, "logging.level '" + *v + "' is not known"};
        }
        config.logging.level = *v;
    }
    if (auto* v = lookup(values, "logging.file")) {
        config.logging.file = expand_tilde(*v);
    }

    return config;
}

void applyEnvironmentOverrides(StoreConfig& config) {
    if (const char* v = env_value("SNIPVAULT_DB_PATH")) {
        config.databasePath = expand_tilde(v);
    }
    if (const char* v = env_value("SNIPVAULT_KEY_FILE")) {
        config.keyFile = expand_tilde(v);
    }
    if (const char* v = env_value("SNIPVAULT_LOG_LEVEL")) {
        if (logging::parseLevel(v)) {
            config.logging.level = v;
        } else {
            spdlog::warn("Ignoring SNIPVAULT_LOG_LEVEL='{}'", v);
        }
    }
}

Result<StoreConfig> resolveStoreConfig(const std::string& overridePath) {
    auto loaded = loadStoreConfig(get_config_path(overridePath));
    if (!loaded) {
        return loaded.error();
    }
    StoreConfig config = std::move(loaded).value();
    applyEnvironmentOverrides(config);
    return config;
}

} // namespace snipvault::config
