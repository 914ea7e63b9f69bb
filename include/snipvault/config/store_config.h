#pragma once

#include <snipvault/core/types.h>
#include <snipvault/logging/logging.h>

#include <filesystem>
#include <string>

namespace snipvault::config {

struct StoreConfig {
    // [store]
    std::filesystem::path databasePath;
    int busyTimeoutMs = 5000;
    bool enableWal = true;

    // [crypto]
    std::filesystem::path keyFile;

    // [logging]
    logging::LoggingConfig logging;
};

// Database and key file under get_data_dir(), console logging at info
StoreConfig defaultStoreConfig();

/**
 * @brief Load configuration from a TOML-style file
 *
 * A missing file yields the defaults. Values that fail to parse are
 * reported as InvalidArgument naming the offending key.
 */
Result<StoreConfig> loadStoreConfig(const std::filesystem::path& configPath);

// SNIPVAULT_DB_PATH, SNIPVAULT_KEY_FILE and SNIPVAULT_LOG_LEVEL win over the file
void applyEnvironmentOverrides(StoreConfig& config);

// get_config_path() followed by the environment overrides
Result<StoreConfig> resolveStoreConfig(const std::string& overridePath = "");

} // namespace snipvault::config
