#pragma once

#include <snipvault/core/types.h>
#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace snipvault::logging {

struct LoggingConfig {
    std::string level = "info";
    // Empty means console only
    std::filesystem::path file;
    std::size_t maxFileSize = 10 * 1024 * 1024;
    std::size_t maxFiles = 5;
    std::string loggerName = "snipvault";
};

// trace, debug, info, warn/warning, error/err, critical, off
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

/**
 * @brief Install the default logger
 *
 * Always logs to a colored stdout sink; adds a rotating file sink when
 * config.file is set. An unknown level is rejected before any sink changes.
 */
Result<void> configureLogging(const LoggingConfig& config);

} // namespace snipvault::logging
