#include <snipvault/logging/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <system_error>
#include <vector>

namespace snipvault::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")
        return spdlog::level::trace;
    if (lowered == "debug")
        return spdlog::level::debug;
    if (lowered == "info")
        return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning")
        return spdlog::level::warn;
    if (lowered == "error" || lowered == "err")
        return spdlog::level::err;
    if (lowered == "critical")
        return spdlog::level::critical;
    if (lowered == "off")
        return spdlog::level::off;
    return std::nullopt;
}

Result<void> configureLogging(const LoggingConfig& config) {
    auto level = parseLevel(config.level);
    if (!level) {
        return Error{ErrorCode::InvalidArgument, "Unknown log level '" + config.level + "'"};
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.file.empty()) {
        std::error_code ec;
        if (config.file.has_parent_path()) {
            std::filesystem::create_directories(config.file.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::InvalidArgument, "Cannot create log directory " +
                                                             config.file.parent_path().string() +
                                                             ": " + ec.message()};
            }
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), config.maxFileSize, config.maxFiles));
        } catch (const spdlog::spdlog_ex& e) {
            return Error{ErrorCode::InvalidArgument,
                         "Cannot open log file " + config.file.string() + ": " + e.what()};
        }
    }

    auto logger = std::make_shared<spdlog::logger>(config.loggerName, sinks.begin(), sinks.end());
    logger->set_level(*level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(*level);
    spdlog::flush_on(spdlog::level::warn);

    if (!config.file.empty()) {
        spdlog::debug("Logging to {} (max {}MB x {} files)", config.file.string(),
                      config.maxFileSize / (1024 * 1024), config.maxFiles);
    }
    return {};
}

} // namespace snipvault::logging
