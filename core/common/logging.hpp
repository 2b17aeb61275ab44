#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace linksim {

struct LoggingOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    std::string log_file;  // empty = no file sink
};

/// Install the "linksim" logger as the spdlog default logger.
/// Throws ConfigError if a sink cannot be created.
void setupLogging(const LoggingOptions& options);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
spdlog::level::level_enum parseLogLevel(const std::string& name);

} // namespace linksim
