#include "common/logging.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace linksim {

void setupLogging(const LoggingOptions& options) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (options.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (!options.log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                options.log_file, true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("linksim", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(options.level);
    } catch (const spdlog::spdlog_ex& ex) {
        throw ConfigError(std::string("Logger initialization failed: ") + ex.what());
    }
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    std::string key = toLower(name);
    // from_str maps unknown names to off.
    spdlog::level::level_enum level = spdlog::level::from_str(key);
    if (level == spdlog::level::off && key != "off") {
        throw ConfigError("Unknown log level: " + name);
    }
    return level;
}

} // namespace linksim
