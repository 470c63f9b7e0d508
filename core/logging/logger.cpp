#include "logging/logger.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace atdd {

LoggerPtr makeLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.file_path, false));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("Cannot open log file " + config.file_path + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->set_pattern(config.pattern);
    // Warnings and errors reach the file immediately.
    logger->flush_on(spdlog::level::warn);
    return logger;
}

LoggerPtr nullLogger() {
    static LoggerPtr instance = std::make_shared<spdlog::logger>(
        "atdd-null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return instance;
}

} // namespace atdd
