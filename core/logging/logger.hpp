#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace atdd {

struct LoggingConfig {
    std::string name = "atdd";
    std::string level = "info";          // trace|debug|info|warn|error|critical|off
    std::string pattern = "%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v";
    std::string file_path;               // empty = console only
    bool console = true;
};

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/// Build a logger from configuration. The logger is NOT registered in the
/// spdlog global registry; callers hand it to each component explicitly.
LoggerPtr makeLogger(const LoggingConfig& config);

/// Shared logger that discards everything. Used when a component is
/// constructed without a logger.
LoggerPtr nullLogger();

/// Returns `logger` when set, otherwise the null logger.
inline LoggerPtr orNull(LoggerPtr logger) {
    return logger ? std::move(logger) : nullLogger();
}

} // namespace atdd
