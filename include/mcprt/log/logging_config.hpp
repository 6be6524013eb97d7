#pragma once

#include "mcprt/log/logger.hpp"

#include <memory>
#include <string>

namespace mcprt {

// ─────────────────────────────────────────────────────────────────────────────
// Logging configuration
// ─────────────────────────────────────────────────────────────────────────────
// Environment variables read by from_env():
//   LOG_LEVEL         console level (default info)
//   LOG_FILE_ENABLED  "true" adds a JSON-lines file sink
//   LOG_FILE_PATH     file sink path (default ./app.log)
//   LOG_FILE_LEVEL    file sink level (default debug)

struct LoggingConfig {
    LogLevel console_level = LogLevel::Info;
    bool file_enabled = false;
    std::string file_path = "./app.log";
    LogLevel file_level = LogLevel::Debug;

    LoggingConfig& with_console_level(LogLevel level) {
        console_level = level;
        return *this;
    }

    LoggingConfig& with_file(std::string path, LogLevel level = LogLevel::Debug) {
        file_enabled = true;
        file_path = std::move(path);
        file_level = level;
        return *this;
    }

    /// Invalid level names produce a warning on stderr and keep the default.
    [[nodiscard]] static LoggingConfig from_env();
};

/// Build an spdlog-backed logger for `config`. If the file sink cannot be
/// opened, logs the failure and continues with the console sink only.
[[nodiscard]] std::unique_ptr<ILogger> make_logger(const LoggingConfig& config);

}  // namespace mcprt
