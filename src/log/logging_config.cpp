#include "mcprt/log/logging_config.hpp"
#include "mcprt/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace mcprt {

namespace {

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

LogLevel level_from_env(const char* name, LogLevel fallback) {
    const std::string raw = get_env(name);
    if (raw.empty()) {
        return fallback;
    }
    const auto parsed = log_level_from_string(raw);
    if (!parsed) {
        std::cerr << "Invalid log level specified for " << name << ": \"" << raw
                  << "\". Defaulting to " << to_string(fallback) << ".\n";
        return fallback;
    }
    return *parsed;
}

}  // namespace

LoggingConfig LoggingConfig::from_env() {
    LoggingConfig config;
    config.console_level = level_from_env("LOG_LEVEL", LogLevel::Info);

    std::string enabled = get_env("LOG_FILE_ENABLED");
    std::transform(enabled.begin(), enabled.end(), enabled.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    config.file_enabled = (enabled == "true");

    config.file_path = get_env("LOG_FILE_PATH", "./app.log");
    config.file_level = level_from_env("LOG_FILE_LEVEL", LogLevel::Debug);
    return config;
}

std::unique_ptr<ILogger> make_logger(const LoggingConfig& config) {
    if (config.file_enabled == false) {
        return make_spdlog_stderr_logger(config.console_level);
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(SpdlogLogger::to_spdlog_level(config.console_level));
    console_sink->set_pattern("[%^%l%$] %Y-%m-%dT%H:%M:%S.%eZ %s:%# - %v");

    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    try {
        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file_path);
    } catch (const spdlog::spdlog_ex& e) {
        auto fallback = std::make_unique<SpdlogLogger>(
            std::vector<spdlog::sink_ptr>{console_sink}, config.console_level);
        fallback->logf(LogLevel::Error, "Failed to open log file '{}': {}. File logging disabled.",
                       config.file_path, e.what());
        return fallback;
    }
    file_sink->set_level(SpdlogLogger::to_spdlog_level(config.file_level));
    file_sink->set_pattern(
        R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","logger":"%n","message":"%v"})");

    const LogLevel lowest = std::min(config.console_level, config.file_level);
    auto logger = std::make_unique<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{console_sink, file_sink}, lowest);
    logger->logf(LogLevel::Info, "File logging enabled: level={}, path={}",
                 to_string(config.file_level), config.file_path);
    return logger;
}

}  // namespace mcprt
