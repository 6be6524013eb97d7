// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcprt/log/logging_config.hpp"
#include "mcprt/log/spdlog_logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace mcprt;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
}

}  // namespace

TEST_CASE("SpdlogLogger respects its minimum level", "[log][spdlog]") {
    auto logger = make_spdlog_stderr_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->level() == LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
}

TEST_CASE("SpdlogLogger adopts the level of a wrapped logger", "[log][spdlog]") {
    auto inner = std::make_shared<spdlog::logger>(
        "wrapped_for_test", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    inner->set_level(spdlog::level::err);

    SpdlogLogger logger(inner);
    REQUIRE(logger.level() == LogLevel::Error);
    REQUIRE(logger.get_spdlog_logger() == inner);
}

TEST_CASE("SpdlogLogger level conversion", "[log][spdlog]") {
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Warn) == spdlog::level::warn);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::err) == LogLevel::Error);
}

TEST_CASE("File logger writes one JSON object per line", "[log][spdlog][file]") {
    const std::string path = "mcprt_spdlog_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_spdlog_file_logger(path, LogLevel::Info);
        logger->debug("not written");
        logger->info("written");
        logger->flush();
    }

    const std::string content = read_file(path);
    REQUIRE(content.find("not written") == std::string::npos);

    std::istringstream lines(content);
    std::string line;
    REQUIRE(std::getline(lines, line));
    const auto record = nlohmann::json::parse(line);
    REQUIRE(record["level"] == "info");
    REQUIRE(record["message"] == "written");
    REQUIRE(record.contains("timestamp"));

    std::filesystem::remove(path);
}

TEST_CASE("make_logger applies per-sink levels", "[log][spdlog][config]") {
    const std::string path = "mcprt_make_logger_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_logger(LoggingConfig{}
            .with_console_level(LogLevel::Error)
            .with_file(path, LogLevel::Debug));

        REQUIRE(logger->should_log(LogLevel::Debug));
        logger->debug("debug record");
        logger->trace("trace record");
        static_cast<SpdlogLogger*>(logger.get())->flush();
    }

    const std::string content = read_file(path);
    REQUIRE(content.find("debug record") != std::string::npos);
    REQUIRE(content.find("trace record") == std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("make_logger without a file sink logs to stderr only", "[log][spdlog][config]") {
    auto logger = make_logger(LoggingConfig{}.with_console_level(LogLevel::Warn));

    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
}
