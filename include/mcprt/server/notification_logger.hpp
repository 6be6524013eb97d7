#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// NotificationLogger - forwards log records to the client
// ═══════════════════════════════════════════════════════════════════════════
// Every record becomes a notifications/message sent through the server.
// Requires the logging capability; records below the level the client set
// through logging/setLevel are dropped by the server.
//
//   auto logger = std::make_unique<NotificationLogger>(server, executor, "my-server");
//   logger->info("indexing started");

#include "mcprt/log/logger.hpp"
#include "mcprt/protocol/mcp_types.hpp"

#include <asio/any_io_executor.hpp>

#include <optional>
#include <string>

namespace mcprt {

class Server;

/// Trace and Debug both map to "debug"; Fatal maps to "critical".
[[nodiscard]] LoggingLevel to_logging_level(LogLevel level) noexcept;

class NotificationLogger final : public ILogger {
public:
    /// `server` must outlive the logger.
    NotificationLogger(
        Server& server,
        asio::any_io_executor executor,
        std::optional<std::string> logger_name = std::nullopt,
        LogLevel min_level = LogLevel::Debug
    );

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_level(LogLevel level) noexcept { min_level_ = level; }

    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

private:
    Server& server_;
    asio::any_io_executor executor_;
    std::optional<std::string> logger_name_;
    LogLevel min_level_;
};

}  // namespace mcprt
