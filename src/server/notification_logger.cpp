#include "mcprt/server/notification_logger.hpp"
#include "mcprt/server/server.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

#include <iostream>

namespace mcprt {

LoggingLevel to_logging_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug: return LoggingLevel::Debug;
        case LogLevel::Info:  return LoggingLevel::Info;
        case LogLevel::Warn:  return LoggingLevel::Warning;
        case LogLevel::Error: return LoggingLevel::Error;
        case LogLevel::Fatal: return LoggingLevel::Critical;
        case LogLevel::Off:   return LoggingLevel::Emergency;
    }
    return LoggingLevel::Info;
}

NotificationLogger::NotificationLogger(
    Server& server,
    asio::any_io_executor executor,
    std::optional<std::string> logger_name,
    LogLevel min_level
)
    : server_(server)
    , executor_(std::move(executor))
    , logger_name_(std::move(logger_name))
    , min_level_(min_level)
{}

bool NotificationLogger::should_log(LogLevel level) const noexcept {
    if (level == LogLevel::Off) {
        return false;
    }
    if (static_cast<std::uint8_t>(level) < static_cast<std::uint8_t>(min_level_)) {
        return false;
    }
    return server_.is_connected() && server_.capabilities().has(CapabilityKey::Logging);
}

void NotificationLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    LoggingMessageNotification message;
    message.level = to_logging_level(record.level);
    message.logger = logger_name_;
    message.data = record.message;

    // Failures go straight to stderr: this logger may be the global one.
    asio::co_spawn(
        executor_,
        [&server = server_, message = std::move(message)]() mutable -> asio::awaitable<void> {
            auto sent = co_await server.send_logging_message(std::move(message));
            if (!sent) {
                std::cerr << "[ERROR] Failed to forward log record: " << sent.error().message << '\n';
            }
        },
        asio::detached
    );
}

}  // namespace mcprt
