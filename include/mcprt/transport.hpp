#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Contract
// ═══════════════════════════════════════════════════════════════════════════
// A duplex channel carrying one JSON-RPC message at a time. The protocol
// engine owns exactly one transport and installs its handlers before
// async_start(). Handlers are invoked on the transport's executor.
//
// Concrete transports:
//   InMemoryTransport  "mcprt/transport/in_memory_transport.hpp"
//   StdioTransport     "mcprt/transport/stdio_transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace mcprt {

using Json = nlohmann::json;

struct TransportError {
    enum class Category { Network, Closed, Protocol };

    Category category{};
    std::string message;
};

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

[[nodiscard]] inline TransportError make_transport_error(TransportError::Category category,
                                                         std::string message) {
    return TransportError{category, std::move(message)};
}

struct TransportHandlers {
    std::function<void(Json)> on_message;
    std::function<void(const TransportError&)> on_error;  ///< Informational, never fatal
    std::function<void()> on_close;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// May be called once; a second call fails.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    /// Fires on_close once; later calls do nothing.
    [[nodiscard]] virtual asio::awaitable<void> async_close() = 0;

    /// Set only by session-addressed transports.
    [[nodiscard]] virtual std::optional<std::string> session_id() const { return std::nullopt; }

    void set_handlers(TransportHandlers handlers) { handlers_ = std::move(handlers); }

    void clear_handlers() { handlers_ = {}; }

protected:
    // Each emit copies the handler first: a handler may replace or clear
    // the handler set while it runs.
    void emit_message(Json message) {
        auto handler = handlers_.on_message;
        if (handler) {
            handler(std::move(message));
        }
    }

    void emit_error(const TransportError& error) {
        auto handler = handlers_.on_error;
        if (handler) {
            handler(error);
        }
    }

    void emit_close() {
        auto handler = handlers_.on_close;
        if (handler) {
            handler();
        }
    }

private:
    TransportHandlers handlers_;
};

}  // namespace mcprt
