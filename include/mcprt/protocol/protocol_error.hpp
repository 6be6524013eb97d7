#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Errors
// ═══════════════════════════════════════════════════════════════════════════
// ProtocolError is the failure half of every awaitable the engine returns.
// Programmer mistakes (registering a request handler twice, asserting a
// capability that was never negotiated) throw UsageError instead.

#include "mcprt/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mcprt {

enum class ProtocolErrorCode {
    NotConnected,        ///< No transport attached
    AlreadyConnected,    ///< connect() called on an engine that was already connected
    TransportError,      ///< Transport failed to start or send
    ProtocolError,       ///< Malformed traffic from the peer
    RpcError,            ///< Peer answered with an error object
    Timeout,             ///< Request timed out (rpc_error code -32001)
    ConnectionClosed,    ///< Transport closed while pending (rpc_error code -32000)
    Cancelled,           ///< Caller cancelled; reason in cancel_reason
    InvalidResult,       ///< Result failed the caller's validator
    UnsupportedVersion   ///< Handshake returned a version we do not speak
};

[[nodiscard]] constexpr std::string_view to_string(ProtocolErrorCode code) noexcept {
    switch (code) {
        case ProtocolErrorCode::NotConnected:       return "NotConnected";
        case ProtocolErrorCode::AlreadyConnected:   return "AlreadyConnected";
        case ProtocolErrorCode::TransportError:     return "TransportError";
        case ProtocolErrorCode::ProtocolError:      return "ProtocolError";
        case ProtocolErrorCode::RpcError:           return "RpcError";
        case ProtocolErrorCode::Timeout:            return "Timeout";
        case ProtocolErrorCode::ConnectionClosed:   return "ConnectionClosed";
        case ProtocolErrorCode::Cancelled:          return "Cancelled";
        case ProtocolErrorCode::InvalidResult:      return "InvalidResult";
        case ProtocolErrorCode::UnsupportedVersion: return "UnsupportedVersion";
    }
    return "Unknown";
}

struct ProtocolError {
    ProtocolErrorCode code{ProtocolErrorCode::ProtocolError};
    std::string message;
    std::optional<McpError> rpc_error;    ///< Wire error, received or synthesized
    std::optional<Json> cancel_reason;    ///< Exactly what the caller passed to cancel()

    /// Wire code when one exists.
    [[nodiscard]] std::optional<int> rpc_code() const noexcept {
        if (rpc_error) {
            return rpc_error->code;
        }
        return std::nullopt;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ProtocolError not_connected() {
        return {ProtocolErrorCode::NotConnected, "Not connected", std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ProtocolError already_connected() {
        return {ProtocolErrorCode::AlreadyConnected,
                "Protocol engine is already connected to a transport", std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ProtocolError transport_error(std::string msg) {
        return {ProtocolErrorCode::TransportError, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ProtocolError protocol_error(std::string msg) {
        return {ProtocolErrorCode::ProtocolError, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ProtocolError from_rpc_error(McpError err) {
        std::string msg = err.message;
        return {ProtocolErrorCode::RpcError, std::move(msg), std::move(err), std::nullopt};
    }

    [[nodiscard]] static ProtocolError request_timeout(std::int64_t timeout_ms) {
        return {ProtocolErrorCode::Timeout, "Request timed out",
                McpError{ErrorCode::RequestTimeout, "Request timed out", Json{{"timeout", timeout_ms}}},
                std::nullopt};
    }

    [[nodiscard]] static ProtocolError max_total_timeout_exceeded(std::int64_t max_total_ms,
                                                                  std::int64_t elapsed_ms) {
        return {ProtocolErrorCode::Timeout, "Maximum total timeout exceeded",
                McpError{ErrorCode::RequestTimeout, "Maximum total timeout exceeded",
                         Json{{"maxTotalTimeout", max_total_ms}, {"totalElapsed", elapsed_ms}}},
                std::nullopt};
    }

    [[nodiscard]] static ProtocolError connection_closed() {
        return {ProtocolErrorCode::ConnectionClosed, "Connection closed",
                McpError{ErrorCode::ConnectionClosed, "Connection closed", std::nullopt},
                std::nullopt};
    }

    [[nodiscard]] static ProtocolError cancelled(Json reason) {
        return {ProtocolErrorCode::Cancelled, "Request was cancelled", std::nullopt, std::move(reason)};
    }

    [[nodiscard]] static ProtocolError invalid_result(std::string msg) {
        return {ProtocolErrorCode::InvalidResult, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ProtocolError unsupported_version(const std::string& version) {
        return {ProtocolErrorCode::UnsupportedVersion,
                "Server's protocol version is not supported: " + version, std::nullopt, std::nullopt};
    }
};

template <typename T>
using ProtocolResult = tl::expected<T, ProtocolError>;

// ═══════════════════════════════════════════════════════════════════════════
// Exceptions
// ═══════════════════════════════════════════════════════════════════════════

/// Thrown for API misuse; never produced by peer behaviour.
class UsageError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// A method was used (or a handler registered) without the capability that
/// gates it.
class CapabilityError : public UsageError {
public:
    using UsageError::UsageError;
};

/// Thrown by request handlers to pick the wire error code. Any other
/// exception escaping a handler is reported as InternalError.
class McpException : public std::runtime_error {
public:
    McpException(int code, const std::string& message, std::optional<Json> data = std::nullopt)
        : std::runtime_error(message)
        , code_(code)
        , data_(std::move(data))
    {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] const std::optional<Json>& data() const noexcept { return data_; }

    [[nodiscard]] McpError to_error() const {
        return McpError{code_, what(), data_};
    }

private:
    int code_;
    std::optional<Json> data_;
};

}  // namespace mcprt
