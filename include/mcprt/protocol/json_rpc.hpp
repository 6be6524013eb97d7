#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace mcprt {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ═══════════════════════════════════════════════════════════════════════════
// Error codes
// ═══════════════════════════════════════════════════════════════════════════

namespace ErrorCode {
    // Standard JSON-RPC
    inline constexpr int ParseError     = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams  = -32602;
    inline constexpr int InternalError  = -32603;

    // Synthesized locally by the protocol engine
    inline constexpr int ConnectionClosed = -32000;
    inline constexpr int RequestTimeout   = -32001;
}  // namespace ErrorCode

// ═══════════════════════════════════════════════════════════════════════════
// Shape errors
// ═══════════════════════════════════════════════════════════════════════════

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        InvalidShape,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ═══════════════════════════════════════════════════════════════════════════
// Identifiers
// ═══════════════════════════════════════════════════════════════════════════

struct RequestId {
    std::variant<std::int64_t, std::string> value;

    static RequestId integer(std::int64_t v);
    static RequestId string(std::string v);

    [[nodiscard]] bool is_integer() const noexcept {
        return std::holds_alternative<std::int64_t>(value);
    }

    [[nodiscard]] Json to_json() const;
    static JsonResult<RequestId> from_json(const Json& node);

    /// Distinguishes 1 from "1"; suitable as a map key.
    [[nodiscard]] std::string key() const;

    friend bool operator==(const RequestId&, const RequestId&) = default;
};

[[nodiscard]] std::string to_string(const RequestId& id);

// ═══════════════════════════════════════════════════════════════════════════
// Wire error object
// ═══════════════════════════════════════════════════════════════════════════

struct McpError {
    int code{ErrorCode::InternalError};
    std::string message;
    std::optional<Json> data;

    [[nodiscard]] Json to_json() const;
    static JsonResult<McpError> from_json(const Json& node);
};

// ═══════════════════════════════════════════════════════════════════════════
// Messages
// ═══════════════════════════════════════════════════════════════════════════

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, RequestId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const RequestId& id() const noexcept { return id_; }
    [[nodiscard]] const std::optional<Json>& params() const noexcept { return params_; }

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    RequestId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const std::optional<Json>& params() const noexcept { return params_; }

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcResponse {
    RequestId id;
    Json result;

    [[nodiscard]] Json to_json() const;
};

/// `id` is empty when the peer could not determine the request id
/// (serialized as null).
struct JsonRpcErrorResponse {
    std::optional<RequestId> id;
    McpError error;

    [[nodiscard]] Json to_json() const;
};

using JsonRpcMessage = std::variant<
    JsonRpcRequest,
    JsonRpcNotification,
    JsonRpcResponse,
    JsonRpcErrorResponse>;

/// Classify a decoded value: no "method" means response or error,
/// "method" with "id" is a request, "method" alone is a notification.
[[nodiscard]] JsonResult<JsonRpcMessage> parse_message(const Json& payload);

[[nodiscard]] Json to_json(const JsonRpcMessage& message);

}  // namespace mcprt
