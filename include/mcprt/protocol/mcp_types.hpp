#ifndef MCPRT_PROTOCOL_MCP_TYPES_HPP
#define MCPRT_PROTOCOL_MCP_TYPES_HPP

#include "mcprt/protocol/capabilities.hpp"
#include "mcprt/protocol/json_rpc.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcprt {

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Versions
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* LATEST_PROTOCOL_VERSION = "2025-03-26";

/// Newest first.
inline const std::vector<std::string>& default_supported_protocol_versions() {
    static const std::vector<std::string> versions{
        "2025-03-26",
        "2024-11-05",
        "2024-10-07",
    };
    return versions;
}

// ═══════════════════════════════════════════════════════════════════════════
// Method Names
// ═══════════════════════════════════════════════════════════════════════════

namespace methods {
    // Lifecycle and built-ins
    inline constexpr const char* Initialize  = "initialize";
    inline constexpr const char* Initialized = "notifications/initialized";
    inline constexpr const char* Ping        = "ping";
    inline constexpr const char* Cancelled   = "notifications/cancelled";
    inline constexpr const char* Progress    = "notifications/progress";

    // Requests handled by the accepting role
    inline constexpr const char* Complete               = "completion/complete";
    inline constexpr const char* SetLoggingLevel        = "logging/setLevel";
    inline constexpr const char* GetPrompt              = "prompts/get";
    inline constexpr const char* ListPrompts            = "prompts/list";
    inline constexpr const char* ListResources          = "resources/list";
    inline constexpr const char* ListResourceTemplates  = "resources/templates/list";
    inline constexpr const char* ReadResource           = "resources/read";
    inline constexpr const char* SubscribeResource      = "resources/subscribe";
    inline constexpr const char* UnsubscribeResource    = "resources/unsubscribe";
    inline constexpr const char* CallTool               = "tools/call";
    inline constexpr const char* ListTools              = "tools/list";

    // Requests handled by the initiating role
    inline constexpr const char* CreateMessage = "sampling/createMessage";
    inline constexpr const char* ListRoots     = "roots/list";

    // Notifications
    inline constexpr const char* LoggingMessage      = "notifications/message";
    inline constexpr const char* ResourceUpdated     = "notifications/resources/updated";
    inline constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    inline constexpr const char* ToolListChanged     = "notifications/tools/list_changed";
    inline constexpr const char* PromptListChanged   = "notifications/prompts/list_changed";
    inline constexpr const char* RootsListChanged    = "notifications/roots/list_changed";
}  // namespace methods

// ═══════════════════════════════════════════════════════════════════════════
// Implementation identity
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }

    friend bool operator==(const Implementation&, const Implementation&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = LATEST_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }

    static JsonResult<InitializeParams> from_json(const Json& j);
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    [[nodiscard]] Json to_json() const;

    static JsonResult<InitializeResult> from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════
// MCP notification: "notifications/cancelled"

struct CancelledNotification {
    RequestId request_id{std::int64_t{0}};
    std::optional<std::string> reason;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        j["requestId"] = request_id.to_json();
        if (reason) {
            j["reason"] = *reason;
        }
        return j;
    }

    static JsonResult<CancelledNotification> from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// Progress
// ═══════════════════════════════════════════════════════════════════════════
// MCP notification: "notifications/progress". Outbound requests use their
// own integer id as progress token.

using ProgressToken = std::variant<std::int64_t, std::string>;

struct ProgressNotification {
    ProgressToken progress_token{std::int64_t{0}};
    double progress{0.0};
    std::optional<double> total;
    std::optional<std::string> message;

    [[nodiscard]] Json to_json() const;

    static JsonResult<ProgressNotification> from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

enum class LoggingLevel {
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

[[nodiscard]] std::string_view to_string(LoggingLevel level) noexcept;

[[nodiscard]] std::optional<LoggingLevel> logging_level_from_string(std::string_view s) noexcept;

/// MCP notification: "notifications/message"
struct LoggingMessageNotification {
    LoggingLevel level{LoggingLevel::Info};
    std::optional<std::string> logger;
    Json data;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        j["level"] = to_string(level);
        if (logger) {
            j["logger"] = *logger;
        }
        j["data"] = data;
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Version negotiation
// ═══════════════════════════════════════════════════════════════════════════

[[nodiscard]] bool is_supported_version(
    std::string_view version,
    const std::vector<std::string>& supported) noexcept;

}  // namespace mcprt

#endif  // MCPRT_PROTOCOL_MCP_TYPES_HPP
