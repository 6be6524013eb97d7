#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Server (accepting role)
// ═══════════════════════════════════════════════════════════════════════════
// Answers initialize with the negotiated version and its own capabilities.
// The handshake is tracked through the two built-in handlers only; methods
// without a capability requirement (ping) work before it completes.
//
// Usage:
//   mcprt::Server server(ServerOptions{}
//       .with_server_info({"example-server", "1.0.0"})
//       .with_capabilities(ServerCapabilities{}.set(CapabilityKey::Tools)));
//
//   server.set_request_handler("tools/list", [](const JsonRpcRequest&, const RequestContext&) {
//       return HandlerResult{Json{{"tools", Json::array()}}};
//   });
//   co_await server.connect(transport);

#include "mcprt/core/protocol.hpp"
#include "mcprt/protocol/mcp_types.hpp"

#include <asio/awaitable.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt {

// ═══════════════════════════════════════════════════════════════════════════
// Server Options
// ═══════════════════════════════════════════════════════════════════════════

struct ServerOptions {
    ProtocolOptions protocol;

    Implementation server_info{"mcprt-server", "0.1.0"};

    /// Local capabilities returned from initialize
    ServerCapabilities capabilities;

    /// Free text returned from initialize
    std::optional<std::string> instructions;

    /// Newest first. A client asking for an unknown version is answered with
    /// LATEST_PROTOCOL_VERSION when listed, otherwise with the first entry.
    std::vector<std::string> supported_versions = default_supported_protocol_versions();

    ServerOptions& with_protocol(ProtocolOptions options) {
        protocol = std::move(options);
        return *this;
    }

    ServerOptions& with_server_info(Implementation info) {
        server_info = std::move(info);
        return *this;
    }

    ServerOptions& with_capabilities(ServerCapabilities caps) {
        capabilities = std::move(caps);
        return *this;
    }

    ServerOptions& with_instructions(std::string text) {
        instructions = std::move(text);
        return *this;
    }

    ServerOptions& with_supported_versions(std::vector<std::string> versions) {
        supported_versions = std::move(versions);
        return *this;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════════════════════════════════

class Server : public Protocol {
public:
    /// Throws UsageError when `supported_versions` is empty.
    explicit Server(ServerOptions options = {});

    /// Merge into the local capabilities. Throws UsageError once connected.
    void register_capabilities(const ServerCapabilities& capabilities);

    /// Runs when the client sends notifications/initialized.
    void on_initialized(std::function<void()> callback) { on_initialized_ = std::move(callback); }

    // ─────────────────────────────────────────────────────────────────────────
    // Client Information (set by initialize)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::optional<ClientCapabilities>& client_capabilities() const noexcept {
        return client_capabilities_;
    }
    [[nodiscard]] const std::optional<Implementation>& client_version() const noexcept { return client_version_; }
    [[nodiscard]] const std::optional<std::string>& negotiated_protocol_version() const noexcept {
        return negotiated_version_;
    }

    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept { return options_.capabilities; }

    /// Minimum level requested through logging/setLevel, if any.
    [[nodiscard]] const std::optional<LoggingLevel>& logging_level() const noexcept { return logging_level_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Requests to the client
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> ping(RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> create_message(Json params, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> list_roots(
        std::optional<Json> params = std::nullopt, RequestOptions options = {});

    // ─────────────────────────────────────────────────────────────────────────
    // Notifications
    // ─────────────────────────────────────────────────────────────────────────

    /// Succeeds without sending when the message is below logging_level().
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> send_logging_message(LoggingMessageNotification message);

    [[nodiscard]] asio::awaitable<ProtocolResult<void>> send_resource_updated(std::string uri);
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> send_resource_list_changed();
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> send_tool_list_changed();
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> send_prompt_list_changed();

protected:
    void assert_capability_for_method(std::string_view method) const override;
    void assert_notification_capability(std::string_view method) const override;
    void assert_request_handler_capability(std::string_view method) const override;

private:
    [[nodiscard]] HandlerResult handle_initialize(const JsonRpcRequest& request);
    [[nodiscard]] HandlerResult handle_set_level(const JsonRpcRequest& request);
    void install_logging_handler();

    ServerOptions options_;
    std::function<void()> on_initialized_;
    bool logging_handler_installed_{false};

    std::optional<ClientCapabilities> client_capabilities_;
    std::optional<Implementation> client_version_;
    std::optional<std::string> negotiated_version_;
    std::optional<LoggingLevel> logging_level_;
};

}  // namespace mcprt
