#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Client (initiating role)
// ═══════════════════════════════════════════════════════════════════════════
// Runs the initialize / initialized handshake on connect and gates every
// later call by the capabilities the server returned.
//
// Usage:
//   mcprt::Client client(ClientOptions{}.with_client_info({"my-app", "1.0.0"}));
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto connected = co_await client.connect(transport);
//       if (!connected) { ... }
//       auto tools = co_await client.list_tools();
//       co_await client.close();
//   }, asio::detached);

#include "mcprt/core/protocol.hpp"
#include "mcprt/protocol/mcp_types.hpp"

#include <asio/awaitable.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt {

// ═══════════════════════════════════════════════════════════════════════════
// Client Options
// ═══════════════════════════════════════════════════════════════════════════

struct ClientOptions {
    ProtocolOptions protocol;

    Implementation client_info{"mcprt-client", "0.1.0"};

    /// Local capabilities announced in initialize
    ClientCapabilities capabilities;

    /// Version sent in initialize
    std::string protocol_version = LATEST_PROTOCOL_VERSION;

    /// Versions accepted back from the server
    std::vector<std::string> supported_versions = default_supported_protocol_versions();

    ClientOptions& with_protocol(ProtocolOptions options) {
        protocol = std::move(options);
        return *this;
    }

    ClientOptions& with_client_info(Implementation info) {
        client_info = std::move(info);
        return *this;
    }

    ClientOptions& with_capabilities(ClientCapabilities caps) {
        capabilities = std::move(caps);
        return *this;
    }

    ClientOptions& with_protocol_version(std::string version) {
        protocol_version = std::move(version);
        return *this;
    }

    ClientOptions& with_supported_versions(std::vector<std::string> versions) {
        supported_versions = std::move(versions);
        return *this;
    }
};

enum class HandshakeState {
    Uninitialized,
    Negotiating,
    Ready
};

[[nodiscard]] constexpr std::string_view to_string(HandshakeState state) noexcept {
    switch (state) {
        case HandshakeState::Uninitialized: return "Uninitialized";
        case HandshakeState::Negotiating:   return "Negotiating";
        case HandshakeState::Ready:         return "Ready";
    }
    return "Unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Client
// ═══════════════════════════════════════════════════════════════════════════

class Client : public Protocol {
public:
    explicit Client(ClientOptions options = {});

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect and run the handshake. On any handshake failure the
    /// transport is closed before the error is returned.
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> connect(std::shared_ptr<ITransport> transport) override;

    [[nodiscard]] HandshakeState state() const noexcept { return state_; }

    /// Merge into the local capabilities. Throws UsageError once connected.
    void register_capabilities(const ClientCapabilities& capabilities);

    // ─────────────────────────────────────────────────────────────────────────
    // Server Information (set once Ready)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::optional<ServerCapabilities>& server_capabilities() const noexcept {
        return server_capabilities_;
    }
    [[nodiscard]] const std::optional<Implementation>& server_version() const noexcept { return server_version_; }
    [[nodiscard]] const std::optional<std::string>& instructions() const noexcept { return instructions_; }
    [[nodiscard]] const std::optional<std::string>& negotiated_protocol_version() const noexcept {
        return negotiated_version_;
    }

    [[nodiscard]] const ClientCapabilities& capabilities() const noexcept { return options_.capabilities; }

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────
    // `params` is forwarded as-is; each result must be an object carrying the
    // field its method promises (tools, contents, ...).

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> ping(RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> complete(Json params, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> set_logging_level(LoggingLevel level, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> get_prompt(Json params, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> list_prompts(
        std::optional<Json> params = std::nullopt, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> list_resources(
        std::optional<Json> params = std::nullopt, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> list_resource_templates(
        std::optional<Json> params = std::nullopt, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> read_resource(Json params, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> subscribe_resource(Json params, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> unsubscribe_resource(Json params, RequestOptions options = {});

    /// Accepts the current `content` result shape and the older `toolResult` one.
    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> call_tool(Json params, RequestOptions options = {});

    [[nodiscard]] asio::awaitable<ProtocolResult<Json>> list_tools(
        std::optional<Json> params = std::nullopt, RequestOptions options = {});

    // ─────────────────────────────────────────────────────────────────────────
    // Notifications
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<ProtocolResult<void>> send_roots_list_changed();

protected:
    void assert_capability_for_method(std::string_view method) const override;
    void assert_notification_capability(std::string_view method) const override;
    void assert_request_handler_capability(std::string_view method) const override;

private:
    ClientOptions options_;
    HandshakeState state_{HandshakeState::Uninitialized};

    std::optional<ServerCapabilities> server_capabilities_;
    std::optional<Implementation> server_version_;
    std::optional<std::string> instructions_;
    std::optional<std::string> negotiated_version_;
};

}  // namespace mcprt
