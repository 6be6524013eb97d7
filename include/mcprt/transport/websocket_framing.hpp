#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Framing
// ═══════════════════════════════════════════════════════════════════════════
// One JSON-RPC message per text frame. Both ends must agree on the "mcp"
// sub-protocol during the upgrade handshake.

#include "mcprt/transport.hpp"

#include <string>
#include <string_view>

namespace mcprt {

inline constexpr std::string_view kWebSocketSubprotocol{"mcp"};

/// True when a Sec-WebSocket-Protocol header value (comma-separated list)
/// offers the "mcp" sub-protocol.
[[nodiscard]] bool accepts_subprotocol(std::string_view header_value);

[[nodiscard]] std::string encode_frame(const Json& message);

/// Exactly one JSON value per frame; trailing content is an error.
[[nodiscard]] TransportResult<Json> decode_frame(std::string_view payload);

}  // namespace mcprt
