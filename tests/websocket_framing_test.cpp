#include <catch2/catch_test_macros.hpp>

#include "mcprt/transport/websocket_framing.hpp"

using namespace mcprt;

TEST_CASE("Sub-protocol negotiation looks for mcp", "[framing][websocket]") {
    REQUIRE(accepts_subprotocol("mcp"));
    REQUIRE(accepts_subprotocol("graphql-ws, mcp"));
    REQUIRE(accepts_subprotocol(" mcp ,chat"));
    REQUIRE_FALSE(accepts_subprotocol("mcp2, chat"));
    REQUIRE_FALSE(accepts_subprotocol(""));
}

TEST_CASE("One message per text frame", "[framing][websocket]") {
    const Json message = {{"jsonrpc", "2.0"}, {"id", 4}, {"result", Json::object()}};

    const auto frame = encode_frame(message);
    auto decoded = decode_frame(frame);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == message);
}

TEST_CASE("Frames holding more than one value are rejected", "[framing][websocket]") {
    auto decoded = decode_frame(R"({"id":1} {"id":2})");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().category == TransportError::Category::Protocol);

    REQUIRE_FALSE(decode_frame("").has_value());
}
