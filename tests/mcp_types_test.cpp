#include <catch2/catch_test_macros.hpp>

#include "mcprt/protocol/capabilities.hpp"
#include "mcprt/protocol/mcp_types.hpp"
#include "mcprt/protocol/protocol_error.hpp"

using namespace mcprt;

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Capabilities track declared keys and options", "[capabilities]") {
    Capabilities caps;
    caps.set(CapabilityKey::Resources, {{"subscribe", true}});
    caps.set(CapabilityKey::Tools);

    REQUIRE(caps.has(CapabilityKey::Resources));
    REQUIRE(caps.has(CapabilityKey::Tools));
    REQUIRE_FALSE(caps.has(CapabilityKey::Prompts));

    REQUIRE(caps.flag(CapabilityKey::Resources, "subscribe"));
    REQUIRE_FALSE(caps.flag(CapabilityKey::Resources, "listChanged"));
    REQUIRE_FALSE(caps.flag(CapabilityKey::Prompts, "listChanged"));
    REQUIRE(caps.options(CapabilityKey::Prompts) == nullptr);
}

TEST_CASE("Capabilities merge unions keys and nested options", "[capabilities]") {
    Capabilities base;
    base.set(CapabilityKey::Resources, {{"subscribe", true}});
    base.set(CapabilityKey::Logging);

    Capabilities extra;
    extra.set(CapabilityKey::Resources, {{"listChanged", true}});
    extra.set(CapabilityKey::Tools, {{"listChanged", false}});

    base.merge(extra);

    REQUIRE(base.has(CapabilityKey::Logging));
    REQUIRE(base.has(CapabilityKey::Tools));
    REQUIRE(base.flag(CapabilityKey::Resources, "subscribe"));
    REQUIRE(base.flag(CapabilityKey::Resources, "listChanged"));
}

TEST_CASE("Capabilities merge lets the newer option value win", "[capabilities]") {
    Capabilities base;
    base.set(CapabilityKey::Tools, {{"listChanged", false}});

    Capabilities update;
    update.set(CapabilityKey::Tools, {{"listChanged", true}});

    base.merge(update);
    REQUIRE(base.flag(CapabilityKey::Tools, "listChanged"));
}

TEST_CASE("Capabilities JSON skips unknown keys", "[capabilities]") {
    const Json wire = {
        {"tools", {{"listChanged", true}}},
        {"sampling", Json::object()},
        {"telepathy", Json::object()},
        {"logging", 5}
    };

    const auto caps = Capabilities::from_json(wire);
    REQUIRE(caps.has(CapabilityKey::Tools));
    REQUIRE(caps.has(CapabilityKey::Sampling));
    REQUIRE(caps.has(CapabilityKey::Logging));
    REQUIRE(caps.options(CapabilityKey::Logging)->empty());

    const auto out = caps.to_json();
    REQUIRE_FALSE(out.contains("telepathy"));
    REQUIRE(out["tools"]["listChanged"] == true);
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake types
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("InitializeResult requires version and capabilities", "[mcp_types]") {
    SECTION("complete") {
        const Json wire = {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", {{"tools", Json::object()}}},
            {"serverInfo", {{"name", "srv"}, {"version", "1.2"}}},
            {"instructions", "be kind"}
        };
        auto result = InitializeResult::from_json(wire);
        REQUIRE(result.has_value());
        REQUIRE(result->protocol_version == "2024-11-05");
        REQUIRE(result->server_info == Implementation{"srv", "1.2"});
        REQUIRE(result->instructions == "be kind");
    }

    SECTION("missing capabilities") {
        auto result = InitializeResult::from_json({{"protocolVersion", "2024-11-05"}});
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("non-string version") {
        auto result = InitializeResult::from_json({{"protocolVersion", 3}, {"capabilities", Json::object()}});
        REQUIRE_FALSE(result.has_value());
    }
}

TEST_CASE("Supported versions are newest first", "[mcp_types]") {
    const auto& versions = default_supported_protocol_versions();
    REQUIRE(versions.front() == LATEST_PROTOCOL_VERSION);
    REQUIRE(is_supported_version("2024-10-07", versions));
    REQUIRE_FALSE(is_supported_version("invalid-version", versions));
}

TEST_CASE("Progress notifications accept integer and string tokens", "[mcp_types]") {
    auto numeric = ProgressNotification::from_json({{"progressToken", 4}, {"progress", 10}, {"total", 100}});
    REQUIRE(numeric.has_value());
    REQUIRE(std::get<std::int64_t>(numeric->progress_token) == 4);
    REQUIRE(numeric->total == 100.0);

    auto text = ProgressNotification::from_json({{"progressToken", "abc"}, {"progress", 1}});
    REQUIRE(std::get<std::string>(text->progress_token) == "abc");

    REQUIRE_FALSE(ProgressNotification::from_json({{"progressToken", 4}}).has_value());
}

TEST_CASE("Logging levels round-trip through their names", "[mcp_types]") {
    REQUIRE(logging_level_from_string("warning") == LoggingLevel::Warning);
    REQUIRE(to_string(LoggingLevel::Emergency) == "emergency");
    REQUIRE_FALSE(logging_level_from_string("WARN").has_value());
    REQUIRE(LoggingLevel::Debug < LoggingLevel::Error);
}

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Synthesized errors carry their wire codes", "[errors]") {
    REQUIRE(ProtocolError::request_timeout(10).rpc_code() == ErrorCode::RequestTimeout);
    REQUIRE(ProtocolError::request_timeout(10).rpc_error->data->at("timeout") == 10);
    REQUIRE(ProtocolError::connection_closed().rpc_code() == ErrorCode::ConnectionClosed);

    const auto cancelled = ProtocolError::cancelled(Json{{"why", "user"}});
    REQUIRE_FALSE(cancelled.rpc_code().has_value());
    REQUIRE(*cancelled.cancel_reason == Json{{"why", "user"}});
}

TEST_CASE("McpException converts to a wire error", "[errors]") {
    const McpException e(ErrorCode::InvalidParams, "bad input", Json{{"field", "uri"}});
    const auto error = e.to_error();
    REQUIRE(error.code == ErrorCode::InvalidParams);
    REQUIRE(error.message == "bad input");
    REQUIRE(error.data->at("field") == "uri");
}
