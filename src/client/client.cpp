#include "mcprt/client/client.hpp"
#include "mcprt/log/logger.hpp"

namespace mcprt {

namespace {

tl::unexpected<JsonError> shape_error(std::string message) {
    return tl::unexpected(JsonError{JsonError::Code::InvalidShape, std::move(message)});
}

JsonResult<Json> require_object(const Json& result) {
    if (result.is_object() == false) {
        return shape_error("result must be an object");
    }
    return result;
}

/// Result must be an object whose `field` is an array.
ResultValidator require_array(std::string field) {
    return [field = std::move(field)](const Json& result) -> JsonResult<Json> {
        if (result.is_object() == false) {
            return shape_error("result must be an object");
        }
        const auto it = result.find(field);
        if ((it == result.end()) || (it->is_array() == false)) {
            return shape_error("result requires an array '" + field + "'");
        }
        return result;
    };
}

JsonResult<Json> require_completion(const Json& result) {
    if ((result.is_object() == false) || (result.contains("completion") == false) ||
        (result.at("completion").is_object() == false)) {
        return shape_error("result requires a 'completion' object");
    }
    return result;
}

JsonResult<Json> require_tool_result(const Json& result) {
    if (result.is_object() == false) {
        return shape_error("result must be an object");
    }
    const auto content = result.find("content");
    if ((content != result.end()) && content->is_array()) {
        return result;
    }
    if (result.contains("toolResult")) {
        return result;
    }
    return shape_error("result requires a 'content' array");
}

JsonResult<Json> validate_initialize_result(const Json& result) {
    auto parsed = InitializeResult::from_json(result);
    if (!parsed) {
        return tl::unexpected(parsed.error());
    }
    return result;
}

[[noreturn]] void missing_capability(std::string_view who, std::string_view what, std::string_view method) {
    throw CapabilityError(std::string(who) + " does not support " + std::string(what) +
                          " (required for " + std::string(method) + ")");
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

Client::Client(ClientOptions options)
    : Protocol(options.protocol)
    , options_(std::move(options))
{}

void Client::register_capabilities(const ClientCapabilities& capabilities) {
    if (is_connected()) {
        throw UsageError("Cannot register capabilities after connecting to transport");
    }
    options_.capabilities.merge(capabilities);
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ProtocolResult<void>> Client::connect(std::shared_ptr<ITransport> transport) {
    auto connected = co_await Protocol::connect(std::move(transport));
    if (!connected) {
        co_return tl::unexpected(connected.error());
    }

    state_ = HandshakeState::Negotiating;

    InitializeParams params;
    params.protocol_version = options_.protocol_version;
    params.capabilities = options_.capabilities;
    params.client_info = options_.client_info;

    auto response = co_await request(methods::Initialize, params.to_json(), {}, validate_initialize_result);
    if (!response) {
        MCPRT_LOG_ERROR("Initialize failed: " + response.error().message);
        state_ = HandshakeState::Uninitialized;
        co_await close();
        co_return tl::unexpected(response.error());
    }

    auto result = InitializeResult::from_json(*response);
    if (!result) {
        state_ = HandshakeState::Uninitialized;
        co_await close();
        co_return tl::unexpected(ProtocolError::invalid_result(result.error().message));
    }

    if (is_supported_version(result->protocol_version, options_.supported_versions) == false) {
        MCPRT_LOG_ERROR("Server answered with unsupported protocol version " + result->protocol_version);
        state_ = HandshakeState::Uninitialized;
        co_await close();
        co_return tl::unexpected(ProtocolError::unsupported_version(result->protocol_version));
    }

    server_capabilities_ = result->capabilities;
    server_version_ = result->server_info;
    instructions_ = result->instructions;
    negotiated_version_ = result->protocol_version;

    auto initialized = co_await notification(methods::Initialized);
    if (!initialized) {
        state_ = HandshakeState::Uninitialized;
        co_await close();
        co_return tl::unexpected(initialized.error());
    }

    state_ = HandshakeState::Ready;
    MCPRT_LOG_INFO("MCP client initialized (protocol " + *negotiated_version_ + ")");
    co_return ProtocolResult<void>{};
}

// ═══════════════════════════════════════════════════════════════════════════
// Capability Gate
// ═══════════════════════════════════════════════════════════════════════════

void Client::assert_capability_for_method(std::string_view method) const {
    const auto server_has = [this](CapabilityKey key) {
        return server_capabilities_ && server_capabilities_->has(key);
    };

    if (method == methods::SetLoggingLevel) {
        if (!server_has(CapabilityKey::Logging)) {
            missing_capability("Server", "logging", method);
        }
    } else if ((method == methods::GetPrompt) || (method == methods::ListPrompts)) {
        if (!server_has(CapabilityKey::Prompts)) {
            missing_capability("Server", "prompts", method);
        }
    } else if ((method == methods::ListResources) || (method == methods::ListResourceTemplates) ||
               (method == methods::ReadResource) || (method == methods::SubscribeResource) ||
               (method == methods::UnsubscribeResource)) {
        if (!server_has(CapabilityKey::Resources)) {
            missing_capability("Server", "resources", method);
        }
        if ((method == methods::SubscribeResource) &&
            (server_capabilities_->flag(CapabilityKey::Resources, "subscribe") == false)) {
            missing_capability("Server", "resource subscriptions", method);
        }
    } else if ((method == methods::CallTool) || (method == methods::ListTools)) {
        if (!server_has(CapabilityKey::Tools)) {
            missing_capability("Server", "tools", method);
        }
    } else if (method == methods::Complete) {
        if (!server_has(CapabilityKey::Completions)) {
            missing_capability("Server", "completions", method);
        }
    }
}

void Client::assert_notification_capability(std::string_view method) const {
    if (method == methods::RootsListChanged) {
        if (options_.capabilities.flag(CapabilityKey::Roots, "listChanged") == false) {
            missing_capability("Client", "roots list changed notifications", method);
        }
    }
}

void Client::assert_request_handler_capability(std::string_view method) const {
    if (method == methods::CreateMessage) {
        if (options_.capabilities.has(CapabilityKey::Sampling) == false) {
            missing_capability("Client", "sampling capability", method);
        }
    } else if (method == methods::ListRoots) {
        if (options_.capabilities.has(CapabilityKey::Roots) == false) {
            missing_capability("Client", "roots capability", method);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ProtocolResult<Json>> Client::ping(RequestOptions options) {
    return request(methods::Ping, std::nullopt, std::move(options), require_object);
}

asio::awaitable<ProtocolResult<Json>> Client::complete(Json params, RequestOptions options) {
    return request(methods::Complete, std::move(params), std::move(options), require_completion);
}

asio::awaitable<ProtocolResult<Json>> Client::set_logging_level(LoggingLevel level, RequestOptions options) {
    Json params = {{"level", std::string(to_string(level))}};
    return request(methods::SetLoggingLevel, std::move(params), std::move(options), require_object);
}

asio::awaitable<ProtocolResult<Json>> Client::get_prompt(Json params, RequestOptions options) {
    return request(methods::GetPrompt, std::move(params), std::move(options), require_array("messages"));
}

asio::awaitable<ProtocolResult<Json>> Client::list_prompts(std::optional<Json> params, RequestOptions options) {
    return request(methods::ListPrompts, std::move(params), std::move(options), require_array("prompts"));
}

asio::awaitable<ProtocolResult<Json>> Client::list_resources(std::optional<Json> params, RequestOptions options) {
    return request(methods::ListResources, std::move(params), std::move(options), require_array("resources"));
}

asio::awaitable<ProtocolResult<Json>> Client::list_resource_templates(
    std::optional<Json> params, RequestOptions options) {
    return request(methods::ListResourceTemplates, std::move(params), std::move(options),
                   require_array("resourceTemplates"));
}

asio::awaitable<ProtocolResult<Json>> Client::read_resource(Json params, RequestOptions options) {
    return request(methods::ReadResource, std::move(params), std::move(options), require_array("contents"));
}

asio::awaitable<ProtocolResult<Json>> Client::subscribe_resource(Json params, RequestOptions options) {
    return request(methods::SubscribeResource, std::move(params), std::move(options), require_object);
}

asio::awaitable<ProtocolResult<Json>> Client::unsubscribe_resource(Json params, RequestOptions options) {
    return request(methods::UnsubscribeResource, std::move(params), std::move(options), require_object);
}

asio::awaitable<ProtocolResult<Json>> Client::call_tool(Json params, RequestOptions options) {
    return request(methods::CallTool, std::move(params), std::move(options), require_tool_result);
}

asio::awaitable<ProtocolResult<Json>> Client::list_tools(std::optional<Json> params, RequestOptions options) {
    return request(methods::ListTools, std::move(params), std::move(options), require_array("tools"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ProtocolResult<void>> Client::send_roots_list_changed() {
    return notification(methods::RootsListChanged);
}

}  // namespace mcprt
