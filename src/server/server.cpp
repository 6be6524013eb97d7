#include "mcprt/server/server.hpp"
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

JsonResult<Json> require_sampled_message(const Json& result) {
    if (result.is_object() == false) {
        return shape_error("result must be an object");
    }
    if ((result.contains("role") == false) || (result.at("role").is_string() == false)) {
        return shape_error("result requires a string 'role'");
    }
    if ((result.contains("content") == false) || (result.at("content").is_object() == false)) {
        return shape_error("result requires a 'content' object");
    }
    return result;
}

JsonResult<Json> require_roots(const Json& result) {
    if ((result.is_object() == false) || (result.contains("roots") == false) ||
        (result.at("roots").is_array() == false)) {
        return shape_error("result requires an array 'roots'");
    }
    return result;
}

[[noreturn]] void missing_capability(std::string_view who, std::string_view what, std::string_view method) {
    throw CapabilityError(std::string(who) + " does not support " + std::string(what) +
                          " (required for " + std::string(method) + ")");
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

Server::Server(ServerOptions options)
    : Protocol(options.protocol)
    , options_(std::move(options))
{
    if (options_.supported_versions.empty()) {
        throw UsageError("Server requires at least one supported protocol version");
    }

    install_request_handler(
        methods::Initialize,
        [this](JsonRpcRequest request, RequestContext) -> asio::awaitable<HandlerResult> {
            co_return handle_initialize(request);
        },
        false
    );

    set_notification_handler(methods::Initialized, [this](const JsonRpcNotification&) {
        auto callback = on_initialized_;
        if (callback) {
            callback();
        }
    });

    if (options_.capabilities.has(CapabilityKey::Logging)) {
        install_logging_handler();
    }
}

void Server::register_capabilities(const ServerCapabilities& capabilities) {
    if (is_connected()) {
        throw UsageError("Cannot register capabilities after connecting to transport");
    }
    options_.capabilities.merge(capabilities);
    if (options_.capabilities.has(CapabilityKey::Logging)) {
        install_logging_handler();
    }
}

void Server::install_logging_handler() {
    if (logging_handler_installed_) {
        return;
    }
    logging_handler_installed_ = true;
    install_request_handler(
        methods::SetLoggingLevel,
        [this](JsonRpcRequest request, RequestContext) -> asio::awaitable<HandlerResult> {
            co_return handle_set_level(request);
        },
        true
    );
}

// ═══════════════════════════════════════════════════════════════════════════
// Built-in Handlers
// ═══════════════════════════════════════════════════════════════════════════

HandlerResult Server::handle_initialize(const JsonRpcRequest& request) {
    auto params = InitializeParams::from_json(request.params().value_or(Json::object()));
    if (!params) {
        return tl::unexpected(McpError{ErrorCode::InvalidParams, params.error().message, std::nullopt});
    }

    client_capabilities_ = params->capabilities;
    client_version_ = params->client_info;

    const bool supported = is_supported_version(params->protocol_version, options_.supported_versions);
    if (supported) {
        negotiated_version_ = params->protocol_version;
    } else if (is_supported_version(LATEST_PROTOCOL_VERSION, options_.supported_versions)) {
        negotiated_version_ = LATEST_PROTOCOL_VERSION;
    } else {
        negotiated_version_ = options_.supported_versions.front();
    }
    if (!supported) {
        MCPRT_LOG_WARN("Client requested protocol version " + params->protocol_version +
                       ", answering with " + *negotiated_version_);
    }

    InitializeResult result;
    result.protocol_version = *negotiated_version_;
    result.capabilities = options_.capabilities;
    result.server_info = options_.server_info;
    result.instructions = options_.instructions;

    MCPRT_LOG_INFO("Initialize from " + client_version_->name + " " + client_version_->version +
                   " (protocol " + *negotiated_version_ + ")");
    return result.to_json();
}

HandlerResult Server::handle_set_level(const JsonRpcRequest& request) {
    const Json params = request.params().value_or(Json::object());
    const auto level = params.find("level");
    if ((level == params.end()) || (level->is_string() == false)) {
        return tl::unexpected(McpError{ErrorCode::InvalidParams, "logging/setLevel requires a string level", std::nullopt});
    }
    const auto parsed = logging_level_from_string(level->get<std::string>());
    if (!parsed) {
        return tl::unexpected(McpError{ErrorCode::InvalidParams, "Unknown logging level: " + level->get<std::string>(), std::nullopt});
    }
    logging_level_ = *parsed;
    return Json::object();
}

// ═══════════════════════════════════════════════════════════════════════════
// Capability Gate
// ═══════════════════════════════════════════════════════════════════════════

void Server::assert_capability_for_method(std::string_view method) const {
    const auto client_has = [this](CapabilityKey key) {
        return client_capabilities_ && client_capabilities_->has(key);
    };

    if (method == methods::CreateMessage) {
        if (!client_has(CapabilityKey::Sampling)) {
            missing_capability("Client", "sampling", method);
        }
    } else if (method == methods::ListRoots) {
        if (!client_has(CapabilityKey::Roots)) {
            missing_capability("Client", "listing roots", method);
        }
    }
}

void Server::assert_notification_capability(std::string_view method) const {
    if (method == methods::LoggingMessage) {
        if (options_.capabilities.has(CapabilityKey::Logging) == false) {
            missing_capability("Server", "logging", method);
        }
    } else if ((method == methods::ResourceUpdated) || (method == methods::ResourceListChanged)) {
        if (options_.capabilities.has(CapabilityKey::Resources) == false) {
            missing_capability("Server", "notifying about resources", method);
        }
    } else if (method == methods::ToolListChanged) {
        if (options_.capabilities.has(CapabilityKey::Tools) == false) {
            missing_capability("Server", "notifying of tool list changes", method);
        }
    } else if (method == methods::PromptListChanged) {
        if (options_.capabilities.has(CapabilityKey::Prompts) == false) {
            missing_capability("Server", "notifying of prompt list changes", method);
        }
    }
}

void Server::assert_request_handler_capability(std::string_view method) const {
    if (method == methods::SetLoggingLevel) {
        if (options_.capabilities.has(CapabilityKey::Logging) == false) {
            missing_capability("Server", "logging", method);
        }
    } else if (starts_with(method, "prompts/")) {
        if (options_.capabilities.has(CapabilityKey::Prompts) == false) {
            missing_capability("Server", "prompts", method);
        }
    } else if (starts_with(method, "resources/")) {
        if (options_.capabilities.has(CapabilityKey::Resources) == false) {
            missing_capability("Server", "resources", method);
        }
    } else if (starts_with(method, "tools/")) {
        if (options_.capabilities.has(CapabilityKey::Tools) == false) {
            missing_capability("Server", "tools", method);
        }
    } else if (method == methods::Complete) {
        if (options_.capabilities.has(CapabilityKey::Completions) == false) {
            missing_capability("Server", "completions", method);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ProtocolResult<Json>> Server::ping(RequestOptions options) {
    return request(methods::Ping, std::nullopt, std::move(options), require_object);
}

asio::awaitable<ProtocolResult<Json>> Server::create_message(Json params, RequestOptions options) {
    return request(methods::CreateMessage, std::move(params), std::move(options), require_sampled_message);
}

asio::awaitable<ProtocolResult<Json>> Server::list_roots(std::optional<Json> params, RequestOptions options) {
    return request(methods::ListRoots, std::move(params), std::move(options), require_roots);
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ProtocolResult<void>> Server::send_logging_message(LoggingMessageNotification message) {
    if (logging_level_ && (message.level < *logging_level_)) {
        co_return ProtocolResult<void>{};
    }
    co_return co_await notification(methods::LoggingMessage, message.to_json());
}

asio::awaitable<ProtocolResult<void>> Server::send_resource_updated(std::string uri) {
    return notification(methods::ResourceUpdated, Json{{"uri", std::move(uri)}});
}

asio::awaitable<ProtocolResult<void>> Server::send_resource_list_changed() {
    return notification(methods::ResourceListChanged);
}

asio::awaitable<ProtocolResult<void>> Server::send_tool_list_changed() {
    return notification(methods::ToolListChanged);
}

asio::awaitable<ProtocolResult<void>> Server::send_prompt_list_changed() {
    return notification(methods::PromptListChanged);
}

}  // namespace mcprt
