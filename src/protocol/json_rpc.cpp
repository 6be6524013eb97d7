#include "mcprt/protocol/json_rpc.hpp"

namespace mcprt {
namespace {

bool is_valid_params_type(const Json& node) {
    return node.is_object() || node.is_array();
}

tl::unexpected<JsonError> shape_error(JsonError::Code code, std::string message) {
    return tl::unexpected(JsonError{code, std::move(message)});
}

JsonResult<void> check_version(const Json& payload) {
    if (payload.is_object() == false) {
        return shape_error(JsonError::Code::InvalidShape, "payload must be a JSON object");
    }
    if (payload.contains("jsonrpc") == false) {
        return shape_error(JsonError::Code::MissingField, "missing jsonrpc version field");
    }
    const Json& version_node = payload.at("jsonrpc");
    if ((version_node.is_string() == false) || (version_node != kJsonRpcVersion)) {
        return shape_error(JsonError::Code::InvalidVersion, "jsonrpc must equal \"2.0\"");
    }
    return {};
}

JsonResult<std::optional<Json>> parse_params(const Json& payload) {
    const auto it = payload.find("params");
    if (it == payload.end()) {
        return std::optional<Json>{};
    }
    if (is_valid_params_type(*it) == false) {
        return shape_error(JsonError::Code::InvalidParams, "params must be an object or array");
    }
    return std::optional<Json>{*it};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// RequestId
// ─────────────────────────────────────────────────────────────────────────────

RequestId RequestId::integer(std::int64_t value) {
    return RequestId{value};
}

RequestId RequestId::string(std::string value) {
    return RequestId{std::move(value)};
}

Json RequestId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

JsonResult<RequestId> RequestId::from_json(const Json& node) {
    if (node.is_number_integer()) {
        return RequestId::integer(node.get<std::int64_t>());
    }
    if (node.is_string()) {
        return RequestId::string(node.get<std::string>());
    }
    return shape_error(JsonError::Code::InvalidId, "id must be an integer or string");
}

std::string RequestId::key() const {
    if (is_integer()) {
        return "i:" + std::to_string(std::get<std::int64_t>(value));
    }
    return "s:" + std::get<std::string>(value);
}

std::string to_string(const RequestId& id) {
    return id.to_json().dump();
}

// ─────────────────────────────────────────────────────────────────────────────
// McpError
// ─────────────────────────────────────────────────────────────────────────────

Json McpError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<McpError> McpError::from_json(const Json& node) {
    if (node.is_object() == false) {
        return shape_error(JsonError::Code::InvalidShape, "error must be an object");
    }
    const auto code = node.find("code");
    if ((code == node.end()) || (code->is_number_integer() == false)) {
        return shape_error(JsonError::Code::MissingField, "error.code must be an integer");
    }
    const auto message = node.find("message");
    if ((message == node.end()) || (message->is_string() == false)) {
        return shape_error(JsonError::Code::MissingField, "error.message must be a string");
    }

    McpError error;
    error.code = code->get<int>();
    error.message = message->get<std::string>();
    if (node.contains("data")) {
        error.data = node.at("data");
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method, RequestId id, std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    auto version = check_version(payload);
    if (!version) {
        return tl::unexpected(version.error());
    }

    const auto method = payload.find("method");
    if (method == payload.end()) {
        return shape_error(JsonError::Code::MissingField, "missing method field");
    }
    if (method->is_string() == false) {
        return shape_error(JsonError::Code::InvalidShape, "method must be a string");
    }

    if (payload.contains("id") == false) {
        return shape_error(JsonError::Code::InvalidId, "missing id field");
    }
    auto id = RequestId::from_json(payload.at("id"));
    if (!id) {
        return tl::unexpected(id.error());
    }

    auto params = parse_params(payload);
    if (!params) {
        return tl::unexpected(params.error());
    }

    return JsonRpcRequest(method->get<std::string>(), std::move(*id), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method, std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    auto version = check_version(payload);
    if (!version) {
        return tl::unexpected(version.error());
    }

    const auto method = payload.find("method");
    if ((method == payload.end()) || (method->is_string() == false)) {
        return shape_error(JsonError::Code::MissingField, "notification requires a string method");
    }

    auto params = parse_params(payload);
    if (!params) {
        return tl::unexpected(params.error());
    }
    return JsonRpcNotification(method->get<std::string>(), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.to_json();
    payload["result"] = result;
    return payload;
}

Json JsonRpcErrorResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.has_value() ? id->to_json() : Json(nullptr);
    payload["error"] = error.to_json();
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<JsonRpcMessage> parse_message(const Json& payload) {
    auto version = check_version(payload);
    if (!version) {
        return tl::unexpected(version.error());
    }

    if (payload.contains("method")) {
        if (payload.contains("id")) {
            auto request = JsonRpcRequest::from_json(payload);
            if (!request) {
                return tl::unexpected(request.error());
            }
            return JsonRpcMessage{std::move(*request)};
        }
        auto notification = JsonRpcNotification::from_json(payload);
        if (!notification) {
            return tl::unexpected(notification.error());
        }
        return JsonRpcMessage{std::move(*notification)};
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return shape_error(JsonError::Code::InvalidShape,
                           "response must carry exactly one of result or error");
    }

    if (has_error) {
        auto error = McpError::from_json(payload.at("error"));
        if (!error) {
            return tl::unexpected(error.error());
        }
        std::optional<RequestId> id;
        const auto id_node = payload.find("id");
        if ((id_node != payload.end()) && (id_node->is_null() == false)) {
            auto parsed = RequestId::from_json(*id_node);
            if (!parsed) {
                return tl::unexpected(parsed.error());
            }
            id = std::move(*parsed);
        }
        return JsonRpcMessage{JsonRpcErrorResponse{std::move(id), std::move(*error)}};
    }

    if (payload.contains("id") == false) {
        return shape_error(JsonError::Code::InvalidId, "response is missing its id");
    }
    auto id = RequestId::from_json(payload.at("id"));
    if (!id) {
        return tl::unexpected(id.error());
    }
    return JsonRpcMessage{JsonRpcResponse{std::move(*id), payload.at("result")}};
}

Json to_json(const JsonRpcMessage& message) {
    return std::visit([](const auto& m) { return m.to_json(); }, message);
}

}  // namespace mcprt
