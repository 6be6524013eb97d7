#include "mcprt/protocol/mcp_types.hpp"

#include <algorithm>

namespace mcprt {

namespace {

tl::unexpected<JsonError> missing(std::string message) {
    return tl::unexpected(JsonError{JsonError::Code::MissingField, std::move(message)});
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Initialize
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<InitializeParams> InitializeParams::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidParams, "initialize params must be an object"});
    }
    const auto version = j.find("protocolVersion");
    if ((version == j.end()) || (version->is_string() == false)) {
        return missing("initialize params require a string protocolVersion");
    }

    InitializeParams params;
    params.protocol_version = version->get<std::string>();
    if (j.contains("capabilities")) {
        params.capabilities = Capabilities::from_json(j.at("capabilities"));
    }
    if (j.contains("clientInfo") && j.at("clientInfo").is_object()) {
        params.client_info = Implementation::from_json(j.at("clientInfo"));
    }
    return params;
}

Json InitializeResult::to_json() const {
    Json j = {
        {"protocolVersion", protocol_version},
        {"capabilities", capabilities.to_json()},
        {"serverInfo", server_info.to_json()}
    };
    if (instructions) {
        j["instructions"] = *instructions;
    }
    return j;
}

JsonResult<InitializeResult> InitializeResult::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(JsonError{JsonError::Code::InvalidShape, "initialize result must be an object"});
    }
    const auto version = j.find("protocolVersion");
    if ((version == j.end()) || (version->is_string() == false)) {
        return missing("initialize result requires a string protocolVersion");
    }
    const auto caps = j.find("capabilities");
    if ((caps == j.end()) || (caps->is_object() == false)) {
        return missing("initialize result requires a capabilities object");
    }

    InitializeResult result;
    result.protocol_version = version->get<std::string>();
    result.capabilities = Capabilities::from_json(*caps);
    if (j.contains("serverInfo") && j.at("serverInfo").is_object()) {
        result.server_info = Implementation::from_json(j.at("serverInfo"));
    }
    if (j.contains("instructions") && j.at("instructions").is_string()) {
        result.instructions = j.at("instructions").get<std::string>();
    }
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Cancellation / Progress
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<CancelledNotification> CancelledNotification::from_json(const Json& j) {
    if ((j.is_object() == false) || (j.contains("requestId") == false)) {
        return missing("cancelled notification requires requestId");
    }
    auto id = RequestId::from_json(j.at("requestId"));
    if (!id) {
        return tl::unexpected(id.error());
    }

    CancelledNotification result;
    result.request_id = std::move(*id);
    if (j.contains("reason") && j.at("reason").is_string()) {
        result.reason = j.at("reason").get<std::string>();
    }
    return result;
}

Json ProgressNotification::to_json() const {
    Json j = Json::object();
    std::visit([&j](const auto& token) { j["progressToken"] = token; }, progress_token);
    j["progress"] = progress;
    if (total) {
        j["total"] = *total;
    }
    if (message) {
        j["message"] = *message;
    }
    return j;
}

JsonResult<ProgressNotification> ProgressNotification::from_json(const Json& j) {
    if ((j.is_object() == false) || (j.contains("progressToken") == false)) {
        return missing("progress notification requires progressToken");
    }

    ProgressNotification result;
    const Json& token = j.at("progressToken");
    if (token.is_number_integer()) {
        result.progress_token = token.get<std::int64_t>();
    } else if (token.is_string()) {
        result.progress_token = token.get<std::string>();
    } else {
        return tl::unexpected(JsonError{JsonError::Code::InvalidId, "progressToken must be an integer or string"});
    }

    const auto progress = j.find("progress");
    if ((progress == j.end()) || (progress->is_number() == false)) {
        return missing("progress notification requires a numeric progress");
    }
    result.progress = progress->get<double>();
    if (j.contains("total") && j.at("total").is_number()) {
        result.total = j.at("total").get<double>();
    }
    if (j.contains("message") && j.at("message").is_string()) {
        result.message = j.at("message").get<std::string>();
    }
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Logging levels
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(LoggingLevel level) noexcept {
    switch (level) {
        case LoggingLevel::Debug:     return "debug";
        case LoggingLevel::Info:      return "info";
        case LoggingLevel::Notice:    return "notice";
        case LoggingLevel::Warning:   return "warning";
        case LoggingLevel::Error:     return "error";
        case LoggingLevel::Critical:  return "critical";
        case LoggingLevel::Alert:     return "alert";
        case LoggingLevel::Emergency: return "emergency";
    }
    return "info";
}

std::optional<LoggingLevel> logging_level_from_string(std::string_view s) noexcept {
    if (s == "debug") return LoggingLevel::Debug;
    if (s == "info") return LoggingLevel::Info;
    if (s == "notice") return LoggingLevel::Notice;
    if (s == "warning") return LoggingLevel::Warning;
    if (s == "error") return LoggingLevel::Error;
    if (s == "critical") return LoggingLevel::Critical;
    if (s == "alert") return LoggingLevel::Alert;
    if (s == "emergency") return LoggingLevel::Emergency;
    return std::nullopt;
}

bool is_supported_version(std::string_view version, const std::vector<std::string>& supported) noexcept {
    return std::find(supported.begin(), supported.end(), version) != supported.end();
}

}  // namespace mcprt
