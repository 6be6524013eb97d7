#include "mcprt/transport/websocket_framing.hpp"

namespace mcprt {

namespace {

std::string_view trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

}  // namespace

bool accepts_subprotocol(std::string_view header_value) {
    while (!header_value.empty()) {
        const auto comma = header_value.find(',');
        if (trim(header_value.substr(0, comma)) == kWebSocketSubprotocol) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        header_value.remove_prefix(comma + 1);
    }
    return false;
}

std::string encode_frame(const Json& message) {
    return message.dump();
}

TransportResult<Json> decode_frame(std::string_view payload) {
    // nlohmann rejects trailing non-whitespace input, which covers frames
    // holding more than one message.
    try {
        return Json::parse(payload);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(make_transport_error(
            TransportError::Category::Protocol,
            "Invalid frame payload: " + std::string(e.what())));
    }
}

}  // namespace mcprt
