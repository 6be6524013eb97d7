#include "mcprt/transport/event_stream.hpp"

#include <ada.h>

#include <charconv>

namespace mcprt {

namespace {

// Consumed input is only erased once this much has accumulated.
constexpr std::size_t kCompactThreshold = 4096;

TransportResult<std::string> endpoint_error(std::string message) {
    return tl::unexpected(make_transport_error(TransportError::Category::Protocol, std::move(message)));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// SseParser
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::vector<SseEvent>> SseParser::feed(std::string_view chunk) {
    const std::size_t needed = buffered_size() + chunk.size();
    if (needed > config_.max_buffer_size) {
        reset();
        return tl::unexpected(make_transport_error(
            TransportError::Category::Protocol,
            "SSE buffer overflow: " + std::to_string(needed) + " bytes exceeds limit of " +
                std::to_string(config_.max_buffer_size)));
    }

    buffer_.append(chunk.data(), chunk.size());

    std::vector<SseEvent> events;
    for (auto newline = buffer_.find('\n', read_pos_); newline != std::string::npos;
         newline = buffer_.find('\n', read_pos_)) {
        std::string_view line(buffer_.data() + read_pos_, newline - read_pos_);
        read_pos_ = newline + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (apply_line(line) == false) {
            continue;
        }
        if (pending_.data.size() > config_.max_event_size) {
            pending_ = SseEvent{};
            continue;
        }
        // A dispatch with no data is not an event.
        if (pending_.data.empty()) {
            pending_ = SseEvent{};
            continue;
        }
        events.push_back(take_event());
    }

    if (read_pos_ > kCompactThreshold || read_pos_ == buffer_.size()) {
        buffer_.erase(0, read_pos_);
        read_pos_ = 0;
    }
    return events;
}

void SseParser::reset() {
    buffer_.clear();
    read_pos_ = 0;
    pending_ = SseEvent{};
}

bool SseParser::apply_line(std::string_view line) {
    if (line.empty()) {
        return true;
    }
    if (line.front() == ':') {
        return false;
    }

    std::string_view field = line;
    std::string_view value;
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "event") {
        pending_.event = std::string(value);
    } else if (field == "id") {
        pending_.id = std::string(value);
    } else if (field == "data") {
        if (!pending_.data.empty()) {
            pending_.data += '\n';
        }
        pending_.data += value;
    } else if (field == "retry") {
        std::uint32_t retry_ms = 0;
        const auto* end = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), end, retry_ms);
        if (ec == std::errc{} && ptr == end) {
            pending_.retry = retry_ms;
        }
    }
    return false;
}

SseEvent SseParser::take_event() {
    SseEvent event = std::move(pending_);
    pending_ = SseEvent{};
    return event;
}

// ─────────────────────────────────────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────────────────────────────────────

std::string format_sse_event(const SseEvent& event) {
    std::string out;
    if (event.event) {
        out += "event: " + *event.event + "\n";
    }
    if (event.id) {
        out += "id: " + *event.id + "\n";
    }
    if (event.retry) {
        out += "retry: " + std::to_string(*event.retry) + "\n";
    }

    std::string_view data = event.data;
    while (true) {
        const auto newline = data.find('\n');
        out += "data: ";
        out += data.substr(0, newline);
        out += '\n';
        if (newline == std::string_view::npos) {
            break;
        }
        data.remove_prefix(newline + 1);
    }
    out += '\n';
    return out;
}

SseEvent make_message_event(const Json& message) {
    SseEvent event;
    event.event = std::string(kMessageEventName);
    event.data = message.dump();
    return event;
}

SseEvent make_endpoint_event(std::string_view path, std::optional<std::string_view> session_id) {
    SseEvent event;
    event.event = std::string(kEndpointEventName);
    event.data = std::string(path);
    if (session_id) {
        ada::url_search_params params;
        params.append(kSessionIdParam, *session_id);
        event.data += (path.find('?') == std::string_view::npos) ? '?' : '&';
        event.data += params.to_string();
    }
    return event;
}

// ─────────────────────────────────────────────────────────────────────────────
// Endpoint handling
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::string> resolve_endpoint(std::string_view stream_url, std::string_view endpoint_data) {
    auto base = ada::parse<ada::url>(stream_url);
    if (!base) {
        return endpoint_error("Invalid stream URL: " + std::string(stream_url));
    }

    auto resolved = ada::parse<ada::url>(endpoint_data, &base.value());
    if (!resolved) {
        return endpoint_error("Invalid endpoint URL: " + std::string(endpoint_data));
    }

    const std::string expected_origin = base->get_origin();
    const std::string actual_origin = resolved->get_origin();
    if (actual_origin != expected_origin) {
        return endpoint_error("Endpoint origin does not match connection origin: " + actual_origin);
    }
    return std::string(resolved->get_href());
}

std::optional<std::string> endpoint_session_id(std::string_view url) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }
    ada::url_search_params params(parsed->get_search());
    const auto value = params.get(kSessionIdParam);
    if (!value) {
        return std::nullopt;
    }
    return std::string(*value);
}

TransportResult<Json> decode_message_event(const SseEvent& event) {
    if (event.type() != kMessageEventName) {
        return tl::unexpected(make_transport_error(
            TransportError::Category::Protocol,
            "Unexpected event type: " + std::string(event.type())));
    }
    try {
        return Json::parse(event.data);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(make_transport_error(
            TransportError::Category::Protocol,
            "Failed to parse JSON: " + std::string(e.what())));
    }
}

}  // namespace mcprt
