#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Event-Stream Framing
// ═══════════════════════════════════════════════════════════════════════════
// Server-Sent Events carrying JSON-RPC messages. The serving side first
// emits an "endpoint" event whose data is the URL the receiver must POST
// its own messages to; every later "message" event carries one payload.
//
//   event: endpoint
//   data: /messages?sessionId=8f2c
//
//   event: message
//   data: {"jsonrpc":"2.0","method":"ping","id":1}

#include "mcprt/transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt {

inline constexpr std::string_view kEndpointEventName{"endpoint"};
inline constexpr std::string_view kMessageEventName{"message"};
inline constexpr std::string_view kSessionIdParam{"sessionId"};

struct SseEvent {
    std::optional<std::string> id;
    std::optional<std::string> event;   ///< Absent means "message"
    std::string data;
    std::optional<std::uint32_t> retry;

    [[nodiscard]] std::string_view type() const noexcept {
        return event ? std::string_view(*event) : kMessageEventName;
    }
};

struct SseParserConfig {
    /// Unconsumed bytes allowed before feed() fails
    std::size_t max_buffer_size{1024 * 1024};

    /// Events whose data exceeds this are dropped
    std::size_t max_event_size{512 * 1024};
};

/// Incremental parser; chunks may split lines and events anywhere.
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Complete events found so far. Fails (and resets) when the buffered
    /// partial input would exceed max_buffer_size.
    [[nodiscard]] TransportResult<std::vector<SseEvent>> feed(std::string_view chunk);

    void reset();

    [[nodiscard]] std::size_t buffered_size() const noexcept { return buffer_.size() - read_pos_; }

private:
    /// True when `line` terminates the current event.
    bool apply_line(std::string_view line);
    SseEvent take_event();

    SseParserConfig config_;
    std::string buffer_;
    std::size_t read_pos_{0};
    SseEvent pending_;
};

/// Wire form of `event`, terminated by a blank line. Multi-line data is
/// split into several data fields.
[[nodiscard]] std::string format_sse_event(const SseEvent& event);

[[nodiscard]] SseEvent make_message_event(const Json& message);

/// `path`, plus "?sessionId=<id>" when a session id is given.
[[nodiscard]] SseEvent make_endpoint_event(std::string_view path,
                                           std::optional<std::string_view> session_id = std::nullopt);

/// Resolve endpoint event data against the URL the stream was opened on.
/// Fails unless the resolved URL has the same origin as the stream.
[[nodiscard]] TransportResult<std::string> resolve_endpoint(std::string_view stream_url,
                                                            std::string_view endpoint_data);

/// The sessionId query parameter of an absolute URL, if any.
[[nodiscard]] std::optional<std::string> endpoint_session_id(std::string_view url);

/// Decode the payload of a "message" event.
[[nodiscard]] TransportResult<Json> decode_message_event(const SseEvent& event);

}  // namespace mcprt
