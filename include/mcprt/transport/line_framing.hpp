#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Line Framing
// ═══════════════════════════════════════════════════════════════════════════
// Byte-stream framing: one serialized message per line. JSON escapes
// embedded newlines, so a raw '\n' always terminates a message.

#include "mcprt/transport.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcprt {

/// Serialize `message` followed by '\n'.
[[nodiscard]] std::string serialize_message(const Json& message);

class ReadBuffer {
public:
    explicit ReadBuffer(std::size_t max_line_size = 4 * 1024 * 1024)
        : max_line_size_(max_line_size) {}

    void append(std::string_view bytes);

    /// Next complete line, decoded. Empty when no full line is buffered.
    /// Blank lines are skipped. A line that fails to decode is consumed and
    /// reported as an error so later lines are still readable.
    [[nodiscard]] std::optional<TransportResult<Json>> read_message();

    /// True when the partial (unterminated) line exceeds the size limit.
    [[nodiscard]] bool overflowed() const noexcept;

    void clear() noexcept;

    [[nodiscard]] std::size_t buffered_size() const noexcept { return buffer_.size() - read_pos_; }

private:
    void compact();

    std::string buffer_;
    std::size_t read_pos_{0};
    std::size_t max_line_size_;
};

}  // namespace mcprt
