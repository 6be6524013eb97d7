#include "mcprt/transport/line_framing.hpp"

namespace mcprt {

std::string serialize_message(const Json& message) {
    std::string data = message.dump();
    data.push_back('\n');
    return data;
}

void ReadBuffer::append(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

std::optional<TransportResult<Json>> ReadBuffer::read_message() {
    while (true) {
        const auto newline = buffer_.find('\n', read_pos_);
        if (newline == std::string::npos) {
            compact();
            return std::nullopt;
        }

        std::string_view line(buffer_.data() + read_pos_, newline - read_pos_);
        read_pos_ = newline + 1;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }

        if (line.size() > max_line_size_) {
            return TransportResult<Json>{tl::unexpected(make_transport_error(
                TransportError::Category::Protocol, "Line too large"))};
        }

        try {
            return TransportResult<Json>{Json::parse(line)};
        } catch (const Json::parse_error& e) {
            return TransportResult<Json>{tl::unexpected(make_transport_error(
                TransportError::Category::Protocol,
                "Failed to parse JSON: " + std::string(e.what())))};
        }
    }
}

bool ReadBuffer::overflowed() const noexcept {
    return buffered_size() > max_line_size_;
}

void ReadBuffer::clear() noexcept {
    buffer_.clear();
    read_pos_ = 0;
}

void ReadBuffer::compact() {
    if (read_pos_ == 0) {
        return;
    }
    buffer_.erase(0, read_pos_);
    read_pos_ = 0;
}

}  // namespace mcprt
