#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Transport
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited JSON over a pair of POSIX file descriptors, stdin and
// stdout by default. The descriptors are duplicated, so closing the
// transport never closes the process's own stdin/stdout.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StdioTransport is only available on POSIX-compatible systems"
#endif

#include "mcprt/transport.hpp"
#include "mcprt/transport/line_framing.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <memory>

#include <unistd.h>

namespace mcprt {

struct StdioTransportConfig {
    int input_fd{STDIN_FILENO};
    int output_fd{STDOUT_FILENO};

    /// Longest accepted line, in bytes
    std::size_t max_message_size{4 * 1024 * 1024};

    /// Bytes requested per read
    std::size_t read_chunk_size{64 * 1024};

    StdioTransportConfig& with_fds(int in, int out) {
        input_fd = in;
        output_fd = out;
        return *this;
    }

    StdioTransportConfig& with_max_message_size(std::size_t size) {
        max_message_size = size;
        return *this;
    }
};

class StdioTransport final
    : public ITransport
    , public std::enable_shared_from_this<StdioTransport> {
public:
    StdioTransport(asio::any_io_executor executor, StdioTransportConfig config = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override { return executor_; }
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<void> async_close() override;

    [[nodiscard]] bool is_running() const noexcept { return running_; }

private:
    asio::awaitable<void> reader_loop();
    void close_streams();

    StdioTransportConfig config_;
    asio::any_io_executor executor_;
    asio::posix::stream_descriptor input_;
    asio::posix::stream_descriptor output_;

    // One-slot channel used as an async mutex so concurrent senders never
    // interleave partial writes.
    asio::experimental::channel<void(asio::error_code)> write_lock_;

    ReadBuffer read_buffer_;
    bool started_{false};
    bool running_{false};
    bool closed_{false};
};

}  // namespace mcprt
