#include "mcprt/transport/stdio_transport.hpp"
#include "mcprt/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

namespace mcprt {

namespace {

TransportResult<void> network_error(std::string message) {
    return tl::unexpected(make_transport_error(TransportError::Category::Network, std::move(message)));
}

}  // namespace

StdioTransport::StdioTransport(asio::any_io_executor executor, StdioTransportConfig config)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , input_(executor_)
    , output_(executor_)
    , write_lock_(executor_, 1)
    , read_buffer_(config_.max_message_size)
{}

StdioTransport::~StdioTransport() {
    close_streams();
}

asio::awaitable<TransportResult<void>> StdioTransport::async_start() {
    if (started_) {
        co_return tl::unexpected(make_transport_error(
            TransportError::Category::Protocol, "StdioTransport already started"));
    }
    started_ = true;

    const int in_fd = ::dup(config_.input_fd);
    if (in_fd < 0) {
        co_return network_error("dup(input) failed: " + std::string(std::strerror(errno)));
    }
    const int out_fd = ::dup(config_.output_fd);
    if (out_fd < 0) {
        ::close(in_fd);
        co_return network_error("dup(output) failed: " + std::string(std::strerror(errno)));
    }

    asio::error_code ec;
    input_.assign(in_fd, ec);
    if (!ec) {
        output_.assign(out_fd, ec);
    }
    if (ec) {
        close_streams();
        co_return network_error("Failed to assign stdio descriptors: " + ec.message());
    }

    running_ = true;
    asio::co_spawn(
        executor_,
        [self = shared_from_this()]() { return self->reader_loop(); },
        asio::detached);

    MCPRT_LOG_INFO("StdioTransport started");
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<void>> StdioTransport::async_send(Json message) {
    if (!running_) {
        co_return network_error("Transport not running");
    }

    const std::string data = serialize_message(message);

    try {
        co_await write_lock_.async_send(asio::error_code{}, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return network_error("Write lock unavailable: " + std::string(e.what()));
    }

    TransportResult<void> result{};
    try {
        co_await asio::async_write(output_, asio::buffer(data), asio::use_awaitable);
    } catch (const std::system_error& e) {
        result = network_error("Write failed: " + std::string(e.what()));
    }
    write_lock_.try_receive([](asio::error_code) {});

    co_return result;
}

asio::awaitable<void> StdioTransport::async_close() {
    if (closed_) {
        co_return;
    }
    closed_ = true;
    running_ = false;
    close_streams();
    write_lock_.close();
    read_buffer_.clear();

    MCPRT_LOG_INFO("StdioTransport closed");
    emit_close();
}

asio::awaitable<void> StdioTransport::reader_loop() {
    std::vector<char> chunk(config_.read_chunk_size);

    while (running_) {
        std::size_t n = 0;
        try {
            n = co_await input_.async_read_some(asio::buffer(chunk), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (running_ && e.code() != asio::error::eof) {
                emit_error(make_transport_error(
                    TransportError::Category::Network,
                    "Read failed: " + std::string(e.what())));
            }
            break;
        }

        read_buffer_.append(std::string_view(chunk.data(), n));
        while (running_) {
            auto next = read_buffer_.read_message();
            if (!next) {
                break;
            }
            if (*next) {
                emit_message(std::move(**next));
            } else {
                emit_error(next->error());
            }
        }

        if (read_buffer_.overflowed()) {
            emit_error(make_transport_error(
                TransportError::Category::Protocol, "Unterminated line exceeds max_message_size"));
            read_buffer_.clear();
        }
    }

    // EOF on input ends the session.
    co_await async_close();
}

void StdioTransport::close_streams() {
    asio::error_code ec;
    if (input_.is_open()) {
        input_.close(ec);
    }
    if (output_.is_open()) {
        output_.close(ec);
    }
}

}  // namespace mcprt
