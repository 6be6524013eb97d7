#include "mcprt/transport/in_memory_transport.hpp"
#include "mcprt/log/logger.hpp"

#include <asio/post.hpp>

namespace mcprt {

InMemoryTransport::Pair InMemoryTransport::create_linked_pair(asio::any_io_executor executor) {
    auto first = std::make_shared<InMemoryTransport>(executor);
    auto second = std::make_shared<InMemoryTransport>(executor);
    first->peer_ = second;
    second->peer_ = first;
    return {first, second};
}

InMemoryTransport::InMemoryTransport(asio::any_io_executor executor)
    : executor_(std::move(executor))
{}

asio::awaitable<TransportResult<void>> InMemoryTransport::async_start() {
    if (started_) {
        co_return tl::unexpected(make_transport_error(
            TransportError::Category::Protocol, "InMemoryTransport already started"));
    }
    if (closed_) {
        co_return tl::unexpected(make_transport_error(
            TransportError::Category::Closed, "InMemoryTransport is closed"));
    }
    started_ = true;

    while (!pending_.empty() && !closed_) {
        Json message = std::move(pending_.front());
        pending_.pop_front();
        emit_message(std::move(message));
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<void>> InMemoryTransport::async_send(Json message) {
    auto peer = peer_.lock();
    if (closed_ || !peer) {
        co_return tl::unexpected(make_transport_error(
            TransportError::Category::Closed, "Not connected"));
    }

    sent_.push_back(message);
    asio::post(executor_, [weak = std::weak_ptr<InMemoryTransport>(peer),
                           message = std::move(message)]() mutable {
        if (auto target = weak.lock()) {
            target->deliver(std::move(message));
        }
    });
    co_return TransportResult<void>{};
}

asio::awaitable<void> InMemoryTransport::async_close() {
    close_now();
    co_return;
}

void InMemoryTransport::deliver(Json message) {
    if (closed_) {
        MCPRT_LOG_DEBUG("InMemoryTransport: dropping message delivered after close");
        return;
    }
    if (!started_) {
        pending_.push_back(std::move(message));
        return;
    }
    emit_message(std::move(message));
}

void InMemoryTransport::close_now() {
    if (closed_) {
        return;
    }
    closed_ = true;
    pending_.clear();

    auto peer = peer_.lock();
    peer_.reset();
    if (peer) {
        peer->close_now();
    }
    emit_close();
}

}  // namespace mcprt
