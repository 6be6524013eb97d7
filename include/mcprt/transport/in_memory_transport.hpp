#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// In-Memory Transport
// ═══════════════════════════════════════════════════════════════════════════
// Two transports joined in process. Sends are posted to the executor, so a
// peer sees messages in send order and never re-entrantly. Messages that
// arrive before the receiver started are queued until it does.

#include "mcprt/transport.hpp"

#include <deque>
#include <memory>
#include <utility>

namespace mcprt {

class InMemoryTransport final
    : public ITransport
    , public std::enable_shared_from_this<InMemoryTransport> {
public:
    using Pair = std::pair<std::shared_ptr<InMemoryTransport>, std::shared_ptr<InMemoryTransport>>;

    [[nodiscard]] static Pair create_linked_pair(asio::any_io_executor executor);

    explicit InMemoryTransport(asio::any_io_executor executor);

    [[nodiscard]] asio::any_io_executor get_executor() override { return executor_; }
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<void> async_close() override;
    [[nodiscard]] std::optional<std::string> session_id() const override { return session_id_; }

    void set_session_id(std::string id) { session_id_ = std::move(id); }

    [[nodiscard]] bool is_started() const noexcept { return started_; }
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }

    /// Every message this side has sent, in order.
    [[nodiscard]] const std::deque<Json>& sent_messages() const noexcept { return sent_; }

private:
    void deliver(Json message);
    void close_now();

    asio::any_io_executor executor_;
    std::weak_ptr<InMemoryTransport> peer_;
    std::deque<Json> pending_;
    std::deque<Json> sent_;
    std::optional<std::string> session_id_;
    bool started_{false};
    bool closed_{false};
};

}  // namespace mcprt
