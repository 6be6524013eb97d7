#include <catch2/catch_test_macros.hpp>

#include "mcprt/transport/in_memory_transport.hpp"
#include "support/test_helpers.hpp"

#include <vector>

using namespace mcprt;
using mcprt::test::drain;
using mcprt::test::run;

namespace {

struct Recorder {
    std::vector<Json> messages;
    int closes{0};

    TransportHandlers handlers() {
        return TransportHandlers{
            [this](Json message) { messages.push_back(std::move(message)); },
            {},
            [this]() { ++closes; }
        };
    }
};

}  // namespace

TEST_CASE("Linked transports deliver in send order", "[transport][memory]") {
    asio::io_context io;
    auto [left, right] = InMemoryTransport::create_linked_pair(io.get_executor());

    Recorder received;
    right->set_handlers(received.handlers());
    REQUIRE(run(io, left->async_start()).has_value());
    REQUIRE(run(io, right->async_start()).has_value());

    for (int i = 0; i < 3; ++i) {
        REQUIRE(run(io, left->async_send(Json{{"n", i}})).has_value());
    }
    drain(io);

    REQUIRE(received.messages.size() == 3);
    REQUIRE(received.messages[2]["n"] == 2);
    REQUIRE(left->sent_messages().size() == 3);
}

TEST_CASE("Messages sent before start are queued", "[transport][memory]") {
    asio::io_context io;
    auto [left, right] = InMemoryTransport::create_linked_pair(io.get_executor());

    Recorder received;
    right->set_handlers(received.handlers());
    REQUIRE(run(io, left->async_send(Json{{"early", true}})).has_value());
    REQUIRE(received.messages.empty());

    REQUIRE(run(io, right->async_start()).has_value());
    REQUIRE(received.messages.size() == 1);
}

TEST_CASE("Starting twice fails", "[transport][memory]") {
    asio::io_context io;
    auto [left, right] = InMemoryTransport::create_linked_pair(io.get_executor());

    REQUIRE(run(io, left->async_start()).has_value());
    auto second = run(io, left->async_start());
    REQUIRE_FALSE(second.has_value());
}

TEST_CASE("Closing one side closes both exactly once", "[transport][memory]") {
    asio::io_context io;
    auto [left, right] = InMemoryTransport::create_linked_pair(io.get_executor());

    Recorder left_events;
    Recorder right_events;
    left->set_handlers(left_events.handlers());
    right->set_handlers(right_events.handlers());

    run(io, left->async_close());
    run(io, left->async_close());

    REQUIRE(left->is_closed());
    REQUIRE(right->is_closed());
    REQUIRE(left_events.closes == 1);
    REQUIRE(right_events.closes == 1);

    auto sent = run(io, right->async_send(Json::object()));
    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().category == TransportError::Category::Closed);
}

TEST_CASE("Session id is reported when set", "[transport][memory]") {
    asio::io_context io;
    auto [left, right] = InMemoryTransport::create_linked_pair(io.get_executor());

    REQUIRE_FALSE(left->session_id().has_value());
    left->set_session_id("session-1");
    REQUIRE(left->session_id() == "session-1");
}
