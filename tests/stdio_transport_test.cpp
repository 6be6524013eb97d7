#include <catch2/catch_test_macros.hpp>

#include "mcprt/transport/stdio_transport.hpp"
#include "support/test_helpers.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace mcprt;
using namespace std::chrono_literals;
using mcprt::test::run;

// ─────────────────────────────────────────────────────────────────────────────
// Pipe - both ends closed on destruction
// ─────────────────────────────────────────────────────────────────────────────

namespace {

class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) {
            FAIL("pipe() failed");
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

    void write(const std::string& data) {
        REQUIRE(::write(fds_[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
    }

    std::string read_available() {
        ::fcntl(fds_[0], F_SETFL, ::fcntl(fds_[0], F_GETFL) | O_NONBLOCK);
        std::string out;
        char buffer[4096];
        ssize_t n = 0;
        while ((n = ::read(fds_[0], buffer, sizeof(buffer))) > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
        }
        return out;
    }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2]{-1, -1};
};

// Real descriptors: poll the context until `done` holds or we give up.
bool run_until(asio::io_context& io, const std::function<bool()>& done) {
    for (int i = 0; (i < 200) && !done(); ++i) {
        io.restart();
        io.run_for(10ms);
    }
    return done();
}

struct Events {
    std::vector<Json> messages;
    std::vector<TransportError> errors;
    int closes{0};

    TransportHandlers handlers() {
        return TransportHandlers{
            [this](Json message) { messages.push_back(std::move(message)); },
            [this](const TransportError& error) { errors.push_back(error); },
            [this]() { ++closes; }
        };
    }
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Reading
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("StdioTransport reads newline-delimited messages", "[transport][stdio]") {
    asio::io_context io;
    Pipe input;
    Pipe output;

    auto transport = std::make_shared<StdioTransport>(
        io.get_executor(), StdioTransportConfig{}.with_fds(input.read_end(), output.write_end()));
    Events events;
    transport->set_handlers(events.handlers());
    REQUIRE(run(io, transport->async_start()).has_value());

    input.write("{\"jsonrpc\":\"2.0\",\"method\":\"a\"}\n{\"jsonrpc\":");
    input.write("\"2.0\",\"method\":\"b\"}\n");

    REQUIRE(run_until(io, [&] { return events.messages.size() == 2; }));
    REQUIRE(events.messages[0]["method"] == "a");
    REQUIRE(events.messages[1]["method"] == "b");

    run(io, transport->async_close());
}

TEST_CASE("StdioTransport reports bad lines and keeps reading", "[transport][stdio]") {
    asio::io_context io;
    Pipe input;
    Pipe output;

    auto transport = std::make_shared<StdioTransport>(
        io.get_executor(), StdioTransportConfig{}.with_fds(input.read_end(), output.write_end()));
    Events events;
    transport->set_handlers(events.handlers());
    REQUIRE(run(io, transport->async_start()).has_value());

    input.write("garbage\n{\"ok\":1}\n");

    REQUIRE(run_until(io, [&] { return events.messages.size() == 1; }));
    REQUIRE(events.errors.size() == 1);
    REQUIRE(events.errors[0].category == TransportError::Category::Protocol);

    run(io, transport->async_close());
}

TEST_CASE("StdioTransport closes on end of input", "[transport][stdio]") {
    asio::io_context io;
    Pipe input;
    Pipe output;

    auto transport = std::make_shared<StdioTransport>(
        io.get_executor(), StdioTransportConfig{}.with_fds(input.read_end(), output.write_end()));
    Events events;
    transport->set_handlers(events.handlers());
    REQUIRE(run(io, transport->async_start()).has_value());

    // The transport holds its own duplicate of the read end; EOF arrives
    // once every write end is gone.
    input.close_write();

    REQUIRE(run_until(io, [&] { return events.closes == 1; }));
    REQUIRE_FALSE(transport->is_running());
    REQUIRE(events.errors.empty());
}

TEST_CASE("StdioTransport rejects oversized lines", "[transport][stdio]") {
    asio::io_context io;
    Pipe input;
    Pipe output;

    auto transport = std::make_shared<StdioTransport>(
        io.get_executor(),
        StdioTransportConfig{}.with_fds(input.read_end(), output.write_end()).with_max_message_size(64));
    Events events;
    transport->set_handlers(events.handlers());
    REQUIRE(run(io, transport->async_start()).has_value());

    input.write(std::string(128, 'x'));
    input.write("\n{\"after\":true}\n");

    REQUIRE(run_until(io, [&] { return events.messages.size() == 1; }));
    REQUIRE(events.messages[0]["after"] == true);
    REQUIRE_FALSE(events.errors.empty());

    run(io, transport->async_close());
}

// ─────────────────────────────────────────────────────────────────────────────
// Writing and lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("StdioTransport writes one line per message", "[transport][stdio]") {
    asio::io_context io;
    Pipe input;
    Pipe output;

    auto transport = std::make_shared<StdioTransport>(
        io.get_executor(), StdioTransportConfig{}.with_fds(input.read_end(), output.write_end()));
    REQUIRE(run(io, transport->async_start()).has_value());

    REQUIRE(run(io, transport->async_send({{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"text", "a\nb"}}}})).has_value());
    REQUIRE(run(io, transport->async_send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}})).has_value());

    const std::string written = output.read_available();
    const auto first_newline = written.find('\n');
    REQUIRE(first_newline != std::string::npos);
    REQUIRE(Json::parse(written.substr(0, first_newline))["result"]["text"] == "a\nb");
    REQUIRE(written.back() == '\n');
    REQUIRE(written.find('\n', first_newline + 1) == written.size() - 1);

    run(io, transport->async_close());
}

TEST_CASE("StdioTransport lifecycle errors", "[transport][stdio]") {
    asio::io_context io;
    Pipe input;
    Pipe output;

    auto transport = std::make_shared<StdioTransport>(
        io.get_executor(), StdioTransportConfig{}.with_fds(input.read_end(), output.write_end()));
    Events events;
    transport->set_handlers(events.handlers());

    auto early = run(io, transport->async_send(Json::object()));
    REQUIRE_FALSE(early.has_value());

    REQUIRE(run(io, transport->async_start()).has_value());
    REQUIRE_FALSE(run(io, transport->async_start()).has_value());

    run(io, transport->async_close());
    run(io, transport->async_close());
    REQUIRE(events.closes == 1);

    auto late = run(io, transport->async_send(Json::object()));
    REQUIRE_FALSE(late.has_value());
}

TEST_CASE("StdioTransport leaves the original descriptors open", "[transport][stdio]") {
    asio::io_context io;
    Pipe input;
    Pipe output;

    auto transport = std::make_shared<StdioTransport>(
        io.get_executor(), StdioTransportConfig{}.with_fds(input.read_end(), output.write_end()));
    REQUIRE(run(io, transport->async_start()).has_value());
    run(io, transport->async_close());

    REQUIRE(::fcntl(input.read_end(), F_GETFD) != -1);
    REQUIRE(::fcntl(output.write_end(), F_GETFD) != -1);
}
