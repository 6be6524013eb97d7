#pragma once

// Helpers for driving coroutines on a single io_context without threads.
//
//   asio::io_context io;
//   auto result = spawn(io, engine.request("ping"));
//   drain(io);
//   REQUIRE(result->done());

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace mcprt::test {

/// Run every ready handler, including ones queued while draining.
inline void drain(asio::io_context& io) {
    io.restart();
    while (io.poll() > 0) {
        io.restart();
    }
}

/// Outcome of a spawned coroutine, filled in when it finishes.
template <typename T>
struct Spawned {
    std::optional<T> value;
    std::exception_ptr error;

    [[nodiscard]] bool done() const noexcept { return value.has_value() || (error != nullptr); }

    /// Rethrows whatever the coroutine threw.
    T& get() {
        if (error) {
            std::rethrow_exception(error);
        }
        return *value;
    }
};

template <>
struct Spawned<void> {
    bool finished{false};
    std::exception_ptr error;

    [[nodiscard]] bool done() const noexcept { return finished || (error != nullptr); }

    void get() const {
        if (error) {
            std::rethrow_exception(error);
        }
    }
};

template <typename T>
std::shared_ptr<Spawned<T>> spawn(asio::io_context& io, asio::awaitable<T> task) {
    auto slot = std::make_shared<Spawned<T>>();
    if constexpr (std::is_void_v<T>) {
        asio::co_spawn(io, std::move(task), [slot](std::exception_ptr error) {
            slot->error = error;
            slot->finished = (error == nullptr);
        });
    } else {
        asio::co_spawn(io, std::move(task), [slot](std::exception_ptr error, T value) {
            slot->error = error;
            if (!error) {
                slot->value = std::move(value);
            }
        });
    }
    return slot;
}

/// Spawn, drain and hand back the result.
template <typename T>
T run(asio::io_context& io, asio::awaitable<T> task) {
    auto slot = spawn(io, std::move(task));
    drain(io);
    if (!slot->done()) {
        throw std::runtime_error("coroutine is still suspended after draining");
    }
    if constexpr (std::is_void_v<T>) {
        slot->get();
    } else {
        return std::move(slot->get());
    }
}

}  // namespace mcprt::test
