#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Timer Service
// ═══════════════════════════════════════════════════════════════════════════
// The protocol engine never reads a clock or arms a timer directly. It goes
// through ITimerService so tests can drive time by hand.

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace mcprt {

using TimerId = std::uint64_t;

class ITimerService {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Callback = std::function<void()>;

    virtual ~ITimerService() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Run `callback` once after `delay` on the engine's executor.
    /// Returned ids are never zero.
    [[nodiscard]] virtual TimerId schedule(std::chrono::milliseconds delay, Callback callback) = 0;

    /// Unknown or already-fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// AsioTimerService - asio::steady_timer per scheduled callback
// ═══════════════════════════════════════════════════════════════════════════

class AsioTimerService final : public ITimerService {
public:
    explicit AsioTimerService(asio::any_io_executor executor);
    ~AsioTimerService() override;

    AsioTimerService(const AsioTimerService&) = delete;
    AsioTimerService& operator=(const AsioTimerService&) = delete;

    [[nodiscard]] TimePoint now() const override;
    [[nodiscard]] TimerId schedule(std::chrono::milliseconds delay, Callback callback) override;
    void cancel(TimerId id) override;

    [[nodiscard]] std::size_t active_timers() const noexcept { return state_->timers.size(); }

private:
    struct State {
        TimerId next_id{1};
        std::unordered_map<TimerId, std::unique_ptr<asio::steady_timer>> timers;
    };

    asio::any_io_executor executor_;
    std::shared_ptr<State> state_;
};

}  // namespace mcprt
