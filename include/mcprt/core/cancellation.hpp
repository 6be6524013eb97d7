#pragma once

#include "mcprt/protocol/json_rpc.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace mcprt {

// ═══════════════════════════════════════════════════════════════════════════
// Cooperative cancellation
// ═══════════════════════════════════════════════════════════════════════════
// A CancellationSource flips a shared flag once and notifies observers with
// the reason it was given. Tokens only observe. Nothing here interrupts
// running work; code must check the token or register an observer.

namespace detail {
struct CancellationState;
}  // namespace detail

/// Unregisters its observer when destroyed.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset();

private:
    std::weak_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

class CancellationToken {
public:
    using Observer = std::function<void(const Json& reason)>;

    /// A token that can never be cancelled.
    CancellationToken() = default;

    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }
    [[nodiscard]] bool is_cancelled() const;

    /// Null until cancelled.
    [[nodiscard]] Json reason() const;

    /// Runs `observer` immediately if already cancelled.
    [[nodiscard]] CancellationRegistration on_cancel(Observer observer) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    /// First call wins; later calls are ignored. Returns whether this call
    /// performed the cancellation.
    bool cancel(Json reason = "Cancelled");

    [[nodiscard]] bool is_cancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace mcprt
