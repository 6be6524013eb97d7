#include "mcprt/core/cancellation.hpp"

#include <algorithm>
#include <mutex>
#include <vector>
#include <utility>

namespace mcprt {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    bool cancelled = false;
    Json reason;
    std::uint64_t next_id = 1;
    std::vector<std::pair<std::uint64_t, CancellationToken::Observer>> observers;
};

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// CancellationRegistration
// ─────────────────────────────────────────────────────────────────────────────

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_))
    , id_(std::exchange(other.id_, 0))
{}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationRegistration::reset() {
    auto state = state_.lock();
    state_.reset();
    if (!state || id_ == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    auto& observers = state->observers;
    observers.erase(
        std::remove_if(observers.begin(), observers.end(),
                       [this](const auto& entry) { return entry.first == id_; }),
        observers.end());
    id_ = 0;
}

// ─────────────────────────────────────────────────────────────────────────────
// CancellationToken
// ─────────────────────────────────────────────────────────────────────────────

bool CancellationToken::is_cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

Json CancellationToken::reason() const {
    if (!state_) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
}

CancellationRegistration CancellationToken::on_cancel(Observer observer) const {
    if (!state_) {
        return {};
    }

    Json reason;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled == false) {
            const std::uint64_t id = state_->next_id++;
            state_->observers.emplace_back(id, std::move(observer));
            return CancellationRegistration(state_, id);
        }
        reason = state_->reason;
    }
    observer(reason);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// CancellationSource
// ─────────────────────────────────────────────────────────────────────────────

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>())
{}

bool CancellationSource::cancel(Json reason) {
    std::vector<std::pair<std::uint64_t, CancellationToken::Observer>> observers;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return false;
        }
        state_->cancelled = true;
        state_->reason = reason;
        observers = std::move(state_->observers);
        state_->observers.clear();
    }

    // Observers run outside the lock so they may query the token.
    for (auto& [id, observer] : observers) {
        observer(reason);
    }
    return true;
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace mcprt
