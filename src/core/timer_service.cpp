#include "mcprt/core/timer_service.hpp"

namespace mcprt {

AsioTimerService::AsioTimerService(asio::any_io_executor executor)
    : executor_(std::move(executor))
    , state_(std::make_shared<State>())
{}

AsioTimerService::~AsioTimerService() {
    for (auto& [id, timer] : state_->timers) {
        timer->cancel();
    }
}

ITimerService::TimePoint AsioTimerService::now() const {
    return Clock::now();
}

TimerId AsioTimerService::schedule(std::chrono::milliseconds delay, Callback callback) {
    const TimerId id = state_->next_id++;
    auto timer = std::make_unique<asio::steady_timer>(executor_, delay);

    // A completion may already be queued when cancel() runs, so the handler
    // re-checks that its entry is still registered.
    timer->async_wait([weak = std::weak_ptr<State>(state_), id, cb = std::move(callback)](
                          const asio::error_code& ec) {
        if (ec) {
            return;
        }
        auto state = weak.lock();
        if (!state) {
            return;
        }
        const auto it = state->timers.find(id);
        if (it == state->timers.end()) {
            return;
        }
        state->timers.erase(it);
        cb();
    });

    state_->timers.emplace(id, std::move(timer));
    return id;
}

void AsioTimerService::cancel(TimerId id) {
    const auto it = state_->timers.find(id);
    if (it == state_->timers.end()) {
        return;
    }
    it->second->cancel();
    state_->timers.erase(it);
}

}  // namespace mcprt
