#include "bulkfetch/cancellation.hpp"

#include <thread>

namespace bulkfetch {

bool CancellationToken::isCancelled() const noexcept {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationToken CancellationSource::token() const {
    return CancellationToken{state_};
}

bool CancellationSource::isCancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
}

bool CancellationSource::cancel() {
    bool performed = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        performed = !state_->cancelled.exchange(true, std::memory_order_acq_rel);
    }
    if (performed) {
        state_->cv.notify_all();
    }
    return performed;
}

} // namespace bulkfetch
