#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>

namespace bulkfetch {

namespace detail {
struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
};
} // namespace detail

class CancellationToken {
public:
    // A default token is never cancelled.
    CancellationToken() = default;

    [[nodiscard]] bool isCancelled() const noexcept;

    // Blocks until cancelled or the timeout expires. Returns true if cancelled.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] CancellationToken token() const;
    [[nodiscard]] bool isCancelled() const noexcept;

    // Idempotent. Returns true only for the call that performed the cancellation.
    bool cancel();

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace bulkfetch
