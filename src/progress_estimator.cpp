#include "bulkfetch/progress_estimator.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace bulkfetch {

ProgressEstimator::ProgressEstimator(std::optional<std::uint64_t> total_bytes) {
    if (total_bytes && *total_bytes > 0) {
        total_bytes_ = total_bytes;
    }
}

int ProgressEstimator::percentOf(std::uint64_t received_bytes, std::uint64_t total_bytes) {
    if (total_bytes == 0) {
        return 0;
    }
    // Integer math keeps floor semantics exact for any realistic size.
    const std::uint64_t scaled = received_bytes >= total_bytes
                                     ? 100
                                     : (received_bytes * 100) / total_bytes;
    return std::min(static_cast<int>(scaled), kMaxStreamingPercent);
}

int ProgressEstimator::onChunk(std::uint64_t received_bytes) {
    if (!total_bytes_) {
        return percent_;
    }
    percent_ = std::max(percent_, percentOf(received_bytes, *total_bytes_));
    return percent_;
}

HeuristicTicker::HeuristicTicker(Options options, CancellationToken token, Callback on_tick)
    : options_(options), token_(std::move(token)), on_tick_(std::move(on_tick)) {}

HeuristicTicker::~HeuristicTicker() { stop(); }

void HeuristicTicker::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable() || stopped_) {
        return;
    }
    thread_ = std::thread([this] { run(); });
}

void HeuristicTicker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

int HeuristicTicker::percent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return percent_;
}

int HeuristicTicker::nextValue(int current, int step, int cap) noexcept {
    return std::min(current + std::max(step, 0), cap);
}

void HeuristicTicker::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        // Cancellation is polled on every wake-up; stop() wakes the wait directly.
        cv_.wait_for(lock, options_.interval, [this] { return stopped_; });
        if (stopped_ || token_.isCancelled()) {
            break;
        }

        const int next = nextValue(percent_, options_.step, options_.cap);
        if (next == percent_) {
            continue;
        }
        percent_ = next;
        spdlog::debug("heuristic progress {}%", next);
        if (on_tick_) {
            // Delivered under the lock so stop() cannot return with a tick in flight.
            on_tick_(next);
        }
    }
}

namespace status {

std::string compressing(int item_count) {
    return item_count > 1 ? fmt::format("Compressing {} recordings...", item_count)
                          : std::string{"Compressing recording..."};
}

std::string downloading(int item_count) {
    return item_count > 1 ? fmt::format("Downloading {} recordings...", item_count)
                          : std::string{"Downloading recording..."};
}

std::string finalizing() { return "Preparing file..."; }

std::string itemLabel(int item_count) {
    return item_count > 1 ? fmt::format("{} recordings", item_count) : std::string{"1 recording"};
}

} // namespace status

} // namespace bulkfetch
