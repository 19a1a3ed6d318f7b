#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace bulkfetch {

// Exact percentage for a stream whose length was declared up front.
// Never reports 100: that value belongs to the finalizing step.
class ProgressEstimator {
public:
    static constexpr int kMaxStreamingPercent = 99;

    explicit ProgressEstimator(std::optional<std::uint64_t> total_bytes);

    [[nodiscard]] bool hasKnownTotal() const noexcept { return total_bytes_.has_value(); }
    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return total_bytes_.value_or(0); }

    // Returns the percent after receiving received_bytes in total. Without a
    // known total the value is left unchanged.
    int onChunk(std::uint64_t received_bytes);

    [[nodiscard]] int percent() const noexcept { return percent_; }

    [[nodiscard]] static int percentOf(std::uint64_t received_bytes, std::uint64_t total_bytes);

private:
    std::optional<std::uint64_t> total_bytes_;
    int percent_{0};
};

// Simulated progress for streams of unknown length: a fixed step on a fixed
// interval, capped below completion, on its own thread.
class HeuristicTicker {
public:
    struct Options {
        std::chrono::milliseconds interval{200};
        int step{5};
        int cap{90};
    };

    using Callback = std::function<void(int)>;

    HeuristicTicker(Options options, CancellationToken token, Callback on_tick);
    ~HeuristicTicker();

    HeuristicTicker(const HeuristicTicker&) = delete;
    HeuristicTicker& operator=(const HeuristicTicker&) = delete;

    void start();
    // Wakes the thread and joins it. No tick is delivered after stop() returns.
    void stop();

    [[nodiscard]] int percent() const;

    [[nodiscard]] static int nextValue(int current, int step, int cap) noexcept;

private:
    void run();

    Options options_;
    CancellationToken token_;
    Callback on_tick_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
    int percent_{0};
    std::thread thread_;
};

namespace status {

[[nodiscard]] std::string compressing(int item_count);
[[nodiscard]] std::string downloading(int item_count);
[[nodiscard]] std::string finalizing();
[[nodiscard]] std::string itemLabel(int item_count);

} // namespace status

} // namespace bulkfetch
