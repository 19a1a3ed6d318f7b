#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace bulkfetch {

struct TransferState {
    bool active{false};
    int percent{0};
    std::string status_text;
    int item_count{0};
    std::uint64_t received_bytes{0};
    std::uint64_t total_bytes{0};   // 0 when the server did not declare a length
};

class TransferController;

// Observable holder for the one TransferState of a controller. Readers take
// snapshots or subscribe; only the owning controller writes.
class TransferStateHolder {
public:
    using Observer = std::function<void(const TransferState&)>;
    using SubscriptionId = std::size_t;

    TransferStateHolder() = default;
    TransferStateHolder(const TransferStateHolder&) = delete;
    TransferStateHolder& operator=(const TransferStateHolder&) = delete;

    [[nodiscard]] TransferState snapshot() const;

    // The observer is called with the current snapshot right away, then after
    // every change. Calls are serialized and arrive in write order.
    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);

private:
    friend class TransferController;

    // Generations are issued by the controller and only move forward.
    bool begin(std::uint64_t generation, int item_count, std::string status_text);
    bool advance(std::uint64_t generation,
                 int percent,
                 std::uint64_t received_bytes,
                 std::optional<std::string> status_text = std::nullopt);
    bool setTotal(std::uint64_t generation, std::uint64_t total_bytes, std::string status_text);
    bool finalize(std::uint64_t generation, std::string status_text);
    bool reset(std::uint64_t generation);

    void publish(const TransferState& state);

    mutable std::mutex state_mutex_;
    TransferState state_;
    std::uint64_t generation_{0};

    std::recursive_mutex notify_mutex_;
    std::mutex observers_mutex_;
    std::map<SubscriptionId, Observer> observers_;
    SubscriptionId next_id_{1};
};

} // namespace bulkfetch
