#include "bulkfetch/transfer_state.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace bulkfetch {

TransferState TransferStateHolder::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

TransferStateHolder::SubscriptionId TransferStateHolder::subscribe(Observer observer) {
    if (!observer) {
        return 0;
    }

    std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
    SubscriptionId id = 0;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        id = next_id_++;
        observers_.emplace(id, observer);
    }
    observer(snapshot());
    return id;
}

void TransferStateHolder::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(id);
}

bool TransferStateHolder::begin(std::uint64_t generation, int item_count, std::string status_text) {
    std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
    TransferState copy;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation <= generation_) {
            return false;
        }
        generation_ = generation;
        state_ = TransferState{};
        state_.active = true;
        state_.item_count = std::max(1, item_count);
        state_.status_text = std::move(status_text);
        copy = state_;
    }
    publish(copy);
    return true;
}

bool TransferStateHolder::advance(std::uint64_t generation,
                                  int percent,
                                  std::uint64_t received_bytes,
                                  std::optional<std::string> status_text) {
    std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
    TransferState copy;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != generation_ || !state_.active) {
            return false;
        }

        const int clamped = std::clamp(percent, 0, 100);
        const bool changed = clamped > state_.percent ||
                             received_bytes > state_.received_bytes ||
                             (status_text && *status_text != state_.status_text);
        if (!changed) {
            return false;
        }

        state_.percent = std::max(state_.percent, clamped);
        state_.received_bytes = std::max(state_.received_bytes, received_bytes);
        if (status_text) {
            state_.status_text = std::move(*status_text);
        }
        copy = state_;
    }
    publish(copy);
    return true;
}

bool TransferStateHolder::setTotal(std::uint64_t generation,
                                   std::uint64_t total_bytes,
                                   std::string status_text) {
    std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
    TransferState copy;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != generation_ || !state_.active) {
            return false;
        }
        state_.total_bytes = total_bytes;
        state_.status_text = std::move(status_text);
        copy = state_;
    }
    publish(copy);
    return true;
}

bool TransferStateHolder::finalize(std::uint64_t generation, std::string status_text) {
    std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
    TransferState copy;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != generation_ || !state_.active) {
            return false;
        }
        state_.percent = 100;
        state_.status_text = std::move(status_text);
        copy = state_;
    }
    publish(copy);
    return true;
}

bool TransferStateHolder::reset(std::uint64_t generation) {
    std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != generation_ || !state_.active) {
            return false;
        }
        state_ = TransferState{};
    }
    publish(TransferState{});
    return true;
}

void TransferStateHolder::publish(const TransferState& state) {
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers.reserve(observers_.size());
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }

    for (const auto& observer : observers) {
        observer(state);
    }
}

} // namespace bulkfetch
