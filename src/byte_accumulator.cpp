#include "bulkfetch/byte_accumulator.hpp"

#include <utility>

namespace bulkfetch {

bool ByteAccumulator::append(Chunk chunk) {
    if (!open_) {
        return false;
    }
    if (chunk.empty()) {
        return true;
    }
    received_bytes_ += static_cast<std::uint64_t>(chunk.size());
    chunks_.push_back(std::move(chunk));
    return true;
}

void ByteAccumulator::invalidate() noexcept {
    open_ = false;
    chunks_.clear();
    chunks_.shrink_to_fit();
}

ChunkList ByteAccumulator::take() {
    if (!open_) {
        return {};
    }
    open_ = false;
    return std::exchange(chunks_, ChunkList{});
}

Chunk concatenate(const ChunkList& chunks) {
    std::size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }

    Chunk buffer;
    buffer.reserve(total);
    for (const auto& chunk : chunks) {
        buffer.insert(buffer.end(), chunk.begin(), chunk.end());
    }
    return buffer;
}

} // namespace bulkfetch
