#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bulkfetch {

using Chunk = std::vector<std::uint8_t>;
using ChunkList = std::vector<Chunk>;

// Ordered, append-only collection of the chunks of one transfer.
class ByteAccumulator {
public:
    // Returns false once the accumulator was invalidated or taken.
    bool append(Chunk chunk);

    // Drops everything received so far and refuses further writes.
    void invalidate() noexcept;

    // Hands the chunks over in arrival order. Only the first call yields data.
    [[nodiscard]] ChunkList take();

    [[nodiscard]] std::uint64_t receivedBytes() const noexcept { return received_bytes_; }
    [[nodiscard]] std::size_t chunkCount() const noexcept { return chunks_.size(); }
    [[nodiscard]] bool isOpen() const noexcept { return open_; }

private:
    ChunkList chunks_;
    std::uint64_t received_bytes_{0};
    bool open_{true};
};

// Concatenates chunks into one buffer sized to the sum of their lengths.
[[nodiscard]] Chunk concatenate(const ChunkList& chunks);

} // namespace bulkfetch
