#pragma once

#include "transfer_state.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace bulkfetch {

// Terminal rendering of a TransferState snapshot, redrawn in place.
class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out) : out_(out) {}

    void render(const TransferState& state);
    // Erases the panel; the next render starts on a fresh line.
    void clear();

    [[nodiscard]] static std::string buildPanel(const TransferState& state);
    [[nodiscard]] static std::string formatBar(int percent, int width);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    void redrawPanel(const std::string& panel);

    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace bulkfetch
