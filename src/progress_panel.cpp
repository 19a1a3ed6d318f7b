#include "bulkfetch/progress_panel.hpp"
#include "bulkfetch/progress_estimator.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace bulkfetch {

void ProgressPanel::render(const TransferState& state) {
    redrawPanel(buildPanel(state));
}

void ProgressPanel::clear() {
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
        previous_lines_ = 0;
    }
    out_ << std::flush;
}

std::string ProgressPanel::buildPanel(const TransferState& state) {
    std::string panel;
    panel.reserve(256);
    panel.append("==================================================\n");

    if (!state.active) {
        panel.append("No transfer in progress\n");
        panel.append("==================================================\n");
        return panel;
    }

    std::string text = state.status_text;
    if (text.size() > 40) {
        text = text.substr(0, 40);
    }
    panel += fmt::format("{:<20} {}\n", status::itemLabel(state.item_count), text);
    panel.append("--------------------------------------------------\n");

    constexpr int bar_width = 30;
    panel += fmt::format("[{}] {:>3}%", formatBar(state.percent, bar_width), state.percent);
    if (state.total_bytes > 0) {
        panel += fmt::format(" ({}/{})", formatSize(state.received_bytes), formatSize(state.total_bytes));
    } else if (state.received_bytes > 0) {
        panel += fmt::format(" ({})", formatSize(state.received_bytes));
    }
    if (state.percent >= 100) {
        panel.append("  Done");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressPanel::formatBar(int percent, int width) {
    const int clamped = std::clamp(percent, 0, 100);
    const int bar_pos = clamped * width / 100;

    std::string bar;
    bar.reserve(static_cast<std::size_t>(width) * 3);
    for (int i = 0; i < width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }
    return bar;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ProgressPanel::redrawPanel(const std::string& panel) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace bulkfetch
