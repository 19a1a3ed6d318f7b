/**
 * @file test_progress_panel.cpp
 * @brief Unit tests for the terminal progress panel
 */

#include <gtest/gtest.h>

#include <bulkfetch/progress_panel.hpp>

#include <sstream>
#include <string>

namespace bulkfetch::test {

namespace {

std::size_t countOf(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST(ProgressPanelTest, FormatSize) {
    EXPECT_EQ(ProgressPanel::formatSize(0), "0 B");
    EXPECT_EQ(ProgressPanel::formatSize(1023), "1023 B");
    EXPECT_EQ(ProgressPanel::formatSize(1536), "1.5 KB");
    EXPECT_EQ(ProgressPanel::formatSize(5ull * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(ProgressPanel::formatSize(3ull * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(ProgressPanelTest, FormatBar) {
    EXPECT_EQ(countOf(ProgressPanel::formatBar(0, 10), u8"█"), 0u);
    EXPECT_EQ(countOf(ProgressPanel::formatBar(50, 10), u8"█"), 5u);
    EXPECT_EQ(countOf(ProgressPanel::formatBar(50, 10), u8"░"), 5u);
    EXPECT_EQ(countOf(ProgressPanel::formatBar(100, 10), u8"█"), 10u);
    EXPECT_EQ(countOf(ProgressPanel::formatBar(250, 10), u8"█"), 10u);
}

TEST(ProgressPanelTest, IdlePanel) {
    const auto panel = ProgressPanel::buildPanel(TransferState{});
    EXPECT_NE(panel.find("No transfer in progress"), std::string::npos);
}

TEST(ProgressPanelTest, ActiveKnownLength) {
    TransferState state;
    state.active = true;
    state.percent = 42;
    state.status_text = "Downloading 3 recordings...";
    state.item_count = 3;
    state.received_bytes = 2048;
    state.total_bytes = 4096;

    const auto panel = ProgressPanel::buildPanel(state);
    EXPECT_NE(panel.find("3 recordings"), std::string::npos);
    EXPECT_NE(panel.find("Downloading 3 recordings..."), std::string::npos);
    EXPECT_NE(panel.find(" 42%"), std::string::npos);
    EXPECT_NE(panel.find("(2.0 KB/4.0 KB)"), std::string::npos);
    EXPECT_EQ(panel.find("Done"), std::string::npos);
}

TEST(ProgressPanelTest, FinalizingShowsDone) {
    TransferState state;
    state.active = true;
    state.percent = 100;
    state.status_text = "Preparing file...";
    state.item_count = 1;
    state.received_bytes = 10;

    const auto panel = ProgressPanel::buildPanel(state);
    EXPECT_NE(panel.find("1 recording"), std::string::npos);
    EXPECT_NE(panel.find("100%"), std::string::npos);
    EXPECT_NE(panel.find("(10 B)"), std::string::npos);
    EXPECT_NE(panel.find("Done"), std::string::npos);
}

TEST(ProgressPanelTest, RedrawMovesCursorBack) {
    std::ostringstream out;
    ProgressPanel panel{out};
    panel.render(TransferState{});
    EXPECT_EQ(out.str().find("\033["), std::string::npos);

    panel.render(TransferState{});
    EXPECT_NE(out.str().find("\033[3F\033[J"), std::string::npos);

    panel.clear();
    const auto text = out.str();
    EXPECT_EQ(countOf(text, "\033[3F\033[J"), 2u);
}

} // namespace bulkfetch::test
