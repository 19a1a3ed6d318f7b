/**
 * @file test_transfer_request.cpp
 * @brief Unit tests for request validation and the recordings request builders
 */

#include <gtest/gtest.h>

#include <bulkfetch/transfer_request.hpp>

#include <chrono>
#include <ctime>
#include <stdexcept>

namespace bulkfetch::test {

namespace {

std::chrono::system_clock::time_point utcTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace

TEST(TransferRequestTest, Validate_AcceptsPlainRequest) {
    EXPECT_NO_THROW(makeGetRequest("http://host/file", "file.zip").validate());
}

TEST(TransferRequestTest, Validate_RejectsMissingFields) {
    EXPECT_THROW(makeGetRequest("", "file.zip").validate(), std::invalid_argument);
    EXPECT_THROW(makeGetRequest("http://host/file", "").validate(), std::invalid_argument);
    EXPECT_THROW(makeGetRequest("http://host/file", "file.zip", 0).validate(), std::invalid_argument);

    auto no_method = makeGetRequest("http://host/file", "file.zip");
    no_method.method.clear();
    EXPECT_THROW(no_method.validate(), std::invalid_argument);
}

TEST(TransferRequestTest, Validate_RejectsPathsInFilename) {
    EXPECT_THROW(makeGetRequest("http://host/f", "../evil.zip").validate(), std::invalid_argument);
    EXPECT_THROW(makeGetRequest("http://host/f", "dir/file.zip").validate(), std::invalid_argument);
    EXPECT_THROW(makeGetRequest("http://host/f", "..").validate(), std::invalid_argument);
}

TEST(TransferRequestTest, ArchiveName) {
    EXPECT_EQ(archiveNameFor("cam1_20260101_120000.mp4"), "cam1_20260101_120000.zip");
    EXPECT_EQ(archiveNameFor("clip.mkv"), "clip.mkv.zip");
    EXPECT_EQ(archiveNameFor(".mp4"), ".mp4.zip");
}

TEST(TransferRequestTest, RecordingDownload) {
    const auto request = recordingDownload("http://localhost:8001/", "cam_lobby", "2026-01-01_10-00-00.mp4");

    EXPECT_EQ(request.url,
              "http://localhost:8001/api/recordings/download/cam_lobby/2026-01-01_10-00-00.mp4");
    EXPECT_EQ(request.method, "GET");
    EXPECT_TRUE(request.body.empty());
    EXPECT_EQ(request.destination_filename, "2026-01-01_10-00-00.zip");
    EXPECT_EQ(request.item_count, 1);
    EXPECT_NO_THROW(request.validate());
}

TEST(TransferRequestTest, RecordingDownload_EscapesSegments) {
    const auto request = recordingDownload("http://nvr", "front door", "a b.mp4");
    EXPECT_EQ(request.url, "http://nvr/api/recordings/download/front%20door/a%20b.mp4");
    EXPECT_EQ(request.destination_filename, "a b.zip");
}

TEST(TransferRequestTest, RecordingDownload_RequiresNames) {
    EXPECT_THROW((void)recordingDownload("http://nvr", "", "a.mp4"), std::invalid_argument);
    EXPECT_THROW((void)recordingDownload("http://nvr", "cam", ""), std::invalid_argument);
}

TEST(TransferRequestTest, BulkDownload) {
    const auto request = bulkRecordingsDownload("http://localhost:8001",
                                                {"cam1/a.mp4", "cam2/b.mp4", "cam2/c.mp4"},
                                                utcTime(2026, 3, 4, 5, 6, 7));

    EXPECT_EQ(request.url, "http://localhost:8001/api/recordings/download-bulk");
    EXPECT_EQ(request.method, "POST");
    ASSERT_EQ(request.headers.size(), 1u);
    EXPECT_EQ(request.headers[0].first, "Content-Type");
    EXPECT_EQ(request.headers[0].second, "application/json");
    EXPECT_EQ(request.body, R"({"recording_ids":["cam1/a.mp4","cam2/b.mp4","cam2/c.mp4"]})");
    EXPECT_EQ(request.destination_filename, "recordings_20260304T050607.zip");
    EXPECT_EQ(request.item_count, 3);
}

TEST(TransferRequestTest, BulkDownload_EscapesJson) {
    const auto request = bulkRecordingsDownload("http://nvr", {"we\"ird\\id\n"});
    EXPECT_EQ(request.body, R"({"recording_ids":["we\"ird\\id\n"]})");
}

TEST(TransferRequestTest, BulkDownload_RejectsEmpty) {
    EXPECT_THROW((void)bulkRecordingsDownload("http://nvr", {}), std::invalid_argument);
}

} // namespace bulkfetch::test
