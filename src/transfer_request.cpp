#include "bulkfetch/transfer_request.hpp"
#include "bulkfetch/detail/curl_utils.hpp"

#include <ctime>
#include <stdexcept>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace bulkfetch {

namespace {

std::string trimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

void TransferRequest::validate() const {
    if (url.empty()) {
        throw std::invalid_argument("Transfer request has no URL");
    }
    if (method.empty()) {
        throw std::invalid_argument("Transfer request has no method");
    }
    if (destination_filename.empty()) {
        throw std::invalid_argument("Transfer request has no destination filename");
    }
    if (destination_filename.find_first_of("/\\") != std::string::npos ||
        destination_filename == "." || destination_filename == "..") {
        throw std::invalid_argument("Destination filename must be a plain file name: " +
                                    destination_filename);
    }
    if (item_count < 1) {
        throw std::invalid_argument("Transfer request must cover at least one item");
    }
}

TransferRequest makeGetRequest(std::string url, std::string destination_filename, int item_count) {
    TransferRequest request;
    request.url = std::move(url);
    request.destination_filename = std::move(destination_filename);
    request.item_count = item_count;
    return request;
}

std::string archiveNameFor(const std::string& recording_filename) {
    constexpr const char* video_ext = ".mp4";
    constexpr std::size_t video_ext_len = 4;

    if (recording_filename.size() > video_ext_len &&
        recording_filename.compare(recording_filename.size() - video_ext_len, video_ext_len, video_ext) == 0) {
        return recording_filename.substr(0, recording_filename.size() - video_ext_len) + ".zip";
    }
    return recording_filename + ".zip";
}

TransferRequest recordingDownload(const std::string& base_url,
                                  const std::string& folder,
                                  const std::string& filename) {
    if (folder.empty() || filename.empty()) {
        throw std::invalid_argument("Recording folder and filename are required");
    }

    const auto url = fmt::format("{}/api/recordings/download/{}/{}",
                                 trimTrailingSlash(base_url),
                                 detail::escapeUrlSegment(folder),
                                 detail::escapeUrlSegment(filename));
    return makeGetRequest(url, archiveNameFor(filename), 1);
}

TransferRequest bulkRecordingsDownload(const std::string& base_url,
                                       const std::vector<std::string>& recording_ids,
                                       std::chrono::system_clock::time_point now) {
    if (recording_ids.empty()) {
        throw std::invalid_argument("No recordings specified");
    }

    const nlohmann::json body = {{"recording_ids", recording_ids}};

    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    TransferRequest request;
    request.url = trimTrailingSlash(base_url) + "/api/recordings/download-bulk";
    request.method = "POST";
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = body.dump();
    request.destination_filename = fmt::format("recordings_{:%Y%m%dT%H%M%S}.zip", utc);
    request.item_count = static_cast<int>(recording_ids.size());
    return request;
}

} // namespace bulkfetch
