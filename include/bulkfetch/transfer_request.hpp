#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace bulkfetch {

struct TransferRequest {
    using Header = std::pair<std::string, std::string>;

    std::string url;
    std::string method{"GET"};
    std::vector<Header> headers;
    std::string body;
    std::string destination_filename;
    int item_count{1};

    // Throws std::invalid_argument when the request cannot be issued.
    void validate() const;
};

[[nodiscard]] TransferRequest makeGetRequest(std::string url,
                                             std::string destination_filename,
                                             int item_count = 1);

// One recording, archived server-side: GET {base}/api/recordings/download/{folder}/{filename}.
[[nodiscard]] TransferRequest recordingDownload(const std::string& base_url,
                                                const std::string& folder,
                                                const std::string& filename);

// Several recordings in a single archive: POST {base}/api/recordings/download-bulk.
[[nodiscard]] TransferRequest bulkRecordingsDownload(
    const std::string& base_url,
    const std::vector<std::string>& recording_ids,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

[[nodiscard]] std::string archiveNameFor(const std::string& recording_filename);

} // namespace bulkfetch
