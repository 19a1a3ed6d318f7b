#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace bulkfetch::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

// Percent-encodes one URL path segment.
[[nodiscard]] std::string escapeUrlSegment(const std::string& segment);

} // namespace bulkfetch::detail
