#include "bulkfetch/detail/curl_utils.hpp"
#include "bulkfetch/errors.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <stdexcept>
#include <mutex>

namespace bulkfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw RequestFailed(0, "Failed to allocate curl handle");
    }
    return curl;
}

std::string escapeUrlSegment(const std::string& segment) {
    auto curl = makeCurlHandle();
    std::unique_ptr<char, decltype(&curl_free)> escaped{
        curl_easy_escape(curl.get(), segment.c_str(), static_cast<int>(segment.size())),
        &curl_free};
    if (!escaped) {
        throw std::runtime_error("Failed to escape URL segment: " + segment);
    }
    return std::string{escaped.get()};
}

} // namespace bulkfetch::detail
