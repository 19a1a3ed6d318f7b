#include "bulkfetch/curl_transport.hpp"
#include "bulkfetch/detail/curl_utils.hpp"
#include "bulkfetch/errors.hpp"

#include <algorithm>
#include <deque>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace bulkfetch {

namespace {

class CurlResponseStream final : public ResponseStream {
public:
    CurlResponseStream(const TransferRequest& request, const CurlTransportOptions& options)
        : options_(options),
          easy_(detail::makeCurlHandle()),
          multi_(curl_multi_init(), &curl_multi_cleanup),
          headers_(nullptr, &curl_slist_free_all) {
        if (!multi_) {
            throw RequestFailed(0, "Failed to allocate curl multi handle");
        }

        CURL* curl = easy_.get();
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_peer ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.connect_timeout.count()));
        if (options_.idle_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                             static_cast<long>(options_.idle_timeout.count()));
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlResponseStream::writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlResponseStream::headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);

        curl_slist* list = nullptr;
        for (const auto& header : request.headers) {
            const auto line = header.first + ": " + header.second;
            curl_slist* appended = curl_slist_append(list, line.c_str());
            if (!appended) {
                curl_slist_free_all(list);
                throw RequestFailed(0, "Failed to build request headers");
            }
            list = appended;
        }
        headers_.reset(list);
        if (headers_) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_.get());
        }

        if (request.method == "GET") {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        } else if (request.method == "POST") {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, request.body.c_str());
        } else {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            if (!request.body.empty()) {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, request.body.c_str());
            }
        }

        if (curl_multi_add_handle(multi_.get(), curl) != CURLM_OK) {
            throw RequestFailed(0, "Failed to register curl handle");
        }
        attached_ = true;
    }

    ~CurlResponseStream() override { release(); }

    // Drives the transfer until the final response headers are in.
    void awaitHeaders(const CancellationToken& token) {
        while (!headers_complete_ && !done_) {
            if (token.isCancelled()) {
                return;
            }
            pump();
            if (!headers_complete_ && !done_) {
                poll();
            }
        }

        if (done_ && result_ != CURLE_OK && status_ == 0) {
            throw RequestFailed(0, fmt::format("curl error: {}", curl_easy_strerror(result_)));
        }
    }

    [[nodiscard]] long statusCode() const override { return status_; }

    [[nodiscard]] std::optional<std::uint64_t> contentLength() const override {
        if (!easy_) {
            return std::nullopt;
        }
        curl_off_t length = -1;
        if (curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK ||
            length <= 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(length);
    }

    std::optional<Chunk> read(const CancellationToken& token) override {
        while (true) {
            if (!pending_.empty()) {
                Chunk chunk = std::move(pending_.front());
                pending_.pop_front();
                return chunk;
            }
            if (done_) {
                if (result_ != CURLE_OK) {
                    throw StreamReadError(fmt::format("curl error: {}", curl_easy_strerror(result_)));
                }
                return std::nullopt;
            }
            if (!attached_) {
                throw StreamReadError("Response stream already released");
            }
            if (token.isCancelled()) {
                return Chunk{};
            }

            pump();
            if (pending_.empty() && !done_) {
                poll();
            }
        }
    }

    [[nodiscard]] std::string errorBody(std::size_t limit, const CancellationToken& token) override {
        std::string body;
        try {
            while (body.size() < limit) {
                auto chunk = read(token);
                if (!chunk || (chunk->empty() && token.isCancelled())) {
                    break;
                }
                const std::size_t take = std::min(limit - body.size(), chunk->size());
                body.append(reinterpret_cast<const char*>(chunk->data()), take);
            }
        } catch (const StreamReadError& ex) {
            spdlog::debug("error body truncated: {}", ex.what());
        }
        return body;
    }

    void release() noexcept override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
            attached_ = false;
        }
        easy_.reset();
        multi_.reset();
        pending_.clear();
    }

private:
    using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    void pump() {
        int running = 0;
        const CURLMcode code = curl_multi_perform(multi_.get(), &running);
        if (code != CURLM_OK) {
            throw StreamReadError(fmt::format("curl multi error: {}", curl_multi_strerror(code)));
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
            if (msg->msg != CURLMSG_DONE) {
                continue;
            }
            done_ = true;
            result_ = msg->data.result;
            if (!headers_complete_) {
                long code_value = 0;
                curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code_value);
                status_ = code_value;
                headers_complete_ = true;
            }
        }
    }

    void poll() {
        const CURLMcode code = curl_multi_poll(multi_.get(), nullptr, 0,
                                               static_cast<int>(options_.poll_interval.count()),
                                               nullptr);
        if (code != CURLM_OK) {
            throw StreamReadError(fmt::format("curl multi error: {}", curl_multi_strerror(code)));
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        if (!self) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (!self->headers_complete_) {
            self->completeHeaders();
        }
        if (total > 0) {
            const auto* bytes = reinterpret_cast<const std::uint8_t*>(ptr);
            self->pending_.emplace_back(bytes, bytes + total);
        }
        return total;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        const size_t total = size * nitems;
        if (!self) {
            return 0;
        }

        const bool blank_line = (total == 2 && buffer[0] == '\r' && buffer[1] == '\n') ||
                                (total == 1 && buffer[0] == '\n');
        if (!blank_line || self->headers_complete_) {
            return total;
        }

        long code = 0;
        curl_easy_getinfo(self->easy_.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code >= 100 && code < 200) {
            return total;
        }
        if (self->options_.follow_redirects && code >= 300 && code < 400) {
            char* location = nullptr;
            curl_easy_getinfo(self->easy_.get(), CURLINFO_REDIRECT_URL, &location);
            if (location) {
                return total;
            }
        }

        self->status_ = code;
        self->headers_complete_ = true;
        return total;
    }

    void completeHeaders() {
        long code = 0;
        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
        status_ = code;
        headers_complete_ = true;
    }

    CurlTransportOptions options_;
    detail::CurlHandle easy_;
    MultiHandle multi_;
    HeaderList headers_;

    std::deque<Chunk> pending_;
    bool attached_{false};
    bool headers_complete_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};
    long status_{0};
};

} // namespace

class CurlTransport::Impl {
public:
    explicit Impl(CurlTransportOptions options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    ResponseStreamPtr open(const TransferRequest& request, const CancellationToken& token) {
        spdlog::debug("{} {}", request.method, request.url);

        auto stream = std::make_unique<CurlResponseStream>(request, options_);
        stream->awaitHeaders(token);
        if (!token.isCancelled()) {
            spdlog::debug("response {} for {}", stream->statusCode(), request.url);
        }
        return stream;
    }

private:
    CurlTransportOptions options_;
};

CurlTransport::CurlTransport(CurlTransportOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransport::~CurlTransport() = default;

ResponseStreamPtr CurlTransport::open(const TransferRequest& request, const CancellationToken& token) {
    return impl_->open(request, token);
}

} // namespace bulkfetch
