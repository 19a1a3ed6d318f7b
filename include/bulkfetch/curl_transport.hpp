#pragma once

#include "transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace bulkfetch {

struct CurlTransportOptions {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    // A read that delivers no byte for this long fails the stream. Zero disables it.
    std::chrono::seconds idle_timeout{60};
    // Upper bound between two cancellation checks while waiting on the socket.
    std::chrono::milliseconds poll_interval{100};
    std::string user_agent{"bulkfetch/1.0"};
    bool follow_redirects{true};
    bool verify_peer{true};
};

class CurlTransport final : public Transport {
public:
    explicit CurlTransport(CurlTransportOptions options = {});
    ~CurlTransport() override;

    ResponseStreamPtr open(const TransferRequest& request, const CancellationToken& token) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bulkfetch
