#pragma once

#include "byte_accumulator.hpp"
#include "cancellation.hpp"
#include "transfer_request.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bulkfetch {

// One open response. Reads are pull-based and happen in arrival order.
class ResponseStream {
public:
    virtual ~ResponseStream() = default;

    [[nodiscard]] virtual long statusCode() const = 0;

    // Declared body length, if the server sent one and it is non-zero.
    [[nodiscard]] virtual std::optional<std::uint64_t> contentLength() const = 0;

    // Next chunk of the body, or std::nullopt once the body is exhausted.
    // Returns an empty chunk if the token is cancelled while waiting.
    // Throws StreamReadError on transport failure.
    virtual std::optional<Chunk> read(const CancellationToken& token) = 0;

    // Drains at most `limit` bytes of an error body for diagnostics. Stops
    // early with what it has when the token is cancelled.
    [[nodiscard]] virtual std::string errorBody(std::size_t limit, const CancellationToken& token) = 0;

    // Releases the connection. Safe to call more than once.
    virtual void release() noexcept = 0;

    [[nodiscard]] bool isSuccess() const { return statusCode() >= 200 && statusCode() < 300; }
};

using ResponseStreamPtr = std::unique_ptr<ResponseStream>;

class Transport {
public:
    virtual ~Transport() = default;

    // Issues the request and returns once the response status is known.
    // Throws RequestFailed if no response could be obtained.
    virtual ResponseStreamPtr open(const TransferRequest& request, const CancellationToken& token) = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace bulkfetch
