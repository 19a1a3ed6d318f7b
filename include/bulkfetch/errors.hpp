#pragma once

#include <stdexcept>
#include <string>

namespace bulkfetch {

// Base of every failure a transfer surfaces to its caller. Cancellation is
// not a failure and never travels as an exception.
class TransferFailed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The initial response had a non-success status, or the request never got one.
// status_code is 0 when no HTTP status was received.
class RequestFailed : public TransferFailed {
public:
    RequestFailed(long status_code, const std::string& message)
        : TransferFailed(message), status_code_(status_code) {}

    [[nodiscard]] long statusCode() const noexcept { return status_code_; }

private:
    long status_code_;
};

class StreamReadError : public TransferFailed {
public:
    using TransferFailed::TransferFailed;
};

class MaterializationError : public TransferFailed {
public:
    using TransferFailed::TransferFailed;
};

} // namespace bulkfetch
