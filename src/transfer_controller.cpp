#include "bulkfetch/transfer_controller.hpp"
#include "bulkfetch/byte_accumulator.hpp"
#include "bulkfetch/errors.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace bulkfetch {

namespace {

// Releases the response on every exit path of a transfer.
class ResponseGuard {
public:
    explicit ResponseGuard(ResponseStream* response) : response_(response) {}
    ~ResponseGuard() {
        if (response_) {
            response_->release();
        }
    }

    ResponseGuard(const ResponseGuard&) = delete;
    ResponseGuard& operator=(const ResponseGuard&) = delete;

private:
    ResponseStream* response_;
};

class RunningGuard {
public:
    RunningGuard(std::mutex& mutex, std::condition_variable& cv, std::size_t& running)
        : mutex_(mutex), cv_(cv), running_(running) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++running_;
    }

    ~RunningGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
        }
        cv_.notify_all();
    }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& cv_;
    std::size_t& running_;
};

} // namespace

const char* toString(TransferOutcome outcome) noexcept {
    switch (outcome) {
    case TransferOutcome::Completed: return "completed";
    case TransferOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* toString(TransferPhase phase) noexcept {
    switch (phase) {
    case TransferPhase::Idle: return "idle";
    case TransferPhase::Requesting: return "requesting";
    case TransferPhase::Streaming: return "streaming";
    case TransferPhase::Finalizing: return "finalizing";
    }
    return "unknown";
}

TransferController::TransferController(TransportPtr transport,
                                       ArtifactMaterializer materializer,
                                       ControllerOptions options)
    : transport_(std::move(transport)),
      materializer_(std::move(materializer)),
      options_(options) {
    if (!transport_) {
        throw std::invalid_argument("TransferController requires a transport");
    }
}

TransferController::~TransferController() {
    cancel();
    {
        std::unique_lock<std::mutex> lock(running_mutex_);
        running_cv_.wait(lock, [this] { return running_ == 0; });
    }
    {
        std::lock_guard<std::mutex> lock(reset_mutex_);
        shutting_down_ = true;
    }
    reset_cv_.notify_all();
    if (reset_thread_.joinable()) {
        reset_thread_.join();
    }
}

TransferOutcome TransferController::start(const TransferRequest& request) {
    request.validate();
    RunningGuard running{running_mutex_, running_cv_, running_};

    CancellationToken token;
    const std::uint64_t generation = beginTransfer(request, token);

    try {
        return runTransfer(request, generation, token);
    } catch (const MaterializationError& ex) {
        failTransfer(generation);
        spdlog::error("Saving {} failed: {}", request.destination_filename, ex.what());
        throw;
    } catch (const TransferFailed& ex) {
        if (token.isCancelled()) {
            // A transport aborted by cancellation is not a failure.
            spdlog::debug("error after cancellation ignored: {}", ex.what());
            return finishCancelled(generation);
        }
        failTransfer(generation);
        spdlog::error("Transfer of {} failed: {}", request.destination_filename, ex.what());
        throw;
    } catch (const std::exception& ex) {
        failTransfer(generation);
        spdlog::error("Transfer of {} aborted: {}", request.destination_filename, ex.what());
        throw;
    }
}

std::future<TransferOutcome> TransferController::startAsync(TransferRequest request) {
    request.validate();
    return std::async(std::launch::async,
                      [this, request = std::move(request)]() { return start(request); });
}

void TransferController::cancel() {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (!current_source_) {
            return;
        }
        if (phase_ == TransferPhase::Finalizing) {
            spdlog::debug("cancel ignored: transfer is finalizing");
            return;
        }
        current_source_->cancel();
        current_source_.reset();
        phase_ = TransferPhase::Idle;
        generation = current_generation_;
    }

    spdlog::info("Transfer cancelled");
    state_.reset(generation);
}

TransferPhase TransferController::phase() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return phase_;
}

std::optional<std::filesystem::path> TransferController::lastSavedPath() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return last_saved_path_;
}

std::uint64_t TransferController::beginTransfer(const TransferRequest& request, CancellationToken& token) {
    CancellationSource source;
    token = source.token();

    std::uint64_t generation = 0;
    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (current_source_) {
            superseded = current_source_->cancel();
        }
        generation = ++next_generation_;
        current_generation_ = generation;
        current_source_ = source;
        phase_ = TransferPhase::Requesting;
    }

    if (superseded) {
        spdlog::warn("Previous transfer superseded by {}", request.destination_filename);
    }
    spdlog::info("Starting transfer of {} ({})",
                 request.destination_filename,
                 status::itemLabel(request.item_count));

    state_.begin(generation, request.item_count, status::compressing(request.item_count));
    return generation;
}

TransferOutcome TransferController::runTransfer(const TransferRequest& request,
                                                std::uint64_t generation,
                                                const CancellationToken& token) {
    ResponseStreamPtr response = transport_->open(request, token);
    if (!response) {
        throw RequestFailed(0, "Transport returned no response for " + request.url);
    }
    ResponseGuard response_guard{response.get()};

    if (token.isCancelled()) {
        return finishCancelled(generation);
    }

    if (!response->isSuccess()) {
        const long status_code = response->statusCode();
        const std::string body = response->errorBody(options_.error_body_limit, token);
        if (token.isCancelled()) {
            return finishCancelled(generation);
        }
        if (body.empty()) {
            throw RequestFailed(status_code, fmt::format("Request failed with status {}", status_code));
        }
        throw RequestFailed(status_code,
                            fmt::format("Request failed with status {}: {}", status_code, body));
    }

    if (!enterPhase(generation, TransferPhase::Streaming)) {
        return finishCancelled(generation);
    }

    ProgressEstimator estimator{response->contentLength()};
    ByteAccumulator accumulator;
    std::unique_ptr<HeuristicTicker> ticker;

    if (estimator.hasKnownTotal()) {
        state_.setTotal(generation, estimator.totalBytes(), status::downloading(request.item_count));
    } else {
        ticker = std::make_unique<HeuristicTicker>(
            options_.ticker, token,
            [this, generation](int percent) { state_.advance(generation, percent, 0); });
        ticker->start();
    }

    while (true) {
        if (token.isCancelled()) {
            if (ticker) {
                ticker->stop();
            }
            response->release();
            accumulator.invalidate();
            return finishCancelled(generation);
        }

        std::optional<Chunk> chunk;
        try {
            chunk = response->read(token);
        } catch (const StreamReadError&) {
            if (ticker) {
                ticker->stop();
            }
            accumulator.invalidate();
            throw;
        }

        if (!chunk) {
            break;
        }
        if (chunk->empty()) {
            continue;
        }

        const std::size_t length = chunk->size();
        accumulator.append(std::move(*chunk));
        const int percent = estimator.onChunk(accumulator.receivedBytes());
        state_.advance(generation, percent, accumulator.receivedBytes());
        spdlog::debug("chunk {} ({} bytes, {} total)", accumulator.chunkCount(), length,
                      accumulator.receivedBytes());
    }

    if (ticker) {
        ticker->stop();
    }
    response->release();

    if (!enterFinalizing(generation, token)) {
        accumulator.invalidate();
        return finishCancelled(generation);
    }

    state_.finalize(generation, status::finalizing());
    const std::uint64_t received = accumulator.receivedBytes();
    std::filesystem::path saved;
    {
        std::lock_guard<std::mutex> lock(materialize_mutex_);
        saved = materializer_.materialize(accumulator.take(), request.destination_filename);
    }
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (generation >= last_saved_generation_) {
            last_saved_generation_ = generation;
            last_saved_path_ = saved;
        }
    }

    spdlog::info("Transfer of {} complete ({} bytes)", request.destination_filename, received);
    scheduleReset(generation);
    return TransferOutcome::Completed;
}

bool TransferController::enterPhase(std::uint64_t generation, TransferPhase phase) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (generation != current_generation_ || !current_source_) {
        return false;
    }
    phase_ = phase;
    return true;
}

bool TransferController::enterFinalizing(std::uint64_t generation, const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    // Decided under the lock so that cancel() either wins or sees Finalizing.
    if (token.isCancelled()) {
        return false;
    }
    if (generation == current_generation_) {
        phase_ = TransferPhase::Finalizing;
    }
    return true;
}

void TransferController::releaseControl(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (generation != current_generation_) {
        return;
    }
    current_source_.reset();
    phase_ = TransferPhase::Idle;
}

TransferOutcome TransferController::finishCancelled(std::uint64_t generation) {
    releaseControl(generation);
    state_.reset(generation);
    spdlog::debug("transfer {} stopped after cancellation", generation);
    return TransferOutcome::Cancelled;
}

void TransferController::failTransfer(std::uint64_t generation) {
    releaseControl(generation);
    state_.reset(generation);
}

void TransferController::scheduleReset(std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        // A superseded transfer no longer owns the state.
        if (generation != current_generation_) {
            spdlog::debug("reset for superseded transfer {} skipped", generation);
            return;
        }
    }

    if (options_.grace_delay.count() <= 0) {
        completeReset(generation);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(reset_mutex_);
        if (pending_reset_ && pending_reset_->generation > generation) {
            return;
        }
        pending_reset_ = PendingReset{generation,
                                      std::chrono::steady_clock::now() + options_.grace_delay};
        if (!reset_thread_.joinable()) {
            reset_thread_ = std::thread([this] { resetLoop(); });
        }
    }
    reset_cv_.notify_all();
}

void TransferController::resetLoop() {
    std::unique_lock<std::mutex> lock(reset_mutex_);
    while (true) {
        reset_cv_.wait(lock, [this] { return shutting_down_ || pending_reset_.has_value(); });
        if (!pending_reset_) {
            return;
        }

        const PendingReset pending = *pending_reset_;
        const bool interrupted = reset_cv_.wait_until(lock, pending.deadline, [this, &pending] {
            return shutting_down_ || !pending_reset_ ||
                   pending_reset_->generation != pending.generation;
        });
        if (interrupted && !shutting_down_) {
            continue;
        }

        pending_reset_.reset();
        lock.unlock();
        completeReset(pending.generation);
        lock.lock();
        if (shutting_down_) {
            return;
        }
    }
}

void TransferController::completeReset(std::uint64_t generation) {
    releaseControl(generation);
    state_.reset(generation);
}

} // namespace bulkfetch
