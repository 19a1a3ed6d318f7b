#pragma once

#include "artifact_materializer.hpp"
#include "cancellation.hpp"
#include "progress_estimator.hpp"
#include "transfer_request.hpp"
#include "transfer_state.hpp"
#include "transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace bulkfetch {

enum class TransferOutcome { Completed, Cancelled };

enum class TransferPhase { Idle, Requesting, Streaming, Finalizing };

[[nodiscard]] const char* toString(TransferOutcome outcome) noexcept;
[[nodiscard]] const char* toString(TransferPhase phase) noexcept;

struct ControllerOptions {
    // How long a completed transfer stays visible before the state goes idle.
    std::chrono::milliseconds grace_delay{500};
    HeuristicTicker::Options ticker{};
    std::size_t error_body_limit{4096};
};

// Runs at most one transfer at a time. Starting a transfer supersedes the one
// in flight; the superseded transfer is dropped without being materialized
// unless it is already finalizing, in which case it still saves its artifact.
class TransferController {
public:
    TransferController(TransportPtr transport,
                       ArtifactMaterializer materializer,
                       ControllerOptions options = {});
    ~TransferController();

    TransferController(const TransferController&) = delete;
    TransferController& operator=(const TransferController&) = delete;

    // Runs the transfer on the calling thread. Returns Cancelled when the
    // transfer was cancelled or superseded; throws TransferFailed otherwise.
    TransferOutcome start(const TransferRequest& request);

    // Same as start() on a worker thread. The controller must outlive the future.
    [[nodiscard]] std::future<TransferOutcome> startAsync(TransferRequest request);

    // No-op when idle or finalizing.
    void cancel();

    [[nodiscard]] TransferStateHolder& state() noexcept { return state_; }
    [[nodiscard]] const TransferStateHolder& state() const noexcept { return state_; }
    [[nodiscard]] TransferPhase phase() const;

    // Where the most recent successful transfer was saved.
    [[nodiscard]] std::optional<std::filesystem::path> lastSavedPath() const;

private:
    struct PendingReset {
        std::uint64_t generation;
        std::chrono::steady_clock::time_point deadline;
    };

    std::uint64_t beginTransfer(const TransferRequest& request, CancellationToken& token);
    TransferOutcome runTransfer(const TransferRequest& request,
                                std::uint64_t generation,
                                const CancellationToken& token);
    bool enterPhase(std::uint64_t generation, TransferPhase phase);
    bool enterFinalizing(std::uint64_t generation, const CancellationToken& token);
    void releaseControl(std::uint64_t generation);
    TransferOutcome finishCancelled(std::uint64_t generation);
    void failTransfer(std::uint64_t generation);

    void scheduleReset(std::uint64_t generation);
    void resetLoop();
    void completeReset(std::uint64_t generation);

    TransportPtr transport_;
    ArtifactMaterializer materializer_;
    ControllerOptions options_;
    TransferStateHolder state_;

    mutable std::mutex control_mutex_;
    std::optional<CancellationSource> current_source_;
    std::uint64_t current_generation_{0};
    std::uint64_t next_generation_{0};
    TransferPhase phase_{TransferPhase::Idle};
    std::optional<std::filesystem::path> last_saved_path_;
    std::uint64_t last_saved_generation_{0};

    std::mutex materialize_mutex_;

    std::mutex running_mutex_;
    std::condition_variable running_cv_;
    std::size_t running_{0};

    std::mutex reset_mutex_;
    std::condition_variable reset_cv_;
    std::optional<PendingReset> pending_reset_;
    bool shutting_down_{false};
    std::thread reset_thread_;
};

} // namespace bulkfetch
