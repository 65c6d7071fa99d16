//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cancellable request/response channel to the analysis worker.
///
/// Every submission gets a process-unique id and a pending entry resolved by
/// the worker's `lint_result` or `error` reply. Aborting an id resolves its
/// waiter immediately and tells the worker to drop the job; a reply that
/// arrives for an id no longer pending is discarded. The worker is created on
/// first use and re-created on the next submission after it dies.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_WORKER_ANALYSIS_WORKER_CHANNEL_H
#define DRAFTLINT_WORKER_ANALYSIS_WORKER_CHANNEL_H

#include "draftlint/Support/Diagnostics.h"
#include "draftlint/Support/Logging.h"
#include "draftlint/Worker/AnalysisWorker.h"
#include "draftlint/Worker/WorkerProtocol.h"

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace draftlint::worker
{

/// @brief Terminal state of one analysis round-trip.
enum class AnalysisStatus
{
    /// @brief Worker replied with messages.
    Completed,

    /// @brief Worker replied with an error or died mid-request.
    Failed,

    /// @brief Request was aborted before a reply was accepted.
    Aborted,

    /// @brief No worker could be started.
    Unavailable,
};

/// @brief Result envelope for one analysis round-trip.
struct AnalysisOutcome final
{
    /// @brief Terminal state.
    AnalysisStatus status{AnalysisStatus::Failed};

    /// @brief Raw rule messages when completed.
    std::vector<RuleMessage> messages;

    /// @brief Failure detail when failed or unavailable.
    std::string errorMessage;
};

/// @brief Returns a stable lowercase name for an analysis status.
[[nodiscard]] llvm::StringRef analysisStatusName(AnalysisStatus status);

/// @brief Channel owning the lazily created analysis worker.
class AnalysisWorkerChannel final
{
public:
    /// @brief Constructs a channel; no worker is started yet.
    /// @param[in] factory Worker factory used on first use and after a crash.
    /// @param[in] logger Advisory log sink; must outlive the channel.
    AnalysisWorkerChannel(WorkerFactory factory, Logger& logger);
    ~AnalysisWorkerChannel();

    AnalysisWorkerChannel(const AnalysisWorkerChannel&)            = delete;
    AnalysisWorkerChannel& operator=(const AnalysisWorkerChannel&) = delete;

    /// @brief Allocates the next request id.
    [[nodiscard]] std::uint64_t nextRequestId();

    /// @brief Posts a request to the worker.
    /// @param[in] request Request; `id` must come from `nextRequestId`.
    /// @return Future resolved exactly once with the outcome.
    [[nodiscard]] std::future<AnalysisOutcome> submit(AnalysisRequest request);

    /// @brief Aborts a pending request.
    /// @param[in] id Request id.
    /// @return `true` when the id was pending.
    bool abort(std::uint64_t id);

    /// @brief Replaces the worker factory and retires the running worker.
    ///
    /// Pending requests of the retired worker fail.
    void replaceFactory(WorkerFactory factory);

    /// @brief Fails outstanding requests and stops the worker.
    void shutdown();

    /// @brief Returns the number of pending requests.
    [[nodiscard]] std::size_t pendingCount() const;

    /// @brief Returns how many workers have been started so far.
    [[nodiscard]] std::uint64_t workerGeneration() const;

private:
    struct PendingRequest final
    {
        std::promise<AnalysisOutcome> promise;
        std::uint64_t                 generation{0};
    };

    void onWorkerMessage(std::uint64_t generation, llvm::json::Value message);
    void onWorkerExit(std::uint64_t generation, int exitCode);
    void failPending(std::uint64_t generation, const std::string& reason);
    void reapRetiredWorkers();

    WorkerFactory                                     factory_;
    Logger&                                           logger_;
    mutable std::mutex                                mutex_;
    std::shared_ptr<AnalysisWorker>                   worker_;
    std::vector<std::shared_ptr<AnalysisWorker>>      retiredWorkers_;
    std::unordered_map<std::uint64_t, PendingRequest> pending_;
    std::uint64_t                                     nextId_{1};
    std::uint64_t                                     generation_{0};
    bool                                              stopped_{false};
};

}  // namespace draftlint::worker

#endif  // DRAFTLINT_WORKER_ANALYSIS_WORKER_CHANNEL_H
