//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Serial lint-cycle scheduler with single-flight supersession.
///
/// Cycles run one at a time on a dedicated thread so the protocol read loop
/// never blocks on analysis. Submitting a cycle supersedes every cycle queued
/// or running before it, for any document. A running cycle binds the analysis
/// request it is waiting on to its token; superseding the cycle hands that
/// request to the abort handler.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_LSP_CYCLE_SCHEDULER_H
#define DRAFTLINT_LSP_CYCLE_SCHEDULER_H

#include "draftlint/LSP/Telemetry.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace draftlint::lsp
{

/// @brief Aborts an analysis request that belonged to a superseded cycle.
using RequestAbortHandler = std::function<void(const std::string& documentUri, std::uint64_t requestId)>;

/// @brief Scheduler-owned state of one cycle.
struct CycleState;

/// @brief Per-cycle handle passed to the cycle body.
class CycleToken final
{
public:
    explicit CycleToken(std::shared_ptr<CycleState> state);

    /// @brief Returns whether a newer trigger has superseded this cycle.
    [[nodiscard]] bool isSuperseded() const;

    /// @brief Records the analysis request the cycle is about to await.
    /// @return `false` when the cycle is already superseded; nothing is bound then.
    [[nodiscard]] bool bindRequest(std::uint64_t requestId) const;

    /// @brief Forgets a bound request once its outcome has arrived.
    void releaseRequest(std::uint64_t requestId) const;

    /// @brief Document the cycle analyses.
    [[nodiscard]] const std::string& documentUri() const;

private:
    std::shared_ptr<CycleState> state_;
};

/// @brief Final report for one submitted cycle.
struct CycleCompletion final
{
    /// @brief Monotonic sequence number assigned by `submit`.
    std::uint64_t sequence{0};

    /// @brief How the cycle ended. Cycles superseded before they started are
    /// reported as `Superseded`; cycle bodies that throw as `Failed`.
    CycleOutcome outcome{CycleOutcome::Superseded};

    /// @brief `"<label>: <what>"` when the body threw.
    std::string errorMessage;

    /// @brief Time spent in the cycle body.
    std::uint64_t latencyMicros{0};
};

/// @brief Cycle body; runs on the scheduler thread.
using CycleTask = std::function<CycleOutcome(const CycleToken& token)>;

/// @brief Invoked once per submitted cycle on the scheduler thread.
using CycleCompletionHandler = std::function<void(const CycleCompletion& completion)>;

/// @brief Single-threaded, single-flight scheduler for lint cycles.
class CycleScheduler final
{
public:
    /// @param[in] abortHandler Called outside scheduler locks for each request
    ///            bound to a cycle at the moment it is superseded.
    explicit CycleScheduler(RequestAbortHandler abortHandler);
    ~CycleScheduler();

    CycleScheduler(const CycleScheduler&)            = delete;
    CycleScheduler& operator=(const CycleScheduler&) = delete;

    /// @brief Supersedes all earlier cycles, then queues a new one.
    /// @param[in] documentUri Document the cycle analyses.
    /// @param[in] label Short label for failure messages.
    /// @param[in] task Cycle body.
    /// @param[in] completion Completion handler; may be empty.
    /// @return Sequence number, or nothing once the scheduler is shut down.
    std::optional<std::uint64_t> submit(std::string            documentUri,
                                        std::string            label,
                                        CycleTask              task,
                                        CycleCompletionHandler completion);

    /// @brief Supersedes queued and running cycles of one document.
    /// @return Number of cycles newly superseded.
    std::size_t supersede(const std::string& documentUri);

    /// @brief Supersedes every queued and running cycle.
    /// @return Number of cycles newly superseded.
    std::size_t supersedeAll();

    /// @brief Blocks until the queue is empty and no cycle is running.
    void waitForIdle();

    /// @brief Number of cycles queued or running.
    [[nodiscard]] std::size_t pendingCount() const;

    /// @brief Supersedes outstanding cycles, reports them, and joins the thread.
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace draftlint::lsp

#endif  // DRAFTLINT_LSP_CYCLE_SCHEDULER_H
