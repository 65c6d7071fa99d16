//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Background analysis worker reached only through JSON messages.
///
/// A worker receives `lint` and `abort` messages through `post` and answers
/// through the endpoint callbacks it was created with. It keeps an active-job
/// set: `abort` removes an id, and a job whose id was removed never posts its
/// result.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_WORKER_ANALYSIS_WORKER_H
#define DRAFTLINT_WORKER_ANALYSIS_WORKER_H

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace draftlint::worker
{

/// @brief Callbacks a worker uses to talk back to its owner.
struct WorkerEndpoint final
{
    /// @brief Receives `lint_result`, `error`, and `log` messages.
    std::function<void(llvm::json::Value message)> onMessage;

    /// @brief Invoked once when the worker stops unexpectedly.
    std::function<void(int exitCode)> onExit;
};

/// @brief Message-driven analysis worker.
class AnalysisWorker
{
public:
    virtual ~AnalysisWorker() = default;

    /// @brief Delivers one message to the worker; never blocks on analysis.
    /// @param[in] message `lint` or `abort` message.
    virtual void post(llvm::json::Value message) = 0;

    /// @brief Stops the worker and joins its execution context.
    ///
    /// `onExit` is not invoked for a requested termination.
    virtual void terminate() = 0;
};

/// @brief Creates a worker bound to an endpoint.
using WorkerFactory = std::function<llvm::Expected<std::unique_ptr<AnalysisWorker>>(WorkerEndpoint endpoint)>;

/// @brief Returns a factory producing rule-engine workers.
///
/// Each worker owns one rule engine with the built-in rules plus the rules
/// registered by `pluginLibraries`. A library that fails to load makes the
/// factory fail, so the channel reports the worker as unavailable.
/// @param[in] pluginLibraries Rule-pack shared library paths.
[[nodiscard]] WorkerFactory makeRuleEngineWorkerFactory(std::vector<std::string> pluginLibraries);

}  // namespace draftlint::worker

#endif  // DRAFTLINT_WORKER_ANALYSIS_WORKER_H
