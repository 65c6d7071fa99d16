//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the analysis worker channel.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Worker/AnalysisWorkerChannel.h"

#include "llvm/Support/FormatVariadic.h"

#include <utility>

namespace draftlint::worker
{
namespace
{

std::future<AnalysisOutcome> readyOutcome(const AnalysisStatus status, std::string errorMessage)
{
    std::promise<AnalysisOutcome> promise;
    AnalysisOutcome               outcome;
    outcome.status       = status;
    outcome.errorMessage = std::move(errorMessage);
    promise.set_value(std::move(outcome));
    return promise.get_future();
}

}  // namespace

llvm::StringRef analysisStatusName(const AnalysisStatus status)
{
    switch (status)
    {
    case AnalysisStatus::Completed:
        return "completed";
    case AnalysisStatus::Failed:
        return "failed";
    case AnalysisStatus::Aborted:
        return "aborted";
    case AnalysisStatus::Unavailable:
        return "unavailable";
    }
    return "failed";
}

AnalysisWorkerChannel::AnalysisWorkerChannel(WorkerFactory factory, Logger& logger)
    : factory_(std::move(factory))
    , logger_(logger)
{
}

AnalysisWorkerChannel::~AnalysisWorkerChannel()
{
    shutdown();
}

std::uint64_t AnalysisWorkerChannel::nextRequestId()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return nextId_++;
}

std::future<AnalysisOutcome> AnalysisWorkerChannel::submit(AnalysisRequest request)
{
    reapRetiredWorkers();

    WorkerFactory factory;
    std::uint64_t generation = 0;
    bool          needWorker = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
        {
            return readyOutcome(AnalysisStatus::Unavailable, "analysis channel is shut down");
        }
        needWorker = !worker_;
        factory    = factory_;
        generation = generation_ + 1U;
    }

    // The factory runs without the channel lock; a fresh worker may call back at once.
    std::shared_ptr<AnalysisWorker> created;
    if (needWorker)
    {
        if (!factory)
        {
            return readyOutcome(AnalysisStatus::Unavailable, "no analysis worker factory configured");
        }
        WorkerEndpoint endpoint;
        endpoint.onMessage = [this, generation](llvm::json::Value message) {
            onWorkerMessage(generation, std::move(message));
        };
        endpoint.onExit = [this, generation](const int exitCode) { onWorkerExit(generation, exitCode); };

        auto worker = factory(std::move(endpoint));
        if (!worker)
        {
            const std::string detail = llvm::toString(worker.takeError());
            logger_.error(llvm::formatv("[worker] unavailable: {0}", detail));
            return readyOutcome(AnalysisStatus::Unavailable, detail);
        }
        created = std::move(*worker);
        logger_.verbose(llvm::formatv("[worker] started generation {0}", generation));
    }

    std::shared_ptr<AnalysisWorker> target;
    std::shared_ptr<AnalysisWorker> surplus;
    std::future<AnalysisOutcome>    future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
        {
            surplus = std::move(created);
        }
        else if (created && !worker_ && generation == generation_ + 1U)
        {
            worker_     = std::move(created);
            generation_ = generation;
        }
        else
        {
            surplus = std::move(created);
        }

        if (stopped_ || !worker_)
        {
            future = readyOutcome(AnalysisStatus::Unavailable, "analysis worker is not running");
        }
        else if (pending_.contains(request.id))
        {
            future = readyOutcome(AnalysisStatus::Failed, llvm::formatv("duplicate request id {0}", request.id).str());
        }
        else
        {
            PendingRequest entry;
            entry.generation = generation_;
            future           = entry.promise.get_future();
            pending_.emplace(request.id, std::move(entry));
            target = worker_;
        }
    }

    if (surplus)
    {
        surplus->terminate();
    }
    if (target)
    {
        target->post(encodeLintRequest(request));
    }
    return future;
}

bool AnalysisWorkerChannel::abort(const std::uint64_t id)
{
    PendingRequest                  entry;
    std::shared_ptr<AnalysisWorker> worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = pending_.find(id);
        if (it == pending_.end())
        {
            return false;
        }
        entry = std::move(it->second);
        pending_.erase(it);
        if (entry.generation == generation_)
        {
            worker = worker_;
        }
    }

    AnalysisOutcome outcome;
    outcome.status = AnalysisStatus::Aborted;
    entry.promise.set_value(std::move(outcome));
    if (worker)
    {
        worker->post(encodeAbort(id));
    }
    logger_.verbose(llvm::formatv("[worker] aborted request {0}", id));
    return true;
}

void AnalysisWorkerChannel::replaceFactory(WorkerFactory factory)
{
    std::shared_ptr<AnalysisWorker> old;
    std::uint64_t                   generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory_   = std::move(factory);
        old        = std::move(worker_);
        generation = generation_;
        worker_.reset();
    }
    failPending(generation, "analysis worker was replaced");
    if (old)
    {
        old->terminate();
    }
}

void AnalysisWorkerChannel::shutdown()
{
    std::shared_ptr<AnalysisWorker>                   old;
    std::vector<std::shared_ptr<AnalysisWorker>>      retired;
    std::unordered_map<std::uint64_t, PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        old      = std::move(worker_);
        worker_.reset();
        retired.swap(retiredWorkers_);
        pending.swap(pending_);
    }

    for (auto& [_, entry] : pending)
    {
        AnalysisOutcome outcome;
        outcome.status       = AnalysisStatus::Failed;
        outcome.errorMessage = "analysis channel is shut down";
        entry.promise.set_value(std::move(outcome));
    }
    if (old)
    {
        old->terminate();
    }
    for (const auto& worker : retired)
    {
        worker->terminate();
    }
}

std::size_t AnalysisWorkerChannel::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::uint64_t AnalysisWorkerChannel::workerGeneration() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

void AnalysisWorkerChannel::onWorkerMessage(const std::uint64_t generation, llvm::json::Value message)
{
    const auto command = messageCommand(message);
    if (!command)
    {
        logger_.verbose("[worker] dropping message without command");
        return;
    }
    if (*command == "log")
    {
        llvm::StringRef text;
        if (const auto value = message.getAsObject()->getString("message"))
        {
            text = *value;
        }
        logger_.verbose(llvm::Twine("[worker] ") + text);
        return;
    }
    if (*command != "lint_result" && *command != "error")
    {
        logger_.verbose(llvm::formatv("[worker] dropping unexpected '{0}' message", *command));
        return;
    }

    const auto id = messageId(message);
    if (!id)
    {
        logger_.verbose(llvm::formatv("[worker] dropping '{0}' message without id", *command));
        return;
    }

    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = pending_.find(*id);
        if (it == pending_.end() || it->second.generation != generation)
        {
            logger_.verbose(llvm::formatv("[worker] dropping reply for settled request {0}", *id));
            return;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    AnalysisOutcome outcome;
    if (*command == "error")
    {
        const auto* object   = message.getAsObject();
        const auto  error    = object->getString("error");
        outcome.status       = AnalysisStatus::Failed;
        outcome.errorMessage = error ? error->str() : std::string("unknown worker error");
    }
    else
    {
        auto decoded = decodeLintResult(message);
        if (decoded)
        {
            outcome.status   = AnalysisStatus::Completed;
            outcome.messages = std::move(*decoded);
        }
        else
        {
            outcome.status       = AnalysisStatus::Failed;
            outcome.errorMessage = llvm::toString(decoded.takeError());
        }
    }
    logger_.verbose(llvm::formatv("[worker] request {0} {1}", *id, analysisStatusName(outcome.status)));
    entry.promise.set_value(std::move(outcome));
}

void AnalysisWorkerChannel::onWorkerExit(const std::uint64_t generation, const int exitCode)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_ && worker_)
        {
            // Joined later from a caller thread; this may be the worker's own thread.
            retiredWorkers_.push_back(std::move(worker_));
            worker_.reset();
        }
    }
    logger_.error(llvm::formatv("[worker] exited unexpectedly with code {0}", exitCode));
    failPending(generation, llvm::formatv("analysis worker exited with code {0}", exitCode).str());
}

void AnalysisWorkerChannel::failPending(const std::uint64_t generation, const std::string& reason)
{
    std::vector<PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();)
        {
            if (it->second.generation != generation)
            {
                ++it;
                continue;
            }
            failed.push_back(std::move(it->second));
            it = pending_.erase(it);
        }
    }
    for (PendingRequest& entry : failed)
    {
        AnalysisOutcome outcome;
        outcome.status       = AnalysisStatus::Failed;
        outcome.errorMessage = reason;
        entry.promise.set_value(std::move(outcome));
    }
}

void AnalysisWorkerChannel::reapRetiredWorkers()
{
    std::vector<std::shared_ptr<AnalysisWorker>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(retiredWorkers_);
    }
    for (const auto& worker : retired)
    {
        worker->terminate();
    }
}

}  // namespace draftlint::worker
