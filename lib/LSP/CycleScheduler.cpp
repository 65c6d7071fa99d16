//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the single-flight lint-cycle scheduler.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/CycleScheduler.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace draftlint::lsp
{

struct CycleState final
{
    std::uint64_t                sequence{0};
    std::string                  documentUri;
    std::mutex                   mutex;
    bool                         superseded{false};
    std::optional<std::uint64_t> boundRequest;
};

CycleToken::CycleToken(std::shared_ptr<CycleState> state)
    : state_(std::move(state))
{
}

bool CycleToken::isSuperseded() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->superseded;
}

bool CycleToken::bindRequest(const std::uint64_t requestId) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->superseded)
    {
        return false;
    }
    state_->boundRequest = requestId;
    return true;
}

void CycleToken::releaseRequest(const std::uint64_t requestId) const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->boundRequest == requestId)
    {
        state_->boundRequest.reset();
    }
}

const std::string& CycleToken::documentUri() const
{
    return state_->documentUri;
}

class CycleScheduler::Impl final
{
public:
    explicit Impl(RequestAbortHandler abortHandler)
        : abortHandler_(std::move(abortHandler))
        , thread_([this]() { run(); })
    {
    }

    ~Impl()
    {
        shutdown();
    }

    std::optional<std::uint64_t> submit(std::string            documentUri,
                                        std::string            label,
                                        CycleTask              task,
                                        CycleCompletionHandler completion)
    {
        std::vector<BoundRequest> aborts;
        std::uint64_t             sequence = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return std::nullopt;
            }
            supersedeLocked([](const CycleState&) { return true; }, aborts);

            auto state         = std::make_shared<CycleState>();
            state->sequence    = ++nextSequence_;
            state->documentUri = std::move(documentUri);
            sequence           = state->sequence;
            queue_.push_back(Cycle{std::move(state), std::move(label), std::move(task), std::move(completion)});
        }
        abortAll(aborts);
        cv_.notify_one();
        return sequence;
    }

    std::size_t supersede(const std::string& documentUri)
    {
        std::vector<BoundRequest> aborts;
        std::size_t               count = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto sameDocument = [&documentUri](const CycleState& state) {
                return state.documentUri == documentUri;
            };
            count = supersedeLocked(sameDocument, aborts);
        }
        abortAll(aborts);
        return count;
    }

    std::size_t supersedeAll()
    {
        std::vector<BoundRequest> aborts;
        std::size_t               count = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            count = supersedeLocked([](const CycleState&) { return true; }, aborts);
        }
        abortAll(aborts);
        return count;
    }

    void waitForIdle()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return queue_.empty() && !running_; });
    }

    std::size_t pendingCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size() + (running_ ? 1U : 0U);
    }

    void shutdown()
    {
        std::vector<BoundRequest> aborts;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
            supersedeLocked([](const CycleState&) { return true; }, aborts);
        }
        abortAll(aborts);
        cv_.notify_all();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

private:
    struct Cycle final
    {
        std::shared_ptr<CycleState> state;
        std::string                 label;
        CycleTask                   task;
        CycleCompletionHandler      completion;
    };

    struct BoundRequest final
    {
        std::string   documentUri;
        std::uint64_t requestId{0};
    };

    /// Marks matching queued and running cycles superseded; caller holds `mutex_`.
    template <typename Predicate>
    std::size_t supersedeLocked(Predicate matches, std::vector<BoundRequest>& aborts)
    {
        std::size_t count        = 0;
        const auto  supersedeOne = [&](CycleState& state) {
            if (!matches(state))
            {
                return;
            }
            std::lock_guard<std::mutex> stateLock(state.mutex);
            if (state.superseded)
            {
                return;
            }
            state.superseded = true;
            ++count;
            if (state.boundRequest)
            {
                aborts.push_back(BoundRequest{state.documentUri, *state.boundRequest});
                state.boundRequest.reset();
            }
        };
        if (running_)
        {
            supersedeOne(*running_);
        }
        for (Cycle& cycle : queue_)
        {
            supersedeOne(*cycle.state);
        }
        return count;
    }

    void abortAll(const std::vector<BoundRequest>& aborts)
    {
        if (!abortHandler_)
        {
            return;
        }
        for (const BoundRequest& bound : aborts)
        {
            abortHandler_(bound.documentUri, bound.requestId);
        }
    }

    void run()
    {
        while (true)
        {
            Cycle cycle;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty())
                {
                    return;
                }
                cycle = std::move(queue_.front());
                queue_.pop_front();
                running_ = cycle.state;
            }

            const CycleToken token(cycle.state);
            CycleCompletion  completion;
            completion.sequence = cycle.state->sequence;
            if (!token.isSuperseded())
            {
                const auto start = std::chrono::steady_clock::now();
                try
                {
                    completion.outcome = cycle.task(token);
                } catch (const std::exception& ex)
                {
                    completion.outcome      = CycleOutcome::Failed;
                    completion.errorMessage = cycle.label + ": " + ex.what();
                }
                const auto elapsed = std::chrono::steady_clock::now() - start;
                completion.latencyMicros =
                    static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
            }

            if (cycle.completion)
            {
                cycle.completion(completion);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                running_.reset();
            }
            idle_.notify_all();
        }
    }

    RequestAbortHandler         abortHandler_;
    mutable std::mutex          mutex_;
    std::condition_variable     cv_;
    std::condition_variable     idle_;
    std::deque<Cycle>           queue_;
    std::shared_ptr<CycleState> running_;
    std::uint64_t               nextSequence_{0};
    bool                        stopping_{false};
    std::thread                 thread_;
};

CycleScheduler::CycleScheduler(RequestAbortHandler abortHandler)
    : impl_(std::make_unique<Impl>(std::move(abortHandler)))
{
}

CycleScheduler::~CycleScheduler() = default;

std::optional<std::uint64_t> CycleScheduler::submit(std::string            documentUri,
                                                    std::string            label,
                                                    CycleTask              task,
                                                    CycleCompletionHandler completion)
{
    return impl_->submit(std::move(documentUri), std::move(label), std::move(task), std::move(completion));
}

std::size_t CycleScheduler::supersede(const std::string& documentUri)
{
    return impl_->supersede(documentUri);
}

std::size_t CycleScheduler::supersedeAll()
{
    return impl_->supersedeAll();
}

void CycleScheduler::waitForIdle()
{
    impl_->waitForIdle();
}

std::size_t CycleScheduler::pendingCount() const
{
    return impl_->pendingCount();
}

void CycleScheduler::shutdown()
{
    impl_->shutdown();
}

}  // namespace draftlint::lsp
