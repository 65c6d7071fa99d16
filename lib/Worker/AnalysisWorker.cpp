//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the rule-engine analysis worker thread.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Worker/AnalysisWorker.h"

#include "draftlint/Rules/RuleEngine.h"
#include "draftlint/Worker/WorkerProtocol.h"

#include "llvm/Support/FormatVariadic.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <utility>

namespace draftlint::worker
{
namespace
{

class RuleEngineWorker final : public AnalysisWorker
{
public:
    RuleEngineWorker(std::unique_ptr<RuleEngine> engine, WorkerEndpoint endpoint)
        : engine_(std::move(engine))
        , endpoint_(std::move(endpoint))
        , thread_([this]() { run(); })
    {
    }

    ~RuleEngineWorker() override
    {
        terminate();
    }

    void post(llvm::json::Value message) override
    {
        const auto command = messageCommand(message);
        const auto id      = messageId(message);

        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            return;
        }
        if (command && *command == "abort")
        {
            // Handled on the posting thread so a busy job sees it before it replies.
            if (id)
            {
                activeJobs_.erase(*id);
            }
            return;
        }
        if (command && *command == "lint" && id)
        {
            activeJobs_.insert(*id);
        }
        inbox_.push_back(std::move(message));
        cv_.notify_one();
    }

    void terminate() override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            inbox_.clear();
            activeJobs_.clear();
        }
        cv_.notify_all();
        if (!thread_.joinable())
        {
            return;
        }
        if (thread_.get_id() == std::this_thread::get_id())
        {
            thread_.detach();
            return;
        }
        thread_.join();
    }

private:
    void run()
    {
        try
        {
            loop();
        } catch (const std::exception& ex)
        {
            emit(encodeLog(llvm::formatv("[Worker] fatal: {0}", ex.what()).str()));
            exitUnexpectedly();
        }
    }

    void loop()
    {
        while (true)
        {
            llvm::json::Value message(nullptr);
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !inbox_.empty(); });
                if (stopping_)
                {
                    return;
                }
                message = std::move(inbox_.front());
                inbox_.pop_front();
            }

            const auto command = messageCommand(message);
            if (!command || *command != "lint")
            {
                emit(encodeLog(llvm::formatv("[Worker] ignoring message '{0}'", command ? *command : "").str()));
                continue;
            }
            handleLint(message);
        }
    }

    void handleLint(const llvm::json::Value& message)
    {
        auto request = decodeLintRequest(message);
        if (!request)
        {
            const std::string detail = llvm::toString(request.takeError());
            if (const auto id = messageId(message); id && finishJob(*id))
            {
                emit(encodeError(*id, "Lint Error: " + detail));
                return;
            }
            emit(encodeLog("[Worker] malformed lint request: " + detail));
            return;
        }

        const std::uint64_t id = request->id;
        if (!isActive(id))
        {
            return;
        }

        if (engine_->enabledRuleCount(request->ruleConfig) == 0U)
        {
            emit(encodeLog("[Worker] WARNING: No rules enabled!"));
        }

        const RuleDocument document =
            makeRuleDocument(std::move(request->filePath), request->fileKind, std::move(request->text));
        std::vector<RuleMessage> messages;
        try
        {
            messages = engine_->run(document, request->ruleConfig, [this, id]() { return !isActive(id); });
        } catch (const std::exception& ex)
        {
            if (finishJob(id))
            {
                emit(encodeError(id, std::string("Lint Error: ") + ex.what()));
            }
            return;
        }

        if (finishJob(id))
        {
            emit(encodeLintResult(id, messages));
        }
    }

    bool isActive(const std::uint64_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return activeJobs_.contains(id);
    }

    /// Removes the id from the active set; false when it was aborted.
    bool finishJob(const std::uint64_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return activeJobs_.erase(id) != 0U;
    }

    void emit(llvm::json::Value message)
    {
        if (endpoint_.onMessage)
        {
            endpoint_.onMessage(std::move(message));
        }
    }

    void exitUnexpectedly()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
        }
        if (endpoint_.onExit)
        {
            endpoint_.onExit(1);
        }
    }

    std::unique_ptr<RuleEngine>       engine_;
    WorkerEndpoint                    endpoint_;
    std::mutex                        mutex_;
    std::condition_variable           cv_;
    std::deque<llvm::json::Value>     inbox_;
    std::unordered_set<std::uint64_t> activeJobs_;
    bool                              stopping_{false};
    std::thread                       thread_;
};

}  // namespace

WorkerFactory makeRuleEngineWorkerFactory(std::vector<std::string> pluginLibraries)
{
    return [pluginLibraries = std::move(pluginLibraries)](
               WorkerEndpoint endpoint) -> llvm::Expected<std::unique_ptr<AnalysisWorker>> {
        RuleRegistry registry;
        for (const std::string& library : pluginLibraries)
        {
            std::string error;
            if (!registry.loadPluginLibrary(library, &error))
            {
                return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                               llvm::formatv("failed to load rule pack '{0}': {1}", library, error));
            }
        }
        auto engine = std::make_unique<RuleEngine>(std::move(registry));
        return std::make_unique<RuleEngineWorker>(std::move(engine), std::move(endpoint));
    };
}

}  // namespace draftlint::worker
