//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "ScriptedWorker.h"
#include "draftlint/Rules/RuleConfig.h"
#include "draftlint/Support/Logging.h"
#include "draftlint/Worker/AnalysisWorkerChannel.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

using draftlint::worker::AnalysisOutcome;
using draftlint::worker::AnalysisStatus;

draftlint::worker::AnalysisRequest makeRequest(draftlint::worker::AnalysisWorkerChannel& channel, std::string text)
{
    draftlint::worker::AnalysisRequest request;
    request.id         = channel.nextRequestId();
    request.text       = std::move(text);
    request.filePath   = "/tmp/draft.txt";
    request.ruleConfig = draftlint::defaultRuleConfig();
    return request;
}

bool settle(std::future<AnalysisOutcome>& future, AnalysisOutcome& outcome)
{
    if (future.wait_for(std::chrono::seconds(10)) != std::future_status::ready)
    {
        std::cerr << "timeout waiting for analysis outcome\n";
        return false;
    }
    outcome = future.get();
    return true;
}

}  // namespace

bool runAnalysisWorkerChannelTests()
{
    draftlint::Logger logger(llvm::nulls(), draftlint::TraceLevel::Off);

    {
        auto script = std::make_shared<draftlint::test::WorkerScript>();
        script->replyMessages.push_back(draftlint::test::makeRuleMessage(1, 2, "scripted"));
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::test::makeScriptedFactory(script), logger);

        auto            first = channel.submit(makeRequest(channel, "one"));
        AnalysisOutcome outcome;
        if (!settle(first, outcome))
        {
            return false;
        }
        if (outcome.status != AnalysisStatus::Completed || outcome.messages.size() != 1U ||
            outcome.messages.front().ruleId != "scripted")
        {
            std::cerr << "expected a completed outcome carrying the worker messages\n";
            return false;
        }

        auto second = channel.submit(makeRequest(channel, "two"));
        if (!settle(second, outcome) || outcome.status != AnalysisStatus::Completed)
        {
            std::cerr << "second request should complete on the same worker\n";
            return false;
        }
        if (script->created != 1 || channel.workerGeneration() != 1U || channel.pendingCount() != 0U)
        {
            std::cerr << "the worker should be started lazily and reused\n";
            return false;
        }
        if (script->requestId(0) == script->requestId(1))
        {
            std::cerr << "request ids should be unique per channel\n";
            return false;
        }
    }

    {
        auto script      = std::make_shared<draftlint::test::WorkerScript>();
        script->failWith = "Lint Error: boom";
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::test::makeScriptedFactory(script), logger);

        auto            future = channel.submit(makeRequest(channel, "text"));
        AnalysisOutcome outcome;
        if (!settle(future, outcome) || outcome.status != AnalysisStatus::Failed ||
            outcome.errorMessage != "Lint Error: boom")
        {
            std::cerr << "worker error replies should fail the request with their message\n";
            return false;
        }
    }

    {
        auto script  = std::make_shared<draftlint::test::WorkerScript>();
        script->hold = true;
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::test::makeScriptedFactory(script), logger);

        auto request = makeRequest(channel, "slow");
        const std::uint64_t id     = request.id;
        auto                future = channel.submit(std::move(request));
        if (!script->waitForRequests(1))
        {
            std::cerr << "worker never received the request\n";
            return false;
        }
        if (!channel.abort(id) || channel.abort(id))
        {
            std::cerr << "abort should settle a pending request exactly once\n";
            return false;
        }

        AnalysisOutcome outcome;
        if (!settle(future, outcome) || outcome.status != AnalysisStatus::Aborted)
        {
            std::cerr << "aborted request should resolve as aborted\n";
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(script->mutex);
            if (script->aborted != std::vector<std::uint64_t>{id})
            {
                std::cerr << "worker should be told about the abort\n";
                return false;
            }
        }

        script->reply(id, {draftlint::test::makeRuleMessage(1, 1, "late")});
        if (channel.pendingCount() != 0U)
        {
            std::cerr << "late replies for aborted requests should be dropped\n";
            return false;
        }
    }

    {
        auto script           = std::make_shared<draftlint::test::WorkerScript>();
        script->crashExitCode = 3;
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::test::makeScriptedFactory(script), logger);

        auto            crashed = channel.submit(makeRequest(channel, "crash"));
        AnalysisOutcome outcome;
        if (!settle(crashed, outcome) || outcome.status != AnalysisStatus::Failed ||
            outcome.errorMessage != "analysis worker exited with code 3")
        {
            std::cerr << "a crashing worker should fail its pending requests\n";
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(script->mutex);
            script->crashExitCode = 0;
        }
        auto restarted = channel.submit(makeRequest(channel, "again"));
        if (!settle(restarted, outcome) || outcome.status != AnalysisStatus::Completed)
        {
            std::cerr << "the channel should start a fresh worker after a crash\n";
            return false;
        }
        if (script->created != 2 || channel.workerGeneration() != 2U || script->terminated < 1)
        {
            std::cerr << "crashed worker should be reaped and replaced by a new generation\n";
            return false;
        }
    }

    {
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::test::makeFailingFactory("no runtime"), logger);
        auto                                     future = channel.submit(makeRequest(channel, "text"));
        AnalysisOutcome                          outcome;
        if (!settle(future, outcome) || outcome.status != AnalysisStatus::Unavailable ||
            outcome.errorMessage.find("no runtime") == std::string::npos)
        {
            std::cerr << "factory failures should report the worker as unavailable\n";
            return false;
        }
    }

    {
        auto oldScript  = std::make_shared<draftlint::test::WorkerScript>();
        oldScript->hold = true;
        auto newScript  = std::make_shared<draftlint::test::WorkerScript>();
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::test::makeScriptedFactory(oldScript), logger);

        auto pending = channel.submit(makeRequest(channel, "held"));
        if (!oldScript->waitForRequests(1))
        {
            std::cerr << "old worker never received the request\n";
            return false;
        }
        channel.replaceFactory(draftlint::test::makeScriptedFactory(newScript));

        AnalysisOutcome outcome;
        if (!settle(pending, outcome) || outcome.status != AnalysisStatus::Failed ||
            outcome.errorMessage != "analysis worker was replaced")
        {
            std::cerr << "replacing the factory should fail requests on the old worker\n";
            return false;
        }
        if (oldScript->terminated != 1)
        {
            std::cerr << "old worker should be terminated on replacement\n";
            return false;
        }

        auto fresh = channel.submit(makeRequest(channel, "fresh"));
        if (!settle(fresh, outcome) || outcome.status != AnalysisStatus::Completed || newScript->created != 1)
        {
            std::cerr << "requests after replacement should use the new factory\n";
            return false;
        }
    }

    {
        auto script  = std::make_shared<draftlint::test::WorkerScript>();
        script->hold = true;
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::test::makeScriptedFactory(script), logger);

        auto request   = makeRequest(channel, "dup");
        auto duplicate = request;
        auto first     = channel.submit(std::move(request));
        auto second    = channel.submit(std::move(duplicate));

        AnalysisOutcome outcome;
        if (!settle(second, outcome) || outcome.status != AnalysisStatus::Failed ||
            outcome.errorMessage.find("duplicate request id") == std::string::npos)
        {
            std::cerr << "duplicate request ids should be rejected\n";
            return false;
        }

        channel.shutdown();
        if (!settle(first, outcome) || outcome.status != AnalysisStatus::Failed ||
            outcome.errorMessage != "analysis channel is shut down")
        {
            std::cerr << "shutdown should fail pending requests\n";
            return false;
        }

        auto late = channel.submit(makeRequest(channel, "late"));
        if (!settle(late, outcome) || outcome.status != AnalysisStatus::Unavailable)
        {
            std::cerr << "requests after shutdown should be unavailable\n";
            return false;
        }
    }

    {
        draftlint::worker::AnalysisWorkerChannel channel(draftlint::worker::makeRuleEngineWorkerFactory({}), logger);

        auto            future = channel.submit(makeRequest(channel, "実行することができる。"));
        AnalysisOutcome outcome;
        if (!settle(future, outcome) || outcome.status != AnalysisStatus::Completed)
        {
            std::cerr << "rule engine worker should complete the request\n";
            return false;
        }
        if (outcome.messages.size() != 1U || outcome.messages.front().ruleId != "ja-no-redundant-expression")
        {
            std::cerr << "rule engine worker should run the built-in rules\n";
            return false;
        }
    }

    {
        draftlint::worker::AnalysisWorkerChannel channel(
            draftlint::worker::makeRuleEngineWorkerFactory({"/nonexistent/librules.so"}),
            logger);

        auto            future = channel.submit(makeRequest(channel, "text"));
        AnalysisOutcome outcome;
        if (!settle(future, outcome) || outcome.status != AnalysisStatus::Unavailable ||
            outcome.errorMessage.find("failed to load rule pack") == std::string::npos)
        {
            std::cerr << "a missing rule pack should make the worker unavailable\n";
            return false;
        }
    }

    return true;
}
