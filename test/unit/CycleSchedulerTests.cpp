//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "draftlint/LSP/CycleScheduler.h"

namespace
{

using draftlint::lsp::CycleCompletion;
using draftlint::lsp::CycleOutcome;
using draftlint::lsp::CycleToken;

struct CompletionLog final
{
    std::mutex                   mutex;
    std::vector<CycleCompletion> entries;

    draftlint::lsp::CycleCompletionHandler recorder()
    {
        return [this](const CycleCompletion& completion) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.push_back(completion);
        };
    }

    std::vector<CycleCompletion> snapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return entries;
    }
};

struct AbortLog final
{
    std::mutex                                         mutex;
    std::vector<std::pair<std::string, std::uint64_t>> entries;

    draftlint::lsp::RequestAbortHandler handler()
    {
        return [this](const std::string& uri, const std::uint64_t id) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.emplace_back(uri, id);
        };
    }

    std::vector<std::pair<std::string, std::uint64_t>> snapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return entries;
    }
};

/// Polls the token until it is superseded or three seconds pass.
bool waitUntilSuperseded(const CycleToken& token)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        if (token.isSuperseded())
        {
            return true;
        }
    }
    return false;
}

/// One-shot latch signalled from the scheduler thread.
struct Latch final
{
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    open = false;

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }

    bool wait()
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(3), [this]() { return open; });
    }
};

bool testNewCycleSupersedesRunningCycle()
{
    AbortLog                       aborts;
    CompletionLog                  log;
    draftlint::lsp::CycleScheduler scheduler(aborts.handler());
    Latch                          started;

    const auto first = scheduler.submit(
        "file:///tmp/a.md",
        "lint save",
        [&started](const CycleToken& token) {
            if (!token.bindRequest(41))
            {
                return CycleOutcome::Superseded;
            }
            started.release();
            return waitUntilSuperseded(token) ? CycleOutcome::Superseded : CycleOutcome::Published;
        },
        log.recorder());
    if (!first || *first != 1U || !started.wait())
    {
        std::cerr << "first cycle never started\n";
        return false;
    }

    const auto second = scheduler.submit(
        "file:///tmp/b.md",
        "lint command",
        [](const CycleToken& token) {
            return token.documentUri() == "file:///tmp/b.md" ? CycleOutcome::Published : CycleOutcome::Failed;
        },
        log.recorder());
    if (!second || *second != 2U)
    {
        std::cerr << "second cycle should get the next sequence number\n";
        return false;
    }
    scheduler.waitForIdle();

    const auto completions = log.snapshot();
    if (completions.size() != 2U || completions[0].sequence != 1U ||
        completions[0].outcome != CycleOutcome::Superseded || completions[0].latencyMicros == 0U ||
        completions[1].sequence != 2U || completions[1].outcome != CycleOutcome::Published)
    {
        std::cerr << "a new trigger should supersede the running cycle of another document\n";
        return false;
    }
    const auto aborted = aborts.snapshot();
    if (aborted.size() != 1U || aborted.front().first != "file:///tmp/a.md" || aborted.front().second != 41U)
    {
        std::cerr << "the superseded cycle's bound request should be aborted\n";
        return false;
    }
    if (scheduler.pendingCount() != 0U)
    {
        std::cerr << "nothing should be pending once idle\n";
        return false;
    }

    scheduler.shutdown();
    return true;
}

bool testQueuedCyclesSupersededBeforeStart()
{
    AbortLog                       aborts;
    CompletionLog                  log;
    draftlint::lsp::CycleScheduler scheduler(aborts.handler());
    Latch                          started;
    Latch                          gate;
    std::atomic_int                ran{0};

    const auto counting = [&ran](const CycleToken&) {
        ++ran;
        return CycleOutcome::Published;
    };

    const auto gateCycle = scheduler.submit(
        "file:///tmp/a.md",
        "gate",
        [&started, &gate](const CycleToken&) {
            started.release();
            return gate.wait() ? CycleOutcome::Published : CycleOutcome::Failed;
        },
        log.recorder());
    if (!gateCycle || !started.wait())
    {
        std::cerr << "gate cycle never started\n";
        return false;
    }

    if (!scheduler.submit("file:///tmp/a.md", "lint save", counting, log.recorder()) ||
        !scheduler.submit("file:///tmp/b.md", "lint save", counting, log.recorder()))
    {
        std::cerr << "cycles should be accepted while another runs\n";
        return false;
    }
    if (scheduler.pendingCount() != 3U)
    {
        std::cerr << "the running cycle and both queued cycles should be pending\n";
        return false;
    }
    if (scheduler.supersede("file:///tmp/b.md") != 1U || scheduler.supersede("file:///tmp/b.md") != 0U ||
        scheduler.supersede("file:///tmp/c.md") != 0U)
    {
        std::cerr << "supersede should only count cycles of that document not yet superseded\n";
        return false;
    }
    gate.release();
    scheduler.waitForIdle();

    const auto completions = log.snapshot();
    if (completions.size() != 3U || completions[0].outcome != CycleOutcome::Published ||
        completions[1].outcome != CycleOutcome::Superseded || completions[2].outcome != CycleOutcome::Superseded)
    {
        std::cerr << "queued cycles behind a newer trigger should complete as superseded\n";
        return false;
    }
    if (completions[1].sequence != 2U || completions[2].sequence != 3U || completions[1].latencyMicros != 0U)
    {
        std::cerr << "completions should fire in submission order without running the body\n";
        return false;
    }
    if (ran.load() != 0 || !aborts.snapshot().empty())
    {
        std::cerr << "superseded queued cycles should not run or abort anything\n";
        return false;
    }

    scheduler.shutdown();
    return true;
}

bool testReleasedRequestIsNotAborted()
{
    AbortLog                       aborts;
    CompletionLog                  log;
    draftlint::lsp::CycleScheduler scheduler(aborts.handler());
    Latch                          released;
    std::atomic_bool               reboundAfterSupersede{true};

    const auto sequence = scheduler.submit(
        "file:///tmp/a.md",
        "lint save",
        [&released, &reboundAfterSupersede](const CycleToken& token) {
            if (!token.bindRequest(7))
            {
                return CycleOutcome::Failed;
            }
            token.releaseRequest(7);
            released.release();
            if (!waitUntilSuperseded(token))
            {
                return CycleOutcome::Failed;
            }
            reboundAfterSupersede = token.bindRequest(8);
            return CycleOutcome::Superseded;
        },
        log.recorder());
    if (!sequence || !released.wait())
    {
        std::cerr << "cycle never released its request\n";
        return false;
    }
    if (scheduler.supersedeAll() != 1U)
    {
        std::cerr << "supersedeAll should reach the running cycle\n";
        return false;
    }
    scheduler.waitForIdle();

    if (reboundAfterSupersede.load())
    {
        std::cerr << "a superseded cycle must not bind new requests\n";
        return false;
    }
    if (!aborts.snapshot().empty())
    {
        std::cerr << "released requests should not be aborted\n";
        return false;
    }
    const auto completions = log.snapshot();
    if (completions.size() != 1U || completions.front().outcome != CycleOutcome::Superseded)
    {
        std::cerr << "the cycle should report being superseded\n";
        return false;
    }

    scheduler.shutdown();
    return true;
}

bool testThrowingCycleAndShutdown()
{
    AbortLog                       aborts;
    CompletionLog                  log;
    draftlint::lsp::CycleScheduler scheduler(aborts.handler());

    const auto thrown = scheduler.submit(
        "file:///tmp/a.md",
        "lint save",
        [](const CycleToken&) -> CycleOutcome { throw std::runtime_error("region out of range"); },
        log.recorder());
    scheduler.waitForIdle();
    auto completions = log.snapshot();
    if (!thrown || completions.size() != 1U || completions.front().outcome != CycleOutcome::Failed ||
        completions.front().errorMessage != "lint save: region out of range")
    {
        std::cerr << "a throwing cycle should fail with its label and message\n";
        return false;
    }

    Latch      bound;
    const auto waiting = scheduler.submit(
        "file:///tmp/b.md",
        "lint command",
        [&bound](const CycleToken& token) {
            if (!token.bindRequest(5))
            {
                return CycleOutcome::Failed;
            }
            bound.release();
            return waitUntilSuperseded(token) ? CycleOutcome::Superseded : CycleOutcome::Published;
        },
        log.recorder());
    if (!waiting || !bound.wait())
    {
        std::cerr << "second cycle never bound its request\n";
        return false;
    }

    scheduler.shutdown();
    scheduler.shutdown();
    completions = log.snapshot();
    if (completions.size() != 2U || completions.back().outcome != CycleOutcome::Superseded)
    {
        std::cerr << "shutdown should supersede and report the running cycle\n";
        return false;
    }
    const auto aborted = aborts.snapshot();
    if (aborted.size() != 1U || aborted.front().second != 5U)
    {
        std::cerr << "shutdown should abort the running cycle's request\n";
        return false;
    }
    if (scheduler.submit("file:///tmp/c.md", "lint save", nullptr, log.recorder()))
    {
        std::cerr << "submit after shutdown should be rejected\n";
        return false;
    }
    scheduler.waitForIdle();
    return true;
}

}  // namespace

bool runCycleSchedulerTests()
{
    bool ok = true;
    ok      = testNewCycleSupersedesRunningCycle() && ok;
    ok      = testQueuedCyclesSupersededBeforeStart() && ok;
    ok      = testReleasedRequestIsNotAborted() && ok;
    ok      = testThrowingCycleAndShutdown() && ok;
    return ok;
}
