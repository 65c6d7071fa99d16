//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements thread-safe lint-cycle telemetry.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/Telemetry.h"

#include <utility>

namespace draftlint::lsp
{

llvm::StringRef cycleModeName(const CycleMode mode)
{
    switch (mode)
    {
    case CycleMode::Full:
        return "full";
    case CycleMode::Incremental:
        return "incremental";
    case CycleMode::Skipped:
        return "skipped";
    case CycleMode::Empty:
        return "empty";
    }
    return "full";
}

llvm::StringRef cycleOutcomeName(const CycleOutcome outcome)
{
    switch (outcome)
    {
    case CycleOutcome::Published:
        return "published";
    case CycleOutcome::Superseded:
        return "superseded";
    case CycleOutcome::Failed:
        return "failed";
    case CycleOutcome::Switched:
        return "switched";
    }
    return "failed";
}

void Telemetry::setSink(CycleMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(CycleMetric metric)
{
    CycleMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++outcomeCounts_[static_cast<int>(metric.outcome)];
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::cycleCount(const CycleOutcome outcome) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = outcomeCounts_.find(static_cast<int>(outcome));
    return it == outcomeCounts_.end() ? 0U : it->second;
}

}  // namespace draftlint::lsp
