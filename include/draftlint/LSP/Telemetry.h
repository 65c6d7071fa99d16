//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Lint-cycle telemetry recorder.
///
/// Each finished cycle produces one sample that is counted per outcome and
/// forwarded to an optional sink for tracing and tests.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_LSP_TELEMETRY_H
#define DRAFTLINT_LSP_TELEMETRY_H

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace draftlint::lsp
{

/// @brief How a cycle chose what to analyse.
enum class CycleMode
{
    /// @brief No cache entry; the whole document was one region.
    Full,

    /// @brief Changed and stale-diagnostic regions were analysed.
    Incremental,

    /// @brief Nothing needed analysis; the cache was refreshed.
    Skipped,

    /// @brief Whitespace-only document; no worker round-trip.
    Empty,
};

/// @brief How a cycle ended.
enum class CycleOutcome
{
    /// @brief Fresh diagnostics were merged and published.
    Published,

    /// @brief A newer trigger cancelled the cycle.
    Superseded,

    /// @brief The worker failed or was unavailable.
    Failed,

    /// @brief The active document changed mid-cycle.
    Switched,
};

/// @brief Returns a stable lowercase name for a cycle mode.
[[nodiscard]] llvm::StringRef cycleModeName(CycleMode mode);

/// @brief Returns a stable lowercase name for a cycle outcome.
[[nodiscard]] llvm::StringRef cycleOutcomeName(CycleOutcome outcome);

/// @brief Immutable telemetry sample for a finished lint cycle.
struct CycleMetric final
{
    /// @brief Document URI.
    std::string uri;

    /// @brief Planning mode.
    CycleMode mode{CycleMode::Full};

    /// @brief Number of regions sent to the worker.
    std::size_t regionCount{0};

    /// @brief Cycle latency in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief Terminal outcome.
    CycleOutcome outcome{CycleOutcome::Published};
};

/// @brief Sink callback invoked for each telemetry sample.
using CycleMetricSink = std::function<void(const CycleMetric&)>;

/// @brief Thread-safe cycle telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(CycleMetricSink sink);

    /// @brief Records one cycle sample.
    /// @param[in] metric Sample to record.
    void record(CycleMetric metric);

    /// @brief Returns how many cycles ended with `outcome`.
    [[nodiscard]] std::uint64_t cycleCount(CycleOutcome outcome) const;

private:
    mutable std::mutex                     mutex_;
    CycleMetricSink                        sink_;
    std::unordered_map<int, std::uint64_t> outcomeCounts_;
};

}  // namespace draftlint::lsp

#endif  // DRAFTLINT_LSP_TELEMETRY_H
