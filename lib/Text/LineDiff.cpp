//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements prefix/suffix line diffing.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Text/LineDiff.h"

#include <algorithm>

namespace draftlint
{

std::optional<LineChange> computeLineChange(const std::vector<std::string>& prev, const std::vector<std::string>& next)
{
    if (next.empty())
    {
        return std::nullopt;
    }

    const auto prevCount = static_cast<std::int64_t>(prev.size());
    const auto nextCount = static_cast<std::int64_t>(next.size());

    std::int64_t prefix = 0;
    while (prefix < prevCount && prefix < nextCount &&
           prev[static_cast<std::size_t>(prefix)] == next[static_cast<std::size_t>(prefix)])
    {
        ++prefix;
    }

    std::int64_t prevSuffix = prevCount - 1;
    std::int64_t nextSuffix = nextCount - 1;
    while (prevSuffix >= prefix && nextSuffix >= prefix &&
           prev[static_cast<std::size_t>(prevSuffix)] == next[static_cast<std::size_t>(nextSuffix)])
    {
        --prevSuffix;
        --nextSuffix;
    }

    if (prefix > prevSuffix && prefix > nextSuffix)
    {
        return std::nullopt;
    }

    // Pure deletions leave nextSuffix below the prefix; report the line that now
    // sits at the deletion point.
    const std::int64_t start = std::min(prefix, nextCount - 1);
    const std::int64_t end   = std::clamp(nextSuffix, start, nextCount - 1);

    LineChange change;
    change.region              = LineRegion{static_cast<std::size_t>(start), static_cast<std::size_t>(end)};
    change.firstChangedLine    = static_cast<std::size_t>(prefix);
    change.previousLastChanged = prevSuffix;
    change.lineDelta           = nextCount - prevCount;
    return change;
}

std::optional<LineRegion> diffLines(const std::vector<std::string>& prev, const std::vector<std::string>& next)
{
    const auto change = computeLineChange(prev, next);
    if (!change)
    {
        return std::nullopt;
    }
    return change->region;
}

}  // namespace draftlint
