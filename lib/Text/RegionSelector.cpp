//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements paragraph expansion and region merging.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Text/RegionSelector.h"

#include "draftlint/Support/TextLines.h"

#include <algorithm>

namespace draftlint
{
namespace
{

LineRegion clampRegion(const std::vector<std::string>& lines, LineRegion region)
{
    const std::size_t last = lines.empty() ? 0U : lines.size() - 1U;
    region.start           = std::min(region.start, last);
    region.end             = std::clamp(region.end, region.start, last);
    return region;
}

}  // namespace

LineRegion expandToParagraph(const std::vector<std::string>& lines, LineRegion region, const std::size_t contextLines)
{
    region = clampRegion(lines, region);
    if (lines.empty())
    {
        return region;
    }

    std::size_t start = region.start;
    while (start > 0 && !isBlankLine(lines[start - 1U]))
    {
        --start;
    }
    std::size_t end = region.end;
    while (end + 1U < lines.size() && !isBlankLine(lines[end + 1U]))
    {
        ++end;
    }

    start = start > contextLines ? start - contextLines : 0U;
    end   = std::min(end + contextLines, lines.size() - 1U);
    return LineRegion{start, end};
}

std::vector<LineRegion> rangesFromDiagnostics(const std::vector<std::string>& lines,
                                              const std::vector<Diagnostic>&  diagnostics)
{
    std::vector<LineRegion> regions;
    regions.reserve(diagnostics.size());
    for (const auto& diagnostic : diagnostics)
    {
        const LineRegion span{diagnostic.range.startLine, diagnostic.range.endLine};
        regions.push_back(expandToParagraph(lines, span, 0));
    }
    return regions;
}

std::vector<LineRegion> mergeRegions(std::vector<LineRegion> regions)
{
    std::sort(regions.begin(), regions.end(), [](const LineRegion& lhs, const LineRegion& rhs) {
        if (lhs.start != rhs.start)
        {
            return lhs.start < rhs.start;
        }
        return lhs.end < rhs.end;
    });

    std::vector<LineRegion> merged;
    for (const auto& region : regions)
    {
        if (!merged.empty() && merged.back().end + 1U >= region.start)
        {
            merged.back().end = std::max(merged.back().end, region.end);
            continue;
        }
        merged.push_back(region);
    }
    return merged;
}

std::vector<LineRegion> selectRegions(const std::vector<std::string>&  lines,
                                      const std::optional<LineRegion>& changed,
                                      const std::vector<Diagnostic>&   staleDiagnostics,
                                      const std::size_t                contextLines)
{
    std::vector<LineRegion> candidates = rangesFromDiagnostics(lines, staleDiagnostics);
    if (changed)
    {
        candidates.push_back(expandToParagraph(lines, *changed, contextLines));
    }
    return mergeRegions(std::move(candidates));
}

}  // namespace draftlint
