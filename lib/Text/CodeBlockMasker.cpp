//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements code-block masking and fence-state replay.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Text/CodeBlockMasker.h"

#include "draftlint/Support/TextLines.h"

#include <algorithm>

namespace draftlint
{
namespace
{

llvm::StringRef leftTrim(llvm::StringRef line)
{
    line = line.ltrim();
    while (line.consume_front("\xE3\x80\x80"))
    {
        line = line.ltrim();
    }
    return line;
}

bool isIndentedCodeLine(llvm::StringRef line)
{
    return line.take_front(4) == "    " || line.take_front(1) == "\t";
}

void blankRange(std::vector<std::string>& lines, const std::size_t first, const std::size_t last)
{
    for (std::size_t i = first; i <= last && i < lines.size(); ++i)
    {
        lines[i].clear();
    }
}

/// How a whole-document mask treats one line.
struct MaskUnit final
{
    /// Lines a slice must share with this one to mask it the same way.
    LineRegion span;
    /// Fence the line sits in, counting the closing marker but not the opener.
    FenceState fence{FenceState::None};
};

/// Walks the document exactly like `maskCodeBlockLines` with no initial fence.
std::vector<MaskUnit> scanMaskUnits(const std::vector<std::string>& lines)
{
    std::vector<MaskUnit> units(lines.size());
    std::size_t           i = 0;
    while (i < lines.size())
    {
        const FenceState marker = fenceMarkerOf(lines[i]);
        if (marker != FenceState::None)
        {
            const auto close = findFenceClose(lines, i + 1U, marker);
            if (!close)
            {
                // Everything from an unterminated opener on is prose to the masker.
                for (std::size_t k = i; k < lines.size(); ++k)
                {
                    units[k].span = LineRegion{i, k};
                }
                break;
            }
            units[i].span = LineRegion{i, *close};
            for (std::size_t k = i + 1U; k <= *close; ++k)
            {
                units[k].span  = LineRegion{k, *close};
                units[k].fence = marker;
            }
            i = *close + 1U;
            continue;
        }

        if (!isIndentedCodeLine(lines[i]))
        {
            units[i].span = LineRegion{i, i};
            ++i;
            continue;
        }
        if (i > 0 && !isBlankLine(lines[i - 1U]))
        {
            // Continues the line above, so a slice must not start here.
            units[i].span = LineRegion{units[i - 1U].span.start, i};
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < lines.size() && isIndentedCodeLine(lines[j]))
        {
            ++j;
        }
        for (std::size_t k = i; k < j; ++k)
        {
            units[k].span = LineRegion{i, j - 1U};
        }
        i = j;
    }
    return units;
}

}  // namespace

FenceState fenceMarkerOf(llvm::StringRef line)
{
    const llvm::StringRef head = leftTrim(line).take_front(3);
    if (head == "```")
    {
        return FenceState::Backtick;
    }
    if (head == "~~~")
    {
        return FenceState::Tilde;
    }
    return FenceState::None;
}

std::optional<std::size_t> findFenceClose(const std::vector<std::string>& lines,
                                          const std::size_t               fromLine,
                                          const FenceState                state)
{
    if (state == FenceState::None)
    {
        return std::nullopt;
    }
    for (std::size_t i = fromLine; i < lines.size(); ++i)
    {
        if (fenceMarkerOf(lines[i]) == state)
        {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> maskCodeBlockLines(const std::vector<std::string>& lines, const FenceState initial)
{
    std::vector<std::string> out = lines;
    std::size_t              i   = 0;

    if (initial != FenceState::None)
    {
        const auto close = findFenceClose(lines, 0, initial);
        if (!close)
        {
            blankRange(out, 0, lines.size());
            return out;
        }
        blankRange(out, 0, *close);
        i = *close + 1U;
    }

    while (i < lines.size())
    {
        const FenceState marker = fenceMarkerOf(lines[i]);
        if (marker != FenceState::None)
        {
            const auto close = findFenceClose(lines, i + 1U, marker);
            if (!close)
            {
                // Unterminated opener: leave it and the rest of the slice as prose.
                break;
            }
            blankRange(out, i, *close);
            i = *close + 1U;
            continue;
        }

        const bool previousBlank = i == 0 || isBlankLine(lines[i - 1U]);
        if (previousBlank && isIndentedCodeLine(lines[i]))
        {
            std::size_t j = i;
            while (j < lines.size() && isIndentedCodeLine(lines[j]))
            {
                ++j;
            }
            if (j - i >= 2U)
            {
                blankRange(out, i, j - 1U);
            }
            i = j;
            continue;
        }
        ++i;
    }
    return out;
}

std::string maskCodeBlocks(llvm::StringRef text, const FenceState initial)
{
    return joinLines(maskCodeBlockLines(splitLines(text), initial));
}

FenceState fenceStateBefore(const std::vector<std::string>& lines, const std::size_t startLine)
{
    FenceState        state = FenceState::None;
    const std::size_t end   = std::min(startLine, lines.size());
    for (std::size_t i = 0; i < end; ++i)
    {
        const FenceState marker = fenceMarkerOf(lines[i]);
        if (marker == FenceState::None)
        {
            continue;
        }
        if (state == FenceState::None)
        {
            state = marker;
        }
        else if (state == marker)
        {
            state = FenceState::None;
        }
    }
    return state;
}

FenceState sliceFenceState(const std::vector<std::string>& lines, const std::size_t startLine)
{
    if (startLine >= lines.size())
    {
        return FenceState::None;
    }
    return scanMaskUnits(lines)[startLine].fence;
}

std::vector<LineRegion> alignToCodeBlocks(const std::vector<std::string>& lines, std::vector<LineRegion> regions)
{
    if (lines.empty())
    {
        return regions;
    }
    const std::vector<MaskUnit> units = scanMaskUnits(lines);
    for (LineRegion& region : regions)
    {
        region.end   = std::min(region.end, lines.size() - 1U);
        region.start = std::min(region.start, region.end);
        region.start = units[region.start].span.start;
        region.end   = units[region.end].span.end;
    }
    return regions;
}

}  // namespace draftlint
