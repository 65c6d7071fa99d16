//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Line-count-preserving blanking of fenced and indented code blocks.
///
/// Every function here is pure. Masked output always has exactly as many lines
/// as its input so rule positions map back onto the document unchanged.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_TEXT_CODE_BLOCK_MASKER_H
#define DRAFTLINT_TEXT_CODE_BLOCK_MASKER_H

#include "draftlint/Text/Region.h"
#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace draftlint
{

/// @brief Fence context of a line.
enum class FenceState
{
    /// @brief Outside any fence.
    None,

    /// @brief Inside a ```` ``` ```` fence.
    Backtick,

    /// @brief Inside a `~~~` fence.
    Tilde,
};

/// @brief Returns the fence type a line opens or closes, or `None`.
///
/// A marker is a line whose left-trimmed text starts with three backticks or
/// three tildes.
[[nodiscard]] FenceState fenceMarkerOf(llvm::StringRef line);

/// @brief Blanks code-block lines in place of a line array.
/// @param[in] lines Slice lines.
/// @param[in] initial Fence context of the line preceding the slice.
/// @return Masked lines, same count as `lines`.
[[nodiscard]] std::vector<std::string> maskCodeBlockLines(const std::vector<std::string>& lines,
                                                          FenceState                      initial);

/// @brief Blanks code-block lines of a text slice.
/// @param[in] text Slice text.
/// @param[in] initial Fence context of the line preceding the slice.
/// @return Masked text with the same number of lines.
[[nodiscard]] std::string maskCodeBlocks(llvm::StringRef text, FenceState initial = FenceState::None);

/// @brief Replays fence toggling for lines `[0, startLine)`.
///
/// Uses the masker's rule: only a marker of the open fence's type closes it,
/// and a marker of the other type inside a fence is content.
[[nodiscard]] FenceState fenceStateBefore(const std::vector<std::string>& lines, std::size_t startLine);

/// @brief Finds the closing marker of an open fence.
/// @param[in] lines Document lines.
/// @param[in] fromLine First line to inspect.
/// @param[in] state Open fence type; `None` never matches.
/// @return Index of the closing marker line.
[[nodiscard]] std::optional<std::size_t> findFenceClose(const std::vector<std::string>& lines,
                                                        std::size_t                     fromLine,
                                                        FenceState                      state);

/// @brief Fence context to hand the masker for a slice starting at `startLine`.
///
/// Derived from a whole-document scan, so a fence that is open before the
/// slice but never closed is plain text, and a marker-like line swallowed by
/// an indented block does not toggle anything.
[[nodiscard]] FenceState sliceFenceState(const std::vector<std::string>& lines, std::size_t startLine);

/// @brief Widens regions so masking each one alone matches a whole-document mask.
///
/// A region never ends between a fence opener and its close or inside an
/// indented block, and never starts on an indented line whose block test
/// depends on lines above it. Returned regions keep their order and may overlap.
/// @param[in] lines Document lines.
/// @param[in] regions Regions to widen; ends past the document are clamped.
[[nodiscard]] std::vector<LineRegion> alignToCodeBlocks(const std::vector<std::string>& lines,
                                                        std::vector<LineRegion>         regions);

}  // namespace draftlint

#endif  // DRAFTLINT_TEXT_CODE_BLOCK_MASKER_H
