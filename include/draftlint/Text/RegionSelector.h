//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Selection of the line regions that must be re-analysed after an edit.
///
/// Candidates come from the changed hunk and from the spans of the previous
/// diagnostics, so issues that were fixed outside the edited paragraph are
/// still re-validated. All candidates are paragraph-expanded and merged into a
/// sorted list with no overlapping or adjacent members.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_TEXT_REGION_SELECTOR_H
#define DRAFTLINT_TEXT_REGION_SELECTOR_H

#include "draftlint/Support/Diagnostics.h"
#include "draftlint/Text/Region.h"

#include <optional>
#include <string>
#include <vector>

namespace draftlint
{

/// @brief Widens a region to blank-line boundaries, then pads it.
/// @param[in] lines Current document lines.
/// @param[in] region Seed region; clamped into the document first.
/// @param[in] contextLines Extra lines added on both sides after expansion.
/// @return Expanded region clamped to document bounds.
[[nodiscard]] LineRegion expandToParagraph(const std::vector<std::string>& lines,
                                           LineRegion                      region,
                                           std::size_t                     contextLines);

/// @brief Maps diagnostic line spans to paragraph-expanded regions.
[[nodiscard]] std::vector<LineRegion> rangesFromDiagnostics(const std::vector<std::string>& lines,
                                                            const std::vector<Diagnostic>&  diagnostics);

/// @brief Sorts regions and folds members where `end + 1 >= next.start`.
[[nodiscard]] std::vector<LineRegion> mergeRegions(std::vector<LineRegion> regions);

/// @brief Computes the merged region list for one incremental cycle.
/// @param[in] lines Current document lines.
/// @param[in] changed Changed hunk from the differ, if any.
/// @param[in] staleDiagnostics Cached diagnostics in current coordinates.
/// @param[in] contextLines Padding applied around the changed hunk.
/// @return Sorted, non-adjacent regions; empty when nothing needs analysis.
[[nodiscard]] std::vector<LineRegion> selectRegions(const std::vector<std::string>& lines,
                                                    const std::optional<LineRegion>& changed,
                                                    const std::vector<Diagnostic>&  staleDiagnostics,
                                                    std::size_t                     contextLines);

}  // namespace draftlint

#endif  // DRAFTLINT_TEXT_REGION_SELECTOR_H
