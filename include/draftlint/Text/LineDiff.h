//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Single-hunk line differ built on common prefix and suffix trimming.
///
/// Edits touching several places are reported as one hunk spanning from the
/// first to the last touched line.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_TEXT_LINE_DIFF_H
#define DRAFTLINT_TEXT_LINE_DIFF_H

#include "draftlint/Text/Region.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace draftlint
{

/// @brief Changed hunk between two snapshots.
struct LineChange final
{
    /// @brief Changed lines on the next side, clamped into the next document.
    LineRegion region;

    /// @brief Length of the common prefix; first index that differs on either side.
    std::size_t firstChangedLine{0};

    /// @brief Last changed line on the previous side; `region.start - 1` for pure insertions.
    std::int64_t previousLastChanged{0};

    /// @brief `next.size() - prev.size()`.
    std::int64_t lineDelta{0};
};

/// @brief Computes the changed hunk with its previous-side extent.
/// @param[in] prev Previous snapshot lines.
/// @param[in] next Current snapshot lines.
/// @return Hunk description, or empty when the arrays are equal or `next` is empty.
[[nodiscard]] std::optional<LineChange> computeLineChange(const std::vector<std::string>& prev,
                                                          const std::vector<std::string>& next);

/// @brief Returns the changed line range of `next`, or empty when unchanged.
[[nodiscard]] std::optional<LineRegion> diffLines(const std::vector<std::string>& prev,
                                                  const std::vector<std::string>& next);

}  // namespace draftlint

#endif  // DRAFTLINT_TEXT_LINE_DIFF_H
