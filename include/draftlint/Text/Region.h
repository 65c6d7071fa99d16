//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Inclusive line-range value type shared by the diff and region planners.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_TEXT_REGION_H
#define DRAFTLINT_TEXT_REGION_H

#include <cstddef>

namespace draftlint
{

/// @brief Inclusive, 0-based line range with `start <= end`.
struct LineRegion final
{
    std::size_t start{0};
    std::size_t end{0};

    bool operator==(const LineRegion&) const = default;
};

}  // namespace draftlint

#endif  // DRAFTLINT_TEXT_REGION_H
