//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "draftlint/Support/TextLines.h"
#include "draftlint/Text/LineDiff.h"

bool runLineDiffTests()
{
    using Lines = std::vector<std::string>;

    {
        const auto region = draftlint::diffLines(draftlint::splitLines("a\nb\nc"), draftlint::splitLines("a\nX\nc"));
        if (!region || *region != draftlint::LineRegion{1, 1})
        {
            std::cerr << "single modified line should produce region {1, 1}\n";
            return false;
        }
    }

    {
        const Lines same{"a", "b"};
        if (draftlint::computeLineChange(same, same))
        {
            std::cerr << "identical snapshots should produce no change\n";
            return false;
        }
    }

    {
        const auto change = draftlint::computeLineChange(Lines{"a", "c"}, Lines{"a", "b", "c"});
        if (!change || change->region != draftlint::LineRegion{1, 1} || change->lineDelta != 1 ||
            change->firstChangedLine != 1U || change->previousLastChanged != 0)
        {
            std::cerr << "inserted line should be reported at its new position\n";
            return false;
        }
    }

    {
        const auto change = draftlint::computeLineChange(Lines{"a", "b", "c"}, Lines{"a", "c"});
        if (!change || change->region != draftlint::LineRegion{1, 1} || change->lineDelta != -1 ||
            change->previousLastChanged != 1)
        {
            std::cerr << "pure deletion should report the line now at the deletion point\n";
            return false;
        }
    }

    {
        const auto region = draftlint::diffLines(Lines{"a", "b"}, Lines{"a"});
        if (!region || *region != draftlint::LineRegion{0, 0})
        {
            std::cerr << "deleting the last line should clamp to the new last line\n";
            return false;
        }
    }

    {
        const auto region = draftlint::diffLines(Lines{"a"}, Lines{"a", "b", "c"});
        if (!region || *region != draftlint::LineRegion{1, 2})
        {
            std::cerr << "appended lines should form the changed region\n";
            return false;
        }
    }

    {
        const auto region = draftlint::diffLines(Lines{"x", "y"}, Lines{});
        if (region)
        {
            std::cerr << "an empty new snapshot has no region\n";
            return false;
        }
    }

    return true;
}
