//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "draftlint/LSP/DiagnosticCache.h"
#include "draftlint/Text/LineDiff.h"

namespace
{

draftlint::Diagnostic diagnosticOn(const std::uint32_t line, std::string message)
{
    draftlint::Diagnostic diagnostic;
    diagnostic.range   = draftlint::DiagnosticRange{line, 3, line, 4};
    diagnostic.message = std::move(message);
    diagnostic.source  = "draftlint";
    return diagnostic;
}

}  // namespace

bool runDiagnosticCacheTests()
{
    {
        draftlint::lsp::DiagnosticCache cache;
        if (cache.lookup("file:///a.md") != nullptr || cache.size() != 0U)
        {
            std::cerr << "fresh cache should be empty\n";
            return false;
        }

        draftlint::lsp::DocumentCacheEntry entry;
        entry.snapshot.lines = {"one", "two"};
        entry.diagnostics    = {diagnosticOn(1, "old")};
        cache.store("file:///a.md", entry);

        const auto held = cache.lookup("file:///a.md");
        if (!held || held->snapshot.lines.size() != 2U || held->diagnostics.size() != 1U)
        {
            std::cerr << "stored entry should be returned by lookup\n";
            return false;
        }

        entry.snapshot.lines = {"one"};
        entry.diagnostics.clear();
        cache.store("file:///a.md", entry);
        if (held->snapshot.lines.size() != 2U || held->diagnostics.front().message != "old")
        {
            std::cerr << "replacing an entry should not mutate snapshots already handed out\n";
            return false;
        }
        if (cache.lookup("file:///a.md")->snapshot.lines.size() != 1U)
        {
            std::cerr << "lookup should see the replacement entry\n";
            return false;
        }

        cache.store("file:///b.md", entry);
        if (!cache.evict("file:///a.md") || cache.evict("file:///a.md") || cache.size() != 1U)
        {
            std::cerr << "evict should remove an entry once\n";
            return false;
        }
        cache.clear();
        if (cache.size() != 0U)
        {
            std::cerr << "clear should drop every entry\n";
            return false;
        }
    }

    {
        const std::vector<draftlint::Diagnostic> previous{diagnosticOn(1, "keep-1"),
                                                          diagnosticOn(5, "replace"),
                                                          diagnosticOn(9, "keep-9")};
        const std::vector<draftlint::LineRegion> regions{{4, 6}};
        const auto merged = draftlint::lsp::mergeDiagnostics(previous, {diagnosticOn(5, "fresh")}, regions);
        if (merged.size() != 3U || merged[0].message != "keep-1" || merged[1].message != "fresh" ||
            merged[2].message != "keep-9")
        {
            std::cerr << "merge should replace only diagnostics inside the analysed regions\n";
            return false;
        }

        const auto cleared = draftlint::lsp::mergeDiagnostics(previous, {}, {{0, 20}});
        if (!cleared.empty())
        {
            std::cerr << "a region covering everything should drop every stale diagnostic\n";
            return false;
        }
    }

    {
        // Two lines inserted after line 0 push later diagnostics down.
        const auto change = draftlint::computeLineChange({"a", "b", "c", "d"}, {"a", "X", "Y", "b", "c", "d"});
        if (!change)
        {
            std::cerr << "expected an insertion change\n";
            return false;
        }
        const auto rebased =
            draftlint::lsp::rebaseDiagnostics({diagnosticOn(0, "above"), diagnosticOn(2, "below")}, *change);
        if (rebased[0].range.startLine != 0U || rebased[1].range.startLine != 4U || rebased[1].range.endLine != 4U)
        {
            std::cerr << "insertion should shift only diagnostics after the change\n";
            return false;
        }
    }

    {
        const auto change = draftlint::computeLineChange({"a", "b", "c"}, {"a", "B", "c"});
        const auto rebased =
            draftlint::lsp::rebaseDiagnostics({diagnosticOn(1, "inside"), diagnosticOn(2, "after")}, *change);
        if (rebased[0].range.startLine != 1U || rebased[1].range.startLine != 2U)
        {
            std::cerr << "in-place edit should keep line numbers\n";
            return false;
        }
    }

    {
        // Lines "b" and "c" deleted: a diagnostic on a deleted line is pinned to the edit point.
        const auto change = draftlint::computeLineChange({"a", "b", "c", "d"}, {"a", "d"});
        if (!change)
        {
            std::cerr << "expected a deletion change\n";
            return false;
        }
        const auto rebased =
            draftlint::lsp::rebaseDiagnostics({diagnosticOn(2, "deleted"), diagnosticOn(3, "moved")}, *change);
        if (rebased[0].range.startLine != 1U || rebased[1].range.startLine != 1U)
        {
            std::cerr << "deletion should pin removed diagnostics and shift later ones up\n";
            return false;
        }
        for (const draftlint::Diagnostic& diagnostic : rebased)
        {
            if (diagnostic.range.endLine < diagnostic.range.startLine)
            {
                std::cerr << "rebased ranges must stay well formed\n";
                return false;
            }
        }
    }

    return true;
}
