//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the diagnostic cache and region merge.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/DiagnosticCache.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace draftlint::lsp
{
namespace
{

std::uint32_t shiftLine(const std::uint32_t line, const std::int64_t delta)
{
    return static_cast<std::uint32_t>(std::max<std::int64_t>(static_cast<std::int64_t>(line) + delta, 0));
}

}  // namespace

std::shared_ptr<const DocumentCacheEntry> DiagnosticCache::lookup(const std::string& uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = entries_.find(uri);
    return it == entries_.end() ? nullptr : it->second;
}

void DiagnosticCache::store(const std::string& uri, DocumentCacheEntry entry)
{
    auto frozen = std::make_shared<const DocumentCacheEntry>(std::move(entry));
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(uri, std::move(frozen));
}

bool DiagnosticCache::evict(const std::string& uri)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(uri) > 0U;
}

void DiagnosticCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t DiagnosticCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<Diagnostic> mergeDiagnostics(const std::vector<Diagnostic>& previous,
                                         std::vector<Diagnostic>        fresh,
                                         const std::vector<LineRegion>& regions)
{
    std::vector<Diagnostic> merged;
    merged.reserve(previous.size() + fresh.size());
    for (const Diagnostic& diagnostic : previous)
    {
        const bool touched = std::any_of(regions.begin(), regions.end(), [&diagnostic](const LineRegion& region) {
            return intersectsLines(diagnostic,
                                   static_cast<std::uint32_t>(region.start),
                                   static_cast<std::uint32_t>(region.end));
        });
        if (!touched)
        {
            merged.push_back(diagnostic);
        }
    }
    std::move(fresh.begin(), fresh.end(), std::back_inserter(merged));
    sortDiagnostics(merged);
    return merged;
}

std::vector<Diagnostic> rebaseDiagnostics(const std::vector<Diagnostic>& diagnostics, const LineChange& change)
{
    const auto firstChanged = static_cast<std::int64_t>(change.firstChangedLine);
    const auto pinned       = static_cast<std::uint32_t>(change.region.start);

    std::vector<Diagnostic> out;
    out.reserve(diagnostics.size());
    for (Diagnostic diagnostic : diagnostics)
    {
        const auto start = static_cast<std::int64_t>(diagnostic.range.startLine);
        const auto end   = static_cast<std::int64_t>(diagnostic.range.endLine);
        if (start > change.previousLastChanged)
        {
            diagnostic.range.startLine = shiftLine(diagnostic.range.startLine, change.lineDelta);
            diagnostic.range.endLine   = shiftLine(diagnostic.range.endLine, change.lineDelta);
        }
        else if (start >= firstChanged)
        {
            diagnostic.range.startLine = pinned;
            diagnostic.range.endLine   = pinned;
            diagnostic.range.endColumn = std::max(diagnostic.range.endColumn, diagnostic.range.startColumn + 1U);
        }
        else if (end > change.previousLastChanged)
        {
            diagnostic.range.endLine = shiftLine(diagnostic.range.endLine, change.lineDelta);
        }
        else if (end >= firstChanged)
        {
            diagnostic.range.endLine = std::max(diagnostic.range.startLine, pinned);
        }
        out.push_back(std::move(diagnostic));
    }
    sortDiagnostics(out);
    return out;
}

}  // namespace draftlint::lsp
