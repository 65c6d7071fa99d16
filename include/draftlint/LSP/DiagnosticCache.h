//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-document cache of the last analysed snapshot and its diagnostics.
///
/// Entries are immutable once stored. A successful cycle builds a new entry
/// and swaps it in; readers keep whatever entry they looked up.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_LSP_DIAGNOSTIC_CACHE_H
#define DRAFTLINT_LSP_DIAGNOSTIC_CACHE_H

#include "draftlint/Support/Diagnostics.h"
#include "draftlint/Text/LineDiff.h"
#include "draftlint/Text/Region.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace draftlint::lsp
{

/// @brief Line-split view of a document at one point in time.
struct TextSnapshot final
{
    std::vector<std::string> lines;
};

/// @brief Cached analysis state of one document.
struct DocumentCacheEntry final
{
    /// @brief Snapshot the diagnostics were computed for.
    TextSnapshot snapshot;

    /// @brief Diagnostics in document coordinates, sorted by start.
    std::vector<Diagnostic> diagnostics;
};

/// @brief Thread-safe map from document URI to its latest cache entry.
class DiagnosticCache final
{
public:
    /// @brief Returns the entry for `uri`, or `nullptr`.
    [[nodiscard]] std::shared_ptr<const DocumentCacheEntry> lookup(const std::string& uri) const;

    /// @brief Replaces the entry for `uri`.
    void store(const std::string& uri, DocumentCacheEntry entry);

    /// @brief Removes the entry for `uri`.
    /// @return `true` when an entry existed.
    bool evict(const std::string& uri);

    /// @brief Removes every entry.
    void clear();

    /// @brief Returns the number of cached documents.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex                                                         mutex_;
    std::unordered_map<std::string, std::shared_ptr<const DocumentCacheEntry>> entries_;
};

/// @brief Replaces the diagnostics of re-analysed regions.
///
/// Old diagnostics whose line span touches any region are dropped, the fresh
/// ones are appended, and the result is stably sorted by start position.
/// @param[in] previous Cached diagnostics in current coordinates.
/// @param[in] fresh Diagnostics computed for `regions`.
/// @param[in] regions Regions that were re-analysed.
/// @return Merged diagnostics.
[[nodiscard]] std::vector<Diagnostic> mergeDiagnostics(const std::vector<Diagnostic>& previous,
                                                       std::vector<Diagnostic>        fresh,
                                                       const std::vector<LineRegion>& regions);

/// @brief Moves cached diagnostics onto the lines they occupy after an edit.
///
/// Diagnostics above the hunk are unchanged. Diagnostics below it shift by the
/// line delta. Diagnostics inside it are pinned to the first changed line so
/// that the hunk's region re-checks them.
[[nodiscard]] std::vector<Diagnostic> rebaseDiagnostics(const std::vector<Diagnostic>& diagnostics,
                                                        const LineChange&              change);

}  // namespace draftlint::lsp

#endif  // DRAFTLINT_LSP_DIAGNOSTIC_CACHE_H
