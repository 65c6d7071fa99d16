//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements open-document storage and document eligibility checks.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/DocumentStore.h"

#include "llvm/ADT/StringExtras.h"

#include <utility>

namespace draftlint::lsp
{

void DocumentStore::open(std::string uri, std::string text, const std::int64_t version, std::string languageId)
{
    DocumentSnapshot snapshot{uri, std::move(text), version, std::move(languageId)};
    documents_.insert_or_assign(std::move(uri), std::move(snapshot));
}

bool DocumentStore::applyFullTextChange(const std::string& uri, std::string text, const std::int64_t version)
{
    const auto it = documents_.find(uri);
    if (it == documents_.end())
    {
        return false;
    }
    it->second.text    = std::move(text);
    it->second.version = version;
    return true;
}

bool DocumentStore::close(const std::string& uri)
{
    return documents_.erase(uri) > 0U;
}

const DocumentSnapshot* DocumentStore::lookup(const std::string& uri) const
{
    const auto it = documents_.find(uri);
    return it == documents_.end() ? nullptr : &it->second;
}

std::vector<DocumentSnapshot> DocumentStore::snapshots() const
{
    std::vector<DocumentSnapshot> out;
    out.reserve(documents_.size());
    for (const auto& [_, snapshot] : documents_)
    {
        out.push_back(snapshot);
    }
    return out;
}

std::string documentPath(llvm::StringRef uri)
{
    llvm::StringRef rest = uri;
    if (!rest.consume_front("file://"))
    {
        return uri.str();
    }

    std::string path;
    path.reserve(rest.size());
    for (std::size_t i = 0; i < rest.size(); ++i)
    {
        if (rest[i] == '%' && i + 2U < rest.size() && llvm::isHexDigit(rest[i + 1U]) &&
            llvm::isHexDigit(rest[i + 2U]))
        {
            path.push_back(static_cast<char>(llvm::hexDigitValue(rest[i + 1U]) * 16U +
                                             llvm::hexDigitValue(rest[i + 2U])));
            i += 2U;
            continue;
        }
        path.push_back(rest[i]);
    }
    return path;
}

bool canLint(const DocumentSnapshot& snapshot)
{
    if (llvm::StringRef(snapshot.uri).take_front(9) == "untitled:")
    {
        return false;
    }
    return isLintableKind(documentPath(snapshot.uri), snapshot.languageId);
}

FileKind fileKindOf(const DocumentSnapshot& snapshot)
{
    return fileKindFor(documentPath(snapshot.uri), snapshot.languageId);
}

}  // namespace draftlint::lsp
