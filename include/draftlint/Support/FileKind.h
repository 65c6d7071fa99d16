//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Document kinds understood by the analysis worker.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_SUPPORT_FILE_KIND_H
#define DRAFTLINT_SUPPORT_FILE_KIND_H

#include "llvm/ADT/StringRef.h"

#include <optional>

namespace draftlint
{

/// @brief Input format of an analysed text.
enum class FileKind
{
    /// @brief Plain text (`txt` on the wire).
    Text,

    /// @brief Markdown (`md` on the wire).
    Markdown,
};

/// @brief Returns the wire name (`txt` or `md`).
[[nodiscard]] llvm::StringRef fileKindName(FileKind kind);

/// @brief Parses a wire name.
[[nodiscard]] std::optional<FileKind> parseFileKind(llvm::StringRef name);

/// @brief Derives the kind from a path and editor language id.
/// @param[in] path File system path or URI.
/// @param[in] languageId Editor language id, possibly empty.
/// @return Markdown for markdown language or `.md`/`.markdown` paths, otherwise text.
[[nodiscard]] FileKind fileKindFor(llvm::StringRef path, llvm::StringRef languageId);

/// @brief Returns whether a path or language id names a lintable prose document.
[[nodiscard]] bool isLintableKind(llvm::StringRef path, llvm::StringRef languageId);

}  // namespace draftlint

#endif  // DRAFTLINT_SUPPORT_FILE_KIND_H
