//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements document kind detection.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Support/FileKind.h"

#include <string>

namespace draftlint
{
namespace
{

bool isMarkdownPath(const std::string& lowered)
{
    return lowered.ends_with(".md") || lowered.ends_with(".markdown");
}

}  // namespace

llvm::StringRef fileKindName(const FileKind kind)
{
    return kind == FileKind::Markdown ? "md" : "txt";
}

std::optional<FileKind> parseFileKind(llvm::StringRef name)
{
    if (name == "md")
    {
        return FileKind::Markdown;
    }
    if (name == "txt")
    {
        return FileKind::Text;
    }
    return std::nullopt;
}

FileKind fileKindFor(llvm::StringRef path, llvm::StringRef languageId)
{
    if (languageId == "markdown" || isMarkdownPath(path.lower()))
    {
        return FileKind::Markdown;
    }
    return FileKind::Text;
}

bool isLintableKind(llvm::StringRef path, llvm::StringRef languageId)
{
    if (languageId == "plaintext" || languageId == "markdown")
    {
        return true;
    }
    const std::string lowered = path.lower();
    return lowered.ends_with(".txt") || isMarkdownPath(lowered);
}

}  // namespace draftlint
