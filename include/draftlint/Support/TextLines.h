//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Line-array helpers over UTF-8 document text.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_SUPPORT_TEXT_LINES_H
#define DRAFTLINT_SUPPORT_TEXT_LINES_H

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace draftlint
{

/// @brief Splits text on `\n`, dropping carriage returns.
///
/// The result always has one more element than the text has newlines, so an
/// empty text yields a single empty line.
/// @param[in] text Document or slice text.
/// @return Line array.
[[nodiscard]] std::vector<std::string> splitLines(llvm::StringRef text);

/// @brief Joins `lines[first..last]` (inclusive) with `\n`.
[[nodiscard]] std::string joinLines(const std::vector<std::string>& lines, std::size_t first, std::size_t last);

/// @brief Joins all lines with `\n`.
[[nodiscard]] std::string joinLines(const std::vector<std::string>& lines);

/// @brief Returns whether a line has only ASCII or ideographic whitespace.
[[nodiscard]] bool isBlankLine(llvm::StringRef line);

/// @brief Returns whether a whole text has only whitespace.
[[nodiscard]] bool isBlankText(llvm::StringRef text);

/// @brief Returns the byte length of the UTF-8 sequence introduced by `lead`.
[[nodiscard]] std::size_t utf8SequenceLength(unsigned char lead);

/// @brief Converts a byte offset in a UTF-8 line into UTF-16 code units.
/// @param[in] line UTF-8 line text.
/// @param[in] byteOffset Byte offset inside `line`.
/// @return Column in UTF-16 code units.
[[nodiscard]] std::uint32_t utf16Column(llvm::StringRef line, std::size_t byteOffset);

}  // namespace draftlint

#endif  // DRAFTLINT_SUPPORT_TEXT_LINES_H
