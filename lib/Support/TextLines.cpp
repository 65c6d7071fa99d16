//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements line splitting, blank detection, and UTF-16 column mapping.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Support/TextLines.h"

#include <algorithm>
#include <cctype>

namespace draftlint
{
namespace
{

// U+3000 IDEOGRAPHIC SPACE and U+00A0 NO-BREAK SPACE count as blank.
constexpr llvm::StringRef IdeographicSpace = "\xE3\x80\x80";
constexpr llvm::StringRef NoBreakSpace     = "\xC2\xA0";

}  // namespace

std::vector<std::string> splitLines(llvm::StringRef text)
{
    std::vector<std::string> lines;
    std::size_t              start = 0;
    while (start <= text.size())
    {
        const std::size_t newline = text.find('\n', start);
        llvm::StringRef   line =
            newline == llvm::StringRef::npos ? text.substr(start) : text.substr(start, newline - start);
        std::string cleaned;
        cleaned.reserve(line.size());
        for (const char c : line)
        {
            if (c != '\r')
            {
                cleaned.push_back(c);
            }
        }
        lines.push_back(std::move(cleaned));
        if (newline == llvm::StringRef::npos)
        {
            break;
        }
        start = newline + 1U;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines, const std::size_t first, const std::size_t last)
{
    std::string out;
    if (lines.empty() || first >= lines.size())
    {
        return out;
    }
    const std::size_t end = std::min(last, lines.size() - 1U);
    for (std::size_t i = first; i <= end; ++i)
    {
        if (i != first)
        {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

std::string joinLines(const std::vector<std::string>& lines)
{
    return lines.empty() ? std::string() : joinLines(lines, 0, lines.size() - 1U);
}

bool isBlankLine(llvm::StringRef line)
{
    while (!line.empty())
    {
        if (std::isspace(static_cast<unsigned char>(line.front())))
        {
            line = line.drop_front();
            continue;
        }
        if (line.consume_front(IdeographicSpace) || line.consume_front(NoBreakSpace))
        {
            continue;
        }
        return false;
    }
    return true;
}

bool isBlankText(llvm::StringRef text)
{
    return isBlankLine(text);
}

std::size_t utf8SequenceLength(const unsigned char lead)
{
    if (lead < 0x80U)
    {
        return 1U;
    }
    if ((lead & 0xE0U) == 0xC0U)
    {
        return 2U;
    }
    if ((lead & 0xF0U) == 0xE0U)
    {
        return 3U;
    }
    if ((lead & 0xF8U) == 0xF0U)
    {
        return 4U;
    }
    return 1U;
}

std::uint32_t utf16Column(llvm::StringRef line, const std::size_t byteOffset)
{
    std::uint32_t     column = 0;
    const std::size_t end    = std::min(byteOffset, line.size());
    for (std::size_t i = 0; i < end; ++i)
    {
        const auto byte = static_cast<unsigned char>(line[i]);
        if ((byte & 0xC0U) == 0x80U)
        {
            continue;
        }
        // Supplementary-plane code points take a surrogate pair.
        column += (byte & 0xF8U) == 0xF0U ? 2U : 1U;
    }
    return column;
}

}  // namespace draftlint
