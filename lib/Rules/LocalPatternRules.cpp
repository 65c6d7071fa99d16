//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the in-process punctuation rules.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Rules/LocalPatternRules.h"

#include "draftlint/Support/TextLines.h"

#include <regex>
#include <string>

namespace draftlint
{
namespace
{

// Patterns operate on UTF-8 bytes, so multi-byte characters are spelled as
// alternations instead of bracket classes.
const std::regex& punctuationRunPattern()
{
    static const std::regex pattern("(。。|、、|、。|。、)");
    return pattern;
}

const std::regex& fullWidthMarkPattern()
{
    static const std::regex pattern("(！|？)(?!！|？|　|」|』|〉|》|）|】|`|'|”|\\*|~|$)");
    return pattern;
}

const std::regex& asciiMarkPattern()
{
    static const std::regex pattern(
        "(!|\\?)(?!\\s|　|!|\\?|！|？|\\)|\\]|\\[|\"|'|」|』|”|\\*|~|,|\\.|:|;|$)");
    return pattern;
}

void scanLines(llvm::StringRef                     text,
               const std::uint32_t                 baseLine,
               const std::regex&                   pattern,
               llvm::StringRef                     ruleId,
               llvm::StringRef                     message,
               std::vector<Diagnostic>&            out)
{
    const std::vector<std::string> lines = splitLines(text);
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string& line = lines[i];
        for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it)
        {
            const std::smatch& match      = *it;
            const auto         byteOffset = static_cast<std::size_t>(match.position(1));
            const auto         byteLength = static_cast<std::size_t>(match.length(1));

            Diagnostic diagnostic;
            diagnostic.range.startLine   = baseLine + static_cast<std::uint32_t>(i);
            diagnostic.range.endLine     = diagnostic.range.startLine;
            diagnostic.range.startColumn = utf16Column(line, byteOffset);
            diagnostic.range.endColumn   = utf16Column(line, byteOffset + byteLength);
            diagnostic.message           = message.str();
            diagnostic.severity          = DiagnosticSeverity::Error;
            diagnostic.source            = DiagnosticSourceName.str();
            diagnostic.ruleId            = ruleId.str();
            out.push_back(std::move(diagnostic));
        }
    }
}

}  // namespace

std::vector<Diagnostic> findRepeatedPunctuation(llvm::StringRef text, const std::uint32_t baseLine)
{
    std::vector<Diagnostic> out;
    scanLines(text, baseLine, punctuationRunPattern(), PunctuationRunRuleId, "句読点が連続しています。", out);
    return out;
}

std::vector<Diagnostic> findExclamQuestionSpacing(llvm::StringRef text, const std::uint32_t baseLine)
{
    constexpr llvm::StringLiteral Message = "「！」と「？」の後にはスペースが必要です。";

    std::vector<Diagnostic> out;
    scanLines(text, baseLine, fullWidthMarkPattern(), ExclamQuestionSpacingRuleId, Message, out);
    scanLines(text, baseLine, asciiMarkPattern(), ExclamQuestionSpacingRuleId, Message, out);
    sortDiagnostics(out);
    return out;
}

std::vector<Diagnostic> runLocalPatternRules(llvm::StringRef text, const std::uint32_t baseLine)
{
    std::vector<Diagnostic> out = findRepeatedPunctuation(text, baseLine);
    std::vector<Diagnostic> spacing = findExclamQuestionSpacing(text, baseLine);
    out.insert(out.end(), spacing.begin(), spacing.end());
    return out;
}

}  // namespace draftlint
