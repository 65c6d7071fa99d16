//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic conversion and ordering helpers.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Support/Diagnostics.h"

#include <algorithm>

namespace draftlint
{

Diagnostic convertRuleMessage(const RuleMessage& message, const std::uint32_t baseLine, llvm::StringRef source)
{
    const std::uint32_t line        = (message.startLine == 0 ? 0U : message.startLine - 1U) + baseLine;
    const std::uint32_t startColumn = message.startColumn == 0 ? 0U : message.startColumn - 1U;
    const std::uint32_t endLine     = std::max((message.endLine == 0 ? 0U : message.endLine - 1U) + baseLine, line);
    std::uint32_t       endColumn   = message.endColumn == 0 ? 0U : message.endColumn - 1U;
    if (endLine == line)
    {
        endColumn = std::max(endColumn, startColumn + 1U);
    }

    Diagnostic diagnostic;
    diagnostic.range    = DiagnosticRange{line, startColumn, endLine, endColumn};
    diagnostic.message  = message.message;
    diagnostic.severity = message.severity >= 1 ? DiagnosticSeverity::Error : DiagnosticSeverity::Info;
    diagnostic.source   = source.str();
    diagnostic.ruleId   = message.ruleId.empty() ? source.str() : message.ruleId;
    return diagnostic;
}

void sortDiagnostics(std::vector<Diagnostic>& diagnostics)
{
    std::stable_sort(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& lhs, const Diagnostic& rhs) {
        if (lhs.range.startLine != rhs.range.startLine)
        {
            return lhs.range.startLine < rhs.range.startLine;
        }
        return lhs.range.startColumn < rhs.range.startColumn;
    });
}

bool intersectsLines(const Diagnostic& diagnostic, const std::uint32_t startLine, const std::uint32_t endLine)
{
    const std::uint32_t first = diagnostic.range.startLine;
    const std::uint32_t last  = std::max(diagnostic.range.endLine, diagnostic.range.startLine);
    return !(last < startLine || first > endLine);
}

llvm::StringRef severityName(const DiagnosticSeverity severity)
{
    switch (severity)
    {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Info:
        return "info";
    }
    return "info";
}

}  // namespace draftlint
