//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Diagnostic records shared by local rules, the analysis worker, the
/// diagnostic cache, and the editor-facing server.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_SUPPORT_DIAGNOSTICS_H
#define DRAFTLINT_SUPPORT_DIAGNOSTICS_H

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace draftlint
{

/// @brief Severity level for a published diagnostic.
enum class DiagnosticSeverity
{
    /// @brief Rule violation rendered as an error squiggle.
    Error,

    /// @brief Informational hint.
    Info,
};

/// @brief Document-coordinate span of a diagnostic.
///
/// Lines are 0-based. Columns are 0-based UTF-16 code units.
struct DiagnosticRange final
{
    std::uint32_t startLine{0};
    std::uint32_t startColumn{0};
    std::uint32_t endLine{0};
    std::uint32_t endColumn{0};

    bool operator==(const DiagnosticRange&) const = default;
};

/// @brief One positioned message describing a style or grammar issue.
struct Diagnostic final
{
    /// @brief Span in document coordinates.
    DiagnosticRange range;

    /// @brief Human-readable message text.
    std::string message;

    /// @brief Severity level.
    DiagnosticSeverity severity{DiagnosticSeverity::Error};

    /// @brief Producer tag shown by the editor.
    std::string source;

    /// @brief Identifier of the rule that produced the message.
    std::string ruleId;

    bool operator==(const Diagnostic&) const = default;
};

/// @brief Raw message emitted by a worker-hosted rule.
///
/// Positions are 1-based and relative to the analysed text slice, matching the
/// worker wire protocol.
struct RuleMessage final
{
    std::string   ruleId;
    std::string   message;
    std::int64_t  severity{2};
    std::uint32_t startLine{1};
    std::uint32_t startColumn{1};
    std::uint32_t endLine{1};
    std::uint32_t endColumn{1};
};

/// @brief Converts a slice-relative rule message into document coordinates.
/// @param[in] message Worker rule message.
/// @param[in] baseLine Document line of the first slice line.
/// @param[in] source Producer tag for the resulting diagnostic.
/// @return Diagnostic with a non-empty range.
[[nodiscard]] Diagnostic convertRuleMessage(const RuleMessage& message, std::uint32_t baseLine, llvm::StringRef source);

/// @brief Sorts diagnostics by start position, preserving order of equal keys.
/// @param[in,out] diagnostics Diagnostics to sort.
void sortDiagnostics(std::vector<Diagnostic>& diagnostics);

/// @brief Returns whether a diagnostic's line span touches `[startLine, endLine]`.
[[nodiscard]] bool intersectsLines(const Diagnostic& diagnostic, std::uint32_t startLine, std::uint32_t endLine);

/// @brief Returns a stable lowercase name for a severity.
[[nodiscard]] llvm::StringRef severityName(DiagnosticSeverity severity);

}  // namespace draftlint

#endif  // DRAFTLINT_SUPPORT_DIAGNOSTICS_H
