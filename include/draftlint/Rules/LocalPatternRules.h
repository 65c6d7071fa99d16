//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// In-process punctuation checks run on each masked region.
///
/// These rules bypass the analysis worker. Each is one regular-expression scan
/// per physical line and every match is reported.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_RULES_LOCAL_PATTERN_RULES_H
#define DRAFTLINT_RULES_LOCAL_PATTERN_RULES_H

#include "draftlint/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <vector>

namespace draftlint
{

/// @brief Rule id for doubled terminal punctuation.
inline constexpr llvm::StringLiteral PunctuationRunRuleId = "punctuation-run";

/// @brief Rule id for a missing space after an exclamation or question mark.
inline constexpr llvm::StringLiteral ExclamQuestionSpacingRuleId = "exclam-question-needs-space";

/// @brief Producer tag used for every diagnostic published by the service.
inline constexpr llvm::StringLiteral DiagnosticSourceName = "draftlint";

/// @brief Reports `。。`, `、、`, `、。`, and `。、`.
/// @param[in] text Masked slice text.
/// @param[in] baseLine Document line of the first slice line.
[[nodiscard]] std::vector<Diagnostic> findRepeatedPunctuation(llvm::StringRef text, std::uint32_t baseLine);

/// @brief Reports `！`/`？`/`!`/`?` directly followed by running text.
/// @param[in] text Masked slice text.
/// @param[in] baseLine Document line of the first slice line.
[[nodiscard]] std::vector<Diagnostic> findExclamQuestionSpacing(llvm::StringRef text, std::uint32_t baseLine);

/// @brief Runs every local rule over a slice, in rule order.
[[nodiscard]] std::vector<Diagnostic> runLocalPatternRules(llvm::StringRef text, std::uint32_t baseLine);

}  // namespace draftlint

#endif  // DRAFTLINT_RULES_LOCAL_PATTERN_RULES_H
