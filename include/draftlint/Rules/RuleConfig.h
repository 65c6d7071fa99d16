//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rule configuration objects sent to the analysis worker.
///
/// A rule configuration maps rule ids to `false` (disabled), `true` (enabled
/// with defaults), or an options object (enabled with options).
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_RULES_RULE_CONFIG_H
#define DRAFTLINT_RULES_RULE_CONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

namespace draftlint
{

/// @brief Resolved enablement and options for one rule.
struct RuleSetting final
{
    /// @brief True unless the configuration maps the rule to `false`.
    bool enabled{true};

    /// @brief Options object; empty for `true` or missing entries.
    llvm::json::Object options;
};

/// @brief Returns the built-in default rule configuration.
[[nodiscard]] llvm::json::Object defaultRuleConfig();

/// @brief Deep-merges `overrides` into `base`.
///
/// Nested objects merge key by key; any other value (including arrays)
/// replaces the base entry.
[[nodiscard]] llvm::json::Object mergeRuleConfig(const llvm::json::Object& base, const llvm::json::Object& overrides);

/// @brief Resolves one rule's entry.
/// @param[in] config Effective rule configuration.
/// @param[in] ruleId Rule identifier.
/// @return Rule setting; rules without an entry are enabled with no options.
[[nodiscard]] RuleSetting resolveRuleSetting(const llvm::json::Object& config, llvm::StringRef ruleId);

}  // namespace draftlint

#endif  // DRAFTLINT_RULES_RULE_CONFIG_H
