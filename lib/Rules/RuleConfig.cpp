//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements rule configuration defaults and merging.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Rules/RuleConfig.h"

namespace draftlint
{

llvm::json::Object defaultRuleConfig()
{
    llvm::json::Array kuten{"。", "「", "」", "『", "』", "—", "―", "…", "！", "？"};
    return llvm::json::Object{
        {"max-ten", llvm::json::Object{{"max", 4}, {"kuten", std::move(kuten)}}},
        {"ja-no-redundant-expression", true},
        {"no-mixed-zenkaku-and-hankaku-alphabet", true},
    };
}

llvm::json::Object mergeRuleConfig(const llvm::json::Object& base, const llvm::json::Object& overrides)
{
    llvm::json::Object out = base;
    for (const auto& entry : overrides)
    {
        // Index with the ObjectKey itself so an owned key stays owned in `out`.
        const llvm::json::ObjectKey& key      = entry.first;
        const llvm::json::Object*    patch    = entry.second.getAsObject();
        const llvm::json::Object*    existing = out.getObject(key);
        if (patch && existing)
        {
            llvm::json::Object merged = mergeRuleConfig(*existing, *patch);
            out[key]                  = std::move(merged);
            continue;
        }
        out[key] = entry.second;
    }
    return out;
}

RuleSetting resolveRuleSetting(const llvm::json::Object& config, llvm::StringRef ruleId)
{
    RuleSetting              setting;
    const llvm::json::Value* value = config.get(ruleId);
    if (!value)
    {
        return setting;
    }
    if (const auto enabled = value->getAsBoolean())
    {
        setting.enabled = *enabled;
        return setting;
    }
    if (const auto* options = value->getAsObject())
    {
        setting.options = *options;
        return setting;
    }
    // null disables; any other scalar enables with defaults.
    setting.enabled = !value->getAsNull();
    return setting;
}

}  // namespace draftlint
