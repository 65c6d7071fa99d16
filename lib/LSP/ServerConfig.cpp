//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements parsing of lint server configuration updates.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/ServerConfig.h"

#include "draftlint/Rules/RuleConfig.h"

#include <algorithm>
#include <optional>

namespace draftlint::lsp
{
namespace
{

std::optional<std::vector<std::string>> parseStringArrayValue(const llvm::json::Value& value)
{
    const auto* array = value.getAsArray();
    if (!array)
    {
        return std::nullopt;
    }

    std::vector<std::string> out;
    out.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return std::nullopt;
        }
        out.emplace_back(text->str());
    }
    return out;
}

void applyTraceLevel(const llvm::json::Object& settings, ServerConfig& config)
{
    if (const auto rawTrace = settings.getString("trace"))
    {
        config.traceLevel = parseTraceLevel(*rawTrace).value_or(TraceLevel::Basic);
    }
}

void applyLinterConfig(const llvm::json::Object& settings, ServerConfig& config)
{
    const auto* linterValue = settings.get("linter");
    if (!linterValue)
    {
        return;
    }
    const auto* linter = linterValue->getAsObject();
    if (!linter)
    {
        return;
    }

    if (const auto enabled = linter->getBoolean("enabled"))
    {
        config.lintEnabled = *enabled;
    }

    if (const auto onAutoSave = linter->getBoolean("lintOnAutoSave"))
    {
        config.lintOnAutoSave = *onAutoSave;
    }

    if (const auto context = linter->getInteger("incrementalContext"))
    {
        config.incrementalContextLines = static_cast<std::size_t>(std::max<std::int64_t>(*context, 0));
    }

    if (const auto* rules = linter->getObject("rules"))
    {
        config.ruleOverrides = *rules;
    }

    if (const auto* pluginLibrariesValue = linter->get("pluginLibraries"))
    {
        if (const auto pluginLibraries = parseStringArrayValue(*pluginLibrariesValue))
        {
            config.pluginLibraries = *pluginLibraries;
        }
    }
}

}  // namespace

llvm::json::Object effectiveRuleConfig(const ServerConfig& config)
{
    return mergeRuleConfig(defaultRuleConfig(), config.ruleOverrides);
}

bool applyDidChangeConfiguration(const llvm::json::Value& params, ServerConfig& config)
{
    const auto* paramsObject = params.getAsObject();
    if (!paramsObject)
    {
        return false;
    }

    const auto* settingsValue = paramsObject->get("settings");
    if (!settingsValue)
    {
        return false;
    }

    const auto* settings = settingsValue->getAsObject();
    if (!settings)
    {
        return false;
    }

    applyLinterConfig(*settings, config);
    applyTraceLevel(*settings, config);
    return true;
}

}  // namespace draftlint::lsp
