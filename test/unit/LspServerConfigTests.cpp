//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "draftlint/LSP/ServerConfig.h"
#include "llvm/Support/JSON.h"

namespace
{

llvm::json::Value parseJson(const std::string& text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        std::cerr << "invalid JSON test fixture\n";
        std::abort();
    }
    return std::move(*parsed);
}

}  // namespace

bool runLspServerConfigTests()
{
    {
        const draftlint::lsp::ServerConfig config;
        if (!config.lintEnabled || config.lintOnAutoSave || config.incrementalContextLines != 2U ||
            config.traceLevel != draftlint::TraceLevel::Basic || !config.pluginLibraries.empty())
        {
            std::cerr << "unexpected configuration defaults\n";
            return false;
        }
    }

    {
        draftlint::lsp::ServerConfig config;
        if (draftlint::lsp::applyDidChangeConfiguration(parseJson("{}"), config) ||
            draftlint::lsp::applyDidChangeConfiguration(parseJson(R"({"settings":3})"), config) ||
            draftlint::lsp::applyDidChangeConfiguration(parseJson("[]"), config))
        {
            std::cerr << "params without a settings object should be rejected\n";
            return false;
        }
    }

    {
        draftlint::lsp::ServerConfig config;
        const bool                   applied = draftlint::lsp::applyDidChangeConfiguration(parseJson(R"({
            "settings": {
                "trace": "verbose",
                "linter": {
                    "enabled": false,
                    "lintOnAutoSave": true,
                    "incrementalContext": 5,
                    "rules": {"max-ten": {"max": 2}},
                    "pluginLibraries": ["/opt/rules/libextra.so"]
                }
            }
        })"),
                                                                             config);
        if (!applied)
        {
            std::cerr << "settings object should be applied\n";
            return false;
        }
        if (config.lintEnabled || !config.lintOnAutoSave || config.incrementalContextLines != 5U ||
            config.traceLevel != draftlint::TraceLevel::Verbose ||
            config.pluginLibraries != std::vector<std::string>{"/opt/rules/libextra.so"})
        {
            std::cerr << "linter settings were not applied\n";
            return false;
        }

        const llvm::json::Object  effective = draftlint::lsp::effectiveRuleConfig(config);
        const llvm::json::Object* maxTen    = effective.getObject("max-ten");
        if (!maxTen || !maxTen->getArray("kuten") || !effective.get("ja-no-redundant-expression"))
        {
            std::cerr << "rule overrides should keep the defaults they do not replace\n";
            return false;
        }
        const auto max = maxTen->getInteger("max");
        if (!max || *max != 2)
        {
            std::cerr << "rule overrides should be deep-merged over the defaults\n";
            return false;
        }
    }

    {
        draftlint::lsp::ServerConfig config;
        config.pluginLibraries = {"/opt/rules/libkept.so"};
        const bool applied     = draftlint::lsp::applyDidChangeConfiguration(parseJson(R"({
            "settings": {
                "trace": "loud",
                "linter": {"incrementalContext": -4, "pluginLibraries": ["/ok.so", 7]}
            }
        })"),
                                                                         config);
        if (!applied || config.incrementalContextLines != 0U || config.traceLevel != draftlint::TraceLevel::Basic)
        {
            std::cerr << "negative context should clamp and unknown trace should fall back to basic\n";
            return false;
        }
        if (config.pluginLibraries != std::vector<std::string>{"/opt/rules/libkept.so"})
        {
            std::cerr << "malformed plugin library lists should be ignored\n";
            return false;
        }
        if (!config.lintEnabled)
        {
            std::cerr << "absent settings should keep their previous values\n";
            return false;
        }
    }

    return true;
}
