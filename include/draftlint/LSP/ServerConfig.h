//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration model for the lint server.
///
/// Configuration is updated from `workspace/didChangeConfiguration`
/// notifications and consumed by the lint orchestrator and tracing.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_LSP_SERVER_CONFIG_H
#define DRAFTLINT_LSP_SERVER_CONFIG_H

#include "draftlint/Support/Logging.h"

#include "llvm/Support/JSON.h"

#include <cstddef>
#include <string>
#include <vector>

namespace draftlint::lsp
{

/// @brief Mutable runtime configuration for `draftlintd`.
struct ServerConfig final
{
    /// @brief Enables lint triggers when true.
    bool lintEnabled{true};

    /// @brief Lints on automatic (delay or focus-out) saves when true.
    bool lintOnAutoSave{false};

    /// @brief Lines of padding around a paragraph-expanded change.
    std::size_t incrementalContextLines{2};

    /// @brief Rule overrides deep-merged over the default rule configuration.
    llvm::json::Object ruleOverrides;

    /// @brief Rule-pack shared library paths loaded by the analysis worker.
    std::vector<std::string> pluginLibraries;

    /// @brief Configured trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};
};

/// @brief Returns the effective rule configuration for a server configuration.
[[nodiscard]] llvm::json::Object effectiveRuleConfig(const ServerConfig& config);

/// @brief Applies settings from `workspace/didChangeConfiguration` params.
/// @param[in] params Notification params object.
/// @param[in,out] config Configuration instance to update.
/// @return `true` when params had a parseable `settings` object.
[[nodiscard]] bool applyDidChangeConfiguration(const llvm::json::Value& params, ServerConfig& config);

}  // namespace draftlint::lsp

#endif  // DRAFTLINT_LSP_SERVER_CONFIG_H
