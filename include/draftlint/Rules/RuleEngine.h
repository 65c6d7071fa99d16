//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Extensible prose rule engine hosted by the analysis worker.
///
/// Rules are created once per engine from a registry of factories. The
/// registry holds the built-in rules and any rule packs loaded from shared
/// libraries exporting `draftlintRegisterRules`. Each run consults the
/// request's rule configuration to decide which rules execute and with which
/// options.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_RULES_RULE_ENGINE_H
#define DRAFTLINT_RULES_RULE_ENGINE_H

#include "draftlint/Support/Diagnostics.h"
#include "draftlint/Support/FileKind.h"

#include "llvm/Support/JSON.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace draftlint
{

/// @brief Text slice handed to every rule.
struct RuleDocument final
{
    /// @brief File system path of the owning document.
    std::string filePath;

    /// @brief Input format.
    FileKind kind{FileKind::Text};

    /// @brief Masked slice text.
    std::string text;

    /// @brief `text` split into lines.
    std::vector<std::string> lines;
};

/// @brief Builds a rule document, splitting the text into lines.
[[nodiscard]] RuleDocument makeRuleDocument(std::string filePath, FileKind kind, std::string text);

/// @brief Interface implemented by one prose rule.
class Rule
{
public:
    virtual ~Rule() = default;

    /// @brief Returns stable rule identifier.
    /// @return Rule ID.
    [[nodiscard]] virtual std::string id() const = 0;

    /// @brief Returns one-line rule title.
    /// @return Rule title.
    [[nodiscard]] virtual std::string title() const = 0;

    /// @brief Executes the rule for one document.
    /// @param[in] document Document slice.
    /// @param[in] options Rule options; empty when enabled with `true`.
    /// @param[out] messages Messages appended by the rule, 1-based positions.
    virtual void run(const RuleDocument&       document,
                     const llvm::json::Object& options,
                     std::vector<RuleMessage>& messages) const = 0;
};

/// @brief Rule factory callback.
using RuleFactory = std::function<std::unique_ptr<Rule>()>;

/// @brief Registry used to install built-in and external rules.
class RuleRegistry final
{
public:
    /// @brief Constructs registry with built-in rules installed.
    RuleRegistry();

    /// @brief Registers one rule factory.
    /// @param[in] factory Rule factory callback.
    void registerRuleFactory(RuleFactory factory);

    /// @brief Loads external rules from a shared library.
    /// @param[in] libraryPath Shared library path.
    /// @param[out] errorMessage Optional failure detail.
    /// @return `true` on success.
    [[nodiscard]] bool loadPluginLibrary(const std::string& libraryPath, std::string* errorMessage = nullptr);

    /// @brief Materializes all registered rule instances.
    /// @return Rule instances sorted by rule ID.
    [[nodiscard]] std::vector<std::unique_ptr<Rule>> createRules() const;

private:
    struct PluginHandle;

    // Handles outlive the factories, whose code may live in a plugin.
    std::vector<std::shared_ptr<PluginHandle>> pluginHandles_;
    std::vector<RuleFactory>                   factories_;
};

/// @brief Persistent rule engine.
class RuleEngine final
{
public:
    /// @brief Returns true when the current job should stop early.
    using CancelCheck = std::function<bool()>;

    /// @brief Constructs engine and instantiates every registered rule.
    /// @param[in] registry Rule registry; kept alive for plugin-backed rules.
    explicit RuleEngine(RuleRegistry registry);

    /// @brief Runs the enabled rules over one slice.
    /// @param[in] document Slice to analyse.
    /// @param[in] ruleConfig Effective rule configuration.
    /// @param[in] cancelled Optional early-exit check run between rules.
    /// @return Messages ordered by position.
    [[nodiscard]] std::vector<RuleMessage> run(const RuleDocument&       document,
                                               const llvm::json::Object& ruleConfig,
                                               const CancelCheck&        cancelled = {}) const;

    /// @brief Counts rules enabled by a configuration.
    [[nodiscard]] std::size_t enabledRuleCount(const llvm::json::Object& ruleConfig) const;

    /// @brief Returns built-in rule IDs.
    /// @return Sorted rule IDs.
    [[nodiscard]] static std::vector<std::string> builtinRuleIds();

private:
    RuleRegistry                       registry_;
    std::vector<std::unique_ptr<Rule>> rules_;
};

}  // namespace draftlint

#endif  // DRAFTLINT_RULES_RULE_ENGINE_H
