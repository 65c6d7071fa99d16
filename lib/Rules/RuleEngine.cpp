//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements rule registration, built-in prose rules, and rule execution.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Rules/RuleEngine.h"

#include "draftlint/Rules/RuleConfig.h"
#include "draftlint/Support/TextLines.h"

#include "llvm/ADT/StringRef.h"

#include <algorithm>
#include <dlfcn.h>
#include <set>
#include <tuple>
#include <utility>

namespace draftlint
{
namespace
{

constexpr std::int64_t WireSeverityInfo    = 0;
constexpr std::int64_t WireSeverityWarning = 1;
constexpr std::int64_t WireSeverityError   = 2;

RuleMessage makeMessage(const std::string&  ruleId,
                        std::string         message,
                        const std::string&  line,
                        const std::size_t   lineIndex,
                        const std::size_t   byteBegin,
                        const std::size_t   byteEnd)
{
    RuleMessage out;
    out.ruleId      = ruleId;
    out.message     = std::move(message);
    out.severity    = WireSeverityError;
    out.startLine   = static_cast<std::uint32_t>(lineIndex + 1U);
    out.endLine     = out.startLine;
    out.startColumn = utf16Column(line, byteBegin) + 1U;
    out.endColumn   = utf16Column(line, byteEnd) + 1U;
    return out;
}

/// Splits a line into UTF-8 code point slices.
std::vector<llvm::StringRef> codePoints(llvm::StringRef line)
{
    std::vector<llvm::StringRef> out;
    std::size_t                  offset = 0;
    while (offset < line.size())
    {
        const std::size_t length = std::min(utf8SequenceLength(static_cast<unsigned char>(line[offset])),
                                            line.size() - offset);
        out.push_back(line.substr(offset, length));
        offset += length;
    }
    return out;
}

class MaxTenRule final : public Rule
{
public:
    [[nodiscard]] std::string id() const override
    {
        return "max-ten";
    }

    [[nodiscard]] std::string title() const override
    {
        return "Limit the number of commas in one sentence";
    }

    void run(const RuleDocument&       document,
             const llvm::json::Object& options,
             std::vector<RuleMessage>& messages) const override
    {
        std::int64_t max = 4;
        if (const auto configured = options.getInteger("max"))
        {
            max = std::max<std::int64_t>(*configured, 0);
        }

        std::set<std::string> kuten{"。", "！", "？"};
        if (const auto* configured = options.getArray("kuten"))
        {
            kuten.clear();
            for (const llvm::json::Value& item : *configured)
            {
                if (const auto text = item.getAsString())
                {
                    kuten.insert(text->str());
                }
            }
        }

        std::int64_t count = 0;
        for (std::size_t lineIndex = 0; lineIndex < document.lines.size(); ++lineIndex)
        {
            const std::string& line = document.lines[lineIndex];
            if (isBlankLine(line))
            {
                count = 0;
                continue;
            }
            std::size_t offset = 0;
            for (const llvm::StringRef point : codePoints(line))
            {
                if (kuten.count(point.str()) != 0U)
                {
                    count = 0;
                }
                else if (point == "、" || point == "，")
                {
                    ++count;
                    if (count == max + 1)
                    {
                        messages.push_back(makeMessage(id(),
                                                       "一つの文で\"、\"を" + std::to_string(max + 1) +
                                                           "つ以上使用しています",
                                                       line,
                                                       lineIndex,
                                                       offset,
                                                       offset + point.size()));
                    }
                }
                offset += point.size();
            }
        }
    }
};

class RedundantExpressionRule final : public Rule
{
public:
    [[nodiscard]] std::string id() const override
    {
        return "ja-no-redundant-expression";
    }

    [[nodiscard]] std::string title() const override
    {
        return "Flag redundant Japanese phrasing";
    }

    void run(const RuleDocument&       document,
             const llvm::json::Object& options,
             std::vector<RuleMessage>& messages) const override
    {
        (void) options;
        struct Phrase final
        {
            llvm::StringRef redundant;
            llvm::StringRef concise;
        };
        static const Phrase Table[] = {
            {"することができ", "でき"},
            {"することが可能", "できる"},
            {"ということができる", "といえる"},
            {"であると言える", "と言える"},
            {"であるといえる", "といえる"},
            {"であると考えている", "と考えている"},
            {"することを行う", "する"},
        };

        for (std::size_t lineIndex = 0; lineIndex < document.lines.size(); ++lineIndex)
        {
            const llvm::StringRef line = document.lines[lineIndex];
            for (const Phrase& phrase : Table)
            {
                std::size_t offset = line.find(phrase.redundant);
                while (offset != llvm::StringRef::npos)
                {
                    messages.push_back(makeMessage(id(),
                                                   "\"" + phrase.redundant.str() + "\"は冗長な表現です。\"" +
                                                       phrase.concise.str() + "\"など簡潔な表現にできます。",
                                                   document.lines[lineIndex],
                                                   lineIndex,
                                                   offset,
                                                   offset + phrase.redundant.size()));
                    offset = line.find(phrase.redundant, offset + phrase.redundant.size());
                }
            }
        }
    }
};

class MixedAlphabetRule final : public Rule
{
public:
    [[nodiscard]] std::string id() const override
    {
        return "no-mixed-zenkaku-and-hankaku-alphabet";
    }

    [[nodiscard]] std::string title() const override
    {
        return "Do not mix full-width and half-width Latin letters";
    }

    void run(const RuleDocument&       document,
             const llvm::json::Object& options,
             std::vector<RuleMessage>& messages) const override
    {
        (void) options;
        for (std::size_t lineIndex = 0; lineIndex < document.lines.size(); ++lineIndex)
        {
            const std::string& line = document.lines[lineIndex];
            const bool         hasHalfWidth =
                std::any_of(line.begin(), line.end(), [](const char c) {
                    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
                });
            if (!hasHalfWidth)
            {
                continue;
            }

            std::size_t offset   = 0;
            std::size_t runStart = llvm::StringRef::npos;
            for (const llvm::StringRef point : codePoints(line))
            {
                const bool fullWidth = isFullWidthLatin(point);
                if (fullWidth && runStart == llvm::StringRef::npos)
                {
                    runStart = offset;
                }
                if (!fullWidth && runStart != llvm::StringRef::npos)
                {
                    report(line, lineIndex, runStart, offset, messages);
                    runStart = llvm::StringRef::npos;
                }
                offset += point.size();
            }
            if (runStart != llvm::StringRef::npos)
            {
                report(line, lineIndex, runStart, offset, messages);
            }
        }
    }

private:
    // U+FF21..U+FF3A and U+FF41..U+FF5A.
    static bool isFullWidthLatin(llvm::StringRef point)
    {
        if (point.size() != 3U || static_cast<unsigned char>(point[0]) != 0xEFU)
        {
            return false;
        }
        const auto second = static_cast<unsigned char>(point[1]);
        const auto third  = static_cast<unsigned char>(point[2]);
        return (second == 0xBCU && third >= 0xA1U && third <= 0xBAU) ||
               (second == 0xBDU && third >= 0x81U && third <= 0x9AU);
    }

    void report(const std::string&        line,
                const std::size_t         lineIndex,
                const std::size_t         begin,
                const std::size_t         end,
                std::vector<RuleMessage>& messages) const
    {
        messages.push_back(
            makeMessage(id(), "全角と半角のアルファベットが混在しています。", line, lineIndex, begin, end));
    }
};

void registerBuiltinRules(RuleRegistry& registry)
{
    registry.registerRuleFactory([]() { return std::make_unique<MaxTenRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<RedundantExpressionRule>(); });
    registry.registerRuleFactory([]() { return std::make_unique<MixedAlphabetRule>(); });
}

/// Applies the `severity` option shared by every rule.
void applySeverityOption(const llvm::json::Object& options, std::vector<RuleMessage>& messages)
{
    const auto name = options.getString("severity");
    if (!name)
    {
        return;
    }
    std::int64_t severity = WireSeverityError;
    if (*name == "info")
    {
        severity = WireSeverityInfo;
    }
    else if (*name == "warning")
    {
        severity = WireSeverityWarning;
    }
    for (RuleMessage& message : messages)
    {
        message.severity = severity;
    }
}

}  // namespace

RuleDocument makeRuleDocument(std::string filePath, const FileKind kind, std::string text)
{
    RuleDocument document;
    document.filePath = std::move(filePath);
    document.kind     = kind;
    document.lines    = splitLines(text);
    document.text     = std::move(text);
    return document;
}

struct RuleRegistry::PluginHandle final
{
    explicit PluginHandle(void* inHandle)
        : handle(inHandle)
    {
    }

    ~PluginHandle()
    {
        if (handle)
        {
            dlclose(handle);
        }
    }

    void* handle{nullptr};
};

RuleRegistry::RuleRegistry()
{
    registerBuiltinRules(*this);
}

void RuleRegistry::registerRuleFactory(RuleFactory factory)
{
    if (!factory)
    {
        return;
    }
    factories_.push_back(std::move(factory));
}

bool RuleRegistry::loadPluginLibrary(const std::string& libraryPath, std::string* errorMessage)
{
    void* handle = dlopen(libraryPath.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (!handle)
    {
        if (errorMessage)
        {
            *errorMessage = dlerror();
        }
        return false;
    }

    using RegisterFn = void (*)(RuleRegistry&);
    void* symbol     = dlsym(handle, "draftlintRegisterRules");
    if (!symbol)
    {
        if (errorMessage)
        {
            *errorMessage = "missing symbol draftlintRegisterRules";
        }
        dlclose(handle);
        return false;
    }

    RegisterFn registerFn = reinterpret_cast<RegisterFn>(symbol);
    registerFn(*this);
    pluginHandles_.push_back(std::make_shared<PluginHandle>(handle));
    return true;
}

std::vector<std::unique_ptr<Rule>> RuleRegistry::createRules() const
{
    std::vector<std::unique_ptr<Rule>> rules;
    rules.reserve(factories_.size());
    for (const RuleFactory& factory : factories_)
    {
        std::unique_ptr<Rule> rule = factory();
        if (!rule)
        {
            continue;
        }
        rules.push_back(std::move(rule));
    }
    std::sort(rules.begin(), rules.end(), [](const std::unique_ptr<Rule>& lhs, const std::unique_ptr<Rule>& rhs) {
        return lhs->id() < rhs->id();
    });
    return rules;
}

RuleEngine::RuleEngine(RuleRegistry registry)
    : registry_(std::move(registry))
    , rules_(registry_.createRules())
{
}

std::vector<RuleMessage> RuleEngine::run(const RuleDocument&       document,
                                         const llvm::json::Object& ruleConfig,
                                         const CancelCheck&        cancelled) const
{
    std::vector<RuleMessage> messages;
    for (const std::unique_ptr<Rule>& rule : rules_)
    {
        if (cancelled && cancelled())
        {
            break;
        }
        const RuleSetting setting = resolveRuleSetting(ruleConfig, rule->id());
        if (!setting.enabled)
        {
            continue;
        }

        std::vector<RuleMessage> emitted;
        rule->run(document, setting.options, emitted);
        applySeverityOption(setting.options, emitted);
        for (RuleMessage& message : emitted)
        {
            if (message.ruleId.empty())
            {
                message.ruleId = rule->id();
            }
            messages.push_back(std::move(message));
        }
    }

    std::stable_sort(messages.begin(), messages.end(), [](const RuleMessage& lhs, const RuleMessage& rhs) {
        return std::tie(lhs.startLine, lhs.startColumn) < std::tie(rhs.startLine, rhs.startColumn);
    });
    return messages;
}

std::size_t RuleEngine::enabledRuleCount(const llvm::json::Object& ruleConfig) const
{
    return static_cast<std::size_t>(
        std::count_if(rules_.begin(), rules_.end(), [&ruleConfig](const std::unique_ptr<Rule>& rule) {
            return resolveRuleSetting(ruleConfig, rule->id()).enabled;
        }));
}

std::vector<std::string> RuleEngine::builtinRuleIds()
{
    RuleRegistry             registry;
    std::vector<std::string> ids;
    for (const std::unique_ptr<Rule>& rule : registry.createRules())
    {
        ids.push_back(rule->id());
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

}  // namespace draftlint
