//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements worker message encoding and decoding.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Worker/WorkerProtocol.h"

#include "llvm/Support/FormatVariadic.h"

#include <algorithm>

namespace draftlint::worker
{
namespace
{

llvm::Error protocolError(const llvm::Twine& message)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), message);
}

llvm::json::Object encodePosition(const std::uint32_t line, const std::uint32_t column)
{
    return llvm::json::Object{{"line", static_cast<std::int64_t>(line)}, {"column", static_cast<std::int64_t>(column)}};
}

std::optional<std::pair<std::uint32_t, std::uint32_t>> decodePosition(const llvm::json::Object* position)
{
    if (!position)
    {
        return std::nullopt;
    }
    const auto line   = position->getInteger("line");
    const auto column = position->getInteger("column");
    if (!line || !column)
    {
        return std::nullopt;
    }
    return std::make_pair(static_cast<std::uint32_t>(std::max<std::int64_t>(*line, 0)),
                          static_cast<std::uint32_t>(std::max<std::int64_t>(*column, 0)));
}

}  // namespace

llvm::json::Value encodeLintRequest(const AnalysisRequest& request)
{
    return llvm::json::Object{
        {"command", "lint"},
        {"id", static_cast<std::int64_t>(request.id)},
        {"text", request.text},
        {"fileKind", fileKindName(request.fileKind)},
        {"filePath", request.filePath},
        {"ruleConfig", llvm::json::Object(request.ruleConfig)},
    };
}

llvm::json::Value encodeLintResult(const std::uint64_t id, const std::vector<RuleMessage>& messages)
{
    llvm::json::Array encoded;
    for (const RuleMessage& message : messages)
    {
        encoded.push_back(llvm::json::Object{
            {"loc",
             llvm::json::Object{
                 {"start", encodePosition(message.startLine, message.startColumn)},
                 {"end", encodePosition(message.endLine, message.endColumn)},
             }},
            {"message", message.message},
            {"severity", message.severity},
            {"ruleId", message.ruleId},
        });
    }
    return llvm::json::Object{
        {"command", "lint_result"},
        {"id", static_cast<std::int64_t>(id)},
        {"result", llvm::json::Object{{"messages", std::move(encoded)}}},
    };
}

llvm::json::Value encodeError(const std::uint64_t id, llvm::StringRef error)
{
    return llvm::json::Object{{"command", "error"}, {"id", static_cast<std::int64_t>(id)}, {"error", error.str()}};
}

llvm::json::Value encodeAbort(const std::uint64_t id)
{
    return llvm::json::Object{{"command", "abort"}, {"id", static_cast<std::int64_t>(id)}};
}

llvm::json::Value encodeLog(llvm::StringRef message)
{
    return llvm::json::Object{{"command", "log"}, {"message", message.str()}};
}

std::optional<std::string> messageCommand(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto command = object->getString("command");
    if (!command)
    {
        return std::nullopt;
    }
    return command->str();
}

std::optional<std::uint64_t> messageId(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return std::nullopt;
    }
    const auto id = object->getInteger("id");
    if (!id || *id < 0)
    {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*id);
}

llvm::Expected<AnalysisRequest> decodeLintRequest(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return protocolError("lint request is not an object");
    }
    const auto id = messageId(message);
    if (!id)
    {
        return protocolError("lint request has no id");
    }
    const auto text = object->getString("text");
    if (!text)
    {
        return protocolError(llvm::formatv("lint request {0} has no text", *id));
    }

    AnalysisRequest request;
    request.id   = *id;
    request.text = text->str();

    if (const auto kindName = object->getString("fileKind"))
    {
        const auto kind = parseFileKind(*kindName);
        if (!kind)
        {
            return protocolError(llvm::formatv("lint request {0} has unknown fileKind '{1}'", *id, *kindName));
        }
        request.fileKind = *kind;
    }
    if (const auto filePath = object->getString("filePath"))
    {
        request.filePath = filePath->str();
    }
    if (const auto* ruleConfig = object->getObject("ruleConfig"))
    {
        request.ruleConfig = *ruleConfig;
    }
    return request;
}

llvm::Expected<std::vector<RuleMessage>> decodeLintResult(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return protocolError("lint result is not an object");
    }
    const auto* result = object->getObject("result");
    if (!result)
    {
        return protocolError("lint result has no result object");
    }

    std::vector<RuleMessage> out;
    const auto*              messages = result->getArray("messages");
    if (!messages)
    {
        return out;
    }
    for (const llvm::json::Value& item : *messages)
    {
        const auto* entry = item.getAsObject();
        if (!entry)
        {
            return protocolError("lint result message is not an object");
        }
        const auto* loc   = entry->getObject("loc");
        const auto  start = decodePosition(loc ? loc->getObject("start") : nullptr);
        if (!start)
        {
            return protocolError("lint result message has no start location");
        }
        const auto end = decodePosition(loc->getObject("end"));

        RuleMessage decoded;
        decoded.startLine   = start->first;
        decoded.startColumn = start->second;
        decoded.endLine     = end ? end->first : start->first;
        decoded.endColumn   = end ? end->second : start->second;
        if (const auto text = entry->getString("message"))
        {
            decoded.message = text->str();
        }
        if (const auto severity = entry->getInteger("severity"))
        {
            decoded.severity = *severity;
        }
        if (const auto ruleId = entry->getString("ruleId"))
        {
            decoded.ruleId = ruleId->str();
        }
        out.push_back(std::move(decoded));
    }
    return out;
}

}  // namespace draftlint::worker
