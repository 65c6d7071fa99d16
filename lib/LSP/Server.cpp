//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements LSP message dispatch, state updates, and response handling.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/Server.h"

#include "draftlint/Version.h"
#include "draftlint/Worker/AnalysisWorker.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace draftlint::lsp
{
namespace
{

constexpr int JsonRpcErrorInvalidParams  = -32602;
constexpr int JsonRpcErrorMethodNotFound = -32601;
constexpr int JsonRpcErrorInvalidRequest = -32600;

constexpr std::int64_t LspMessageTypeInfo = 3;

const llvm::json::Object* textDocumentOf(const llvm::json::Value* params)
{
    if (!params)
    {
        return nullptr;
    }
    const auto* paramsObject = params->getAsObject();
    if (!paramsObject)
    {
        return nullptr;
    }
    return paramsObject->getObject("textDocument");
}

std::optional<std::string> parseTextDocumentUri(const llvm::json::Value* params)
{
    const auto* textDocument = textDocumentOf(params);
    if (!textDocument)
    {
        return std::nullopt;
    }
    const auto uri = textDocument->getString("uri");
    if (!uri)
    {
        return std::nullopt;
    }
    return uri->str();
}

std::int64_t parseTextDocumentVersion(const llvm::json::Value* params)
{
    const auto* textDocument = textDocumentOf(params);
    if (!textDocument)
    {
        return 0;
    }
    if (const auto version = textDocument->getInteger("version"))
    {
        return *version;
    }
    return 0;
}

std::optional<std::string> parseDidOpenText(const llvm::json::Value* params)
{
    const auto* textDocument = textDocumentOf(params);
    if (!textDocument)
    {
        return std::nullopt;
    }
    const auto text = textDocument->getString("text");
    if (!text)
    {
        return std::nullopt;
    }
    return text->str();
}

std::string parseDidOpenLanguageId(const llvm::json::Value* params)
{
    const auto* textDocument = textDocumentOf(params);
    if (!textDocument)
    {
        return {};
    }
    if (const auto languageId = textDocument->getString("languageId"))
    {
        return languageId->str();
    }
    return {};
}

/// Full synchronization only: the last content change carries the whole text.
std::optional<std::string> parseDidChangeText(const llvm::json::Value* params)
{
    if (!params)
    {
        return std::nullopt;
    }
    const auto* paramsObject = params->getAsObject();
    if (!paramsObject)
    {
        return std::nullopt;
    }
    const auto* changes = paramsObject->getArray("contentChanges");
    if (!changes || changes->empty())
    {
        return std::nullopt;
    }
    const auto* change = changes->back().getAsObject();
    if (!change)
    {
        return std::nullopt;
    }
    const auto text = change->getString("text");
    if (!text)
    {
        return std::nullopt;
    }
    return text->str();
}

SaveReason parseWillSaveReason(const llvm::json::Value* params)
{
    if (!params)
    {
        return SaveReason::Manual;
    }
    const auto* paramsObject = params->getAsObject();
    if (!paramsObject)
    {
        return SaveReason::Manual;
    }
    if (const auto raw = paramsObject->getInteger("reason"))
    {
        return parseSaveReason(*raw).value_or(SaveReason::Manual);
    }
    return SaveReason::Manual;
}

llvm::json::Value cloneJsonId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return llvm::json::Value(text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return llvm::json::Value(*integer);
    }
    if (const auto number = id.getAsNumber())
    {
        return llvm::json::Value(*number);
    }
    return llvm::json::Value(nullptr);
}

int diagnosticSeverityToLsp(const DiagnosticSeverity severity)
{
    switch (severity)
    {
    case DiagnosticSeverity::Error:
        return 1;
    case DiagnosticSeverity::Info:
        return 3;
    }
    return 1;
}

llvm::json::Value toLspDiagnostic(const Diagnostic& diagnostic)
{
    const DiagnosticRange& range = diagnostic.range;
    llvm::json::Object     out{
        {"range",
         llvm::json::Object{
             {"start",
              llvm::json::Object{{"line", static_cast<std::int64_t>(range.startLine)},
                                 {"character", static_cast<std::int64_t>(range.startColumn)}}},
             {"end",
              llvm::json::Object{{"line", static_cast<std::int64_t>(range.endLine)},
                                 {"character", static_cast<std::int64_t>(range.endColumn)}}},
         }},
        {"severity", diagnosticSeverityToLsp(diagnostic.severity)},
        {"source", diagnostic.source},
        {"message", diagnostic.message},
    };
    if (!diagnostic.ruleId.empty())
    {
        out["code"] = diagnostic.ruleId;
    }
    return out;
}

llvm::StringRef statusKindName(const LintStatus::Kind kind)
{
    switch (kind)
    {
    case LintStatus::Kind::Idle:
        return "idle";
    case LintStatus::Kind::Running:
        return "running";
    case LintStatus::Kind::Error:
        return "error";
    }
    return "idle";
}

}  // namespace

Server::Server(ServerConfig config, SendMessageFn sendMessage, Logger& logger, CycleMetricSink metricSink)
    : sendMessage_(std::move(sendMessage))
    , logger_(logger)
    , config_(std::move(config))
    , orchestrator_(*this, worker::makeRuleEngineWorkerFactory(config_.pluginLibraries), logger, std::move(metricSink))
{
    orchestrator_.updateConfig(config_);
}

Server::~Server()
{
    shutdown();
}

void Server::handleMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return;
    }

    const auto method = object->getString("method");
    if (!method)
    {
        return;
    }

    if (const auto* id = object->get("id"))
    {
        if (shutdownRequested_)
        {
            sendError(*id, JsonRpcErrorInvalidRequest, "server is shutting down");
            return;
        }
        handleRequest(*object, *method, *id);
        return;
    }

    handleNotification(*object, *method);
}

void Server::handleRequest(const llvm::json::Object& message, const llvm::StringRef method, const llvm::json::Value& id)
{
    if (method == "initialize")
    {
        if (const auto* params = message.getObject("params"))
        {
            if (const auto* options = params->get("initializationOptions"))
            {
                applyConfiguration(llvm::json::Object{{"settings", *options}});
            }
        }

        llvm::json::Object result;
        result["capabilities"] = llvm::json::Object{
            {"textDocumentSync",
             llvm::json::Object{
                 {"openClose", true},
                 {"change", 1},
                 {"willSave", true},
                 {"save", llvm::json::Object{{"includeText", false}}},
             }},
            {"executeCommandProvider",
             llvm::json::Object{{"commands", llvm::json::Array{LintActiveFileCommand.str()}}}},
        };
        result["serverInfo"] = llvm::json::Object{{"name", "draftlintd"}, {"version", kVersionString}};
        sendResult(id, std::move(result));
        return;
    }

    if (method == "shutdown")
    {
        shutdownRequested_ = true;
        orchestrator_.shutdown();
        sendResult(id, llvm::json::Value(nullptr));
        return;
    }

    if (method == "workspace/executeCommand")
    {
        const auto*     params = message.getObject("params");
        llvm::StringRef command;
        if (params)
        {
            if (const auto value = params->getString("command"))
            {
                command = *value;
            }
        }
        if (command != LintActiveFileCommand)
        {
            sendError(id, JsonRpcErrorInvalidParams, "unknown command: " + command.str());
            return;
        }
        sendResult(id, executeLintActiveFile(params));
        return;
    }

    sendError(id, JsonRpcErrorMethodNotFound, "method not found: " + method.str());
}

void Server::handleNotification(const llvm::json::Object& message, const llvm::StringRef method)
{
    if (method == "textDocument/didOpen")
    {
        const auto* params = message.get("params");
        const auto  uri    = parseTextDocumentUri(params);
        const auto  text   = parseDidOpenText(params);
        if (uri && text)
        {
            documents_.open(*uri, *text, parseTextDocumentVersion(params), parseDidOpenLanguageId(params));
            orchestrator_.onActiveDocumentChanged(*uri);
        }
        return;
    }

    if (method == "textDocument/didChange")
    {
        const auto* params = message.get("params");
        const auto  uri    = parseTextDocumentUri(params);
        const auto  text   = parseDidChangeText(params);
        if (uri && text)
        {
            if (!documents_.applyFullTextChange(*uri, *text, parseTextDocumentVersion(params)))
            {
                logger_.verbose(llvm::formatv("[lsp] change for unopened document {0}", *uri));
                return;
            }
            const auto active = orchestrator_.activeDocument();
            if (!active || *active != *uri)
            {
                orchestrator_.onActiveDocumentChanged(*uri);
            }
            orchestrator_.onChange(*documents_.lookup(*uri));
        }
        return;
    }

    if (method == "textDocument/willSave")
    {
        const auto* params = message.get("params");
        if (const auto uri = parseTextDocumentUri(params))
        {
            saveReasons_[*uri] = parseWillSaveReason(params);
        }
        return;
    }

    if (method == "textDocument/didSave")
    {
        const auto uri = parseTextDocumentUri(message.get("params"));
        if (!uri)
        {
            return;
        }
        SaveReason reason = SaveReason::Manual;
        if (const auto it = saveReasons_.find(*uri); it != saveReasons_.end())
        {
            reason = it->second;
            saveReasons_.erase(it);
        }
        const DocumentSnapshot* snapshot = documents_.lookup(*uri);
        if (!snapshot)
        {
            logger_.verbose(llvm::formatv("[lsp] save for unopened document {0}", *uri));
            return;
        }
        if (!orchestrator_.onSave(*snapshot, reason))
        {
            logger_.verbose(llvm::formatv("[lsp] save of {0} did not start a lint cycle", *uri));
        }
        return;
    }

    if (method == "textDocument/didClose")
    {
        if (const auto uri = parseTextDocumentUri(message.get("params")))
        {
            if (!documents_.close(*uri))
            {
                logger_.verbose(llvm::formatv("[lsp] close for unopened document {0}", *uri));
            }
            saveReasons_.erase(*uri);
            orchestrator_.onClose(*uri);
        }
        return;
    }

    if (method == "workspace/didChangeConfiguration")
    {
        if (const auto* params = message.get("params"))
        {
            applyConfiguration(*params);
        }
        return;
    }

    if (method == "draftlint/didChangeActiveDocument")
    {
        std::optional<std::string> uri;
        if (const auto* params = message.getObject("params"))
        {
            if (const auto value = params->getString("uri"))
            {
                uri = value->str();
            }
        }
        orchestrator_.onActiveDocumentChanged(uri);
        return;
    }

    if (method == "exit")
    {
        shouldExit_ = true;
        if (!shutdownRequested_)
        {
            exitCode_ = 1;
        }
        return;
    }
}

void Server::applyConfiguration(const llvm::json::Value& params)
{
    ServerConfig next = config_;
    if (!applyDidChangeConfiguration(params, next))
    {
        logger_.verbose("[lsp] ignoring configuration without settings");
        return;
    }
    if (next.pluginLibraries != config_.pluginLibraries)
    {
        logger_.basic(llvm::formatv("[lsp] rule packs changed; restarting analysis worker ({0} pack(s))",
                                    next.pluginLibraries.size()));
        orchestrator_.replaceWorkerFactory(worker::makeRuleEngineWorkerFactory(next.pluginLibraries));
    }
    config_ = std::move(next);
    orchestrator_.updateConfig(config_);
}

llvm::json::Value Server::executeLintActiveFile(const llvm::json::Object* params)
{
    std::optional<std::string> uri;
    if (params)
    {
        if (const auto* arguments = params->getArray("arguments"); arguments && !arguments->empty())
        {
            if (const auto value = arguments->front().getAsString())
            {
                uri = value->str();
            }
        }
    }
    if (!uri)
    {
        uri = orchestrator_.activeDocument();
    }
    if (!uri)
    {
        showMessage("No active document.");
        return llvm::json::Object{{"scheduled", false}};
    }

    const DocumentSnapshot* snapshot = documents_.lookup(*uri);
    if (!snapshot)
    {
        showMessage("The document is not open: " + *uri);
        return llvm::json::Object{{"scheduled", false}};
    }
    const bool scheduled = orchestrator_.runAnalyzeCommand(*snapshot);
    return llvm::json::Object{{"scheduled", scheduled}};
}

void Server::publish(const std::string& uri, const std::vector<Diagnostic>& diagnostics)
{
    llvm::json::Array payload;
    for (const Diagnostic& diagnostic : diagnostics)
    {
        payload.push_back(toLspDiagnostic(diagnostic));
    }
    sendNotification("textDocument/publishDiagnostics",
                     llvm::json::Object{
                         {"uri", uri},
                         {"diagnostics", std::move(payload)},
                     });
}

void Server::clear(const std::string& uri)
{
    sendNotification("textDocument/publishDiagnostics",
                     llvm::json::Object{
                         {"uri", uri},
                         {"diagnostics", llvm::json::Array{}},
                     });
}

void Server::showStatus(const LintStatus& status)
{
    sendNotification("draftlint/status",
                     llvm::json::Object{
                         {"uri", status.uri},
                         {"kind", statusKindName(status.kind)},
                         {"issueCount", static_cast<std::int64_t>(status.issueCount)},
                         {"text", status.text()},
                     });
}

void Server::showMessage(const std::string& message)
{
    sendNotification("window/showMessage",
                     llvm::json::Object{
                         {"type", LspMessageTypeInfo},
                         {"message", message},
                     });
}

void Server::sendResult(const llvm::json::Value& id, llvm::json::Value result)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"result", std::move(result)},
    });
}

void Server::sendError(const llvm::json::Value& id, const int code, std::string message)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"error", llvm::json::Object{{"code", code}, {"message", std::move(message)}}},
    });
}

void Server::sendNotification(std::string method, llvm::json::Value params)
{
    sendMessage_(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"method", std::move(method)},
        {"params", std::move(params)},
    });
}

void Server::shutdown()
{
    orchestrator_.shutdown();
}

}  // namespace draftlint::lsp
