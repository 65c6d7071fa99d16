//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language server session coordinator for request/notification handling.
///
/// This layer wires JSON-RPC protocol messages to document overlays,
/// configuration state, and the lint orchestrator, and renders the
/// orchestrator's diagnostics and status as LSP notifications.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_LSP_SERVER_H
#define DRAFTLINT_LSP_SERVER_H

#include "draftlint/LSP/DocumentStore.h"
#include "draftlint/LSP/LintOrchestrator.h"
#include "draftlint/LSP/ServerConfig.h"
#include "draftlint/LSP/Telemetry.h"
#include "draftlint/Support/Logging.h"
#include "llvm/Support/JSON.h"

#include <functional>
#include <string>
#include <unordered_map>

namespace draftlint::lsp
{

/// @brief Command id of the explicit lint command.
inline constexpr llvm::StringLiteral LintActiveFileCommand = "draftlint.lintActiveFile";

/// @brief LSP server core for message dispatch and state management.
class Server final : public EditorSurface
{
public:
    /// @brief Outbound transport callback for JSON-RPC responses/notifications.
    using SendMessageFn = std::function<void(llvm::json::Value message)>;

    /// @brief Constructs the server.
    /// @param[in] config Initial configuration, e.g. from command-line flags.
    /// @param[in] sendMessage Outbound message sink; called from the lint thread too.
    /// @param[in] logger Advisory log sink; must outlive the server.
    /// @param[in] metricSink Optional per-cycle telemetry sink.
    Server(ServerConfig config, SendMessageFn sendMessage, Logger& logger, CycleMetricSink metricSink = {});
    ~Server() override;

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Handles one incoming JSON-RPC message.
    /// @param[in] message Parsed message object.
    void handleMessage(const llvm::json::Value& message);

    /// @brief Returns whether an `exit` notification was observed.
    /// @return `true` when process should terminate.
    [[nodiscard]] bool shouldExit() const
    {
        return shouldExit_;
    }

    /// @brief Returns the LSP-conformant process exit code.
    /// @return `0` after orderly `shutdown`+`exit`, otherwise non-zero.
    [[nodiscard]] int exitCode() const
    {
        return exitCode_;
    }

    /// @brief Returns whether `shutdown` has been requested.
    [[nodiscard]] bool shutdownRequested() const
    {
        return shutdownRequested_;
    }

    /// @brief Returns read-only access to open-document overlays.
    [[nodiscard]] const DocumentStore& documentStore() const
    {
        return documents_;
    }

    /// @brief Returns read-only access to current server configuration.
    [[nodiscard]] const ServerConfig& config() const
    {
        return config_;
    }

    /// @brief Returns the lint orchestrator.
    [[nodiscard]] LintOrchestrator& orchestrator()
    {
        return orchestrator_;
    }

    /// @brief Stops lint cycles and the analysis worker.
    void shutdown();

    void publish(const std::string& uri, const std::vector<Diagnostic>& diagnostics) override;
    void clear(const std::string& uri) override;
    void showStatus(const LintStatus& status) override;
    void showMessage(const std::string& message) override;

private:
    void handleRequest(const llvm::json::Object& message, llvm::StringRef method, const llvm::json::Value& id);
    void handleNotification(const llvm::json::Object& message, llvm::StringRef method);
    void applyConfiguration(const llvm::json::Value& params);
    [[nodiscard]] llvm::json::Value executeLintActiveFile(const llvm::json::Object* params);

    void sendResult(const llvm::json::Value& id, llvm::json::Value result);
    void sendError(const llvm::json::Value& id, int code, std::string message);
    void sendNotification(std::string method, llvm::json::Value params);

    SendMessageFn                               sendMessage_;
    Logger&                                     logger_;
    DocumentStore                               documents_;
    ServerConfig                                config_;
    std::unordered_map<std::string, SaveReason> saveReasons_;
    bool                                        shutdownRequested_{false};
    bool                                        shouldExit_{false};
    int                                         exitCode_{0};
    LintOrchestrator                            orchestrator_;
};

}  // namespace draftlint::lsp

#endif  // DRAFTLINT_LSP_SERVER_H
