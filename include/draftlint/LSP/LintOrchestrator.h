//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Trigger policy and incremental lint cycle driver.
///
/// The orchestrator decides when a document is analysed, cancels superseded
/// work, selects the regions that need re-analysis, round-trips each masked
/// region through the analysis worker, and publishes the merged diagnostic
/// set. Cycles run on the scheduler thread; the editor surface callbacks are
/// invoked from that thread.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_LSP_LINT_ORCHESTRATOR_H
#define DRAFTLINT_LSP_LINT_ORCHESTRATOR_H

#include "draftlint/LSP/CycleScheduler.h"
#include "draftlint/LSP/DiagnosticCache.h"
#include "draftlint/LSP/DocumentStore.h"
#include "draftlint/LSP/ServerConfig.h"
#include "draftlint/LSP/Telemetry.h"
#include "draftlint/Support/Diagnostics.h"
#include "draftlint/Support/Logging.h"
#include "draftlint/Worker/AnalysisWorker.h"
#include "draftlint/Worker/AnalysisWorkerChannel.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace draftlint::lsp
{

/// @brief Why a document was saved; values match the LSP enumeration.
enum class SaveReason
{
    /// @brief Explicit user save.
    Manual = 1,

    /// @brief Automatic save after an idle delay.
    AfterDelay = 2,

    /// @brief Automatic save when the editor lost focus.
    FocusOut = 3,
};

/// @brief Parses an LSP `TextDocumentSaveReason` integer.
[[nodiscard]] std::optional<SaveReason> parseSaveReason(std::int64_t value);

/// @brief Status indicator state.
struct LintStatus final
{
    enum class Kind
    {
        Idle,
        Running,
        Error,
    };

    Kind        kind{Kind::Idle};
    std::size_t issueCount{0};
    std::string uri;

    /// @brief Renders `"N iss"`, `"Linting..."`, or `"Error"`.
    [[nodiscard]] std::string text() const;
};

/// @brief Editor-facing sink for diagnostics and status.
class EditorSurface
{
public:
    virtual ~EditorSurface() = default;

    /// @brief Replaces the published diagnostics of a document.
    virtual void publish(const std::string& uri, const std::vector<Diagnostic>& diagnostics) = 0;

    /// @brief Removes every published diagnostic of a document.
    virtual void clear(const std::string& uri) = 0;

    /// @brief Updates the status indicator.
    virtual void showStatus(const LintStatus& status) = 0;

    /// @brief Shows an informational message to the user.
    virtual void showMessage(const std::string& message) = 0;
};

/// @brief Drives lint cycles for the active document.
class LintOrchestrator final
{
public:
    /// @brief Constructs the orchestrator; no worker is started yet.
    /// @param[in] surface Editor surface; must outlive the orchestrator.
    /// @param[in] factory Analysis worker factory.
    /// @param[in] logger Advisory log sink; must outlive the orchestrator.
    /// @param[in] metricSink Optional per-cycle telemetry sink.
    LintOrchestrator(EditorSurface&        surface,
                     worker::WorkerFactory factory,
                     Logger&               logger,
                     CycleMetricSink       metricSink = {});
    ~LintOrchestrator();

    LintOrchestrator(const LintOrchestrator&)            = delete;
    LintOrchestrator& operator=(const LintOrchestrator&) = delete;

    /// @brief Applies a new configuration.
    ///
    /// Drops every cache entry so the next cycle per document is full. When
    /// linting becomes disabled, published diagnostics are cleared.
    void updateConfig(ServerConfig config);

    /// @brief Returns a copy of the current configuration.
    [[nodiscard]] ServerConfig config() const;

    /// @brief Replaces the worker factory; the running worker is retired.
    void replaceWorkerFactory(worker::WorkerFactory factory);

    /// @brief Observes an edit. Never triggers analysis.
    void onChange(const DocumentSnapshot& document);

    /// @brief Handles a save notification.
    /// @return `true` when a cycle was scheduled.
    bool onSave(const DocumentSnapshot& document, SaveReason reason);

    /// @brief Records the active document and shows its cached issue count.
    void onActiveDocumentChanged(const std::optional<std::string>& uri);

    /// @brief Runs the explicit analyze command on a document.
    /// @return `true` when a cycle was scheduled.
    bool runAnalyzeCommand(const DocumentSnapshot& document);

    /// @brief Forgets a closed document and clears its diagnostics.
    void onClose(const std::string& uri);

    /// @brief Blocks until every cycle queued so far has finished.
    void waitForIdle();

    /// @brief Cancels outstanding cycles and stops the worker and scheduler.
    void shutdown();

    [[nodiscard]] const DiagnosticCache& cache() const
    {
        return cache_;
    }

    [[nodiscard]] const Telemetry& telemetry() const
    {
        return telemetry_;
    }

    /// @brief Returns the active document URI, if any.
    [[nodiscard]] std::optional<std::string> activeDocument() const;

private:
    struct CycleReport final
    {
        CycleMode   mode{CycleMode::Full};
        std::size_t regionCount{0};
    };

    bool         trigger(const DocumentSnapshot& document, llvm::StringRef reason);
    CycleOutcome runCycle(const DocumentSnapshot& document, const CycleToken& token, CycleReport& report);
    void         finishCycle(const std::string&              uri,
                             const std::vector<std::string>& lines,
                             const std::vector<Diagnostic>&  diagnostics);
    void         publish(const std::string& uri, const std::vector<Diagnostic>& diagnostics);
    void         republishCached(const std::string& uri);
    void         clearOtherDocuments(const std::string& uri);
    void         clearAllDocuments();
    void         showIdleStatus(const std::optional<std::string>& uri);
    [[nodiscard]] bool isActive(const std::string& uri) const;

    EditorSurface&                                 surface_;
    Logger&                                        logger_;
    worker::AnalysisWorkerChannel                  channel_;
    Telemetry                                      telemetry_;
    DiagnosticCache                                cache_;
    mutable std::mutex                             mutex_;
    ServerConfig                                   config_;
    std::optional<std::string>                     activeUri_;
    std::unordered_set<std::string>                publishedUris_;
    bool                                           stopped_{false};
    CycleScheduler                                 scheduler_;
};

}  // namespace draftlint::lsp

#endif  // DRAFTLINT_LSP_LINT_ORCHESTRATOR_H
