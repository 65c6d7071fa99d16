//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the lint trigger policy and the incremental cycle.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/LintOrchestrator.h"

#include "draftlint/Rules/LocalPatternRules.h"
#include "draftlint/Support/TextLines.h"
#include "draftlint/Text/CodeBlockMasker.h"
#include "draftlint/Text/LineDiff.h"
#include "draftlint/Text/RegionSelector.h"

#include "llvm/Support/FormatVariadic.h"

#include <future>
#include <iterator>
#include <memory>
#include <utility>

namespace draftlint::lsp
{
namespace
{

/// Widens regions around code blocks so each slice masks like the whole
/// document would, then folds together the ones that now touch.
std::vector<LineRegion> alignRegionsToCodeBlocks(const std::vector<std::string>& lines, std::vector<LineRegion> regions)
{
    return mergeRegions(alignToCodeBlocks(lines, std::move(regions)));
}

}  // namespace

std::optional<SaveReason> parseSaveReason(const std::int64_t value)
{
    switch (value)
    {
    case 1:
        return SaveReason::Manual;
    case 2:
        return SaveReason::AfterDelay;
    case 3:
        return SaveReason::FocusOut;
    default:
        return std::nullopt;
    }
}

std::string LintStatus::text() const
{
    switch (kind)
    {
    case Kind::Running:
        return "Linting...";
    case Kind::Error:
        return "Error";
    case Kind::Idle:
        break;
    }
    return std::to_string(issueCount) + " iss";
}

LintOrchestrator::LintOrchestrator(EditorSurface&        surface,
                                   worker::WorkerFactory factory,
                                   Logger&               logger,
                                   CycleMetricSink       metricSink)
    : surface_(surface)
    , logger_(logger)
    , channel_(std::move(factory), logger)
    , scheduler_([this](const std::string& uri, const std::uint64_t id) {
        if (channel_.abort(id))
        {
            logger_.verbose(llvm::formatv("[lint:skip] {0} request {1} aborted", uri, id));
        }
    })
{
    telemetry_.setSink(std::move(metricSink));
}

LintOrchestrator::~LintOrchestrator()
{
    shutdown();
}

void LintOrchestrator::updateConfig(ServerConfig config)
{
    const bool       disabled = !config.lintEnabled;
    const TraceLevel level    = config.traceLevel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = std::move(config);
    }
    logger_.setLevel(level);
    cache_.clear();
    logger_.verbose("[lint:clear] configuration changed; cache dropped");
    if (disabled)
    {
        scheduler_.supersedeAll();
        clearAllDocuments();
    }
}

ServerConfig LintOrchestrator::config() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void LintOrchestrator::replaceWorkerFactory(worker::WorkerFactory factory)
{
    channel_.replaceFactory(std::move(factory));
}

void LintOrchestrator::onChange(const DocumentSnapshot& document)
{
    logger_.verbose(llvm::formatv("[lint:skip] {0} v{1} edited; waiting for save", document.uri, document.version));
}

bool LintOrchestrator::onSave(const DocumentSnapshot& document, const SaveReason reason)
{
    const ServerConfig current = config();
    if (!current.lintEnabled)
    {
        return false;
    }
    if (reason != SaveReason::Manual && !current.lintOnAutoSave)
    {
        logger_.verbose(llvm::formatv("[lint:skip] {0} automatic save", document.uri));
        showIdleStatus(activeDocument());
        return false;
    }
    if (!isActive(document.uri))
    {
        logger_.verbose(llvm::formatv("[lint:skip] {0} saved while inactive", document.uri));
        showIdleStatus(activeDocument());
        return false;
    }
    if (!canLint(document))
    {
        return false;
    }
    return trigger(document, "save");
}

void LintOrchestrator::onActiveDocumentChanged(const std::optional<std::string>& uri)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeUri_ = uri;
    }
    showIdleStatus(uri);
}

bool LintOrchestrator::runAnalyzeCommand(const DocumentSnapshot& document)
{
    if (!config().lintEnabled)
    {
        return false;
    }
    if (!canLint(document))
    {
        surface_.showMessage("This file is not lintable (.txt / plaintext / markdown only).");
        showIdleStatus(document.uri);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeUri_ = document.uri;
    }
    return trigger(document, "command");
}

void LintOrchestrator::onClose(const std::string& uri)
{
    if (const std::size_t superseded = scheduler_.supersede(uri); superseded != 0U)
    {
        logger_.verbose(llvm::formatv("[lint:skip] {0} closed; {1} cycle(s) superseded", uri, superseded));
    }
    const bool evicted      = cache_.evict(uri);
    bool       wasPublished = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wasPublished = publishedUris_.erase(uri) != 0U;
        if (activeUri_ && *activeUri_ == uri)
        {
            activeUri_.reset();
        }
    }
    surface_.clear(uri);
    logger_.verbose(llvm::formatv("[lint:clear] {0} closed (cached={1}, published={2})", uri, evicted, wasPublished));
}

void LintOrchestrator::waitForIdle()
{
    scheduler_.waitForIdle();
}

void LintOrchestrator::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
    }
    scheduler_.supersedeAll();
    channel_.shutdown();
    scheduler_.shutdown();
}

std::optional<std::string> LintOrchestrator::activeDocument() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return activeUri_;
}

bool LintOrchestrator::trigger(const DocumentSnapshot& document, const llvm::StringRef reason)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
        {
            return false;
        }
    }

    auto       report   = std::make_shared<CycleReport>();
    const auto sequence = scheduler_.submit(
        document.uri,
        llvm::formatv("lint {0}", reason).str(),
        [this, document, report](const CycleToken& token) { return runCycle(document, token, *report); },
        [this, uri = document.uri, report](const CycleCompletion& completion) {
            CycleMetric metric;
            metric.uri           = uri;
            metric.mode          = report->mode;
            metric.regionCount   = report->regionCount;
            metric.latencyMicros = completion.latencyMicros;
            metric.outcome       = completion.outcome;
            if (!completion.errorMessage.empty())
            {
                logger_.error(llvm::formatv("{0}: {1}", uri, completion.errorMessage));
                surface_.showStatus(LintStatus{LintStatus::Kind::Error, 0, uri});
            }
            telemetry_.record(std::move(metric));
        });
    if (!sequence)
    {
        logger_.error(llvm::formatv("failed to queue lint cycle for {0}", document.uri));
        return false;
    }
    logger_.verbose(llvm::formatv("[lint:queue] {0} cycle {1} on {2}", document.uri, *sequence, reason));
    return true;
}

CycleOutcome LintOrchestrator::runCycle(const DocumentSnapshot& document,
                                        const CycleToken&       token,
                                        CycleReport&            report)
{
    const std::string& uri     = document.uri;
    const ServerConfig current = config();
    logger_.basic(llvm::formatv("[lint:start] {0} v{1}", uri, document.version));

    clearOtherDocuments(uri);
    surface_.showStatus(LintStatus{LintStatus::Kind::Running, 0, uri});

    const std::vector<std::string> lines = splitLines(document.text);
    if (isBlankText(document.text))
    {
        report.mode = CycleMode::Empty;
        finishCycle(uri, lines, {});
        logger_.basic(llvm::formatv("[lint:done] {0} empty document", uri));
        return CycleOutcome::Published;
    }

    const auto              cached = cache_.lookup(uri);
    std::vector<Diagnostic> baseline;
    std::vector<LineRegion> regions;
    if (!cached)
    {
        report.mode = CycleMode::Full;
        regions.push_back(LineRegion{0, lines.size() - 1U});
    }
    else
    {
        report.mode       = CycleMode::Incremental;
        const auto change = computeLineChange(cached->snapshot.lines, lines);
        baseline          = change ? rebaseDiagnostics(cached->diagnostics, *change) : cached->diagnostics;

        std::optional<LineRegion> changed;
        if (change)
        {
            changed = change->region;
        }
        regions = selectRegions(lines, changed, baseline, current.incrementalContextLines);
        if (regions.empty())
        {
            report.mode = CycleMode::Skipped;
            finishCycle(uri, lines, baseline);
            logger_.basic(llvm::formatv("[lint:skip] {0} nothing changed; {1} cached issue(s)", uri, baseline.size()));
            return CycleOutcome::Published;
        }
        regions = alignRegionsToCodeBlocks(lines, std::move(regions));
    }
    report.regionCount = regions.size();

    const llvm::json::Object ruleConfig = effectiveRuleConfig(current);
    const std::string        filePath   = documentPath(uri);
    const FileKind           fileKind   = fileKindOf(document);

    std::vector<Diagnostic> fresh;
    for (const LineRegion& region : regions)
    {
        if (token.isSuperseded())
        {
            logger_.verbose(llvm::formatv("[lint:skip] {0} superseded", uri));
            return CycleOutcome::Superseded;
        }
        if (!isActive(uri))
        {
            logger_.basic(llvm::formatv("[lint:skip] {0} no longer active; keeping cached diagnostics", uri));
            republishCached(uri);
            showIdleStatus(activeDocument());
            return CycleOutcome::Switched;
        }

        const std::vector<std::string> slice(lines.begin() + static_cast<std::ptrdiff_t>(region.start),
                                             lines.begin() + static_cast<std::ptrdiff_t>(region.end) + 1);
        const std::string masked = joinLines(maskCodeBlockLines(slice, sliceFenceState(lines, region.start)));

        worker::AnalysisRequest request;
        request.id         = channel_.nextRequestId();
        request.text       = masked;
        request.fileKind   = fileKind;
        request.filePath   = filePath;
        request.ruleConfig = ruleConfig;
        const std::uint64_t id = request.id;

        if (!token.bindRequest(id))
        {
            logger_.verbose(llvm::formatv("[lint:skip] {0} superseded", uri));
            return CycleOutcome::Superseded;
        }
        logger_.verbose(llvm::formatv("[lint:start] {0} region {1}-{2} as request {3}", uri, region.start, region.end, id));
        worker::AnalysisOutcome outcome = channel_.submit(std::move(request)).get();
        token.releaseRequest(id);

        if (token.isSuperseded() || outcome.status == worker::AnalysisStatus::Aborted)
        {
            logger_.verbose(llvm::formatv("[lint:skip] {0} request {1} superseded", uri, id));
            return CycleOutcome::Superseded;
        }
        if (outcome.status == worker::AnalysisStatus::Unavailable)
        {
            logger_.error(llvm::formatv("analysis worker unavailable for {0}: {1}", uri, outcome.errorMessage));
            surface_.showStatus(LintStatus{LintStatus::Kind::Error, 0, uri});
            return CycleOutcome::Failed;
        }
        if (outcome.status == worker::AnalysisStatus::Failed)
        {
            logger_.error(llvm::formatv("analysis failed for {0}: {1}", uri, outcome.errorMessage));
            republishCached(uri);
            surface_.showStatus(LintStatus{LintStatus::Kind::Error, 0, uri});
            return CycleOutcome::Failed;
        }

        for (const RuleMessage& message : outcome.messages)
        {
            fresh.push_back(convertRuleMessage(message, static_cast<std::uint32_t>(region.start), DiagnosticSourceName));
        }
        std::vector<Diagnostic> local = runLocalPatternRules(masked, static_cast<std::uint32_t>(region.start));
        fresh.insert(fresh.end(), std::make_move_iterator(local.begin()), std::make_move_iterator(local.end()));
    }

    if (token.isSuperseded())
    {
        logger_.verbose(llvm::formatv("[lint:skip] {0} superseded", uri));
        return CycleOutcome::Superseded;
    }

    const std::vector<Diagnostic> merged = mergeDiagnostics(baseline, std::move(fresh), regions);
    finishCycle(uri, lines, merged);
    logger_.basic(llvm::formatv("[lint:done] {0} {1} issue(s), {2} {3} region(s)",
                                uri,
                                merged.size(),
                                cycleModeName(report.mode),
                                regions.size()));
    return CycleOutcome::Published;
}

void LintOrchestrator::finishCycle(const std::string&              uri,
                                   const std::vector<std::string>& lines,
                                   const std::vector<Diagnostic>&  diagnostics)
{
    DocumentCacheEntry entry;
    entry.snapshot.lines = lines;
    entry.diagnostics    = diagnostics;
    cache_.store(uri, std::move(entry));
    publish(uri, diagnostics);
    surface_.showStatus(LintStatus{LintStatus::Kind::Idle, diagnostics.size(), uri});
}

void LintOrchestrator::publish(const std::string& uri, const std::vector<Diagnostic>& diagnostics)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        publishedUris_.insert(uri);
    }
    surface_.publish(uri, diagnostics);
}

void LintOrchestrator::republishCached(const std::string& uri)
{
    if (const auto cached = cache_.lookup(uri))
    {
        publish(uri, cached->diagnostics);
    }
}

void LintOrchestrator::clearOtherDocuments(const std::string& uri)
{
    std::vector<std::string> others;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = publishedUris_.begin(); it != publishedUris_.end();)
        {
            if (*it == uri)
            {
                ++it;
                continue;
            }
            others.push_back(*it);
            it = publishedUris_.erase(it);
        }
    }
    for (const std::string& other : others)
    {
        logger_.verbose(llvm::formatv("[lint:clear] {0}", other));
        surface_.clear(other);
    }
}

void LintOrchestrator::clearAllDocuments()
{
    std::unordered_set<std::string> published;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        published.swap(publishedUris_);
    }
    for (const std::string& uri : published)
    {
        logger_.verbose(llvm::formatv("[lint:clear] {0}", uri));
        surface_.clear(uri);
    }
}

void LintOrchestrator::showIdleStatus(const std::optional<std::string>& uri)
{
    LintStatus status;
    if (uri)
    {
        status.uri = *uri;
        if (const auto cached = cache_.lookup(*uri))
        {
            status.issueCount = cached->diagnostics.size();
        }
    }
    surface_.showStatus(status);
}

bool LintOrchestrator::isActive(const std::string& uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return activeUri_ && *activeUri_ == uri;
}

}  // namespace draftlint::lsp
