//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Advisory log channel shared by the orchestrator, worker channel, and server.
///
/// Lines are written to an LLVM output stream (stderr by default) and gated by
/// the configured trace level.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_SUPPORT_LOGGING_H
#define DRAFTLINT_SUPPORT_LOGGING_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <mutex>
#include <optional>

namespace draftlint
{

/// @brief Trace verbosity level for server logs and telemetry.
enum class TraceLevel
{
    /// @brief Disable trace output.
    Off,

    /// @brief Emit cycle-level lines and errors.
    Basic,

    /// @brief Emit verbose traces for debugging.
    Verbose,
};

/// @brief Parses `off`, `basic`, or `verbose`.
[[nodiscard]] std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text);

/// @brief Thread-safe advisory logger.
class Logger final
{
public:
    /// @brief Creates a logger writing to `stream`.
    /// @param[in] stream Destination stream; must outlive the logger.
    /// @param[in] level Initial trace level.
    explicit Logger(llvm::raw_ostream& stream = llvm::errs(), TraceLevel level = TraceLevel::Basic);

    /// @brief Updates the trace level.
    void setLevel(TraceLevel level);

    /// @brief Returns the current trace level.
    [[nodiscard]] TraceLevel level() const;

    /// @brief Logs a line at basic verbosity.
    void basic(const llvm::Twine& message);

    /// @brief Logs a line at verbose verbosity.
    void verbose(const llvm::Twine& message);

    /// @brief Logs an `[error]` line unless tracing is off.
    void error(const llvm::Twine& message);

private:
    void write(llvm::StringRef prefix, const llvm::Twine& message);

    llvm::raw_ostream&      stream_;
    std::atomic<TraceLevel> level_;
    std::mutex              mutex_;
};

}  // namespace draftlint

#endif  // DRAFTLINT_SUPPORT_LOGGING_H
