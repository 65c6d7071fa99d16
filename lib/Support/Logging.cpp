//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the advisory logger.
///
//===----------------------------------------------------------------------===//

#include "draftlint/Support/Logging.h"

namespace draftlint
{

std::optional<TraceLevel> parseTraceLevel(llvm::StringRef text)
{
    const std::string normalized = text.trim().lower();
    if (normalized == "off")
    {
        return TraceLevel::Off;
    }
    if (normalized == "basic")
    {
        return TraceLevel::Basic;
    }
    if (normalized == "verbose")
    {
        return TraceLevel::Verbose;
    }
    return std::nullopt;
}

Logger::Logger(llvm::raw_ostream& stream, const TraceLevel level)
    : stream_(stream)
    , level_(level)
{
}

void Logger::setLevel(const TraceLevel level)
{
    level_.store(level, std::memory_order_relaxed);
}

TraceLevel Logger::level() const
{
    return level_.load(std::memory_order_relaxed);
}

void Logger::basic(const llvm::Twine& message)
{
    if (level() == TraceLevel::Off)
    {
        return;
    }
    write({}, message);
}

void Logger::verbose(const llvm::Twine& message)
{
    if (level() != TraceLevel::Verbose)
    {
        return;
    }
    write({}, message);
}

void Logger::error(const llvm::Twine& message)
{
    if (level() == TraceLevel::Off)
    {
        return;
    }
    write("[error] ", message);
}

void Logger::write(llvm::StringRef prefix, const llvm::Twine& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << "[draftlint] " << prefix << message << "\n";
    stream_.flush();
}

}  // namespace draftlint
