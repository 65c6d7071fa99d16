//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON message protocol between the analysis channel and its worker.
///
/// Messages are JSON objects with a `command` member:
/// - `lint` carries `{id, text, fileKind, filePath, ruleConfig}`.
/// - `lint_result` carries `{id, result: {messages: [...]}}`.
/// - `error` carries `{id, error}`.
/// - `abort` carries `{id}` and has no reply.
/// - `log` carries `{message}`.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_WORKER_WORKER_PROTOCOL_H
#define DRAFTLINT_WORKER_WORKER_PROTOCOL_H

#include "draftlint/Support/Diagnostics.h"
#include "draftlint/Support/FileKind.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace draftlint::worker
{

/// @brief Analysis request for one masked text slice.
struct AnalysisRequest final
{
    /// @brief Correlation id, unique for the process lifetime.
    std::uint64_t id{0};

    /// @brief Masked slice text.
    std::string text;

    /// @brief Input format.
    FileKind fileKind{FileKind::Text};

    /// @brief File system path of the owning document.
    std::string filePath;

    /// @brief Effective rule configuration.
    llvm::json::Object ruleConfig;
};

/// @brief Encodes a `lint` request.
[[nodiscard]] llvm::json::Value encodeLintRequest(const AnalysisRequest& request);

/// @brief Encodes a `lint_result` reply.
[[nodiscard]] llvm::json::Value encodeLintResult(std::uint64_t id, const std::vector<RuleMessage>& messages);

/// @brief Encodes an `error` reply.
[[nodiscard]] llvm::json::Value encodeError(std::uint64_t id, llvm::StringRef error);

/// @brief Encodes an `abort` notice.
[[nodiscard]] llvm::json::Value encodeAbort(std::uint64_t id);

/// @brief Encodes a `log` line.
[[nodiscard]] llvm::json::Value encodeLog(llvm::StringRef message);

/// @brief Returns the `command` member of a message.
[[nodiscard]] std::optional<std::string> messageCommand(const llvm::json::Value& message);

/// @brief Returns the `id` member of a message.
[[nodiscard]] std::optional<std::uint64_t> messageId(const llvm::json::Value& message);

/// @brief Decodes a `lint` request.
[[nodiscard]] llvm::Expected<AnalysisRequest> decodeLintRequest(const llvm::json::Value& message);

/// @brief Decodes the messages of a `lint_result` reply.
[[nodiscard]] llvm::Expected<std::vector<RuleMessage>> decodeLintResult(const llvm::json::Value& message);

}  // namespace draftlint::worker

#endif  // DRAFTLINT_WORKER_WORKER_PROTOCOL_H
