//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// `Content-Length` framed JSON-RPC transport for the lint server.
///
//===----------------------------------------------------------------------===//
#ifndef DRAFTLINT_LSP_JSON_RPC_IO_H
#define DRAFTLINT_LSP_JSON_RPC_IO_H

#include "llvm/Support/JSON.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace draftlint::lsp
{

/// @brief Outcome of reading one frame.
enum class ReadStatus
{
    /// @brief A message was parsed.
    Message,

    /// @brief Input ended cleanly between frames.
    EndOfStream,

    /// @brief A frame was malformed; reading may continue.
    Malformed,
};

/// @brief JSON-RPC stream transport with `Content-Length` framing.
///
/// Writes are serialized so the protocol thread and the lint thread can both
/// send messages.
class JsonRpcTransport final
{
public:
    /// @brief Largest accepted payload in bytes.
    static constexpr std::size_t MaxPayloadBytes = 64U * 1024U * 1024U;

    /// @brief Creates a transport over input and output streams.
    /// @param[in] in Input stream.
    /// @param[in] out Output stream.
    JsonRpcTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed JSON-RPC message.
    /// @param[out] message Parsed JSON payload.
    /// @param[out] error Framing or parsing error text for `Malformed`.
    /// @return Read outcome.
    [[nodiscard]] ReadStatus readMessage(llvm::json::Value& message, std::string& error);

    /// @brief Writes one framed JSON-RPC message.
    /// @param[in] message JSON payload to write.
    /// @return `true` when write succeeds.
    [[nodiscard]] bool writeMessage(const llvm::json::Value& message);

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex    writeMutex_;
};

}  // namespace draftlint::lsp

#endif  // DRAFTLINT_LSP_JSON_RPC_IO_H
