//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framing over standard streams.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace draftlint::lsp
{
namespace
{

/// Header names are case-insensitive; other headers are ignored.
std::optional<std::size_t> parseContentLengthHeader(llvm::StringRef header)
{
    const auto [name, value] = header.split(':');
    if (!name.trim().equals_insensitive("Content-Length"))
    {
        return std::nullopt;
    }
    std::size_t length = 0;
    if (value.trim().getAsInteger(10, length))
    {
        return std::nullopt;
    }
    return length;
}

}  // namespace

JsonRpcTransport::JsonRpcTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

ReadStatus JsonRpcTransport::readMessage(llvm::json::Value& message, std::string& error)
{
    std::optional<std::size_t> contentLength;
    bool                       hasHeaders = false;
    std::string                line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            if (hasHeaders)
            {
                break;
            }
            continue;
        }

        hasHeaders = true;
        if (const auto parsed = parseContentLengthHeader(line))
        {
            contentLength = parsed;
        }
    }

    if (!hasHeaders)
    {
        return ReadStatus::EndOfStream;
    }
    if (!contentLength || *contentLength == 0U)
    {
        error = "missing Content-Length header";
        return input_ ? ReadStatus::Malformed : ReadStatus::EndOfStream;
    }
    if (*contentLength > MaxPayloadBytes)
    {
        error = "Content-Length exceeds limit";
        input_.ignore(static_cast<std::streamsize>(*contentLength));
        return ReadStatus::Malformed;
    }

    std::string payload(*contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(*contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(*contentLength))
    {
        error = "truncated JSON-RPC payload";
        return ReadStatus::EndOfStream;
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return ReadStatus::Malformed;
    }

    message = std::move(*parsed);
    return ReadStatus::Message;
}

bool JsonRpcTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    return static_cast<bool>(output_);
}

}  // namespace draftlint::lsp
