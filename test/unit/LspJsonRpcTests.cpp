//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validates JSON-RPC framing and malformed-message handling.
///
/// Malformed and fuzz-like inputs are fed through the transport and the
/// server entrypoint; failures must be reported without crashes and the
/// server must keep answering afterwards.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/JsonRpcIO.h"
#include "draftlint/LSP/Server.h"
#include "draftlint/Support/Logging.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace
{

using draftlint::lsp::ReadStatus;

llvm::json::Value parseJson(const std::string& text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        std::cerr << "invalid JSON test fixture\n";
        std::abort();
    }
    return std::move(*parsed);
}

std::string encodeLspFrame(const std::string& payload)
{
    std::ostringstream out;
    out << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    return out.str();
}

bool expectRead(const std::string& input, const ReadStatus expectedStatus, const std::string& expectedError)
{
    std::istringstream                  in(input);
    std::ostringstream                  out;
    draftlint::lsp::JsonRpcTransport    transport(in, out);
    llvm::json::Value                   message(llvm::json::Object{});
    std::string                         error;
    const ReadStatus                    status = transport.readMessage(message, error);
    if (status != expectedStatus || error.rfind(expectedError, 0) != 0U)
    {
        std::cerr << "unexpected read outcome for input '" << input.substr(0, 40) << "': " << error << "\n";
        return false;
    }
    return true;
}

class Outbox final
{
public:
    draftlint::lsp::Server::SendMessageFn sink()
    {
        return [this](llvm::json::Value message) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(std::move(message));
        };
    }

    std::optional<llvm::json::Object> responseById(const std::int64_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const llvm::json::Value& message : messages_)
        {
            const auto* object = message.getAsObject();
            if (!object)
            {
                continue;
            }
            const auto responseId = object->getInteger("id");
            if (responseId && *responseId == id)
            {
                return *object;
            }
        }
        return std::nullopt;
    }

private:
    std::mutex                     mutex_;
    std::vector<llvm::json::Value> messages_;
};

}  // namespace

bool runLspJsonRpcTests()
{
    if (!expectRead("", ReadStatus::EndOfStream, "") ||
        !expectRead("Header: value\r\n\r\n{}", ReadStatus::Malformed, "missing Content-Length header") ||
        !expectRead("Content-Length: abc\r\n\r\n{}", ReadStatus::Malformed, "missing Content-Length header") ||
        !expectRead("Content-Length: 10\r\n\r\n{}", ReadStatus::EndOfStream, "truncated JSON-RPC payload") ||
        !expectRead("Content-Length: 67108865\r\n\r\n", ReadStatus::Malformed, "Content-Length exceeds limit") ||
        !expectRead(encodeLspFrame(R"({"jsonrpc":2.0)"), ReadStatus::Malformed, "invalid JSON payload: "))
    {
        return false;
    }

    {
        const std::string payload = R"({"jsonrpc":"2.0","method":"exit"})";
        std::istringstream in("content-length: " + std::to_string(payload.size()) +
                              "\r\nContent-Type: application/vscode-jsonrpc; charset=utf-8\r\n\r\n" + payload);
        std::ostringstream               out;
        draftlint::lsp::JsonRpcTransport transport(in, out);
        llvm::json::Value                message(nullptr);
        std::string                      error;
        if (transport.readMessage(message, error) != ReadStatus::Message)
        {
            std::cerr << "header names should match case-insensitively: " << error << "\n";
            return false;
        }
        const auto* object = message.getAsObject();
        if (!object || object->getString("method") != std::optional<llvm::StringRef>("exit"))
        {
            std::cerr << "parsed message lost its method\n";
            return false;
        }
    }

    {
        // A malformed payload must not desynchronize the frames that follow it.
        std::istringstream in(encodeLspFrame("{bad") + encodeLspFrame(R"({"jsonrpc":"2.0","id":4,"method":"x"})"));
        std::ostringstream               out;
        draftlint::lsp::JsonRpcTransport transport(in, out);
        llvm::json::Value                message(nullptr);
        std::string                      error;
        if (transport.readMessage(message, error) != ReadStatus::Malformed)
        {
            std::cerr << "expected the first frame to be malformed\n";
            return false;
        }
        error.clear();
        if (transport.readMessage(message, error) != ReadStatus::Message || !message.getAsObject() ||
            message.getAsObject()->getInteger("id") != std::optional<std::int64_t>(4))
        {
            std::cerr << "transport should recover on the next frame\n";
            return false;
        }
        if (transport.readMessage(message, error) != ReadStatus::EndOfStream)
        {
            std::cerr << "expected end of stream after the last frame\n";
            return false;
        }
    }

    {
        std::istringstream               in;
        std::ostringstream               out;
        draftlint::lsp::JsonRpcTransport transport(in, out);
        const llvm::json::Value          message = llvm::json::Object{
                     {"jsonrpc", "2.0"},
                     {"id", 1},
                     {"method", "initialize"},
        };
        if (!transport.writeMessage(message))
        {
            std::cerr << "writeMessage unexpectedly failed\n";
            return false;
        }
        if (out.str() != encodeLspFrame(R"({"id":1,"jsonrpc":"2.0","method":"initialize"})"))
        {
            std::cerr << "writeMessage emitted unexpected frame: " << out.str() << "\n";
            return false;
        }
    }

    {
        // Random byte soup must end in a bounded number of reads without crashing.
        std::mt19937                       rng(0xD5AF7u);
        std::uniform_int_distribution<int> lengthDist(0, 96);
        const std::string                  alphabet = "Content-Length: 0123456789{}[]\":,\r\n\r\nabc";
        std::uniform_int_distribution<std::size_t> charDist(0, alphabet.size() - 1U);
        for (int iteration = 0; iteration < 128; ++iteration)
        {
            std::string input;
            if (iteration % 4 == 0)
            {
                input += "Content-Length: ";
            }
            const int length = lengthDist(rng);
            for (int idx = 0; idx < length; ++idx)
            {
                input.push_back(alphabet[charDist(rng)]);
            }

            std::istringstream               in(input);
            std::ostringstream               out;
            draftlint::lsp::JsonRpcTransport transport(in, out);
            bool                             ended = false;
            for (int read = 0; read < 256 && !ended; ++read)
            {
                llvm::json::Value message(nullptr);
                std::string       error;
                ended = transport.readMessage(message, error) == ReadStatus::EndOfStream;
            }
            if (!ended)
            {
                std::cerr << "transport never reached end of stream on fuzz input " << iteration << "\n";
                return false;
            }
        }
    }

    draftlint::Logger      logger(llvm::nulls(), draftlint::TraceLevel::Off);
    Outbox                 outbox;
    draftlint::lsp::Server server(draftlint::lsp::ServerConfig{}, outbox.sink(), logger);

    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","id":1,"method":"no/such/method","params":{}})"));
    {
        const auto  response = outbox.responseById(1);
        const auto* error    = response ? response->getObject("error") : nullptr;
        if (!error || error->getInteger("code").getValueOr(0) != -32601)
        {
            std::cerr << "expected method-not-found response for unknown request\n";
            return false;
        }
    }

    // Fuzz-like malformed values at the server entrypoint.
    server.handleMessage(llvm::json::Value(nullptr));
    server.handleMessage(llvm::json::Array{});
    server.handleMessage(llvm::json::Object{{"jsonrpc", "2.0"}});
    server.handleMessage(llvm::json::Object{{"jsonrpc", "2.0"}, {"method", 99}});
    server.handleMessage(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", 2}, {"method", ""}});
    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","method":"textDocument/didOpen","params":{"textDocument":7}})"));
    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","method":"textDocument/didChange","params":{"contentChanges":[]}})"));
    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","method":"textDocument/didSave","params":{"textDocument":{"uri":"file:///nope.md"}}})"));
    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","method":"workspace/didChangeConfiguration","params":{"settings":[]}})"));
    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","id":3,"method":"workspace/executeCommand","params":null})"));
    {
        const auto  response = outbox.responseById(3);
        const auto* error    = response ? response->getObject("error") : nullptr;
        if (!error || error->getInteger("code").getValueOr(0) != -32602)
        {
            std::cerr << "executeCommand without a command should be rejected as invalid params\n";
            return false;
        }
    }

    std::mt19937                       rng(0xD5D1u);
    std::uniform_int_distribution<int> methodLength(0, 18);
    std::uniform_int_distribution<int> charDist(0, 25);
    std::uniform_int_distribution<int> idDist(10, 200);
    for (int iteration = 0; iteration < 256; ++iteration)
    {
        std::string method;
        const int   length = methodLength(rng);
        method.reserve(static_cast<std::size_t>(length));
        for (int idx = 0; idx < length; ++idx)
        {
            method.push_back(static_cast<char>('a' + charDist(rng)));
        }

        llvm::json::Object message{
            {"jsonrpc", "2.0"},
            {"method", method},
        };
        if (iteration % 2 == 0)
        {
            message["id"] = idDist(rng);
        }
        if (iteration % 3 == 0)
        {
            message["params"] = llvm::json::Array{llvm::json::Value(nullptr)};
        }
        server.handleMessage(llvm::json::Value(std::move(message)));
    }

    // Server should remain healthy after malformed traffic.
    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","id":9000,"method":"initialize","params":{}})"));
    const auto initializeResponse = outbox.responseById(9000);
    if (!initializeResponse || !initializeResponse->getObject("result"))
    {
        std::cerr << "server did not recover after malformed input fuzzing\n";
        return false;
    }

    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","id":9001,"method":"shutdown","params":null})"));
    server.handleMessage(parseJson(R"({"jsonrpc":"2.0","method":"exit"})"));
    if (!server.shutdownRequested() || !server.shouldExit() || server.exitCode() != 0)
    {
        std::cerr << "expected orderly shutdown after malformed input fuzzing\n";
        return false;
    }

    return true;
}
