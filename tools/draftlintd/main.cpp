//===----------------------------------------------------------------------===//
//
// Part of the draftlint project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `draftlintd` Language Server Protocol executable.
///
/// The process runs a stdio JSON-RPC loop and dispatches protocol messages to
/// the LSP server core. Lint cycles run on a background thread and write
/// their notifications through the same transport.
///
//===----------------------------------------------------------------------===//

#include "draftlint/LSP/JsonRpcIO.h"
#include "draftlint/LSP/Server.h"
#include "draftlint/Support/Logging.h"
#include "draftlint/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <iostream>

namespace
{

void printUsage()
{
    llvm::outs() << "usage: draftlintd [--trace=off|basic|verbose] [--plugin=<rule-pack.so>]... [--version]\n";
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    draftlint::lsp::ServerConfig config;
    for (int i = 1; i < argc; ++i)
    {
        llvm::StringRef arg(argv[i]);
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "draftlintd " << draftlint::kVersionString << "\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        if (arg.consume_front("--trace="))
        {
            const auto level = draftlint::parseTraceLevel(arg);
            if (!level)
            {
                llvm::errs() << "[draftlintd] unknown trace level '" << arg << "'\n";
                return 2;
            }
            config.traceLevel = *level;
            continue;
        }
        if (arg.consume_front("--plugin="))
        {
            config.pluginLibraries.push_back(arg.str());
            continue;
        }
        if (arg == "--stdio")
        {
            continue;
        }
        llvm::errs() << "[draftlintd] unknown argument '" << arg << "'\n";
        printUsage();
        return 2;
    }

    draftlint::Logger                logger(llvm::errs(), config.traceLevel);
    draftlint::lsp::JsonRpcTransport transport(std::cin, std::cout);
    draftlint::lsp::Server           server(
        config,
        [&transport](llvm::json::Value message) {
            if (!transport.writeMessage(message))
            {
                llvm::errs() << "[draftlintd] failed to write JSON-RPC message\n";
            }
        },
        logger,
        [&logger](const draftlint::lsp::CycleMetric& metric) {
            if (logger.level() != draftlint::TraceLevel::Verbose)
            {
                return;
            }
            logger.verbose(llvm::Twine("[telemetry] uri=") + metric.uri +
                           " mode=" + draftlint::lsp::cycleModeName(metric.mode) +
                           " regions=" + llvm::Twine(static_cast<std::uint64_t>(metric.regionCount)) +
                           " latency_us=" + llvm::Twine(metric.latencyMicros) +
                           " outcome=" + draftlint::lsp::cycleOutcomeName(metric.outcome));
        });

    while (!server.shouldExit())
    {
        llvm::json::Value message(llvm::json::Object{});
        std::string       error;
        const auto        status = transport.readMessage(message, error);
        if (status == draftlint::lsp::ReadStatus::EndOfStream)
        {
            if (!error.empty())
            {
                llvm::errs() << "[draftlintd] " << error << "\n";
            }
            break;
        }
        if (status == draftlint::lsp::ReadStatus::Malformed)
        {
            llvm::errs() << "[draftlintd] " << error << "\n";
            continue;
        }
        server.handleMessage(message);
    }

    server.shutdown();
    return server.exitCode();
}
