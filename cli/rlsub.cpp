/*
 * rootledger - Result submission tool (rlsub)
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/inbox.hpp"
#include "rootledger/json.hpp"
#include "rootledger/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <unistd.h>

using namespace rootledger;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "rootledger Result Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <run_dir> [--job ID] [--worker N] <json>\n";
    std::cout << "       " << progName << " <run_dir> [--job ID] [--worker N] -     (read JSON from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  run_dir       Orchestrator run directory (inbox lives in run_dir/inbox)\n";
    std::cout << "  json          Result payload {\"t\":..,\"root_val\":..,\"meta\":{\"method\":..,\"iters\":..}}\n";
    std::cout << "  -             Read the payload from stdin\n\n";
    std::cout << "Options:\n";
    std::cout << "  --job ID        Job the result belongs to\n";
    std::cout << "  --worker N      Worker id recorded with the result\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Without --job or --worker the text is delivered exactly as given.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ROOTLEDGER_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./run '{\"t\":1,\"root_val\":1e-14,\"meta\":{\"method\":\"newton\",\"iters\":7}}'\n";
    std::cout << "  " << progName << " ./run --job chunk_5000_5010 --worker 2 -  < result.json\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; ROOTLEDGER_LOG_LEVEL overrides
    if (!std::getenv("ROOTLEDGER_LOG_LEVEL")) {
        Logger::setLevel(LogLevel::WARN);
    } else {
        Logger::initFromEnv();
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::filesystem::path runDir = argv[1];
    std::string jobId;
    int workerId = -1;
    bool wrap = false;
    std::string text;
    bool haveText = false;
    bool readStdin = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--job") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --job requires an id\n";
                return 1;
            }
            jobId = argv[++i];
            wrap = true;
        } else if (arg == "--worker") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --worker requires a number\n";
                return 1;
            }
            try {
                workerId = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid worker id: " << argv[i] << "\n";
                return 1;
            }
            wrap = true;
        } else if (arg == "-") {
            readStdin = true;
        } else if (!haveText) {
            text = arg;
            haveText = true;
        } else {
            std::cerr << "Error: unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (!haveText && !readStdin && !isatty(fileno(stdin))) {
        readStdin = true;
    }
    if (readStdin) {
        text.assign((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
    } else if (!haveText) {
        printUsage(argv[0]);
        return 1;
    }

    if (!std::filesystem::exists(runDir)) {
        std::cerr << "Error: run directory does not exist: " << runDir.string() << "\n";
        return 1;
    }

    Inbox inbox(runDir / "inbox");
    SubmitResult result;
    if (wrap) {
        Json::Value payload;
        std::string error;
        if (!parseJson(text, payload, &error)) {
            std::cerr << "Error: payload is not valid JSON: " << error << "\n";
            return 1;
        }
        result = inbox.submit(payload, workerId, jobId);
    } else {
        result = inbox.submit(text);
    }

    if (!result) {
        std::cerr << "Error: " << result.message << " (" << toString(result.error) << ")\n";
        return 1;
    }

    std::cout << result.id << "\n";
    return 0;
}
