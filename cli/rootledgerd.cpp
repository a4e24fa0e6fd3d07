/*
 * rootledger - Orchestrator daemon (rootledgerd)
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/config.hpp"
#include "rootledger/json.hpp"
#include "rootledger/logger.hpp"
#include "rootledger/orchestrator.hpp"
#include "rootledger/schema.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

using namespace rootledger;

constexpr const char* VERSION = "0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitLockConflict = 2;
constexpr int kExitFatal = 3;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

struct JobRange {
    std::size_t count = 20;
    double t0 = 5000.0;
    double span = 10.0;
    double stride = 0.5;
};

void printUsage(const char* progName) {
    std::cout << "rootledger Orchestrator v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <run_dir> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers N       Worker threads (default 4)\n";
    std::cout << "  --jobs N              Stub scan jobs to register (default 20, 0 = none)\n";
    std::cout << "  --t0 X                Start of the first scan range (default 5000)\n";
    std::cout << "  --span X              Width of each scan range (default 10)\n";
    std::cout << "  --stride X            Scan step inside a range (default 0.5)\n";
    std::cout << "  --eps X               Acceptance tolerance for |root_val| (default 1e-10)\n";
    std::cout << "  --max-in-flight N     Dispatch bound (default 8)\n";
    std::cout << "  --run-id ID           Run identifier recorded in every ledger event\n";
    std::cout << "  --schema NAME         Result schema: root (default) or mersenne-v1 (inbox only)\n";
    std::cout << "  --serve               Keep running until SIGINT/SIGTERM instead of exiting when idle\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ROOTLEDGER_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  ROOTLEDGER_RUN_ID           Default run id\n";
    std::cout << "  ROOTLEDGER_EPS_ROOT         Default tolerance\n";
    std::cout << "  ROOTLEDGER_SCHEMA           Default result schema\n";
    std::cout << "  ROOTLEDGER_WORKERS          Default worker count\n";
    std::cout << "  ROOTLEDGER_MAX_IN_FLIGHT    Default dispatch bound\n";
    std::cout << "  ROOTLEDGER_CHECKPOINT_EVERY State flush and checkpoint interval (default 200)\n";
    std::cout << "  ROOTLEDGER_MAX_ATTEMPTS     Attempts per job before FAILED (default 1)\n\n";
    std::cout << "Exit codes: 0 ok, 1 usage or startup error, 2 lock conflict, 3 ledger I/O failure\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./run\n";
    std::cout << "  " << progName << " ./run -w 8 --jobs 100 --t0 0 --span 5 --stride 0.25\n";
    std::cout << "  " << progName << " ./run --jobs 0 --serve        (reduce inbox results only)\n";
}

std::string formatBound(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.0f", value);
    return buf;
}

std::vector<Job> makeJobs(const JobRange& range) {
    std::vector<Job> jobs;
    jobs.reserve(range.count);
    for (std::size_t i = 0; i < range.count; ++i) {
        double a = range.t0 + static_cast<double>(i) * range.span;
        double b = a + range.span;
        Job job;
        job.id = "chunk_" + formatBound(a) + "_" + formatBound(b);
        job.payload = stubJobPayload(a, b, range.stride);
        jobs.push_back(std::move(job));
    }
    return jobs;
}

template <typename T, typename Parse>
bool takeValue(int& i, int argc, char* argv[], const std::string& flag, T& out, Parse parse) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires a value\n";
        return false;
    }
    try {
        out = parse(argv[++i]);
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: invalid value for " << flag << ": " << argv[i] << "\n";
        return false;
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return kExitOk;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return kExitOk;
        }
    }

    if (argc < 2 || argv[1][0] == '-') {
        printUsage(argv[0]);
        return kExitUsage;
    }

    Logger::initFromEnv();
    setThreadName("Main");

    Config config = Config::fromEnv(argv[1]);
    JobRange range;

    auto toSize = [](const char* s) {
        long long v = std::stoll(s);
        if (v < 0) throw std::out_of_range("negative");
        return static_cast<std::size_t>(v);
    };
    auto toFinite = [](const char* s) {
        double v = std::stod(s);
        if (!std::isfinite(v)) throw std::out_of_range("not finite");
        return v;
    };
    auto toPositive = [&toFinite](const char* s) {
        double v = toFinite(s);
        if (!(v > 0.0)) throw std::out_of_range("not positive");
        return v;
    };

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "-w" || arg == "--workers") {
            std::size_t workers = 0;
            ok = takeValue(i, argc, argv, arg, workers, toSize);
            if (ok && workers == 0) {
                std::cerr << "Error: worker count must be positive\n";
                ok = false;
            }
            config.workers = static_cast<int>(workers);
        } else if (arg == "--jobs") {
            ok = takeValue(i, argc, argv, arg, range.count, toSize);
        } else if (arg == "--t0") {
            ok = takeValue(i, argc, argv, arg, range.t0, toFinite);
        } else if (arg == "--span") {
            ok = takeValue(i, argc, argv, arg, range.span, toPositive);
        } else if (arg == "--stride") {
            ok = takeValue(i, argc, argv, arg, range.stride, toPositive);
        } else if (arg == "--eps") {
            ok = takeValue(i, argc, argv, arg, config.epsRoot, toPositive);
        } else if (arg == "--max-in-flight") {
            ok = takeValue(i, argc, argv, arg, config.maxInFlight, toSize);
            if (ok && config.maxInFlight == 0) {
                std::cerr << "Error: --max-in-flight must be positive\n";
                ok = false;
            }
        } else if (arg == "--run-id") {
            ok = takeValue(i, argc, argv, arg, config.runId, [](const char* s) { return std::string(s); });
        } else if (arg == "--schema") {
            ok = takeValue(i, argc, argv, arg, config.schema, [](const char* s) { return std::string(s); });
            if (ok && !schemaByName(config.schema)) {
                std::cerr << "Error: unknown schema: " << config.schema << "\n";
                ok = false;
            }
        } else if (arg == "--serve") {
            config.exitWhenIdle = false;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            ok = false;
        }
        if (!ok) {
            return kExitUsage;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::error_code ec;
    std::filesystem::create_directories(config.runDir, ec);
    if (!ec && !Logger::setFile(config.logPath())) {
        LOG_WARN("Could not open log file " + config.logPath().string());
    }

    // The stub workers produce root results; other schemas reduce inbox results only.
    const bool stubJobs = config.schema == "root";
    WorkerFactory factory;
    if (stubJobs) {
        factory = [](int workerId) -> std::unique_ptr<Worker> {
            return std::make_unique<StubWorker>(workerId);
        };
    }
    Orchestrator orchestrator(config, factory);

    if (!orchestrator.start()) {
        auto kind = orchestrator.startError();
        std::cerr << "Failed to start: " << (kind ? toString(*kind) : "UNKNOWN") << "\n";
        return kind && *kind == ErrorKind::LockConflict ? kExitLockConflict : kExitUsage;
    }

    if (stubJobs) {
        orchestrator.registerJobs(makeJobs(range));
    }

    std::atomic<bool> finished{false};
    std::exception_ptr failure;
    Summary summary;
    std::thread reducer([&]() {
        try {
            summary = orchestrator.run();
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        finished.store(true);
    });

    while (!g_shutdown_requested && !finished.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (g_shutdown_requested) {
        LOG_INFO("Shutdown requested, stopping orchestrator...");
        orchestrator.requestShutdown();
    }
    reducer.join();
    orchestrator.shutdown();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const OrchestratorError& e) {
            LOG_ERROR(std::string(toString(e.kind())) + ": " + e.what());
            std::cerr << "Fatal: " << toString(e.kind()) << ": " << e.what() << "\n";
            return kExitFatal;
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Orchestrator error: ") + e.what());
            std::cerr << "Fatal: " << e.what() << "\n";
            return kExitFatal;
        }
    }

    std::cout << prettyJson(toJson(summary)) << "\n";
    Logger::setFile({});
    LOG_DEBUG("rootledgerd stopped");
    return kExitOk;
}
