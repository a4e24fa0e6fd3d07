/*
 * rootledger - Run inspection and maintenance tool (rlctl)
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/compactor.hpp"
#include "rootledger/config.hpp"
#include "rootledger/errors.hpp"
#include "rootledger/json.hpp"
#include "rootledger/ledger.hpp"
#include "rootledger/lock_guard.hpp"
#include "rootledger/logger.hpp"
#include "rootledger/orchestrator.hpp"
#include "rootledger/recovery.hpp"
#include "rootledger/schema.hpp"
#include "rootledger/scheduler.hpp"
#include "rootledger/state_store.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <unordered_set>

using namespace rootledger;

constexpr const char* VERSION = "0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitLockConflict = 2;
constexpr int kExitChainMismatch = 4;

void printUsage(const char* progName) {
    std::cout << "rootledger Control Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <run_dir> <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  status              Job and result counters from the state file\n";
    std::cout << "  verify              Recompute the ledger hash chain\n";
    std::cout << "  compact [out]       Write the deduplicated accepted results (default run_dir/merged_clean.jsonl)\n";
    std::cout << "  unlock              Remove the orchestrator lock marker after an unclean stop\n";
    std::cout << "  requeue <job_id>    Return a RUNNING or FAILED job to PENDING (orchestrator must be stopped)\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ROOTLEDGER_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  ROOTLEDGER_SCHEMA       Result schema for compact (root, mersenne-v1)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./run verify\n";
    std::cout << "  " << progName << " ./run compact ./merged.jsonl\n";
    std::cout << "  " << progName << " ./run requeue chunk_5000_5010\n";
}

std::size_t countDistinctAccepted(const std::filesystem::path& ledgerPath) {
    std::unordered_set<CanonicalHash> hashes;
    LedgerReader reader(ledgerPath, ReadMode::Lenient);
    LedgerEvent event;
    while (reader.next(event)) {
        if (event.kind == EventKind::Accepted) {
            hashes.insert(event.hash);
        }
    }
    return hashes.size();
}

int cmdStatus(const Config& config) {
    StateStore store(config.statePath());
    OrchestratorState state = store.load();
    Json::Value out = toJson(summarize(state, countDistinctAccepted(config.ledgerPath())));

    Json::Value lock(Json::objectValue);
    auto owner = LockGuard::readOwner(config.lockPath());
    std::error_code ec;
    bool present = std::filesystem::exists(config.lockPath(), ec);
    lock["present"] = present;
    if (owner) {
        lock["pid"] = static_cast<Json::Int64>(*owner);
        lock["alive"] = LockGuard::isProcessAlive(*owner);
    }
    out["lock"] = lock;

    Json::Value failed(Json::arrayValue);
    for (const auto& job : state.jobs) {
        if (job.status == JobStatus::Failed) {
            Json::Value entry(Json::objectValue);
            entry["id"] = job.id;
            entry["last_error"] = job.lastError;
            failed.append(entry);
        }
    }
    if (!failed.empty()) {
        out["failed_jobs"] = failed;
    }

    std::cout << prettyJson(out) << "\n";
    return kExitOk;
}

int cmdVerify(const Config& config) {
    ChainReport report = Ledger::verifyChain(config.ledgerPath());
    if (report.ok) {
        std::cout << "OK: " << report.message << "\n";
        if (!report.lastDigest.empty()) {
            std::cout << "last digest " << report.lastDigest << "\n";
        }
        return kExitOk;
    }
    std::cerr << toString(ErrorKind::ChainMismatch) << ": " << report.message << "\n";
    if (report.firstDivergence > 0) {
        std::cerr << "first divergent line: " << report.firstDivergence << " (" << report.events
                  << " event(s) verified before it)\n";
    }
    return kExitChainMismatch;
}

int cmdCompact(const Config& config, const std::filesystem::path& output) {
    auto schema = schemaByName(config.schema);
    if (!schema) {
        std::cerr << "Error: unknown result schema '" << config.schema << "'\n";
        return kExitError;
    }
    CompactResult result = compact(config.ledgerPath(), output, *schema);
    if (!result) {
        std::cerr << "Error: " << result.error << "\n";
        return kExitError;
    }
    const CompactStats& s = result.stats;
    std::cout << "wrote " << s.kept << " line(s) to " << output.string() << "\n";
    std::cout << "  read " << s.read << ", duplicates dropped " << s.droppedDuplicates << ", rejected skipped "
              << s.skippedRejected << ", invalid skipped " << s.skippedInvalid << ", malformed " << s.malformed
              << (s.tornTail ? ", partial final line ignored" : "") << "\n";
    return kExitOk;
}

int cmdUnlock(const Config& config) {
    auto owner = LockGuard::readOwner(config.lockPath());
    if (owner && LockGuard::isProcessAlive(*owner)) {
        std::cerr << "Warning: lock holder pid " << *owner << " is still running\n";
    }
    std::string error;
    if (!LockGuard::breakLock(config.lockPath(), &error)) {
        std::cerr << "Error: " << error << "\n";
        return kExitError;
    }
    std::cout << "lock removed: " << config.lockPath().string() << "\n";
    return kExitOk;
}

int cmdRequeue(const Config& config, const JobId& jobId) {
    auto acquired = LockGuard(config.lockPath()).acquire();
    if (!acquired) {
        std::cerr << "Error: " << acquired.message << "\n";
        return acquired.error == LockError::AlreadyLocked ? kExitLockConflict : kExitError;
    }

    try {
        StateStore store(config.statePath());
        RecoveryResult recovered = recover(config.ledgerPath(), store, "");
        SchedulerLimits limits;
        limits.maxInFlight = config.maxInFlight;
        limits.checkpointEvery = config.checkpointEvery;
        limits.maxAttempts = config.maxAttempts;
        Scheduler scheduler(store, std::move(recovered.state), limits);

        std::string error;
        if (!scheduler.requeue(jobId, &error)) {
            std::cerr << "Error: " << (error.empty() ? "state file not saved" : error) << "\n";
            return kExitError;
        }
    } catch (const OrchestratorError& e) {
        std::cerr << "Error: " << toString(e.kind()) << ": " << e.what() << "\n";
        return kExitError;
    }

    std::cout << "requeued " << jobId << "\n";
    return kExitOk;
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);
    if (std::getenv("ROOTLEDGER_LOG_LEVEL")) {
        Logger::initFromEnv();
    }

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

    if (argc < 3) {
        printUsage(argv[0]);
        return kExitError;
    }

    Config config = Config::fromEnv(argv[1]);
    std::string command = argv[2];

    if (!std::filesystem::exists(config.runDir)) {
        std::cerr << "Error: run directory does not exist: " << config.runDir.string() << "\n";
        return kExitError;
    }

    if (command == "status" && argc == 3) {
        return cmdStatus(config);
    }
    if (command == "verify" && argc == 3) {
        return cmdVerify(config);
    }
    if (command == "compact" && argc <= 4) {
        return cmdCompact(config, argc == 4 ? std::filesystem::path(argv[3]) : config.mergedPath());
    }
    if (command == "unlock" && argc == 3) {
        return cmdUnlock(config);
    }
    if (command == "requeue" && argc == 4) {
        return cmdRequeue(config, argv[3]);
    }

    printUsage(argv[0]);
    return kExitError;
}
