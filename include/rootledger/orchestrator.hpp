/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "rootledger/config.hpp"
#include "rootledger/errors.hpp"
#include "rootledger/lock_guard.hpp"
#include "rootledger/pipeline.hpp"
#include "rootledger/queue.hpp"
#include "rootledger/recovery.hpp"
#include "rootledger/worker.hpp"

namespace rootledger {

class Ledger;
class StateStore;
class Scheduler;
class Inbox;
class WorkerPool;

struct Summary {
    std::string runId;
    std::size_t jobs = 0;
    std::size_t pending = 0;
    std::size_t running = 0;
    std::size_t done = 0;
    std::size_t failed = 0;
    std::uint64_t accepted = 0;
    std::uint64_t rejected = 0;
    std::map<std::string, std::uint64_t> rejectedByReason;
    std::map<std::string, std::uint64_t> rejectedByKind;   // VALIDATION, TOLERANCE, DUPLICATE
    Seq lastSeq = 0;
    std::size_t distinctResults = 0;
};

[[nodiscard]] Summary summarize(const OrchestratorState& state, std::size_t distinctResults);
[[nodiscard]] Json::Value toJson(const Summary& summary);

// Single writer for one run directory. Owns the lock, the ledger, the
// acceptance pipeline, the scheduler and the worker pool.
class Orchestrator final {
public:
    // An empty factory runs without a pool: only inbox results are reduced
    // and registered jobs are never dispatched.
    Orchestrator(Config config, WorkerFactory factory);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Lock, open ledger, recover, start workers. On failure nothing has been
    // written to the ledger and startError() says why.
    [[nodiscard]] bool start();

    std::size_t registerJobs(const std::vector<Job>& jobs);

    // The reducer loop. Returns when shutdown is requested or, with
    // exitWhenIdle, once no job is pending or in flight and the inbox is
    // empty. Throws OrchestratorError(LedgerIo).
    Summary run();

    // Feeds one candidate through the pipeline from the calling thread.
    // Not to be called while run() is active on another thread.
    AcceptResult submit(const Json::Value& candidate, const ResultOrigin& origin);

    // Async-signal-safe.
    void requestShutdown() noexcept { shutdown_.store(true); }
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::optional<ErrorKind> startError() const noexcept { return startError_; }
    [[nodiscard]] const RecoveryResult& recovery() const noexcept { return recovery_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] Summary summary() const;

private:
    void handleMessage(const ResultMessage& msg);
    void drainInbox();
    void dispatchJobs();
    void failStart(ErrorKind kind, const std::string& message) noexcept;

    Config config_;
    WorkerFactory factory_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::optional<ErrorKind> startError_;

    std::optional<LockHandle> lock_;
    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<StateStore> store_;
    RecoveryResult recovery_;
    DedupSet dedup_;
    std::unique_ptr<AcceptancePipeline> pipeline_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<Inbox> inbox_;
    BlockingQueue<ResultMessage> results_;
    std::unique_ptr<WorkerPool> pool_;
};

}
