/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "rootledger/pipeline.hpp"
#include "rootledger/state_store.hpp"
#include "rootledger/types.hpp"

namespace rootledger {

struct SchedulerLimits {
    std::size_t maxInFlight = 8;
    std::size_t checkpointEvery = 200;
    int maxAttempts = 1;
};

// Owns the job state machine and the only writer of the state file.
//
//   PENDING --dispatch--> RUNNING --first ACCEPTED--> DONE
//                            |
//                            +--worker failure--> FAILED (or PENDING while attempts remain)
//
// A RUNNING job whose worker finished without an accepted result stays
// RUNNING. Jobs are never retried on their own across restarts.
class Scheduler final {
public:
    Scheduler(StateStore& store, OrchestratorState state, SchedulerLimits limits);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Adds unknown ids as PENDING, keeps existing records untouched.
    // Returns the number of jobs actually added.
    std::size_t registerJobs(const std::vector<Job>& jobs);

    // Moves PENDING jobs to RUNNING in registration order while there is
    // room under maxInFlight. The returned copies are what workers receive.
    [[nodiscard]] std::vector<Job> dispatch();

    void recordOutcome(const AcceptResult& result, const JobId& jobId);
    void onWorkerFinished(const JobId& jobId);
    void onWorkerFailed(const JobId& jobId, const std::string& error);

    // Operator action: RUNNING or FAILED back to PENDING with a fresh attempt budget.
    [[nodiscard]] bool requeue(const JobId& jobId, std::string* error = nullptr);

    // Saves when forced, or when checkpointEvery outcomes are pending.
    // Every checkpointEvery accepted results also leave a checkpoint snapshot.
    // A failed save keeps the state dirty so the next flush retries.
    bool flush(bool force = false);

    [[nodiscard]] bool idle() const noexcept;
    [[nodiscard]] std::size_t inFlight() const noexcept { return inFlight_.size(); }
    [[nodiscard]] std::size_t pending() const noexcept;
    [[nodiscard]] const OrchestratorState& state() const noexcept { return state_; }

private:
    void release(const JobId& jobId);
    void checkpoint();

    StateStore& store_;
    OrchestratorState state_;
    SchedulerLimits limits_;
    std::unordered_set<JobId> inFlight_;
    std::size_t outcomesSinceFlush_ = 0;
    std::size_t acceptedSinceCheckpoint_ = 0;
    bool dirty_ = false;
};

}
