/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/recovery.hpp"
#include "rootledger/contract.hpp"
#include "rootledger/errors.hpp"
#include "rootledger/ledger.hpp"
#include "rootledger/logger.hpp"
#include <unordered_map>
#include <vector>

namespace rootledger {

RecoveryResult recover(const std::filesystem::path& ledgerPath, const StateStore& store,
                       const std::string& runId) {
    LOG_INFO("Recovery: replaying " + ledgerPath.string());

    RecoveryResult result;
    OrchestratorState cached = store.load();

    OrchestratorState derived;
    std::unordered_map<JobId, std::string> acceptedJobs;   // job id -> ts of first ACCEPTED
    std::vector<JobId> acceptedOrder;

    LedgerReader reader(ledgerPath, ReadMode::Strict);
    LedgerEvent event;
    while (reader.next(event)) {
        ++result.events;
        derived.lastSeq = event.seq;
        if (event.kind == EventKind::Accepted) {
            ++result.acceptedEvents;
            ++derived.accepted;
            result.dedup.insert(event.hash);
            if (isValidJobId(event.jobId) && acceptedJobs.emplace(event.jobId, event.ts).second) {
                acceptedOrder.push_back(event.jobId);
            }
        } else {
            ++result.rejectedEvents;
            ++derived.rejected;
            if (event.reason) {
                ++derived.rejectedByReason[toString(*event.reason)];
            }
        }
    }
    result.tornTail = reader.tornTail();
    if (result.tornTail) {
        LOG_WARN("Recovery: ignored torn final ledger line");
    }

    derived.runId = runId.empty() ? cached.runId : runId;
    for (const auto& cachedJob : cached.jobs) {
        Job job = cachedJob;
        if (acceptedJobs.count(job.id) > 0) {
            job.status = JobStatus::Done;
        } else if (job.status == JobStatus::Done) {
            LOG_WARN("Recovery: job " + job.id + " cached as DONE without an ACCEPTED event, reverting to RUNNING");
            job.status = JobStatus::Running;
            ++result.revertedDone;
        }
        derived.add(std::move(job));
    }
    for (const auto& id : acceptedOrder) {
        if (derived.find(id)) {
            continue;
        }
        Job job;
        job.id = id;
        job.status = JobStatus::Done;
        job.createdAt = acceptedJobs[id];
        derived.add(std::move(job));
    }

    result.staleRunning = derived.count(JobStatus::Running);
    if (result.staleRunning > 0) {
        LOG_WARN("Recovery: " + std::to_string(result.staleRunning) +
                 " job(s) left RUNNING by a previous run; they stay RUNNING until requeued");
    }

    if (derived != cached) {
        if (store.save(derived)) {
            result.rewritten = true;
            LOG_INFO("Recovery: state file rewritten from ledger");
        } else {
            LOG_WARN(std::string(toString(ErrorKind::StateIo)) + ": recovered state not saved");
        }
    }

    LOG_INFO("Recovery: " + std::to_string(result.events) + " event(s), " +
             std::to_string(result.acceptedEvents) + " accepted, " +
             std::to_string(result.rejectedEvents) + " rejected, last seq " +
             std::to_string(derived.lastSeq));

    result.state = std::move(derived);
    return result;
}

}
