/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/scheduler.hpp"
#include "rootledger/contract.hpp"
#include "rootledger/errors.hpp"
#include "rootledger/logger.hpp"

namespace rootledger {

Scheduler::Scheduler(StateStore& store, OrchestratorState state, SchedulerLimits limits)
    : store_(store), state_(std::move(state)), limits_(limits) {
    if (limits_.maxInFlight == 0) limits_.maxInFlight = 1;
    if (limits_.checkpointEvery == 0) limits_.checkpointEvery = 1;
    if (limits_.maxAttempts < 1) limits_.maxAttempts = 1;
    state_.reindex();
}

std::size_t Scheduler::registerJobs(const std::vector<Job>& jobs) {
    std::size_t added = 0;
    for (const auto& job : jobs) {
        if (!isValidJobId(job.id)) {
            LOG_WARN("Skipping job with invalid id '" + job.id + "'");
            continue;
        }
        if (state_.find(job.id)) {
            LOG_TRACE("Job already registered: " + job.id);
            continue;
        }
        Job fresh = job;
        fresh.status = JobStatus::Pending;
        fresh.attempts = 0;
        fresh.lastError.clear();
        if (fresh.createdAt.empty()) {
            fresh.createdAt = nowIso();
        }
        state_.add(std::move(fresh));
        ++added;
    }

    if (added > 0) {
        LOG_INFO("Registered " + std::to_string(added) + " job(s)");
        dirty_ = true;
        flush(true);
    }
    return added;
}

std::vector<Job> Scheduler::dispatch() {
    std::vector<Job> batch;
    for (auto& job : state_.jobs) {
        if (inFlight_.size() >= limits_.maxInFlight) {
            break;
        }
        if (job.status != JobStatus::Pending) {
            continue;
        }
        job.status = JobStatus::Running;
        ++job.attempts;
        inFlight_.insert(job.id);
        batch.push_back(job);
        LOG_DEBUG("Dispatch " + job.id + " (attempt " + std::to_string(job.attempts) + ")");
    }

    if (!batch.empty()) {
        dirty_ = true;
        flush(true);
    }
    return batch;
}

void Scheduler::recordOutcome(const AcceptResult& result, const JobId& jobId) {
    if (result.accepted()) {
        ++state_.accepted;
        ++acceptedSinceCheckpoint_;
    } else {
        ++state_.rejected;
        if (result.reason) {
            ++state_.rejectedByReason[toString(*result.reason)];
        }
    }
    if (result.seq > state_.lastSeq) {
        state_.lastSeq = result.seq;
    }
    dirty_ = true;
    ++outcomesSinceFlush_;

    bool transitioned = false;
    if (result.accepted() && !jobId.empty() && !isValidJobId(jobId)) {
        LOG_WARN("Accepted result names invalid job id '" + jobId + "', no job record kept");
    } else if (result.accepted() && !jobId.empty()) {
        Job* job = state_.find(jobId);
        if (!job) {
            // Results for jobs this run never registered still complete them.
            Job record;
            record.id = jobId;
            record.status = JobStatus::Done;
            record.createdAt = nowIso();
            state_.add(std::move(record));
            LOG_INFO("Job " + jobId + " DONE (not registered here)");
            transitioned = true;
        } else if (job->status != JobStatus::Done) {
            job->status = JobStatus::Done;
            LOG_INFO("Job " + jobId + " DONE");
            transitioned = true;
        }
    }

    flush(transitioned);
    if (acceptedSinceCheckpoint_ >= limits_.checkpointEvery) {
        checkpoint();
    }
}

void Scheduler::checkpoint() {
    if (!store_.saveCheckpoint(state_)) {
        LOG_WARN(std::string(toString(ErrorKind::StateIo)) + ": checkpoint at seq " +
                 std::to_string(state_.lastSeq) + " not written, will retry");
        return;
    }
    acceptedSinceCheckpoint_ = 0;
}

void Scheduler::onWorkerFinished(const JobId& jobId) {
    release(jobId);
    const Job* job = state_.find(jobId);
    if (job && job->status == JobStatus::Running) {
        LOG_WARN("Job " + jobId + " finished without an accepted result, left RUNNING");
    }
}

void Scheduler::onWorkerFailed(const JobId& jobId, const std::string& error) {
    release(jobId);
    Job* job = state_.find(jobId);
    if (!job) {
        LOG_WARN("Failure reported for unknown job " + jobId + ": " + error);
        return;
    }

    job->lastError = error;
    dirty_ = true;
    if (job->status != JobStatus::Running) {
        LOG_WARN("Failure reported for job " + jobId + " in state " + toString(job->status) + ": " + error);
        flush(true);
        return;
    }

    if (job->attempts < limits_.maxAttempts) {
        job->status = JobStatus::Pending;
        LOG_WARN("Job " + jobId + " failed (attempt " + std::to_string(job->attempts) + "/" +
                 std::to_string(limits_.maxAttempts) + "), requeued: " + error);
    } else {
        job->status = JobStatus::Failed;
        LOG_ERROR("Job " + jobId + " FAILED: " + error);
    }
    flush(true);
}

bool Scheduler::requeue(const JobId& jobId, std::string* error) {
    Job* job = state_.find(jobId);
    if (!job) {
        if (error) *error = "unknown job " + jobId;
        return false;
    }
    if (job->status != JobStatus::Running && job->status != JobStatus::Failed) {
        if (error) *error = "job " + jobId + " is " + toString(job->status) + ", only RUNNING or FAILED jobs can be requeued";
        return false;
    }
    if (inFlight_.count(jobId) > 0) {
        if (error) *error = "job " + jobId + " is still in flight";
        return false;
    }

    LOG_INFO("Requeue " + jobId + " (was " + toString(job->status) + ")");
    job->status = JobStatus::Pending;
    job->attempts = 0;
    dirty_ = true;
    return flush(true);
}

bool Scheduler::flush(bool force) {
    if (!dirty_) {
        return true;
    }
    if (!force && outcomesSinceFlush_ < limits_.checkpointEvery) {
        return true;
    }
    if (!store_.save(state_)) {
        LOG_WARN(std::string(toString(ErrorKind::StateIo)) + ": state not saved, will retry at next flush");
        return false;
    }
    dirty_ = false;
    outcomesSinceFlush_ = 0;
    return true;
}

bool Scheduler::idle() const noexcept {
    return inFlight_.empty() && pending() == 0;
}

std::size_t Scheduler::pending() const noexcept {
    return state_.count(JobStatus::Pending);
}

void Scheduler::release(const JobId& jobId) {
    if (inFlight_.erase(jobId) == 0) {
        LOG_DEBUG("Completion for job not in flight: " + jobId);
    }
}

}
