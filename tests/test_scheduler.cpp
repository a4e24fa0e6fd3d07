/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "rootledger/json.hpp"
#include "rootledger/scheduler.hpp"
#include "test_support.hpp"

using namespace rootledger;
using namespace rootledger::test;

namespace {
std::vector<Job> makeJobs(int n) {
    std::vector<Job> jobs;
    for (int i = 0; i < n; ++i) {
        Job job;
        job.id = "job-" + std::to_string(i);
        jobs.push_back(job);
    }
    return jobs;
}

AcceptResult acceptedAt(Seq seq) {
    AcceptResult r;
    r.status = AcceptStatus::Accepted;
    r.seq = seq;
    r.hash = "sha256:" + std::to_string(seq);
    return r;
}

AcceptResult rejectedAt(Seq seq, RejectReason reason) {
    AcceptResult r;
    r.status = AcceptStatus::Rejected;
    r.reason = reason;
    r.seq = seq;
    return r;
}
}

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override { quietLogs(); }

    SchedulerLimits limits(std::size_t inFlight, std::size_t checkpoint = 200, int attempts = 1) {
        SchedulerLimits l;
        l.maxInFlight = inFlight;
        l.checkpointEvery = checkpoint;
        l.maxAttempts = attempts;
        return l;
    }

    TempDir dir_;
    StateStore store_{dir_ / "state.json"};
};

TEST_F(SchedulerTest, RegisterIsIdempotent) {
    Scheduler s(store_, OrchestratorState{}, limits(4));
    EXPECT_EQ(s.registerJobs(makeJobs(3)), 3u);
    EXPECT_EQ(s.registerJobs(makeJobs(5)), 2u);
    EXPECT_EQ(s.state().jobs.size(), 5u);
    EXPECT_EQ(s.pending(), 5u);
    EXPECT_EQ(store_.load().jobs.size(), 5u);
}

TEST_F(SchedulerTest, DispatchIsFifoAndBounded) {
    Scheduler s(store_, OrchestratorState{}, limits(2));
    s.registerJobs(makeJobs(5));

    auto first = s.dispatch();
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].id, "job-0");
    EXPECT_EQ(first[1].id, "job-1");
    EXPECT_EQ(first[0].status, JobStatus::Running);
    EXPECT_EQ(first[0].attempts, 1);
    EXPECT_TRUE(s.dispatch().empty());
    EXPECT_EQ(s.inFlight(), 2u);

    s.onWorkerFinished("job-0");
    auto next = s.dispatch();
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].id, "job-2");
}

TEST_F(SchedulerTest, AcceptedResultCompletesJob) {
    Scheduler s(store_, OrchestratorState{}, limits(4));
    s.registerJobs(makeJobs(1));
    (void)s.dispatch();

    s.recordOutcome(rejectedAt(1, RejectReason::OutOfTolerance), "job-0");
    EXPECT_EQ(s.state().find("job-0")->status, JobStatus::Running);

    s.recordOutcome(acceptedAt(2), "job-0");
    EXPECT_EQ(s.state().find("job-0")->status, JobStatus::Done);
    EXPECT_EQ(s.state().accepted, 1u);
    EXPECT_EQ(s.state().rejected, 1u);
    EXPECT_EQ(s.state().rejectedByReason.at("OUT_OF_TOLERANCE"), 1u);
    EXPECT_EQ(s.state().lastSeq, 2u);

    // The transition is persisted right away
    EXPECT_EQ(store_.load().find("job-0")->status, JobStatus::Done);
}

TEST_F(SchedulerTest, FinishedWithoutAcceptStaysRunning) {
    Scheduler s(store_, OrchestratorState{}, limits(4));
    s.registerJobs(makeJobs(1));
    (void)s.dispatch();
    s.recordOutcome(rejectedAt(1, RejectReason::Duplicate), "job-0");
    s.onWorkerFinished("job-0");

    EXPECT_EQ(s.state().find("job-0")->status, JobStatus::Running);
    EXPECT_EQ(s.inFlight(), 0u);
    EXPECT_TRUE(s.idle());
}

TEST_F(SchedulerTest, WorkerFailureFailsJob) {
    Scheduler s(store_, OrchestratorState{}, limits(4));
    s.registerJobs(makeJobs(1));
    (void)s.dispatch();
    s.onWorkerFailed("job-0", "boom");

    const Job* job = s.state().find("job-0");
    EXPECT_EQ(job->status, JobStatus::Failed);
    EXPECT_EQ(job->lastError, "boom");
    EXPECT_TRUE(s.idle());
}

TEST_F(SchedulerTest, FailureRetriesWhileAttemptsRemain) {
    Scheduler s(store_, OrchestratorState{}, limits(4, 200, 2));
    s.registerJobs(makeJobs(1));
    (void)s.dispatch();
    s.onWorkerFailed("job-0", "first");
    EXPECT_EQ(s.state().find("job-0")->status, JobStatus::Pending);

    auto again = s.dispatch();
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].attempts, 2);
    s.onWorkerFailed("job-0", "second");
    EXPECT_EQ(s.state().find("job-0")->status, JobStatus::Failed);
}

TEST_F(SchedulerTest, RequeueRunningOrFailedOnly) {
    OrchestratorState state;
    Job running;
    running.id = "stale";
    running.status = JobStatus::Running;
    running.attempts = 1;
    state.add(running);
    Job done;
    done.id = "done";
    done.status = JobStatus::Done;
    state.add(done);

    Scheduler s(store_, state, limits(4));
    std::string error;
    EXPECT_FALSE(s.requeue("done", &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(s.requeue("missing", &error));

    EXPECT_TRUE(s.requeue("stale", &error));
    EXPECT_EQ(s.state().find("stale")->status, JobStatus::Pending);
    EXPECT_EQ(s.state().find("stale")->attempts, 0);
    EXPECT_EQ(store_.load().find("stale")->status, JobStatus::Pending);
}

TEST_F(SchedulerTest, StaleRunningJobsAreNotDispatched) {
    OrchestratorState state;
    Job running;
    running.id = "stale";
    running.status = JobStatus::Running;
    state.add(running);

    Scheduler s(store_, state, limits(4));
    EXPECT_TRUE(s.dispatch().empty());
    EXPECT_TRUE(s.idle());
    EXPECT_EQ(s.state().find("stale")->status, JobStatus::Running);
}

TEST_F(SchedulerTest, CountersCheckpointEveryN) {
    Scheduler s(store_, OrchestratorState{}, limits(4, 3));
    s.recordOutcome(rejectedAt(1, RejectReason::Duplicate), "");
    s.recordOutcome(rejectedAt(2, RejectReason::Duplicate), "");
    EXPECT_EQ(store_.load().rejected, 0u);

    s.recordOutcome(rejectedAt(3, RejectReason::Duplicate), "");
    EXPECT_EQ(store_.load().rejected, 3u);

    s.recordOutcome(rejectedAt(4, RejectReason::SchemaInvalid), "");
    EXPECT_EQ(store_.load().rejected, 3u);
    EXPECT_TRUE(s.flush(true));
    EXPECT_EQ(store_.load().rejected, 4u);
    EXPECT_EQ(store_.load().lastSeq, 4u);
}

TEST_F(SchedulerTest, AcceptedResultForUnknownJobCreatesDoneRecord) {
    Scheduler s(store_, OrchestratorState{}, limits(4));
    s.recordOutcome(acceptedAt(1), "external-7");
    ASSERT_NE(s.state().find("external-7"), nullptr);
    EXPECT_EQ(s.state().find("external-7")->status, JobStatus::Done);
}

TEST_F(SchedulerTest, InvalidJobIdsAreNotRegistered) {
    std::vector<Job> jobs = makeJobs(1);
    for (const std::string& id : {std::string("bad id"), std::string("a/b"), std::string(),
                                  "chunk_" + std::string(200, '9')}) {
        Job job;
        job.id = id;
        jobs.push_back(job);
    }

    Scheduler s(store_, OrchestratorState{}, limits(8));
    EXPECT_EQ(s.registerJobs(jobs), 1u);
    auto running = s.dispatch();
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].id, "job-0");

    // The saved state reloads intact, so a restart does not dispatch job-0 again
    OrchestratorState reloaded = store_.load();
    ASSERT_EQ(reloaded.jobs.size(), 1u);
    EXPECT_EQ(reloaded.find("job-0")->status, JobStatus::Running);

    Scheduler restarted(store_, reloaded, limits(8));
    EXPECT_EQ(restarted.registerJobs(makeJobs(1)), 0u);
    EXPECT_TRUE(restarted.dispatch().empty());
}

TEST_F(SchedulerTest, AcceptedResultWithInvalidJobIdCountsButAddsNoRecord) {
    Scheduler s(store_, OrchestratorState{}, limits(4));
    s.recordOutcome(acceptedAt(1), "not/valid");
    EXPECT_EQ(s.state().accepted, 1u);
    EXPECT_TRUE(s.state().jobs.empty());
    EXPECT_TRUE(s.flush(true));
    EXPECT_EQ(store_.load().accepted, 1u);
}

TEST_F(SchedulerTest, CheckpointSnapshotEveryNAccepted) {
    Scheduler s(store_, OrchestratorState{}, limits(4, 2));
    s.registerJobs(makeJobs(3));
    ASSERT_EQ(s.dispatch().size(), 3u);
    s.onWorkerFailed("job-2", "boom");

    s.recordOutcome(acceptedAt(1), "job-0");
    s.recordOutcome(rejectedAt(2, RejectReason::Duplicate), "job-1");
    EXPECT_FALSE(std::filesystem::exists(store_.checkpointDir()));

    s.recordOutcome(acceptedAt(3), "job-1");
    auto path = dir_ / "checkpoints" / "checkpoint_seq_3.json";
    ASSERT_EQ(store_.checkpointPath(3), path);
    ASSERT_TRUE(std::filesystem::exists(path));

    Json::Value snapshot;
    ASSERT_TRUE(parseJson(slurp(path), snapshot));
    EXPECT_EQ(snapshot["seq"].asUInt64(), 3u);
    EXPECT_EQ(snapshot["accepted"].asUInt64(), 2u);
    EXPECT_EQ(snapshot["rejected"].asUInt64(), 1u);
    ASSERT_EQ(snapshot["done"].size(), 2u);
    EXPECT_EQ(snapshot["done"][0].asString(), "job-0");
    EXPECT_EQ(snapshot["done"][1].asString(), "job-1");
    ASSERT_EQ(snapshot["failed"].size(), 1u);
    EXPECT_EQ(snapshot["failed"][0].asString(), "job-2");
    EXPECT_FALSE(snapshot["ts"].asString().empty());

    // Rejections alone never trigger a snapshot
    s.recordOutcome(rejectedAt(4, RejectReason::Duplicate), "");
    s.recordOutcome(rejectedAt(5, RejectReason::Duplicate), "");
    EXPECT_FALSE(std::filesystem::exists(store_.checkpointPath(5)));
}

TEST_F(SchedulerTest, FailedCheckpointIsRetriedOnNextAccept) {
    spit(store_.checkpointDir(), "not a directory");
    Scheduler s(store_, OrchestratorState{}, limits(4, 2));
    s.recordOutcome(acceptedAt(1), "");
    s.recordOutcome(acceptedAt(2), "");
    EXPECT_TRUE(std::filesystem::is_regular_file(store_.checkpointDir()));

    std::filesystem::remove(store_.checkpointDir());
    s.recordOutcome(acceptedAt(3), "");
    EXPECT_FALSE(std::filesystem::exists(store_.checkpointPath(2)));
    EXPECT_TRUE(std::filesystem::exists(store_.checkpointPath(3)));

    // The state file is unaffected by checkpoint failures
    EXPECT_EQ(store_.load().accepted, 2u);
}
