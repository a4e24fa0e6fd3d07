/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <stdexcept>

#include "rootledger/compactor.hpp"
#include "rootledger/inbox.hpp"
#include "rootledger/json.hpp"
#include "rootledger/ledger.hpp"
#include "rootledger/orchestrator.hpp"
#include "rootledger/schema.hpp"
#include "test_support.hpp"

using namespace rootledger;
using namespace rootledger::test;

namespace {
std::vector<Job> stubJobs(int n, double t0, double span, double stride) {
    std::vector<Job> jobs;
    for (int i = 0; i < n; ++i) {
        const double a = t0 + i * span;
        const double b = a + span;
        char id[64];
        std::snprintf(id, sizeof(id), "chunk_%.0f_%.0f", a, b);
        Job job;
        job.id = id;
        job.payload = stubJobPayload(a, b, stride);
        jobs.push_back(job);
    }
    return jobs;
}

std::size_t countKind(const std::filesystem::path& ledger, EventKind kind) {
    LedgerReader reader(ledger);
    LedgerEvent event;
    std::size_t n = 0;
    while (reader.next(event)) {
        if (event.kind == kind) ++n;
    }
    return n;
}

// Fails every job whose id ends in "_13".
class FlakyWorker : public Worker {
public:
    explicit FlakyWorker(int id) : stub_(id) {}
    std::vector<ResultPayload> compute(const Job& job) override {
        if (job.id.size() >= 3 && job.id.compare(job.id.size() - 3, 3, "_13") == 0) {
            throw std::runtime_error("solver diverged");
        }
        return stub_.compute(job);
    }

private:
    StubWorker stub_;
};
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        quietLogs();
        config_.runDir = dir_.path();
        config_.runId = "e2e";
        config_.epsRoot = 1e-10;
        config_.workers = 3;
        config_.maxInFlight = 4;
        config_.checkpointEvery = 7;
        config_.pollInterval = std::chrono::milliseconds(10);
        config_.inboxScanInterval = std::chrono::milliseconds(10);
    }

    TempDir dir_;
    Config config_;
};

TEST_F(EndToEndTest, AcceptRejectDuplicateThenCompact) {
    Orchestrator orch(config_, WorkerFactory{});
    ASSERT_TRUE(orch.start());

    auto first = orch.submit(result(1.0, 1e-14), ResultOrigin{0, "j1"});
    auto far = orch.submit(result(2.0, 5.0), ResultOrigin{0, "j2"});
    auto again = orch.submit(result(1.0, 1e-14, "secant", 3), ResultOrigin{1, "j1"});

    EXPECT_TRUE(first);
    ASSERT_TRUE(far.reason);
    EXPECT_EQ(*far.reason, RejectReason::OutOfTolerance);
    ASSERT_TRUE(again.reason);
    EXPECT_EQ(*again.reason, RejectReason::Duplicate);

    Summary s = orch.summary();
    EXPECT_EQ(s.accepted, 1u);
    EXPECT_EQ(s.rejected, 2u);
    EXPECT_EQ(s.lastSeq, 3u);
    EXPECT_EQ(s.distinctResults, 1u);
    EXPECT_EQ(s.done, 1u);
    orch.shutdown();

    EXPECT_EQ(lines(config_.ledgerPath()).size(), 3u);
    EXPECT_EQ(countKind(config_.ledgerPath(), EventKind::Accepted), 1u);
    EXPECT_TRUE(Ledger::verifyChain(config_.ledgerPath()).ok);

    auto merged = compact(config_.ledgerPath(), config_.mergedPath());
    ASSERT_TRUE(merged);
    EXPECT_EQ(lines(config_.mergedPath()).size(), 1u);
}

TEST_F(EndToEndTest, StubWorkersRunToIdle) {
    Orchestrator orch(config_, [](int id) { return std::make_unique<StubWorker>(id); });
    ASSERT_TRUE(orch.start());
    EXPECT_EQ(orch.registerJobs(stubJobs(6, 5000.0, 10.0, 0.5)), 6u);

    Summary s = orch.run();
    EXPECT_EQ(s.jobs, 6u);
    EXPECT_EQ(s.done, 6u);
    EXPECT_EQ(s.pending, 0u);
    EXPECT_EQ(s.running, 0u);
    EXPECT_EQ(s.accepted, 120u);
    EXPECT_EQ(s.rejected, 0u);
    EXPECT_EQ(s.lastSeq, 120u);
    EXPECT_EQ(s.distinctResults, 120u);
    orch.shutdown();

    auto report = Ledger::verifyChain(config_.ledgerPath());
    EXPECT_TRUE(report.ok) << report.message;
    EXPECT_EQ(report.events, 120u);

    StateStore store(config_.statePath());
    OrchestratorState saved = store.load();
    EXPECT_EQ(saved.count(JobStatus::Done), 6u);
    EXPECT_EQ(saved.lastSeq, 120u);
}

TEST_F(EndToEndTest, RestartDoesNotDuplicate) {
    {
        Orchestrator orch(config_, [](int id) { return std::make_unique<StubWorker>(id); });
        ASSERT_TRUE(orch.start());
        orch.registerJobs(stubJobs(3, 100.0, 5.0, 1.0));
        EXPECT_EQ(orch.run().accepted, 15u);
    }

    // Same jobs again: already DONE, nothing dispatched. Re-sent results are duplicates.
    Orchestrator orch(config_, [](int id) { return std::make_unique<StubWorker>(id); });
    ASSERT_TRUE(orch.start());
    EXPECT_EQ(orch.recovery().acceptedEvents, 15u);
    EXPECT_EQ(orch.registerJobs(stubJobs(3, 100.0, 5.0, 1.0)), 0u);

    auto replayed = StubWorker(9).compute(stubJobs(1, 100.0, 5.0, 1.0)[0]);
    for (const auto& p : replayed) {
        auto r = orch.submit(toJson(p), ResultOrigin{9, "chunk_100_105"});
        ASSERT_TRUE(r.reason);
        EXPECT_EQ(*r.reason, RejectReason::Duplicate);
    }
    Summary s = orch.run();
    EXPECT_EQ(s.accepted, 15u);
    EXPECT_EQ(s.rejected, 5u);
    EXPECT_EQ(s.distinctResults, 15u);
    EXPECT_EQ(s.done, 3u);
}

TEST_F(EndToEndTest, FailedJobIsRecordedAndOthersComplete) {
    Orchestrator orch(config_, [](int id) { return std::make_unique<FlakyWorker>(id); });
    ASSERT_TRUE(orch.start());
    std::vector<Job> jobs;
    for (int i = 10; i < 15; ++i) {
        Job job;
        job.id = "scan_" + std::to_string(i);
        job.payload = stubJobPayload(i, i + 1.0, 0.5);
        jobs.push_back(job);
    }
    orch.registerJobs(jobs);

    Summary s = orch.run();
    EXPECT_EQ(s.done, 4u);
    EXPECT_EQ(s.failed, 1u);
    orch.shutdown();

    OrchestratorState saved = StateStore(config_.statePath()).load();
    const Job* failed = saved.find("scan_13");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->status, JobStatus::Failed);
    EXPECT_EQ(failed->lastError, "solver diverged");
}

TEST_F(EndToEndTest, InboxResultsAreReduced) {
    {
        Inbox inbox(config_.inboxPath());
        ASSERT_TRUE(inbox.submit(result(7.0, 1e-13), 4, "remote"));
        ASSERT_TRUE(inbox.submit(result(7.0, 1e-13), 5, "remote"));
        ASSERT_TRUE(inbox.submit(std::string("{\"t\": 7.5, \"root_val\":")));
        ASSERT_TRUE(inbox.submit(canonicalJson(result(8.0, 0.1))));
    }

    Orchestrator orch(config_, WorkerFactory{});
    ASSERT_TRUE(orch.start());
    Summary s = orch.run();

    EXPECT_EQ(s.accepted, 1u);
    EXPECT_EQ(s.rejected, 3u);
    EXPECT_EQ(s.rejectedByReason["DUPLICATE"], 1u);
    EXPECT_EQ(s.rejectedByReason["SCHEMA_INVALID"], 1u);
    EXPECT_EQ(s.rejectedByReason["OUT_OF_TOLERANCE"], 1u);
    EXPECT_EQ(s.rejectedByKind["DUPLICATE"], 1u);
    EXPECT_EQ(s.rejectedByKind["VALIDATION"], 1u);
    EXPECT_EQ(s.rejectedByKind["TOLERANCE"], 1u);
    EXPECT_EQ(toJson(s)["rejected_by_kind"]["VALIDATION"].asUInt64(), 1u);
    EXPECT_EQ(s.done, 1u);
    orch.shutdown();

    Inbox inbox(config_.inboxPath());
    EXPECT_EQ(inbox.readyCount(), 0u);

    LedgerReader reader(config_.ledgerPath());
    LedgerEvent event;
    ASSERT_TRUE(reader.next(event));
    EXPECT_EQ(event.kind, EventKind::Accepted);
    EXPECT_EQ(event.workerId, 4);
    EXPECT_EQ(event.jobId, "remote");
}

TEST_F(EndToEndTest, TornTailIsRepairedOnStart) {
    {
        Orchestrator orch(config_, WorkerFactory{});
        ASSERT_TRUE(orch.start());
        for (int i = 0; i < 4; ++i) {
            ASSERT_TRUE(orch.submit(result(i, 0.0), ResultOrigin{}));
        }
    }
    spit(config_.ledgerPath(), slurp(config_.ledgerPath()) + "{\"seq\":5,\"kind\":\"ACCEP");

    Orchestrator orch(config_, WorkerFactory{});
    ASSERT_TRUE(orch.start());
    EXPECT_EQ(orch.summary().lastSeq, 4u);
    EXPECT_EQ(orch.summary().distinctResults, 4u);
    EXPECT_EQ(orch.submit(result(4.0, 0.0), ResultOrigin{}).seq, 5u);
    orch.shutdown();

    EXPECT_TRUE(Ledger::verifyChain(config_.ledgerPath()).ok);
    EXPECT_EQ(lines(config_.ledgerPath()).size(), 5u);
}

TEST_F(EndToEndTest, CannotRestartAfterShutdown) {
    Orchestrator orch(config_, WorkerFactory{});
    ASSERT_TRUE(orch.start());
    orch.shutdown();
    EXPECT_FALSE(orch.isRunning());
    EXPECT_FALSE(orch.start());
}

TEST_F(EndToEndTest, UnknownSchemaFailsStart) {
    config_.schema = "fermat";
    Orchestrator orch(config_, WorkerFactory{});
    EXPECT_FALSE(orch.start());
    ASSERT_TRUE(orch.startError().has_value());
    EXPECT_EQ(*orch.startError(), ErrorKind::Validation);
    EXPECT_FALSE(std::filesystem::exists(config_.ledgerPath()));
}

TEST_F(EndToEndTest, MersenneRunReducesInboxCertificates) {
    config_.schema = "mersenne-v1";
    config_.checkpointEvery = 2;
    {
        Inbox inbox(config_.inboxPath());
        ASSERT_TRUE(inbox.submit(mersenne(61), 1, "p61"));
        ASSERT_TRUE(inbox.submit(mersenne(89), 1, "p89"));
        ASSERT_TRUE(inbox.submit(mersenne(61), 2, "p61"));
        ASSERT_TRUE(inbox.submit(result(1.0, 0.0), 3, "root"));
    }

    Orchestrator orch(config_, WorkerFactory{});
    ASSERT_TRUE(orch.start());
    Summary s = orch.run();
    EXPECT_EQ(s.accepted, 2u);
    EXPECT_EQ(s.rejectedByKind["DUPLICATE"], 1u);
    EXPECT_EQ(s.rejectedByKind["VALIDATION"], 1u);
    EXPECT_EQ(s.distinctResults, 2u);
    orch.shutdown();

    auto checkpoints = dir_ / "checkpoints";
    ASSERT_TRUE(std::filesystem::is_directory(checkpoints));
    EXPECT_FALSE(std::filesystem::is_empty(checkpoints));

    auto schema = schemaByName(config_.schema);
    ASSERT_TRUE(schema.has_value());
    auto merged = compact(config_.ledgerPath(), config_.mergedPath(), *schema);
    ASSERT_TRUE(merged) << merged.error;
    EXPECT_EQ(merged.stats.kept, 2u);
}
