/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "rootledger/state_store.hpp"
#include "test_support.hpp"

using namespace rootledger;
using namespace rootledger::test;

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override { quietLogs(); }

    static OrchestratorState sample() {
        OrchestratorState s;
        s.runId = "run-7";
        for (int i = 0; i < 3; ++i) {
            Job job;
            job.id = "chunk_" + std::to_string(i);
            job.payload["t_start"] = i * 10.0;
            job.createdAt = "2025-01-01T00:00:00.000Z";
            s.add(std::move(job));
        }
        s.jobs[0].status = JobStatus::Done;
        s.jobs[1].status = JobStatus::Running;
        s.jobs[1].attempts = 1;
        s.jobs[2].status = JobStatus::Failed;
        s.jobs[2].attempts = 2;
        s.jobs[2].lastError = "stride must be positive";
        s.accepted = 4;
        s.rejected = 3;
        s.rejectedByReason["DUPLICATE"] = 2;
        s.rejectedByReason["OUT_OF_TOLERANCE"] = 1;
        s.lastSeq = 7;
        return s;
    }

    TempDir dir_;
};

TEST_F(StateStoreTest, MissingFileLoadsDefault) {
    StateStore store(dir_ / "state.json");
    auto state = store.load();
    EXPECT_TRUE(state.jobs.empty());
    EXPECT_EQ(state.lastSeq, 0u);
    EXPECT_EQ(state, OrchestratorState{});
}

TEST_F(StateStoreTest, SaveThenLoadPreservesEverything) {
    StateStore store(dir_ / "state.json");
    auto original = sample();
    ASSERT_TRUE(store.save(original));

    auto loaded = store.load();
    EXPECT_EQ(loaded, original);
    ASSERT_NE(loaded.find("chunk_2"), nullptr);
    EXPECT_EQ(loaded.find("chunk_2")->lastError, "stride must be positive");
    EXPECT_EQ(loaded.count(JobStatus::Done), 1u);
    EXPECT_EQ(loaded.jobs[1].id, "chunk_1");
}

TEST_F(StateStoreTest, SaveLeavesNoTemporaryFiles) {
    StateStore store(dir_ / "state.json");
    ASSERT_TRUE(store.save(sample()));
    ASSERT_TRUE(store.save(sample()));

    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir_.path())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(StateStoreTest, CorruptFileLoadsDefault) {
    spit(dir_ / "state.json", "{\"run_id\": \"x\", \"jobs\": [");
    StateStore store(dir_ / "state.json");
    EXPECT_EQ(store.load(), OrchestratorState{});

    spit(dir_ / "state.json", "{\"jobs\": [{\"id\": \"a\", \"status\": \"SLEEPING\"}]}");
    EXPECT_TRUE(store.load().jobs.empty());
}

TEST_F(StateStoreTest, BadJobRecordDoesNotCostTheOthers) {
    spit(dir_ / "state.json",
         "{\"run_id\": \"r\", \"accepted\": 3, \"last_seq\": 5, \"jobs\": ["
         "{\"id\": \"good\", \"status\": \"RUNNING\"},"
         "{\"id\": \"bad id\", \"status\": \"RUNNING\"},"
         "{\"id\": \"good\", \"status\": \"DONE\"},"
         "{\"id\": \"other\", \"status\": \"FAILED\"}]}");
    auto state = StateStore(dir_ / "state.json").load();
    EXPECT_EQ(state.runId, "r");
    EXPECT_EQ(state.accepted, 3u);
    EXPECT_EQ(state.lastSeq, 5u);
    ASSERT_EQ(state.jobs.size(), 2u);
    EXPECT_EQ(state.find("good")->status, JobStatus::Running);
    EXPECT_EQ(state.find("other")->status, JobStatus::Failed);
    EXPECT_EQ(state.find("bad id"), nullptr);
}

TEST_F(StateStoreTest, FailedSaveKeepsPreviousFile) {
    StateStore good(dir_ / "state.json");
    ASSERT_TRUE(good.save(sample()));
    const auto before = slurp(dir_ / "state.json");

    // A path whose parent is a regular file cannot be written.
    StateStore bad(dir_ / "state.json" / "nested.json");
    EXPECT_FALSE(bad.save(sample()));
    EXPECT_EQ(slurp(dir_ / "state.json"), before);
}

TEST_F(StateStoreTest, StateDocumentCarriesDerivedCounts) {
    auto doc = toJson(sample());
    EXPECT_EQ(doc["done"].asUInt64(), 1u);
    EXPECT_EQ(doc["failed"].asUInt64(), 1u);
    EXPECT_EQ(doc["jobs"].size(), 3u);
    EXPECT_EQ(doc["jobs"][1]["status"].asString(), "RUNNING");
}

TEST_F(StateStoreTest, FindUsesIndex) {
    auto s = sample();
    ASSERT_NE(s.find("chunk_1"), nullptr);
    EXPECT_EQ(s.find("chunk_1")->status, JobStatus::Running);
    EXPECT_EQ(s.find("nope"), nullptr);

    OrchestratorState copy = s;
    ASSERT_NE(copy.find("chunk_0"), nullptr);
    EXPECT_EQ(copy.find("chunk_0"), &copy.jobs[0]);
}
