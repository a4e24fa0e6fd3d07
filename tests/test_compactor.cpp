/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "rootledger/compactor.hpp"
#include "rootledger/hasher.hpp"
#include "rootledger/json.hpp"
#include "rootledger/ledger.hpp"
#include "rootledger/schema.hpp"
#include "test_support.hpp"

using namespace rootledger;
using namespace rootledger::test;

class CompactorTest : public ::testing::Test {
protected:
    void SetUp() override {
        quietLogs();
        ledgerPath_ = dir_ / "ledger.jsonl";
        outPath_ = dir_ / "merged_clean.jsonl";
        ledger_.open();
    }

    // Bypasses the pipeline so the ledger can hold what dedup would block,
    // e.g. two runs merged by hand.
    void accepted(double t, double rootVal, const std::string& job, const std::string& method = "newton") {
        LedgerEvent e;
        e.kind = EventKind::Accepted;
        e.runId = "run";
        e.workerId = 0;
        e.jobId = job;
        e.payload = result(t, rootVal, method);
        ResultPayload p;
        p.t = t;
        p.rootVal = rootVal;
        e.hash = canonicalHash(p);
        ledger_.append(e);
    }

    void rejected(double t) {
        LedgerEvent e;
        e.kind = EventKind::Rejected;
        e.runId = "run";
        e.jobId = "job-r";
        e.payload = result(t, 3.0);
        e.reason = RejectReason::OutOfTolerance;
        ledger_.append(e);
    }

    TempDir dir_;
    std::filesystem::path ledgerPath_;
    std::filesystem::path outPath_;
    Ledger ledger_{dir_ / "ledger.jsonl"};
};

TEST_F(CompactorTest, OneLinePerDistinctResultInLedgerOrder) {
    accepted(3.0, 1e-14, "a");
    rejected(9.0);
    accepted(1.0, 2e-14, "b");
    accepted(3.0, 1e-14, "c", "bisect");   // same (t, root_val), different meta
    accepted(2.0, 0.0, "d");

    auto r = compact(ledgerPath_, outPath_);
    ASSERT_TRUE(r) << r.error;
    EXPECT_EQ(r.stats.read, 5u);
    EXPECT_EQ(r.stats.kept, 3u);
    EXPECT_EQ(r.stats.droppedDuplicates, 1u);
    EXPECT_EQ(r.stats.skippedRejected, 1u);

    auto out = lines(outPath_);
    ASSERT_EQ(out.size(), 3u);

    Json::Value first;
    ASSERT_TRUE(parseJson(out[0], first));
    EXPECT_EQ(first["job_id"].asString(), "a");
    EXPECT_EQ(first["seq"].asUInt64(), 1u);
    EXPECT_EQ(first["payload"]["meta"]["method"].asString(), "newton");
    EXPECT_EQ(first["hash"].asString().rfind("sha256:", 0), 0u);

    Json::Value second;
    ASSERT_TRUE(parseJson(out[1], second));
    EXPECT_EQ(second["job_id"].asString(), "b");
    Json::Value third;
    ASSERT_TRUE(parseJson(out[2], third));
    EXPECT_EQ(third["job_id"].asString(), "d");

    // Lines are canonical
    EXPECT_EQ(out[0], canonicalJson(first));
}

TEST_F(CompactorTest, OutputIsByteIdenticalAcrossRuns) {
    accepted(1.0, 1e-14, "a");
    accepted(1.5, -3e-12, "b");
    accepted(1.0, 1e-14, "c");

    ASSERT_TRUE(compact(ledgerPath_, outPath_));
    std::string once = slurp(outPath_);
    ASSERT_TRUE(compact(ledgerPath_, outPath_));
    EXPECT_EQ(slurp(outPath_), once);
    EXPECT_EQ(lines(outPath_).size(), 2u);
}

TEST_F(CompactorTest, LedgerIsLeftUntouched) {
    accepted(1.0, 1e-14, "a");
    accepted(1.0, 1e-14, "b");
    std::string before = slurp(ledgerPath_);
    ASSERT_TRUE(compact(ledgerPath_, outPath_));
    EXPECT_EQ(slurp(ledgerPath_), before);
}

TEST_F(CompactorTest, RefusesToOverwriteLedger) {
    accepted(1.0, 1e-14, "a");
    std::string before = slurp(ledgerPath_);

    auto r = compact(ledgerPath_, ledgerPath_);
    EXPECT_FALSE(r);
    EXPECT_FALSE(r.error.empty());

    auto viaDot = compact(ledgerPath_, dir_.path() / "." / "ledger.jsonl");
    EXPECT_FALSE(viaDot);
    EXPECT_EQ(slurp(ledgerPath_), before);
}

TEST_F(CompactorTest, SkipsAcceptedEventWithInvalidPayload) {
    accepted(1.0, 1e-14, "a");
    LedgerEvent bad;
    bad.kind = EventKind::Accepted;
    bad.runId = "run";
    bad.jobId = "b";
    bad.payload = Json::Value("not a payload");
    bad.hash = "sha256:00";
    ledger_.append(bad);

    auto r = compact(ledgerPath_, outPath_);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.stats.skippedInvalid, 1u);
    EXPECT_EQ(r.stats.kept, 1u);
}

TEST_F(CompactorTest, ToleratesDamagedLines) {
    accepted(1.0, 1e-14, "a");
    accepted(2.0, 1e-14, "b");
    std::string content = slurp(ledgerPath_);
    spit(ledgerPath_, "{not json\n" + content + "{\"seq\":3,\"kind\":\"ACC");

    auto r = compact(ledgerPath_, outPath_);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.stats.malformed, 1u);
    EXPECT_TRUE(r.stats.tornTail);
    EXPECT_EQ(r.stats.kept, 2u);
}

TEST_F(CompactorTest, EmptyLedgerGivesEmptyOutput) {
    auto r = compact(ledgerPath_, outPath_);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.stats.kept, 0u);
    EXPECT_TRUE(std::filesystem::exists(outPath_));
    EXPECT_TRUE(slurp(outPath_).empty());
}

TEST_F(CompactorTest, MersenneLedgerCompactsWithItsSchema) {
    auto append = [this](const Json::Value& payload, const std::string& job) {
        LedgerEvent e;
        e.kind = EventKind::Accepted;
        e.runId = "ll";
        e.jobId = job;
        e.payload = payload;
        e.hash = identityHash(checkMersenneResult(payload).identity);
        ledger_.append(e);
    };
    Json::Value rerun = mersenne(127);
    rerun["wall_time"] = 40.0;
    append(mersenne(127), "p127");
    append(mersenne(89), "p89");
    append(rerun, "p127-again");

    auto r = compact(ledgerPath_, outPath_, mersenneSchema());
    ASSERT_TRUE(r) << r.error;
    EXPECT_EQ(r.stats.kept, 2u);
    EXPECT_EQ(r.stats.droppedDuplicates, 1u);
    EXPECT_EQ(r.stats.skippedInvalid, 0u);

    auto out = lines(outPath_);
    ASSERT_EQ(out.size(), 2u);
    Json::Value first;
    ASSERT_TRUE(parseJson(out[0], first));
    EXPECT_EQ(first["payload"]["p"].asInt64(), 127);
    EXPECT_EQ(first["job_id"].asString(), "p127");

    // Read under the default schema every certificate is invalid
    auto asRoot = compact(ledgerPath_, outPath_);
    ASSERT_TRUE(asRoot);
    EXPECT_EQ(asRoot.stats.kept, 0u);
    EXPECT_EQ(asRoot.stats.skippedInvalid, 3u);
}

TEST(CompactorMissingLedger, Fails) {
    quietLogs();
    TempDir dir;
    auto r = compact(dir / "nope.jsonl", dir / "out.jsonl");
    EXPECT_FALSE(r);
    EXPECT_FALSE(std::filesystem::exists(dir / "out.jsonl"));
}
