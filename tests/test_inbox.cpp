/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "rootledger/inbox.hpp"
#include "rootledger/json.hpp"
#include "test_support.hpp"

using namespace rootledger;
using namespace rootledger::test;

class InboxTest : public ::testing::Test {
protected:
    void SetUp() override { quietLogs(); }

    TempDir dir_;
    Inbox inbox_{dir_ / "inbox"};
};

TEST_F(InboxTest, CreatesLayout) {
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "inbox" / "writing"));
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "inbox" / "ready"));
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "inbox" / "consumed"));
    EXPECT_EQ(inbox_.readyCount(), 0u);
}

TEST_F(InboxTest, SubmitPublishesToReady) {
    auto r = inbox_.submit(std::string(R"({"t":1.0,"root_val":0.0,"meta":{"method":"m","iters":1}})"));
    ASSERT_TRUE(r) << r.message;
    EXPECT_FALSE(r.id.empty());
    EXPECT_TRUE(std::filesystem::exists(dir_ / "inbox" / "ready" / (r.id + ".json")));
    EXPECT_TRUE(std::filesystem::is_empty(dir_ / "inbox" / "writing"));
    EXPECT_EQ(inbox_.readyCount(), 1u);
}

TEST_F(InboxTest, CollectReturnsArrivalOrder) {
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        auto r = inbox_.submit("entry-" + std::to_string(i));
        ASSERT_TRUE(r);
        ids.push_back(r.id);
    }

    auto entries = inbox_.collect(3);
    ASSERT_EQ(entries.size(), 3u);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].id, ids[i]);
        EXPECT_EQ(entries[i].content, "entry-" + std::to_string(i));
    }
    EXPECT_EQ(inbox_.collect(100).size(), 5u);
}

TEST_F(InboxTest, ConsumeMovesEntryOut) {
    ASSERT_TRUE(inbox_.submit(std::string("one")));
    ASSERT_TRUE(inbox_.submit(std::string("two")));

    auto entries = inbox_.collect(10);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(inbox_.consume(entries[0]));
    EXPECT_EQ(inbox_.readyCount(), 1u);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "inbox" / "consumed" / entries[0].path.filename()));

    auto left = inbox_.collect(10);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].content, "two");

    // Already gone
    EXPECT_FALSE(inbox_.consume(entries[0]));
}

TEST_F(InboxTest, RejectsEmptyAndOversized) {
    auto empty = inbox_.submit(std::string());
    EXPECT_FALSE(empty);
    EXPECT_EQ(empty.error, InboxError::InvalidContent);

    inbox_.setMaxSize(16);
    auto big = inbox_.submit(std::string(17, 'x'));
    EXPECT_FALSE(big);
    EXPECT_EQ(big.error, InboxError::InvalidSize);
    EXPECT_TRUE(inbox_.submit(std::string(16, 'x')));
    EXPECT_EQ(inbox_.readyCount(), 1u);
}

TEST_F(InboxTest, EnvelopeSubmitRoundTripsOrigin) {
    auto r = inbox_.submit(result(4.0, 1e-13), 3, "chunk_1_2");
    ASSERT_TRUE(r);

    auto entries = inbox_.collect(1);
    ASSERT_EQ(entries.size(), 1u);
    auto msg = decodeInboxMessage(entries[0].content);
    ASSERT_TRUE(msg.parsed);
    EXPECT_EQ(msg.origin.workerId, 3);
    EXPECT_EQ(msg.origin.jobId, "chunk_1_2");
    EXPECT_DOUBLE_EQ(msg.payload["t"].asDouble(), 4.0);
    EXPECT_EQ(msg.payload["root_val"].asDouble(), 1e-13);
    EXPECT_EQ(msg.payload["meta"]["method"].asString(), "newton");

    EXPECT_FALSE(inbox_.submit(result(4.0, 0.0), 0, "bad id with spaces"));
}

TEST_F(InboxTest, MissingRootWithoutCreate) {
    Inbox absent(dir_ / "elsewhere", false);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "elsewhere"));
    EXPECT_EQ(absent.readyCount(), 0u);
    EXPECT_TRUE(absent.collect(10).empty());
}

TEST(InboxDecodeTest, BarePayload) {
    auto msg = decodeInboxMessage(R"({"t":2.5,"root_val":1e-12,"meta":{"method":"m","iters":3}})");
    ASSERT_TRUE(msg.parsed);
    EXPECT_EQ(msg.origin.workerId, -1);
    EXPECT_TRUE(msg.origin.jobId.empty());
    EXPECT_DOUBLE_EQ(msg.payload["t"].asDouble(), 2.5);
}

TEST(InboxDecodeTest, EnvelopeWithBadOriginKeepsPayload) {
    auto msg = decodeInboxMessage(R"({"worker_id":"seven","job_id":42,"payload":{"t":1}})");
    ASSERT_TRUE(msg.parsed);
    EXPECT_EQ(msg.origin.workerId, -1);
    EXPECT_TRUE(msg.origin.jobId.empty());
    EXPECT_TRUE(msg.payload.isObject());
}

TEST(InboxDecodeTest, NotJson) {
    auto msg = decodeInboxMessage("{\"t\": 1,");
    EXPECT_FALSE(msg.parsed);
    EXPECT_FALSE(msg.error.empty());
}
