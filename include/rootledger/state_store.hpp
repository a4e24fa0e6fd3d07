/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>

#include "rootledger/contract.hpp"
#include "rootledger/types.hpp"

namespace rootledger {

// Snapshot of job statuses and result counters. A cache for fast restart;
// the ledger wins whenever the two disagree.
struct OrchestratorState {
    std::string runId;
    std::vector<Job> jobs;                         // registration order, FIFO dispatch order
    std::uint64_t accepted = 0;
    std::uint64_t rejected = 0;
    std::map<std::string, std::uint64_t> rejectedByReason;
    Seq lastSeq = 0;

    [[nodiscard]] Job* find(const JobId& id) noexcept;
    [[nodiscard]] const Job* find(const JobId& id) const noexcept;
    Job& add(Job job);
    void reindex();

    [[nodiscard]] std::size_t count(JobStatus status) const noexcept;

    bool operator==(const OrchestratorState& other) const;
    bool operator!=(const OrchestratorState& other) const { return !(*this == other); }

private:
    std::unordered_map<JobId, std::size_t> index_;
};

[[nodiscard]] Json::Value toJson(const Job& job);
[[nodiscard]] bool jobFromJson(const Json::Value& value, Job& out, std::string* error = nullptr);

[[nodiscard]] Json::Value toJson(const OrchestratorState& state);
[[nodiscard]] bool stateFromJson(const Json::Value& value, OrchestratorState& out, std::string* error = nullptr);

class StateStore final {
public:
    explicit StateStore(std::filesystem::path path) noexcept;

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;
    StateStore(StateStore&&) noexcept = default;
    StateStore& operator=(StateStore&&) noexcept = default;

    // Missing, unreadable or corrupt files yield a default state; recovery
    // rebuilds what matters from the ledger.
    [[nodiscard]] OrchestratorState load() const;

    // Atomic replace. On failure the previous file is left intact.
    [[nodiscard]] bool save(const OrchestratorState& state) const noexcept;

    // Audit snapshot checkpoints/checkpoint_seq_<lastSeq>.json beside the state
    // file: {seq, run_id, accepted, rejected, done, failed, ts}. Never read back.
    [[nodiscard]] bool saveCheckpoint(const OrchestratorState& state) const noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path checkpointDir() const { return path_.parent_path() / "checkpoints"; }
    [[nodiscard]] std::filesystem::path checkpointPath(Seq seq) const;

private:
    std::filesystem::path path_;
};

}
