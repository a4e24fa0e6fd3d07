/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace rootledger {

struct Config {
    std::filesystem::path runDir = "run";
    std::string runId = "default";

    double epsRoot = 1e-10;
    std::string schema = "root";   // see schemaByName()
    int workers = 4;
    std::size_t maxInFlight = 8;
    std::size_t checkpointEvery = 200;
    int maxAttempts = 1;

    std::chrono::milliseconds inboxScanInterval{500};
    std::chrono::milliseconds pollInterval{100};
    bool exitWhenIdle = true;

    [[nodiscard]] std::filesystem::path ledgerPath() const { return runDir / "ledger.jsonl"; }
    [[nodiscard]] std::filesystem::path statePath() const { return runDir / "state.json"; }
    [[nodiscard]] std::filesystem::path lockPath() const { return runDir / "orchestrator.lock"; }
    [[nodiscard]] std::filesystem::path inboxPath() const { return runDir / "inbox"; }
    [[nodiscard]] std::filesystem::path mergedPath() const { return runDir / "merged_clean.jsonl"; }
    [[nodiscard]] std::filesystem::path logPath() const { return runDir / "orchestrator.log"; }
    [[nodiscard]] std::filesystem::path checkpointDir() const { return runDir / "checkpoints"; }

    // Defaults overlaid with ROOTLEDGER_* environment variables. Invalid values keep the default.
    [[nodiscard]] static Config fromEnv(const std::filesystem::path& runDir);
};

}
