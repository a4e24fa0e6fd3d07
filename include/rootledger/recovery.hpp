/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include "rootledger/pipeline.hpp"
#include "rootledger/state_store.hpp"

namespace rootledger {

struct RecoveryResult {
    OrchestratorState state;
    DedupSet dedup;
    std::size_t events = 0;
    std::size_t acceptedEvents = 0;
    std::size_t rejectedEvents = 0;
    std::size_t revertedDone = 0;     // cached DONE without ledger evidence
    std::size_t staleRunning = 0;     // RUNNING jobs carried over from a previous run
    bool tornTail = false;
    bool rewritten = false;           // state file replaced with the ledger-derived view
};

// Full ledger replay reconciled against the cached state. The ledger wins on
// every disagreement. Running it twice on the same inputs yields the same
// state and dedup set. Throws OrchestratorError(ChainMismatch) if a complete
// ledger line cannot be parsed. An empty runId keeps the cached one.
[[nodiscard]] RecoveryResult recover(const std::filesystem::path& ledgerPath, const StateStore& store,
                                     const std::string& runId);

}
