/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include "rootledger/schema.hpp"

namespace rootledger {

struct CompactStats {
    std::size_t read = 0;
    std::size_t kept = 0;
    std::size_t droppedDuplicates = 0;
    std::size_t skippedRejected = 0;
    std::size_t skippedInvalid = 0;
    std::size_t malformed = 0;
    bool tornTail = false;
};

struct CompactResult {
    bool ok = false;
    CompactStats stats;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Offline merge: one canonical line {"hash","job_id","payload","seq"} per
// distinct accepted result, first occurrence wins, ledger order. Reads the
// ledger only; the output is replaced atomically. Payloads are re-validated
// and re-hashed with the schema the run was reduced under.
[[nodiscard]] CompactResult compact(const std::filesystem::path& ledgerPath,
                                    const std::filesystem::path& outputPath,
                                    const ResultSchema& schema = rootSchema());

}
