/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rootledger {

// Validation, Tolerance and Duplicate are per-result outcomes and never fatal.
// LockConflict and LedgerIo stop the orchestrator.
enum class ErrorKind : uint8_t {
    Validation,
    Tolerance,
    Duplicate,
    LockConflict,
    LedgerIo,
    ChainMismatch,
    StateIo
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

class OrchestratorError : public std::runtime_error {
public:
    OrchestratorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}
