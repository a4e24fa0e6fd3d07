/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/errors.hpp"

namespace rootledger {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:    return "VALIDATION";
        case ErrorKind::Tolerance:     return "TOLERANCE";
        case ErrorKind::Duplicate:     return "DUPLICATE";
        case ErrorKind::LockConflict:  return "LOCK_CONFLICT";
        case ErrorKind::LedgerIo:      return "LEDGER_IO";
        case ErrorKind::ChainMismatch: return "CHAIN_MISMATCH";
        case ErrorKind::StateIo:       return "STATE_IO";
    }
    return "UNKNOWN";
}

}
