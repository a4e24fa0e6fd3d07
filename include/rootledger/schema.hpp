/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <optional>
#include <string>

#include <json/json.h>

#include "rootledger/contract.hpp"

namespace rootledger {

// What the schema gate makes of one candidate.
struct GateCheck {
    bool ok = false;
    Json::Value normalized;   // recorded in the ledger on acceptance
    Json::Value identity;     // hashed for dedup; equal identities are duplicates
    ValidationError error;

    explicit operator bool() const noexcept { return ok; }
};

using PayloadValidator = std::function<GateCheck(const Json::Value& candidate)>;

// Returns why a normalized payload is out of tolerance, nullopt when it is within.
using ToleranceChecker = std::function<std::optional<std::string>(const Json::Value& normalized, double eps)>;

// The first two gates of the acceptance pipeline. An empty tolerance checker
// means the schema has no tolerance gate.
struct ResultSchema {
    std::string name;
    PayloadValidator validate;
    ToleranceChecker tolerance;
};

// {"t", "root_val", "meta": {"method", "iters"}}, tolerance |root_val| < eps,
// identity {"root_val", "t"}.
[[nodiscard]] ResultSchema rootSchema();

// Lucas-Lehmer certification: {"p", "residue_hash", "roundoff_max",
// "engine_version", "wall_time", "is_prime", "meta"}, identity
// {"p", "residue_hash"}, no tolerance gate.
[[nodiscard]] ResultSchema mersenneSchema();

// "root" or "mersenne-v1".
[[nodiscard]] std::optional<ResultSchema> schemaByName(const std::string& name);

[[nodiscard]] GateCheck checkRootResult(const Json::Value& candidate);
[[nodiscard]] GateCheck checkMersenneResult(const Json::Value& candidate);

}
