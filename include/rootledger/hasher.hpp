/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include <json/json.h>

#include "rootledger/contract.hpp"
#include "rootledger/types.hpp"

namespace rootledger {

constexpr const char* kHashPrefix = "sha256:";

// Lowercase hex SHA-256 of raw bytes.
[[nodiscard]] std::string sha256Hex(const std::string& data);

// The identity-bearing subset of a result: {"root_val", "t"}. Meta is volatile
// (method, iteration counts, timings) and never participates.
[[nodiscard]] Json::Value canonicalize(const ResultPayload& payload);

[[nodiscard]] CanonicalHash canonicalHash(const ResultPayload& payload);

// Hash of any identity document, "sha256:" + sha256(canonicalJson(identity)).
[[nodiscard]] CanonicalHash identityHash(const Json::Value& identity);

// Ledger chain link: sha256(previous chain digest || serialized event content).
// previous is empty for the first event.
[[nodiscard]] std::string chainDigest(const std::string& previous, const std::string& content);

}
