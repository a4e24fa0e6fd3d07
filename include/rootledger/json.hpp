/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include <json/json.h>

namespace rootledger {

// Compact, sorted-key, single-line serialization. Doubles use 17 significant
// digits so parse(canonicalJson(v)) re-serializes to the same bytes.
[[nodiscard]] std::string canonicalJson(const Json::Value& value);

// Indented form for human-facing documents (state file, CLI output).
[[nodiscard]] std::string prettyJson(const Json::Value& value);

// Strict parse: no comments, no duplicate keys, no trailing content,
// no NaN/Infinity literals.
[[nodiscard]] bool parseJson(const std::string& text, Json::Value& out, std::string* error = nullptr);

}
