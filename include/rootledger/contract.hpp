/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include <json/json.h>

#include "rootledger/types.hpp"

namespace rootledger {

enum class ValidationReason : uint8_t {
    MissingField,
    TypeMismatch,
    OutOfRange
};

[[nodiscard]] const char* toString(ValidationReason reason) noexcept;

struct ValidationError {
    ValidationReason reason = ValidationReason::MissingField;
    std::string field;     // dotted path, e.g. "meta.iters"
    std::string message;
};

struct Job {
    JobId id;
    Json::Value payload;   // opaque to the core, interpreted by workers
    JobStatus status = JobStatus::Pending;
    std::string createdAt;
    int attempts = 0;
    std::string lastError;
};

struct ResultMeta {
    std::string method;
    std::int64_t iters = 0;
    Json::Value extra{Json::objectValue};   // any further meta keys, kept verbatim
};

struct ResultPayload {
    double t = 0.0;
    double rootVal = 0.0;
    ResultMeta meta;
};

struct JobValidation {
    bool ok = false;
    Job job;
    ValidationError error;
    explicit operator bool() const noexcept { return ok; }
};

struct ResultValidation {
    bool ok = false;
    ResultPayload payload;
    ValidationError error;
    explicit operator bool() const noexcept { return ok; }
};

constexpr std::size_t kMaxJobIdLength = 128;

// {"id": string, "payload": any?, "created_at": string?}. The returned job is PENDING.
[[nodiscard]] JobValidation validateJob(const Json::Value& value);

// {"t": number, "root_val": number, "meta": {"method": string, "iters": integer, ...}}
[[nodiscard]] ResultValidation validateResult(const Json::Value& payload);

[[nodiscard]] bool isValidJobId(const std::string& id) noexcept;

[[nodiscard]] Json::Value toJson(const ResultPayload& payload);

}
