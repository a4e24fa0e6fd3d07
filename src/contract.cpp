/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/contract.hpp"
#include <cctype>
#include <cmath>

namespace rootledger {

namespace {
ValidationError fail(ValidationReason reason, std::string field, std::string message) {
    return ValidationError{reason, std::move(field), std::move(message)};
}

// Booleans are not numbers even though JSON parsers sometimes coerce them.
bool isJsonNumber(const Json::Value& v) {
    return !v.isBool() && v.isDouble();
}

bool readFiniteNumber(const Json::Value& parent, const char* key, double& out, ValidationError& error) {
    if (!parent.isMember(key)) {
        error = fail(ValidationReason::MissingField, key, std::string("missing required field '") + key + "'");
        return false;
    }
    const Json::Value& v = parent[key];
    if (!isJsonNumber(v)) {
        error = fail(ValidationReason::TypeMismatch, key, std::string("field '") + key + "' must be a number");
        return false;
    }
    out = v.asDouble();
    if (!std::isfinite(out)) {
        error = fail(ValidationReason::OutOfRange, key, std::string("field '") + key + "' must be finite");
        return false;
    }
    return true;
}
}

const char* toString(ValidationReason reason) noexcept {
    switch (reason) {
        case ValidationReason::MissingField: return "MISSING_FIELD";
        case ValidationReason::TypeMismatch: return "TYPE_MISMATCH";
        case ValidationReason::OutOfRange:   return "OUT_OF_RANGE";
    }
    return "UNKNOWN";
}

bool isValidJobId(const std::string& id) noexcept {
    if (id.empty() || id.size() > kMaxJobIdLength) {
        return false;
    }
    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || std::isspace(uc) || std::iscntrl(uc)) {
            return false;
        }
    }
    return id != "." && id != "..";
}

JobValidation validateJob(const Json::Value& value) {
    JobValidation result;
    if (!value.isObject()) {
        result.error = fail(ValidationReason::TypeMismatch, "", "job must be a JSON object");
        return result;
    }
    if (!value.isMember("id")) {
        result.error = fail(ValidationReason::MissingField, "id", "missing required field 'id'");
        return result;
    }
    if (!value["id"].isString()) {
        result.error = fail(ValidationReason::TypeMismatch, "id", "field 'id' must be a string");
        return result;
    }
    std::string id = value["id"].asString();
    if (!isValidJobId(id)) {
        result.error = fail(ValidationReason::OutOfRange, "id",
            "job id must be 1-" + std::to_string(kMaxJobIdLength) + " characters without separators or whitespace");
        return result;
    }

    std::string createdAt;
    if (value.isMember("created_at")) {
        if (!value["created_at"].isString()) {
            result.error = fail(ValidationReason::TypeMismatch, "created_at", "field 'created_at' must be a string");
            return result;
        }
        createdAt = value["created_at"].asString();
    }

    result.ok = true;
    result.job.id = std::move(id);
    result.job.payload = value.get("payload", Json::Value());
    result.job.status = JobStatus::Pending;
    result.job.createdAt = createdAt.empty() ? nowIso() : createdAt;
    return result;
}

ResultValidation validateResult(const Json::Value& payload) {
    ResultValidation result;
    if (!payload.isObject()) {
        result.error = fail(ValidationReason::TypeMismatch, "", "result payload must be a JSON object");
        return result;
    }

    ResultPayload out;
    if (!readFiniteNumber(payload, "t", out.t, result.error)) return result;
    if (!readFiniteNumber(payload, "root_val", out.rootVal, result.error)) return result;

    if (!payload.isMember("meta")) {
        result.error = fail(ValidationReason::MissingField, "meta", "missing required field 'meta'");
        return result;
    }
    const Json::Value& meta = payload["meta"];
    if (!meta.isObject()) {
        result.error = fail(ValidationReason::TypeMismatch, "meta", "field 'meta' must be an object");
        return result;
    }

    if (!meta.isMember("method")) {
        result.error = fail(ValidationReason::MissingField, "meta.method", "missing required field 'meta.method'");
        return result;
    }
    if (!meta["method"].isString()) {
        result.error = fail(ValidationReason::TypeMismatch, "meta.method", "field 'meta.method' must be a string");
        return result;
    }

    if (!meta.isMember("iters")) {
        result.error = fail(ValidationReason::MissingField, "meta.iters", "missing required field 'meta.iters'");
        return result;
    }
    const Json::Value& iters = meta["iters"];
    if (!isJsonNumber(iters) || !iters.isIntegral() || !iters.isInt64()) {
        result.error = fail(ValidationReason::TypeMismatch, "meta.iters", "field 'meta.iters' must be an integer");
        return result;
    }
    if (iters.asInt64() < 0) {
        result.error = fail(ValidationReason::OutOfRange, "meta.iters", "field 'meta.iters' must not be negative");
        return result;
    }

    out.meta.method = meta["method"].asString();
    out.meta.iters = iters.asInt64();
    for (const auto& key : meta.getMemberNames()) {
        if (key != "method" && key != "iters") {
            out.meta.extra[key] = meta[key];
        }
    }

    result.ok = true;
    result.payload = std::move(out);
    return result;
}

Json::Value toJson(const ResultPayload& payload) {
    Json::Value meta = payload.meta.extra.isObject() ? payload.meta.extra : Json::Value(Json::objectValue);
    meta["method"] = payload.meta.method;
    meta["iters"] = static_cast<Json::Int64>(payload.meta.iters);

    Json::Value out(Json::objectValue);
    out["t"] = payload.t;
    out["root_val"] = payload.rootVal;
    out["meta"] = std::move(meta);
    return out;
}

}
