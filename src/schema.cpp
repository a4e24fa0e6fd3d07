/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/schema.hpp"
#include "rootledger/hasher.hpp"
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <sstream>

namespace rootledger {

namespace {
constexpr std::size_t kResidueHashLength = 64;

std::string formatDouble(double value) {
    std::ostringstream ss;
    ss.precision(17);
    ss << value;
    return ss.str();
}

GateCheck failed(ValidationReason reason, const std::string& field, const std::string& message) {
    GateCheck check;
    check.error = ValidationError{reason, field, message};
    return check;
}

GateCheck missingOrMistyped(const Json::Value& payload, const char* field, const char* expected) {
    if (!payload.isMember(field)) {
        return failed(ValidationReason::MissingField, field, std::string("missing required field '") + field + "'");
    }
    return failed(ValidationReason::TypeMismatch, field, std::string("field '") + field + "' must be " + expected);
}

bool isFiniteNonNegative(const Json::Value& v) {
    return !v.isBool() && v.isDouble() && std::isfinite(v.asDouble()) && v.asDouble() >= 0.0;
}

bool isLowerHex(const std::string& text) {
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}
}

GateCheck checkRootResult(const Json::Value& candidate) {
    GateCheck check;
    auto validation = validateResult(candidate);
    if (!validation) {
        check.error = validation.error;
        return check;
    }
    check.ok = true;
    check.normalized = toJson(validation.payload);
    check.identity = canonicalize(validation.payload);
    return check;
}

GateCheck checkMersenneResult(const Json::Value& candidate) {
    if (!candidate.isObject()) {
        return failed(ValidationReason::TypeMismatch, "", "result payload must be a JSON object");
    }

    const Json::Value& p = candidate["p"];
    if (p.isBool() || !p.isIntegral() || !p.isInt64()) {
        return missingOrMistyped(candidate, "p", "an integer");
    }
    if (p.asInt64() < 2) {
        return failed(ValidationReason::OutOfRange, "p", "field 'p' must be at least 2");
    }

    const Json::Value& residue = candidate["residue_hash"];
    if (!residue.isString()) {
        return missingOrMistyped(candidate, "residue_hash", "a string");
    }
    if (residue.asString().size() != kResidueHashLength || !isLowerHex(residue.asString())) {
        return failed(ValidationReason::OutOfRange, "residue_hash",
                      "field 'residue_hash' must be 64 lowercase hex characters");
    }

    for (const char* field : {"roundoff_max", "wall_time"}) {
        const Json::Value& v = candidate[field];
        if (v.isBool() || !v.isDouble()) {
            return missingOrMistyped(candidate, field, "a number");
        }
        if (!isFiniteNonNegative(v)) {
            return failed(ValidationReason::OutOfRange, field,
                          std::string("field '") + field + "' must be finite and not negative");
        }
    }

    if (!candidate["engine_version"].isString()) {
        return missingOrMistyped(candidate, "engine_version", "a string");
    }
    if (!candidate["is_prime"].isBool()) {
        return missingOrMistyped(candidate, "is_prime", "a boolean");
    }
    if (!candidate["meta"].isObject()) {
        return missingOrMistyped(candidate, "meta", "an object");
    }

    GateCheck check;
    check.ok = true;
    check.normalized = Json::Value(Json::objectValue);
    check.normalized["p"] = static_cast<Json::Int64>(p.asInt64());
    check.normalized["residue_hash"] = residue.asString();
    check.normalized["roundoff_max"] = candidate["roundoff_max"].asDouble();
    check.normalized["engine_version"] = candidate["engine_version"].asString();
    check.normalized["wall_time"] = candidate["wall_time"].asDouble();
    check.normalized["is_prime"] = candidate["is_prime"].asBool();
    check.normalized["meta"] = candidate["meta"];

    check.identity = Json::Value(Json::objectValue);
    check.identity["p"] = static_cast<Json::Int64>(p.asInt64());
    check.identity["residue_hash"] = residue.asString();
    return check;
}

ResultSchema rootSchema() {
    ResultSchema schema;
    schema.name = "root";
    schema.validate = checkRootResult;
    schema.tolerance = [](const Json::Value& normalized, double eps) -> std::optional<std::string> {
        double magnitude = std::fabs(normalized["root_val"].asDouble());
        if (magnitude < eps) {
            return std::nullopt;
        }
        return "|root_val| = " + formatDouble(magnitude) + " >= eps_root " + formatDouble(eps);
    };
    return schema;
}

ResultSchema mersenneSchema() {
    ResultSchema schema;
    schema.name = "mersenne-v1";
    schema.validate = checkMersenneResult;
    return schema;
}

std::optional<ResultSchema> schemaByName(const std::string& name) {
    if (name == "root") return rootSchema();
    if (name == "mersenne-v1") return mersenneSchema();
    return std::nullopt;
}

}
