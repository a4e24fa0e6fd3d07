/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/pipeline.hpp"
#include "rootledger/contract.hpp"
#include "rootledger/errors.hpp"
#include "rootledger/hasher.hpp"
#include "rootledger/logger.hpp"
#include <cmath>
#include <stdexcept>

namespace rootledger {

namespace {
std::string describe(const ValidationError& error) {
    std::string out = toString(error.reason);
    if (!error.field.empty()) {
        out += " " + error.field;
    }
    return out + ": " + error.message;
}

std::string originTag(const ResultOrigin& origin) {
    return "job=" + (origin.jobId.empty() ? std::string("-") : origin.jobId) +
           " worker=" + std::to_string(origin.workerId);
}
}

const char* toString(AcceptStatus status) noexcept {
    switch (status) {
        case AcceptStatus::Accepted: return "ACCEPTED";
        case AcceptStatus::Rejected: return "REJECTED";
    }
    return "UNKNOWN";
}

Json::Value sanitizeForLedger(const Json::Value& v) {
    switch (v.type()) {
        case Json::realValue: {
            double d = v.asDouble();
            if (std::isnan(d)) return Json::Value("NaN");
            if (std::isinf(d)) return Json::Value(d > 0 ? "Infinity" : "-Infinity");
            return v;
        }
        case Json::arrayValue: {
            Json::Value out(Json::arrayValue);
            for (const auto& item : v) {
                out.append(sanitizeForLedger(item));
            }
            return out;
        }
        case Json::objectValue: {
            Json::Value out(Json::objectValue);
            for (const auto& key : v.getMemberNames()) {
                out[key] = sanitizeForLedger(v[key]);
            }
            return out;
        }
        default:
            return v;
    }
}

AcceptancePipeline::AcceptancePipeline(Ledger& ledger, DedupSet& dedup, double epsRoot, std::string runId,
                                       ResultSchema schema)
    : ledger_(ledger), dedup_(dedup), epsRoot_(epsRoot), runId_(std::move(runId)), schema_(std::move(schema)) {
    if (!schema_.validate) {
        throw std::invalid_argument("result schema '" + schema_.name + "' has no validator");
    }
}

std::size_t AcceptancePipeline::dedupSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dedup_.size();
}

LedgerEvent AcceptancePipeline::makeEvent(EventKind kind, const ResultOrigin& origin) const {
    LedgerEvent event;
    event.kind = kind;
    event.runId = runId_;
    event.workerId = origin.workerId;
    event.jobId = origin.jobId;
    return event;
}

AcceptResult AcceptancePipeline::accept(const Json::Value& candidate, const ResultOrigin& origin) {
    std::lock_guard<std::mutex> lock(mutex_);

    GateCheck check = schema_.validate(candidate);
    if (!check) {
        return reject(RejectReason::SchemaInvalid, describe(check.error), candidate, "", origin);
    }

    CanonicalHash hash = identityHash(check.identity);

    if (schema_.tolerance) {
        if (auto why = schema_.tolerance(check.normalized, epsRoot_)) {
            return reject(RejectReason::OutOfTolerance, std::move(*why), candidate, hash, origin);
        }
    }

    if (dedup_.count(hash) > 0) {
        return reject(RejectReason::Duplicate, "already accepted: " + hash, candidate, hash, origin);
    }

    LedgerEvent event = makeEvent(EventKind::Accepted, origin);
    event.payload = std::move(check.normalized);
    event.hash = hash;
    Seq seq = ledger_.append(event);
    dedup_.insert(hash);

    LOG_DEBUG("ACCEPTED seq=" + std::to_string(seq) + " " + originTag(origin) + " " + hash);

    AcceptResult result;
    result.status = AcceptStatus::Accepted;
    result.hash = std::move(hash);
    result.seq = seq;
    return result;
}

AcceptResult AcceptancePipeline::acceptRaw(const std::string& text, const std::string& parseError,
                                           const ResultOrigin& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    return reject(RejectReason::SchemaInvalid, "unparseable JSON: " + parseError,
                  Json::Value(text), "", origin);
}

AcceptResult AcceptancePipeline::reject(RejectReason reason, std::string detail, const Json::Value& raw,
                                        CanonicalHash hash, const ResultOrigin& origin) {
    LedgerEvent event = makeEvent(EventKind::Rejected, origin);
    event.payload = sanitizeForLedger(raw);
    event.hash = hash;
    event.reason = reason;
    event.detail = detail;
    Seq seq = ledger_.append(event);

    LOG_DEBUG("REJECTED(" + std::string(toString(reason)) + "/" + toString(errorKind(reason)) + ") seq=" +
              std::to_string(seq) + " " + originTag(origin) + ": " + detail);

    AcceptResult result;
    result.status = AcceptStatus::Rejected;
    result.reason = reason;
    result.detail = std::move(detail);
    result.hash = std::move(hash);
    result.seq = seq;
    return result;
}

}
