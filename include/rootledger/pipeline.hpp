/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include <json/json.h>

#include "rootledger/ledger.hpp"
#include "rootledger/schema.hpp"
#include "rootledger/types.hpp"

namespace rootledger {

// Every canonical hash ever ACCEPTED. Rebuilt from the ledger by recovery.
using DedupSet = std::unordered_set<CanonicalHash>;

// Who produced a candidate.
struct ResultOrigin {
    int workerId = -1;
    JobId jobId;
};

enum class AcceptStatus : uint8_t { Accepted, Rejected };

[[nodiscard]] const char* toString(AcceptStatus status) noexcept;

struct AcceptResult {
    AcceptStatus status = AcceptStatus::Rejected;
    std::optional<RejectReason> reason;
    std::string detail;
    CanonicalHash hash;
    Seq seq = 0;                 // ledger position of the recorded event

    [[nodiscard]] bool accepted() const noexcept { return status == AcceptStatus::Accepted; }
    explicit operator bool() const noexcept { return accepted(); }
};

// The validate -> tolerance -> dedup gate. Every decision, accept or reject,
// is appended to the ledger before accept() returns. Calls are serialized.
// The schema supplies the first two gates; throws std::invalid_argument if it
// has no validator.
class AcceptancePipeline final {
public:
    AcceptancePipeline(Ledger& ledger, DedupSet& dedup, double epsRoot, std::string runId,
                       ResultSchema schema = rootSchema());

    AcceptancePipeline(const AcceptancePipeline&) = delete;
    AcceptancePipeline& operator=(const AcceptancePipeline&) = delete;

    // Throws OrchestratorError(LedgerIo) if the decision cannot be recorded.
    AcceptResult accept(const Json::Value& candidate, const ResultOrigin& origin);

    // For input that never made it to a JSON value. Always SCHEMA_INVALID.
    AcceptResult acceptRaw(const std::string& text, const std::string& parseError,
                           const ResultOrigin& origin);

    [[nodiscard]] double epsRoot() const noexcept { return epsRoot_; }
    [[nodiscard]] std::size_t dedupSize() const;
    [[nodiscard]] const std::string& schemaName() const noexcept { return schema_.name; }

private:
    AcceptResult reject(RejectReason reason, std::string detail, const Json::Value& raw,
                        CanonicalHash hash, const ResultOrigin& origin);
    LedgerEvent makeEvent(EventKind kind, const ResultOrigin& origin) const;

    Ledger& ledger_;
    DedupSet& dedup_;
    const double epsRoot_;
    const std::string runId_;
    const ResultSchema schema_;
    mutable std::mutex mutex_;
};

// Copy of v with NaN and infinities replaced by strings, so the value can be
// written as strict JSON.
[[nodiscard]] Json::Value sanitizeForLedger(const Json::Value& v);

}
