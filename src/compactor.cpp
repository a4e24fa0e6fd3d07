/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/compactor.hpp"
#include "rootledger/fsutil.hpp"
#include "rootledger/hasher.hpp"
#include "rootledger/json.hpp"
#include "rootledger/ledger.hpp"
#include "rootledger/logger.hpp"
#include <unordered_set>

namespace rootledger {

namespace {
bool samePath(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    if (std::filesystem::exists(a, ec) && std::filesystem::exists(b, ec)) {
        bool same = std::filesystem::equivalent(a, b, ec);
        if (!ec) return same;
    }
    auto ca = std::filesystem::weakly_canonical(a, ec);
    if (ec) return a.lexically_normal() == b.lexically_normal();
    auto cb = std::filesystem::weakly_canonical(b, ec);
    if (ec) return a.lexically_normal() == b.lexically_normal();
    return ca == cb;
}
}

CompactResult compact(const std::filesystem::path& ledgerPath, const std::filesystem::path& outputPath,
                      const ResultSchema& schema) {
    CompactResult result;

    if (!schema.validate) {
        result.error = "result schema '" + schema.name + "' has no validator";
        LOG_ERROR("Compact refused: " + result.error);
        return result;
    }
    if (samePath(ledgerPath, outputPath)) {
        result.error = "output path must differ from the ledger: " + outputPath.string();
        LOG_ERROR("Compact refused: " + result.error);
        return result;
    }
    std::error_code ec;
    if (!std::filesystem::exists(ledgerPath, ec)) {
        result.error = "ledger not found: " + ledgerPath.string();
        LOG_ERROR("Compact failed: " + result.error);
        return result;
    }

    CompactStats& stats = result.stats;
    std::unordered_set<CanonicalHash> seen;
    std::string out;

    LedgerReader reader(ledgerPath, ReadMode::Lenient);
    LedgerEvent event;
    while (reader.next(event)) {
        ++stats.read;
        if (event.kind != EventKind::Accepted) {
            ++stats.skippedRejected;
            continue;
        }

        GateCheck check = schema.validate(event.payload);
        if (!check) {
            ++stats.skippedInvalid;
            LOG_WARN("Compact: seq " + std::to_string(event.seq) + " has an invalid payload: " +
                     check.error.message);
            continue;
        }

        CanonicalHash hash = identityHash(check.identity);
        if (hash != event.hash) {
            LOG_WARN("Compact: seq " + std::to_string(event.seq) + " stored hash differs from recomputed");
        }
        if (!seen.insert(hash).second) {
            ++stats.droppedDuplicates;
            continue;
        }

        Json::Value line(Json::objectValue);
        line["hash"] = hash;
        line["job_id"] = event.jobId;
        line["payload"] = check.normalized;
        line["seq"] = static_cast<Json::UInt64>(event.seq);
        out += canonicalJson(line);
        out += '\n';
        ++stats.kept;
    }
    stats.malformed = reader.malformed();
    stats.tornTail = reader.tornTail();

    if (!outputPath.parent_path().empty()) {
        std::filesystem::create_directories(outputPath.parent_path(), ec);
    }
    std::string error;
    if (!writeFileAtomic(outputPath, out, &error)) {
        result.error = "cannot write " + outputPath.string() + ": " + error;
        LOG_ERROR("Compact failed: " + result.error);
        return result;
    }

    LOG_INFO("Compacted " + std::to_string(stats.read) + " event(s) into " + std::to_string(stats.kept) +
             " line(s): " + outputPath.string());
    result.ok = true;
    return result;
}

}
