/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/ledger.hpp"
#include "rootledger/errors.hpp"
#include "rootledger/hasher.hpp"
#include "rootledger/json.hpp"
#include "rootledger/logger.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace rootledger {

namespace {
// Returns false at end of input. torn is set when the final line has no '\n'.
bool readRawLine(std::istream& in, std::string& line, bool& torn) {
    torn = false;
    if (!std::getline(in, line)) {
        return false;
    }
    if (in.eof()) {
        torn = true;
    }
    return true;
}

// A final line with a missing or damaged terminator that still holds a whole
// record is a damaged acknowledged event, not a torn write. A torn write
// stops before the record's closing brace and never parses.
bool holdsCompleteRecord(const std::string& tail) {
    auto close = tail.rfind('}');
    if (close == std::string::npos) {
        return false;
    }
    Json::Value value;
    LedgerEvent event;
    return parseJson(tail.substr(0, close + 1), value) && eventFromJson(value, event);
}

[[noreturn]] void ioFailure(const std::string& what) {
    LOG_ERROR("Ledger I/O failure: " + what);
    throw OrchestratorError(ErrorKind::LedgerIo, what);
}
}

const char* toString(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Accepted: return "ACCEPTED";
        case EventKind::Rejected: return "REJECTED";
    }
    return "UNKNOWN";
}

const char* toString(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::SchemaInvalid:  return "SCHEMA_INVALID";
        case RejectReason::OutOfTolerance: return "OUT_OF_TOLERANCE";
        case RejectReason::Duplicate:      return "DUPLICATE";
    }
    return "UNKNOWN";
}

std::optional<EventKind> parseEventKind(const std::string& text) noexcept {
    if (text == "ACCEPTED") return EventKind::Accepted;
    if (text == "REJECTED") return EventKind::Rejected;
    return std::nullopt;
}

std::optional<RejectReason> parseRejectReason(const std::string& text) noexcept {
    if (text == "SCHEMA_INVALID") return RejectReason::SchemaInvalid;
    if (text == "OUT_OF_TOLERANCE") return RejectReason::OutOfTolerance;
    if (text == "DUPLICATE") return RejectReason::Duplicate;
    return std::nullopt;
}

ErrorKind errorKind(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::SchemaInvalid:  return ErrorKind::Validation;
        case RejectReason::OutOfTolerance: return ErrorKind::Tolerance;
        case RejectReason::Duplicate:      return ErrorKind::Duplicate;
    }
    return ErrorKind::Validation;
}

Json::Value eventContent(const LedgerEvent& event) {
    Json::Value v(Json::objectValue);
    v["seq"] = static_cast<Json::UInt64>(event.seq);
    v["kind"] = toString(event.kind);
    v["run_id"] = event.runId;
    v["worker_id"] = event.workerId;
    v["job_id"] = event.jobId;
    v["payload"] = event.payload;
    v["hash"] = event.hash;
    v["ts"] = event.ts;
    if (event.kind == EventKind::Rejected) {
        v["reason"] = event.reason ? toString(*event.reason) : "UNKNOWN";
        v["detail"] = event.detail;
    }
    return v;
}

Json::Value toJson(const LedgerEvent& event) {
    Json::Value v = eventContent(event);
    v["chain"] = event.chain;
    return v;
}

bool eventFromJson(const Json::Value& value, LedgerEvent& out, std::string* error) {
    auto bad = [error](const std::string& message) {
        if (error) *error = message;
        return false;
    };

    if (!value.isObject()) return bad("record is not an object");
    if (!value["seq"].isUInt64() || value["seq"].isBool()) return bad("missing or invalid 'seq'");
    if (!value["kind"].isString()) return bad("missing or invalid 'kind'");
    auto kind = parseEventKind(value["kind"].asString());
    if (!kind) return bad("unknown kind '" + value["kind"].asString() + "'");
    if (!value["run_id"].isString()) return bad("missing or invalid 'run_id'");
    if (!value["worker_id"].isInt() || value["worker_id"].isBool()) return bad("missing or invalid 'worker_id'");
    if (!value["job_id"].isString()) return bad("missing or invalid 'job_id'");
    if (!value.isMember("payload")) return bad("missing 'payload'");
    if (!value["hash"].isString()) return bad("missing or invalid 'hash'");
    if (!value["ts"].isString()) return bad("missing or invalid 'ts'");
    if (!value["chain"].isString()) return bad("missing or invalid 'chain'");

    LedgerEvent event;
    event.seq = value["seq"].asUInt64();
    event.kind = *kind;
    event.runId = value["run_id"].asString();
    event.workerId = value["worker_id"].asInt();
    event.jobId = value["job_id"].asString();
    event.payload = value["payload"];
    event.hash = value["hash"].asString();
    event.ts = value["ts"].asString();
    event.chain = value["chain"].asString();

    if (event.kind == EventKind::Rejected) {
        if (!value["reason"].isString()) return bad("REJECTED record without 'reason'");
        event.reason = parseRejectReason(value["reason"].asString());
        if (!event.reason) return bad("unknown reason '" + value["reason"].asString() + "'");
        event.detail = value.get("detail", "").asString();
    }

    out = std::move(event);
    return true;
}


LedgerReader::LedgerReader(std::filesystem::path path, ReadMode mode)
    : path_(std::move(path)), mode_(mode), in_(path_, std::ios::binary) {
}

bool LedgerReader::next(LedgerEvent& out) {
    if (!in_.is_open()) {
        return false;
    }

    std::string raw;
    bool torn = false;
    while (readRawLine(in_, raw, torn)) {
        ++line_;
        if (torn) {
            std::string where = path_.string() + ":" + std::to_string(line_);
            if (holdsCompleteRecord(raw)) {
                if (mode_ == ReadMode::Strict) {
                    throw OrchestratorError(ErrorKind::ChainMismatch,
                        "Unterminated complete record at " + where + " (possible corruption)");
                }
                ++malformed_;
                LOG_WARN("Skipping unterminated complete record at " + where);
                return false;
            }
            tornTail_ = true;
            LOG_WARN("Ignoring partial record at " + where);
            return false;
        }
        if (raw.empty()) {
            continue;
        }

        Json::Value value;
        std::string error;
        if (!parseJson(raw, value, &error) || !eventFromJson(value, out, &error)) {
            std::string where = path_.string() + ":" + std::to_string(line_);
            if (mode_ == ReadMode::Strict) {
                throw OrchestratorError(ErrorKind::ChainMismatch,
                    "Malformed ledger record at " + where + " (possible corruption): " + error);
            }
            ++malformed_;
            LOG_WARN("Skipping malformed ledger record at " + where + ": " + error);
            continue;
        }
        return true;
    }
    return false;
}

void LedgerReader::rewind() {
    in_.close();
    in_.clear();
    in_.open(path_, std::ios::binary);
    line_ = 0;
    malformed_ = 0;
    tornTail_ = false;
}


Ledger::Ledger(std::filesystem::path path) : path_(std::move(path)) {
}

void Ledger::open() {
    std::error_code ec;
    bool existed = std::filesystem::exists(path_, ec);
    if (ec) {
        ioFailure("cannot stat " + path_.string() + ": " + ec.message());
    }

    if (existed) {
        discardTornTail();

        LedgerReader reader(path_, ReadMode::Strict);
        LedgerEvent event;
        while (reader.next(event)) {
            lastSeq_ = event.seq;
            lastChain_ = event.chain;
        }
    }

    fd_ = FileDescriptor(::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!fd_.valid()) {
        ioFailure("cannot open " + path_.string() + ": " + errnoMessage(errno));
    }
    if (!existed && !fsyncDirectory(path_.parent_path())) {
        ioFailure("cannot fsync directory of " + path_.string() + ": " + errnoMessage(errno));
    }

    LOG_DEBUG("Ledger opened: " + path_.string() + " (last seq " + std::to_string(lastSeq_) + ")");
}

void Ledger::discardTornTail() {
    std::ifstream in(path_, std::ios::binary | std::ios::ate);
    if (!in) {
        ioFailure("cannot read " + path_.string());
    }
    const std::streamoff size = in.tellg();
    if (size <= 0) {
        return;
    }

    // Walk backwards to the last newline; everything after it is a torn write.
    constexpr std::streamoff kChunk = 4096;
    std::vector<char> buffer(static_cast<std::size_t>(kChunk));
    std::streamoff end = size;
    std::streamoff keep = 0;
    bool found = false;
    while (end > 0 && !found) {
        std::streamoff begin = end > kChunk ? end - kChunk : 0;
        in.seekg(begin);
        in.read(buffer.data(), end - begin);
        if (!in) {
            ioFailure("cannot read tail of " + path_.string());
        }
        for (std::streamoff i = end - begin; i > 0; --i) {
            if (buffer[static_cast<std::size_t>(i - 1)] == '\n') {
                keep = begin + i;
                found = true;
                break;
            }
        }
        end = begin;
    }

    if (keep == size) {
        return;
    }

    std::string tail(static_cast<std::size_t>(size - keep), '\0');
    in.clear();
    in.seekg(keep);
    in.read(&tail[0], size - keep);
    if (!in) {
        ioFailure("cannot read tail of " + path_.string());
    }
    if (holdsCompleteRecord(tail)) {
        throw OrchestratorError(ErrorKind::ChainMismatch,
            "final record of " + path_.string() + " is complete but unterminated; refusing to truncate it");
    }

    LOG_WARN("Discarding " + std::to_string(size - keep) + " byte partial record at end of " + path_.string());
    if (::truncate(path_.c_str(), static_cast<off_t>(keep)) != 0) {
        ioFailure("cannot truncate torn tail of " + path_.string() + ": " + errnoMessage(errno));
    }
    discardedTornTail_ = true;
}

Seq Ledger::append(LedgerEvent& event) {
    if (failed_) {
        throw OrchestratorError(ErrorKind::LedgerIo, "ledger is unusable after an earlier write failure");
    }
    if (!fd_.valid()) {
        throw OrchestratorError(ErrorKind::LedgerIo, "ledger is not open: " + path_.string());
    }

    event.seq = lastSeq_ + 1;
    if (event.ts.empty()) {
        event.ts = nowIso();
    }
    event.chain = chainDigest(lastChain_, canonicalJson(eventContent(event)));

    std::string line = canonicalJson(toJson(event));
    line.push_back('\n');

    if (!writeAll(fd_.get(), line.data(), line.size())) {
        failed_ = true;
        ioFailure("write failed for seq " + std::to_string(event.seq) + ": " + errnoMessage(errno));
    }
    if (::fsync(fd_.get()) != 0) {
        failed_ = true;
        ioFailure("fsync failed for seq " + std::to_string(event.seq) + ": " + errnoMessage(errno));
    }

    lastSeq_ = event.seq;
    lastChain_ = event.chain;
    LOG_TRACE("Ledger append seq " + std::to_string(event.seq) + " " + toString(event.kind));
    return event.seq;
}

LedgerReader Ledger::replay(ReadMode mode) const {
    return LedgerReader(path_, mode);
}

ChainReport Ledger::verifyChain(const std::filesystem::path& path) {
    ChainReport report;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            report.message = "ledger does not exist yet";
            return report;
        }
        report.ok = false;
        report.message = "cannot read " + path.string();
        return report;
    }

    std::string previous;
    Seq expectedSeq = 1;
    std::size_t lineNo = 0;
    std::string raw;
    bool torn = false;

    auto diverge = [&](const std::string& message) {
        report.ok = false;
        report.firstDivergence = lineNo;
        report.message = "line " + std::to_string(lineNo) + ": " + message;
        report.lastDigest = previous;
        return report;
    };

    while (readRawLine(in, raw, torn)) {
        ++lineNo;
        if (torn) {
            if (holdsCompleteRecord(raw)) {
                return diverge("complete record without line terminator");
            }
            report.tornTail = true;
            break;
        }

        Json::Value value;
        std::string error;
        if (!parseJson(raw, value, &error)) {
            return diverge("unparseable record: " + error);
        }
        LedgerEvent event;
        if (!eventFromJson(value, event, &error)) {
            return diverge("invalid record: " + error);
        }
        if (canonicalJson(value) != raw) {
            return diverge("record is not in canonical form");
        }
        if (event.seq != expectedSeq) {
            return diverge("expected seq " + std::to_string(expectedSeq) + ", found " + std::to_string(event.seq));
        }

        Json::Value content = value;
        content.removeMember("chain");
        std::string recomputed = chainDigest(previous, canonicalJson(content));
        if (recomputed != event.chain) {
            return diverge("chain digest mismatch (stored " + event.chain + ", recomputed " + recomputed + ")");
        }

        previous = std::move(recomputed);
        ++expectedSeq;
        ++report.events;
    }

    report.lastDigest = previous;
    report.message = "chain intact over " + std::to_string(report.events) + " event(s)";
    if (report.tornTail) {
        report.message += "; partial final record ignored";
    }
    return report;
}

}
