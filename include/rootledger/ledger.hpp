/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <json/json.h>

#include "rootledger/errors.hpp"
#include "rootledger/fsutil.hpp"
#include "rootledger/types.hpp"

namespace rootledger {

enum class EventKind : uint8_t { Accepted, Rejected };

enum class RejectReason : uint8_t {
    SchemaInvalid,
    OutOfTolerance,
    Duplicate
};

[[nodiscard]] const char* toString(EventKind kind) noexcept;
[[nodiscard]] const char* toString(RejectReason reason) noexcept;
[[nodiscard]] std::optional<EventKind> parseEventKind(const std::string& text) noexcept;
[[nodiscard]] std::optional<RejectReason> parseRejectReason(const std::string& text) noexcept;

// The per-result error kind a rejection reports as.
[[nodiscard]] ErrorKind errorKind(RejectReason reason) noexcept;

struct LedgerEvent {
    Seq seq = 0;
    EventKind kind = EventKind::Accepted;
    std::string runId;
    int workerId = -1;
    JobId jobId;
    Json::Value payload;              // normalized payload if ACCEPTED, raw candidate if REJECTED
    CanonicalHash hash;
    std::optional<RejectReason> reason;
    std::string detail;
    std::string ts;
    std::string chain;
};

// Everything the chain digest covers: the event without its "chain" field.
[[nodiscard]] Json::Value eventContent(const LedgerEvent& event);
[[nodiscard]] Json::Value toJson(const LedgerEvent& event);
[[nodiscard]] bool eventFromJson(const Json::Value& value, LedgerEvent& out, std::string* error = nullptr);

enum class ReadMode : uint8_t {
    Strict,   // malformed complete line throws OrchestratorError(ChainMismatch)
    Lenient   // malformed complete line is skipped and counted
};

// Lazy forward reader over a ledger file. A last line without a trailing
// newline is a torn write from a crash and is never returned.
class LedgerReader {
public:
    explicit LedgerReader(std::filesystem::path path, ReadMode mode = ReadMode::Strict);

    LedgerReader(const LedgerReader&) = delete;
    LedgerReader& operator=(const LedgerReader&) = delete;
    LedgerReader(LedgerReader&&) = default;
    LedgerReader& operator=(LedgerReader&&) = default;

    [[nodiscard]] bool next(LedgerEvent& out);
    void rewind();

    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] bool tornTail() const noexcept { return tornTail_; }
    [[nodiscard]] std::size_t malformed() const noexcept { return malformed_; }

private:
    std::filesystem::path path_;
    ReadMode mode_;
    std::ifstream in_;
    std::size_t line_ = 0;
    std::size_t malformed_ = 0;
    bool tornTail_ = false;
};

struct ChainReport {
    bool ok = true;
    std::size_t events = 0;
    std::size_t firstDivergence = 0;   // 1-based line, 0 when the chain is intact
    std::string lastDigest;
    bool tornTail = false;
    std::string message;
};

// Append-only, hash-chained JSON-lines log. Not internally synchronized:
// the acceptance pipeline is its only writer.
class Ledger final {
public:
    explicit Ledger(std::filesystem::path path);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;
    Ledger(Ledger&&) = delete;
    Ledger& operator=(Ledger&&) = delete;

    // Creates the file if needed, discards a torn tail, loads last seq and chain.
    // Throws OrchestratorError(LedgerIo) on any I/O failure.
    void open();

    // Assigns seq, ts (if empty) and chain, writes one line and fsyncs before
    // returning. Throws OrchestratorError(LedgerIo); after a failure the
    // ledger refuses further appends.
    Seq append(LedgerEvent& event);

    [[nodiscard]] LedgerReader replay(ReadMode mode = ReadMode::Strict) const;

    [[nodiscard]] Seq lastSeq() const noexcept { return lastSeq_; }
    [[nodiscard]] const std::string& lastChain() const noexcept { return lastChain_; }
    [[nodiscard]] bool discardedTornTail() const noexcept { return discardedTornTail_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] static ChainReport verifyChain(const std::filesystem::path& path);

private:
    void discardTornTail();

    std::filesystem::path path_;
    FileDescriptor fd_;
    Seq lastSeq_ = 0;
    std::string lastChain_;
    bool discardedTornTail_ = false;
    bool failed_ = false;
};

}
