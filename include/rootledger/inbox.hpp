/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <json/json.h>

#include "rootledger/pipeline.hpp"

namespace rootledger {

enum class InboxError : uint8_t {
    None = 0,
    IoError,
    InvalidSize,
    InvalidContent
};

[[nodiscard]] const char* toString(InboxError error) noexcept;

struct SubmitResult {
    bool ok = false;
    std::string id;
    InboxError error = InboxError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct InboxEntry {
    std::string id;
    std::filesystem::path path;
    std::string content;
};

// An inbox file decoded into something the pipeline can take. When the text
// is not JSON, parsed is false and error says why.
struct InboxMessage {
    bool parsed = false;
    ResultOrigin origin;
    Json::Value payload;
    std::string error;
};

// {"worker_id": int, "job_id": string, "payload": {...}} or a bare payload.
[[nodiscard]] InboxMessage decodeInboxMessage(const std::string& text);

// Spool directory for results from worker processes:
//   inbox/writing/   files being written
//   inbox/ready/     published, waiting for the reducer
//   inbox/consumed/  recorded in the ledger
// Publishing is a rename, so the reducer never sees a partial file.
class Inbox final {
public:
    explicit Inbox(const std::filesystem::path& root, bool createIfMissing = true);

    Inbox(const Inbox&) = delete;
    Inbox& operator=(const Inbox&) = delete;
    Inbox(Inbox&&) noexcept = default;
    Inbox& operator=(Inbox&&) noexcept = default;

    [[nodiscard]] SubmitResult submit(const std::string& text);
    [[nodiscard]] SubmitResult submit(const Json::Value& payload, int workerId, const JobId& jobId);

    // Oldest first, at most max entries.
    [[nodiscard]] std::vector<InboxEntry> collect(std::size_t max) const;
    [[nodiscard]] bool consume(const InboxEntry& entry) const noexcept;
    [[nodiscard]] std::size_t readyCount() const noexcept;

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::size_t maxBytes_ = 1'000'000;

    [[nodiscard]] bool createLayout(bool createIfMissing) noexcept;
    [[nodiscard]] static std::string generateId();
    [[nodiscard]] bool writeEntry(const std::filesystem::path& path, const std::string& text) const noexcept;
    [[nodiscard]] bool atomicPublish(const std::string& id) const noexcept;
    void cleanupFailedEntry(const std::string& id) const noexcept;
};

}
