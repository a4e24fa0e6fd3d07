/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/inbox.hpp"
#include "rootledger/contract.hpp"
#include "rootledger/fsutil.hpp"
#include "rootledger/json.hpp"
#include "rootledger/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace rootledger {

namespace {
constexpr const char* kExtension = ".json";
}

const char* toString(InboxError error) noexcept {
    switch (error) {
        case InboxError::None:           return "NONE";
        case InboxError::IoError:        return "IO_ERROR";
        case InboxError::InvalidSize:    return "INVALID_SIZE";
        case InboxError::InvalidContent: return "INVALID_CONTENT";
    }
    return "UNKNOWN";
}

InboxMessage decodeInboxMessage(const std::string& text) {
    InboxMessage msg;
    Json::Value doc;
    if (!parseJson(text, doc, &msg.error)) {
        return msg;
    }
    msg.parsed = true;

    if (doc.isObject() && doc.isMember("payload")) {
        const Json::Value& worker = doc["worker_id"];
        if (worker.isInt() && !worker.isBool()) {
            msg.origin.workerId = worker.asInt();
        }
        const Json::Value& job = doc["job_id"];
        if (job.isString() && isValidJobId(job.asString())) {
            msg.origin.jobId = job.asString();
        }
        msg.payload = doc["payload"];
    } else {
        msg.payload = doc;
    }
    return msg;
}

Inbox::Inbox(const std::filesystem::path& root, bool createIfMissing) : root_(root) {
    if (!createLayout(createIfMissing)) {
        LOG_ERROR("Failed to initialize inbox: " + root_.string());
    }
}

SubmitResult Inbox::submit(const std::string& text) {
    if (text.empty()) {
        LOG_DEBUG("Invalid inbox message: empty");
        return {false, "", InboxError::InvalidContent, "Message is empty"};
    }
    if (text.size() > maxBytes_) {
        LOG_DEBUG("Inbox message exceeds size limit: " + std::to_string(text.size()) + " > " + std::to_string(maxBytes_));
        return {false, "", InboxError::InvalidSize, "Message exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    std::string id = generateId();
    LOG_DEBUG("Generated inbox entry ID: " + id);

    if (!writeEntry(root_ / "writing" / (id + kExtension), text)) {
        LOG_ERROR("Failed to write inbox entry: " + id);
        cleanupFailedEntry(id);
        return {false, "", InboxError::IoError, "Failed to write inbox entry"};
    }

    if (!atomicPublish(id)) {
        LOG_ERROR("Failed to publish inbox entry: " + id);
        cleanupFailedEntry(id);
        return {false, "", InboxError::IoError, "Failed to publish inbox entry"};
    }

    LOG_INFO("Result submitted to inbox: " + id);
    return {true, id, InboxError::None, ""};
}

SubmitResult Inbox::submit(const Json::Value& payload, int workerId, const JobId& jobId) {
    if (!jobId.empty() && !isValidJobId(jobId)) {
        return {false, "", InboxError::InvalidContent, "Invalid job id: " + jobId};
    }
    Json::Value envelope(Json::objectValue);
    envelope["worker_id"] = workerId;
    envelope["job_id"] = jobId;
    envelope["payload"] = payload;
    return submit(canonicalJson(envelope));
}

std::vector<InboxEntry> Inbox::collect(std::size_t max) const {
    std::vector<std::filesystem::path> files;
    const auto ready = root_ / "ready";

    std::error_code ec;
    for (std::filesystem::directory_iterator it(ready, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == kExtension) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        LOG_ERROR("Inbox scan error: " + ec.message());
    }

    // IDs start with a zero-padded timestamp, so name order is arrival order.
    std::sort(files.begin(), files.end());
    if (files.size() > max) {
        files.resize(max);
    }

    std::vector<InboxEntry> entries;
    entries.reserve(files.size());
    for (const auto& file : files) {
        auto content = readFile(file);
        if (!content) {
            LOG_WARN("Cannot read inbox entry, will retry: " + file.string());
            continue;
        }
        entries.push_back({file.stem().string(), file, std::move(*content)});
    }
    if (!entries.empty()) {
        LOG_DEBUG("Inbox has " + std::to_string(entries.size()) + " ready entr" + (entries.size() == 1 ? "y" : "ies"));
    }
    return entries;
}

bool Inbox::consume(const InboxEntry& entry) const noexcept {
    std::error_code ec;
    std::filesystem::rename(entry.path, root_ / "consumed" / entry.path.filename(), ec);
    if (ec) {
        LOG_ERROR("Failed to move inbox entry " + entry.id + " to consumed: " + ec.message());
        return false;
    }
    return true;
}

std::size_t Inbox::readyCount() const noexcept {
    std::size_t count = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(root_ / "ready", ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == kExtension) {
            ++count;
        }
    }
    return count;
}

bool Inbox::createLayout(bool createIfMissing) noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(root_, ec) && !createIfMissing) {
        return false;
    }
    for (const char* sub : {"writing", "ready", "consumed"}) {
        std::filesystem::create_directories(root_ / sub, ec);
        if (ec) {
            LOG_ERROR("Failed to create inbox directory " + (root_ / sub).string() + ": " + ec.message());
            return false;
        }
    }
    return true;
}

std::string Inbox::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::ostringstream ss;
    ss << std::setw(20) << std::setfill('0') << now << "_" << getpid() << "_"
       << std::setw(6) << std::setfill('0') << unique_counter;
    return ss.str();
}

bool Inbox::writeEntry(const std::filesystem::path& path, const std::string& text) const noexcept {
    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        LOG_ERROR("Cannot create " + path.string() + ": " + errnoMessage(errno));
        return false;
    }
    if (!writeAll(fd.get(), text.data(), text.size()) || ::fsync(fd.get()) != 0) {
        LOG_ERROR("Cannot write " + path.string() + ": " + errnoMessage(errno));
        return false;
    }
    return true;
}

bool Inbox::atomicPublish(const std::string& id) const noexcept {
    std::error_code ec;
    std::filesystem::rename(root_ / "writing" / (id + kExtension), root_ / "ready" / (id + kExtension), ec);
    if (ec) {
        LOG_ERROR("Publish rename failed: " + ec.message());
        return false;
    }
    if (!fsyncDirectory(root_ / "ready")) {
        LOG_WARN("Could not fsync inbox ready directory");
    }
    return true;
}

void Inbox::cleanupFailedEntry(const std::string& id) const noexcept {
    std::error_code ec;
    std::filesystem::remove(root_ / "writing" / (id + kExtension), ec);
}

}
