/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/state_store.hpp"
#include "rootledger/fsutil.hpp"
#include "rootledger/json.hpp"
#include "rootledger/logger.hpp"
#include <algorithm>

namespace rootledger {

Job* OrchestratorState::find(const JobId& id) noexcept {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &jobs[it->second];
}

const Job* OrchestratorState::find(const JobId& id) const noexcept {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &jobs[it->second];
}

Job& OrchestratorState::add(Job job) {
    index_[job.id] = jobs.size();
    jobs.push_back(std::move(job));
    return jobs.back();
}

void OrchestratorState::reindex() {
    index_.clear();
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        index_[jobs[i].id] = i;
    }
}

std::size_t OrchestratorState::count(JobStatus status) const noexcept {
    return static_cast<std::size_t>(std::count_if(jobs.begin(), jobs.end(),
        [status](const Job& job) { return job.status == status; }));
}

bool OrchestratorState::operator==(const OrchestratorState& other) const {
    if (runId != other.runId || accepted != other.accepted || rejected != other.rejected ||
        rejectedByReason != other.rejectedByReason || lastSeq != other.lastSeq ||
        jobs.size() != other.jobs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        const Job& a = jobs[i];
        const Job& b = other.jobs[i];
        if (a.id != b.id || a.status != b.status || a.payload != b.payload ||
            a.createdAt != b.createdAt || a.attempts != b.attempts || a.lastError != b.lastError) {
            return false;
        }
    }
    return true;
}

Json::Value toJson(const Job& job) {
    Json::Value v(Json::objectValue);
    v["id"] = job.id;
    v["payload"] = job.payload;
    v["status"] = toString(job.status);
    v["created_at"] = job.createdAt;
    v["attempts"] = job.attempts;
    v["last_error"] = job.lastError;
    return v;
}

bool jobFromJson(const Json::Value& value, Job& out, std::string* error) {
    if (!value.isObject() || !value["id"].isString() || !isValidJobId(value["id"].asString())) {
        if (error) *error = "job record without a valid id";
        return false;
    }
    auto status = parseJobStatus(value.get("status", "PENDING").asString());
    if (!status) {
        if (error) *error = "job " + value["id"].asString() + " has unknown status";
        return false;
    }

    out.id = value["id"].asString();
    out.payload = value.get("payload", Json::Value());
    out.status = *status;
    out.createdAt = value.get("created_at", "").asString();
    out.attempts = value.get("attempts", 0).asInt();
    out.lastError = value.get("last_error", "").asString();
    return true;
}

Json::Value toJson(const OrchestratorState& state) {
    Json::Value v(Json::objectValue);
    v["run_id"] = state.runId;
    v["accepted"] = static_cast<Json::UInt64>(state.accepted);
    v["rejected"] = static_cast<Json::UInt64>(state.rejected);
    v["last_seq"] = static_cast<Json::UInt64>(state.lastSeq);
    v["done"] = static_cast<Json::UInt64>(state.count(JobStatus::Done));
    v["failed"] = static_cast<Json::UInt64>(state.count(JobStatus::Failed));

    Json::Value reasons(Json::objectValue);
    for (const auto& [reason, n] : state.rejectedByReason) {
        reasons[reason] = static_cast<Json::UInt64>(n);
    }
    v["rejected_by_reason"] = reasons;

    Json::Value jobs(Json::arrayValue);
    for (const auto& job : state.jobs) {
        jobs.append(toJson(job));
    }
    v["jobs"] = jobs;
    return v;
}

bool stateFromJson(const Json::Value& value, OrchestratorState& out, std::string* error) {
    if (!value.isObject()) {
        if (error) *error = "state document is not an object";
        return false;
    }

    try {
        OrchestratorState state;
        state.runId = value.get("run_id", "").asString();
        state.accepted = value.get("accepted", 0).asUInt64();
        state.rejected = value.get("rejected", 0).asUInt64();
        state.lastSeq = value.get("last_seq", 0).asUInt64();

        const Json::Value& reasons = value["rejected_by_reason"];
        if (reasons.isObject()) {
            for (const auto& key : reasons.getMemberNames()) {
                state.rejectedByReason[key] = reasons[key].asUInt64();
            }
        }

        const Json::Value& jobs = value["jobs"];
        if (!jobs.isNull() && !jobs.isArray()) {
            if (error) *error = "'jobs' is not an array";
            return false;
        }
        for (const auto& entry : jobs) {
            Job job;
            std::string why;
            if (!jobFromJson(entry, job, &why)) {
                LOG_WARN("Dropping job record from state: " + why);
                continue;
            }
            if (state.find(job.id)) {
                LOG_WARN("Dropping duplicate job record from state: " + job.id);
                continue;
            }
            state.add(std::move(job));
        }

        out = std::move(state);
        return true;
    } catch (const Json::Exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

StateStore::StateStore(std::filesystem::path path) noexcept : path_(std::move(path)) {
}

OrchestratorState StateStore::load() const {
    OrchestratorState state;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LOG_DEBUG("No state file at " + path_.string() + ", starting empty");
        return state;
    }

    auto content = readFile(path_);
    if (!content) {
        LOG_WARN("State file unreadable, ignoring: " + path_.string());
        return state;
    }

    Json::Value doc;
    std::string error;
    if (!parseJson(*content, doc, &error) || !stateFromJson(doc, state, &error)) {
        LOG_WARN("State file corrupt, ignoring (" + error + "): " + path_.string());
        return OrchestratorState{};
    }

    LOG_DEBUG("State loaded: " + std::to_string(state.jobs.size()) + " job(s), last seq " +
              std::to_string(state.lastSeq));
    return state;
}

bool StateStore::save(const OrchestratorState& state) const noexcept {
    try {
        std::string error;
        if (!writeFileAtomic(path_, prettyJson(toJson(state)) + "\n", &error)) {
            LOG_ERROR("State save failed: " + error);
            return false;
        }
        LOG_TRACE("State saved: " + path_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("State save failed: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path StateStore::checkpointPath(Seq seq) const {
    return checkpointDir() / ("checkpoint_seq_" + std::to_string(seq) + ".json");
}

bool StateStore::saveCheckpoint(const OrchestratorState& state) const noexcept {
    try {
        Json::Value v(Json::objectValue);
        v["seq"] = static_cast<Json::UInt64>(state.lastSeq);
        v["run_id"] = state.runId;
        v["accepted"] = static_cast<Json::UInt64>(state.accepted);
        v["rejected"] = static_cast<Json::UInt64>(state.rejected);
        Json::Value done(Json::arrayValue);
        Json::Value failed(Json::arrayValue);
        for (const auto& job : state.jobs) {
            if (job.status == JobStatus::Done) done.append(job.id);
            if (job.status == JobStatus::Failed) failed.append(job.id);
        }
        v["done"] = done;
        v["failed"] = failed;
        v["ts"] = nowIso();

        std::error_code ec;
        std::filesystem::create_directories(checkpointDir(), ec);
        if (ec) {
            LOG_ERROR("Checkpoint failed: cannot create " + checkpointDir().string() + ": " + ec.message());
            return false;
        }

        auto target = checkpointPath(state.lastSeq);
        std::string error;
        if (!writeFileAtomic(target, prettyJson(v) + "\n", &error)) {
            LOG_ERROR("Checkpoint failed: " + error);
            return false;
        }
        LOG_DEBUG("Checkpoint written: " + target.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Checkpoint failed: " + std::string(e.what()));
        return false;
    }
}

}
