/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/types.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rootledger {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending: return "PENDING";
        case JobStatus::Running: return "RUNNING";
        case JobStatus::Done:    return "DONE";
        case JobStatus::Failed:  return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<JobStatus> parseJobStatus(const std::string& text) noexcept {
    if (text == "PENDING") return JobStatus::Pending;
    if (text == "RUNNING") return JobStatus::Running;
    if (text == "DONE") return JobStatus::Done;
    if (text == "FAILED") return JobStatus::Failed;
    return std::nullopt;
}

std::string nowIso() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    ::gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

}
