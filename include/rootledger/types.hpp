/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace rootledger {

// Job lifecycle states. Jobs are never deleted, only transitioned.
enum class JobStatus : std::uint8_t { Pending, Running, Done, Failed };

// Stable job identifier assigned by whoever registers the job.
using JobId = std::string;

// Ledger sequence number, 1-based. 0 means "nothing appended yet".
using Seq = std::uint64_t;

// "sha256:<64 hex chars>", or empty when nothing could be hashed.
using CanonicalHash = std::string;

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] std::optional<JobStatus> parseJobStatus(const std::string& text) noexcept;

// UTC wall clock as ISO 8601 with millisecond precision, e.g. 2025-01-31T12:00:00.123Z
[[nodiscard]] std::string nowIso();

} // namespace rootledger
