/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "rootledger/contract.hpp"
#include "rootledger/types.hpp"

namespace rootledger {

// A unit of computation. Implementations never see the ledger or the state;
// whatever they return goes through the acceptance pipeline. Throwing marks
// the job as failed.
class Worker {
public:
    virtual ~Worker() = default;
    [[nodiscard]] virtual std::vector<ResultPayload> compute(const Job& job) = 0;
};

// Called once per pool thread with that thread's worker id.
using WorkerFactory = std::function<std::unique_ptr<Worker>(int workerId)>;

enum class MessageKind : uint8_t {
    Result,
    JobFinished,
    JobFailed
};

[[nodiscard]] const char* toString(MessageKind kind) noexcept;

// What workers send back to the reducer.
struct ResultMessage {
    MessageKind kind = MessageKind::Result;
    int workerId = -1;
    JobId jobId;
    Json::Value payload;      // Result only
    std::string error;        // JobFailed only
};

// Scans [t_start, t_end) by stride from the job payload and reports every
// grid point with a tiny deterministic root_val, always inside the default
// tolerance.
class StubWorker final : public Worker {
public:
    explicit StubWorker(int workerId) noexcept : workerId_(workerId) {}

    [[nodiscard]] std::vector<ResultPayload> compute(const Job& job) override;

    static constexpr std::size_t kMaxPoints = 1'000'000;

private:
    int workerId_;
};

// Job payload understood by StubWorker.
[[nodiscard]] Json::Value stubJobPayload(double tStart, double tEnd, double stride);

}
