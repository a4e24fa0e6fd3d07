/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/worker.hpp"
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace rootledger {

namespace {
double requireNumber(const Json::Value& payload, const char* key) {
    const Json::Value& v = payload[key];
    if (v.isBool() || !v.isDouble() || !std::isfinite(v.asDouble())) {
        throw std::invalid_argument(std::string("job payload needs a finite number '") + key + "'");
    }
    return v.asDouble();
}

// splitmix64 finalizer, so root_val depends only on t.
std::uint64_t mix(std::uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

double stubRootVal(double t) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &t, sizeof(bits));
    double unit = static_cast<double>(mix(bits) >> 11) * 0x1.0p-53;   // [0, 1)
    return (unit - 0.5) * 1e-11;
}
}

const char* toString(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Result:      return "RESULT";
        case MessageKind::JobFinished: return "JOB_FINISHED";
        case MessageKind::JobFailed:   return "JOB_FAILED";
    }
    return "UNKNOWN";
}

Json::Value stubJobPayload(double tStart, double tEnd, double stride) {
    Json::Value payload(Json::objectValue);
    payload["t_start"] = tStart;
    payload["t_end"] = tEnd;
    payload["stride"] = stride;
    return payload;
}

std::vector<ResultPayload> StubWorker::compute(const Job& job) {
    if (!job.payload.isObject()) {
        throw std::invalid_argument("job " + job.id + " has no scan range");
    }
    const double tStart = requireNumber(job.payload, "t_start");
    const double tEnd = requireNumber(job.payload, "t_end");
    const double stride = requireNumber(job.payload, "stride");
    if (!(stride > 0.0)) {
        throw std::invalid_argument("job " + job.id + ": stride must be positive");
    }

    if ((tEnd - tStart) / stride > static_cast<double>(kMaxPoints)) {
        throw std::length_error("job " + job.id + " scans more than " + std::to_string(kMaxPoints) + " points");
    }

    std::vector<ResultPayload> out;
    for (std::size_t i = 0;; ++i) {
        const double t = tStart + static_cast<double>(i) * stride;
        if (!(t < tEnd)) {
            break;
        }
        if (i >= kMaxPoints) {
            throw std::length_error("job " + job.id + " scans more than " + std::to_string(kMaxPoints) + " points");
        }
        ResultPayload p;
        p.t = t;
        p.rootVal = stubRootVal(t);
        p.meta.method = "stub";
        p.meta.iters = 12;
        p.meta.extra["worker_id"] = workerId_;
        out.push_back(std::move(p));
    }
    return out;
}

}
