/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/config.hpp"
#include "rootledger/logger.hpp"
#include <cmath>
#include <cstdlib>

namespace rootledger {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

double env_positive_double(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        double parsed = std::stod(val);
        if (!std::isfinite(parsed) || parsed <= 0.0) {
            LOG_WARN(std::string("Ignoring non-positive ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

Config Config::fromEnv(const std::filesystem::path& runDir) {
    Config config;
    config.runDir = runDir;

    if (const char* runId = std::getenv("ROOTLEDGER_RUN_ID"); runId && *runId) {
        config.runId = runId;
    }
    config.epsRoot = env_positive_double("ROOTLEDGER_EPS_ROOT", config.epsRoot);
    if (const char* schema = std::getenv("ROOTLEDGER_SCHEMA"); schema && *schema) {
        config.schema = schema;
    }
    config.workers = static_cast<int>(env_size("ROOTLEDGER_WORKERS", static_cast<std::size_t>(config.workers)));
    config.maxInFlight = env_size("ROOTLEDGER_MAX_IN_FLIGHT", config.maxInFlight);
    config.checkpointEvery = env_size("ROOTLEDGER_CHECKPOINT_EVERY", config.checkpointEvery);
    config.maxAttempts = static_cast<int>(env_size("ROOTLEDGER_MAX_ATTEMPTS", static_cast<std::size_t>(config.maxAttempts)));
    return config;
}

}
