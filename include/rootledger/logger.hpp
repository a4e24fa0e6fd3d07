/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rootledger {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

    // Mirror every emitted line into an append-only file. Empty path closes the sink.
    static bool setFile(const std::filesystem::path& path) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context ("Main", "Reducer", "Worker-3")
void setThreadName(const std::string& name);
std::string workerThreadName(int workerId);

}

#define LOG_ERROR(msg) ::rootledger::Logger::error(msg)
#define LOG_WARN(msg)  ::rootledger::Logger::warn(msg)
#define LOG_INFO(msg)  ::rootledger::Logger::info(msg)
#define LOG_DEBUG(msg) ::rootledger::Logger::debug(msg)
#define LOG_TRACE(msg) ::rootledger::Logger::trace(msg)
