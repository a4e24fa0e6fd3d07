/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace rootledger {

namespace {
LogLevel g_level = LogLevel::INFO;
bool g_level_initialized = false;
std::mutex g_log_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;
std::ofstream g_file;
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) noexcept {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

bool Logger::setFile(const std::filesystem::path& path) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    try {
        if (g_file.is_open()) {
            g_file.close();
        }
        if (path.empty()) {
            return true;
        }
        g_file.open(path, std::ios::app);
        return g_file.is_open();
    } catch (const std::exception& e) {
        std::cerr << "log sink unavailable: " << e.what() << std::endl;
        return false;
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
        return;
    }

    try {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        ::localtime_r(&time, &local);

        std::lock_guard<std::mutex> lock(g_log_mutex);

        std::string threadInfo;
        auto it = g_thread_names.find(std::this_thread::get_id());
        if (it != g_thread_names.end()) {
            threadInfo = it->second;
        } else {
            std::ostringstream oss;
            oss << "T" << std::this_thread::get_id();
            threadInfo = oss.str();
        }

        std::ostringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << threadInfo << "]";
        ss << " " << message;

        // stdout stays reserved for tool output
        std::cerr << ss.str() << std::endl;
        if (g_file.is_open()) {
            g_file << ss.str() << '\n';
            g_file.flush();
        }
    } catch (const std::exception&) {
        // Logging must never throw into its caller
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* envVal = std::getenv("ROOTLEDGER_LOG_LEVEL");
    if (!envVal) return LogLevel::INFO;
    return parseLevel(envVal).value_or(LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string workerThreadName(int workerId) {
    return "Worker-" + std::to_string(workerId);
}

}
