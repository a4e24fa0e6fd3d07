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
#include <sys/types.h>

namespace rootledger {

enum class LockError : uint8_t {
    None = 0,
    AlreadyLocked,
    IoError
};

[[nodiscard]] const char* toString(LockError error) noexcept;

// Proof of exclusive write access. Removes the marker when released or destroyed.
class LockHandle {
public:
    LockHandle(std::filesystem::path path, pid_t owner) noexcept;
    ~LockHandle();

    LockHandle(const LockHandle&) = delete;
    LockHandle& operator=(const LockHandle&) = delete;
    LockHandle(LockHandle&& other) noexcept;
    LockHandle& operator=(LockHandle&& other) noexcept;

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return held_; }
    [[nodiscard]] pid_t owner() const noexcept { return owner_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    pid_t owner_ = 0;
    bool held_ = false;
};

struct AcquireResult {
    bool ok = false;
    std::optional<LockHandle> handle;
    LockError error = LockError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Marker-file lock. The marker is never taken over automatically, even when
// its owner is gone; breakLock() is the explicit operator override.
class LockGuard final {
public:
    explicit LockGuard(std::filesystem::path path) noexcept;

    [[nodiscard]] AcquireResult acquire() const;
    static void release(LockHandle& handle) noexcept { handle.release(); }

    [[nodiscard]] static bool breakLock(const std::filesystem::path& path, std::string* error = nullptr) noexcept;
    [[nodiscard]] static std::optional<pid_t> readOwner(const std::filesystem::path& path) noexcept;
    [[nodiscard]] static bool isProcessAlive(pid_t pid) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
