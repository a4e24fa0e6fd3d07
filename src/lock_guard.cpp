/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/lock_guard.hpp"
#include "rootledger/fsutil.hpp"
#include "rootledger/logger.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

namespace rootledger {

const char* toString(LockError error) noexcept {
    switch (error) {
        case LockError::None:          return "NONE";
        case LockError::AlreadyLocked: return "LOCK_CONFLICT";
        case LockError::IoError:       return "IO_ERROR";
    }
    return "UNKNOWN";
}

LockHandle::LockHandle(std::filesystem::path path, pid_t owner) noexcept
    : path_(std::move(path)), owner_(owner), held_(true) {
}

LockHandle::~LockHandle() {
    release();
}

LockHandle::LockHandle(LockHandle&& other) noexcept
    : path_(std::move(other.path_)), owner_(other.owner_), held_(other.held_) {
    other.held_ = false;
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        owner_ = other.owner_;
        held_ = other.held_;
        other.held_ = false;
    }
    return *this;
}

void LockHandle::release() noexcept {
    if (!held_) {
        return;
    }
    held_ = false;

    // Only remove a marker that is still ours; an operator may have broken it.
    auto current = LockGuard::readOwner(path_);
    if (!current || *current != owner_) {
        LOG_WARN("Lock marker no longer owned by pid " + std::to_string(owner_) + ", leaving it: " + path_.string());
        return;
    }
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LOG_ERROR("Failed to remove lock marker " + path_.string() + ": " + errnoMessage(errno));
        return;
    }
    LOG_DEBUG("Lock released: " + path_.string());
}

LockGuard::LockGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {
}

AcquireResult LockGuard::acquire() const {
    AcquireResult result;

    FileDescriptor fd(::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        int err = errno;
        if (err != EEXIST) {
            result.error = LockError::IoError;
            result.message = "cannot create lock marker " + path_.string() + ": " + errnoMessage(err);
            LOG_ERROR(result.message);
            return result;
        }

        result.error = LockError::AlreadyLocked;
        auto owner = readOwner(path_);
        if (owner && isProcessAlive(*owner)) {
            result.message = "run is locked by live process " + std::to_string(*owner) + " (" + path_.string() + ")";
        } else {
            std::string who = owner ? "pid " + std::to_string(*owner) + " is not running" : "owner unknown";
            result.message = "stale lock marker " + path_.string() + " (" + who +
                             "); remove it explicitly with 'rlctl <run_dir> unlock'";
        }
        LOG_ERROR(std::string(toString(result.error)) + ": " + result.message);
        return result;
    }

    pid_t self = ::getpid();
    std::string content = std::to_string(self) + "\n";
    if (!writeAll(fd.get(), content.data(), content.size()) || ::fsync(fd.get()) != 0) {
        int err = errno;
        fd.reset();
        ::unlink(path_.c_str());
        result.error = LockError::IoError;
        result.message = "cannot write lock marker " + path_.string() + ": " + errnoMessage(err);
        LOG_ERROR(result.message);
        return result;
    }

    LOG_INFO("Lock acquired: " + path_.string() + " (pid " + std::to_string(self) + ")");
    result.ok = true;
    result.handle.emplace(path_, self);
    return result;
}

bool LockGuard::breakLock(const std::filesystem::path& path, std::string* error) noexcept {
    auto owner = readOwner(path);
    if (::unlink(path.c_str()) != 0) {
        int err = errno;
        if (err == ENOENT) {
            if (error) *error = "no lock marker at " + path.string();
        } else if (error) {
            *error = "cannot remove " + path.string() + ": " + errnoMessage(err);
        }
        return false;
    }
    if (owner && isProcessAlive(*owner)) {
        LOG_WARN("Broke lock held by live process " + std::to_string(*owner) + ": " + path.string());
    } else {
        LOG_INFO("Removed lock marker " + path.string());
    }
    return true;
}

std::optional<pid_t> LockGuard::readOwner(const std::filesystem::path& path) noexcept {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (!file || pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool LockGuard::isProcessAlive(pid_t pid) noexcept {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

}
