/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/fsutil.hpp"
#include "rootledger/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

namespace rootledger {

FileDescriptor::~FileDescriptor() {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileDescriptor::reset() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool writeAll(int fd, const char* data, std::size_t size) noexcept {
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

bool fsyncDirectory(const std::filesystem::path& dir) noexcept {
    std::string path = dir.empty() ? std::string(".") : dir.string();
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.valid()) {
        return false;
    }
    return ::fsync(fd.get()) == 0;
}

bool writeFileAtomic(const std::filesystem::path& path, const std::string& content,
                     std::string* error) noexcept {
    try {
        auto tmpPath = path;
        tmpPath += ".tmp";

        {
            FileDescriptor fd(::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
            if (!fd.valid()) {
                if (error) *error = "open " + tmpPath.string() + ": " + errnoMessage(errno);
                return false;
            }
            if (!writeAll(fd.get(), content.data(), content.size()) || ::fsync(fd.get()) != 0) {
                if (error) *error = "write " + tmpPath.string() + ": " + errnoMessage(errno);
                std::error_code ec;
                std::filesystem::remove(tmpPath, ec);
                return false;
            }
        }

        if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
            if (error) *error = "rename " + tmpPath.string() + ": " + errnoMessage(errno);
            std::error_code ec;
            std::filesystem::remove(tmpPath, ec);
            return false;
        }

        if (!fsyncDirectory(path.parent_path())) {
            LOG_WARN("Directory fsync failed after replacing " + path.string());
        }
        return true;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

std::optional<std::string> readFile(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        if (file.bad()) {
            return std::nullopt;
        }
        return content;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::string errnoMessage(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

}
