/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace rootledger {

// Owning POSIX file descriptor.
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    void reset() noexcept;

private:
    int fd_ = -1;
};

// Writes every byte, retrying on EINTR and short writes. errno is left set on failure.
[[nodiscard]] bool writeAll(int fd, const char* data, std::size_t size) noexcept;

[[nodiscard]] bool fsyncDirectory(const std::filesystem::path& dir) noexcept;

// temp file + fsync + rename + directory fsync. On failure the previous file is untouched.
[[nodiscard]] bool writeFileAtomic(const std::filesystem::path& path, const std::string& content,
                                   std::string* error = nullptr) noexcept;

[[nodiscard]] std::optional<std::string> readFile(const std::filesystem::path& path) noexcept;

[[nodiscard]] std::string errnoMessage(int err);

}
