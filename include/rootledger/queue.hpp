/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace rootledger {

// Multi-producer, multi-consumer handoff channel. After close() pushes are
// refused and consumers drain what is left, then receive nullopt.
template <typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;
    BlockingQueue(BlockingQueue&&) = delete;
    BlockingQueue& operator=(BlockingQueue&&) = delete;

    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push(std::move(item));
        }
        available_.notify_one();
        return true;
    }

    [[nodiscard]] std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this] { return !items_.empty() || closed_; });
        return takeLocked();
    }

    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return takeLocked();
    }

    [[nodiscard]] std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::optional<T> takeLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::queue<T> items_;
    bool closed_ = false;
};

}
