/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "rootledger/queue.hpp"
#include "rootledger/worker.hpp"

namespace rootledger {

// N threads, one Worker each, pulling jobs and streaming ResultMessages to
// the reducer. There is no cancellation: stop() lets each thread finish the
// job it holds, and anything it reports after the results queue is closed
// is dropped.
class WorkerPool {
public:
    WorkerPool(int workers, BlockingQueue<ResultMessage>& results) noexcept;
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    [[nodiscard]] bool start(const WorkerFactory& factory);
    void stop() noexcept;
    [[nodiscard]] bool submit(Job job);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const { return jobs_.size(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId, std::unique_ptr<Worker> worker);

    int workers_;
    BlockingQueue<Job> jobs_;
    BlockingQueue<ResultMessage>& results_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;
};

}
