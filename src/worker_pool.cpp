/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/worker_pool.hpp"
#include "rootledger/logger.hpp"

namespace rootledger {

WorkerPool::WorkerPool(int workers, BlockingQueue<ResultMessage>& results) noexcept
    : workers_(workers > 0 ? workers : 1), results_(results) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::start(const WorkerFactory& factory) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }
    if (!factory) {
        LOG_ERROR("Invalid worker factory provided");
        return false;
    }

    try {
        std::vector<std::unique_ptr<Worker>> workers;
        workers.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            auto worker = factory(i);
            if (!worker) {
                LOG_ERROR("Worker factory returned nothing for worker " + std::to_string(i));
                return false;
            }
            workers.push_back(std::move(worker));
        }

        running_.store(true);
        threads_.reserve(workers.size());
        for (int i = 0; i < workers_; ++i) {
            threads_.emplace_back(&WorkerPool::workerLoop, this, i, std::move(workers[static_cast<std::size_t>(i)]));
        }
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void WorkerPool::stop() noexcept {
    if (!running_.exchange(false) && threads_.empty()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    jobs_.close();
    std::size_t abandoned = 0;
    while (jobs_.tryPop()) {
        ++abandoned;
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    if (abandoned > 0) {
        LOG_INFO("Pool stopped, " + std::to_string(abandoned) + " queued job(s) abandoned");
    } else {
        LOG_INFO("Pool stopped");
    }
}

bool WorkerPool::submit(Job job) {
    if (!running_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + job.id);
        return false;
    }
    JobId id = job.id;
    if (!jobs_.push(std::move(job))) {
        LOG_DEBUG("Job queue closed, dropping: " + id);
        return false;
    }
    LOG_TRACE("Job queued: " + id);
    return true;
}

void WorkerPool::workerLoop(int workerId, std::unique_ptr<Worker> worker) {
    setThreadName(workerThreadName(workerId));
    LOG_DEBUG("Worker thread started");

    while (auto job = jobs_.pop()) {
        LOG_DEBUG("Claimed job: " + job->id);

        ResultMessage done;
        done.workerId = workerId;
        done.jobId = job->id;
        try {
            auto payloads = worker->compute(*job);
            for (const auto& payload : payloads) {
                ResultMessage msg;
                msg.kind = MessageKind::Result;
                msg.workerId = workerId;
                msg.jobId = job->id;
                msg.payload = toJson(payload);
                if (!results_.push(std::move(msg))) {
                    break;
                }
            }
            done.kind = MessageKind::JobFinished;
            LOG_DEBUG("Job " + job->id + " computed " + std::to_string(payloads.size()) + " candidate(s)");
        } catch (const std::exception& e) {
            done.kind = MessageKind::JobFailed;
            done.error = e.what();
            LOG_ERROR("Job processing error: " + done.error + " (job: " + job->id + ")");
        }

        if (!results_.push(std::move(done))) {
            LOG_DEBUG("Results closed, abandoning report for job " + job->id);
        }
    }

    LOG_DEBUG("Worker thread stopped");
}

}
