/*
 * rootledger - Single-Writer Result Ledger
 * Copyright (c) 2025 The rootledger Authors
 * SPDX-License-Identifier: MIT
 */

#include "rootledger/orchestrator.hpp"
#include "rootledger/inbox.hpp"
#include "rootledger/ledger.hpp"
#include "rootledger/logger.hpp"
#include "rootledger/schema.hpp"
#include "rootledger/scheduler.hpp"
#include "rootledger/state_store.hpp"
#include "rootledger/worker_pool.hpp"
#include <chrono>

namespace rootledger {

namespace {
constexpr std::size_t kInboxBatch = 256;
}

Summary summarize(const OrchestratorState& state, std::size_t distinctResults) {
    Summary s;
    s.runId = state.runId;
    s.jobs = state.jobs.size();
    s.pending = state.count(JobStatus::Pending);
    s.running = state.count(JobStatus::Running);
    s.done = state.count(JobStatus::Done);
    s.failed = state.count(JobStatus::Failed);
    s.accepted = state.accepted;
    s.rejected = state.rejected;
    s.rejectedByReason = state.rejectedByReason;
    for (const auto& [reason, n] : state.rejectedByReason) {
        if (auto parsed = parseRejectReason(reason)) {
            s.rejectedByKind[toString(errorKind(*parsed))] += n;
        }
    }
    s.lastSeq = state.lastSeq;
    s.distinctResults = distinctResults;
    return s;
}

Json::Value toJson(const Summary& summary) {
    Json::Value v(Json::objectValue);
    v["run_id"] = summary.runId;
    Json::Value jobs(Json::objectValue);
    jobs["total"] = static_cast<Json::UInt64>(summary.jobs);
    jobs["pending"] = static_cast<Json::UInt64>(summary.pending);
    jobs["running"] = static_cast<Json::UInt64>(summary.running);
    jobs["done"] = static_cast<Json::UInt64>(summary.done);
    jobs["failed"] = static_cast<Json::UInt64>(summary.failed);
    v["jobs"] = jobs;
    v["accepted"] = static_cast<Json::UInt64>(summary.accepted);
    v["rejected"] = static_cast<Json::UInt64>(summary.rejected);
    Json::Value reasons(Json::objectValue);
    for (const auto& [reason, n] : summary.rejectedByReason) {
        reasons[reason] = static_cast<Json::UInt64>(n);
    }
    v["rejected_by_reason"] = reasons;
    Json::Value kinds(Json::objectValue);
    for (const auto& [kind, n] : summary.rejectedByKind) {
        kinds[kind] = static_cast<Json::UInt64>(n);
    }
    v["rejected_by_kind"] = kinds;
    v["last_seq"] = static_cast<Json::UInt64>(summary.lastSeq);
    v["distinct_results"] = static_cast<Json::UInt64>(summary.distinctResults);
    return v;
}

Orchestrator::Orchestrator(Config config, WorkerFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    LOG_DEBUG("Orchestrator created - run dir: " + config_.runDir.string() + ", run id: " + config_.runId +
              ", workers: " + std::to_string(config_.workers));
}

Orchestrator::~Orchestrator() {
    shutdown();
}

void Orchestrator::failStart(ErrorKind kind, const std::string& message) noexcept {
    startError_ = kind;
    LOG_ERROR(std::string(toString(kind)) + ": " + message);
    pipeline_.reset();
    scheduler_.reset();
    inbox_.reset();
    ledger_.reset();
    store_.reset();
    lock_.reset();
}

bool Orchestrator::start() {
    if (running_.load()) {
        LOG_WARN("Orchestrator already running");
        return false;
    }
    if (results_.closed()) {
        LOG_ERROR("Orchestrator was shut down and cannot be restarted");
        return false;
    }
    startError_.reset();

    LOG_INFO("Starting rootledger orchestrator...");

    auto schema = schemaByName(config_.schema);
    if (!schema) {
        failStart(ErrorKind::Validation, "unknown result schema '" + config_.schema + "'");
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.runDir, ec);
    if (ec) {
        failStart(ErrorKind::StateIo, "cannot create run directory " + config_.runDir.string() + ": " + ec.message());
        return false;
    }

    auto acquired = LockGuard(config_.lockPath()).acquire();
    if (!acquired) {
        failStart(acquired.error == LockError::AlreadyLocked ? ErrorKind::LockConflict : ErrorKind::StateIo,
                  acquired.message);
        return false;
    }
    lock_ = std::move(acquired.handle);

    LOG_DEBUG("========================================");
    LOG_DEBUG("Run dir: " + config_.runDir.string());
    LOG_DEBUG("Run id: " + config_.runId);
    LOG_DEBUG("eps_root: " + std::to_string(config_.epsRoot) + ", schema: " + schema->name);
    LOG_DEBUG("Workers: " + std::to_string(config_.workers) + ", max in flight: " +
              std::to_string(config_.maxInFlight));
    LOG_DEBUG("========================================");

    try {
        ledger_ = std::make_unique<Ledger>(config_.ledgerPath());
        ledger_->open();

        store_ = std::make_unique<StateStore>(config_.statePath());
        recovery_ = recover(config_.ledgerPath(), *store_, config_.runId);
        if (recovery_.state.lastSeq != ledger_->lastSeq()) {
            failStart(ErrorKind::ChainMismatch, "ledger tail seq " + std::to_string(ledger_->lastSeq()) +
                      " disagrees with replay seq " + std::to_string(recovery_.state.lastSeq));
            return false;
        }
        dedup_ = recovery_.dedup;

        pipeline_ = std::make_unique<AcceptancePipeline>(*ledger_, dedup_, config_.epsRoot, config_.runId,
                                                         std::move(*schema));
        SchedulerLimits limits;
        limits.maxInFlight = config_.maxInFlight;
        limits.checkpointEvery = config_.checkpointEvery;
        limits.maxAttempts = config_.maxAttempts;
        scheduler_ = std::make_unique<Scheduler>(*store_, recovery_.state, limits);
        inbox_ = std::make_unique<Inbox>(config_.inboxPath());
    } catch (const OrchestratorError& e) {
        failStart(e.kind(), e.what());
        return false;
    } catch (const std::exception& e) {
        failStart(ErrorKind::StateIo, e.what());
        return false;
    }

    LOG_INFO("Resumed at seq " + std::to_string(ledger_->lastSeq()) + " with " +
             std::to_string(dedup_.size()) + " accepted hash(es)");

    if (factory_) {
        pool_ = std::make_unique<WorkerPool>(config_.workers, results_);
        if (!pool_->start(factory_)) {
            pool_.reset();
            failStart(ErrorKind::StateIo, "failed to start worker pool");
            return false;
        }
    } else {
        LOG_INFO("No worker factory, reducing inbox results only");
    }

    shutdown_.store(false);
    running_.store(true);
    LOG_INFO("Orchestrator started");
    return true;
}

std::size_t Orchestrator::registerJobs(const std::vector<Job>& jobs) {
    if (!scheduler_) {
        LOG_ERROR("Cannot register jobs before start()");
        return 0;
    }
    return scheduler_->registerJobs(jobs);
}

Summary Orchestrator::run() {
    if (!running_.load()) {
        LOG_ERROR("Orchestrator not started");
        return summary();
    }

    setThreadName("Reducer");
    LOG_INFO("Reducer loop started");

    auto lastInboxScan = std::chrono::steady_clock::time_point{};
    while (!shutdown_.load()) {
        dispatchJobs();

        if (auto msg = results_.popFor(config_.pollInterval)) {
            handleMessage(*msg);
            while (auto more = results_.tryPop()) {
                handleMessage(*more);
                if (shutdown_.load()) {
                    break;
                }
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now - lastInboxScan >= config_.inboxScanInterval) {
            drainInbox();
            lastInboxScan = now;
        }

        if (config_.exitWhenIdle && scheduler_->idle() && results_.size() == 0) {
            drainInbox();
            if (results_.size() == 0 && inbox_->readyCount() == 0 && scheduler_->idle()) {
                LOG_INFO("Nothing pending or in flight, reducer exiting");
                break;
            }
        }
    }

    scheduler_->flush(true);
    Summary s = summary();
    LOG_INFO("Reducer loop finished: " + std::to_string(s.accepted) + " accepted, " +
             std::to_string(s.rejected) + " rejected, last seq " + std::to_string(s.lastSeq));
    return s;
}

AcceptResult Orchestrator::submit(const Json::Value& candidate, const ResultOrigin& origin) {
    if (!pipeline_ || !scheduler_) {
        throw OrchestratorError(ErrorKind::LedgerIo, "orchestrator not started");
    }
    AcceptResult result = pipeline_->accept(candidate, origin);
    scheduler_->recordOutcome(result, origin.jobId);
    return result;
}

void Orchestrator::dispatchJobs() {
    if (!pool_) {
        return;
    }
    for (auto& job : scheduler_->dispatch()) {
        JobId id = job.id;
        if (!pool_->submit(std::move(job))) {
            LOG_ERROR("Worker pool refused job " + id + ", stopping");
            requestShutdown();
            return;
        }
    }
}

void Orchestrator::handleMessage(const ResultMessage& msg) {
    switch (msg.kind) {
        case MessageKind::Result:
            submit(msg.payload, ResultOrigin{msg.workerId, msg.jobId});
            break;
        case MessageKind::JobFinished:
            scheduler_->onWorkerFinished(msg.jobId);
            break;
        case MessageKind::JobFailed:
            scheduler_->onWorkerFailed(msg.jobId, msg.error);
            break;
    }
}

void Orchestrator::drainInbox() {
    auto entries = inbox_->collect(kInboxBatch);
    for (const auto& entry : entries) {
        InboxMessage msg = decodeInboxMessage(entry.content);
        AcceptResult result;
        if (msg.parsed) {
            result = pipeline_->accept(msg.payload, msg.origin);
        } else {
            result = pipeline_->acceptRaw(entry.content, msg.error, msg.origin);
        }
        scheduler_->recordOutcome(result, msg.origin.jobId);

        LOG_DEBUG("Inbox " + entry.id + ": " + toString(result.status) +
                  (result.reason ? std::string("(") + toString(*result.reason) + ")" : std::string()));
        if (!inbox_->consume(entry)) {
            LOG_WARN("Inbox entry " + entry.id + " left in ready/ and will be seen again");
        }
        if (shutdown_.load()) {
            break;
        }
    }
}

Summary Orchestrator::summary() const {
    if (scheduler_) {
        return summarize(scheduler_->state(), dedup_.size());
    }
    return summarize(recovery_.state, recovery_.dedup.size());
}

void Orchestrator::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down orchestrator...");
    shutdown_.store(true);

    // In-flight jobs are abandoned: their results are refused from here on
    // and the jobs stay RUNNING.
    results_.close();
    if (pool_) {
        pool_->stop();
    }
    if (scheduler_ && scheduler_->inFlight() > 0) {
        LOG_WARN(std::to_string(scheduler_->inFlight()) + " job(s) abandoned while RUNNING");
    }
    if (scheduler_) {
        scheduler_->flush(true);
    }

    pool_.reset();
    pipeline_.reset();
    inbox_.reset();
    ledger_.reset();
    lock_.reset();

    LOG_INFO("Orchestrator shutdown complete");
}

}
