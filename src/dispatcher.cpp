/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/dispatcher.hpp"
#include "taskq/logger.hpp"
#include "taskq/pool.hpp"
#include "taskq/resource_monitor.hpp"
#include "taskq/run_state.hpp"
#include "taskq/store.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <unistd.h>

namespace taskq {

Dispatcher::Dispatcher(TaskStore& store, RunStateStore& runState, ResourceMonitor& monitor,
                       const Config& config, std::shared_ptr<Logger> logger)
    : store_(store),
      runState_(runState),
      monitor_(monitor),
      config_(config),
      log_(std::move(logger)),
      executor_(store, config, log_) {
    log_->debug("Dispatcher created - batch: " + std::to_string(config_.batchSize) +
                ", workers: " + std::to_string(config_.minWorkers) + ".." + std::to_string(config_.maxWorkers));
}

Dispatcher::~Dispatcher() = default;

Millis Dispatcher::nextBackoff(Millis current, Millis ceiling) noexcept {
    if (current.count() <= 0) {
        return std::min(Millis(1), ceiling);
    }
    if (current >= ceiling / 2) {
        return ceiling;
    }
    return current * 2;
}

int Dispatcher::chooseWorkerCount() {
    int minimum = std::max(1, config_.minWorkers);
    int maximum = std::max(minimum, config_.maxWorkers);
    if (monitor_.isNearOverload(config_.cpuThreshold, config_.memThreshold, config_.nearOverloadMargin)) {
        log_->info("Load is near the limits, starting with " + std::to_string(minimum) + " worker(s)");
        return minimum;
    }
    return maximum;
}

std::size_t Dispatcher::inFlight() const {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    return inFlight_.size();
}

bool Dispatcher::isRunning() const noexcept {
    try {
        if (runState_.get() != RunState::Running) {
            return false;
        }
        // A stop followed by another process's start leaves the marker
        // running under a new owner; this loop must not carry on beside it
        auto owner = runState_.owner();
        if (owner && *owner != ::getpid()) {
            if (!ownershipLost_.exchange(true)) {
                log_->warn("Run state taken over by pid " + std::to_string(*owner) + ", stopping");
            }
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log_->error("Cannot read run state, stopping: " + std::string(e.what()));
        return false;
    }
}

bool Dispatcher::sleepWhileRunning(Millis duration) const {
    auto sleepEnd = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < sleepEnd) {
        if (!isRunning()) {
            return false;
        }
        auto left = std::chrono::duration_cast<Millis>(sleepEnd - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::max(Millis(1), std::min(left, config_.pollSlice)));
    }
    return isRunning();
}

void Dispatcher::run() {
    setThreadName("Dispatcher");
    log_->info("Dispatcher starting");

    terminating_.store(false);
    ownershipLost_.store(false);
    int workers = chooseWorkerCount();
    Pool pool(workers, log_);
    if (!pool.start([this](const Task& task, int workerId) { executeTask(task, workerId); })) {
        log_->error("Failed to start worker pool");
        markStopped();
        return;
    }

    Millis backoff = config_.idleBackoffBase;
    while (isRunning()) {
        try {
            Pass pass = dispatchOnce(pool);
            switch (pass) {
                case Pass::Idle:
                    log_->trace("Nothing pending, sleeping " + std::to_string(backoff.count()) + "ms");
                    sleepWhileRunning(backoff);
                    backoff = nextBackoff(backoff, config_.idleBackoffCeiling);
                    break;
                case Pass::Overloaded:
                    backoff = config_.idleBackoffBase;
                    log_->info("Holding dispatch for " + std::to_string(config_.overloadCooldown.count()) + "ms");
                    sleepWhileRunning(config_.overloadCooldown);
                    break;
                case Pass::Saturated:
                case Pass::Dispatched:
                    backoff = config_.idleBackoffBase;
                    sleepWhileRunning(config_.pollSlice);
                    break;
            }
        } catch (const std::exception& e) {
            log_->error("Dispatch loop error: " + std::string(e.what()));
            sleepWhileRunning(config_.idleBackoffBase);
        } catch (...) {
            log_->error("Unknown dispatch loop error");
            sleepWhileRunning(config_.idleBackoffBase);
        }
    }

    std::size_t remaining = inFlight();
    if (config_.terminateOnShutdown) {
        if (remaining > 0) {
            log_->info("Stop requested, terminating " + std::to_string(remaining) + " running task(s)");
        }
        terminating_.store(true);
    } else if (remaining > 0) {
        log_->info("Stop requested, waiting for " + std::to_string(remaining) + " running task(s)");
    }

    pool.stop();
    markStopped();
    log_->info("Dispatcher stopped");
}

Dispatcher::Pass Dispatcher::dispatchOnce(Pool& pool) {
    auto pending = store_.listTasks({Status::Pending});
    if (pending.empty()) {
        return Pass::Idle;
    }

    // Drop what was already released; the pool may not have claimed it yet
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [this](const Task& t) { return inFlight_.count(t.id) > 0; }),
                      pending.end());
    }
    if (pending.empty() || pool.occupied() >= static_cast<std::size_t>(pool.workerCount())) {
        return Pass::Saturated;
    }

    if (monitor_.isOverloaded(config_.cpuThreshold, config_.memThreshold)) {
        return Pass::Overloaded;
    }
    // Sampling can take a while; a stop may have landed meanwhile
    if (!isRunning()) {
        return Pass::Saturated;
    }

    int released = 0;
    for (const auto& task : pending) {
        if (released >= config_.batchSize) break;
        if (pool.occupied() >= static_cast<std::size_t>(pool.workerCount())) break;

        if (released > 0 && !sleepWhileRunning(config_.staggerDelay)) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(inFlightMutex_);
            inFlight_.insert(task.id);
        }
        if (!pool.trySubmit(task)) {
            std::lock_guard<std::mutex> lock(inFlightMutex_);
            inFlight_.erase(task.id);
            break;
        }

        ++released;
        log_->debug("Released task " + std::to_string(task.id) + " (priority " +
                    std::to_string(task.priority) + ")");
    }

    if (released > 0) {
        log_->debug("Released " + std::to_string(released) + " task(s) to the pool");
        return Pass::Dispatched;
    }
    return Pass::Saturated;
}

void Dispatcher::executeTask(const Task& task, int workerId) {
    if (terminating_.load()) {
        // Not claimed yet, so it stays pending for the next run
        log_->debug("Task " + std::to_string(task.id) + " left pending for shutdown");
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        inFlight_.erase(task.id);
        return;
    }
    log_->debug(getThreadName(workerId) + " executing task " + std::to_string(task.id));

    ExecutionResult result = executor_.execute(task, &terminating_);
    try {
        Status settled = executor_.finish(task, result);
        log_->debug("Task " + std::to_string(task.id) + " " + outcomeName(result.outcome) +
                    ", now " + statusName(settled));
    } catch (const std::exception& e) {
        log_->error("Task " + std::to_string(task.id) + " result could not be recorded: " + std::string(e.what()));
    }

    std::lock_guard<std::mutex> lock(inFlightMutex_);
    inFlight_.erase(task.id);
}

void Dispatcher::markStopped() noexcept {
    try {
        // A newer scheduler may already own the flag after our stop
        auto owner = runState_.owner();
        if (owner && *owner != ::getpid()) {
            log_->debug("Run state now owned by pid " + std::to_string(*owner) + ", leaving it");
            return;
        }
        runState_.set(RunState::Stopped);
    } catch (const std::exception& e) {
        log_->error("Failed to record stopped state: " + std::string(e.what()));
    }
}

}
