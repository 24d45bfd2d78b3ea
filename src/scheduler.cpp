/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/scheduler.hpp"
#include "taskq/dispatcher.hpp"
#include "taskq/logger.hpp"
#include "taskq/process.hpp"
#include "taskq/store.hpp"
#include <atomic>
#include <exception>
#include <thread>
#include <unistd.h>

namespace taskq {

std::string SchedulerStatus::describe() const {
    std::string text = std::string("Scheduler ") + runStateName(state);
    if (owner) {
        text += " (pid " + std::to_string(*owner) + ")";
    }
    if (stale) {
        text += ", stale: owner is no longer alive";
    }
    return text;
}

Scheduler::Scheduler(TaskStore& store, RunStateStore& runState, ResourceMonitor& monitor,
                     const Config& config, std::shared_ptr<Logger> logger)
    : store_(store), runState_(runState), monitor_(monitor), config_(config), log_(std::move(logger)) {
}

SchedulerStatus Scheduler::status() const {
    SchedulerStatus current;
    current.state = runState_.get();
    if (current.state == RunState::Running) {
        current.owner = runState_.owner();
        current.stale = current.owner && *current.owner != ::getpid() && !isProcessAlive(*current.owner);
    }
    return current;
}

ControlResult Scheduler::start() {
    SchedulerStatus current = status();
    if (current.state == RunState::Running && !current.stale) {
        std::string message = "Scheduler is already running";
        if (current.owner) {
            message += " (pid " + std::to_string(*current.owner) + ")";
        }
        log_->warn(message);
        return {ControlOutcome::AlreadyRunning, message};
    }
    if (current.stale) {
        log_->warn("Taking over stale run-state left by pid " + std::to_string(*current.owner));
    }

    store_.initialize();
    if (!runState_.claim()) {
        // Another start won the marker between our check and the claim
        std::string message = "Scheduler is already running";
        if (auto owner = runState_.owner()) {
            message += " (pid " + std::to_string(*owner) + ")";
        }
        log_->warn(message);
        return {ControlOutcome::AlreadyRunning, message};
    }
    log_->info("Scheduler started (pid " + std::to_string(::getpid()) + ")");

    Dispatcher dispatcher(store_, runState_, monitor_, config_, log_);
    dispatcher.run();

    return {ControlOutcome::Done, "Scheduler stopped"};
}

ControlResult Scheduler::stop() {
    SchedulerStatus current = status();
    if (current.state != RunState::Running) {
        log_->info("Scheduler is not running");
        return {ControlOutcome::NotRunning, "Scheduler is not running"};
    }

    runState_.set(RunState::Stopped);
    std::string message = "Stop requested";
    if (current.stale) {
        message += ", cleared stale run-state";
    } else if (current.owner) {
        message += " for pid " + std::to_string(*current.owner);
    }
    log_->info(message);
    return {ControlOutcome::Done, message};
}

ControlResult Scheduler::runUntil(const std::function<bool()>& shutdownRequested, Millis pollInterval) {
    std::optional<ControlResult> outcome;
    std::exception_ptr failure;
    std::atomic<bool> finished{false};

    std::thread runner([&] {
        try {
            outcome = start();
        } catch (...) {
            failure = std::current_exception();
        }
        finished.store(true);
    });

    bool stopLanded = false;
    while (!finished.load()) {
        if (!stopLanded && shutdownRequested()) {
            try {
                // NotRunning here means start() has not claimed the marker yet
                stopLanded = stop().outcome == ControlOutcome::Done;
            } catch (const std::exception& e) {
                log_->error("Failed to stop scheduler: " + std::string(e.what()));
            }
        }
        std::this_thread::sleep_for(pollInterval);
    }
    runner.join();

    if (failure) {
        std::rethrow_exception(failure);
    }
    return *outcome;
}

}
