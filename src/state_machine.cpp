/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/state_machine.hpp"
#include "taskq/logger.hpp"
#include "taskq/process.hpp"
#include "taskq/store.hpp"
#include <csignal>

namespace taskq {

namespace {
// pending -> running can race a cancel; re-read and try again a few times
constexpr int kCancelAttempts = 3;
}

bool canTransition(Status from, Status to) noexcept {
    switch (from) {
        case Status::Pending:
            return to == Status::Running || to == Status::Cancelled;
        case Status::Running:
            return to == Status::Completed || to == Status::Failed || to == Status::Cancelled;
        default:
            return false;
    }
}

bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed || status == Status::Cancelled;
}

CancelResult cancelTask(TaskStore& store, TaskId id, Logger& log) {
    const std::string label = "Task " + std::to_string(id);
    CancelResult result;

    for (int attempt = 0; attempt < kCancelAttempts; ++attempt) {
        auto task = store.getTask(id);
        if (!task) {
            result.outcome = CancelOutcome::NotFound;
            result.message = label + " not found";
            return result;
        }

        result.previous = task->status;
        if (!canTransition(task->status, Status::Cancelled)) {
            result.outcome = CancelOutcome::NotCancellable;
            result.message = label + " cannot be cancelled (status: " + statusName(task->status) + ")";
            log.warn(result.message);
            return result;
        }

        if (!store.transition(id, task->status, Status::Cancelled)) {
            log.debug(label + " changed state during cancel, retrying");
            continue;
        }

        result.outcome = CancelOutcome::Cancelled;
        result.message = label + " cancelled";
        log.info(result.message + " (was " + statusName(task->status) + ")");

        if (task->status == Status::Running) {
            // The pid may have been recorded after our first read
            auto current = store.getTask(id);
            auto pid = current ? current->pid : task->pid;
            if (!pid) {
                log.warn(label + " has no recorded pid yet, the executor will stop it after spawn");
                return result;
            }
            std::string error;
            if (signalTaskProcess(*pid, SIGTERM, error)) {
                result.signalled = true;
                log.info(label + " sent SIGTERM to pid " + std::to_string(*pid));
            } else {
                log.warn(label + " could not signal pid " + std::to_string(*pid) + ": " + error);
            }
        }
        return result;
    }

    result.outcome = CancelOutcome::NotCancellable;
    result.message = label + " kept changing state, cancel not applied";
    log.warn(result.message);
    return result;
}

}
