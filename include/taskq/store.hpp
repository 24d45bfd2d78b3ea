/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "taskq/task.hpp"
#include "taskq/types.hpp"

namespace taskq {

// Raised when the backing storage cannot serve a request.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable task table. Implementations must be safe for concurrent use by
// the dispatcher, every worker and other processes touching the same home.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    // Idempotent; creates whatever layout the store needs.
    virtual void initialize() = 0;

    [[nodiscard]] virtual TaskId insertTask(const TaskSpec& spec) = 0;
    [[nodiscard]] virtual std::optional<Task> getTask(TaskId id) const = 0;

    // Ordered by (priority, created_at, id). An empty filter lists everything.
    [[nodiscard]] virtual std::vector<Task> listTasks(const std::vector<Status>& filter = {}) const = 0;

    // Unconditional status write.
    virtual void updateStatus(TaskId id, Status status) = 0;
    // Compare-and-set. False when the task is not currently in `from`.
    [[nodiscard]] virtual bool transition(TaskId id, Status from, Status to) = 0;

    virtual void updatePid(TaskId id, int pid) = 0;
    virtual void updateStartTime(TaskId id, Timestamp ts) = 0;
    virtual void updateEndTime(TaskId id, Timestamp ts) = 0;
    virtual void updateExitCode(TaskId id, int exitCode) = 0;
    virtual void updateError(TaskId id, const std::string& error) = 0;
};

}
