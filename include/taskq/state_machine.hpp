/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "taskq/types.hpp"

namespace taskq {

class Logger;
class TaskStore;

// pending -> running -> {completed, failed}; pending|running -> cancelled.
[[nodiscard]] bool canTransition(Status from, Status to) noexcept;
[[nodiscard]] bool isTerminal(Status status) noexcept;

enum class CancelOutcome : uint8_t {
    Cancelled,
    NotFound,
    NotCancellable
};

struct CancelResult {
    CancelOutcome outcome = CancelOutcome::NotFound;
    Status previous = Status::Pending;  // status seen when the cancel landed or was refused
    bool signalled = false;             // a running child was sent SIGTERM
    std::string message;
    explicit operator bool() const noexcept { return outcome == CancelOutcome::Cancelled; }
};

// Moves a pending or running task to cancelled. A running task's process
// group is signalled best-effort; a failed signal never blocks the change.
[[nodiscard]] CancelResult cancelTask(TaskStore& store, TaskId id, Logger& log);

}
