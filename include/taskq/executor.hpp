/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

#include "taskq/config.hpp"
#include "taskq/task.hpp"

namespace taskq {

class Logger;
class TaskStore;

enum class ExecutionOutcome : uint8_t {
    Completed,  // child exited 0
    Failed,     // validation, spawn, non-zero exit or signal
    TimedOut,   // killed after timeout_seconds
    Skipped     // task was no longer pending, nothing was touched
};

[[nodiscard]] const char* outcomeName(ExecutionOutcome outcome) noexcept;

struct ExecutionResult {
    ExecutionOutcome outcome = ExecutionOutcome::Failed;
    std::optional<int> exitCode;
    std::string reason;
    bool started = false;  // the task was claimed, so end_time is owed

    [[nodiscard]] bool succeeded() const noexcept { return outcome == ExecutionOutcome::Completed; }
};

// Runs one task as `/bin/sh -c <command>` in its own process group and
// turns what happened into an ExecutionResult. Instances are shared by all
// workers; nothing here holds per-task state.
class Executor {
public:
    Executor(TaskStore& store, const Config& config, std::shared_ptr<Logger> logger);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Claims the task (pending -> running), stamps start_time, spawns and
    // waits. When `abort` becomes true the child is terminated early.
    [[nodiscard]] ExecutionResult execute(const Task& task, const std::atomic<bool>* abort = nullptr) noexcept;

    // Records end_time, exit_code and error, then applies the terminal
    // transition. A task cancelled meanwhile stays cancelled. Returns the
    // status the task ends in.
    Status finish(const Task& task, const ExecutionResult& result);

    // execute() followed by finish().
    Status run(const Task& task, const std::atomic<bool>* abort = nullptr);

private:
    [[nodiscard]] pid_t spawn(const Task& task) const;
    [[nodiscard]] ExecutionResult waitForExit(const Task& task, pid_t pid, const std::atomic<bool>* abort) const;
    // SIGTERM to the group, SIGKILL after the grace period, always reaps.
    void terminate(TaskId id, pid_t pid) const noexcept;
    [[nodiscard]] bool cancelledMeanwhile(TaskId id) const noexcept;

    TaskStore& store_;
    Config config_;
    std::shared_ptr<Logger> log_;
};

}
