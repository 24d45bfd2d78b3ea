/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>

#include "taskq/config.hpp"
#include "taskq/executor.hpp"
#include "taskq/task.hpp"

namespace taskq {

class Logger;
class Pool;
class ResourceMonitor;
class RunStateStore;
class TaskStore;

// The scheduling loop. Each pass lists pending work in priority order,
// asks the resource monitor for permission and hands at most a batch of
// tasks to the worker pool. Runs until the run-state reads stopped.
class Dispatcher {
public:
    enum class Pass : uint8_t {
        Idle,        // nothing pending
        Overloaded,  // pending work held back by load
        Saturated,   // pending work but no free worker
        Dispatched   // at least one task released
    };

    Dispatcher(TaskStore& store, RunStateStore& runState, ResourceMonitor& monitor,
               const Config& config, std::shared_ptr<Logger> logger);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Blocks. Returns once the run-state leaves Running, or another process
    // owns it, and every task the loop released has finished.
    void run();

    // Worker count for this run: the minimum when load is already close to
    // a threshold, otherwise the maximum.
    [[nodiscard]] int chooseWorkerCount();

    // Doubles `current`, capped at `ceiling`.
    [[nodiscard]] static Millis nextBackoff(Millis current, Millis ceiling) noexcept;

    [[nodiscard]] std::size_t inFlight() const;

private:
    [[nodiscard]] Pass dispatchOnce(Pool& pool);
    void executeTask(const Task& task, int workerId);
    [[nodiscard]] bool isRunning() const noexcept;
    // Sleeps in pollSlice steps; false as soon as a stop is observed.
    bool sleepWhileRunning(Millis duration) const;
    void markStopped() noexcept;

    TaskStore& store_;
    RunStateStore& runState_;
    ResourceMonitor& monitor_;
    Config config_;
    std::shared_ptr<Logger> log_;
    Executor executor_;

    std::atomic<bool> terminating_{false};
    mutable std::atomic<bool> ownershipLost_{false};

    mutable std::mutex inFlightMutex_;
    std::unordered_set<TaskId> inFlight_;  // released to the pool, not yet finished
};

}
