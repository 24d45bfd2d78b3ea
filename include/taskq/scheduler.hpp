/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

#include "taskq/config.hpp"
#include "taskq/run_state.hpp"

namespace taskq {

class Logger;
class ResourceMonitor;
class TaskStore;

enum class ControlOutcome : uint8_t {
    Done,
    AlreadyRunning,
    NotRunning
};

struct ControlResult {
    ControlOutcome outcome = ControlOutcome::Done;
    std::string message;
    explicit operator bool() const noexcept { return outcome == ControlOutcome::Done; }
};

struct SchedulerStatus {
    RunState state = RunState::Stopped;
    std::optional<pid_t> owner;
    bool stale = false;  // marker says running but its owner is gone

    [[nodiscard]] std::string describe() const;
};

// start/stop/status over the run-state marker. start() runs the dispatcher
// on the calling thread; stop() only flips the marker, so it works from any
// process sharing the same home.
class Scheduler final {
public:
    Scheduler(TaskStore& store, RunStateStore& runState, ResourceMonitor& monitor,
              const Config& config, std::shared_ptr<Logger> logger);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Blocks until stopped. Returns AlreadyRunning when a live owner holds
    // the marker. Store failures propagate as StoreError.
    ControlResult start();
    ControlResult stop();

    // start() on a helper thread. Once `shutdownRequested` turns true the
    // stop is repeated until it lands, so a request that arrives before the
    // marker is claimed is not lost. Rethrows whatever start() threw.
    ControlResult runUntil(const std::function<bool()>& shutdownRequested,
                           Millis pollInterval = Millis(100));
    [[nodiscard]] SchedulerStatus status() const;

private:
    TaskStore& store_;
    RunStateStore& runState_;
    ResourceMonitor& monitor_;
    Config config_;
    std::shared_ptr<Logger> log_;
};

}
