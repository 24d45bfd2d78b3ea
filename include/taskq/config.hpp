/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>

namespace taskq {

using Millis = std::chrono::milliseconds;

struct Config {
    std::filesystem::path home;

    // Admission control
    double cpuThreshold = 80.0;
    double memThreshold = 75.0;
    double nearOverloadMargin = 10.0;
    int batchSize = 5;
    int minWorkers = 1;
    int maxWorkers = 4;

    // Dispatcher pacing
    Millis overloadCooldown{30'000};
    Millis idleBackoffBase{1'000};
    Millis idleBackoffCeiling{60'000};
    Millis staggerDelay{200};
    Millis pollSlice{100};

    // Executor
    Millis killGrace{5'000};
    Millis waitPollInterval{20};
    bool terminateOnShutdown = false;

    // Resource monitor
    Millis cpuSampleWindow{1'000};

    // Defaults with TASKQ_* environment overrides applied.
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] std::filesystem::path tasksDir() const { return home / "tasks"; }
    [[nodiscard]] std::filesystem::path logsDir() const { return home / "logs"; }
    [[nodiscard]] std::filesystem::path statusFile() const { return home / "scheduler.status"; }
    [[nodiscard]] std::filesystem::path pidFile() const { return home / "scheduler.pid"; }
};

// ~/.taskq unless TASKQ_HOME is set
[[nodiscard]] std::filesystem::path defaultHome();

}
