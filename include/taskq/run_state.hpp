/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <sys/types.h>

namespace taskq {

class Logger;

enum class RunState : uint8_t { Stopped, Running };

[[nodiscard]] const char* runStateName(RunState state) noexcept;

// Where the dispatcher's run flag lives. Separate invocations of the CLI
// observe and flip the same flag through it.
class RunStateStore {
public:
    virtual ~RunStateStore() = default;

    [[nodiscard]] virtual RunState get() const = 0;
    virtual void set(RunState state) = 0;

    // Sets Running for the calling process unless a live owner already
    // holds the marker. Check and write happen as one step.
    [[nodiscard]] virtual bool claim() = 0;

    // Process that last set Running, when the implementation tracks it.
    [[nodiscard]] virtual std::optional<pid_t> owner() const { return std::nullopt; }
};

class MemoryRunState final : public RunStateStore {
public:
    [[nodiscard]] RunState get() const override { return state_.load(); }
    void set(RunState state) override { state_.store(state); }
    [[nodiscard]] bool claim() override {
        RunState expected = RunState::Stopped;
        return state_.compare_exchange_strong(expected, RunState::Running);
    }

private:
    std::atomic<RunState> state_{RunState::Stopped};
};

// scheduler.status holds "running" or "stopped"; scheduler.pid names the
// owner while running. A missing status file reads as stopped. Writers
// serialise on an flock beside the status file.
class FileRunState final : public RunStateStore {
public:
    FileRunState(const std::filesystem::path& statusFile, const std::filesystem::path& pidFile,
                 std::shared_ptr<Logger> logger);

    [[nodiscard]] RunState get() const override;
    void set(RunState state) override;
    [[nodiscard]] bool claim() override;
    [[nodiscard]] std::optional<pid_t> owner() const override;

private:
    void write(RunState state);

    std::filesystem::path statusFile_;
    std::filesystem::path pidFile_;
    std::filesystem::path lockFile_;
    std::shared_ptr<Logger> log_;
};

}
