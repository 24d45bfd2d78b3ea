/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "taskq/types.hpp"

namespace taskq {

// Everything a submitter decides. Immutable once inserted.
struct TaskSpec {
    std::string name;
    std::string command;
    int priority = 5;
    Environment environment;
    std::filesystem::path cwd;
    std::filesystem::path stdoutFile;
    std::filesystem::path stderrFile;
    int timeoutSeconds = 0;  // 0 = unbounded
};

struct Task {
    TaskId id = 0;
    std::string name;
    std::string command;
    int priority = 0;
    Timestamp createdAt;
    Status status = Status::Pending;
    Environment environment;
    std::filesystem::path cwd;
    std::filesystem::path stdoutFile;
    std::filesystem::path stderrFile;
    std::optional<int> pid;
    std::optional<int> timeoutSeconds;
    std::optional<Timestamp> startTime;
    std::optional<Timestamp> endTime;
    std::optional<int> exitCode;
    std::optional<std::string> error;

    [[nodiscard]] bool hasTimeout() const noexcept {
        return timeoutSeconds.has_value() && *timeoutSeconds > 0;
    }
};

// Microseconds since the Unix epoch; the on-disk timestamp encoding.
[[nodiscard]] std::int64_t toMicros(Timestamp ts) noexcept;
[[nodiscard]] Timestamp fromMicros(std::int64_t micros) noexcept;

// Local time, "YYYY-mm-dd HH:MM:SS".
[[nodiscard]] std::string formatTimestamp(Timestamp ts);

// Shape checks shared by submission and execution. nullopt means valid.
[[nodiscard]] std::optional<std::string> environmentProblem(const Environment& env);
[[nodiscard]] std::optional<std::string> workingDirectoryProblem(const std::filesystem::path& cwd);

}
