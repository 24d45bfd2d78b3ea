/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "taskq/task.hpp"

namespace taskq {

class Logger;
class TaskStore;

enum class SubmissionError : uint8_t {
    None = 0,
    InvalidCommand,
    InvalidPriority,
    InvalidTimeout,
    InvalidCwd,
    InvalidEnvironment,
    InvalidOutputPath,
    StoreError
};

struct SubmitResult {
    bool ok = false;
    TaskId id = 0;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Validates a TaskSpec, fills in defaults and inserts it as pending.
// Nothing reaches the store unless every check passes.
class Submitter final {
public:
    static constexpr int kMinPriority = 0;
    static constexpr int kMaxPriority = 9;

    Submitter(TaskStore& store, const std::filesystem::path& logsDir, std::shared_ptr<Logger> logger);

    Submitter(const Submitter&) = delete;
    Submitter& operator=(const Submitter&) = delete;

    [[nodiscard]] SubmitResult submit(TaskSpec spec);

    // The calling process's environment, as a child would inherit it.
    [[nodiscard]] static Environment captureEnvironment();
    // First word of the command without its directory.
    [[nodiscard]] static std::string defaultName(const std::string& command);

private:
    [[nodiscard]] SubmitResult reject(SubmissionError error, const std::string& message) const;
    [[nodiscard]] std::filesystem::path defaultOutput(const std::string& name, const char* extension) const;

    TaskStore& store_;
    std::filesystem::path logsDir_;
    std::shared_ptr<Logger> log_;
};

}
