/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/task.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace taskq {

const char* statusName(Status status) noexcept {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Running: return "running";
        case Status::Completed: return "completed";
        case Status::Cancelled: return "cancelled";
        case Status::Failed: return "failed";
        default: return "unknown";
    }
}

std::optional<Status> parseStatus(const std::string& name) noexcept {
    if (name == "pending") return Status::Pending;
    if (name == "running") return Status::Running;
    if (name == "completed") return Status::Completed;
    if (name == "cancelled") return Status::Cancelled;
    if (name == "failed") return Status::Failed;
    return std::nullopt;
}

std::int64_t toMicros(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

Timestamp fromMicros(std::int64_t micros) noexcept {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros)));
}

std::string formatTimestamp(Timestamp ts) {
    auto time = Clock::to_time_t(ts);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::optional<std::string> environmentProblem(const Environment& env) {
    for (const auto& [key, value] : env) {
        if (key.empty()) {
            return std::string("environment variable with empty name");
        }
        if (key.find('=') != std::string::npos || key.find('\0') != std::string::npos) {
            return "invalid environment variable name: " + key;
        }
        if (value.find('\0') != std::string::npos) {
            return "environment variable " + key + " contains a NUL byte";
        }
    }
    return std::nullopt;
}

std::optional<std::string> workingDirectoryProblem(const std::filesystem::path& cwd) {
    if (cwd.empty()) {
        return std::string("working directory not set");
    }
    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec)) {
        return "working directory does not exist: " + cwd.string();
    }
    if (!std::filesystem::is_directory(cwd, ec)) {
        return "working directory is not a directory: " + cwd.string();
    }
    return std::nullopt;
}

}
