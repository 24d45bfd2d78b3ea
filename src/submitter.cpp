/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/submitter.hpp"
#include "taskq/logger.hpp"
#include "taskq/store.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

extern char** environ;

namespace taskq {

namespace {
bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

// Keeps default log file names inside logs/
std::string safeFileName(const std::string& name) {
    std::string safe;
    safe.reserve(name.size());
    for (unsigned char c : name) {
        safe.push_back(std::isalnum(c) || c == '.' || c == '_' || c == '-' ? static_cast<char>(c) : '_');
    }
    if (safe.empty() || safe == "." || safe == "..") {
        safe = "task";
    }
    return safe;
}
}

Submitter::Submitter(TaskStore& store, const std::filesystem::path& logsDir, std::shared_ptr<Logger> logger)
    : store_(store), logsDir_(logsDir), log_(std::move(logger)) {
}

Environment Submitter::captureEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const char* eq = std::strchr(*entry, '=');
        if (!eq || eq == *entry) {
            continue;
        }
        env.emplace(std::string(*entry, static_cast<std::size_t>(eq - *entry)), std::string(eq + 1));
    }
    return env;
}

std::string Submitter::defaultName(const std::string& command) {
    std::istringstream words(command);
    std::string first;
    words >> first;
    auto base = std::filesystem::path(first).filename().string();
    return base.empty() ? "task" : base;
}

SubmitResult Submitter::reject(SubmissionError error, const std::string& message) const {
    log_->debug("Submission rejected: " + message);
    return {false, 0, error, message};
}

std::filesystem::path Submitter::defaultOutput(const std::string& name, const char* extension) const {
    return logsDir_ / (safeFileName(name) + extension);
}

SubmitResult Submitter::submit(TaskSpec spec) {
    if (spec.command.empty() || isBlank(spec.command)) {
        return reject(SubmissionError::InvalidCommand, "Command is empty");
    }
    if (spec.priority < kMinPriority || spec.priority > kMaxPriority) {
        return reject(SubmissionError::InvalidPriority,
                      "Priority must be between " + std::to_string(kMinPriority) + " and " +
                      std::to_string(kMaxPriority) + ", got " + std::to_string(spec.priority));
    }
    if (spec.timeoutSeconds < 0) {
        return reject(SubmissionError::InvalidTimeout,
                      "Timeout must not be negative, got " + std::to_string(spec.timeoutSeconds));
    }
    if (auto problem = workingDirectoryProblem(spec.cwd)) {
        return reject(SubmissionError::InvalidCwd, *problem);
    }
    if (!spec.cwd.is_absolute()) {
        return reject(SubmissionError::InvalidCwd, "Working directory must be absolute: " + spec.cwd.string());
    }
    if (auto problem = environmentProblem(spec.environment)) {
        return reject(SubmissionError::InvalidEnvironment, *problem);
    }

    if (isBlank(spec.name)) {
        spec.name = defaultName(spec.command);
    }
    if (spec.stdoutFile.empty()) {
        spec.stdoutFile = defaultOutput(spec.name, ".out");
    }
    if (spec.stderrFile.empty()) {
        spec.stderrFile = defaultOutput(spec.name, ".err");
    }
    for (const auto* path : {&spec.stdoutFile, &spec.stderrFile}) {
        if (!path->is_absolute()) {
            return reject(SubmissionError::InvalidOutputPath, "Output path must be absolute: " + path->string());
        }
        if (!path->has_filename()) {
            return reject(SubmissionError::InvalidOutputPath, "Output path names a directory: " + path->string());
        }
    }

    try {
        TaskId id = store_.insertTask(spec);
        log_->debug("Task submitted: " + std::to_string(id) + " " + spec.name + " (priority " +
                    std::to_string(spec.priority) + ")");
        return {true, id, SubmissionError::None, ""};
    } catch (const StoreError& e) {
        log_->error("Failed to store task: " + std::string(e.what()));
        return {false, 0, SubmissionError::StoreError, e.what()};
    }
}

}
