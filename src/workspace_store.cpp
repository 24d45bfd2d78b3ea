/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/workspace_store.hpp"
#include "taskq/file_lock.hpp"
#include "taskq/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace taskq {

namespace {

constexpr std::array<Status, 5> kLifecycleOrder = {
    Status::Pending, Status::Running, Status::Completed, Status::Failed, Status::Cancelled
};

// A record can move between state directories while we read it.
constexpr int kLocateAttempts = 4;

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StoreError("Cannot read " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::optional<std::string> readOptionalFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    return readFile(path);
}

// Write to a sibling temp file, then rename over the target.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content) {
    auto tmpPath = path.parent_path() / ("." + path.filename().string() + ".tmp." + std::to_string(::getpid()));
    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::filesystem::filesystem_error("cannot create temp file", tmpPath,
                std::make_error_code(std::errc::no_such_file_or_directory));
        }
        file << content;
        file.flush();
        if (!file.good()) {
            throw std::filesystem::filesystem_error("short write", tmpPath,
                std::make_error_code(std::errc::io_error));
        }
    }
    std::filesystem::rename(tmpPath, path);
}

std::int64_t parseInteger(const std::string& text, const std::filesystem::path& source) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw StoreError("Corrupt field " + source.string() + ": '" + text + "'");
    }
}

std::string encodeEnvironment(const Environment& env) {
    std::string out;
    for (const auto& [key, value] : env) {
        out += key;
        out += '=';
        out += value;
        out += '\0';
    }
    return out;
}

Environment decodeEnvironment(const std::string& data) {
    Environment env;
    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t end = data.find('\0', pos);
        if (end == std::string::npos) {
            end = data.size();
        }
        std::string entry = data.substr(pos, end - pos);
        auto eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        pos = end + 1;
    }
    return env;
}

std::optional<TaskId> parseRecordName(const std::filesystem::path& dir) {
    const std::string name = dir.filename().string();
    if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<TaskId>(std::stoll(name));
    } catch (...) {
        return std::nullopt;
    }
}

bool isMissing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory;
}

}

WorkspaceStore::WorkspaceStore(const std::filesystem::path& root, std::shared_ptr<Logger> logger)
    : root_(root), log_(std::move(logger)) {
    log_->debug("WorkspaceStore created for: " + root_.string());
}

void WorkspaceStore::initialize() {
    try {
        std::filesystem::create_directories(root_ / "writing");
        for (Status status : kLifecycleOrder) {
            std::filesystem::create_directories(stateDir(status));
        }
        log_->debug("Task store ready: " + root_.string());
    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreError("Failed to initialize task store: " + std::string(e.what()));
    }
}

bool WorkspaceStore::isInitialized() const noexcept {
    std::error_code ec;
    for (Status status : kLifecycleOrder) {
        if (!std::filesystem::is_directory(stateDir(status), ec)) {
            return false;
        }
    }
    return std::filesystem::is_directory(root_ / "writing", ec);
}

void WorkspaceStore::requireInitialized() const {
    if (!isInitialized()) {
        throw StoreError("Task store not initialized: " + root_.string());
    }
}

std::filesystem::path WorkspaceStore::stateDir(Status status) const {
    return root_ / statusName(status);
}

std::filesystem::path WorkspaceStore::recordDir(Status status, TaskId id) const {
    return stateDir(status) / std::to_string(id);
}

std::optional<WorkspaceStore::Location> WorkspaceStore::locate(TaskId id) const {
    std::error_code ec;
    for (Status status : kLifecycleOrder) {
        auto dir = recordDir(status, id);
        if (std::filesystem::is_directory(dir, ec)) {
            return Location{status, dir};
        }
    }
    return std::nullopt;
}

TaskId WorkspaceStore::allocateId() {
    FileLock lock(root_ / ".lock");
    auto counterPath = root_ / "next_id";

    TaskId last = 0;
    if (auto text = readOptionalFile(counterPath)) {
        std::string trimmed = *text;
        trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(),
            [](unsigned char c) { return std::isspace(c); }), trimmed.end());
        if (!trimmed.empty()) {
            last = parseInteger(trimmed, counterPath);
        }
    }

    TaskId next = last + 1;
    try {
        writeFileAtomic(counterPath, std::to_string(next) + "\n");
    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreError("Failed to advance task counter: " + std::string(e.what()));
    }
    return next;
}

TaskId WorkspaceStore::insertTask(const TaskSpec& spec) {
    requireInitialized();

    TaskId id = allocateId();
    auto writingPath = root_ / "writing" / std::to_string(id);
    auto pendingPath = recordDir(Status::Pending, id);

    try {
        std::filesystem::create_directories(writingPath);

        writeFileAtomic(writingPath / "name", spec.name);
        writeFileAtomic(writingPath / "command", spec.command);
        writeFileAtomic(writingPath / "priority", std::to_string(spec.priority));
        writeFileAtomic(writingPath / "created_at", std::to_string(toMicros(Clock::now())));
        writeFileAtomic(writingPath / "cwd", spec.cwd.string());
        writeFileAtomic(writingPath / "stdout_file", spec.stdoutFile.string());
        writeFileAtomic(writingPath / "stderr_file", spec.stderrFile.string());
        writeFileAtomic(writingPath / "environ", encodeEnvironment(spec.environment));
        if (spec.timeoutSeconds > 0) {
            writeFileAtomic(writingPath / "timeout", std::to_string(spec.timeoutSeconds));
        }

        // Publishing is a single rename; readers never see a half-written record
        std::filesystem::rename(writingPath, pendingPath);
    } catch (const std::filesystem::filesystem_error& e) {
        std::error_code ec;
        std::filesystem::remove_all(writingPath, ec);
        throw StoreError("Failed to insert task " + std::to_string(id) + ": " + e.what());
    }

    log_->info("Task " + std::to_string(id) + " inserted: " + spec.name +
               " (priority=" + std::to_string(spec.priority) + ")");
    return id;
}

Task WorkspaceStore::readRecord(const std::filesystem::path& dir, Status status, TaskId id) const {
    Task task;
    task.id = id;
    task.status = status;
    task.name = readFile(dir / "name");
    task.command = readFile(dir / "command");
    task.priority = static_cast<int>(parseInteger(readFile(dir / "priority"), dir / "priority"));
    task.createdAt = fromMicros(parseInteger(readFile(dir / "created_at"), dir / "created_at"));
    task.cwd = readFile(dir / "cwd");
    task.stdoutFile = readFile(dir / "stdout_file");
    task.stderrFile = readFile(dir / "stderr_file");
    task.environment = decodeEnvironment(readFile(dir / "environ"));

    if (auto text = readOptionalFile(dir / "timeout")) {
        task.timeoutSeconds = static_cast<int>(parseInteger(*text, dir / "timeout"));
    }
    if (auto text = readOptionalFile(dir / "pid")) {
        task.pid = static_cast<int>(parseInteger(*text, dir / "pid"));
    }
    if (auto text = readOptionalFile(dir / "start_time")) {
        task.startTime = fromMicros(parseInteger(*text, dir / "start_time"));
    }
    if (auto text = readOptionalFile(dir / "end_time")) {
        task.endTime = fromMicros(parseInteger(*text, dir / "end_time"));
    }
    if (auto text = readOptionalFile(dir / "exit_code")) {
        task.exitCode = static_cast<int>(parseInteger(*text, dir / "exit_code"));
    }
    if (auto text = readOptionalFile(dir / "error")) {
        task.error = *text;
    }
    return task;
}

std::optional<Task> WorkspaceStore::getTask(TaskId id) const {
    requireInitialized();

    for (int attempt = 0; attempt < kLocateAttempts; ++attempt) {
        auto location = locate(id);
        if (!location) {
            return std::nullopt;
        }
        try {
            return readRecord(location->dir, location->status, id);
        } catch (const StoreError&) {
            // Moved mid-read: look again, otherwise the record is damaged
            std::error_code ec;
            if (std::filesystem::is_directory(location->dir, ec)) {
                throw;
            }
            log_->trace("Task " + std::to_string(id) + " moved while reading, retrying");
        }
    }
    throw StoreError("Task " + std::to_string(id) + " kept moving while being read");
}

std::vector<Task> WorkspaceStore::listTasks(const std::vector<Status>& filter) const {
    requireInitialized();

    // Scan in lifecycle order so a record moving forward is seen at least once;
    // a later sighting replaces an earlier one.
    std::map<TaskId, Task> byId;
    for (Status status : kLifecycleOrder) {
        if (!filter.empty() && std::find(filter.begin(), filter.end(), status) == filter.end()) {
            continue;
        }
        std::error_code ec;
        std::filesystem::directory_iterator it(stateDir(status), ec);
        if (ec) {
            throw StoreError("Cannot list " + stateDir(status).string() + ": " + ec.message());
        }
        for (const auto& entry : it) {
            auto id = parseRecordName(entry.path());
            if (!id) {
                continue;
            }
            try {
                byId[*id] = readRecord(entry.path(), status, *id);
            } catch (const StoreError& e) {
                std::error_code existsEc;
                if (std::filesystem::is_directory(entry.path(), existsEc)) {
                    log_->warn("Skipping unreadable task record: " + std::string(e.what()));
                }
            }
        }
    }

    std::vector<Task> tasks;
    tasks.reserve(byId.size());
    for (auto& [id, task] : byId) {
        if (filter.empty() || std::find(filter.begin(), filter.end(), task.status) != filter.end()) {
            tasks.push_back(std::move(task));
        }
    }

    std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    return tasks;
}

void WorkspaceStore::updateStatus(TaskId id, Status status) {
    requireInitialized();
    std::lock_guard<std::mutex> lock(mutex_);

    for (int attempt = 0; attempt < kLocateAttempts; ++attempt) {
        auto location = locate(id);
        if (!location) {
            throw StoreError("Task " + std::to_string(id) + " not found");
        }
        if (location->status == status) {
            return;
        }
        std::error_code ec;
        std::filesystem::rename(location->dir, recordDir(status, id), ec);
        if (!ec) {
            log_->debug("Task " + std::to_string(id) + " status " +
                        statusName(location->status) + " -> " + statusName(status));
            return;
        }
        if (!isMissing(ec)) {
            throw StoreError("Failed to update status of task " + std::to_string(id) + ": " + ec.message());
        }
    }
    throw StoreError("Task " + std::to_string(id) + " kept moving during status update");
}

bool WorkspaceStore::transition(TaskId id, Status from, Status to) {
    requireInitialized();
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::rename(recordDir(from, id), recordDir(to, id), ec);
    if (ec) {
        if (isMissing(ec)) {
            log_->debug("Task " + std::to_string(id) + " not " + statusName(from) +
                        ", transition to " + statusName(to) + " refused");
            return false;
        }
        throw StoreError("Failed to move task " + std::to_string(id) + " to " +
                         statusName(to) + ": " + ec.message());
    }
    log_->debug("Task " + std::to_string(id) + " status " + statusName(from) + " -> " + statusName(to));
    return true;
}

void WorkspaceStore::writeField(TaskId id, const char* field, const std::string& value) {
    requireInitialized();
    std::lock_guard<std::mutex> lock(mutex_);

    for (int attempt = 0; attempt < kLocateAttempts; ++attempt) {
        auto location = locate(id);
        if (!location) {
            throw StoreError("Task " + std::to_string(id) + " not found");
        }
        try {
            writeFileAtomic(location->dir / field, value);
            return;
        } catch (const std::filesystem::filesystem_error& e) {
            std::error_code ec;
            if (std::filesystem::is_directory(location->dir, ec)) {
                throw StoreError("Failed to write " + std::string(field) + " of task " +
                                 std::to_string(id) + ": " + e.what());
            }
            // Another process moved the record, follow it
        }
    }
    throw StoreError("Task " + std::to_string(id) + " kept moving while writing " + field);
}

void WorkspaceStore::updatePid(TaskId id, int pid) {
    writeField(id, "pid", std::to_string(pid));
}

void WorkspaceStore::updateStartTime(TaskId id, Timestamp ts) {
    writeField(id, "start_time", std::to_string(toMicros(ts)));
}

void WorkspaceStore::updateEndTime(TaskId id, Timestamp ts) {
    writeField(id, "end_time", std::to_string(toMicros(ts)));
}

void WorkspaceStore::updateExitCode(TaskId id, int exitCode) {
    writeField(id, "exit_code", std::to_string(exitCode));
}

void WorkspaceStore::updateError(TaskId id, const std::string& error) {
    writeField(id, "error", error);
}

}
