/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "taskq/store.hpp"

namespace taskq {

class Logger;

// Task table kept as one directory per task under tasks/<status>/<id>.
// Status changes are directory renames, so a transition is atomic and a
// stale compare-and-set simply fails to find its source.
class WorkspaceStore final : public TaskStore {
public:
    WorkspaceStore(const std::filesystem::path& root, std::shared_ptr<Logger> logger);

    WorkspaceStore(const WorkspaceStore&) = delete;
    WorkspaceStore& operator=(const WorkspaceStore&) = delete;
    WorkspaceStore(WorkspaceStore&&) = delete;
    WorkspaceStore& operator=(WorkspaceStore&&) = delete;

    void initialize() override;

    [[nodiscard]] TaskId insertTask(const TaskSpec& spec) override;
    [[nodiscard]] std::optional<Task> getTask(TaskId id) const override;
    [[nodiscard]] std::vector<Task> listTasks(const std::vector<Status>& filter = {}) const override;

    void updateStatus(TaskId id, Status status) override;
    [[nodiscard]] bool transition(TaskId id, Status from, Status to) override;

    void updatePid(TaskId id, int pid) override;
    void updateStartTime(TaskId id, Timestamp ts) override;
    void updateEndTime(TaskId id, Timestamp ts) override;
    void updateExitCode(TaskId id, int exitCode) override;
    void updateError(TaskId id, const std::string& error) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] bool isInitialized() const noexcept;

private:
    struct Location {
        Status status;
        std::filesystem::path dir;
    };

    [[nodiscard]] std::filesystem::path stateDir(Status status) const;
    [[nodiscard]] std::filesystem::path recordDir(Status status, TaskId id) const;
    [[nodiscard]] std::optional<Location> locate(TaskId id) const;
    [[nodiscard]] TaskId allocateId();
    [[nodiscard]] Task readRecord(const std::filesystem::path& dir, Status status, TaskId id) const;

    void writeField(TaskId id, const char* field, const std::string& value);
    void requireInitialized() const;

    std::filesystem::path root_;
    std::shared_ptr<Logger> log_;
    mutable std::mutex mutex_;
};

}
