/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/run_state.hpp"
#include "taskq/file_lock.hpp"
#include "taskq/logger.hpp"
#include "taskq/process.hpp"
#include "taskq/store.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <unistd.h>

namespace taskq {

namespace {
std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

void replaceFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    auto tmpPath = path.parent_path() / ("." + path.filename().string() + ".tmp." + std::to_string(::getpid()));
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file) {
            throw StoreError("Cannot write " + tmpPath.string());
        }
        file << content << "\n";
        file.flush();
        if (!file.good()) {
            throw StoreError("Short write to " + tmpPath.string());
        }
    }
    std::filesystem::rename(tmpPath, path);
}
}

const char* runStateName(RunState state) noexcept {
    return state == RunState::Running ? "running" : "stopped";
}

FileRunState::FileRunState(const std::filesystem::path& statusFile, const std::filesystem::path& pidFile,
                           std::shared_ptr<Logger> logger)
    : statusFile_(statusFile),
      pidFile_(pidFile),
      lockFile_(statusFile.parent_path() / ("." + statusFile.filename().string() + ".lock")),
      log_(std::move(logger)) {
}

RunState FileRunState::get() const {
    std::ifstream file(statusFile_);
    if (!file) {
        return RunState::Stopped;
    }
    std::string value;
    std::getline(file, value);
    return trim(value) == "running" ? RunState::Running : RunState::Stopped;
}

void FileRunState::set(RunState state) {
    try {
        std::filesystem::create_directories(statusFile_.parent_path());
        FileLock lock(lockFile_);
        write(state);
    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreError("Failed to write scheduler run-state: " + std::string(e.what()));
    }
}

bool FileRunState::claim() {
    try {
        std::filesystem::create_directories(statusFile_.parent_path());
        FileLock lock(lockFile_);
        if (get() == RunState::Running) {
            auto holder = owner();
            if (!holder || isProcessAlive(*holder)) {
                log_->debug("Scheduler run-state already held" +
                            (holder ? " by pid " + std::to_string(*holder) : std::string()));
                return false;
            }
        }
        write(RunState::Running);
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreError("Failed to claim scheduler run-state: " + std::string(e.what()));
    }
}

// Caller holds lockFile_.
void FileRunState::write(RunState state) {
    replaceFile(statusFile_, runStateName(state));
    if (state == RunState::Running) {
        replaceFile(pidFile_, std::to_string(::getpid()));
    } else {
        std::error_code ec;
        std::filesystem::remove(pidFile_, ec);
    }
    log_->debug(std::string("Scheduler run-state set to ") + runStateName(state));
}

std::optional<pid_t> FileRunState::owner() const {
    std::ifstream file(pidFile_);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

}
