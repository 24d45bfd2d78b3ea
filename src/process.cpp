/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>

namespace taskq {

bool isProcessAlive(pid_t pid) noexcept {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

bool signalTaskProcess(pid_t pid, int signal, std::string& error) noexcept {
    if (pid <= 0) {
        error = "invalid pid " + std::to_string(pid);
        return false;
    }
    // Children are spawned as process group leaders so shell pipelines die too
    if (::kill(-pid, signal) == 0) {
        return true;
    }
    if (errno == ESRCH && ::kill(pid, signal) == 0) {
        return true;
    }
    error = std::strerror(errno);
    return false;
}

}
