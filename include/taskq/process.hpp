/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <sys/types.h>

namespace taskq {

// kill(pid, 0) semantics: EPERM still means the process exists.
[[nodiscard]] bool isProcessAlive(pid_t pid) noexcept;

// Signals the process group led by `pid`, falling back to the process
// itself when no such group exists. On failure `error` gets strerror text.
[[nodiscard]] bool signalTaskProcess(pid_t pid, int signal, std::string& error) noexcept;

}
