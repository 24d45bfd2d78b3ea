/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "taskq/task.hpp"

namespace taskq {

class Logger;

using TaskProcessor = std::function<void(const Task&, int workerId)>;

// Fixed set of worker threads. Accepts a task only while some worker is
// free, so callers can leave the rest of their queue where it is.
class Pool {
public:
    Pool(int workers, std::shared_ptr<Logger> logger) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(TaskProcessor processor);
    // Runs everything already accepted to completion, then joins.
    void stop() noexcept;
    [[nodiscard]] bool trySubmit(const Task& task) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t occupied() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    std::shared_ptr<Logger> log_;
    TaskProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::queue<Task> taskQueue_;
    std::size_t occupied_ = 0;  // queued + executing

    std::vector<std::thread> workerThreads_;
};

}
