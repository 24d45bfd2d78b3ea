/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/pool.hpp"
#include "taskq/logger.hpp"

namespace taskq {

Pool::Pool(int workers, std::shared_ptr<Logger> logger) noexcept
    : workers_(workers < 1 ? 1 : workers), log_(std::move(logger)) {
    log_->debug("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(TaskProcessor processor) {
    if (running_.load()) {
        log_->warn("Pool already running");
        return false;
    }

    if (!processor) {
        log_->error("Invalid task processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        log_->info("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        log_->error("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    log_->debug("Stopping pool, waiting for " + std::to_string(occupied()) + " accepted task(s)...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    taskAvailable_.notify_all();

    // Workers drain the queue before leaving, so nothing accepted is dropped
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();
    running_.store(false);

    log_->info("Pool stopped");
}

bool Pool::trySubmit(const Task& task) noexcept {
    if (!running_.load() || shutdown_.load()) {
        log_->debug("Cannot submit task to stopped pool: " + std::to_string(task.id));
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (occupied_ >= static_cast<std::size_t>(workers_)) {
                return false;
            }
            taskQueue_.push(task);
            ++occupied_;
        }

        taskAvailable_.notify_one();
        log_->debug("Task queued: " + std::to_string(task.id));
        return true;
    } catch (...) {
        log_->error("Failed to queue task: " + std::to_string(task.id));
        return false;
    }
}

std::size_t Pool::occupied() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return occupied_;
}

void Pool::workerLoop(int workerId) {
    // Name this thread for logging
    setThreadName(getThreadName(workerId));
    log_->debug(getThreadName(workerId) + " thread started");

    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            // Wait for a task or shutdown signal
            taskAvailable_.wait(lock, [this] {
                return !taskQueue_.empty() || shutdown_.load();
            });

            if (taskQueue_.empty()) {
                break;  // shutdown with nothing left to run
            }

            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        // Process task outside of lock
        log_->debug(getThreadName(workerId) + " claimed task: " + std::to_string(task.id));

        try {
            processor_(task, workerId);
        } catch (const std::exception& e) {
            log_->error(getThreadName(workerId) + " task processing error: " +
                        std::string(e.what()) + " (task: " + std::to_string(task.id) + ")");
        } catch (...) {
            log_->error(getThreadName(workerId) + " unknown task processing error (task: " +
                        std::to_string(task.id) + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --occupied_;
        }
    }

    log_->debug(getThreadName(workerId) + " stopped");
}

}
