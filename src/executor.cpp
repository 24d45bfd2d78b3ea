/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/executor.hpp"
#include "taskq/logger.hpp"
#include "taskq/process.hpp"
#include "taskq/store.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr const char* kShell = "/bin/sh";
constexpr int kCancelCheckEvery = 25;  // wait polls between cancellation checks

// Reported by the child through the CLOEXEC pipe when it cannot exec.
enum ChildStage : int { StageChdir = 1, StageRedirect = 2, StageExec = 3 };

struct ChildFailure {
    int stage;
    int error;
};

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

std::system_error systemError(int error, const std::string& what) {
    return std::system_error(error, std::generic_category(), what);
}

int openOutput(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        // open() below reports the real problem if this failed
    }
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw systemError(errno, "Cannot open " + path.string());
    }
    return fd;
}

std::string describeStage(int stage) {
    switch (stage) {
        case StageChdir: return "Cannot change directory";
        case StageRedirect: return "Cannot redirect output";
        case StageExec: return std::string("Cannot execute ") + kShell;
        default: return "Cannot start task";
    }
}

void pause(taskq::Millis interval) {
    std::this_thread::sleep_for(interval);
}

}

namespace taskq {

const char* outcomeName(ExecutionOutcome outcome) noexcept {
    switch (outcome) {
        case ExecutionOutcome::Completed: return "completed";
        case ExecutionOutcome::Failed: return "failed";
        case ExecutionOutcome::TimedOut: return "timed out";
        case ExecutionOutcome::Skipped: return "skipped";
        default: return "unknown";
    }
}

Executor::Executor(TaskStore& store, const Config& config, std::shared_ptr<Logger> logger)
    : store_(store), config_(config), log_(std::move(logger)) {
}

ExecutionResult Executor::execute(const Task& task, const std::atomic<bool>* abort) noexcept {
    ExecutionResult result;
    const std::string label = "Task " + std::to_string(task.id);

    // Step 1: claim. Losing the race means someone else owns the task now.
    try {
        if (!store_.transition(task.id, Status::Pending, Status::Running)) {
            log_->debug(label + " is no longer pending, skipping");
            result.outcome = ExecutionOutcome::Skipped;
            result.reason = "task is no longer pending";
            return result;
        }
    } catch (const std::exception& e) {
        log_->error(label + " could not be claimed: " + std::string(e.what()));
        result.outcome = ExecutionOutcome::Skipped;
        result.reason = e.what();
        return result;
    }
    result.started = true;

    // Step 2: stamp, validate, spawn
    pid_t pid = -1;
    try {
        store_.updateStartTime(task.id, Clock::now());

        std::optional<std::string> problem = workingDirectoryProblem(task.cwd);
        if (!problem) {
            problem = environmentProblem(task.environment);
        }
        if (!problem && task.command.empty()) {
            problem = "empty command";
        }
        if (problem) {
            log_->warn(label + " rejected before spawn: " + *problem);
            result.outcome = ExecutionOutcome::Failed;
            result.reason = *problem;
            return result;
        }

        pid = spawn(task);
    } catch (const std::exception& e) {
        log_->error(label + " failed to start: " + std::string(e.what()));
        result.outcome = ExecutionOutcome::Failed;
        result.reason = e.what();
        return result;
    }

    log_->info(label + " started (pid " + std::to_string(pid) + "): " + task.command);

    try {
        store_.updatePid(task.id, static_cast<int>(pid));
    } catch (const std::exception& e) {
        log_->warn(label + " pid not recorded, cancel cannot signal it: " + std::string(e.what()));
    }

    // A cancel that landed between the claim and the pid write had nothing to signal
    if (cancelledMeanwhile(task.id)) {
        log_->info(label + " was cancelled before its child started, terminating pid " + std::to_string(pid));
        terminate(task.id, pid);
        result.outcome = ExecutionOutcome::Failed;
        result.reason = "cancelled";
        return result;
    }

    // Step 3: wait
    try {
        ExecutionResult waited = waitForExit(task, pid, abort);
        waited.started = true;
        return waited;
    } catch (const std::exception& e) {
        log_->error(label + " lost while waiting: " + std::string(e.what()));
        terminate(task.id, pid);
        result.outcome = ExecutionOutcome::Failed;
        result.reason = e.what();
        return result;
    }
}

Status Executor::finish(const Task& task, const ExecutionResult& result) {
    const std::string label = "Task " + std::to_string(task.id);

    if (result.outcome == ExecutionOutcome::Skipped || !result.started) {
        auto current = store_.getTask(task.id);
        return current ? current->status : task.status;
    }

    store_.updateEndTime(task.id, Clock::now());
    if (result.exitCode) {
        store_.updateExitCode(task.id, *result.exitCode);
    }
    if (!result.succeeded()) {
        store_.updateError(task.id, result.reason);
    }

    Status target = result.succeeded() ? Status::Completed : Status::Failed;
    if (store_.transition(task.id, Status::Running, target)) {
        if (target == Status::Completed) {
            log_->info("TASK COMPLETED: " + std::to_string(task.id) + " (" + task.name + ")");
        } else {
            log_->warn("TASK FAILED: " + std::to_string(task.id) + " (" + task.name + ") - " + result.reason);
        }
        return target;
    }

    auto current = store_.getTask(task.id);
    Status actual = current ? current->status : target;
    if (actual == Status::Cancelled) {
        log_->info(label + " was cancelled while running, keeping cancelled");
    } else {
        log_->warn(label + " left running before it finished, now " + statusName(actual));
    }
    return actual;
}

Status Executor::run(const Task& task, const std::atomic<bool>* abort) {
    return finish(task, execute(task, abort));
}

pid_t Executor::spawn(const Task& task) const {
    // Everything the child needs is prepared here; after fork it only makes
    // async-signal-safe calls.
    FileDescriptor out(openOutput(task.stdoutFile));
    FileDescriptor err(openOutput(task.stderrFile));
    FileDescriptor in(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) {
        throw systemError(errno, "Cannot open /dev/null");
    }

    std::vector<std::string> entries;
    entries.reserve(task.environment.size());
    for (const auto& [key, value] : task.environment) {
        entries.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(entries.size() + 1);
    for (auto& entry : entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string command = task.command;
    std::string shellName = "sh";
    std::string flag = "-c";
    char* argv[] = {shellName.data(), flag.data(), command.data(), nullptr};
    std::string cwd = task.cwd.string();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw systemError(errno, "Cannot create status pipe");
    }
    FileDescriptor statusRead(fds[0]);
    FileDescriptor statusWrite(fds[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw systemError(errno, "fork failed");
    }

    if (pid == 0) {
        auto report = [&](int stage) {
            ChildFailure failure{stage, errno};
            ssize_t ignored = ::write(statusWrite.get(), &failure, sizeof(failure));
            (void)ignored;
            ::_exit(127);
        };

        ::setpgid(0, 0);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);

        if (::chdir(cwd.c_str()) != 0) {
            report(StageChdir);
        }
        if (::dup2(in.get(), STDIN_FILENO) < 0 ||
            ::dup2(out.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err.get(), STDERR_FILENO) < 0) {
            report(StageRedirect);
        }
        ::execve(kShell, argv, envp.data());
        report(StageExec);
        ::_exit(127);
    }

    // Both sides set the group so signals work before the child runs
    ::setpgid(pid, pid);
    statusWrite.reset();

    ChildFailure failure{0, 0};
    ssize_t n;
    do {
        n = ::read(statusRead.get(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw systemError(failure.error, describeStage(failure.stage));
    }

    return pid;
}

ExecutionResult Executor::waitForExit(const Task& task, pid_t pid, const std::atomic<bool>* abort) const {
    const std::string label = "Task " + std::to_string(task.id);
    const auto started = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (task.hasTimeout()) {
        deadline = started + std::chrono::seconds(*task.timeoutSeconds);
    }

    ExecutionResult result;
    result.started = true;
    int polls = 0;

    while (true) {
        int status = 0;
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw systemError(errno, "waitpid failed for pid " + std::to_string(pid));
        }

        if (reaped == pid) {
            // Sweep anything the shell left behind in its group
            ::kill(-pid, SIGKILL);

            if (WIFEXITED(status)) {
                int code = WEXITSTATUS(status);
                result.exitCode = code;
                if (code == 0) {
                    result.outcome = ExecutionOutcome::Completed;
                } else {
                    result.outcome = ExecutionOutcome::Failed;
                    result.reason = "exited with status " + std::to_string(code);
                }
            } else if (WIFSIGNALED(status)) {
                int sig = WTERMSIG(status);
                result.exitCode = 128 + sig;
                result.outcome = ExecutionOutcome::Failed;
                result.reason = "terminated by signal " + std::to_string(sig) + " (" + ::strsignal(sig) + ")";
            } else {
                result.outcome = ExecutionOutcome::Failed;
                result.reason = "ended with wait status " + std::to_string(status);
            }

            auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            log_->debug(label + " pid " + std::to_string(pid) + " " + outcomeName(result.outcome) +
                        " after " + std::to_string(elapsed) + "s");
            return result;
        }

        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            log_->warn(label + " exceeded its timeout of " + std::to_string(*task.timeoutSeconds) +
                       "s, terminating pid " + std::to_string(pid));
            terminate(task.id, pid);
            result.outcome = ExecutionOutcome::TimedOut;
            result.reason = "timed out after " + std::to_string(*task.timeoutSeconds) + "s";
            return result;
        }

        if (abort && abort->load()) {
            log_->info(label + " terminated for scheduler shutdown");
            terminate(task.id, pid);
            result.outcome = ExecutionOutcome::Failed;
            result.reason = "terminated by scheduler shutdown";
            return result;
        }

        if (++polls % kCancelCheckEvery == 0 && cancelledMeanwhile(task.id)) {
            log_->info(label + " cancelled, making sure pid " + std::to_string(pid) + " is gone");
            terminate(task.id, pid);
            result.outcome = ExecutionOutcome::Failed;
            result.reason = "cancelled";
            return result;
        }

        pause(config_.waitPollInterval);
    }
}

void Executor::terminate(TaskId id, pid_t pid) const noexcept {
    const std::string label = "Task " + std::to_string(id);
    std::string error;

    if (!signalTaskProcess(pid, SIGTERM, error)) {
        log_->debug(label + " SIGTERM to pid " + std::to_string(pid) + " failed: " + error);
    }

    bool reaped = false;
    const auto graceEnd = std::chrono::steady_clock::now() + config_.killGrace;
    while (std::chrono::steady_clock::now() < graceEnd) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) {
            reaped = true;
            break;
        }
        pause(config_.waitPollInterval);
    }

    if (reaped) {
        // Leader gone; only the group can still hold stragglers
        ::kill(-pid, SIGKILL);
        return;
    }

    log_->warn(label + " pid " + std::to_string(pid) + " ignored SIGTERM for " +
               std::to_string(config_.killGrace.count()) + "ms, sending SIGKILL");
    if (!signalTaskProcess(pid, SIGKILL, error)) {
        log_->error(label + " SIGKILL to pid " + std::to_string(pid) + " failed: " + error);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            log_->error(label + " could not reap pid " + std::to_string(pid) + ": " + std::strerror(errno));
            break;
        }
    }
}

bool Executor::cancelledMeanwhile(TaskId id) const noexcept {
    try {
        auto current = store_.getTask(id);
        return current && current->status == Status::Cancelled;
    } catch (const std::exception& e) {
        log_->debug("Task " + std::to_string(id) + " status check failed: " + std::string(e.what()));
        return false;
    }
}

}
