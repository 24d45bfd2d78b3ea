/*
 * taskq - Command-line interface (taskq)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/config.hpp"
#include "taskq/logger.hpp"
#include "taskq/resource_monitor.hpp"
#include "taskq/run_state.hpp"
#include "taskq/scheduler.hpp"
#include "taskq/state_machine.hpp"
#include "taskq/submitter.hpp"
#include "taskq/workspace_store.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace taskq;

constexpr const char* VERSION = "0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void printUsage(const char* progName) {
    std::cout << "taskq - single-host task queue v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  init                          Create the task store\n";
    std::cout << "  submit [options] <command...> Queue a shell command\n";
    std::cout << "      --name <name>             Display name (default: first word of command)\n";
    std::cout << "      --priority <0-9>          Lower runs first (default: 5)\n";
    std::cout << "      --stdout <path>           Append stdout here (default: logs/<name>.out)\n";
    std::cout << "      --stderr <path>           Append stderr here (default: logs/<name>.err)\n";
    std::cout << "      --timeout <seconds>       Kill after this long, 0 = never (default: 0)\n";
    std::cout << "  list [--status s[,s...]]      List tasks in dispatch order\n";
    std::cout << "  show <id>                     Show every field of one task\n";
    std::cout << "  cancel <id>                   Cancel a pending or running task\n";
    std::cout << "  start [--workers <n>]         Run the scheduler in the foreground\n";
    std::cout << "  stop                          Ask a running scheduler to stop\n";
    std::cout << "  status                        Show whether the scheduler is running\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  TASKQ_HOME         State directory (default: ~/.taskq)\n";
    std::cout << "  TASKQ_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " submit --priority 1 --timeout 600 ./train.sh --epochs 3\n";
    std::cout << "  " << progName << " list --status pending,running\n";
    std::cout << "  " << progName << " start --workers 2\n";
}

int parseIntArg(const std::string& value, const std::string& what) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw UsageError("Invalid " + what + ": " + value);
    }
}

TaskId parseIdArg(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw UsageError("Expected exactly one task id");
    }
    try {
        std::size_t used = 0;
        long long id = std::stoll(args[0], &used);
        if (used != args[0].size() || id <= 0) {
            throw std::invalid_argument(args[0]);
        }
        return static_cast<TaskId>(id);
    } catch (const std::exception&) {
        throw UsageError("Invalid task id: " + args[0]);
    }
}

std::string optionValue(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw UsageError(args[i] + " requires a value");
    }
    return args[++i];
}

std::vector<Status> parseStatusList(const std::string& value) {
    std::vector<Status> statuses;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        auto status = parseStatus(item);
        if (!status) {
            throw UsageError("Unknown status: " + item);
        }
        statuses.push_back(*status);
    }
    if (statuses.empty()) {
        throw UsageError("--status needs at least one status");
    }
    return statuses;
}

std::string ellipsize(const std::string& value, std::size_t width) {
    if (value.size() <= width) return value;
    return value.substr(0, width - 3) + "...";
}

// ---------------------------------------------------------------------------

int cmdInit(const Config& config, WorkspaceStore& store) {
    store.initialize();
    std::error_code ec;
    std::filesystem::create_directories(config.logsDir(), ec);
    std::cout << "Task store initialized at " << config.home.string() << "\n";
    return kExitOk;
}

int cmdSubmit(const std::vector<std::string>& args, const Config& config,
              WorkspaceStore& store, const std::shared_ptr<Logger>& log) {
    TaskSpec spec;
    std::vector<std::string> words;
    bool optionsDone = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        // Options end at "--" or at the first word of the command
        if (optionsDone) {
            words.push_back(arg);
        } else if (arg == "--") {
            optionsDone = true;
        } else if (arg == "--name" || arg == "-n") {
            spec.name = optionValue(args, i);
        } else if (arg == "--priority" || arg == "-p") {
            spec.priority = parseIntArg(optionValue(args, i), "priority");
        } else if (arg == "--stdout") {
            spec.stdoutFile = std::filesystem::absolute(optionValue(args, i));
        } else if (arg == "--stderr") {
            spec.stderrFile = std::filesystem::absolute(optionValue(args, i));
        } else if (arg == "--timeout" || arg == "-t") {
            spec.timeoutSeconds = parseIntArg(optionValue(args, i), "timeout");
        } else {
            words.push_back(arg);
            optionsDone = true;
        }
    }

    if (words.empty()) {
        throw UsageError("submit needs a command");
    }
    std::ostringstream command;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) command << " ";
        command << words[i];
    }
    spec.command = command.str();
    spec.environment = Submitter::captureEnvironment();
    spec.cwd = std::filesystem::current_path();

    store.initialize();
    Submitter submitter(store, config.logsDir(), log);
    SubmitResult result = submitter.submit(spec);
    if (!result) {
        std::cerr << "Error: " << result.message << std::endl;
        return kExitError;
    }

    // Just the task ID - clean for piping
    std::cout << result.id << std::endl;
    return kExitOk;
}

int cmdList(const std::vector<std::string>& args, WorkspaceStore& store) {
    std::vector<Status> filter;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--status" || args[i] == "-s") {
            filter = parseStatusList(optionValue(args, i));
        } else {
            throw UsageError("Unexpected argument to list: " + args[i]);
        }
    }

    store.initialize();
    auto tasks = store.listTasks(filter);

    std::cout << std::left << std::setw(6) << "ID" << "  "
              << std::setw(20) << "NAME" << "  "
              << std::setw(3) << "PRI" << "  "
              << std::setw(19) << "CREATED" << "  "
              << "STATUS\n";
    for (const auto& task : tasks) {
        std::cout << std::left << std::setw(6) << task.id << "  "
                  << std::setw(20) << ellipsize(task.name, 20) << "  "
                  << std::setw(3) << task.priority << "  "
                  << std::setw(19) << formatTimestamp(task.createdAt) << "  "
                  << statusName(task.status) << "\n";
    }
    return kExitOk;
}

int cmdShow(const std::vector<std::string>& args, WorkspaceStore& store) {
    TaskId id = parseIdArg(args);
    store.initialize();
    auto task = store.getTask(id);
    if (!task) {
        std::cerr << "Error: Task " << id << " not found" << std::endl;
        return kExitError;
    }

    auto row = [](const char* label, const std::string& value) {
        std::cout << "  " << std::left << std::setw(12) << label << value << "\n";
    };
    row("id", std::to_string(task->id));
    row("name", task->name);
    row("command", task->command);
    row("status", statusName(task->status));
    row("priority", std::to_string(task->priority));
    row("created", formatTimestamp(task->createdAt));
    row("cwd", task->cwd.string());
    row("stdout", task->stdoutFile.string());
    row("stderr", task->stderrFile.string());
    row("timeout", task->hasTimeout() ? std::to_string(*task->timeoutSeconds) + "s" : "none");
    if (task->pid) row("pid", std::to_string(*task->pid));
    if (task->startTime) row("started", formatTimestamp(*task->startTime));
    if (task->endTime) row("ended", formatTimestamp(*task->endTime));
    if (task->startTime && task->endTime) {
        auto secs = std::chrono::duration<double>(*task->endTime - *task->startTime).count();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << secs << "s";
        row("duration", oss.str());
    }
    if (task->exitCode) row("exit code", std::to_string(*task->exitCode));
    if (task->error) row("error", *task->error);
    row("env vars", std::to_string(task->environment.size()));
    return kExitOk;
}

int cmdCancel(const std::vector<std::string>& args, WorkspaceStore& store, Logger& log) {
    TaskId id = parseIdArg(args);
    store.initialize();
    CancelResult result = cancelTask(store, id, log);
    if (!result) {
        std::cerr << "Error: " << result.message << std::endl;
        return kExitError;
    }
    std::cout << result.message;
    if (result.signalled) {
        std::cout << " (signalled running process)";
    }
    std::cout << std::endl;
    return kExitOk;
}

int cmdStart(const std::vector<std::string>& args, Config config, WorkspaceStore& store,
             FileRunState& runState, const std::shared_ptr<Logger>& log) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--workers" || args[i] == "-w") {
            int workers = parseIntArg(optionValue(args, i), "worker count");
            if (workers < 1 || workers > 64) {
                throw UsageError("Worker count must be between 1 and 64");
            }
            config.minWorkers = workers;
            config.maxWorkers = workers;
        } else {
            throw UsageError("Unexpected argument to start: " + args[i]);
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    ProcResourceMonitor monitor(log, config.cpuSampleWindow);
    Scheduler scheduler(store, runState, monitor, config, log);

    std::cout << "Scheduler starting (pid " << ::getpid() << ", home " << config.home.string() << ")" << std::endl;

    bool announced = false;
    ControlResult outcome = scheduler.runUntil([&announced] {
        if (!g_shutdown_requested) {
            return false;
        }
        if (!announced) {
            std::cout << "\nShutdown requested, stopping scheduler..." << std::endl;
            announced = true;
        }
        return true;
    });

    std::cout << outcome.message << std::endl;
    return kExitOk;
}

int cmdStop(Scheduler& scheduler) {
    ControlResult result = scheduler.stop();
    std::cout << result.message << std::endl;
    return kExitOk;
}

int cmdStatus(const Scheduler& scheduler) {
    std::cout << scheduler.status().describe() << std::endl;
    return kExitOk;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    // Anything after the command word may belong to a submitted command
    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (command == "-v" || command == "--version") {
        std::cout << VERSION << "\n";
        return kExitOk;
    }

    std::vector<std::string> args(argv + 2, argv + argc);

    // The scheduler reports progress at INFO; other commands stay quiet for
    // clean piping. TASKQ_LOG_LEVEL overrides both.
    auto log = Logger::fromEnv(command == "start" ? LogLevel::INFO : LogLevel::WARN);
    setThreadName("Main");

    try {
        Config config = Config::fromEnv();
        WorkspaceStore store(config.tasksDir(), log);
        FileRunState runState(config.statusFile(), config.pidFile(), log);

        if (command == "init") {
            if (!args.empty()) throw UsageError("init takes no arguments");
            return cmdInit(config, store);
        }
        if (command == "submit") {
            return cmdSubmit(args, config, store, log);
        }
        if (command == "list") {
            return cmdList(args, store);
        }
        if (command == "show") {
            return cmdShow(args, store);
        }
        if (command == "cancel") {
            return cmdCancel(args, store, *log);
        }
        if (command == "start") {
            return cmdStart(args, config, store, runState, log);
        }
        if (command == "stop" || command == "status") {
            if (!args.empty()) throw UsageError(command + " takes no arguments");
            ProcResourceMonitor monitor(log, config.cpuSampleWindow);
            Scheduler scheduler(store, runState, monitor, config, log);
            return command == "stop" ? cmdStop(scheduler) : cmdStatus(scheduler);
        }
        throw UsageError("Unknown command: " + command);

    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitError;
    }
}
