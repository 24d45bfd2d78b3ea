/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace taskq {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Receives fully formatted lines. Called under the logger's mutex.
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

class Logger {
public:
    // A null sink writes to stderr - stdout stays clean for CLI output
    explicit Logger(LogLevel level = LogLevel::INFO, LogSink sink = nullptr) noexcept;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Level from TASKQ_LOG_LEVEL, falling back to `fallback`
    [[nodiscard]] static std::shared_ptr<Logger> fromEnv(LogLevel fallback = LogLevel::INFO);
    [[nodiscard]] static LogLevel parseLevel(const std::string& value, LogLevel fallback) noexcept;

    void setLevel(LogLevel level) noexcept { level_.store(level); }
    [[nodiscard]] LogLevel level() const noexcept { return level_.load(); }
    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return static_cast<uint8_t>(level) <= static_cast<uint8_t>(level_.load());
    }

    void log(LogLevel level, const std::string& message) noexcept;

    void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static const char* levelToString(LogLevel level) noexcept;

    std::atomic<LogLevel> level_;
    LogSink sink_;
    std::mutex mutex_;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

}
