/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/logger.hpp"
#include <iostream>
#include <cstdlib>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace taskq {

namespace {
std::mutex g_names_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;

std::string currentThreadName() {
    std::lock_guard<std::mutex> lock(g_names_mutex);
    auto tid = std::this_thread::get_id();
    auto it = g_thread_names.find(tid);
    if (it != g_thread_names.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}
}

Logger::Logger(LogLevel level, LogSink sink) noexcept
    : level_(level), sink_(std::move(sink)) {
}

std::shared_ptr<Logger> Logger::fromEnv(LogLevel fallback) {
    const char* env_val = std::getenv("TASKQ_LOG_LEVEL");
    LogLevel level = env_val ? parseLevel(env_val, fallback) : fallback;
    return std::make_shared<Logger>(level);
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return; // Skip if below threshold
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << currentThreadName() << "]";
        ss << " " << message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(level, ss.str());
        } else {
            std::cerr << ss.str() << std::endl;
        }
    } catch (...) {
        // Never throw from logging - would cause infinite loops
    }
}

LogLevel Logger::parseLevel(const std::string& value, LogLevel fallback) noexcept {
    // Case-insensitive comparison
    std::string level_str(value);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return fallback;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

// Helper function to name threads for better logging
void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_names_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

}
