/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/resource_monitor.hpp"
#include "taskq/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace taskq {

namespace {
std::string readProcFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot read " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::string formatPercent(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << value << "%";
    return oss.str();
}
}

std::optional<CpuTimes> parseProcStat(const std::string& content) noexcept {
    try {
        std::istringstream input(content);
        std::string line;
        while (std::getline(input, line)) {
            std::istringstream fields(line);
            std::string label;
            fields >> label;
            if (label != "cpu") {
                continue;
            }
            // user nice system idle iowait irq softirq steal [guest guest_nice]
            std::vector<std::uint64_t> values;
            std::uint64_t value = 0;
            while (fields >> value) {
                values.push_back(value);
            }
            if (values.size() < 4) {
                return std::nullopt;
            }
            CpuTimes times;
            times.idle = values[3] + (values.size() > 4 ? values[4] : 0);
            // guest time is already folded into user/nice
            std::size_t counted = std::min<std::size_t>(values.size(), 8);
            for (std::size_t i = 0; i < counted; ++i) {
                times.total += values[i];
            }
            return times;
        }
    } catch (...) {
    }
    return std::nullopt;
}

std::optional<double> parseMeminfoUsage(const std::string& content) noexcept {
    try {
        std::istringstream input(content);
        std::string key;
        std::uint64_t value = 0;
        std::optional<std::uint64_t> total;
        std::optional<std::uint64_t> available;
        std::string line;
        while (std::getline(input, line)) {
            std::istringstream fields(line);
            if (!(fields >> key >> value)) {
                continue;
            }
            if (key == "MemTotal:") total = value;
            else if (key == "MemAvailable:") available = value;
        }
        if (!total || !available || *total == 0 || *available > *total) {
            return std::nullopt;
        }
        return 100.0 * static_cast<double>(*total - *available) / static_cast<double>(*total);
    } catch (...) {
        return std::nullopt;
    }
}

double cpuPercentBetween(const CpuTimes& before, const CpuTimes& after) noexcept {
    if (after.total <= before.total) {
        return 0.0;
    }
    double totalDelta = static_cast<double>(after.total - before.total);
    double idleDelta = after.idle >= before.idle ? static_cast<double>(after.idle - before.idle) : 0.0;
    double busy = 100.0 * (totalDelta - idleDelta) / totalDelta;
    return busy < 0.0 ? 0.0 : (busy > 100.0 ? 100.0 : busy);
}

ResourceMonitor::ResourceMonitor(std::shared_ptr<Logger> logger) : log_(std::move(logger)) {
}

bool ResourceMonitor::isOverloaded(double cpuThreshold, double memThreshold) noexcept {
    try {
        LoadSample load = sample();
        bool overloaded = load.cpuPercent > cpuThreshold || load.memoryPercent > memThreshold;
        log_->trace("Load cpu=" + formatPercent(load.cpuPercent) + " mem=" + formatPercent(load.memoryPercent));
        if (overloaded) {
            log_->info("System overloaded: cpu=" + formatPercent(load.cpuPercent) + " (limit " +
                       formatPercent(cpuThreshold) + "), mem=" + formatPercent(load.memoryPercent) +
                       " (limit " + formatPercent(memThreshold) + ")");
        }
        return overloaded;
    } catch (const std::exception& e) {
        log_->error("Resource sample failed, treating system as overloaded: " + std::string(e.what()));
        return true;
    } catch (...) {
        log_->error("Resource sample failed, treating system as overloaded");
        return true;
    }
}

bool ResourceMonitor::isNearOverload(double cpuThreshold, double memThreshold, double margin) noexcept {
    try {
        LoadSample load = sample();
        return load.cpuPercent > cpuThreshold - margin || load.memoryPercent > memThreshold - margin;
    } catch (const std::exception& e) {
        log_->warn("Resource sample failed, assuming near overload: " + std::string(e.what()));
        return true;
    } catch (...) {
        log_->warn("Resource sample failed, assuming near overload");
        return true;
    }
}

ProcResourceMonitor::ProcResourceMonitor(std::shared_ptr<Logger> logger, Millis window,
                                         std::filesystem::path procRoot)
    : ResourceMonitor(std::move(logger)), window_(window), procRoot_(std::move(procRoot)) {
}

LoadSample ProcResourceMonitor::sample() {
    CpuTimes before = readCpuTimes();
    std::this_thread::sleep_for(window_);
    CpuTimes after = readCpuTimes();

    LoadSample load;
    load.cpuPercent = cpuPercentBetween(before, after);
    load.memoryPercent = readMemoryPercent();
    return load;
}

CpuTimes ProcResourceMonitor::readCpuTimes() const {
    auto path = procRoot_ / "stat";
    auto times = parseProcStat(readProcFile(path));
    if (!times) {
        throw std::runtime_error("Unrecognised format in " + path.string());
    }
    return *times;
}

double ProcResourceMonitor::readMemoryPercent() const {
    auto path = procRoot_ / "meminfo";
    auto usage = parseMeminfoUsage(readProcFile(path));
    if (!usage) {
        throw std::runtime_error("Unrecognised format in " + path.string());
    }
    return *usage;
}

}
