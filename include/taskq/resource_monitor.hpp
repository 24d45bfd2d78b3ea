/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "taskq/config.hpp"

namespace taskq {

class Logger;

struct LoadSample {
    double cpuPercent = 0.0;
    double memoryPercent = 0.0;
};

// Aggregate jiffies from the first "cpu" line of /proc/stat.
struct CpuTimes {
    std::uint64_t idle = 0;
    std::uint64_t total = 0;
};

[[nodiscard]] std::optional<CpuTimes> parseProcStat(const std::string& content) noexcept;
// Used percentage from MemTotal/MemAvailable.
[[nodiscard]] std::optional<double> parseMeminfoUsage(const std::string& content) noexcept;
[[nodiscard]] double cpuPercentBetween(const CpuTimes& before, const CpuTimes& after) noexcept;

class ResourceMonitor {
public:
    explicit ResourceMonitor(std::shared_ptr<Logger> logger);
    virtual ~ResourceMonitor() = default;

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    // Throws when the load cannot be measured.
    [[nodiscard]] virtual LoadSample sample() = 0;

    // Fails closed: a sample that cannot be taken reports overloaded.
    [[nodiscard]] bool isOverloaded(double cpuThreshold, double memThreshold) noexcept;

    // Within `margin` points of either threshold. Also fails closed.
    [[nodiscard]] bool isNearOverload(double cpuThreshold, double memThreshold, double margin) noexcept;

protected:
    std::shared_ptr<Logger> log_;
};

// Reads /proc/stat twice, `window` apart, and /proc/meminfo once.
class ProcResourceMonitor final : public ResourceMonitor {
public:
    ProcResourceMonitor(std::shared_ptr<Logger> logger, Millis window,
                        std::filesystem::path procRoot = "/proc");

    [[nodiscard]] LoadSample sample() override;

private:
    [[nodiscard]] CpuTimes readCpuTimes() const;
    [[nodiscard]] double readMemoryPercent() const;

    Millis window_;
    std::filesystem::path procRoot_;
};

}
