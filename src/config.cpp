/*
 * taskq - Single-host task queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "taskq/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <pwd.h>
#include <unistd.h>

namespace taskq {

namespace {
long env_long(const char* name, long defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long parsed = std::stol(val);
        return parsed < 0 ? defv : parsed;
    } catch (...) {
        return defv;
    }
}

double env_percent(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        double parsed = std::stod(val);
        return (parsed <= 0.0 || parsed > 100.0) ? defv : parsed;
    } catch (...) {
        return defv;
    }
}

Millis env_millis(const char* name, Millis defv) {
    return Millis(env_long(name, defv.count()));
}

bool env_flag(const char* name, bool defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::string value(val);
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "no") return false;
    return defv;
}
}

std::filesystem::path defaultHome() {
    if (const char* env = std::getenv("TASKQ_HOME"); env && *env) {
        return std::filesystem::path(env);
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        if (const passwd* pw = ::getpwuid(::getuid())) {
            home = pw->pw_dir;
        }
    }
    if (!home || !*home) {
        return std::filesystem::current_path() / ".taskq";
    }
    return std::filesystem::path(home) / ".taskq";
}

Config Config::fromEnv() {
    Config config;
    config.home = defaultHome();

    config.cpuThreshold = env_percent("TASKQ_CPU_THRESHOLD", config.cpuThreshold);
    config.memThreshold = env_percent("TASKQ_MEM_THRESHOLD", config.memThreshold);
    config.nearOverloadMargin = static_cast<double>(
        env_long("TASKQ_NEAR_OVERLOAD_MARGIN", static_cast<long>(config.nearOverloadMargin)));
    config.batchSize = static_cast<int>(std::max(1L, env_long("TASKQ_BATCH_SIZE", config.batchSize)));
    config.minWorkers = static_cast<int>(std::max(1L, env_long("TASKQ_MIN_WORKERS", config.minWorkers)));
    config.maxWorkers = static_cast<int>(std::max(1L, env_long("TASKQ_MAX_WORKERS", config.maxWorkers)));
    if (config.minWorkers > config.maxWorkers) {
        config.minWorkers = config.maxWorkers;
    }

    config.overloadCooldown = env_millis("TASKQ_OVERLOAD_COOLDOWN_MS", config.overloadCooldown);
    config.idleBackoffBase = env_millis("TASKQ_IDLE_BACKOFF_BASE_MS", config.idleBackoffBase);
    config.idleBackoffCeiling = env_millis("TASKQ_IDLE_BACKOFF_MAX_MS", config.idleBackoffCeiling);
    if (config.idleBackoffBase.count() == 0) {
        config.idleBackoffBase = Millis(1);
    }
    if (config.idleBackoffCeiling < config.idleBackoffBase) {
        config.idleBackoffCeiling = config.idleBackoffBase;
    }
    config.staggerDelay = env_millis("TASKQ_STAGGER_MS", config.staggerDelay);
    config.killGrace = env_millis("TASKQ_KILL_GRACE_MS", config.killGrace);
    config.cpuSampleWindow = env_millis("TASKQ_CPU_SAMPLE_MS", config.cpuSampleWindow);
    config.terminateOnShutdown = env_flag("TASKQ_TERMINATE_ON_SHUTDOWN", config.terminateOnShutdown);

    return config;
}

}
