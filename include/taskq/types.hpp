#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace taskq {

// Task lifecycle states.
enum class Status : std::uint8_t { Pending, Running, Completed, Cancelled, Failed };

// Monotonically assigned, never reused.
using TaskId = std::int64_t;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Environment snapshot, ordered so records are written deterministically.
using Environment = std::map<std::string, std::string>;

[[nodiscard]] const char* statusName(Status status) noexcept;
[[nodiscard]] std::optional<Status> parseStatus(const std::string& name) noexcept;

} // namespace taskq
