#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "engine/error.hpp"

namespace wf::engine {

using Json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Source of "now" for the engine; tests substitute a manual clock.
using ClockFn = std::function<TimePoint()>;
/// Source of fresh record ids.
using IdGenerator = std::function<std::string()>;

enum class ExecutionStatus {
  Running,
  Paused,
  Success,
  Error,
  Cancelled,
};

enum class TaskStatus {
  Waiting,
  Running,
  Delayed,
  Success,
  Error,
};

enum class Outcome {
  OnSuccess,
  OnError,
  OnComplete,
};

auto to_string(ExecutionStatus status) -> std::string_view;
auto to_string(TaskStatus status) -> std::string_view;
auto to_string(Outcome outcome) -> std::string_view;

auto parse_execution_status(std::string_view text) -> Expected<ExecutionStatus>;
auto parse_task_status(std::string_view text) -> Expected<TaskStatus>;

inline auto is_terminal(ExecutionStatus status) -> bool {
  return status == ExecutionStatus::Success || status == ExecutionStatus::Error ||
         status == ExecutionStatus::Cancelled;
}

inline auto is_terminal(TaskStatus status) -> bool {
  return status == TaskStatus::Success || status == TaskStatus::Error;
}

/// WAITING, RUNNING and DELAYED all keep an execution alive.
inline auto is_pending(TaskStatus status) -> bool { return !is_terminal(status); }

/// Random RFC 4122 version 4 identifier.
auto generate_uuid() -> std::string;

auto to_millis(TimePoint tp) -> std::int64_t;
auto from_millis(std::int64_t millis) -> TimePoint;

}  // namespace wf::engine
