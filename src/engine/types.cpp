#include "engine/types.hpp"

#include <random>

#include <fmt/format.h>

namespace wf::engine {

auto to_string(ExecutionStatus status) -> std::string_view {
  switch (status) {
    case ExecutionStatus::Running: return "RUNNING";
    case ExecutionStatus::Paused: return "PAUSED";
    case ExecutionStatus::Success: return "SUCCESS";
    case ExecutionStatus::Error: return "ERROR";
    case ExecutionStatus::Cancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

auto to_string(TaskStatus status) -> std::string_view {
  switch (status) {
    case TaskStatus::Waiting: return "WAITING";
    case TaskStatus::Running: return "RUNNING";
    case TaskStatus::Delayed: return "DELAYED";
    case TaskStatus::Success: return "SUCCESS";
    case TaskStatus::Error: return "ERROR";
  }
  return "UNKNOWN";
}

auto to_string(Outcome outcome) -> std::string_view {
  switch (outcome) {
    case Outcome::OnSuccess: return "on-success";
    case Outcome::OnError: return "on-error";
    case Outcome::OnComplete: return "on-complete";
  }
  return "unknown";
}

auto parse_execution_status(std::string_view text) -> Expected<ExecutionStatus> {
  if (text == "RUNNING") return ExecutionStatus::Running;
  if (text == "PAUSED") return ExecutionStatus::Paused;
  if (text == "SUCCESS") return ExecutionStatus::Success;
  if (text == "ERROR") return ExecutionStatus::Error;
  if (text == "CANCELLED") return ExecutionStatus::Cancelled;
  return tl::unexpected(
    make_error(ErrorCode::InvalidArgument, fmt::format("unknown execution status: {}", text)));
}

auto parse_task_status(std::string_view text) -> Expected<TaskStatus> {
  if (text == "WAITING") return TaskStatus::Waiting;
  if (text == "RUNNING") return TaskStatus::Running;
  if (text == "DELAYED") return TaskStatus::Delayed;
  if (text == "SUCCESS") return TaskStatus::Success;
  if (text == "ERROR") return TaskStatus::Error;
  return tl::unexpected(
    make_error(ErrorCode::InvalidArgument, fmt::format("unknown task status: {}", text)));
}

auto generate_uuid() -> std::string {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::uint64_t> dist;
  std::uint64_t hi = dist(rng);
  std::uint64_t lo = dist(rng);
  hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<std::uint32_t>(hi >> 32),
                     static_cast<std::uint32_t>((hi >> 16) & 0xffff),
                     static_cast<std::uint32_t>(hi & 0xffff),
                     static_cast<std::uint32_t>(lo >> 48),
                     lo & 0xffffffffffffULL);
}

auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto from_millis(std::int64_t millis) -> TimePoint {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis))};
}

}  // namespace wf::engine
