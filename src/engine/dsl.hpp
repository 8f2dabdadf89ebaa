#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::engine {

enum class JoinKind {
  None,
  All,
  One,
  Count,
};

struct JoinPolicy {
  JoinKind kind = JoinKind::None;
  int count = 0;
};

/// Upper bound for a single retry delay; longer backoffs saturate here.
inline constexpr std::chrono::milliseconds kMaxRetryDelay = std::chrono::hours(24);

struct RetryPolicy {
  /// Total attempts including the first; 1 disables retries.
  int max_attempts = 1;
  std::chrono::milliseconds delay{0};
  double backoff = 1.0;

  /// Delay before attempt `attempt + 1` after attempt `attempt` failed,
  /// capped at kMaxRetryDelay.
  auto delay_after(int attempt) const -> std::chrono::milliseconds;
};

struct TaskDef {
  std::string name;
  std::string action;
  Json input = Json::object();
  RetryPolicy retry;
  JoinPolicy join;
  std::string with_items;
  int loop = 0;
  bool entry = false;
  std::vector<std::string> on_success;
  std::vector<std::string> on_error;
  std::vector<std::string> on_complete;
};

struct WorkflowDef {
  std::string name;
  int version = 1;
  std::vector<TaskDef> tasks;
};

auto parse_workflow_json(const Json& json) -> Expected<WorkflowDef>;

/// Canonical JSON form (used for hashing and round-tripping through storage).
auto workflow_to_json(const WorkflowDef& workflow) -> Json;

auto to_string(const JoinPolicy& join) -> std::string;

}  // namespace wf::engine
