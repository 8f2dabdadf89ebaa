#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "engine/definition_store.hpp"
#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::engine {

/// One run of a workflow definition.
struct Execution {
  std::string id;
  DefinitionId definition;
  Json input = Json::object();
  ExecutionStatus status = ExecutionStatus::Running;
  /// Set on the terminal transition: the leaf result on SUCCESS, the
  /// originating error on ERROR, the cancellation reason on CANCELLED.
  Json output;
  /// Published task results, `{"tasks": {name: result}}`.
  Json context = Json::object();
  /// Predecessors that fired a transition into a not yet spawned group,
  /// keyed by group id.
  std::map<std::string, std::vector<std::string>> join_arrivals;
  /// Current iteration (re-entry count) per task.
  std::map<std::string, int> iterations;
  /// Sibling groups whose join already resolved.
  std::set<std::string> resolved_groups;
  /// First error that no transition handled.
  Json failure;
  /// Result of the most recently resolved leaf task.
  Json leaf_result;
  TimePoint created_at{};
  TimePoint updated_at{};
  /// Optimistic-concurrency version, bumped by every commit.
  std::uint64_t version = 0;
};

/// One run of one task instance (per with-items element and iteration).
struct TaskExecution {
  std::string id;
  std::string execution_id;
  std::string task_name;
  TaskStatus status = TaskStatus::Waiting;
  int attempt = 0;
  Json input = Json::object();
  Json result;
  std::string error;
  std::string group_id;
  int item_index = -1;
  int iteration = 0;
  std::optional<TimePoint> next_retry_at;
  std::string dispatch_nonce;
  std::optional<TimePoint> dispatched_at;
  bool dispatch_confirmed = false;
  TimePoint created_at{};
  TimePoint updated_at{};
};

/// Execution plus all of its TaskExecutions, read and committed as one unit.
struct ExecutionSnapshot {
  Execution execution;
  std::vector<TaskExecution> tasks;

  auto find_task(std::string_view id) -> TaskExecution*;
  auto find_task(std::string_view id) const -> const TaskExecution*;
};

auto make_group_id(std::string_view task_name, int iteration) -> std::string;

auto to_json(const Execution& execution) -> Json;
auto to_json(const TaskExecution& task) -> Json;
auto to_json(const ExecutionSnapshot& snapshot) -> Json;

auto execution_from_json(const Json& json) -> Expected<Execution>;
auto task_execution_from_json(const Json& json) -> Expected<TaskExecution>;
auto snapshot_from_json(const Json& json) -> Expected<ExecutionSnapshot>;

}  // namespace wf::engine
