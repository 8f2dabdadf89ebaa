#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/expression.hpp"
#include "engine/registry.hpp"

namespace wf::engine {

struct CompiledTask {
  TaskDef def;
  int index = -1;
  std::optional<Expression> with_items;
  /// Target task indices per outcome, deduplicated, in definition order.
  std::vector<int> on_success;
  std::vector<int> on_error;
  std::vector<int> on_complete;
  /// Tasks with a forward (non-loop) transition into this task.
  std::vector<int> predecessors;
  /// Back edges into this task that close a loop.
  std::vector<int> loop_sources;

  auto is_with_items() const -> bool { return with_items.has_value(); }
};

/// Immutable, validated form of a WorkflowDef.
class CompiledGraph {
 public:
  CompiledGraph() = default;

  auto name() const -> const std::string& { return name_; }
  auto version() const -> int { return version_; }
  auto size() const -> std::size_t { return tasks_.size(); }
  auto tasks() const -> const std::vector<CompiledTask>& { return tasks_; }
  auto task(int index) const -> const CompiledTask& { return tasks_[static_cast<std::size_t>(index)]; }
  auto find(std::string_view name) const -> const CompiledTask*;
  auto index_of(std::string_view name) const -> std::optional<int>;

  /// Entry tasks in definition order.
  auto entry_tasks() const -> std::vector<std::string>;

  /// Tasks reachable from `task_name` for one outcome kind, in definition order.
  auto successors(std::string_view task_name, Outcome outcome) const -> std::vector<std::string>;

  /// Targets fired when a task resolves with `status`: the outcome-specific set
  /// plus on-complete, deduplicated, in definition order.
  auto fired_successors(int task_index, TaskStatus status) const -> std::vector<int>;

  /// True when the task declares any transition that fires for `status`.
  auto has_handler(int task_index, TaskStatus status) const -> bool;

  auto is_loop_edge(int from, int to) const -> bool;

 private:
  friend struct GraphBuilder;

  std::string name_;
  int version_ = 0;
  std::vector<CompiledTask> tasks_;
  std::unordered_map<std::string, int> index_;
  std::vector<int> entries_;
};

struct CompileOptions {
  /// When set, every task action must be registered here.
  const ActionRegistry* actions = nullptr;
};

/// Validate and index a definition; fails with ErrorCode::Definition.
auto compile_graph(const WorkflowDef& workflow, const CompileOptions& options = {})
  -> Expected<CompiledGraph>;

}  // namespace wf::engine
