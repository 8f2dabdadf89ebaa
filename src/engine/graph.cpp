#include "engine/graph.hpp"

#include <algorithm>
#include <queue>
#include <set>

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto definition_error(std::string message) -> tl::unexpected<EngineError> {
  return tl::unexpected(make_error(ErrorCode::Definition, std::move(message)));
}

auto merge_sorted(const std::vector<int>& a, const std::vector<int>& b) -> std::vector<int> {
  std::vector<int> out;
  out.reserve(a.size() + b.size());
  std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
  return out;
}

}  // namespace

struct GraphBuilder {
  const WorkflowDef& workflow;
  const CompileOptions& options;

  CompiledGraph graph;
  // (from, to) for every declared transition, duplicates removed.
  std::set<std::pair<int, int>> edges;
  std::vector<std::vector<int>> adjacency;

  auto build_tasks() -> Expected<void> {
    if (workflow.tasks.empty()) {
      return definition_error(fmt::format("workflow {} has no tasks", workflow.name));
    }
    graph.name_ = workflow.name;
    graph.version_ = workflow.version;
    graph.tasks_.reserve(workflow.tasks.size());
    for (const auto& def : workflow.tasks) {
      if (graph.index_.contains(def.name)) {
        return definition_error(fmt::format("duplicate task name: {}", def.name));
      }
      if (def.action.empty()) {
        return definition_error(fmt::format("task {}: action is required", def.name));
      }
      if (options.actions && !options.actions->contains(def.action)) {
        return definition_error(fmt::format("task {}: action not registered: {}", def.name, def.action));
      }
      if (auto valid = validate_template(def.input); !valid) {
        return definition_error(fmt::format("task {}: {}", def.name, valid.error().message));
      }

      CompiledTask task;
      task.def = def;
      task.index = static_cast<int>(graph.tasks_.size());
      if (!def.with_items.empty()) {
        auto expr = parse_expression(def.with_items);
        if (!expr) {
          return definition_error(fmt::format("task {}: with-items: {}", def.name, expr.error().message));
        }
        task.with_items = std::move(*expr);
      }
      graph.index_.emplace(def.name, task.index);
      graph.tasks_.push_back(std::move(task));
    }
    adjacency.assign(graph.tasks_.size(), {});
    return {};
  }

  auto resolve_targets(const CompiledTask& task, const std::vector<std::string>& names, Outcome outcome)
    -> Expected<std::vector<int>> {
    std::vector<int> targets;
    for (const auto& name : names) {
      auto it = graph.index_.find(name);
      if (it == graph.index_.end()) {
        return definition_error(
          fmt::format("task {}: {} transition references unknown task: {}", task.def.name, to_string(outcome), name));
      }
      targets.push_back(it->second);
    }
    std::sort(targets.begin(), targets.end());
    targets.erase(std::unique(targets.begin(), targets.end()), targets.end());
    return targets;
  }

  auto bind_transitions() -> Expected<void> {
    for (auto& task : graph.tasks_) {
      auto on_success = resolve_targets(task, task.def.on_success, Outcome::OnSuccess);
      if (!on_success) {
        return tl::unexpected(on_success.error());
      }
      auto on_error = resolve_targets(task, task.def.on_error, Outcome::OnError);
      if (!on_error) {
        return tl::unexpected(on_error.error());
      }
      auto on_complete = resolve_targets(task, task.def.on_complete, Outcome::OnComplete);
      if (!on_complete) {
        return tl::unexpected(on_complete.error());
      }
      task.on_success = std::move(*on_success);
      task.on_error = std::move(*on_error);
      task.on_complete = std::move(*on_complete);

      for (const auto* targets : {&task.on_success, &task.on_error, &task.on_complete}) {
        for (int target : *targets) {
          if (edges.emplace(task.index, target).second) {
            adjacency[static_cast<std::size_t>(task.index)].push_back(target);
          }
        }
      }
    }
    return {};
  }

  auto reachable(int from, int to) const -> bool {
    std::vector<bool> seen(adjacency.size(), false);
    std::vector<int> stack{from};
    while (!stack.empty()) {
      int node = stack.back();
      stack.pop_back();
      if (node == to) {
        return true;
      }
      if (seen[static_cast<std::size_t>(node)]) {
        continue;
      }
      seen[static_cast<std::size_t>(node)] = true;
      for (int next : adjacency[static_cast<std::size_t>(node)]) {
        stack.push_back(next);
      }
    }
    return false;
  }

  // A transition is a loop edge when its target declares a loop bound and the
  // target can reach the source again.
  auto classify_edges() -> void {
    for (const auto& [from, to] : edges) {
      auto& target = graph.tasks_[static_cast<std::size_t>(to)];
      if (target.def.loop > 0 && reachable(to, from)) {
        target.loop_sources.push_back(from);
      } else {
        target.predecessors.push_back(from);
      }
    }
    for (auto& task : graph.tasks_) {
      std::sort(task.predecessors.begin(), task.predecessors.end());
      std::sort(task.loop_sources.begin(), task.loop_sources.end());
    }
  }

  auto check_acyclic() -> Expected<void> {
    const std::size_t n = graph.tasks_.size();
    std::vector<int> indegree(n, 0);
    std::vector<std::vector<int>> forward(n);
    for (const auto& task : graph.tasks_) {
      for (int pred : task.predecessors) {
        forward[static_cast<std::size_t>(pred)].push_back(task.index);
        indegree[static_cast<std::size_t>(task.index)] += 1;
      }
    }

    std::queue<int> ready;
    for (std::size_t i = 0; i < n; ++i) {
      if (indegree[i] == 0) {
        ready.push(static_cast<int>(i));
      }
    }
    std::size_t visited = 0;
    while (!ready.empty()) {
      int node = ready.front();
      ready.pop();
      visited += 1;
      for (int next : forward[static_cast<std::size_t>(node)]) {
        if (--indegree[static_cast<std::size_t>(next)] == 0) {
          ready.push(next);
        }
      }
    }
    if (visited != n) {
      for (std::size_t i = 0; i < n; ++i) {
        if (indegree[i] > 0) {
          return definition_error(
            fmt::format("workflow {} has a cycle through task {} without a loop bound", workflow.name,
                        graph.tasks_[i].def.name));
        }
      }
    }
    return {};
  }

  auto check_joins() -> Expected<void> {
    for (const auto& task : graph.tasks_) {
      if (task.is_with_items()) {
        continue;
      }
      const auto preds = static_cast<int>(task.predecessors.size());
      switch (task.def.join.kind) {
        case JoinKind::All:
          if (preds == 0) {
            return definition_error(
              fmt::format("task {}: join 'all' has no predecessors to wait for", task.def.name));
          }
          break;
        case JoinKind::Count:
          if (task.def.join.count > preds) {
            return definition_error(fmt::format("task {}: join count {} exceeds {} predecessors", task.def.name,
                                                task.def.join.count, preds));
          }
          break;
        case JoinKind::None:
        case JoinKind::One:
          break;
      }
    }
    return {};
  }

  auto collect_entries() -> Expected<void> {
    for (const auto& task : graph.tasks_) {
      if (task.def.entry || task.predecessors.empty()) {
        graph.entries_.push_back(task.index);
      }
    }
    if (graph.entries_.empty()) {
      return definition_error(fmt::format("workflow {} has no entry task", workflow.name));
    }
    return {};
  }
};

auto CompiledGraph::find(std::string_view name) const -> const CompiledTask* {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) {
    return nullptr;
  }
  return &tasks_[static_cast<std::size_t>(it->second)];
}

auto CompiledGraph::index_of(std::string_view name) const -> std::optional<int> {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto CompiledGraph::entry_tasks() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (int index : entries_) {
    names.push_back(task(index).def.name);
  }
  return names;
}

auto CompiledGraph::successors(std::string_view task_name, Outcome outcome) const -> std::vector<std::string> {
  std::vector<std::string> names;
  const auto* source = find(task_name);
  if (!source) {
    return names;
  }
  const std::vector<int>* targets = nullptr;
  switch (outcome) {
    case Outcome::OnSuccess: targets = &source->on_success; break;
    case Outcome::OnError: targets = &source->on_error; break;
    case Outcome::OnComplete: targets = &source->on_complete; break;
  }
  for (int index : *targets) {
    names.push_back(task(index).def.name);
  }
  return names;
}

auto CompiledGraph::fired_successors(int task_index, TaskStatus status) const -> std::vector<int> {
  const auto& source = task(task_index);
  if (status == TaskStatus::Success) {
    return merge_sorted(source.on_success, source.on_complete);
  }
  if (status == TaskStatus::Error) {
    return merge_sorted(source.on_error, source.on_complete);
  }
  return {};
}

auto CompiledGraph::has_handler(int task_index, TaskStatus status) const -> bool {
  return !fired_successors(task_index, status).empty();
}

auto CompiledGraph::is_loop_edge(int from, int to) const -> bool {
  const auto& sources = task(to).loop_sources;
  return std::binary_search(sources.begin(), sources.end(), from);
}

auto compile_graph(const WorkflowDef& workflow, const CompileOptions& options) -> Expected<CompiledGraph> {
  GraphBuilder builder{workflow, options, {}, {}, {}};
  if (auto result = builder.build_tasks(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.bind_transitions(); !result) {
    return tl::unexpected(result.error());
  }
  builder.classify_edges();
  if (auto result = builder.check_acyclic(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.check_joins(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.collect_entries(); !result) {
    return tl::unexpected(result.error());
  }
  return std::move(builder.graph);
}

}  // namespace wf::engine
