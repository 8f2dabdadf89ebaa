#include "engine/state_store.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto not_found(std::string_view what, std::string_view id) -> tl::unexpected<EngineError> {
  return tl::unexpected(make_error(ErrorCode::NotFound, fmt::format("{} not found: {}", what, id)));
}

auto execution_before(const Execution& a, const Execution& b) -> bool {
  if (a.created_at != b.created_at) {
    return a.created_at < b.created_at;
  }
  return a.id < b.id;
}

}  // namespace

auto MemoryExecutionStore::create_execution(const DefinitionId& definition, Json input, TimePoint now)
  -> Expected<Execution> {
  ExecutionSnapshot snapshot;
  auto& execution = snapshot.execution;
  execution.id = generate_uuid();
  execution.definition = definition;
  execution.input = std::move(input);
  execution.status = ExecutionStatus::Running;
  execution.context = Json{{"tasks", Json::object()}};
  execution.created_at = now;
  execution.updated_at = now;
  execution.version = 1;

  std::unique_lock lock(mutex_);
  if (records_.contains(execution.id)) {
    return tl::unexpected(make_error(ErrorCode::Conflict, fmt::format("execution id collision: {}", execution.id)));
  }
  if (auto persisted = persist(snapshot); !persisted) {
    return tl::unexpected(persisted.error());
  }
  auto created = snapshot.execution;
  install_locked(std::move(snapshot));
  return created;
}

auto MemoryExecutionStore::load_for_update(std::string_view execution_id) -> Expected<ExecutionSnapshot> {
  std::shared_lock lock(mutex_);
  auto it = records_.find(std::string(execution_id));
  if (it == records_.end()) {
    return not_found("execution", execution_id);
  }
  return it->second;
}

auto MemoryExecutionStore::commit(const ExecutionSnapshot& snapshot) -> Expected<ExecutionSnapshot> {
  const auto& id = snapshot.execution.id;
  std::unique_lock lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return not_found("execution", id);
  }
  const auto stored_version = it->second.execution.version;
  if (stored_version != snapshot.execution.version) {
    return tl::unexpected(make_error(
      ErrorCode::Conflict,
      fmt::format("execution {} advanced to version {} (commit based on {})", id, stored_version,
                  snapshot.execution.version)));
  }

  ExecutionSnapshot next = snapshot;
  next.execution.version = stored_version + 1;
  if (auto persisted = persist(next); !persisted) {
    return tl::unexpected(persisted.error());
  }
  install_locked(next);
  return next;
}

auto MemoryExecutionStore::get_execution(std::string_view execution_id) const -> Expected<Execution> {
  std::shared_lock lock(mutex_);
  auto it = records_.find(std::string(execution_id));
  if (it == records_.end()) {
    return not_found("execution", execution_id);
  }
  return it->second.execution;
}

auto MemoryExecutionStore::list_task_executions(std::string_view execution_id) const
  -> Expected<std::vector<TaskExecution>> {
  std::shared_lock lock(mutex_);
  auto it = records_.find(std::string(execution_id));
  if (it == records_.end()) {
    return not_found("execution", execution_id);
  }
  return it->second.tasks;
}

auto MemoryExecutionStore::get_task_execution(std::string_view task_execution_id) const
  -> Expected<TaskExecution> {
  std::shared_lock lock(mutex_);
  auto index_it = task_index_.find(std::string(task_execution_id));
  if (index_it == task_index_.end()) {
    return not_found("task execution", task_execution_id);
  }
  auto it = records_.find(index_it->second);
  if (it == records_.end()) {
    return not_found("task execution", task_execution_id);
  }
  const auto* task = it->second.find_task(task_execution_id);
  if (!task) {
    return not_found("task execution", task_execution_id);
  }
  return *task;
}

auto MemoryExecutionStore::list_executions(const ExecutionQuery& query) const
  -> Expected<std::vector<Execution>> {
  std::vector<Execution> matches;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, record] : records_) {
      const auto& execution = record.execution;
      if (query.definition_name && execution.definition.name != *query.definition_name) {
        continue;
      }
      if (query.status && execution.status != *query.status) {
        continue;
      }
      matches.push_back(execution);
    }
  }

  std::sort(matches.begin(), matches.end(), execution_before);
  if (query.direction == SortDirection::Descending) {
    std::reverse(matches.begin(), matches.end());
  }

  auto begin = matches.begin();
  if (query.marker) {
    auto marker_it = std::find_if(matches.begin(), matches.end(),
                                  [&](const Execution& execution) { return execution.id == *query.marker; });
    if (marker_it == matches.end()) {
      return tl::unexpected(
        make_error(ErrorCode::InvalidArgument, fmt::format("marker not found: {}", *query.marker)));
    }
    begin = std::next(marker_it);
  }

  std::vector<Execution> page;
  for (auto it = begin; it != matches.end(); ++it) {
    if (query.limit > 0 && page.size() >= query.limit) {
      break;
    }
    page.push_back(std::move(*it));
  }
  return page;
}

auto MemoryExecutionStore::list_active_executions() const -> Expected<std::vector<std::string>> {
  std::vector<std::string> ids;
  std::shared_lock lock(mutex_);
  for (const auto& [id, record] : records_) {
    if (!is_terminal(record.execution.status)) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

auto MemoryExecutionStore::delete_execution(std::string_view execution_id) -> Expected<void> {
  std::unique_lock lock(mutex_);
  auto it = records_.find(std::string(execution_id));
  if (it == records_.end()) {
    return not_found("execution", execution_id);
  }
  if (auto persisted = persist_delete(execution_id); !persisted) {
    return tl::unexpected(persisted.error());
  }
  for (const auto& task : it->second.tasks) {
    task_index_.erase(task.id);
  }
  records_.erase(it);
  return {};
}

auto MemoryExecutionStore::persist(const ExecutionSnapshot&) -> Expected<void> {
  return {};
}

auto MemoryExecutionStore::persist_delete(std::string_view) -> Expected<void> {
  return {};
}

auto MemoryExecutionStore::restore(ExecutionSnapshot snapshot) -> void {
  std::unique_lock lock(mutex_);
  install_locked(std::move(snapshot));
}

auto MemoryExecutionStore::forget(std::string_view execution_id) -> void {
  std::unique_lock lock(mutex_);
  auto it = records_.find(std::string(execution_id));
  if (it == records_.end()) {
    return;
  }
  for (const auto& task : it->second.tasks) {
    task_index_.erase(task.id);
  }
  records_.erase(it);
}

auto MemoryExecutionStore::install_locked(ExecutionSnapshot snapshot) -> void {
  auto id = snapshot.execution.id;
  for (const auto& task : snapshot.tasks) {
    task_index_[task.id] = id;
  }
  records_[std::move(id)] = std::move(snapshot);
}

}  // namespace wf::engine
