#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/records.hpp"

namespace wf::engine {

enum class SortDirection {
  Ascending,
  Descending,
};

struct ExecutionQuery {
  std::optional<std::string> definition_name;
  std::optional<ExecutionStatus> status;
  /// Maximum number of records (0 means unlimited).
  std::size_t limit = 0;
  /// Id of the last record of the previous page.
  std::optional<std::string> marker;
  SortDirection direction = SortDirection::Ascending;
};

/// Transactional persistence for Execution and TaskExecution records.
///
/// All mutation goes through load_for_update() / commit(): commit() succeeds
/// only if the stored version still equals the version that was loaded, so
/// concurrent writers of one execution serialize by retrying on Conflict.
class ExecutionStore {
 public:
  virtual ~ExecutionStore() = default;

  /// Persist a new execution in RUNNING status with version 1.
  virtual auto create_execution(const DefinitionId& definition, Json input, TimePoint now)
    -> Expected<Execution> = 0;
  virtual auto load_for_update(std::string_view execution_id) -> Expected<ExecutionSnapshot> = 0;
  /// Returns the committed snapshot (version bumped) or ErrorCode::Conflict.
  virtual auto commit(const ExecutionSnapshot& snapshot) -> Expected<ExecutionSnapshot> = 0;

  virtual auto get_execution(std::string_view execution_id) const -> Expected<Execution> = 0;
  virtual auto list_task_executions(std::string_view execution_id) const
    -> Expected<std::vector<TaskExecution>> = 0;
  virtual auto get_task_execution(std::string_view task_execution_id) const -> Expected<TaskExecution> = 0;
  virtual auto list_executions(const ExecutionQuery& query) const -> Expected<std::vector<Execution>> = 0;
  /// Ids of executions that are not terminal.
  virtual auto list_active_executions() const -> Expected<std::vector<std::string>> = 0;
  virtual auto delete_execution(std::string_view execution_id) -> Expected<void> = 0;
};

/// Process-local store; also the in-memory core of JournalExecutionStore.
class MemoryExecutionStore : public ExecutionStore {
 public:
  MemoryExecutionStore() = default;
  ~MemoryExecutionStore() override = default;

  MemoryExecutionStore(const MemoryExecutionStore&) = delete;
  auto operator=(const MemoryExecutionStore&) -> MemoryExecutionStore& = delete;

  auto create_execution(const DefinitionId& definition, Json input, TimePoint now)
    -> Expected<Execution> override;
  auto load_for_update(std::string_view execution_id) -> Expected<ExecutionSnapshot> override;
  auto commit(const ExecutionSnapshot& snapshot) -> Expected<ExecutionSnapshot> override;

  auto get_execution(std::string_view execution_id) const -> Expected<Execution> override;
  auto list_task_executions(std::string_view execution_id) const
    -> Expected<std::vector<TaskExecution>> override;
  auto get_task_execution(std::string_view task_execution_id) const -> Expected<TaskExecution> override;
  auto list_executions(const ExecutionQuery& query) const -> Expected<std::vector<Execution>> override;
  auto list_active_executions() const -> Expected<std::vector<std::string>> override;
  auto delete_execution(std::string_view execution_id) -> Expected<void> override;

 protected:
  /// Durability hook, called under the write lock before a state change
  /// becomes visible; a failure aborts the change.
  virtual auto persist(const ExecutionSnapshot& snapshot) -> Expected<void>;
  virtual auto persist_delete(std::string_view execution_id) -> Expected<void>;

  /// Install a snapshot without version checks (journal replay).
  auto restore(ExecutionSnapshot snapshot) -> void;
  auto forget(std::string_view execution_id) -> void;

 private:
  auto install_locked(ExecutionSnapshot snapshot) -> void;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, ExecutionSnapshot> records_;
  std::unordered_map<std::string, std::string> task_index_;
};

}  // namespace wf::engine
