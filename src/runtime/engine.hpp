#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <exec/static_thread_pool.hpp>

#include "engine/definition_store.hpp"
#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/registry.hpp"
#include "engine/scheduler.hpp"
#include "engine/state_store.hpp"
#include "runtime/channel.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/reconciler.hpp"

namespace wf::engine {

/// Configuration for the engine workers, dispatch and maintenance loop.
struct EngineConfig {
  /// Threads pulling the events topic (0 disables background workers).
  int workers = 2;
  /// Reload-and-recompute attempts after a commit Conflict.
  int conflict_retries = 32;
  /// Run request publishing policy.
  DispatcherConfig dispatch;
  /// Period of the recovery sweep (0 disables the maintenance loop).
  std::chrono::milliseconds sweep_interval{std::chrono::seconds(1)};
  /// Age after which an unconfirmed dispatch or overdue timer is re-issued.
  std::chrono::milliseconds dispatch_stale{std::chrono::seconds(5)};
  /// Directory to watch for definition files (disabled when unset).
  std::optional<std::filesystem::path> definition_root;
  /// Polling interval for the definition directory.
  std::chrono::milliseconds definition_poll_interval{std::chrono::seconds(60)};
  /// File extension filter (empty means all files).
  std::string definition_extension = ".json";
  /// How long an idle worker blocks on the events topic.
  std::chrono::milliseconds receive_poll{50};
  /// Start workers and the maintenance loop from the constructor.
  bool autostart = true;
  /// Time source; defaults to the system clock.
  ClockFn clock;
  /// Id source for TaskExecutions and dispatch nonces; defaults to UUIDs.
  IdGenerator ids;
};

/// Build an EngineConfig from the --engine_* / --dispatch_* / --sweep_* flags.
auto engine_config_from_flags() -> EngineConfig;

/// Workflow execution engine: owns the definition registry and drives
/// executions through the store, the scheduler and the message channel.
///
/// Every state change is a load_for_update / Scheduler::apply / commit cycle
/// retried on Conflict; dispatches and timers are emitted only after the
/// commit that produced them succeeded.
class Engine {
public:
  Engine(std::shared_ptr<ExecutionStore> store,
         std::shared_ptr<MessageChannel> channel, EngineConfig config = {});
  /// Stops workers and the maintenance loop.
  ~Engine();

  Engine(const Engine &) = delete;
  auto operator=(const Engine &) -> Engine & = delete;

  /// Start event workers and the maintenance loop (idempotent).
  auto start() -> void;
  auto stop() -> void;

  /// Actions known to this engine; registration validates against it.
  auto actions() -> ActionRegistry &;
  auto shared_actions() const -> std::shared_ptr<ActionRegistry>;
  auto definitions() const -> const DefinitionStore &;
  auto store() const -> ExecutionStore &;

  /// Register a parsed definition.
  auto register_definition(const WorkflowDef &workflow, std::string source = {})
      -> Expected<DefinitionId>;
  /// Register a definition from its JSON form.
  auto register_json(const Json &json, std::string source = {})
      -> Expected<DefinitionId>;
  /// Register a definition from JSON text.
  auto register_text(std::string_view text, std::string source = {})
      -> Expected<DefinitionId>;
  /// Register a definition by reading a JSON file from disk.
  auto register_file(const std::filesystem::path &path)
      -> Expected<DefinitionId>;
  /// Register every matching file under `root`; returns how many registered.
  auto load_definitions(const std::filesystem::path &root)
      -> Expected<std::size_t>;

  /// Create an execution and dispatch its entry tasks.
  auto start_execution(const DefinitionId &definition, Json input)
      -> Expected<std::string>;
  /// Start the latest registered version of `name`.
  auto start_execution(std::string_view name, Json input)
      -> Expected<std::string>;

  auto get_execution(std::string_view execution_id) const
      -> Expected<Execution>;
  auto list_task_executions(std::string_view execution_id) const
      -> Expected<std::vector<TaskExecution>>;
  auto list_executions(const ExecutionQuery &query = {}) const
      -> Expected<std::vector<Execution>>;

  auto cancel_execution(std::string_view execution_id, std::string reason = {})
      -> Expected<Execution>;
  auto pause_execution(std::string_view execution_id) -> Expected<Execution>;
  auto resume_execution(std::string_view execution_id) -> Expected<Execution>;
  /// Remove a terminal execution and its TaskExecutions.
  auto delete_execution(std::string_view execution_id) -> Expected<void>;

  /// Poll committed state until the execution is terminal or `timeout`
  /// passes; returns the last state seen either way.
  auto wait_for_terminal(std::string_view execution_id,
                         std::chrono::milliseconds timeout) const
      -> Expected<Execution>;

  /// Apply one events-topic payload (completion or retry timer).
  auto handle_message(const Json &raw) -> Expected<Execution>;
  /// Drain the events topic on the calling thread; returns messages handled.
  auto drain_events(std::chrono::milliseconds idle_timeout) -> std::size_t;
  /// Run the recovery sweep over all active executions now.
  auto reconcile_now() -> Expected<std::size_t>;

private:
  class MaintenanceDaemon;

  auto now() const -> TimePoint;
  auto run_transition(std::string_view execution_id, const Event &event)
      -> Expected<Execution>;
  auto run_command(std::string_view execution_id, const Event &event)
      -> Expected<Execution>;
  auto emit(const Transition &transition) -> void;
  auto confirm_dispatches(std::string_view execution_id,
                          const std::vector<DispatchToken> &tokens) -> void;
  auto worker_loop() -> void;

  EngineConfig config_;
  std::shared_ptr<ExecutionStore> store_;
  std::shared_ptr<MessageChannel> channel_;
  std::shared_ptr<ActionRegistry> actions_;
  DefinitionStore definitions_;
  Dispatcher dispatcher_;
  Reconciler reconciler_;
  int worker_count_ = 0;
  mutable exec::static_thread_pool worker_pool_;
  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<int> alive_{0};
  std::unique_ptr<MaintenanceDaemon> daemon_;
};

} // namespace wf::engine
