#include "runtime/engine.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <exec/async_scope.hpp>
#include <exec/timed_thread_scheduler.hpp>
#include <fmt/format.h>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace wf::engine {
namespace {

struct DefinitionFileState {
  std::filesystem::file_time_type last_write;
  bool had_error = false;
};

auto path_matches_extension(const std::filesystem::path &path,
                            const std::string &extension) -> bool {
  if (extension.empty()) {
    return true;
  }
  return path.extension() == extension;
}

auto definition_files(const std::filesystem::path &root,
                      const std::string &extension)
    -> Expected<std::vector<std::filesystem::path>> {
  std::error_code fs_error;
  if (!std::filesystem::is_directory(root, fs_error)) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        fmt::format("definition root is not a directory: {}", root.string())));
  }
  std::vector<std::filesystem::path> files;
  std::error_code iter_error;
  for (std::filesystem::directory_iterator it(root, iter_error), end;
       it != end && !iter_error; it.increment(iter_error)) {
    std::error_code entry_error;
    if (!it->is_regular_file(entry_error)) {
      continue;
    }
    if (path_matches_extension(it->path(), extension)) {
      files.push_back(it->path());
    }
  }
  if (iter_error) {
    return tl::unexpected(make_error(
        ErrorCode::Storage, fmt::format("scan failed for {}: {}", root.string(),
                                        iter_error.message())));
  }
  std::sort(files.begin(), files.end());
  return files;
}

auto log_event_error(const EngineError &error) -> void {
  switch (error.code) {
  case ErrorCode::StaleEvent:
    wf::log::debug("Event dropped: {}", error.message);
    break;
  case ErrorCode::Conflict:
    wf::log::warn("Event abandoned after conflicts: {}", error.message);
    break;
  default:
    wf::log::error("Event failed ({}): {}", to_string(error.code),
                   error.message);
    break;
  }
}

} // namespace

/// Periodic recovery sweep plus definition directory polling.
class Engine::MaintenanceDaemon {
public:
  MaintenanceDaemon(Engine &engine, const EngineConfig &config)
      : engine_(engine),
        root_(config.definition_root.value_or(std::filesystem::path{})),
        sweep_interval_(config.sweep_interval),
        poll_interval_(config.definition_poll_interval),
        extension_(config.definition_extension),
        scheduler_context_(std::make_unique<exec::timed_thread_context>()),
        scheduler_(scheduler_context_->get_scheduler()), scope_() {
    if (!root_.empty()) {
      scan_once();
      schedule_scan();
    }
    if (sweep_interval_.count() > 0) {
      schedule_sweep();
    }
  }

  ~MaintenanceDaemon() {
    running_ = false;
    scope_.request_stop();
    stdexec::sync_wait(scope_.on_empty());
  }

private:
  auto sweep_once() -> void {
    auto swept = engine_.reconcile_now();
    if (!swept) {
      wf::log::error("Recovery sweep failed: {}", swept.error().message);
    }
  }

  auto scan_once() -> void {
    auto files = definition_files(root_, extension_);
    if (!files) {
      wf::log::error("Definition scan failed: {}", files.error().message);
      return;
    }

    std::unordered_set<std::string> seen;
    for (const auto &path : *files) {
      auto path_string = path.string();
      seen.insert(path_string);
      std::error_code stat_error;
      auto last_write = std::filesystem::last_write_time(path, stat_error);
      if (stat_error) {
        wf::log::error("stat failed for {}: {}", path_string,
                       stat_error.message());
        continue;
      }
      auto it = files_.find(path_string);
      bool should_register = it == files_.end() ||
                             it->second.last_write != last_write ||
                             it->second.had_error;
      if (!should_register) {
        continue;
      }
      auto registered = engine_.register_file(path);
      files_[path_string] = DefinitionFileState{last_write, !registered};
      if (!registered) {
        wf::log::error("register failed for {}: {}", path_string,
                       registered.error().message);
      }
    }

    for (auto it = files_.begin(); it != files_.end();) {
      if (seen.find(it->first) == seen.end()) {
        it = files_.erase(it);
      } else {
        ++it;
      }
    }
  }

  auto schedule_sweep() -> void {
    if (!running_.load(std::memory_order_relaxed)) {
      return;
    }
    auto sender = exec::schedule_after(scheduler_, sweep_interval_) |
                  stdexec::then([this] {
                    if (running_.load(std::memory_order_relaxed)) {
                      sweep_once();
                      schedule_sweep();
                    }
                  });
    scope_.spawn(std::move(sender));
  }

  auto schedule_scan() -> void {
    if (!running_.load(std::memory_order_relaxed)) {
      return;
    }
    auto sender = exec::schedule_after(scheduler_, poll_interval_) |
                  stdexec::then([this] {
                    if (running_.load(std::memory_order_relaxed)) {
                      scan_once();
                      schedule_scan();
                    }
                  });
    scope_.spawn(std::move(sender));
  }

  Engine &engine_;
  std::filesystem::path root_;
  std::chrono::milliseconds sweep_interval_;
  std::chrono::milliseconds poll_interval_;
  std::string extension_;
  std::unique_ptr<exec::timed_thread_context> scheduler_context_;
  exec::timed_thread_scheduler scheduler_;
  std::atomic<bool> running_{true};
  exec::async_scope scope_;
  std::unordered_map<std::string, DefinitionFileState> files_;
};

Engine::Engine(std::shared_ptr<ExecutionStore> store,
               std::shared_ptr<MessageChannel> channel, EngineConfig config)
    : config_(std::move(config)), store_(std::move(store)),
      channel_(std::move(channel)),
      actions_(std::make_shared<ActionRegistry>()),
      dispatcher_(channel_, config_.dispatch), reconciler_(store_),
      worker_count_(std::max(0, config_.workers)),
      worker_pool_(static_cast<std::uint32_t>(std::max(1, config_.workers))) {
  wf::log::init();
  if (!config_.clock) {
    config_.clock = [] { return Clock::now(); };
  }
  if (!config_.ids) {
    config_.ids = [] { return generate_uuid(); };
  }
  wf::log::info("Initializing workflow engine: workers={}, sweep_ms={}",
                worker_count_, config_.sweep_interval.count());
  if (config_.autostart) {
    start();
  }
}

Engine::~Engine() { stop(); }

auto Engine::start() -> void {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true,
                                        std::memory_order_acq_rel)) {
    return;
  }
  stopping_.store(false, std::memory_order_release);
  alive_.store(worker_count_, std::memory_order_release);

  auto scheduler = worker_pool_.get_scheduler();
  for (int i = 0; i < worker_count_; ++i) {
    auto task = stdexec::schedule(scheduler) |
                stdexec::then([this]() { this->worker_loop(); });
    stdexec::start_detached(std::move(task));
  }

  if (config_.sweep_interval.count() > 0 || config_.definition_root) {
    if (config_.definition_root) {
      wf::log::info("Watching definitions under '{}'",
                    config_.definition_root->string());
    }
    daemon_ = std::make_unique<MaintenanceDaemon>(*this, config_);
  }
}

auto Engine::stop() -> void {
  if (!started_.load(std::memory_order_acquire)) {
    return;
  }
  daemon_.reset();
  stopping_.store(true, std::memory_order_release);
  int count = alive_.load(std::memory_order_acquire);
  while (count != 0) {
    alive_.wait(count, std::memory_order_relaxed);
    count = alive_.load(std::memory_order_acquire);
  }
  started_.store(false, std::memory_order_release);
}

auto Engine::worker_loop() -> void {
  while (!stopping_.load(std::memory_order_acquire)) {
    auto payload = channel_->receive(Topic::Events, config_.receive_poll);
    if (!payload) {
      if (channel_->closed()) {
        break;
      }
      continue;
    }
    try {
      if (auto handled = handle_message(*payload); !handled) {
        log_event_error(handled.error());
      }
    } catch (const std::exception &ex) {
      // The loop runs detached; an escaped exception would terminate the process.
      wf::log::error("Event handling failed: {}", ex.what());
    }
  }
  if (alive_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    alive_.notify_all();
  }
}

auto Engine::now() const -> TimePoint { return config_.clock(); }

auto Engine::actions() -> ActionRegistry & { return *actions_; }

auto Engine::shared_actions() const -> std::shared_ptr<ActionRegistry> {
  return actions_;
}

auto Engine::definitions() const -> const DefinitionStore & {
  return definitions_;
}

auto Engine::store() const -> ExecutionStore & { return *store_; }

auto Engine::register_definition(const WorkflowDef &workflow,
                                 std::string source) -> Expected<DefinitionId> {
  RegisterOptions options;
  options.source = std::move(source);
  options.actions = actions_.get();
  auto snapshot = definitions_.register_definition(workflow, options);
  if (!snapshot) {
    return tl::unexpected(snapshot.error());
  }
  wf::log::info("definition_registered",
                {{"definition", (*snapshot)->id.to_string()},
                 {"hash", (*snapshot)->hash},
                 {"tasks", std::to_string((*snapshot)->graph.size())}});
  return (*snapshot)->id;
}

auto Engine::register_json(const Json &json, std::string source)
    -> Expected<DefinitionId> {
  auto workflow = parse_workflow_json(json);
  if (!workflow) {
    return tl::unexpected(workflow.error());
  }
  return register_definition(*workflow, std::move(source));
}

auto Engine::register_text(std::string_view text, std::string source)
    -> Expected<DefinitionId> {
  Json json;
  try {
    json = Json::parse(text);
  } catch (const std::exception &ex) {
    return tl::unexpected(make_error(
        ErrorCode::Definition, fmt::format("definition parse error: {}", ex.what())));
  }
  return register_json(json, std::move(source));
}

auto Engine::register_file(const std::filesystem::path &path)
    -> Expected<DefinitionId> {
  std::ifstream file{path};
  if (!file) {
    return tl::unexpected(
        make_error(ErrorCode::InvalidArgument,
                   fmt::format("failed to open definition file: {}", path.string())));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return register_text(buffer.str(), path.string());
}

auto Engine::load_definitions(const std::filesystem::path &root)
    -> Expected<std::size_t> {
  auto files = definition_files(root, config_.definition_extension);
  if (!files) {
    return tl::unexpected(files.error());
  }
  std::size_t registered = 0;
  for (const auto &path : *files) {
    auto id = register_file(path);
    if (!id) {
      wf::log::error("register failed for {}: {}", path.string(),
                     id.error().message);
      continue;
    }
    ++registered;
  }
  return registered;
}

auto Engine::start_execution(const DefinitionId &definition, Json input)
    -> Expected<std::string> {
  auto snapshot = definitions_.resolve(definition);
  if (!snapshot) {
    return tl::unexpected(make_error(
        ErrorCode::NotFound,
        fmt::format("definition not found: {}", definition.to_string())));
  }
  auto created =
      store_->create_execution(snapshot->id, std::move(input), now());
  if (!created) {
    return tl::unexpected(created.error());
  }
  wf::log::info("execution_started", {{"execution", created->id},
                                      {"definition", snapshot->id.to_string()}});
  auto started = run_transition(created->id, Event::start());
  // StaleEvent here means a recovery sweep already spawned the entry tasks.
  if (!started && started.error().code != ErrorCode::StaleEvent) {
    return tl::unexpected(started.error());
  }
  return created->id;
}

auto Engine::start_execution(std::string_view name, Json input)
    -> Expected<std::string> {
  auto snapshot = definitions_.resolve(name);
  if (!snapshot) {
    return tl::unexpected(make_error(
        ErrorCode::NotFound, fmt::format("definition not found: {}", name)));
  }
  return start_execution(snapshot->id, std::move(input));
}

auto Engine::get_execution(std::string_view execution_id) const
    -> Expected<Execution> {
  return store_->get_execution(execution_id);
}

auto Engine::list_task_executions(std::string_view execution_id) const
    -> Expected<std::vector<TaskExecution>> {
  return store_->list_task_executions(execution_id);
}

auto Engine::list_executions(const ExecutionQuery &query) const
    -> Expected<std::vector<Execution>> {
  return store_->list_executions(query);
}

auto Engine::cancel_execution(std::string_view execution_id,
                              std::string reason) -> Expected<Execution> {
  auto cancelled =
      run_command(execution_id, Event::cancel(std::move(reason)));
  if (cancelled) {
    wf::log::info("Execution cancelled: id={}", execution_id);
  }
  return cancelled;
}

auto Engine::pause_execution(std::string_view execution_id)
    -> Expected<Execution> {
  return run_command(execution_id, Event::pause());
}

auto Engine::resume_execution(std::string_view execution_id)
    -> Expected<Execution> {
  return run_command(execution_id, Event::resume());
}

auto Engine::delete_execution(std::string_view execution_id)
    -> Expected<void> {
  auto execution = store_->get_execution(execution_id);
  if (!execution) {
    return tl::unexpected(execution.error());
  }
  if (!is_terminal(execution->status)) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        fmt::format("execution {} is {}; only finished executions can be "
                    "deleted",
                    execution_id, to_string(execution->status))));
  }
  return store_->delete_execution(execution_id);
}

auto Engine::wait_for_terminal(std::string_view execution_id,
                               std::chrono::milliseconds timeout) const
    -> Expected<Execution> {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto execution = store_->get_execution(execution_id);
    if (!execution || is_terminal(execution->status) ||
        std::chrono::steady_clock::now() >= deadline) {
      return execution;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

auto Engine::handle_message(const Json &raw) -> Expected<Execution> {
  auto reconciled = reconciler_.on_message(raw);
  if (!reconciled) {
    return tl::unexpected(reconciled.error());
  }
  return run_transition(reconciled->execution_id, reconciled->event);
}

auto Engine::drain_events(std::chrono::milliseconds idle_timeout)
    -> std::size_t {
  std::size_t handled = 0;
  while (auto payload = channel_->receive(Topic::Events, idle_timeout)) {
    if (auto applied = handle_message(*payload); !applied) {
      log_event_error(applied.error());
    }
    ++handled;
  }
  return handled;
}

auto Engine::reconcile_now() -> Expected<std::size_t> {
  auto active = store_->list_active_executions();
  if (!active) {
    return tl::unexpected(active.error());
  }
  std::size_t swept = 0;
  for (const auto &execution_id : *active) {
    auto result =
        run_transition(execution_id, Event::sweep(config_.dispatch_stale));
    if (!result) {
      if (!is_stale(result.error())) {
        wf::log::warn("Sweep of {} failed: {}", execution_id,
                      result.error().message);
      }
      continue;
    }
    ++swept;
  }
  return swept;
}

auto Engine::run_command(std::string_view execution_id, const Event &event)
    -> Expected<Execution> {
  auto result = run_transition(execution_id, event);
  if (!result && is_stale(result.error())) {
    return tl::unexpected(
        make_error(ErrorCode::InvalidArgument, result.error().message));
  }
  return result;
}

auto Engine::run_transition(std::string_view execution_id, const Event &event)
    -> Expected<Execution> {
  const int retries = std::max(0, config_.conflict_retries);
  for (int tries = 0; tries <= retries; ++tries) {
    auto snapshot = store_->load_for_update(execution_id);
    if (!snapshot) {
      return tl::unexpected(snapshot.error());
    }
    auto definition = definitions_.resolve(snapshot->execution.definition);
    if (!definition) {
      return tl::unexpected(make_error(
          ErrorCode::NotFound,
          fmt::format("definition {} of execution {} is not registered",
                      snapshot->execution.definition.to_string(),
                      execution_id)));
    }

    Scheduler scheduler(definition->graph);
    auto transition =
        scheduler.apply(std::move(*snapshot), event, now(), config_.ids);
    if (!transition) {
      return tl::unexpected(transition.error());
    }
    if (!transition->changed) {
      return transition->snapshot.execution;
    }

    auto committed = store_->commit(transition->snapshot);
    if (!committed) {
      if (is_conflict(committed.error())) {
        wf::log::debug("Commit conflict: execution={}, event={}, try={}",
                       execution_id, to_string(event.kind), tries + 1);
        continue;
      }
      return tl::unexpected(committed.error());
    }
    emit(*transition);
    return committed->execution;
  }
  return tl::unexpected(make_error(
      ErrorCode::Conflict,
      fmt::format("execution {} still conflicting after {} retries",
                  execution_id, retries)));
}

auto Engine::emit(const Transition &transition) -> void {
  const auto &execution_id = transition.snapshot.execution.id;
  std::vector<DispatchToken> sent;
  std::vector<std::pair<DispatchRequest, std::string>> unsent;
  for (const auto &request : transition.dispatches) {
    auto token = dispatcher_.dispatch(request);
    if (token) {
      sent.push_back(std::move(*token));
    } else {
      unsent.emplace_back(request, token.error().message);
    }
  }

  for (const auto &timer : transition.timers) {
    if (auto scheduled = dispatcher_.schedule_retry(timer); !scheduled) {
      wf::log::warn("Retry timer for {} not scheduled, sweep will re-arm: {}",
                    timer.task_execution_id, scheduled.error().message);
    }
  }

  if (!sent.empty()) {
    confirm_dispatches(execution_id, sent);
  }

  for (const auto &[request, error] : unsent) {
    auto failed = run_transition(
        execution_id, Event::failed(request.task_execution_id, request.attempt,
                                    error, request.nonce));
    if (!failed && !is_stale(failed.error())) {
      wf::log::error("Recording dispatch failure of {} failed: {}",
                     request.task_execution_id, failed.error().message);
    }
  }
}

auto Engine::confirm_dispatches(std::string_view execution_id,
                                const std::vector<DispatchToken> &tokens)
    -> void {
  const int retries = std::max(0, config_.conflict_retries);
  for (int tries = 0; tries <= retries; ++tries) {
    auto snapshot = store_->load_for_update(execution_id);
    if (!snapshot) {
      wf::log::warn("Dispatch confirmation skipped for {}: {}", execution_id,
                    snapshot.error().message);
      return;
    }
    bool changed = false;
    for (const auto &token : tokens) {
      auto *task = snapshot->find_task(token.task_execution_id);
      if (task != nullptr && task->status == TaskStatus::Running &&
          task->dispatch_nonce == token.nonce && !task->dispatch_confirmed) {
        task->dispatch_confirmed = true;
        changed = true;
      }
    }
    if (!changed) {
      return;
    }
    auto committed = store_->commit(*snapshot);
    if (committed) {
      return;
    }
    if (!is_conflict(committed.error())) {
      wf::log::warn("Dispatch confirmation for {} failed: {}", execution_id,
                    committed.error().message);
      return;
    }
  }
  wf::log::warn("Dispatch confirmation for {} abandoned after conflicts",
                execution_id);
}

} // namespace wf::engine
