#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "engine/state_store.hpp"
#include "test_support.hpp"

namespace {

namespace engine = wf::engine;

auto test_racing_commits_conflict() -> bool {
  engine::MemoryExecutionStore store;
  ManualClock clock;
  auto created = store.create_execution(engine::DefinitionId{"race", 1}, engine::Json::object(), clock.now());
  if (!created) {
    return false;
  }
  auto base = store.load_for_update(created->id);
  if (!base) {
    return false;
  }

  std::atomic<int> committed{0};
  std::atomic<int> conflicts{0};
  auto ok = run_concurrent(2, 1, [&](int thread_index, int) {
    auto snapshot = *base;
    snapshot.execution.context["tasks"]["writer"] = thread_index;
    auto result = store.commit(snapshot);
    if (result) {
      committed.fetch_add(1, std::memory_order_relaxed);
      return true;
    }
    if (engine::is_conflict(result.error())) {
      conflicts.fetch_add(1, std::memory_order_relaxed);
      return true;
    }
    return false;
  });
  auto stored = store.get_execution(created->id);
  return ok && committed.load() == 1 && conflicts.load() == 1 && stored && stored->version == 2;
}

auto test_concurrent_completions_serialize() -> bool {
  constexpr int kItems = 32;
  constexpr int kThreads = 8;

  ManualClock clock;
  auto config = make_manual_config(clock);
  config.conflict_retries = 1000;
  auto channel = std::make_shared<engine::InMemoryChannel>();
  engine::Engine wf_engine(std::make_shared<engine::MemoryExecutionStore>(), channel, config);
  wf::action::register_sample_actions(wf_engine.actions());
  engine::ActionExecutor executor(wf_engine.shared_actions(), channel);

  auto registered = wf_engine.register_text(R"JSON(
  { "name": "wide", "version": 1,
    "tasks": [
      { "name": "square", "action": "echo", "with-items": "$.input.items", "input": { "n": "$.item" },
        "on-success": "gather" },
      { "name": "gather", "action": "constant", "input": { "value": "$.tasks.square" } }
    ] }
  )JSON");
  if (!registered) {
    return false;
  }
  engine::Json items = engine::Json::array();
  for (int i = 0; i < kItems; ++i) {
    items.push_back(i);
  }
  auto id = wf_engine.start_execution("wide", engine::Json{{"items", items}});
  if (!id) {
    return false;
  }

  std::vector<engine::Json> completions;
  while (auto run = channel->try_receive(engine::Topic::Run)) {
    auto request = engine::decode_run_request(*run);
    if (!request) {
      return false;
    }
    completions.push_back(engine::encode(executor.execute(*request)));
  }
  if (completions.size() != static_cast<std::size_t>(kItems)) {
    std::cerr << "expected " << kItems << " run requests, got " << completions.size() << "\n";
    return false;
  }

  std::mutex error_mutex;
  std::string first_error;
  auto ok = run_concurrent(kThreads, kItems / kThreads, [&](int thread_index, int iteration) {
    const auto& payload = completions[static_cast<std::size_t>(iteration * kThreads + thread_index)];
    auto applied = wf_engine.handle_message(payload);
    if (!applied) {
      std::lock_guard<std::mutex> lock(error_mutex);
      if (first_error.empty()) {
        first_error = applied.error().message;
      }
      return false;
    }
    return true;
  });
  if (!ok) {
    std::cerr << "completion failed: " << first_error << "\n";
    return false;
  }

  // Replays of every completion are dropped.
  for (const auto& payload : completions) {
    auto replay = wf_engine.handle_message(payload);
    if (replay || !engine::is_stale(replay.error())) {
      return false;
    }
  }

  auto tasks = wf_engine.list_task_executions(*id);
  if (!tasks || tasks_named(*tasks, "gather").size() != 1) {
    std::cerr << "gather must run exactly once\n";
    return false;
  }
  pump(wf_engine, *channel, executor);
  auto execution = wf_engine.get_execution(*id);
  if (!execution || execution->status != engine::ExecutionStatus::Success) {
    return false;
  }
  const auto& output = execution->output;
  if (!output.is_array() || output.size() != static_cast<std::size_t>(kItems)) {
    return false;
  }
  for (int i = 0; i < kItems; ++i) {
    if (output[static_cast<std::size_t>(i)] != engine::Json{{"n", i}}) {
      std::cerr << "result " << i << " out of order: " << output.dump() << "\n";
      return false;
    }
  }
  return true;
}

auto test_concurrent_starts() -> bool {
  constexpr int kThreads = 6;
  constexpr int kIterations = 20;

  ManualClock clock;
  auto channel = std::make_shared<engine::InMemoryChannel>();
  engine::Engine wf_engine(std::make_shared<engine::MemoryExecutionStore>(), channel, make_manual_config(clock));
  wf::action::register_sample_actions(wf_engine.actions());
  if (!wf_engine.register_json(make_linear_definition("quick", {"only"}, "echo"))) {
    return false;
  }

  std::mutex ids_mutex;
  std::vector<std::string> ids;
  auto ok = run_concurrent(kThreads, kIterations, [&](int thread_index, int iteration) {
    auto id = wf_engine.start_execution("quick", engine::Json{{"t", thread_index}, {"i", iteration}});
    if (!id) {
      return false;
    }
    std::lock_guard<std::mutex> lock(ids_mutex);
    ids.push_back(*id);
    return true;
  });
  auto all = wf_engine.list_executions({});
  return ok && ids.size() == static_cast<std::size_t>(kThreads * kIterations) && all &&
         all->size() == ids.size() && channel->pending(engine::Topic::Run) == ids.size();
}

auto test_stress_background_engine() -> bool {
  constexpr int kExecutions = 200;

  engine::EngineConfig config;
  config.workers = 4;
  config.sweep_interval = std::chrono::milliseconds(100);
  config.receive_poll = std::chrono::milliseconds(5);
  auto channel = std::make_shared<engine::InMemoryChannel>();
  engine::Engine wf_engine(std::make_shared<engine::MemoryExecutionStore>(), channel, config);
  wf::action::register_sample_actions(wf_engine.actions());
  engine::ExecutorConfig executor_config;
  executor_config.threads = 4;
  executor_config.receive_poll = std::chrono::milliseconds(5);
  engine::ActionExecutor executor(wf_engine.shared_actions(), channel, executor_config);
  executor.start();

  auto registered = wf_engine.register_text(R"JSON(
  { "name": "stress", "version": 1,
    "tasks": [
      { "name": "split", "action": "echo", "with-items": "$.input.parts", "input": { "part": "$.item" },
        "on-success": ["left", "right"] },
      { "name": "left", "action": "fail_times", "input": { "times": 1, "key": "$.input.key", "result": "l" },
        "retry": { "max_attempts": 2, "delay_ms": 1 }, "on-success": "join" },
      { "name": "right", "action": "echo", "input": { "side": "r" }, "on-success": "join" },
      { "name": "join", "action": "constant", "join": "all", "input": { "value": "$.tasks.left" } }
    ] }
  )JSON");
  if (!registered) {
    return false;
  }

  std::vector<std::string> ids;
  for (int i = 0; i < kExecutions; ++i) {
    auto id = wf_engine.start_execution(
      "stress", engine::Json{{"parts", {1, 2, 3}}, {"key", fmt::format("stress-{}", i)}});
    if (!id) {
      return false;
    }
    ids.push_back(*id);
  }

  for (const auto& id : ids) {
    auto execution = wf_engine.wait_for_terminal(id, std::chrono::seconds(30));
    if (!execution || execution->status != engine::ExecutionStatus::Success || execution->output != "l") {
      std::cerr << "execution " << id << " did not succeed\n";
      return false;
    }
  }
  executor.stop();
  wf_engine.stop();
  return true;
}

}  // namespace

int main() {
  TestStats stats;
  run_test("racing_commits_conflict", test_racing_commits_conflict, stats);
  run_test("concurrent_completions_serialize", test_concurrent_completions_serialize, stats);
  run_test("concurrent_starts", test_concurrent_starts, stats);
  if (stress_enabled()) {
    run_test("stress_background_engine", test_stress_background_engine, stats);
  } else {
    std::cout << "[SKIP] stress_background_engine (set WF_ENGINE_STRESS=1)\n";
  }
  return report(stats);
}
