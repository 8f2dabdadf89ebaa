#include <chrono>
#include <iostream>
#include <memory>

#include <fmt/format.h>

#include "action/sample_actions.hpp"
#include "engine/state_store.hpp"
#include "runtime/channel.hpp"
#include "runtime/engine.hpp"
#include "runtime/executor.hpp"

int main() {
  auto channel = std::make_shared<wf::engine::InMemoryChannel>();
  auto store = std::make_shared<wf::engine::MemoryExecutionStore>();

  wf::engine::EngineConfig config;
  config.workers = 1;
  wf::engine::Engine engine(store, channel, config);
  wf::action::register_sample_actions(engine.actions());

  // Stand-ins for an HTTP fetch, a transform and a write.
  engine.actions().register_action("http_get", [](const wf::engine::Json& input) -> wf::engine::Expected<wf::engine::Json> {
    return wf::engine::Json{{"url", input.value("url", "")}, {"data", {3, 4, 5}}};
  });
  engine.actions().register_action("save", [](const wf::engine::Json& input) -> wf::engine::Expected<wf::engine::Json> {
    std::cout << fmt::format("saving {}\n", input.dump());
    return wf::engine::Json{{"ok", true}};
  });

  wf::engine::ActionExecutor executor(engine.shared_actions(), channel);
  executor.start();

  const char* dsl = R"JSON(
  {
    "name": "fetch_process_store",
    "version": 1,
    "tasks": [
      { "name": "fetch", "action": "http_get", "input": { "url": "$.input.url" },
        "retry": { "max_attempts": 3, "delay_ms": 100, "backoff": 2.0 }, "on-success": ["process"] },
      { "name": "process", "action": "sum", "input": { "values": "$.tasks.fetch.data" }, "on-success": ["store"] },
      { "name": "store", "action": "save", "input": { "total": "$.tasks.process" } }
    ]
  }
  )JSON";

  auto definition = engine.register_text(dsl, "examples/simple.cpp");
  if (!definition) {
    std::cerr << "Register error: " << definition.error().message << "\n";
    return 1;
  }

  auto execution_id = engine.start_execution(*definition, wf::engine::Json{{"url", "https://example.com/data"}});
  if (!execution_id) {
    std::cerr << "Start error: " << execution_id.error().message << "\n";
    return 1;
  }

  auto execution = engine.wait_for_terminal(*execution_id, std::chrono::seconds(10));
  executor.stop();
  engine.stop();
  if (!execution) {
    std::cerr << "Lookup error: " << execution.error().message << "\n";
    return 1;
  }

  std::cout << fmt::format("execution {} finished {}: {}\n", execution->id, wf::engine::to_string(execution->status),
                           execution->output.dump());
  return execution->status == wf::engine::ExecutionStatus::Success ? 0 : 1;
}
