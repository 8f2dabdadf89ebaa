#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "action/sample_actions.hpp"
#include "common/logging/log.hpp"
#include "engine/journal_store.hpp"
#include "engine/state_store.hpp"
#include "runtime/channel.hpp"
#include "runtime/engine.hpp"
#include "runtime/executor.hpp"

DEFINE_string(definition, "", "Workflow definition file to register and run");
DEFINE_string(input, "{}", "Execution input as a JSON document");
DEFINE_int32(timeout_ms, 30000, "How long to wait for the execution to finish");

DECLARE_string(journal_path);
DECLARE_int32(executor_threads);

namespace {

auto open_store() -> wf::engine::Expected<std::shared_ptr<wf::engine::ExecutionStore>> {
  if (FLAGS_journal_path.empty()) {
    return std::make_shared<wf::engine::MemoryExecutionStore>();
  }
  auto journal = wf::engine::JournalExecutionStore::open(FLAGS_journal_path);
  if (!journal) {
    return tl::unexpected(journal.error());
  }
  return std::shared_ptr<wf::engine::ExecutionStore>(std::move(*journal));
}

auto print_tasks(wf::engine::Engine& engine, const std::string& execution_id) -> void {
  auto tasks = engine.list_task_executions(execution_id);
  if (!tasks) {
    return;
  }
  for (const auto& task : *tasks) {
    std::cout << fmt::format("  {:<20} {:<8} attempt={} {}\n", task.task_name, wf::engine::to_string(task.status),
                             task.attempt, task.error.empty() ? task.result.dump() : task.error);
  }
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Run one workflow definition to completion:\n  workflow_runner --definition=flow.json");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  if (FLAGS_definition.empty()) {
    std::cerr << gflags::ProgramUsage() << "\n";
    return 2;
  }

  wf::engine::Json input;
  try {
    input = wf::engine::Json::parse(FLAGS_input);
  } catch (const std::exception& ex) {
    std::cerr << "Invalid --input: " << ex.what() << "\n";
    return 2;
  }

  auto store = open_store();
  if (!store) {
    std::cerr << "Store error: " << store.error().message << "\n";
    return 1;
  }

  auto channel = std::make_shared<wf::engine::InMemoryChannel>();
  wf::engine::Engine engine(*store, channel, wf::engine::engine_config_from_flags());
  wf::action::register_sample_actions(engine.actions());

  wf::engine::ExecutorConfig executor_config;
  executor_config.threads = FLAGS_executor_threads;
  wf::engine::ActionExecutor executor(engine.shared_actions(), channel, executor_config);
  executor.start();

  auto definition = engine.register_file(FLAGS_definition);
  if (!definition) {
    std::cerr << "Register error: " << definition.error().message << "\n";
    return 1;
  }

  auto execution_id = engine.start_execution(*definition, std::move(input));
  if (!execution_id) {
    std::cerr << "Start error: " << execution_id.error().message << "\n";
    return 1;
  }
  wf::log::info("Started {} as {}", definition->to_string(), *execution_id);

  auto execution = engine.wait_for_terminal(*execution_id, std::chrono::milliseconds(FLAGS_timeout_ms));
  executor.stop();
  engine.stop();
  if (!execution) {
    std::cerr << "Lookup error: " << execution.error().message << "\n";
    return 1;
  }

  std::cout << fmt::format("{} {}\n", execution->id, wf::engine::to_string(execution->status));
  print_tasks(engine, *execution_id);
  std::cout << execution->output.dump(2) << "\n";
  wf::log::shutdown();
  return execution->status == wf::engine::ExecutionStatus::Success ? 0 : 1;
}
