#include <gflags/gflags.h>

#include "runtime/engine.hpp"

DEFINE_int32(engine_workers, 2, "Threads consuming the events topic");
DEFINE_int32(executor_threads, 0, "In-process action executor threads (0 = hardware concurrency)");
DEFINE_int32(conflict_retries, 32, "Reload-and-recompute attempts after a commit conflict");
DEFINE_int32(dispatch_send_attempts, 3, "Publish attempts per run request before the task fails");
DEFINE_int32(dispatch_retry_base_ms, 10, "First backoff between publish attempts, doubled per attempt");
DEFINE_int32(sweep_interval_ms, 1000, "Recovery sweep period in milliseconds (0 disables)");
DEFINE_int32(dispatch_stale_ms, 5000, "Age after which an unconfirmed dispatch is re-sent");
DEFINE_string(journal_path, "", "Execution journal file (empty keeps state in memory only)");
DEFINE_string(definition_root, "", "Directory polled for workflow definition files");
DEFINE_int32(definition_poll_ms, 60000, "Definition directory polling interval in milliseconds");

namespace wf::engine {

auto engine_config_from_flags() -> EngineConfig {
  EngineConfig config;
  config.workers = FLAGS_engine_workers;
  config.conflict_retries = FLAGS_conflict_retries;
  config.dispatch.send_attempts = FLAGS_dispatch_send_attempts;
  config.dispatch.retry_base = std::chrono::milliseconds(FLAGS_dispatch_retry_base_ms);
  config.sweep_interval = std::chrono::milliseconds(FLAGS_sweep_interval_ms);
  config.dispatch_stale = std::chrono::milliseconds(FLAGS_dispatch_stale_ms);
  if (!FLAGS_definition_root.empty()) {
    config.definition_root = std::filesystem::path(FLAGS_definition_root);
  }
  config.definition_poll_interval = std::chrono::milliseconds(FLAGS_definition_poll_ms);
  return config;
}

}  // namespace wf::engine
