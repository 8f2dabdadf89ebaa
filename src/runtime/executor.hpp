#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <exec/static_thread_pool.hpp>

#include "engine/error.hpp"
#include "engine/registry.hpp"
#include "runtime/channel.hpp"
#include "runtime/messages.hpp"

namespace wf::engine {

struct ExecutorConfig {
  /// Worker count; 0 uses hardware concurrency.
  int threads = 0;
  /// How long an idle worker blocks on the run topic before rechecking stop.
  std::chrono::milliseconds receive_poll{50};
};

/// Action executor: pulls run requests, invokes the named action and
/// publishes a completion message for each.
class ActionExecutor {
 public:
  ActionExecutor(std::shared_ptr<const ActionRegistry> actions, std::shared_ptr<MessageChannel> channel,
                 ExecutorConfig config = {});
  ~ActionExecutor();

  ActionExecutor(const ActionExecutor&) = delete;
  auto operator=(const ActionExecutor&) -> ActionExecutor& = delete;

  auto start() -> void;
  /// Signal workers and wait for in-flight actions to finish.
  auto stop() -> void;

  /// Run one request synchronously.
  auto execute(const RunRequest& request) const -> CompletionMessage;

  auto executed() const -> std::uint64_t { return executed_.load(std::memory_order_relaxed); }

 private:
  auto worker_loop() -> void;
  auto handle(const Json& payload) -> void;

  std::shared_ptr<const ActionRegistry> actions_;
  std::shared_ptr<MessageChannel> channel_;
  ExecutorConfig config_;
  int worker_count_ = 1;
  exec::static_thread_pool pool_;
  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<int> alive_{0};
  std::atomic<std::uint64_t> executed_{0};
};

}  // namespace wf::engine
