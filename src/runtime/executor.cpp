#include "runtime/executor.hpp"

#include <exception>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace wf::engine {
namespace {

auto resolve_threads(int requested) -> int {
  if (requested > 0) {
    return requested;
  }
  const auto hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<int>(hw) : 1;
}

}  // namespace

ActionExecutor::ActionExecutor(std::shared_ptr<const ActionRegistry> actions, std::shared_ptr<MessageChannel> channel,
                               ExecutorConfig config)
    : actions_(std::move(actions)),
      channel_(std::move(channel)),
      config_(config),
      worker_count_(resolve_threads(config.threads)),
      pool_(static_cast<std::uint32_t>(worker_count_)) {}

ActionExecutor::~ActionExecutor() { stop(); }

auto ActionExecutor::start() -> void {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  stopping_.store(false, std::memory_order_release);
  alive_.store(worker_count_, std::memory_order_release);

  auto scheduler = pool_.get_scheduler();
  for (int i = 0; i < worker_count_; ++i) {
    auto task = stdexec::schedule(scheduler) | stdexec::then([this]() { this->worker_loop(); });
    stdexec::start_detached(std::move(task));
  }
  wf::log::info("Action executor started: workers={}", worker_count_);
}

auto ActionExecutor::stop() -> void {
  if (!started_.load(std::memory_order_acquire)) {
    return;
  }
  stopping_.store(true, std::memory_order_release);
  int count = alive_.load(std::memory_order_acquire);
  while (count != 0) {
    alive_.wait(count, std::memory_order_relaxed);
    count = alive_.load(std::memory_order_acquire);
  }
  started_.store(false, std::memory_order_release);
}

auto ActionExecutor::worker_loop() -> void {
  while (!stopping_.load(std::memory_order_acquire)) {
    auto payload = channel_->receive(Topic::Run, config_.receive_poll);
    if (payload) {
      handle(*payload);
    } else if (channel_->closed()) {
      break;
    }
  }
  if (alive_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    alive_.notify_all();
  }
}

auto ActionExecutor::handle(const Json& payload) -> void {
  Expected<RunRequest> request;
  try {
    request = decode_run_request(payload);
  } catch (const std::exception& ex) {
    request = tl::unexpected(make_error(ErrorCode::InvalidArgument, ex.what()));
  }
  if (!request) {
    wf::log::error("Discarding run request: {}", request.error().message);
    return;
  }

  auto completion = execute(*request);
  executed_.fetch_add(1, std::memory_order_relaxed);
  if (auto sent = channel_->publish(Topic::Events, encode(completion)); !sent) {
    // The engine's recovery sweep re-dispatches unanswered requests.
    wf::log::error("Completion for {} not published: {}", request->task_execution_id, sent.error().message);
  }
}

auto ActionExecutor::execute(const RunRequest& request) const -> CompletionMessage {
  CompletionMessage completion;
  completion.task_execution_id = request.task_execution_id;
  completion.execution_id = request.execution_id;
  completion.attempt = request.attempt;
  completion.nonce = request.nonce;

  auto action = actions_->find(request.action);
  if (!action) {
    completion.error = fmt::format("unknown action '{}'", request.action);
    return completion;
  }

  Expected<Json> result;
  try {
    result = action->invoke(request.input);
  } catch (const std::exception& ex) {
    result = tl::unexpected(make_error(ErrorCode::Action, ex.what()));
  }
  if (!result) {
    wf::log::debug("Action failed: action={}, task_execution={}, attempt={}: {}", request.action,
                   request.task_execution_id, request.attempt, result.error().message);
    completion.error = result.error().message;
    return completion;
  }
  completion.success = true;
  completion.result = std::move(*result);
  return completion;
}

}  // namespace wf::engine
