#include "runtime/reconciler.hpp"

#include <exception>
#include <utility>

#include <fmt/format.h>

#include "common/logging/log.hpp"
#include "runtime/messages.hpp"

namespace wf::engine {
namespace {

auto drop(std::string message) -> EngineError {
  wf::log::debug("Dropping event: {}", message);
  return make_error(ErrorCode::StaleEvent, std::move(message));
}

auto reconcile_completion(const ExecutionStore &store, const Json &raw)
    -> Expected<ReconciledEvent> {
  auto message = decode_completion(raw);
  if (!message) {
    return tl::unexpected(message.error());
  }
  auto task = store.get_task_execution(message->task_execution_id);
  if (!task) {
    return tl::unexpected(
        drop(fmt::format("completion for unknown task execution {}",
                         message->task_execution_id)));
  }
  if (task->status != TaskStatus::Running ||
      task->attempt != message->attempt) {
    return tl::unexpected(drop(fmt::format(
        "completion for {} attempt {} while task is {} at attempt {}",
        task->id, message->attempt, to_string(task->status), task->attempt)));
  }
  if (!message->nonce.empty() && message->nonce != task->dispatch_nonce) {
    wf::log::debug("Completion nonce {} differs from current dispatch {} for "
                   "{}",
                   message->nonce, task->dispatch_nonce, task->id);
  }

  Event event =
      message->success
          ? Event::completed(task->id, message->attempt,
                             std::move(message->result), message->nonce)
          : Event::failed(task->id, message->attempt,
                          std::move(message->error), message->nonce);
  return ReconciledEvent{task->execution_id, std::move(event)};
}

auto reconcile_retry_timer(const ExecutionStore &store, const Json &raw)
    -> Expected<ReconciledEvent> {
  auto message = decode_retry_timer(raw);
  if (!message) {
    return tl::unexpected(message.error());
  }
  auto task = store.get_task_execution(message->task_execution_id);
  if (!task) {
    return tl::unexpected(drop(fmt::format(
        "retry timer for unknown task execution {}", message->task_execution_id)));
  }
  if (task->status != TaskStatus::Delayed ||
      task->attempt != message->attempt) {
    return tl::unexpected(drop(fmt::format(
        "retry timer for {} attempt {} while task is {} at attempt {}",
        task->id, message->attempt, to_string(task->status), task->attempt)));
  }
  return ReconciledEvent{task->execution_id,
                         Event::retry_timer(task->id, message->attempt)};
}

} // namespace

Reconciler::Reconciler(std::shared_ptr<const ExecutionStore> store)
    : store_(std::move(store)) {}

auto Reconciler::on_message(const Json &raw) const
    -> Expected<ReconciledEvent> {
  try {
    const auto type = message_type(raw);
    if (type == "completion") {
      return reconcile_completion(*store_, raw);
    }
    if (type == "retry_timer") {
      return reconcile_retry_timer(*store_, raw);
    }
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        fmt::format("unknown event message type '{}'", type)));
  } catch (const std::exception &ex) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidArgument,
        fmt::format("malformed event message: {}", ex.what())));
  }
}

} // namespace wf::engine
