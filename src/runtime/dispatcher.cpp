#include "runtime/dispatcher.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "common/logging/log.hpp"

namespace wf::engine {

Dispatcher::Dispatcher(std::shared_ptr<MessageChannel> channel,
                       DispatcherConfig config)
    : channel_(std::move(channel)), config_(config) {
  config_.send_attempts = std::max(1, config_.send_attempts);
}

auto Dispatcher::dispatch(const DispatchRequest &request)
    -> Expected<DispatchToken> {
  const auto payload = encode(to_run_request(request));
  auto backoff = config_.retry_base;
  EngineError last;
  for (int attempt = 1; attempt <= config_.send_attempts; ++attempt) {
    auto sent = channel_->publish(Topic::Run, payload);
    if (sent) {
      wf::log::debug("Dispatched: task_execution={}, action={}, attempt={}, "
                     "nonce={}",
                     request.task_execution_id, request.action,
                     request.attempt, request.nonce);
      return DispatchToken{request.task_execution_id, request.nonce,
                           request.attempt, Clock::now()};
    }
    last = sent.error();
    wf::log::warn("Dispatch send failed: task_execution={}, try={}/{}: {}",
                  request.task_execution_id, attempt, config_.send_attempts,
                  last.message);
    if (attempt < config_.send_attempts) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
  return tl::unexpected(make_error(
      ErrorCode::Dispatch,
      fmt::format("run request for {} not sent after {} tries: {}",
                  request.task_execution_id, config_.send_attempts,
                  last.message)));
}

auto Dispatcher::schedule_retry(const TimerRequest &timer) -> Expected<void> {
  RetryTimerMessage message{timer.task_execution_id, timer.execution_id,
                            timer.attempt};
  return channel_->publish_after(Topic::Events, encode(message), timer.delay);
}

} // namespace wf::engine
