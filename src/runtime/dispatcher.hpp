#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "engine/error.hpp"
#include "engine/scheduler.hpp"
#include "runtime/channel.hpp"

namespace wf::engine {

/// Receipt for a run request the channel accepted.
struct DispatchToken {
  std::string task_execution_id;
  std::string nonce;
  int attempt = 0;
  TimePoint sent_at;
};

struct DispatcherConfig {
  /// Publish attempts per run request before giving up with ErrorCode::Dispatch.
  int send_attempts = 3;
  /// First backoff between publish attempts; doubles per attempt.
  std::chrono::milliseconds retry_base{10};
};

/// Hands run requests and retry timers to the message channel.
class Dispatcher {
public:
  Dispatcher(std::shared_ptr<MessageChannel> channel,
             DispatcherConfig config = {});

  auto dispatch(const DispatchRequest &request) -> Expected<DispatchToken>;
  auto schedule_retry(const TimerRequest &timer) -> Expected<void>;

  auto config() const -> const DispatcherConfig & { return config_; }

private:
  std::shared_ptr<MessageChannel> channel_;
  DispatcherConfig config_;
};

} // namespace wf::engine
