#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include <exec/async_scope.hpp>
#include <exec/timed_thread_scheduler.hpp>

#include "engine/error.hpp"
#include "engine/types.hpp"
#include "runtime/messages.hpp"
#include "runtime/queue.hpp"

namespace wf::engine {

/// Asynchronous, at-least-once message transport between the engine and
/// action executors.
class MessageChannel {
public:
  virtual ~MessageChannel() = default;

  virtual auto publish(Topic topic, Json message) -> Expected<void> = 0;
  /// Deliver `message` on `topic` once `delay` has elapsed.
  virtual auto publish_after(Topic topic, Json message,
                             std::chrono::milliseconds delay)
      -> Expected<void> = 0;
  /// Next message on `topic`, or nullopt after `timeout` or once closed.
  virtual auto receive(Topic topic, std::chrono::milliseconds timeout)
      -> std::optional<Json> = 0;
  virtual auto close() -> void = 0;
  virtual auto closed() const -> bool = 0;
};

/// Process-local channel backed by one queue per topic. Delayed messages
/// ride a timed scheduler and are discarded when the channel closes.
class InMemoryChannel : public MessageChannel {
public:
  InMemoryChannel();
  ~InMemoryChannel() override;

  InMemoryChannel(const InMemoryChannel &) = delete;
  auto operator=(const InMemoryChannel &) -> InMemoryChannel & = delete;

  auto publish(Topic topic, Json message) -> Expected<void> override;
  auto publish_after(Topic topic, Json message, std::chrono::milliseconds delay)
      -> Expected<void> override;
  auto receive(Topic topic, std::chrono::milliseconds timeout)
      -> std::optional<Json> override;
  auto close() -> void override;
  auto closed() const -> bool override;

  /// Non-blocking receive.
  auto try_receive(Topic topic) -> std::optional<Json>;
  auto pending(Topic topic) const -> std::size_t;
  /// Fail the next `count` publishes on `topic` with ErrorCode::Dispatch.
  auto fail_next_publishes(Topic topic, int count) -> void;
  /// Total messages accepted per topic.
  auto published(Topic topic) const -> std::size_t;

private:
  auto queue(Topic topic) -> MessageQueue<Json> &;
  auto queue(Topic topic) const -> const MessageQueue<Json> &;

  MessageQueue<Json> run_queue_;
  MessageQueue<Json> event_queue_;
  std::atomic<int> run_failures_{0};
  std::atomic<int> event_failures_{0};
  std::atomic<std::size_t> run_published_{0};
  std::atomic<std::size_t> event_published_{0};
  std::atomic<bool> closed_{false};
  std::unique_ptr<exec::timed_thread_context> timer_context_;
  exec::timed_thread_scheduler timer_scheduler_;
  exec::async_scope scope_;
};

} // namespace wf::engine
