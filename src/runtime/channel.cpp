#include "runtime/channel.hpp"

#include <utility>

#include <fmt/format.h>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace wf::engine {
namespace {

auto consume_failure(std::atomic<int> &failures) -> bool {
  int remaining = failures.load(std::memory_order_acquire);
  while (remaining > 0) {
    if (failures.compare_exchange_weak(remaining, remaining - 1,
                                       std::memory_order_acq_rel)) {
      return true;
    }
  }
  return false;
}

} // namespace

InMemoryChannel::InMemoryChannel()
    : timer_context_(std::make_unique<exec::timed_thread_context>()),
      timer_scheduler_(timer_context_->get_scheduler()), scope_() {}

InMemoryChannel::~InMemoryChannel() {
  close();
  stdexec::sync_wait(scope_.on_empty());
}

auto InMemoryChannel::queue(Topic topic) -> MessageQueue<Json> & {
  return topic == Topic::Run ? run_queue_ : event_queue_;
}

auto InMemoryChannel::queue(Topic topic) const -> const MessageQueue<Json> & {
  return topic == Topic::Run ? run_queue_ : event_queue_;
}

auto InMemoryChannel::publish(Topic topic, Json message) -> Expected<void> {
  if (closed_.load(std::memory_order_acquire)) {
    return tl::unexpected(
        make_error(ErrorCode::Dispatch, "channel is closed"));
  }
  auto &failures = topic == Topic::Run ? run_failures_ : event_failures_;
  if (consume_failure(failures)) {
    return tl::unexpected(make_error(
        ErrorCode::Dispatch,
        fmt::format("publish to '{}' rejected by transport", to_string(topic))));
  }
  if (!queue(topic).push(std::move(message))) {
    return tl::unexpected(make_error(
        ErrorCode::Dispatch,
        fmt::format("topic '{}' is not accepting messages", to_string(topic))));
  }
  auto &counter = topic == Topic::Run ? run_published_ : event_published_;
  counter.fetch_add(1, std::memory_order_relaxed);
  return {};
}

auto InMemoryChannel::publish_after(Topic topic, Json message,
                                    std::chrono::milliseconds delay)
    -> Expected<void> {
  if (closed_.load(std::memory_order_acquire)) {
    return tl::unexpected(
        make_error(ErrorCode::Dispatch, "channel is closed"));
  }
  if (delay <= std::chrono::milliseconds::zero()) {
    return publish(topic, std::move(message));
  }
  auto sender =
      exec::schedule_after(timer_scheduler_, delay) |
      stdexec::then([this, topic, message = std::move(message)]() mutable {
        if (closed_.load(std::memory_order_acquire)) {
          return;
        }
        if (auto sent = publish(topic, std::move(message)); !sent) {
          wf::log::warn("Delayed publish to '{}' failed: {}", to_string(topic),
                        sent.error().message);
        }
      });
  scope_.spawn(std::move(sender));
  return {};
}

auto InMemoryChannel::receive(Topic topic, std::chrono::milliseconds timeout)
    -> std::optional<Json> {
  return queue(topic).pop_for(timeout);
}

auto InMemoryChannel::try_receive(Topic topic) -> std::optional<Json> {
  return queue(topic).try_pop();
}

auto InMemoryChannel::close() -> void {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  scope_.request_stop();
  run_queue_.close();
  event_queue_.close();
}

auto InMemoryChannel::closed() const -> bool {
  return closed_.load(std::memory_order_acquire);
}

auto InMemoryChannel::pending(Topic topic) const -> std::size_t {
  return queue(topic).size();
}

auto InMemoryChannel::fail_next_publishes(Topic topic, int count) -> void {
  auto &failures = topic == Topic::Run ? run_failures_ : event_failures_;
  failures.store(count, std::memory_order_release);
}

auto InMemoryChannel::published(Topic topic) const -> std::size_t {
  const auto &counter = topic == Topic::Run ? run_published_ : event_published_;
  return counter.load(std::memory_order_relaxed);
}

} // namespace wf::engine
