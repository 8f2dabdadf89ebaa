#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace wf::engine {

/// Multi-producer, multi-consumer FIFO; capacity 0 means unbounded.
template <typename T>
class MessageQueue {
public:
  explicit MessageQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  auto push(T value) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_ || (capacity_ > 0 && queue_.size() >= capacity_)) {
      return false;
    }
    queue_.push_back(std::move(value));
    cv_.notify_one();
    return true;
  }

  /// Wait up to `timeout`; nullopt on timeout or once closed and drained.
  template <typename Rep, typename Period>
  auto pop_for(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T out = std::move(queue_.front());
    queue_.pop_front();
    return out;
  }

  auto try_pop() -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T out = std::move(queue_.front());
    queue_.pop_front();
    return out;
  }

  auto close() -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
  }

  auto closed() const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return closed_;
  }

  auto size() const -> std::size_t {
    std::unique_lock<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  std::size_t capacity_ = 0;
  std::deque<T> queue_;
  bool closed_ = false;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace wf::engine
