#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/graph.hpp"
#include "engine/records.hpp"
#include "engine/types.hpp"

namespace wf::engine {

enum class EventKind {
  Start,
  TaskCompleted,
  TaskFailed,
  RetryTimerFired,
  CancelRequested,
  PauseRequested,
  ResumeRequested,
  /// Periodic recovery pass over dispatches and timers that went missing.
  Sweep,
};

auto to_string(EventKind kind) -> std::string_view;

/// Trigger for one scheduler step.
struct Event {
  EventKind kind = EventKind::Start;
  std::string task_execution_id;
  /// Attempt the completion or timer refers to; mismatches are stale.
  int attempt = 0;
  std::string nonce;
  Json result;
  std::string error;
  std::string reason;
  /// Sweep only: how long a dispatch may stay unconfirmed.
  std::chrono::milliseconds stale_after{0};

  static auto start() -> Event;
  static auto completed(std::string task_execution_id, int attempt, Json result, std::string nonce = {}) -> Event;
  static auto failed(std::string task_execution_id, int attempt, std::string error, std::string nonce = {}) -> Event;
  static auto retry_timer(std::string task_execution_id, int attempt) -> Event;
  static auto cancel(std::string reason = {}) -> Event;
  static auto pause() -> Event;
  static auto resume() -> Event;
  static auto sweep(std::chrono::milliseconds stale_after) -> Event;
};

/// Run request the engine sends after the transition commits.
struct DispatchRequest {
  std::string task_execution_id;
  std::string execution_id;
  std::string task_name;
  std::string action;
  Json input;
  int attempt = 0;
  std::string nonce;
};

/// Delayed RetryTimerFired the engine schedules after the transition commits.
struct TimerRequest {
  std::string task_execution_id;
  std::string execution_id;
  int attempt = 0;
  std::chrono::milliseconds delay{0};
};

/// Next state plus the effects to emit once it is durable.
struct Transition {
  ExecutionSnapshot snapshot;
  std::vector<DispatchRequest> dispatches;
  std::vector<TimerRequest> timers;
  /// False when the event was accepted but nothing needs committing.
  bool changed = false;
};

/// Pure state machine over one execution snapshot.
///
/// apply() never touches storage or the channel: it returns the successor
/// snapshot together with the dispatches and timers the caller must emit
/// after committing it. Events that no longer match the snapshot (duplicate
/// completions, superseded timers, commands on finished executions) fail with
/// ErrorCode::StaleEvent.
class Scheduler {
 public:
  explicit Scheduler(const CompiledGraph& graph) : graph_(&graph) {}

  auto apply(ExecutionSnapshot snapshot, const Event& event, TimePoint now, const IdGenerator& ids) const
    -> Expected<Transition>;

 private:
  const CompiledGraph* graph_;
};

}  // namespace wf::engine
