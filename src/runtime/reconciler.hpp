#pragma once

#include <memory>
#include <string>

#include "engine/error.hpp"
#include "engine/scheduler.hpp"
#include "engine/state_store.hpp"

namespace wf::engine {

struct ReconciledEvent {
  std::string execution_id;
  Event event;
};

/// Maps raw events-topic payloads onto scheduler events, dropping the ones
/// that no longer match a pending TaskExecution.
class Reconciler {
public:
  explicit Reconciler(std::shared_ptr<const ExecutionStore> store);

  /// Fails with ErrorCode::StaleEvent for duplicates and superseded timers,
  /// ErrorCode::InvalidArgument for payloads that do not parse.
  auto on_message(const Json &raw) const -> Expected<ReconciledEvent>;

private:
  std::shared_ptr<const ExecutionStore> store_;
};

} // namespace wf::engine
