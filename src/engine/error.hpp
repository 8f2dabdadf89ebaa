#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace wf::engine {

enum class ErrorCode {
  Internal,
  InvalidArgument,
  NotFound,
  /// Malformed or invalid workflow graph, rejected at registration.
  Definition,
  /// Optimistic-concurrency collision on commit; callers reload and recompute.
  Conflict,
  /// Run request could not be handed to the message channel.
  Dispatch,
  /// The action executor reported a failure.
  Action,
  /// Event references a TaskExecution that already moved on.
  StaleEvent,
  Storage,
};

struct EngineError {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(std::string message) -> EngineError {
  return EngineError{ErrorCode::Internal, std::move(message)};
}

inline auto make_error(ErrorCode code, std::string message) -> EngineError {
  return EngineError{code, std::move(message)};
}

inline auto is_conflict(const EngineError& error) -> bool {
  return error.code == ErrorCode::Conflict;
}

inline auto is_stale(const EngineError& error) -> bool {
  return error.code == ErrorCode::StaleEvent;
}

inline auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::Internal: return "internal";
    case ErrorCode::InvalidArgument: return "invalid_argument";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::Definition: return "definition";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Dispatch: return "dispatch";
    case ErrorCode::Action: return "action";
    case ErrorCode::StaleEvent: return "stale_event";
    case ErrorCode::Storage: return "storage";
  }
  return "unknown";
}

}  // namespace wf::engine
