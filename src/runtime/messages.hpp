#pragma once

#include <string>
#include <string_view>

#include "engine/error.hpp"
#include "engine/scheduler.hpp"
#include "engine/types.hpp"

namespace wf::engine {

/// Channel topics: run requests flow to executors, everything else flows back.
enum class Topic {
  Run,
  Events,
};

auto to_string(Topic topic) -> std::string_view;

struct RunRequest {
  std::string task_execution_id;
  std::string execution_id;
  std::string task_name;
  std::string action;
  Json input;
  int attempt = 0;
  std::string nonce;
};

struct CompletionMessage {
  std::string task_execution_id;
  std::string execution_id;
  int attempt = 0;
  std::string nonce;
  bool success = false;
  Json result;
  std::string error;
};

struct RetryTimerMessage {
  std::string task_execution_id;
  std::string execution_id;
  int attempt = 0;
};

auto to_run_request(const DispatchRequest& request) -> RunRequest;

auto encode(const RunRequest& request) -> Json;
auto encode(const CompletionMessage& message) -> Json;
auto encode(const RetryTimerMessage& message) -> Json;

auto decode_run_request(const Json& json) -> Expected<RunRequest>;
auto decode_completion(const Json& json) -> Expected<CompletionMessage>;
auto decode_retry_timer(const Json& json) -> Expected<RetryTimerMessage>;

/// Value of the "type" field of an events-topic message.
auto message_type(const Json& json) -> std::string;

}  // namespace wf::engine
