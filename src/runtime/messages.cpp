#include "runtime/messages.hpp"

#include <cstdint>
#include <exception>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace wf::engine {
namespace {

constexpr const char* kCompletionType = "completion";
constexpr const char* kRetryTimerType = "retry_timer";

auto malformed(std::string_view kind, std::string_view detail) -> EngineError {
  return make_error(ErrorCode::InvalidArgument, fmt::format("malformed {} message: {}", kind, detail));
}

auto require_string(const Json& json, const char* key, std::string_view kind) -> Expected<std::string> {
  auto it = json.find(key);
  if (it == json.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    return tl::unexpected(malformed(kind, fmt::format("missing '{}'", key)));
  }
  return it->get<std::string>();
}

auto require_attempt(const Json& json, std::string_view kind) -> Expected<int> {
  auto it = json.find("attempt");
  // Checked before narrowing so 2^32 + 1 cannot alias attempt 1.
  if (it == json.end() || !it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 1) ||
      it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
    return tl::unexpected(malformed(kind, "attempt must be a positive integer"));
  }
  return static_cast<int>(it->get<std::int64_t>());
}

}  // namespace

auto to_string(Topic topic) -> std::string_view {
  switch (topic) {
    case Topic::Run: return "run";
    case Topic::Events: return "events";
  }
  return "unknown";
}

auto to_run_request(const DispatchRequest& request) -> RunRequest {
  return RunRequest{request.task_execution_id, request.execution_id, request.task_name, request.action,
                    request.input, request.attempt, request.nonce};
}

auto encode(const RunRequest& request) -> Json {
  return Json{
    {"task_execution_id", request.task_execution_id},
    {"execution_id", request.execution_id},
    {"task", request.task_name},
    {"action", request.action},
    {"input", request.input},
    {"attempt", request.attempt},
    {"nonce", request.nonce},
  };
}

auto encode(const CompletionMessage& message) -> Json {
  Json json{
    {"type", kCompletionType},
    {"task_execution_id", message.task_execution_id},
    {"execution_id", message.execution_id},
    {"attempt", message.attempt},
    {"nonce", message.nonce},
    {"outcome", message.success ? "success" : "error"},
  };
  if (message.success) {
    json["result"] = message.result;
  } else {
    json["error"] = message.error;
  }
  return json;
}

auto encode(const RetryTimerMessage& message) -> Json {
  return Json{
    {"type", kRetryTimerType},
    {"task_execution_id", message.task_execution_id},
    {"execution_id", message.execution_id},
    {"attempt", message.attempt},
  };
}

auto decode_run_request(const Json& json) -> Expected<RunRequest> {
  if (!json.is_object()) {
    return tl::unexpected(malformed("run", "expected an object"));
  }
  RunRequest request;
  auto id = require_string(json, "task_execution_id", "run");
  if (!id) {
    return tl::unexpected(id.error());
  }
  auto action = require_string(json, "action", "run");
  if (!action) {
    return tl::unexpected(action.error());
  }
  auto attempt = require_attempt(json, "run");
  if (!attempt) {
    return tl::unexpected(attempt.error());
  }
  request.task_execution_id = std::move(*id);
  request.action = std::move(*action);
  request.attempt = *attempt;
  request.execution_id = json.value("execution_id", std::string{});
  request.task_name = json.value("task", std::string{});
  request.input = json.value("input", Json::object());
  request.nonce = json.value("nonce", std::string{});
  return request;
}

auto decode_completion(const Json& json) -> Expected<CompletionMessage> {
  if (!json.is_object()) {
    return tl::unexpected(malformed("completion", "expected an object"));
  }
  auto id = require_string(json, "task_execution_id", "completion");
  if (!id) {
    return tl::unexpected(id.error());
  }
  auto attempt = require_attempt(json, "completion");
  if (!attempt) {
    return tl::unexpected(attempt.error());
  }
  auto outcome = json.value("outcome", std::string{});
  if (outcome != "success" && outcome != "error") {
    return tl::unexpected(malformed("completion", fmt::format("unknown outcome '{}'", outcome)));
  }

  CompletionMessage message;
  message.task_execution_id = std::move(*id);
  message.execution_id = json.value("execution_id", std::string{});
  message.attempt = *attempt;
  message.nonce = json.value("nonce", std::string{});
  message.success = outcome == "success";
  if (message.success) {
    message.result = json.value("result", Json());
  } else {
    message.error = json.value("error", std::string("action failed"));
  }
  return message;
}

auto decode_retry_timer(const Json& json) -> Expected<RetryTimerMessage> {
  if (!json.is_object()) {
    return tl::unexpected(malformed("retry_timer", "expected an object"));
  }
  auto id = require_string(json, "task_execution_id", "retry_timer");
  if (!id) {
    return tl::unexpected(id.error());
  }
  auto attempt = require_attempt(json, "retry_timer");
  if (!attempt) {
    return tl::unexpected(attempt.error());
  }
  return RetryTimerMessage{std::move(*id), json.value("execution_id", std::string{}), *attempt};
}

auto message_type(const Json& json) -> std::string {
  if (!json.is_object()) {
    return {};
  }
  return json.value("type", std::string{});
}

}  // namespace wf::engine
