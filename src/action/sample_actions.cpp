#include "action/sample_actions.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <fmt/format.h>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::action {
namespace {

using wf::engine::ErrorCode;
using wf::engine::Expected;
using wf::engine::Json;
using wf::engine::make_error;

auto get_int_param(const Json& params, const char* key, int64_t fallback) -> int64_t {
  if (!params.is_object()) {
    return fallback;
  }
  auto it = params.find(key);
  if (it != params.end() && it->is_number_integer()) {
    return it->get<int64_t>();
  }
  return fallback;
}

auto get_string_param(const Json& params, const char* key, std::string fallback) -> std::string {
  if (!params.is_object()) {
    return fallback;
  }
  auto it = params.find(key);
  if (it != params.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return fallback;
}

// Failure budget per key, shared by every invocation of fail_times.
struct FailureCounter {
  std::mutex mutex;
  std::unordered_map<std::string, int64_t> calls;

  auto next(const std::string& key) -> int64_t {
    std::lock_guard<std::mutex> lock(mutex);
    return ++calls[key];
  }
};

}  // namespace

auto register_sample_actions(wf::engine::ActionRegistry& registry) -> void {
  registry.register_action("echo", [](const Json& input) -> Expected<Json> { return input; });

  registry.register_action("constant", [](const Json& input) -> Expected<Json> {
    if (!input.is_object() || !input.contains("value")) {
      return tl::unexpected(make_error(ErrorCode::Action, "constant expects 'value'"));
    }
    return input["value"];
  });

  registry.register_action("fail", [](const Json& input) -> Expected<Json> {
    return tl::unexpected(make_error(ErrorCode::Action, get_string_param(input, "message", "failed")));
  });

  auto counter = std::make_shared<FailureCounter>();
  registry.register_action("fail_times", [counter](const Json& input) -> Expected<Json> {
    const auto times = get_int_param(input, "times", 1);
    const auto key = get_string_param(input, "key", "default");
    const auto call = counter->next(key);
    if (call <= times) {
      return tl::unexpected(make_error(ErrorCode::Action, fmt::format("{} failure {} of {}", key, call, times)));
    }
    if (input.is_object() && input.contains("result")) {
      return input["result"];
    }
    return Json{{"calls", call}};
  });

  registry.register_action("sleep", [](const Json& input) -> Expected<Json> {
    const auto ms = get_int_param(input, "ms", 10);
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    return input;
  });

  registry.register_action("sum", [](const Json& input) -> Expected<Json> {
    if (!input.is_object() || !input.contains("values") || !input["values"].is_array()) {
      return tl::unexpected(make_error(ErrorCode::Action, "sum expects an array 'values'"));
    }
    double total = 0.0;
    bool integral = true;
    for (const auto& value : input["values"]) {
      if (!value.is_number()) {
        const auto shown = value.dump(-1, ' ', false, Json::error_handler_t::replace);
        return tl::unexpected(make_error(ErrorCode::Action, fmt::format("sum: '{}' is not a number", shown)));
      }
      integral = integral && value.is_number_integer();
      total += value.get<double>();
    }
    if (integral) {
      return Json(static_cast<int64_t>(total));
    }
    return Json(total);
  });
}

}  // namespace wf::action
