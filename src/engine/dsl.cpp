#include "engine/dsl.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string_view>
#include <unordered_set>

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto definition_error(std::string message) -> tl::unexpected<EngineError> {
  return tl::unexpected(make_error(ErrorCode::Definition, std::move(message)));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return definition_error(fmt::format("{}: missing or invalid field '{}'", context, field));
  }
  return it->get<std::string>();
}

// Integer field within [min_value, INT_MAX]; anything else is rejected rather than narrowed.
auto bounded_int(const Json& value, std::int64_t min_value) -> std::optional<int> {
  if (!value.is_number_integer()) {
    return std::nullopt;
  }
  constexpr auto max_value = static_cast<std::int64_t>(std::numeric_limits<int>::max());
  if (value.is_number_unsigned()) {
    auto u = value.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(max_value) || static_cast<std::int64_t>(u) < min_value) {
      return std::nullopt;
    }
    return static_cast<int>(u);
  }
  auto v = value.get<std::int64_t>();
  if (v < min_value || v > max_value) {
    return std::nullopt;
  }
  return static_cast<int>(v);
}

auto parse_transitions(const Json& task_json, std::string_view field, std::string_view task_name)
  -> Expected<std::vector<std::string>> {
  std::vector<std::string> targets;
  auto it = task_json.find(std::string(field));
  if (it == task_json.end() || it->is_null()) {
    return targets;
  }
  if (it->is_string()) {
    targets.push_back(it->get<std::string>());
    return targets;
  }
  if (!it->is_array()) {
    return definition_error(fmt::format("task {}: '{}' must be a string or an array", task_name, field));
  }
  for (const auto& target : *it) {
    if (!target.is_string() || target.get<std::string>().empty()) {
      return definition_error(fmt::format("task {}: '{}' entries must be task names", task_name, field));
    }
    targets.push_back(target.get<std::string>());
  }
  return targets;
}

auto parse_join(const Json& value, std::string_view task_name) -> Expected<JoinPolicy> {
  JoinPolicy join;
  if (value.is_number_integer()) {
    auto count = bounded_int(value, 1);
    if (!count) {
      return definition_error(fmt::format("task {}: join count must be a positive int", task_name));
    }
    join.kind = JoinKind::Count;
    join.count = *count;
    return join;
  }
  if (!value.is_string()) {
    return definition_error(fmt::format("task {}: join must be a string or an integer", task_name));
  }
  auto text = value.get<std::string>();
  if (text == "none") {
    join.kind = JoinKind::None;
  } else if (text == "all") {
    join.kind = JoinKind::All;
  } else if (text == "one") {
    join.kind = JoinKind::One;
  } else {
    return definition_error(fmt::format("task {}: unknown join policy '{}'", task_name, text));
  }
  return join;
}

auto parse_retry(const Json& value, std::string_view task_name) -> Expected<RetryPolicy> {
  if (!value.is_object()) {
    return definition_error(fmt::format("task {}: retry must be an object", task_name));
  }
  RetryPolicy retry;
  if (auto it = value.find("max_attempts"); it != value.end()) {
    auto attempts = bounded_int(*it, 1);
    if (!attempts) {
      return definition_error(fmt::format("task {}: retry.max_attempts must be >= 1", task_name));
    }
    retry.max_attempts = *attempts;
  }
  if (auto it = value.find("delay_ms"); it != value.end()) {
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0 ||
        it->get<std::int64_t>() > kMaxRetryDelay.count()) {
      return definition_error(
        fmt::format("task {}: retry.delay_ms must be in [0, {}]", task_name, kMaxRetryDelay.count()));
    }
    retry.delay = std::chrono::milliseconds(it->get<std::int64_t>());
  }
  if (auto it = value.find("backoff"); it != value.end()) {
    if (!it->is_number() || !std::isfinite(it->get<double>()) || it->get<double>() < 1.0) {
      return definition_error(fmt::format("task {}: retry.backoff must be >= 1.0", task_name));
    }
    retry.backoff = it->get<double>();
  }
  return retry;
}

auto parse_task(const Json& task_json) -> Expected<TaskDef> {
  if (!task_json.is_object()) {
    return definition_error("task entry must be an object");
  }
  auto name = get_string_field(task_json, "name", "task");
  if (!name) {
    return tl::unexpected(name.error());
  }
  if (name->empty()) {
    return definition_error("task name must not be empty");
  }
  auto action = get_string_field(task_json, "action", fmt::format("task {}", *name));
  if (!action) {
    return tl::unexpected(action.error());
  }

  TaskDef task;
  task.name = std::move(*name);
  task.action = std::move(*action);

  if (auto it = task_json.find("input"); it != task_json.end()) {
    task.input = *it;
  }
  if (auto it = task_json.find("retry"); it != task_json.end()) {
    auto retry = parse_retry(*it, task.name);
    if (!retry) {
      return tl::unexpected(retry.error());
    }
    task.retry = *retry;
  }
  if (auto it = task_json.find("join"); it != task_json.end()) {
    auto join = parse_join(*it, task.name);
    if (!join) {
      return tl::unexpected(join.error());
    }
    task.join = *join;
  }
  if (auto it = task_json.find("with-items"); it != task_json.end()) {
    if (!it->is_string() || it->get<std::string>().empty()) {
      return definition_error(fmt::format("task {}: with-items must be an expression string", task.name));
    }
    task.with_items = it->get<std::string>();
  }
  if (auto it = task_json.find("loop"); it != task_json.end()) {
    auto loop = bounded_int(*it, 0);
    if (!loop) {
      return definition_error(fmt::format("task {}: loop must be a non-negative integer", task.name));
    }
    task.loop = *loop;
  }
  if (auto it = task_json.find("entry"); it != task_json.end()) {
    if (!it->is_boolean()) {
      return definition_error(fmt::format("task {}: entry must be a boolean", task.name));
    }
    task.entry = it->get<bool>();
  }

  auto on_success = parse_transitions(task_json, "on-success", task.name);
  if (!on_success) {
    return tl::unexpected(on_success.error());
  }
  auto on_error = parse_transitions(task_json, "on-error", task.name);
  if (!on_error) {
    return tl::unexpected(on_error.error());
  }
  auto on_complete = parse_transitions(task_json, "on-complete", task.name);
  if (!on_complete) {
    return tl::unexpected(on_complete.error());
  }
  task.on_success = std::move(*on_success);
  task.on_error = std::move(*on_error);
  task.on_complete = std::move(*on_complete);
  return task;
}

auto transitions_to_json(const std::vector<std::string>& targets) -> Json {
  Json out = Json::array();
  for (const auto& target : targets) {
    out.push_back(target);
  }
  return out;
}

}  // namespace

auto RetryPolicy::delay_after(int attempt) const -> std::chrono::milliseconds {
  if (attempt < 1) {
    attempt = 1;
  }
  const double cap = static_cast<double>(kMaxRetryDelay.count());
  double millis = static_cast<double>(delay.count()) * std::pow(backoff, static_cast<double>(attempt - 1));
  // Saturate before the cast; pow overflows to inf for large attempts.
  if (!(millis < cap)) {
    return delay.count() > 0 ? kMaxRetryDelay : std::chrono::milliseconds(0);
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(millis));
}

auto parse_workflow_json(const Json& json) -> Expected<WorkflowDef> {
  if (!json.is_object()) {
    return definition_error("workflow json must be an object");
  }

  WorkflowDef workflow;
  auto name = get_string_field(json, "name", "workflow");
  if (!name) {
    return tl::unexpected(name.error());
  }
  if (name->empty()) {
    return definition_error("workflow name must not be empty");
  }
  workflow.name = std::move(*name);

  if (auto it = json.find("version"); it != json.end()) {
    auto version = bounded_int(*it, 1);
    if (!version) {
      return definition_error("version must be a positive integer");
    }
    workflow.version = *version;
  }

  auto tasks_it = json.find("tasks");
  if (tasks_it == json.end() || !tasks_it->is_array()) {
    return definition_error("tasks must be an array");
  }
  std::unordered_set<std::string> names;
  for (const auto& task_json : *tasks_it) {
    auto task = parse_task(task_json);
    if (!task) {
      return tl::unexpected(task.error());
    }
    if (!names.insert(task->name).second) {
      return definition_error(fmt::format("duplicate task name: {}", task->name));
    }
    workflow.tasks.push_back(std::move(*task));
  }
  return workflow;
}

auto workflow_to_json(const WorkflowDef& workflow) -> Json {
  Json out = Json::object();
  out["name"] = workflow.name;
  out["version"] = workflow.version;
  out["tasks"] = Json::array();
  for (const auto& task : workflow.tasks) {
    Json task_json = Json::object();
    task_json["name"] = task.name;
    task_json["action"] = task.action;
    task_json["input"] = task.input;
    task_json["retry"] = {{"max_attempts", task.retry.max_attempts},
                          {"delay_ms", task.retry.delay.count()},
                          {"backoff", task.retry.backoff}};
    if (task.join.kind == JoinKind::Count) {
      task_json["join"] = task.join.count;
    } else {
      task_json["join"] = to_string(task.join);
    }
    if (!task.with_items.empty()) {
      task_json["with-items"] = task.with_items;
    }
    task_json["loop"] = task.loop;
    task_json["entry"] = task.entry;
    task_json["on-success"] = transitions_to_json(task.on_success);
    task_json["on-error"] = transitions_to_json(task.on_error);
    task_json["on-complete"] = transitions_to_json(task.on_complete);
    out["tasks"].push_back(std::move(task_json));
  }
  return out;
}

auto to_string(const JoinPolicy& join) -> std::string {
  switch (join.kind) {
    case JoinKind::None: return "none";
    case JoinKind::All: return "all";
    case JoinKind::One: return "one";
    case JoinKind::Count: return std::to_string(join.count);
  }
  return "none";
}

}  // namespace wf::engine
