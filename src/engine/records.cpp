#include "engine/records.hpp"

#include <exception>

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto optional_time_to_json(const std::optional<TimePoint>& tp) -> Json {
  if (!tp) {
    return Json();
  }
  return to_millis(*tp);
}

auto optional_time_from_json(const Json& json) -> std::optional<TimePoint> {
  if (json.is_null()) {
    return std::nullopt;
  }
  return from_millis(json.get<std::int64_t>());
}

auto storage_error(std::string_view what, const std::exception& ex) -> EngineError {
  return make_error(ErrorCode::Storage, fmt::format("malformed {} record: {}", what, ex.what()));
}

}  // namespace

auto ExecutionSnapshot::find_task(std::string_view id) -> TaskExecution* {
  for (auto& task : tasks) {
    if (task.id == id) {
      return &task;
    }
  }
  return nullptr;
}

auto ExecutionSnapshot::find_task(std::string_view id) const -> const TaskExecution* {
  for (const auto& task : tasks) {
    if (task.id == id) {
      return &task;
    }
  }
  return nullptr;
}

auto make_group_id(std::string_view task_name, int iteration) -> std::string {
  return fmt::format("{}#{}", task_name, iteration);
}

auto to_json(const Execution& execution) -> Json {
  Json out = Json::object();
  out["id"] = execution.id;
  out["definition"] = {{"name", execution.definition.name}, {"version", execution.definition.version}};
  out["input"] = execution.input;
  out["status"] = std::string(to_string(execution.status));
  out["output"] = execution.output;
  out["context"] = execution.context;
  out["join_arrivals"] = execution.join_arrivals;
  out["iterations"] = execution.iterations;
  out["resolved_groups"] = execution.resolved_groups;
  out["failure"] = execution.failure;
  out["leaf_result"] = execution.leaf_result;
  out["created_at"] = to_millis(execution.created_at);
  out["updated_at"] = to_millis(execution.updated_at);
  out["version"] = execution.version;
  return out;
}

auto to_json(const TaskExecution& task) -> Json {
  Json out = Json::object();
  out["id"] = task.id;
  out["execution_id"] = task.execution_id;
  out["task_name"] = task.task_name;
  out["status"] = std::string(to_string(task.status));
  out["attempt"] = task.attempt;
  out["input"] = task.input;
  out["result"] = task.result;
  out["error"] = task.error;
  out["group_id"] = task.group_id;
  out["item_index"] = task.item_index;
  out["iteration"] = task.iteration;
  out["next_retry_at"] = optional_time_to_json(task.next_retry_at);
  out["dispatch_nonce"] = task.dispatch_nonce;
  out["dispatched_at"] = optional_time_to_json(task.dispatched_at);
  out["dispatch_confirmed"] = task.dispatch_confirmed;
  out["created_at"] = to_millis(task.created_at);
  out["updated_at"] = to_millis(task.updated_at);
  return out;
}

auto to_json(const ExecutionSnapshot& snapshot) -> Json {
  Json out = Json::object();
  out["execution"] = to_json(snapshot.execution);
  out["tasks"] = Json::array();
  for (const auto& task : snapshot.tasks) {
    out["tasks"].push_back(to_json(task));
  }
  return out;
}

auto execution_from_json(const Json& json) -> Expected<Execution> {
  try {
    Execution execution;
    execution.id = json.at("id").get<std::string>();
    execution.definition.name = json.at("definition").at("name").get<std::string>();
    execution.definition.version = json.at("definition").at("version").get<int>();
    execution.input = json.at("input");
    auto status = parse_execution_status(json.at("status").get<std::string>());
    if (!status) {
      return tl::unexpected(make_error(ErrorCode::Storage, status.error().message));
    }
    execution.status = *status;
    execution.output = json.at("output");
    execution.context = json.at("context");
    execution.join_arrivals = json.at("join_arrivals").get<std::map<std::string, std::vector<std::string>>>();
    execution.iterations = json.at("iterations").get<std::map<std::string, int>>();
    execution.resolved_groups = json.at("resolved_groups").get<std::set<std::string>>();
    execution.failure = json.at("failure");
    execution.leaf_result = json.at("leaf_result");
    execution.created_at = from_millis(json.at("created_at").get<std::int64_t>());
    execution.updated_at = from_millis(json.at("updated_at").get<std::int64_t>());
    execution.version = json.at("version").get<std::uint64_t>();
    return execution;
  } catch (const std::exception& ex) {
    return tl::unexpected(storage_error("execution", ex));
  }
}

auto task_execution_from_json(const Json& json) -> Expected<TaskExecution> {
  try {
    TaskExecution task;
    task.id = json.at("id").get<std::string>();
    task.execution_id = json.at("execution_id").get<std::string>();
    task.task_name = json.at("task_name").get<std::string>();
    auto status = parse_task_status(json.at("status").get<std::string>());
    if (!status) {
      return tl::unexpected(make_error(ErrorCode::Storage, status.error().message));
    }
    task.status = *status;
    task.attempt = json.at("attempt").get<int>();
    task.input = json.at("input");
    task.result = json.at("result");
    task.error = json.at("error").get<std::string>();
    task.group_id = json.at("group_id").get<std::string>();
    task.item_index = json.at("item_index").get<int>();
    task.iteration = json.at("iteration").get<int>();
    task.next_retry_at = optional_time_from_json(json.at("next_retry_at"));
    task.dispatch_nonce = json.at("dispatch_nonce").get<std::string>();
    task.dispatched_at = optional_time_from_json(json.at("dispatched_at"));
    task.dispatch_confirmed = json.at("dispatch_confirmed").get<bool>();
    task.created_at = from_millis(json.at("created_at").get<std::int64_t>());
    task.updated_at = from_millis(json.at("updated_at").get<std::int64_t>());
    return task;
  } catch (const std::exception& ex) {
    return tl::unexpected(storage_error("task execution", ex));
  }
}

auto snapshot_from_json(const Json& json) -> Expected<ExecutionSnapshot> {
  if (!json.is_object() || !json.contains("execution") || !json.contains("tasks") || !json["tasks"].is_array()) {
    return tl::unexpected(make_error(ErrorCode::Storage, "malformed snapshot record"));
  }
  ExecutionSnapshot snapshot;
  auto execution = execution_from_json(json["execution"]);
  if (!execution) {
    return tl::unexpected(execution.error());
  }
  snapshot.execution = std::move(*execution);
  for (const auto& task_json : json["tasks"]) {
    auto task = task_execution_from_json(task_json);
    if (!task) {
      return tl::unexpected(task.error());
    }
    snapshot.tasks.push_back(std::move(*task));
  }
  return snapshot;
}

}  // namespace wf::engine
