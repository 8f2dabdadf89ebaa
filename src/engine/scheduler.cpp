#include "engine/scheduler.hpp"

#include <algorithm>
#include <deque>
#include <optional>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "common/logging/log.hpp"
#include "engine/expression.hpp"

namespace wf::engine {
namespace {

auto stale(std::string message) -> EngineError {
  return make_error(ErrorCode::StaleEvent, std::move(message));
}

auto remaining(TimePoint due, TimePoint now) -> std::chrono::milliseconds {
  if (due <= now) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::ceil<std::chrono::milliseconds>(due - now);
}

struct GroupCounts {
  int succeeded = 0;
  int failed = 0;
  int pending = 0;
};

struct Step {
  const CompiledGraph& graph;
  TimePoint now;
  const IdGenerator& ids;
  Transition out;

  auto execution() -> Execution& { return out.snapshot.execution; }
  auto tasks() -> std::vector<TaskExecution>& { return out.snapshot.tasks; }

  auto touch() -> void {
    execution().updated_at = now;
    out.changed = true;
  }

  auto task_index(std::string_view name) const -> Expected<int> {
    auto index = graph.index_of(name);
    if (!index) {
      return tl::unexpected(make_error(fmt::format("task '{}' is not part of {}", name, graph.name())));
    }
    return *index;
  }

  auto published() -> Json& {
    auto& context = execution().context;
    if (!context.is_object()) {
      context = Json::object();
    }
    if (!context.contains("tasks") || !context["tasks"].is_object()) {
      context["tasks"] = Json::object();
    }
    return context["tasks"];
  }

  auto render_context() -> Json {
    return Json{{"input", execution().input}, {"tasks", published()}};
  }

  auto group_spawned(const std::string& group) -> bool {
    if (execution().resolved_groups.count(group) > 0) {
      return true;
    }
    return std::any_of(tasks().begin(), tasks().end(),
                       [&](const TaskExecution& te) { return te.group_id == group; });
  }

  auto start_attempt(TaskExecution& te) -> void {
    te.status = TaskStatus::Running;
    te.attempt += 1;
    te.error.clear();
    te.next_retry_at.reset();
    te.dispatch_nonce = ids();
    te.dispatched_at = now;
    te.dispatch_confirmed = false;
    te.updated_at = now;

    const auto* task = graph.find(te.task_name);
    out.dispatches.push_back(DispatchRequest{
      te.id, te.execution_id, te.task_name, task != nullptr ? task->def.action : std::string{},
      te.input, te.attempt, te.dispatch_nonce});
  }

  auto make_instance(const CompiledTask& task, const std::string& group, int iteration, int item_index)
    -> TaskExecution {
    TaskExecution te;
    te.id = ids();
    te.execution_id = execution().id;
    te.task_name = task.def.name;
    te.status = TaskStatus::Waiting;
    te.group_id = group;
    te.item_index = item_index;
    te.iteration = iteration;
    te.created_at = now;
    te.updated_at = now;
    return te;
  }

  auto fail_instance(TaskExecution& te, std::string message) -> void {
    te.status = TaskStatus::Error;
    te.error = std::move(message);
    te.updated_at = now;
  }

  auto render_input(TaskExecution& te, const CompiledTask& task, const Json& context) -> void {
    auto rendered = render_template(task.def.input, context);
    if (!rendered) {
      fail_instance(te, fmt::format("input of task '{}': {}", task.def.name, rendered.error().message));
      return;
    }
    te.input = std::move(*rendered);
  }

  auto spawn(int index, int iteration) -> void {
    const auto& task = graph.task(index);
    auto& exec = execution();
    const auto group = make_group_id(task.def.name, iteration);
    exec.iterations[task.def.name] = iteration;
    exec.join_arrivals.erase(group);

    const auto context = render_context();
    std::vector<TaskExecution> created;
    if (task.is_with_items()) {
      auto collection = evaluate(*task.with_items, context);
      if (!collection.is_array()) {
        created.push_back(make_instance(task, group, iteration, -1));
        fail_instance(created.back(),
                      fmt::format("with-items '{}' did not yield an array", task.with_items->source));
      } else {
        const auto size = static_cast<int>(collection.size());
        if (task.def.join.kind == JoinKind::Count && task.def.join.count > size) {
          resolve_group(index, iteration, TaskStatus::Error, Json(),
                        fmt::format("join count {} exceeds {} items", task.def.join.count, size), {});
          return;
        }
        if (size == 0) {
          resolve_group(index, iteration, TaskStatus::Success, Json::array(), {}, {});
          return;
        }
        for (int i = 0; i < size; ++i) {
          auto item_context = context;
          item_context["item"] = collection[static_cast<std::size_t>(i)];
          item_context["index"] = i;
          created.push_back(make_instance(task, group, iteration, i));
          render_input(created.back(), task, item_context);
        }
      }
    } else {
      created.push_back(make_instance(task, group, iteration, -1));
      render_input(created.back(), task, context);
    }

    bool settled = false;
    for (auto& te : created) {
      if (te.status == TaskStatus::Waiting && exec.status == ExecutionStatus::Running) {
        start_attempt(te);
      }
      settled = settled || is_terminal(te.status);
      tasks().push_back(std::move(te));
    }
    if (settled) {
      evaluate_group(index, iteration);
    }
  }

  auto siblings(const std::string& group) -> std::vector<const TaskExecution*> {
    std::vector<const TaskExecution*> members;
    for (const auto& te : tasks()) {
      if (te.group_id == group) {
        members.push_back(&te);
      }
    }
    std::sort(members.begin(), members.end(),
              [](const TaskExecution* a, const TaskExecution* b) { return a->item_index < b->item_index; });
    return members;
  }

  auto evaluate_group(int index, int iteration) -> void {
    const auto& task = graph.task(index);
    const auto group = make_group_id(task.def.name, iteration);
    if (execution().resolved_groups.count(group) > 0) {
      return;
    }

    const auto members = siblings(group);
    if (members.empty()) {
      return;
    }
    GroupCounts counts;
    const TaskExecution* first_failure = nullptr;
    for (const auto* te : members) {
      if (te->status == TaskStatus::Success) {
        counts.succeeded += 1;
      } else if (te->status == TaskStatus::Error) {
        counts.failed += 1;
        if (first_failure == nullptr) {
          first_failure = te;
        }
      } else {
        counts.pending += 1;
      }
    }

    std::optional<TaskStatus> outcome;
    if (!task.is_with_items()) {
      if (counts.pending == 0) {
        outcome = counts.failed == 0 ? TaskStatus::Success : TaskStatus::Error;
      }
    } else {
      switch (task.def.join.kind) {
        case JoinKind::None:
        case JoinKind::All:
          if (counts.pending == 0) {
            outcome = counts.failed == 0 ? TaskStatus::Success : TaskStatus::Error;
          }
          break;
        case JoinKind::One:
          if (counts.succeeded >= 1) {
            outcome = TaskStatus::Success;
          } else if (counts.pending == 0) {
            outcome = TaskStatus::Error;
          }
          break;
        case JoinKind::Count:
          if (counts.succeeded >= task.def.join.count) {
            outcome = TaskStatus::Success;
          } else if (counts.succeeded + counts.pending < task.def.join.count) {
            outcome = TaskStatus::Error;
          }
          break;
      }
    }
    if (!outcome) {
      return;
    }

    if (*outcome == TaskStatus::Success) {
      Json result;
      if (task.is_with_items()) {
        result = Json::array();
        for (const auto* te : members) {
          result.push_back(te->status == TaskStatus::Success ? te->result : Json());
        }
      } else {
        result = members.front()->result;
      }
      resolve_group(index, iteration, TaskStatus::Success, std::move(result), {}, {});
      return;
    }

    std::string message = first_failure != nullptr ? first_failure->error : std::string("join not satisfied");
    std::string origin = first_failure != nullptr ? first_failure->id : std::string{};
    resolve_group(index, iteration, TaskStatus::Error, Json(), std::move(message), std::move(origin));
  }

  auto resolve_group(int index, int iteration, TaskStatus status, Json result, std::string error,
                     std::string origin) -> void {
    const auto& task = graph.task(index);
    auto& exec = execution();
    exec.resolved_groups.insert(make_group_id(task.def.name, iteration));
    if (status == TaskStatus::Success) {
      published()[task.def.name] = result;
    } else {
      published()[task.def.name] = Json{{"error", error}};
    }
    wf::log::debug("Task resolved: execution={}, task={}, iteration={}, status={}",
                   exec.id, task.def.name, iteration, to_string(status));

    bool fired = false;
    for (int target : graph.fired_successors(index, status)) {
      fired = arrive(target, index) || fired;
    }
    if (fired) {
      return;
    }
    if (status == TaskStatus::Success) {
      exec.leaf_result = std::move(result);
    } else if (exec.failure.is_null()) {
      exec.failure = Json{{"error", error}, {"task", task.def.name}, {"task_execution_id", origin}};
    }
  }

  auto join_satisfied(const CompiledTask& task, std::size_t arrivals) const -> bool {
    if (task.is_with_items()) {
      return arrivals >= 1;
    }
    switch (task.def.join.kind) {
      case JoinKind::None:
      case JoinKind::One:
        return arrivals >= 1;
      case JoinKind::All:
        return arrivals >= task.predecessors.size();
      case JoinKind::Count:
        return arrivals >= static_cast<std::size_t>(task.def.join.count);
    }
    return false;
  }

  /// Returns false only when the edge was dropped.
  auto arrive(int target, int source) -> bool {
    const auto& task = graph.task(target);
    auto& exec = execution();
    auto current = exec.iterations.find(task.def.name);
    if (current != exec.iterations.end() && graph.is_loop_edge(source, target)) {
      return reenter(target, current->second + 1);
    }

    const int iteration = current != exec.iterations.end() ? current->second : 0;
    exec.iterations[task.def.name] = iteration;
    const auto group = make_group_id(task.def.name, iteration);
    if (group_spawned(group)) {
      wf::log::debug("Transition absorbed: execution={}, from={}, into={}",
                     exec.id, graph.task(source).def.name, group);
      return true;
    }

    auto& arrivals = exec.join_arrivals[group];
    const auto& source_name = graph.task(source).def.name;
    if (std::find(arrivals.begin(), arrivals.end(), source_name) == arrivals.end()) {
      arrivals.push_back(source_name);
    }
    if (join_satisfied(task, arrivals.size())) {
      spawn(target, iteration);
    }
    return true;
  }

  /// Tasks reachable from `index` over forward edges.
  auto downstream(int index) const -> std::vector<int> {
    std::vector<int> reached;
    std::unordered_set<int> seen{index};
    std::deque<int> frontier{index};
    while (!frontier.empty()) {
      int from = frontier.front();
      frontier.pop_front();
      const auto& task = graph.task(from);
      for (const auto* edges : {&task.on_success, &task.on_error, &task.on_complete}) {
        for (int to : *edges) {
          if (graph.is_loop_edge(from, to) || !seen.insert(to).second) {
            continue;
          }
          reached.push_back(to);
          frontier.push_back(to);
        }
      }
    }
    return reached;
  }

  auto reenter(int target, int iteration) -> bool {
    const auto& task = graph.task(target);
    auto& exec = execution();
    if (iteration > task.def.loop) {
      wf::log::info("Loop bound reached: execution={}, task={}, loop={}", exec.id, task.def.name, task.def.loop);
      return false;
    }
    for (int body : downstream(target)) {
      auto it = exec.iterations.find(graph.task(body).def.name);
      if (it == exec.iterations.end()) {
        continue;
      }
      const auto group = make_group_id(it->first, it->second);
      if (group_spawned(group)) {
        it->second += 1;
      } else {
        exec.join_arrivals.erase(group);
      }
    }
    spawn(target, iteration);
    return true;
  }

  auto unsatisfied_join() -> std::optional<std::string> {
    for (const auto& [group, arrivals] : execution().join_arrivals) {
      if (!arrivals.empty() && !group_spawned(group)) {
        return group.substr(0, group.rfind('#'));
      }
    }
    return std::nullopt;
  }

  auto finalize() -> void {
    auto& exec = execution();
    if (is_terminal(exec.status)) {
      return;
    }
    if (std::any_of(tasks().begin(), tasks().end(),
                    [](const TaskExecution& te) { return is_pending(te.status); })) {
      return;
    }

    if (!exec.failure.is_null()) {
      exec.status = ExecutionStatus::Error;
      exec.output = exec.failure;
    } else if (auto task = unsatisfied_join()) {
      exec.status = ExecutionStatus::Error;
      exec.output = Json{{"error", fmt::format("join of task '{}' cannot be satisfied", *task)}, {"task", *task}};
    } else {
      exec.status = ExecutionStatus::Success;
      exec.output = exec.leaf_result;
    }
    touch();
    wf::log::info("Execution finished: id={}, status={}", exec.id, to_string(exec.status));
  }

  // Event handlers.

  auto never_started() -> bool {
    const auto& exec = execution();
    return exec.status == ExecutionStatus::Running && tasks().empty() && exec.resolved_groups.empty();
  }

  auto on_start() -> Expected<void> {
    if (!never_started()) {
      return tl::unexpected(stale(fmt::format("execution {} already started", execution().id)));
    }
    return spawn_entries();
  }

  auto spawn_entries() -> Expected<void> {
    touch();
    for (const auto& name : graph.entry_tasks()) {
      auto index = task_index(name);
      if (!index) {
        return tl::unexpected(index.error());
      }
      spawn(*index, 0);
    }
    return {};
  }

  auto on_completion(const Event& event) -> Expected<void> {
    auto& exec = execution();
    if (is_terminal(exec.status)) {
      return tl::unexpected(stale(fmt::format("execution {} is {}", exec.id, to_string(exec.status))));
    }
    auto* te = out.snapshot.find_task(event.task_execution_id);
    if (te == nullptr) {
      return tl::unexpected(
        make_error(ErrorCode::NotFound, fmt::format("task execution {} not found", event.task_execution_id)));
    }
    if (te->status != TaskStatus::Running || te->attempt != event.attempt) {
      return tl::unexpected(stale(fmt::format("task execution {} is {} at attempt {}, event is for attempt {}",
                                              te->id, to_string(te->status), te->attempt, event.attempt)));
    }
    auto index = task_index(te->task_name);
    if (!index) {
      return tl::unexpected(index.error());
    }
    const auto& task = graph.task(*index);

    touch();
    te->dispatch_confirmed = true;
    te->updated_at = now;
    if (event.kind == EventKind::TaskCompleted) {
      te->status = TaskStatus::Success;
      te->result = event.result;
      te->error.clear();
    } else {
      te->error = event.error;
      if (te->attempt < task.def.retry.max_attempts) {
        const auto delay = task.def.retry.delay_after(te->attempt);
        te->status = TaskStatus::Delayed;
        te->next_retry_at = now + delay;
        out.timers.push_back(TimerRequest{te->id, te->execution_id, te->attempt, delay});
        wf::log::debug("Retry scheduled: task_execution={}, attempt={}, delay_ms={}",
                       te->id, te->attempt, delay.count());
        return {};
      }
      te->status = TaskStatus::Error;
    }
    evaluate_group(*index, te->iteration);
    return {};
  }

  auto on_retry_timer(const Event& event) -> Expected<void> {
    auto& exec = execution();
    if (is_terminal(exec.status)) {
      return tl::unexpected(stale(fmt::format("execution {} is {}", exec.id, to_string(exec.status))));
    }
    auto* te = out.snapshot.find_task(event.task_execution_id);
    if (te == nullptr) {
      return tl::unexpected(
        make_error(ErrorCode::NotFound, fmt::format("task execution {} not found", event.task_execution_id)));
    }
    if (te->status != TaskStatus::Delayed || te->attempt != event.attempt) {
      return tl::unexpected(stale(fmt::format("retry timer for {} attempt {} superseded", te->id, event.attempt)));
    }
    if (exec.status == ExecutionStatus::Paused) {
      wf::log::debug("Retry deferred while paused: task_execution={}", te->id);
      return {};
    }
    touch();
    start_attempt(*te);
    return {};
  }

  auto on_cancel(const Event& event) -> Expected<void> {
    auto& exec = execution();
    if (is_terminal(exec.status)) {
      return tl::unexpected(stale(fmt::format("execution {} is already {}", exec.id, to_string(exec.status))));
    }
    const std::string reason = event.reason.empty() ? std::string("cancelled") : event.reason;
    exec.status = ExecutionStatus::Cancelled;
    exec.output = Json{{"reason", reason}};
    for (auto& te : tasks()) {
      if (is_pending(te.status)) {
        te.status = TaskStatus::Error;
        te.error = reason;
        te.next_retry_at.reset();
        te.updated_at = now;
      }
    }
    touch();
    return {};
  }

  auto on_pause() -> Expected<void> {
    auto& exec = execution();
    if (exec.status != ExecutionStatus::Running) {
      return tl::unexpected(stale(fmt::format("execution {} is {}", exec.id, to_string(exec.status))));
    }
    exec.status = ExecutionStatus::Paused;
    touch();
    return {};
  }

  auto on_resume() -> Expected<void> {
    auto& exec = execution();
    if (exec.status != ExecutionStatus::Paused) {
      return tl::unexpected(stale(fmt::format("execution {} is {}", exec.id, to_string(exec.status))));
    }
    exec.status = ExecutionStatus::Running;
    touch();
    for (auto& te : tasks()) {
      if (te.status == TaskStatus::Waiting) {
        start_attempt(te);
      } else if (te.status == TaskStatus::Delayed) {
        if (!te.next_retry_at || *te.next_retry_at <= now) {
          start_attempt(te);
        } else {
          out.timers.push_back(
            TimerRequest{te.id, te.execution_id, te.attempt, remaining(*te.next_retry_at, now)});
        }
      }
    }
    return {};
  }

  auto on_sweep(const Event& event) -> Expected<void> {
    auto& exec = execution();
    if (is_terminal(exec.status)) {
      return {};
    }
    // Created but the start transition never committed (crash or storage failure in between).
    if (never_started() && exec.created_at + event.stale_after <= now) {
      wf::log::warn("Starting execution left without tasks: execution={}", exec.id);
      return spawn_entries();
    }
    for (auto& te : tasks()) {
      if (te.status == TaskStatus::Running && !te.dispatch_confirmed && te.dispatched_at &&
          *te.dispatched_at + event.stale_after <= now) {
        te.dispatch_nonce = ids();
        te.dispatched_at = now;
        te.updated_at = now;
        const auto* task = graph.find(te.task_name);
        out.dispatches.push_back(DispatchRequest{
          te.id, te.execution_id, te.task_name, task != nullptr ? task->def.action : std::string{},
          te.input, te.attempt, te.dispatch_nonce});
        wf::log::warn("Re-dispatching unconfirmed task: task_execution={}, attempt={}", te.id, te.attempt);
        touch();
      } else if (te.status == TaskStatus::Delayed && exec.status == ExecutionStatus::Running &&
                 te.next_retry_at && *te.next_retry_at + event.stale_after <= now) {
        out.timers.push_back(TimerRequest{te.id, te.execution_id, te.attempt, std::chrono::milliseconds{0}});
        wf::log::warn("Re-arming overdue retry timer: task_execution={}, attempt={}", te.id, te.attempt);
        touch();
      }
    }
    return {};
  }

  auto dispatch_in_definition_order() -> void {
    std::stable_sort(out.dispatches.begin(), out.dispatches.end(),
                     [this](const DispatchRequest& a, const DispatchRequest& b) {
                       return graph.index_of(a.task_name).value_or(-1) < graph.index_of(b.task_name).value_or(-1);
                     });
  }
};

}  // namespace

auto to_string(EventKind kind) -> std::string_view {
  switch (kind) {
    case EventKind::Start: return "start";
    case EventKind::TaskCompleted: return "task_completed";
    case EventKind::TaskFailed: return "task_failed";
    case EventKind::RetryTimerFired: return "retry_timer_fired";
    case EventKind::CancelRequested: return "cancel_requested";
    case EventKind::PauseRequested: return "pause_requested";
    case EventKind::ResumeRequested: return "resume_requested";
    case EventKind::Sweep: return "sweep";
  }
  return "unknown";
}

auto Event::start() -> Event { return Event{}; }

auto Event::completed(std::string task_execution_id, int attempt, Json result, std::string nonce) -> Event {
  Event event;
  event.kind = EventKind::TaskCompleted;
  event.task_execution_id = std::move(task_execution_id);
  event.attempt = attempt;
  event.result = std::move(result);
  event.nonce = std::move(nonce);
  return event;
}

auto Event::failed(std::string task_execution_id, int attempt, std::string error, std::string nonce) -> Event {
  Event event;
  event.kind = EventKind::TaskFailed;
  event.task_execution_id = std::move(task_execution_id);
  event.attempt = attempt;
  event.error = std::move(error);
  event.nonce = std::move(nonce);
  return event;
}

auto Event::retry_timer(std::string task_execution_id, int attempt) -> Event {
  Event event;
  event.kind = EventKind::RetryTimerFired;
  event.task_execution_id = std::move(task_execution_id);
  event.attempt = attempt;
  return event;
}

auto Event::cancel(std::string reason) -> Event {
  Event event;
  event.kind = EventKind::CancelRequested;
  event.reason = std::move(reason);
  return event;
}

auto Event::pause() -> Event {
  Event event;
  event.kind = EventKind::PauseRequested;
  return event;
}

auto Event::resume() -> Event {
  Event event;
  event.kind = EventKind::ResumeRequested;
  return event;
}

auto Event::sweep(std::chrono::milliseconds stale_after) -> Event {
  Event event;
  event.kind = EventKind::Sweep;
  event.stale_after = stale_after;
  return event;
}

auto Scheduler::apply(ExecutionSnapshot snapshot, const Event& event, TimePoint now, const IdGenerator& ids) const
  -> Expected<Transition> {
  Step step{*graph_, now, ids, Transition{std::move(snapshot), {}, {}, false}};

  Expected<void> handled;
  switch (event.kind) {
    case EventKind::Start:
      handled = step.on_start();
      break;
    case EventKind::TaskCompleted:
    case EventKind::TaskFailed:
      handled = step.on_completion(event);
      break;
    case EventKind::RetryTimerFired:
      handled = step.on_retry_timer(event);
      break;
    case EventKind::CancelRequested:
      handled = step.on_cancel(event);
      break;
    case EventKind::PauseRequested:
      handled = step.on_pause();
      break;
    case EventKind::ResumeRequested:
      handled = step.on_resume();
      break;
    case EventKind::Sweep:
      handled = step.on_sweep(event);
      break;
  }
  if (!handled) {
    return tl::unexpected(handled.error());
  }

  if (step.out.changed) {
    step.finalize();
  }
  step.dispatch_in_definition_order();
  return std::move(step.out);
}

}  // namespace wf::engine
