#include <string>
#include <utility>
#include <vector>

#include "engine/scheduler.hpp"
#include "test_support.hpp"

namespace {

namespace engine = wf::engine;

auto make_snapshot(const engine::CompiledGraph& graph, engine::Json input, engine::TimePoint now)
  -> engine::ExecutionSnapshot {
  engine::ExecutionSnapshot snapshot;
  auto& execution = snapshot.execution;
  execution.id = "exec-1";
  execution.definition = engine::DefinitionId{graph.name(), graph.version()};
  execution.input = std::move(input);
  execution.status = engine::ExecutionStatus::Running;
  execution.context = engine::Json{{"tasks", engine::Json::object()}};
  execution.created_at = now;
  execution.updated_at = now;
  execution.version = 1;
  return snapshot;
}

/// One execution driven event by event through the scheduler.
class Run {
 public:
  explicit Run(engine::CompiledGraph graph, engine::Json input = engine::Json::object())
      : graph_(std::move(graph)), ids_(make_sequential_ids("te")) {
    snapshot_ = make_snapshot(graph_, std::move(input), clock_.now());
  }

  auto apply(const engine::Event& event) -> engine::Expected<engine::Transition> {
    engine::Scheduler scheduler(graph_);
    auto transition = scheduler.apply(snapshot_, event, clock_.now(), ids_);
    if (transition) {
      snapshot_ = transition->snapshot;
      dispatched_.insert(dispatched_.end(), transition->dispatches.begin(), transition->dispatches.end());
      timers_.insert(timers_.end(), transition->timers.begin(), transition->timers.end());
    }
    return transition;
  }

  auto start() -> engine::Expected<engine::Transition> { return apply(engine::Event::start()); }

  /// Latest instance of `name` with the given item index.
  auto find(std::string_view name, int item = -1) const -> const engine::TaskExecution* {
    const engine::TaskExecution* found = nullptr;
    for (const auto& te : snapshot_.tasks) {
      if (te.task_name == name && te.item_index == item) {
        found = &te;
      }
    }
    return found;
  }

  auto complete(std::string_view name, engine::Json result, int item = -1) -> engine::Expected<engine::Transition> {
    const auto* te = find(name, item);
    if (te == nullptr) {
      return tl::unexpected(engine::make_error(engine::ErrorCode::NotFound, std::string(name)));
    }
    return apply(engine::Event::completed(te->id, te->attempt, std::move(result)));
  }

  auto fail(std::string_view name, std::string error, int item = -1) -> engine::Expected<engine::Transition> {
    const auto* te = find(name, item);
    if (te == nullptr) {
      return tl::unexpected(engine::make_error(engine::ErrorCode::NotFound, std::string(name)));
    }
    return apply(engine::Event::failed(te->id, te->attempt, std::move(error)));
  }

  auto fire_timer(std::string_view name, int item = -1) -> engine::Expected<engine::Transition> {
    const auto* te = find(name, item);
    if (te == nullptr) {
      return tl::unexpected(engine::make_error(engine::ErrorCode::NotFound, std::string(name)));
    }
    return apply(engine::Event::retry_timer(te->id, te->attempt));
  }

  auto count(std::string_view name) const -> int {
    int total = 0;
    for (const auto& te : snapshot_.tasks) {
      if (te.task_name == name) {
        ++total;
      }
    }
    return total;
  }

  auto dispatched_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& request : dispatched_) {
      names.push_back(request.task_name);
    }
    return names;
  }

  auto execution() const -> const engine::Execution& { return snapshot_.execution; }
  auto snapshot() const -> const engine::ExecutionSnapshot& { return snapshot_; }
  auto dispatched() const -> const std::vector<engine::DispatchRequest>& { return dispatched_; }
  auto timers() const -> const std::vector<engine::TimerRequest>& { return timers_; }
  auto clock() -> ManualClock& { return clock_; }

 private:
  engine::CompiledGraph graph_;
  ManualClock clock_;
  engine::IdGenerator ids_;
  engine::ExecutionSnapshot snapshot_;
  std::vector<engine::DispatchRequest> dispatched_;
  std::vector<engine::TimerRequest> timers_;
};

auto expect(bool condition, const char* what) -> bool {
  if (!condition) {
    std::cerr << "expectation failed: " << what << "\n";
  }
  return condition;
}

auto test_linear_order_and_output() -> bool {
  auto graph = compile_definition(R"JSON(
  {
    "name": "linear", "version": 1,
    "tasks": [
      { "name": "a", "action": "echo", "on-success": "b" },
      { "name": "b", "action": "echo", "on-success": "c" },
      { "name": "c", "action": "echo" }
    ]
  }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !expect(run.dispatched_names() == std::vector<std::string>{"a"}, "only a dispatched")) {
    return false;
  }
  if (!run.complete("a", {{"step", "a"}}) || !run.complete("b", {{"step", "b"}})) {
    return false;
  }
  if (!expect(run.execution().status == engine::ExecutionStatus::Running, "still running before c")) {
    return false;
  }
  if (!run.complete("c", {{"step", "c"}})) {
    return false;
  }
  return expect(run.dispatched_names() == std::vector<std::string>{"a", "b", "c"}, "declared order") &&
         expect(run.execution().status == engine::ExecutionStatus::Success, "success") &&
         expect(run.execution().output == engine::Json{{"step", "c"}}, "last result is output");
}

auto test_fetch_process_store() -> bool {
  auto graph = compile_definition(R"JSON(
  {
    "name": "pipeline", "version": 1,
    "tasks": [
      { "name": "fetch", "action": "http_get", "input": { "url": "$.input.url" }, "on-success": ["process"] },
      { "name": "process", "action": "transform", "input": { "data": "$.tasks.fetch.data" }, "on-success": ["store"] },
      { "name": "store", "action": "save", "input": { "payload": "$.tasks.process" } }
    ]
  }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph), engine::Json{{"url", "x"}});
  if (!run.start()) {
    return false;
  }
  if (!expect(run.dispatched().front().input == engine::Json{{"url", "x"}}, "fetch input rendered")) {
    return false;
  }
  if (!run.complete("fetch", {{"data", 1}})) {
    return false;
  }
  if (!expect(run.dispatched().back().input == engine::Json{{"data", 1}}, "process sees fetch data")) {
    return false;
  }
  if (!run.complete("process", {{"data", 2}})) {
    return false;
  }
  if (!expect(run.dispatched().back().input == engine::Json{{"payload", {{"data", 2}}}}, "store sees process")) {
    return false;
  }
  if (!run.complete("store", {{"ok", true}})) {
    return false;
  }
  return expect(run.execution().status == engine::ExecutionStatus::Success, "success") &&
         expect(run.execution().output == engine::Json{{"ok", true}}, "output {ok:true}");
}

auto test_retry_exhaustion() -> bool {
  auto graph = compile_definition(R"JSON(
  {
    "name": "retrying", "version": 1,
    "tasks": [
      { "name": "fetch", "action": "http_get",
        "retry": { "max_attempts": 3, "delay_ms": 1000, "backoff": 2.0 } }
    ]
  }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.fail("fetch", "boom 1")) {
    return false;
  }
  const auto* te = run.find("fetch");
  if (!expect(te->status == engine::TaskStatus::Delayed, "delayed after first failure") ||
      !expect(run.timers().size() == 1 && run.timers()[0].delay == std::chrono::milliseconds(1000), "1s delay") ||
      !expect(te->next_retry_at == run.clock().now() + std::chrono::milliseconds(1000), "next retry stamped")) {
    return false;
  }

  run.clock().advance(std::chrono::milliseconds(1000));
  if (!run.fire_timer("fetch") || !expect(run.find("fetch")->attempt == 2, "attempt 2 running")) {
    return false;
  }
  if (!run.fail("fetch", "boom 2") ||
      !expect(run.timers().size() == 2 && run.timers()[1].delay == std::chrono::milliseconds(2000), "2s delay")) {
    return false;
  }
  run.clock().advance(std::chrono::milliseconds(2000));
  if (!run.fire_timer("fetch") || !run.fail("fetch", "boom 3")) {
    return false;
  }

  const auto& execution = run.execution();
  return expect(run.find("fetch")->status == engine::TaskStatus::Error, "task error") &&
         expect(run.find("fetch")->attempt == 3, "three attempts") &&
         expect(run.dispatched().size() == 3, "three dispatches") &&
         expect(execution.status == engine::ExecutionStatus::Error, "execution error") &&
         expect(execution.output.value("error", "") == "boom 3", "final error recorded") &&
         expect(execution.output.value("task", "") == "fetch", "originating task recorded");
}

auto test_stale_retry_timer() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "timers", "version": 1,
    "tasks": [ { "name": "a", "action": "x", "retry": { "max_attempts": 2, "delay_ms": 10 } } ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.fail("a", "first")) {
    return false;
  }
  const auto id = run.find("a")->id;
  auto wrong_attempt = run.apply(engine::Event::retry_timer(id, 2));
  if (!expect(!wrong_attempt && engine::is_stale(wrong_attempt.error()), "mismatched attempt is stale")) {
    return false;
  }
  if (!run.apply(engine::Event::retry_timer(id, 1))) {
    return false;
  }
  auto duplicate = run.apply(engine::Event::retry_timer(id, 1));
  return expect(!duplicate && engine::is_stale(duplicate.error()), "second firing is stale") &&
         expect(run.dispatched().size() == 2, "one redispatch");
}

auto test_duplicate_completion() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "dup", "version": 1,
    "tasks": [ { "name": "a", "action": "x", "on-success": "b" }, { "name": "b", "action": "x" } ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start()) {
    return false;
  }
  const auto* a = run.find("a");
  const auto event = engine::Event::completed(a->id, a->attempt, {{"v", 1}});
  if (!run.apply(event)) {
    return false;
  }
  const auto tasks_before = run.snapshot().tasks.size();
  auto again = run.apply(event);
  return expect(!again && engine::is_stale(again.error()), "duplicate is stale") &&
         expect(run.count("b") == 1, "b created once") &&
         expect(run.snapshot().tasks.size() == tasks_before, "no new tasks") &&
         expect(run.dispatched().size() == 2, "no extra dispatch");
}

auto test_with_items_all() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "fanout", "version": 1,
    "tasks": [
      { "name": "each", "action": "x", "with-items": "$.input.items",
        "input": { "value": "$.item", "position": "$.index" }, "on-success": "collect" },
      { "name": "collect", "action": "x", "input": { "values": "$.tasks.each" } }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph), engine::Json{{"items", {10, 20, 30}}});
  if (!run.start() || !expect(run.dispatched().size() == 3, "three items dispatched")) {
    return false;
  }
  if (!expect(run.dispatched()[1].input == engine::Json{{"value", 20}, {"position", 1}}, "item input")) {
    return false;
  }
  if (!run.complete("each", 21, 1) || !run.complete("each", 31, 2)) {
    return false;
  }
  if (!expect(run.count("collect") == 0, "collect waits for all siblings")) {
    return false;
  }
  if (!run.complete("each", 11, 0)) {
    return false;
  }
  if (!expect(run.count("collect") == 1, "collect after last sibling") ||
      !expect(run.dispatched().back().input == engine::Json{{"values", {11, 21, 31}}}, "results in item order")) {
    return false;
  }
  if (!run.complete("collect", "done")) {
    return false;
  }
  return expect(run.execution().status == engine::ExecutionStatus::Success, "success");
}

auto test_with_items_all_error() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "fanout_err", "version": 1,
    "tasks": [
      { "name": "each", "action": "x", "with-items": "$.input.items", "join": "all", "on-success": "collect" },
      { "name": "collect", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph), engine::Json{{"items", {1, 2, 3}}});
  if (!run.start() || !run.fail("each", "bad item", 0) || !run.complete("each", 2, 1)) {
    return false;
  }
  if (!expect(run.execution().status == engine::ExecutionStatus::Running, "waits for remaining sibling")) {
    return false;
  }
  if (!run.complete("each", 3, 2)) {
    return false;
  }
  return expect(run.count("collect") == 0, "downstream never fires") &&
         expect(run.execution().status == engine::ExecutionStatus::Error, "execution error") &&
         expect(run.execution().output.value("error", "") == "bad item", "sibling error recorded");
}

auto test_with_items_one() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "first_wins", "version": 1,
    "tasks": [
      { "name": "ping", "action": "x", "with-items": "$.input.hosts", "join": "one", "on-success": "use" },
      { "name": "use", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph), engine::Json{{"hosts", {"a", "b", "c"}}});
  if (!run.start() || !run.fail("ping", "down", 0) || !expect(run.count("use") == 0, "failure does not satisfy")) {
    return false;
  }
  if (!run.complete("ping", "b-ok", 1) || !expect(run.count("use") == 1, "first success fires")) {
    return false;
  }
  if (!run.complete("ping", "c-ok", 2) || !expect(run.count("use") == 1, "later success absorbed")) {
    return false;
  }
  if (!run.complete("use", "used")) {
    return false;
  }
  return expect(run.execution().status == engine::ExecutionStatus::Success, "success");
}

auto test_with_items_count() -> bool {
  const char* definition = R"JSON(
  { "name": "quorum", "version": 1,
    "tasks": [
      { "name": "vote", "action": "x", "with-items": "$.input.voters", "join": 2, "on-success": "tally" },
      { "name": "tally", "action": "x" }
    ] }
  )JSON";
  auto graph = compile_definition(definition);
  if (!graph) {
    return false;
  }
  Run quorum(std::move(*graph), engine::Json{{"voters", {1, 2, 3}}});
  if (!quorum.start() || !quorum.fail("vote", "no", 0) || !quorum.complete("vote", "yes", 1)) {
    return false;
  }
  if (!expect(quorum.count("tally") == 0, "one success is not a quorum")) {
    return false;
  }
  if (!quorum.complete("vote", "yes", 2) || !expect(quorum.count("tally") == 1, "two successes reach quorum")) {
    return false;
  }

  auto second = compile_definition(definition);
  if (!second) {
    return false;
  }
  Run lost(std::move(*second), engine::Json{{"voters", {1, 2, 3}}});
  if (!lost.start() || !lost.fail("vote", "no", 0) || !lost.fail("vote", "no", 1)) {
    return false;
  }
  // Quorum is lost after two failures; the execution still waits for the last vote.
  if (!expect(lost.execution().status == engine::ExecutionStatus::Running, "pending sibling keeps it alive")) {
    return false;
  }
  if (!lost.complete("vote", "yes", 2)) {
    return false;
  }
  return expect(lost.count("tally") == 0, "no tally") &&
         expect(lost.execution().status == engine::ExecutionStatus::Error, "quorum lost");
}

auto test_with_items_empty() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "empty", "version": 1,
    "tasks": [
      { "name": "each", "action": "x", "with-items": "$.input.items", "on-success": "after" },
      { "name": "after", "action": "x", "input": { "seen": "$.tasks.each" } }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph), engine::Json{{"items", engine::Json::array()}});
  if (!run.start()) {
    return false;
  }
  return expect(run.count("each") == 0, "no instances") &&
         expect(run.dispatched_names() == std::vector<std::string>{"after"}, "downstream runs at once") &&
         expect(run.dispatched().front().input == engine::Json{{"seen", engine::Json::array()}}, "empty result");
}

auto test_with_items_not_array() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "scalar", "version": 1,
    "tasks": [ { "name": "each", "action": "x", "with-items": "$.input.items" } ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph), engine::Json{{"items", 5}});
  if (!run.start()) {
    return false;
  }
  return expect(run.dispatched().empty(), "nothing dispatched") &&
         expect(run.execution().status == engine::ExecutionStatus::Error, "execution error");
}

auto test_join_all_incoming() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "merge", "version": 1,
    "tasks": [
      { "name": "left", "action": "x", "on-success": "merge" },
      { "name": "right", "action": "x", "on-success": "merge" },
      { "name": "merge", "action": "x", "join": "all" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !expect(run.dispatched_names() == std::vector<std::string>{"left", "right"}, "two entries")) {
    return false;
  }
  if (!run.complete("left", 1) || !expect(run.count("merge") == 0, "merge waits for right")) {
    return false;
  }
  if (!run.complete("right", 2) || !expect(run.count("merge") == 1, "merge after both")) {
    return false;
  }
  return run.complete("merge", 3).has_value() &&
         expect(run.execution().status == engine::ExecutionStatus::Success, "success");
}

auto test_join_all_unsatisfied() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "merge_fail", "version": 1,
    "tasks": [
      { "name": "left", "action": "x", "on-success": "merge" },
      { "name": "right", "action": "x", "on-success": "merge", "on-error": "cleanup" },
      { "name": "merge", "action": "x", "join": "all" },
      { "name": "cleanup", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.complete("left", 1) || !run.fail("right", "broken") || !run.complete("cleanup", 0)) {
    return false;
  }
  return expect(run.count("merge") == 0, "merge never ran") &&
         expect(run.execution().status == engine::ExecutionStatus::Error, "stuck join is an error") &&
         expect(run.execution().output.value("task", "") == "merge", "join task named");
}

auto test_default_join_absorbs_duplicates() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "any", "version": 1,
    "tasks": [
      { "name": "left", "action": "x", "on-success": "next" },
      { "name": "right", "action": "x", "on-success": "next" },
      { "name": "next", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.complete("left", 1) || !expect(run.count("next") == 1, "first edge suffices")) {
    return false;
  }
  if (!run.complete("next", 2) || !run.complete("right", 3)) {
    return false;
  }
  return expect(run.count("next") == 1, "second edge absorbed") &&
         expect(run.execution().status == engine::ExecutionStatus::Success, "success");
}

auto test_on_error_and_on_complete() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "handlers", "version": 1,
    "tasks": [
      { "name": "risky", "action": "x", "on-error": "recover", "on-complete": "audit" },
      { "name": "recover", "action": "x", "input": { "why": "$.tasks.risky.error" } },
      { "name": "audit", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.fail("risky", "disk full")) {
    return false;
  }
  if (!expect(run.dispatched_names() == std::vector<std::string>{"risky", "recover", "audit"}, "both handlers") ||
      !expect(run.dispatched()[1].input == engine::Json{{"why", "disk full"}}, "error visible to handler")) {
    return false;
  }
  if (!run.complete("audit", "audited") || !run.complete("recover", "recovered")) {
    return false;
  }
  return expect(run.execution().status == engine::ExecutionStatus::Success, "handled error succeeds") &&
         expect(run.execution().output == "recovered", "latest leaf is output");
}

auto test_unhandled_error_waits_for_other_paths() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "parallel", "version": 1,
    "tasks": [
      { "name": "doomed", "action": "x" },
      { "name": "steady", "action": "x", "on-success": "follow" },
      { "name": "follow", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.fail("doomed", "lost")) {
    return false;
  }
  if (!expect(run.execution().status == engine::ExecutionStatus::Running, "other path still alive")) {
    return false;
  }
  if (!run.complete("steady", 1) || !expect(run.count("follow") == 1, "other path continues")) {
    return false;
  }
  if (!run.complete("follow", 2)) {
    return false;
  }
  return expect(run.execution().status == engine::ExecutionStatus::Error, "error once quiescent") &&
         expect(run.execution().output.value("task", "") == "doomed", "origin recorded");
}

auto test_cancel() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "cancel", "version": 1,
    "tasks": [
      { "name": "a", "action": "x", "on-success": "c" },
      { "name": "b", "action": "x", "retry": { "max_attempts": 3, "delay_ms": 500 } },
      { "name": "c", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.fail("b", "flaky")) {
    return false;
  }
  auto cancelled = run.apply(engine::Event::cancel("operator request"));
  if (!cancelled || !expect(cancelled->dispatches.empty(), "no dispatch on cancel")) {
    return false;
  }
  auto late = run.complete("a", 1);
  auto again = run.apply(engine::Event::cancel());
  return expect(run.execution().status == engine::ExecutionStatus::Cancelled, "cancelled") &&
         expect(run.find("a")->status == engine::TaskStatus::Error, "running task errored") &&
         expect(run.find("b")->status == engine::TaskStatus::Error, "delayed task errored") &&
         expect(run.find("a")->error == "operator request", "reason recorded") &&
         expect(!late && engine::is_stale(late.error()), "late completion dropped") &&
         expect(!again && engine::is_stale(again.error()), "second cancel refused") &&
         expect(run.count("c") == 0, "no successor");
}

auto test_bounded_loop() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "poll", "version": 1,
    "tasks": [
      { "name": "init", "action": "x", "on-success": "check" },
      { "name": "check", "action": "x", "loop": 2, "on-success": "wait" },
      { "name": "wait", "action": "x", "on-success": "check" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.complete("init", 0)) {
    return false;
  }
  for (int round = 0; round < 3; ++round) {
    if (!run.complete("check", round) || !run.complete("wait", round * 10)) {
      std::cerr << "round " << round << " failed\n";
      return false;
    }
  }
  return expect(run.count("check") == 3, "loop head ran 1 + 2 times") &&
         expect(run.count("wait") == 3, "body reran each iteration") &&
         expect(run.find("check")->iteration == 2, "iteration recorded") &&
         expect(run.execution().status == engine::ExecutionStatus::Success, "loop terminates") &&
         expect(run.execution().output == 20, "last body result");
}

auto test_pause_resume() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "pausable", "version": 1,
    "tasks": [
      { "name": "a", "action": "x", "on-success": "b" },
      { "name": "b", "action": "x" },
      { "name": "r", "action": "x", "retry": { "max_attempts": 2, "delay_ms": 100 } }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.fail("r", "later") || !run.apply(engine::Event::pause())) {
    return false;
  }
  if (!run.complete("a", 1)) {
    return false;
  }
  if (!expect(run.find("b")->status == engine::TaskStatus::Waiting, "new task waits while paused") ||
      !expect(run.dispatched().size() == 2, "no dispatch while paused")) {
    return false;
  }
  auto deferred = run.fire_timer("r");
  if (!deferred || !expect(!deferred->changed, "timer deferred") ||
      !expect(run.find("r")->status == engine::TaskStatus::Delayed, "still delayed")) {
    return false;
  }
  run.clock().advance(std::chrono::milliseconds(200));
  if (!run.apply(engine::Event::resume())) {
    return false;
  }
  return expect(run.execution().status == engine::ExecutionStatus::Running, "running again") &&
         expect(run.find("b")->status == engine::TaskStatus::Running, "waiting task dispatched") &&
         expect(run.find("r")->attempt == 2, "due retry dispatched") &&
         expect(run.dispatched_names() == std::vector<std::string>{"a", "r", "b", "r"}, "resume dispatch order");
}

auto test_sweep_redispatch() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "sweep", "version": 1, "tasks": [ { "name": "a", "action": "x" } ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start()) {
    return false;
  }
  const auto first_nonce = run.find("a")->dispatch_nonce;
  auto early = run.apply(engine::Event::sweep(std::chrono::milliseconds(5000)));
  if (!early || !expect(!early->changed && early->dispatches.empty(), "fresh dispatch left alone")) {
    return false;
  }
  run.clock().advance(std::chrono::milliseconds(6000));
  auto late = run.apply(engine::Event::sweep(std::chrono::milliseconds(5000)));
  if (!late || !expect(late->dispatches.size() == 1, "stale dispatch re-sent")) {
    return false;
  }
  const auto* a = run.find("a");
  return expect(a->attempt == 1, "same attempt") && expect(a->dispatch_nonce != first_nonce, "fresh nonce") &&
         expect(late->dispatches[0].nonce == a->dispatch_nonce, "request carries new nonce");
}

auto test_sweep_starts_orphaned_execution() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "orphan", "version": 1,
    "tasks": [ { "name": "a", "action": "x", "on-success": ["b"] }, { "name": "b", "action": "x" } ] }
  )JSON");
  if (!graph) {
    return false;
  }
  // Execution created but the start transition was never applied.
  Run run(std::move(*graph));
  auto early = run.apply(engine::Event::sweep(std::chrono::milliseconds(5000)));
  if (!early || !expect(!early->changed && run.count("a") == 0, "young execution left to its starter")) {
    return false;
  }
  run.clock().advance(std::chrono::hours(1));
  auto swept = run.apply(engine::Event::sweep(std::chrono::milliseconds(5000)));
  if (!swept || !expect(swept->changed && swept->dispatches.size() == 1, "sweep spawns entry tasks") ||
      !expect(swept->dispatches[0].task_name == "a", "entry task dispatched")) {
    return false;
  }
  auto late_start = run.start();
  if (!expect(!late_start && engine::is_stale(late_start.error()), "start after recovery is stale")) {
    return false;
  }
  if (!run.complete("a", 1) || !run.complete("b", 2)) {
    return false;
  }
  const auto& execution = run.snapshot().execution;
  return expect(execution.status == engine::ExecutionStatus::Success, "recovered execution finishes") &&
         expect(execution.output == 2, "leaf output");
}

auto test_definition_order_dispatch() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "order", "version": 1,
    "tasks": [
      { "name": "root", "action": "x", "on-success": ["d", "c", "b"] },
      { "name": "b", "action": "x" },
      { "name": "c", "action": "x" },
      { "name": "d", "action": "x" }
    ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start() || !run.complete("root", 0)) {
    return false;
  }
  return expect(run.dispatched_names() == std::vector<std::string>{"root", "b", "c", "d"}, "definition order");
}

auto test_start_twice() -> bool {
  auto graph = compile_definition(R"JSON(
  { "name": "once", "version": 1, "tasks": [ { "name": "a", "action": "x" } ] }
  )JSON");
  if (!graph) {
    return false;
  }
  Run run(std::move(*graph));
  if (!run.start()) {
    return false;
  }
  auto again = run.start();
  return expect(!again && engine::is_stale(again.error()), "second start is stale") &&
         expect(run.count("a") == 1, "single entry instance");
}

}  // namespace

int main() {
  TestStats stats;
  run_test("linear_order_and_output", test_linear_order_and_output, stats);
  run_test("fetch_process_store", test_fetch_process_store, stats);
  run_test("retry_exhaustion", test_retry_exhaustion, stats);
  run_test("stale_retry_timer", test_stale_retry_timer, stats);
  run_test("duplicate_completion", test_duplicate_completion, stats);
  run_test("with_items_all", test_with_items_all, stats);
  run_test("with_items_all_error", test_with_items_all_error, stats);
  run_test("with_items_one", test_with_items_one, stats);
  run_test("with_items_count", test_with_items_count, stats);
  run_test("with_items_empty", test_with_items_empty, stats);
  run_test("with_items_not_array", test_with_items_not_array, stats);
  run_test("join_all_incoming", test_join_all_incoming, stats);
  run_test("join_all_unsatisfied", test_join_all_unsatisfied, stats);
  run_test("default_join_absorbs_duplicates", test_default_join_absorbs_duplicates, stats);
  run_test("on_error_and_on_complete", test_on_error_and_on_complete, stats);
  run_test("unhandled_error_waits_for_other_paths", test_unhandled_error_waits_for_other_paths, stats);
  run_test("cancel", test_cancel, stats);
  run_test("bounded_loop", test_bounded_loop, stats);
  run_test("pause_resume", test_pause_resume, stats);
  run_test("sweep_redispatch", test_sweep_redispatch, stats);
  run_test("sweep_starts_orphaned_execution", test_sweep_starts_orphaned_execution, stats);
  run_test("definition_order_dispatch", test_definition_order_dispatch, stats);
  run_test("start_twice", test_start_twice, stats);
  return report(stats);
}
