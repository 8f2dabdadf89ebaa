#include "engine/definition_store.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include <fmt/format.h>

namespace wf::engine {
namespace {

struct HashBuilder {
  std::uint64_t value = 1469598103934665603ULL;

  void add_byte(unsigned char byte) {
    value ^= byte;
    value *= 1099511628211ULL;
  }

  void add(std::string_view text) {
    for (unsigned char byte : text) {
      add_byte(byte);
    }
    add_byte(0xff);
  }

  auto finish() const -> std::string {
    return fmt::format("{:016x}", value);
  }
};

}  // namespace

auto DefinitionId::to_string() const -> std::string {
  return fmt::format("{} v{}", name, version);
}

auto hash_workflow(const WorkflowDef& workflow) -> std::string {
  HashBuilder builder;
  builder.add("workflow");
  // nlohmann::json keeps object keys sorted, so dump() is canonical.
  builder.add(workflow_to_json(workflow).dump(-1, ' ', false, Json::error_handler_t::replace));
  return builder.finish();
}

auto DefinitionStore::register_definition(const WorkflowDef& workflow, const RegisterOptions& options)
  -> Expected<std::shared_ptr<const DefinitionSnapshot>> {
  CompileOptions compile_options;
  compile_options.actions = options.actions;
  auto graph = compile_graph(workflow, compile_options);
  if (!graph) {
    return tl::unexpected(graph.error());
  }

  auto snapshot = std::make_shared<DefinitionSnapshot>();
  snapshot->id = DefinitionId{workflow.name, workflow.version};
  snapshot->hash = hash_workflow(workflow);
  snapshot->workflow = workflow;
  snapshot->graph = std::move(*graph);
  snapshot->source = options.source;
  snapshot->registered_at = std::chrono::system_clock::now();

  std::unique_lock lock(mutex_);
  auto& entry = entries_[workflow.name];
  auto existing = entry.versions.find(workflow.version);
  if (existing != entry.versions.end()) {
    if (existing->second->hash == snapshot->hash) {
      return existing->second;
    }
    return tl::unexpected(make_error(
      ErrorCode::Definition,
      fmt::format("definition already registered with different content: {}", snapshot->id.to_string())));
  }

  entry.versions.emplace(workflow.version, snapshot);
  entry.latest_version = std::max(entry.latest_version, workflow.version);
  return snapshot;
}

auto DefinitionStore::resolve(std::string_view name) const -> std::shared_ptr<const DefinitionSnapshot> {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(std::string(name));
  if (it == entries_.end()) {
    return {};
  }
  auto snapshot_it = it->second.versions.find(it->second.latest_version);
  if (snapshot_it == it->second.versions.end()) {
    return {};
  }
  return snapshot_it->second;
}

auto DefinitionStore::resolve(std::string_view name, int version) const
  -> std::shared_ptr<const DefinitionSnapshot> {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(std::string(name));
  if (it == entries_.end()) {
    return {};
  }
  auto snapshot_it = it->second.versions.find(version);
  if (snapshot_it == it->second.versions.end()) {
    return {};
  }
  return snapshot_it->second;
}

auto DefinitionStore::resolve(const DefinitionId& id) const -> std::shared_ptr<const DefinitionSnapshot> {
  return resolve(id.name, id.version);
}

auto DefinitionStore::list_versions(std::string_view name) const -> std::vector<int> {
  std::vector<int> versions;
  std::shared_lock lock(mutex_);
  auto it = entries_.find(std::string(name));
  if (it == entries_.end()) {
    return versions;
  }
  versions.reserve(it->second.versions.size());
  for (const auto& [version, _] : it->second.versions) {
    versions.push_back(version);
  }
  std::sort(versions.begin(), versions.end());
  return versions;
}

auto DefinitionStore::list_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  {
    std::shared_lock lock(mutex_);
    names.reserve(entries_.size());
    for (const auto& [name, _] : entries_) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace wf::engine
