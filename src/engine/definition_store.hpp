#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/graph.hpp"

namespace wf::engine {

struct DefinitionId {
  std::string name;
  int version = 0;

  auto operator==(const DefinitionId&) const -> bool = default;
  auto to_string() const -> std::string;
};

struct DefinitionSnapshot {
  DefinitionId id;
  std::string hash;
  WorkflowDef workflow;
  CompiledGraph graph;
  std::string source;
  std::chrono::system_clock::time_point registered_at;
};

struct RegisterOptions {
  std::string source;
  /// Validate action names against this registry at registration time.
  const ActionRegistry* actions = nullptr;
};

/// Registry of immutable workflow definitions keyed by name + version.
class DefinitionStore {
 public:
  DefinitionStore() = default;

  auto register_definition(const WorkflowDef& workflow, const RegisterOptions& options = {})
    -> Expected<std::shared_ptr<const DefinitionSnapshot>>;

  /// Latest registered version for `name`.
  auto resolve(std::string_view name) const -> std::shared_ptr<const DefinitionSnapshot>;
  auto resolve(std::string_view name, int version) const -> std::shared_ptr<const DefinitionSnapshot>;
  auto resolve(const DefinitionId& id) const -> std::shared_ptr<const DefinitionSnapshot>;
  auto list_versions(std::string_view name) const -> std::vector<int>;
  auto list_names() const -> std::vector<std::string>;

 private:
  struct Entry {
    std::unordered_map<int, std::shared_ptr<const DefinitionSnapshot>> versions;
    int latest_version = 0;
  };

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

/// Content hash over the canonical JSON form of a definition.
auto hash_workflow(const WorkflowDef& workflow) -> std::string;

}  // namespace wf::engine
