#pragma once

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::engine {

/// Capability an action executor resolves by name at dispatch time.
struct Action {
  using InvokeFn = std::function<Expected<Json>(const Json& input)>;

  std::string name;
  InvokeFn invoke;
};

class ActionRegistry {
 public:
  auto register_action(Action action) -> void;
  auto register_action(std::string name, Action::InvokeFn fn) -> void;

  /// Copy of the registered action, or nullopt when the name is unknown.
  auto find(std::string_view name) const -> std::optional<Action>;
  auto contains(std::string_view name) const -> bool;
  auto names() const -> std::vector<std::string>;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Action> actions_;
};

}  // namespace wf::engine
