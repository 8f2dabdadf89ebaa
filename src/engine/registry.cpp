#include "engine/registry.hpp"

#include <algorithm>
#include <mutex>

namespace wf::engine {

auto ActionRegistry::register_action(Action action) -> void {
  std::unique_lock lock(mutex_);
  auto name = action.name;
  actions_[std::move(name)] = std::move(action);
}

auto ActionRegistry::register_action(std::string name, Action::InvokeFn fn) -> void {
  register_action(Action{std::move(name), std::move(fn)});
}

auto ActionRegistry::find(std::string_view name) const -> std::optional<Action> {
  std::shared_lock lock(mutex_);
  auto it = actions_.find(std::string(name));
  if (it == actions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ActionRegistry::contains(std::string_view name) const -> bool {
  std::shared_lock lock(mutex_);
  return actions_.contains(std::string(name));
}

auto ActionRegistry::names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  {
    std::shared_lock lock(mutex_);
    out.reserve(actions_.size());
    for (const auto& [name, _] : actions_) {
      out.push_back(name);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace wf::engine
