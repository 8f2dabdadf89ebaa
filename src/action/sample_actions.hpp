#pragma once

#include "engine/registry.hpp"

namespace wf::action {

/// Register echo, constant, fail, fail_times, sleep and sum.
auto register_sample_actions(wf::engine::ActionRegistry& registry) -> void;

}  // namespace wf::action
