#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace wf::engine {

/// Path expression over the execution context, e.g. `$.tasks.fetch.data`.
///
/// The context object has the shape `{input, tasks, item, index}`. Numeric
/// segments index arrays; a path that does not resolve yields null.
struct Expression {
  std::string source;
  std::vector<std::string> path;
};

auto is_expression(const Json& value) -> bool;

auto parse_expression(std::string_view text) -> Expected<Expression>;

auto evaluate(const Expression& expr, const Json& context) -> Json;

/// Check every expression embedded in an input template.
auto validate_template(const Json& input) -> Expected<void>;

/// Substitute every expression in `input` with its value in `context`.
/// Strings starting with `$$` are literals with the first `$` removed.
auto render_template(const Json& input, const Json& context) -> Expected<Json>;

}  // namespace wf::engine
