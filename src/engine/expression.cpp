#include "engine/expression.hpp"

#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace wf::engine {
namespace {

auto valid_segment(std::string_view segment) -> bool {
  if (segment.empty()) {
    return false;
  }
  for (char c : segment) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
      return false;
    }
  }
  return true;
}

auto is_literal_dollar(const std::string& text) -> bool {
  return text.size() >= 2 && text[0] == '$' && text[1] == '$';
}

}  // namespace

auto is_expression(const Json& value) -> bool {
  if (!value.is_string()) {
    return false;
  }
  const auto& text = value.get_ref<const std::string&>();
  return !text.empty() && text[0] == '$' && !is_literal_dollar(text);
}

auto parse_expression(std::string_view text) -> Expected<Expression> {
  if (text.empty() || text[0] != '$') {
    return tl::unexpected(
      make_error(ErrorCode::Definition, fmt::format("expression must start with '$': {}", text)));
  }
  Expression expr;
  expr.source = std::string(text);
  std::string_view rest = text.substr(1);
  if (rest.empty()) {
    return expr;
  }
  if (rest[0] != '.') {
    return tl::unexpected(
      make_error(ErrorCode::Definition, fmt::format("expected '.' after '$' in expression: {}", text)));
  }
  rest.remove_prefix(1);
  while (true) {
    auto dot = rest.find('.');
    auto segment = rest.substr(0, dot);
    if (!valid_segment(segment)) {
      return tl::unexpected(
        make_error(ErrorCode::Definition, fmt::format("invalid path segment in expression: {}", text)));
    }
    expr.path.emplace_back(segment);
    if (dot == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(dot + 1);
  }
  return expr;
}

auto evaluate(const Expression& expr, const Json& context) -> Json {
  const Json* current = &context;
  for (const auto& segment : expr.path) {
    if (current->is_object()) {
      auto it = current->find(segment);
      if (it == current->end()) {
        return Json();
      }
      current = &*it;
      continue;
    }
    if (current->is_array()) {
      std::size_t index = 0;
      auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
      if (ec != std::errc{} || ptr != segment.data() + segment.size() || index >= current->size()) {
        return Json();
      }
      current = &(*current)[index];
      continue;
    }
    return Json();
  }
  return *current;
}

auto validate_template(const Json& input) -> Expected<void> {
  if (is_expression(input)) {
    auto expr = parse_expression(input.get_ref<const std::string&>());
    if (!expr) {
      return tl::unexpected(expr.error());
    }
    return {};
  }
  if (input.is_object() || input.is_array()) {
    for (const auto& child : input) {
      if (auto result = validate_template(child); !result) {
        return result;
      }
    }
  }
  return {};
}

auto render_template(const Json& input, const Json& context) -> Expected<Json> {
  if (input.is_string()) {
    const auto& text = input.get_ref<const std::string&>();
    if (is_literal_dollar(text)) {
      return Json(text.substr(1));
    }
    if (!is_expression(input)) {
      return input;
    }
    auto expr = parse_expression(text);
    if (!expr) {
      return tl::unexpected(expr.error());
    }
    return evaluate(*expr, context);
  }
  if (input.is_object()) {
    Json out = Json::object();
    for (auto it = input.begin(); it != input.end(); ++it) {
      auto value = render_template(it.value(), context);
      if (!value) {
        return tl::unexpected(value.error());
      }
      out[it.key()] = std::move(*value);
    }
    return out;
  }
  if (input.is_array()) {
    Json out = Json::array();
    for (const auto& child : input) {
      auto value = render_template(child, context);
      if (!value) {
        return tl::unexpected(value.error());
      }
      out.push_back(std::move(*value));
    }
    return out;
  }
  return input;
}

}  // namespace wf::engine
