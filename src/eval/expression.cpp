#include "canopy/eval/expression.hpp"

#include <algorithm>

#include "canopy/core/string_utils.hpp"

namespace canopy::eval {

namespace {

constexpr std::string_view COMMAND_PREFIX = "$ ";

// Length of the "${...}" starting at pos, honoring nested braces; 0 if unterminated
auto braced_length(std::string_view str, size_t pos) -> size_t {
  size_t end         = pos + 2;
  size_t brace_count = 1;

  while (end < str.size() && brace_count > 0) {
    if (str[end] == '{') {
      ++brace_count;
    } else if (str[end] == '}') {
      --brace_count;
    }
    ++end;
  }

  return brace_count > 0 ? 0 : end - pos;
}

} // namespace

auto classify(std::string_view expr) noexcept -> ExpressionKind {
  if (expr.starts_with(COMMAND_PREFIX)) {
    return ExpressionKind::Command;
  }
  if (expr.find("${") != std::string_view::npos) {
    return ExpressionKind::Interpolation;
  }
  return ExpressionKind::Literal;
}

auto references(std::string_view text) -> std::vector<std::string> {
  if (text.starts_with(COMMAND_PREFIX)) {
    text.remove_prefix(COMMAND_PREFIX.size());
  }

  std::vector<std::string> names;
  size_t                   pos = 0;
  while ((pos = text.find('$', pos)) != std::string_view::npos && pos + 1 < text.size()) {
    if (text[pos + 1] == '$') {
      pos += 2;
      continue;
    }
    if (text[pos + 1] != '{') {
      ++pos;
      continue;
    }

    size_t length = braced_length(text, pos);
    if (length == 0) {
      break;
    }
    auto name = std::string(text.substr(pos + 2, length - 3));
    if (core::is_valid_variable_name(name) && std::ranges::find(names, name) == names.end()) {
      names.push_back(std::move(name));
    }
    pos += length;
  }
  return names;
}

auto Evaluator::interpolate(std::string_view text, Lookup const& lookup, std::string_view scope) const
    -> Result<std::string> {
  std::string result;
  result.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '$' || pos + 1 >= text.size()) {
      result += text[pos];
      ++pos;
      continue;
    }

    if (text[pos + 1] == '$') {
      result += '$';
      pos += 2;
      continue;
    }

    if (text[pos + 1] != '{') {
      result += '$';
      ++pos;
      continue;
    }

    size_t length = braced_length(text, pos);
    if (length == 0) {
      result.append(text.substr(pos));
      break;
    }

    auto braced = text.substr(pos, length);
    auto name   = std::string(braced.substr(2, length - 3));

    // Shell constructs such as ${x:-y} pass through untouched
    if (!core::is_valid_variable_name(name)) {
      result.append(braced);
      pos += length;
      continue;
    }

    auto value = lookup(name);
    if (!value) {
      return std::unexpected(value.error());
    }
    if (!*value) {
      return std::unexpected(core::Error::undefined_variable(name, std::string(scope)));
    }
    result += **value;
    pos += length;
  }

  return result;
}

auto Evaluator::evaluate(std::string_view expr, Lookup const& lookup, std::string_view scope) const
    -> Result<std::string> {
  switch (classify(expr)) {
  case ExpressionKind::Literal:
  case ExpressionKind::Interpolation:
    return interpolate(expr, lookup, scope);
  case ExpressionKind::Command: {
    auto command = interpolate(expr.substr(COMMAND_PREFIX.size()), lookup, scope);
    if (!command) {
      return command;
    }
    return runner_.run(*command);
  }
  }
  return std::string(expr);
}

} // namespace canopy::eval
