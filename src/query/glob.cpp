#include "canopy/query/glob.hpp"

#include <optional>

namespace canopy::query {

namespace {

// Match c against the bracket expression at pattern[pos]. On success returns
// the index just past the closing ']'; nullopt when c is not in the set.
// An unterminated '[' is reported through `literal`.
auto match_bracket_expression(std::string_view pattern, size_t pos, char c, bool& literal) -> std::optional<size_t> {
  size_t i = pos + 1;

  bool negated = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negated = true;
    ++i;
  }

  bool matched = false;
  bool first   = true;
  while (i < pattern.size() && (pattern[i] != ']' || first)) {
    first   = false;
    char lo = pattern[i];

    // Handle range expressions like a-z
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      if (lo <= c && c <= pattern[i + 2]) {
        matched = true;
      }
      i += 3;
    } else {
      if (c == lo) {
        matched = true;
      }
      ++i;
    }
  }

  if (i >= pattern.size()) {
    literal = true;
    return std::nullopt;
  }

  literal = false;
  if (negated == matched) {
    return std::nullopt;
  }
  return i + 1;
}

} // namespace

auto glob_match(std::string_view pattern, std::string_view name) -> bool {
  size_t p = 0;
  size_t n = 0;

  // Position after the most recent '*' and the name index it is trying
  std::optional<size_t> star_p;
  size_t                star_n = 0;

  while (n < name.size()) {
    if (p < pattern.size()) {
      char pc = pattern[p];

      if (pc == '*') {
        star_p = ++p;
        star_n = n;
        continue;
      }

      if (pc == '?') {
        ++p;
        ++n;
        continue;
      }

      if (pc == '[') {
        bool literal = false;
        auto next    = match_bracket_expression(pattern, p, name[n], literal);
        if (next) {
          p = *next;
          ++n;
          continue;
        }
        if (literal && name[n] == '[') {
          ++p;
          ++n;
          continue;
        }
      } else {
        if (pc == '\\' && p + 1 < pattern.size()) {
          pc = pattern[p + 1];
          if (pc == name[n]) {
            p += 2;
            ++n;
            continue;
          }
        } else if (pc == name[n]) {
          ++p;
          ++n;
          continue;
        }
      }
    }

    // Mismatch: let the last '*' swallow one more character
    if (!star_p) {
      return false;
    }
    p = *star_p;
    n = ++star_n;
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

auto has_glob_characters(std::string_view str) noexcept -> bool {
  return str.find_first_of("*?[") != std::string_view::npos;
}

} // namespace canopy::query
