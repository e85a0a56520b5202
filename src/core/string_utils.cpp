#include "canopy/core/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace canopy::core {

namespace {

auto is_space(char c) noexcept -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

auto trim(std::string_view sv) -> std::string {
  auto begin = std::ranges::find_if_not(sv, is_space);
  auto end   = std::find_if_not(sv.rbegin(), sv.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

auto trim_trailing_newlines(std::string_view sv) -> std::string {
  while (!sv.empty() && (sv.back() == '\n' || sv.back() == '\r')) {
    sv.remove_suffix(1);
  }
  return std::string(sv);
}

auto split_words(std::string_view sv) -> std::vector<std::string> {
  std::vector<std::string> words;
  std::string              current;
  for (char c : sv) {
    if (is_space(c)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

auto split_assignment(std::string_view sv, std::string& name, std::string& value) -> bool {
  auto eq_pos = sv.find('=');
  if (eq_pos == std::string_view::npos) {
    return false;
  }
  name  = trim(sv.substr(0, eq_pos));
  value = std::string(sv.substr(eq_pos + 1));
  return true;
}

auto is_identifier_start(char c) noexcept -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto is_identifier_char(char c) noexcept -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-' || c == '.';
}

auto is_valid_variable_name(std::string_view name) noexcept -> bool {
  if (name.empty() || !is_identifier_start(name.front())) {
    return false;
  }
  return std::ranges::all_of(name.substr(1), is_identifier_char);
}

} // namespace canopy::core
