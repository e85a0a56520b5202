#pragma once

#include <string_view>

namespace canopy::query {

// Shell-style wildcard match over whole names: *, ?, [abc], [a-z], [!x], [^x].
// A backslash makes the next pattern character literal.
auto glob_match(std::string_view pattern, std::string_view name) -> bool;

auto has_glob_characters(std::string_view str) noexcept -> bool;

} // namespace canopy::query
