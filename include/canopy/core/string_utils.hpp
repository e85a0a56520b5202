#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace canopy::core {

auto trim(std::string_view sv) -> std::string;
auto trim_trailing_newlines(std::string_view sv) -> std::string;

// Split on runs of whitespace, dropping empty words
auto split_words(std::string_view sv) -> std::vector<std::string>;

// Split "NAME=VALUE" at the first '='; false when there is no '='
auto split_assignment(std::string_view sv, std::string& name, std::string& value) -> bool;

auto is_identifier_start(char c) noexcept -> bool;
auto is_identifier_char(char c) noexcept -> bool;
auto is_valid_variable_name(std::string_view name) noexcept -> bool;

} // namespace canopy::core
