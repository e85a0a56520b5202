#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "canopy/core/error.hpp"

namespace canopy::cli {

template<typename T>
concept ArgType = std::convertible_to<T, std::string> || requires(T t, char const* ptr, char const* end) {
  std::from_chars(ptr, end, t);
};

class Option;
class Arguments;

class ArgumentParser {
  std::string         name_;
  std::string         usage_;
  std::string         desc_;
  std::vector<Option> options_;
  bool                stop_at_positional_ = false;

public:
  explicit ArgumentParser(std::string name = "", std::string desc = "");

  auto add_argument(std::string name, std::string short_name = "") -> Option&;

  // Everything from the first positional argument on is left unparsed,
  // so a subcommand can parse its own options
  auto stop_at_positional(bool stop = true) noexcept -> ArgumentParser&;
  auto usage(std::string usage) -> ArgumentParser&;

  auto parse(int argc, char const* const* argv) const -> core::Result<Arguments>;
  auto parse(std::vector<std::string> const& args) const -> core::Result<Arguments>;

  [[nodiscard]] auto help() const -> std::string;
};

class Option {
  std::string                             name_;
  std::string                             short_name_;
  std::string                             description_;
  std::optional<std::vector<std::string>> default_value_;
  size_t                                  nargs_    = 0;
  bool                                    multiple_ = false;

public:
  Option(std::string name, std::string short_name);

  auto desc(std::string desc) -> Option&;
  auto default_value(std::string value) -> Option&;
  auto nargs(size_t n) noexcept -> Option&;
  // Repeated occurrences accumulate instead of replacing
  auto multiple() noexcept -> Option&;

  friend class ArgumentParser;
};

class Arguments {
  std::unordered_map<std::string, std::vector<std::string>> args_;

public:
  std::vector<std::string> positional_;
  // Everything after a bare "--"
  std::vector<std::string> trailing_;

  Arguments() = default;

  [[nodiscard]] auto has(std::string const& name) const noexcept -> bool;

  template<ArgType T = std::string>
  [[nodiscard]] auto get(std::string const& name) const -> std::optional<T> {
    auto it = args_.find(name);
    if (it == args_.end() || it->second.empty()) {
      return std::nullopt;
    }

    std::string const& str = it->second.back();

    if constexpr (std::convertible_to<T, std::string>) {
      return str;
    } else {
      T value = 0;

      auto [_, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{}) {
        return std::nullopt;
      }
      return value;
    }
  }

  [[nodiscard]] auto get_all(std::string const& name) const -> std::vector<std::string>;

  friend class ArgumentParser;
};

} // namespace canopy::cli
