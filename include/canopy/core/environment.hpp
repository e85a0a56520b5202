#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canopy::core {

// Value snapshot of a process environment. Nothing here touches the live
// environment of the running process after capture().
class Environment {
  std::map<std::string, std::string, std::less<>> vars_;

public:
  Environment() = default;

  static auto capture() -> Environment;
  static auto from_entries(char const* const* entries) -> Environment;

  [[nodiscard]] auto get(std::string_view name) const -> std::optional<std::string>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  void               set(std::string name, std::string value);
  void               unset(std::string_view name);
  [[nodiscard]] auto size() const noexcept -> size_t;
  [[nodiscard]] auto entries() const noexcept -> std::map<std::string, std::string, std::less<>> const&;

  // "NAME=VALUE" strings suitable for building an envp array
  [[nodiscard]] auto to_strings() const -> std::vector<std::string>;

  auto operator==(Environment const&) const -> bool = default;
};

// Owns the storage behind a NULL-terminated envp array.
class EnvBlock {
  std::vector<std::string> storage_;
  std::vector<char*>       pointers_;

public:
  explicit EnvBlock(Environment const& env);

  EnvBlock(EnvBlock const&)            = delete;
  EnvBlock& operator=(EnvBlock const&) = delete;
  EnvBlock(EnvBlock&&)                 = delete;
  EnvBlock& operator=(EnvBlock&&)      = delete;
  ~EnvBlock()                          = default;

  [[nodiscard]] auto data() noexcept -> char**;
};

} // namespace canopy::core
