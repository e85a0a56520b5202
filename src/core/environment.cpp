#include "canopy/core/environment.hpp"

#include <utility>

extern "C" {
  extern char** environ; // NOLINT
}

namespace canopy::core {

auto Environment::capture() -> Environment {
  return from_entries(::environ);
}

auto Environment::from_entries(char const* const* entries) -> Environment {
  Environment env;
  if (entries == nullptr) {
    return env;
  }
  for (char const* const* it = entries; *it != nullptr; ++it) {
    std::string_view entry{*it};
    if (auto eq_pos = entry.find('='); eq_pos != std::string_view::npos) {
      env.vars_.insert_or_assign(std::string(entry.substr(0, eq_pos)), std::string(entry.substr(eq_pos + 1)));
    }
  }
  return env;
}

auto Environment::get(std::string_view name) const -> std::optional<std::string> {
  if (auto it = vars_.find(name); it != vars_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto Environment::contains(std::string_view name) const -> bool {
  return vars_.find(name) != vars_.end();
}

void Environment::set(std::string name, std::string value) {
  vars_.insert_or_assign(std::move(name), std::move(value));
}

void Environment::unset(std::string_view name) {
  if (auto it = vars_.find(name); it != vars_.end()) {
    vars_.erase(it);
  }
}

auto Environment::size() const noexcept -> size_t {
  return vars_.size();
}

auto Environment::entries() const noexcept -> std::map<std::string, std::string, std::less<>> const& {
  return vars_;
}

auto Environment::to_strings() const -> std::vector<std::string> {
  std::vector<std::string> result;
  result.reserve(vars_.size());
  for (auto const& [key, value] : vars_) {
    result.push_back(key + "=" + value);
  }
  return result;
}

EnvBlock::EnvBlock(Environment const& env)
    : storage_(env.to_strings()) {
  pointers_.reserve(storage_.size() + 1);
  for (auto& entry : storage_) {
    pointers_.push_back(entry.data());
  }
  pointers_.push_back(nullptr);
}

auto EnvBlock::data() noexcept -> char** {
  return pointers_.data();
}

} // namespace canopy::core
