#pragma once

#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace canopy::core::log {

enum struct Level {
  Debug,
  Info,
  Warn,
  Error,
  Off
};

void set_level(Level level) noexcept;
auto level() noexcept -> Level;
auto enabled(Level level) noexcept -> bool;

auto prefix(Level level) noexcept -> std::string_view;

template<typename... Args>
void write(Level lvl, fmt::format_string<Args...> format, Args&&... args) {
  if (!enabled(lvl)) {
    return;
  }
  fmt::print(stderr, "{}{}\n", prefix(lvl), fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Info, format, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Warn, format, std::forward<Args>(args)...);
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Error, format, std::forward<Args>(args)...);
}

} // namespace canopy::core::log
