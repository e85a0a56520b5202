#include "canopy/core/log.hpp"

#include <atomic>

namespace canopy::core::log {

namespace {

std::atomic<Level> current_level{Level::Info}; // NOLINT

} // namespace

void set_level(Level level) noexcept {
  current_level.store(level);
}

auto level() noexcept -> Level {
  return current_level.load();
}

auto enabled(Level lvl) noexcept -> bool {
  return lvl >= current_level.load() && lvl != Level::Off;
}

auto prefix(Level lvl) noexcept -> std::string_view {
  switch (lvl) {
  case Level::Debug:
    return "debug: ";
  case Level::Info:
    return "";
  case Level::Warn:
    return "warning: ";
  case Level::Error:
    return "error: ";
  case Level::Off:
    break;
  }
  return "";
}

} // namespace canopy::core::log
