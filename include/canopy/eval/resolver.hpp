#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "canopy/config/model.hpp"
#include "canopy/core/environment.hpp"
#include "canopy/eval/expression.hpp"
#include "canopy/eval/scope.hpp"

namespace canopy::eval {

using VariableMap = std::vector<std::pair<std::string, std::string>>;

// Lazy, memoized variable resolution for one run.
//
// A variable is evaluated in the scope it is looked up from, so a global
// definition referencing ${TREE_NAME} yields a different value per tree.
// Values and failures are cached per (scope id, name). Every in-flight
// (scope id, name) pair sits on an explicit frame stack that also drives
// dependency order; re-entering one is a cycle.
class Resolver {
  using Frame = std::pair<std::string, std::string>;

  config::Configuration const& config_;
  Evaluator                    evaluator_;

  std::map<Frame, std::string>                       cache_;
  std::map<Frame, core::Error>                       failures_;
  std::vector<Frame>                                 stack_;
  std::set<Frame>                                    active_;
  std::optional<std::filesystem::path>               root_;
  std::map<config::TreeIndex, std::filesystem::path> paths_;

  class FrameGuard;

  auto enter(std::string const& scope, std::string const& name) -> Result<void>;
  void leave();
  auto resolve(Scope const& scope, std::string const& name) -> Result<void>;

  static auto is_builtin(Scope const& scope, std::string_view name) noexcept -> bool;
  auto        builtin(Scope const& scope, std::string const& name) -> std::optional<Result<std::string>>;

public:
  Resolver(config::Configuration const& config, ExpressionRunner& runner);

  Resolver(Resolver const&)            = delete;
  Resolver& operator=(Resolver const&) = delete;

  [[nodiscard]] auto config() const noexcept -> config::Configuration const& {
    return config_;
  }

  // nullopt when the name is defined in no layer and not in the environment
  auto lookup(Scope const& scope, std::string const& name) -> Result<std::optional<std::string>>;

  auto evaluate(Scope const& scope, std::string_view expr) -> Result<std::string>;

  // Substitute ${name} references only; a leading "$ " is not executed
  auto interpolate(Scope const& scope, std::string_view text) -> Result<std::string>;

  // Every built-in and user variable visible in the scope, outermost first
  auto resolve_all(Scope const& scope) -> Result<VariableMap>;

  auto root() -> Result<std::filesystem::path>;
  auto tree_path(config::TreeIndex tree) -> Result<std::filesystem::path>;

  // Apply the scope's environment entries (global, garden, tree) over `base`
  auto environment(Scope const& scope, core::Environment base) -> Result<core::Environment>;

  [[nodiscard]] auto cache_size() const noexcept -> size_t {
    return cache_.size();
  }
};

} // namespace canopy::eval
