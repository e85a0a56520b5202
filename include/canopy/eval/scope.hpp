#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "canopy/config/model.hpp"

namespace canopy::eval {

// A tree selected for a run, with the garden it was reached through
struct TreeContext {
  config::TreeIndex                  tree_;
  std::optional<config::GardenIndex> garden_;

  auto operator==(TreeContext const&) const -> bool = default;
};

// Read-only view over the variable and environment layers visible at one
// resolution point. Views borrow from the Configuration and never copy it.
class Scope {
public:
  enum struct Kind {
    Global,
    Garden,
    Tree,
    // Where a tree's path expression is evaluated: TREE_NAME and globals only
    TreePath
  };

private:
  Kind                                        kind_;
  std::string                                 id_;
  std::optional<config::TreeIndex>            tree_;
  std::optional<config::GardenIndex>          garden_;
  std::vector<config::VariableList const*>    variables_;   // innermost first
  std::vector<config::EnvironmentList const*> environment_; // outermost first

  Scope(Kind kind, std::string id)
      : kind_(kind), id_(std::move(id)) {}

public:
  static auto global(config::Configuration const& config) -> Scope;
  static auto garden(config::Configuration const& config, config::GardenIndex garden) -> Scope;
  static auto tree(config::Configuration const& config, TreeContext context) -> Scope;
  static auto tree_path(config::Configuration const& config, config::TreeIndex tree) -> Scope;

  [[nodiscard]] auto kind() const noexcept -> Kind {
    return kind_;
  }
  // Stable identity: global, garden:<g>, tree:<t>, garden:<g>/tree:<t>, path:<t>
  [[nodiscard]] auto id() const noexcept -> std::string const& {
    return id_;
  }
  [[nodiscard]] auto tree() const noexcept -> std::optional<config::TreeIndex> {
    return tree_;
  }
  [[nodiscard]] auto garden() const noexcept -> std::optional<config::GardenIndex> {
    return garden_;
  }

  // Innermost definition of `name`, if any layer has one
  [[nodiscard]] auto find(std::string_view name) const -> config::Variable const*;

  [[nodiscard]] auto variable_layers() const noexcept -> std::vector<config::VariableList const*> const& {
    return variables_;
  }
  [[nodiscard]] auto environment_layers() const noexcept -> std::vector<config::EnvironmentList const*> const& {
    return environment_;
  }
};

} // namespace canopy::eval
