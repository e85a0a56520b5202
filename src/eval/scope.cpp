#include "canopy/eval/scope.hpp"

#include <fmt/format.h>

namespace canopy::eval {

auto Scope::global(config::Configuration const& config) -> Scope {
  Scope scope{Kind::Global, "global"};
  scope.variables_.push_back(&config.variables_);
  scope.environment_.push_back(&config.environment_);
  return scope;
}

auto Scope::garden(config::Configuration const& config, config::GardenIndex garden) -> Scope {
  auto const& g = config.gardens_.at(garden);

  Scope scope{Kind::Garden, fmt::format("garden:{}", g.name_)};
  scope.garden_ = garden;
  scope.variables_.push_back(&g.variables_);
  scope.variables_.push_back(&config.variables_);
  scope.environment_.push_back(&config.environment_);
  scope.environment_.push_back(&g.environment_);
  return scope;
}

auto Scope::tree(config::Configuration const& config, TreeContext context) -> Scope {
  auto const& t = config.trees_.at(context.tree_);

  std::string id = fmt::format("tree:{}", t.name_);
  if (context.garden_) {
    id = fmt::format("garden:{}/{}", config.gardens_.at(*context.garden_).name_, id);
  }

  Scope scope{Kind::Tree, std::move(id)};
  scope.tree_   = context.tree_;
  scope.garden_ = context.garden_;

  scope.variables_.push_back(&t.variables_);
  if (context.garden_) {
    scope.variables_.push_back(&config.gardens_.at(*context.garden_).variables_);
  }
  scope.variables_.push_back(&config.variables_);

  scope.environment_.push_back(&config.environment_);
  if (context.garden_) {
    scope.environment_.push_back(&config.gardens_.at(*context.garden_).environment_);
  }
  scope.environment_.push_back(&t.environment_);
  return scope;
}

auto Scope::tree_path(config::Configuration const& config, config::TreeIndex tree) -> Scope {
  Scope scope{Kind::TreePath, fmt::format("path:{}", config.trees_.at(tree).name_)};
  scope.tree_ = tree;
  scope.variables_.push_back(&config.variables_);
  return scope;
}

auto Scope::find(std::string_view name) const -> config::Variable const* {
  for (auto const* layer : variables_) {
    for (auto const& var : *layer) {
      if (var.name_ == name) {
        return &var;
      }
    }
  }
  return nullptr;
}

} // namespace canopy::eval
