#include "canopy/eval/resolver.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "canopy/core/constants.hpp"
#include "canopy/core/log.hpp"

namespace canopy::eval {

namespace constant = core::constant;

// Drops every frame pushed while the guard was alive
class Resolver::FrameGuard {
  Resolver& resolver_;
  size_t    depth_;

public:
  explicit FrameGuard(Resolver& resolver)
      : resolver_(resolver), depth_(resolver.stack_.size()) {}

  FrameGuard(FrameGuard const&)            = delete;
  FrameGuard& operator=(FrameGuard const&) = delete;

  ~FrameGuard() {
    while (resolver_.stack_.size() > depth_) {
      resolver_.leave();
    }
  }
};

Resolver::Resolver(config::Configuration const& config, ExpressionRunner& runner)
    : config_(config), evaluator_(runner) {}

auto Resolver::enter(std::string const& scope, std::string const& name) -> Result<void> {
  Frame frame{scope, name};
  if (active_.contains(frame)) {
    std::vector<std::string> cycle;
    for (auto it = std::ranges::find(stack_, frame); it != stack_.end(); ++it) {
      cycle.push_back(it->second);
    }
    cycle.push_back(name);
    return std::unexpected(core::Error::circular_variable(std::move(cycle), scope));
  }
  active_.insert(frame);
  stack_.push_back(std::move(frame));
  return {};
}

void Resolver::leave() {
  active_.erase(stack_.back());
  stack_.pop_back();
}

auto Resolver::is_builtin(Scope const& scope, std::string_view name) noexcept -> bool {
  if (name == constant::CONFIG_DIR_VAR || name == constant::ROOT_VAR) {
    return true;
  }
  if (!scope.tree()) {
    return false;
  }
  return name == constant::TREE_NAME_VAR || (name == constant::TREE_PATH_VAR && scope.kind() == Scope::Kind::Tree);
}

auto Resolver::builtin(Scope const& scope, std::string const& name) -> std::optional<Result<std::string>> {
  if (name == constant::CONFIG_DIR_VAR) {
    return config_.config_dir_.string();
  }
  if (name == constant::ROOT_VAR) {
    auto path = root();
    if (!path) {
      return std::unexpected(path.error());
    }
    return path->string();
  }
  if (!is_builtin(scope, name)) {
    return std::nullopt;
  }
  if (name == constant::TREE_NAME_VAR) {
    return config_.trees_.at(*scope.tree()).name_;
  }
  if (name == constant::TREE_PATH_VAR) {
    auto path = tree_path(*scope.tree());
    if (!path) {
      return std::unexpected(path.error());
    }
    return path->string();
  }
  return std::nullopt;
}

auto Resolver::lookup(Scope const& scope, std::string const& name) -> Result<std::optional<std::string>> {
  if (auto value = builtin(scope, name)) {
    if (!*value) {
      return std::unexpected(value->error());
    }
    return std::move(**value);
  }

  Frame key{scope.id(), name};
  if (auto it = cache_.find(key); it != cache_.end()) {
    return it->second;
  }
  if (auto it = failures_.find(key); it != failures_.end()) {
    return std::unexpected(it->second);
  }

  if (scope.find(name) == nullptr) {
    return config_.ambient_.get(name);
  }

  if (auto resolved = resolve(scope, name); !resolved) {
    return std::unexpected(resolved.error());
  }
  if (auto it = failures_.find(key); it != failures_.end()) {
    return std::unexpected(it->second);
  }
  return cache_.at(key);
}

// Depth-first over the dependency graph using stack_ as the work list. A
// frame is only evaluated once every user variable it references is cached
// or failed, so evaluation never nests through user variables.
auto Resolver::resolve(Scope const& scope, std::string const& name) -> Result<void> {
  FrameGuard guard{*this};
  size_t     base = stack_.size();

  if (auto entered = enter(scope.id(), name); !entered) {
    return std::unexpected(entered.error());
  }

  while (stack_.size() > base) {
    config::Variable const* var = scope.find(stack_.back().second);

    std::optional<std::string> pending;
    for (auto& dep : references(var->expr_)) {
      Frame dep_key{scope.id(), dep};
      if (is_builtin(scope, dep) || cache_.contains(dep_key) || failures_.contains(dep_key) ||
          scope.find(dep) == nullptr) {
        continue;
      }
      pending = std::move(dep);
      break;
    }

    if (pending) {
      if (auto entered = enter(scope.id(), *pending); !entered) {
        return std::unexpected(entered.error());
      }
      continue;
    }

    auto  value = evaluate(scope, var->expr_);
    Frame key   = stack_.back();
    leave();
    if (!value) {
      failures_.emplace(std::move(key), std::move(value.error()));
      continue;
    }
    core::log::debug("{}: {} = {}", key.first, key.second, *value);
    cache_.emplace(std::move(key), std::move(*value));
  }
  return {};
}

auto Resolver::evaluate(Scope const& scope, std::string_view expr) -> Result<std::string> {
  return evaluator_.evaluate(
      expr, [this, &scope](std::string const& name) { return lookup(scope, name); }, scope.id()
  );
}

auto Resolver::interpolate(Scope const& scope, std::string_view text) -> Result<std::string> {
  return evaluator_.interpolate(
      text, [this, &scope](std::string const& name) { return lookup(scope, name); }, scope.id()
  );
}

auto Resolver::resolve_all(Scope const& scope) -> Result<VariableMap> {
  std::vector<std::string> names{std::string(constant::CONFIG_DIR_VAR), std::string(constant::ROOT_VAR)};
  if (scope.tree()) {
    names.emplace_back(constant::TREE_NAME_VAR);
    if (scope.kind() == Scope::Kind::Tree) {
      names.emplace_back(constant::TREE_PATH_VAR);
    }
  }

  auto const& layers = scope.variable_layers();
  for (auto layer = layers.rbegin(); layer != layers.rend(); ++layer) {
    for (auto const& var : **layer) {
      if (std::ranges::find(names, var.name_) == names.end()) {
        names.push_back(var.name_);
      }
    }
  }

  VariableMap result;
  result.reserve(names.size());
  for (auto const& name : names) {
    auto value = lookup(scope, name);
    if (!value) {
      return std::unexpected(value.error());
    }
    result.emplace_back(name, value->value_or(""));
  }
  return result;
}

auto Resolver::root() -> Result<std::filesystem::path> {
  if (root_) {
    return *root_;
  }

  auto       scope = Scope::global(config_);
  FrameGuard guard{*this};
  if (auto entered = enter(scope.id(), std::string(constant::ROOT_VAR)); !entered) {
    return std::unexpected(entered.error());
  }

  auto value = evaluate(scope, config_.root_expr_);
  if (!value) {
    return std::unexpected(value.error());
  }

  std::filesystem::path path{*value};
  if (path.is_relative()) {
    path = config_.config_dir_ / path;
  }
  root_ = path.lexically_normal();
  core::log::debug("workspace root: {}", root_->string());
  return *root_;
}

auto Resolver::tree_path(config::TreeIndex tree) -> Result<std::filesystem::path> {
  if (auto it = paths_.find(tree); it != paths_.end()) {
    return it->second;
  }

  auto       scope = Scope::tree_path(config_, tree);
  FrameGuard guard{*this};
  if (auto entered = enter(scope.id(), std::string(constant::TREE_PATH_VAR)); !entered) {
    return std::unexpected(entered.error());
  }

  auto value = evaluate(scope, config_.trees_.at(tree).path_expr());
  if (!value) {
    return std::unexpected(value.error());
  }

  std::filesystem::path path{*value};
  if (path.is_relative()) {
    auto base = root();
    if (!base) {
      return std::unexpected(base.error());
    }
    path = *base / path;
  }
  path = path.lexically_normal();
  // "a/" normalizes to "a/"; drop the empty trailing element
  if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
    path = path.parent_path();
  }
  return paths_.emplace(tree, std::move(path)).first->second;
}

auto Resolver::environment(Scope const& scope, core::Environment base) -> Result<core::Environment> {
  for (auto const* layer : scope.environment_layers()) {
    for (auto const& entry : *layer) {
      for (auto const& expr : entry.values_) {
        auto value = evaluate(scope, expr);
        if (!value) {
          return std::unexpected(value.error());
        }

        auto inherited = base.get(entry.name_);
        switch (entry.mode_) {
        case config::EnvMode::Set:
          base.set(entry.name_, std::move(*value));
          break;
        case config::EnvMode::Prepend:
          base.set(
              entry.name_,
              inherited && !inherited->empty() ? fmt::format("{}{}{}", *value, constant::PATH_SEPARATOR, *inherited)
                                               : std::move(*value)
          );
          break;
        case config::EnvMode::Append:
          base.set(
              entry.name_,
              inherited && !inherited->empty() ? fmt::format("{}{}{}", *inherited, constant::PATH_SEPARATOR, *value)
                                               : std::move(*value)
          );
          break;
        }
      }
    }
  }
  return base;
}

} // namespace canopy::eval
