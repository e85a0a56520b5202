#include "canopy/config/model.hpp"

#include <fmt/format.h>

#include "canopy/core/log.hpp"

namespace canopy::config {

namespace {

template<typename List>
auto index_of(List const& list, std::string_view name) -> std::optional<size_t> {
  for (size_t i = 0; i < list.size(); ++i) {
    if (list[i].name_ == name) {
      return i;
    }
  }
  return std::nullopt;
}

template<typename List>
void merge_by_name(List& into, List const& from) {
  for (auto const& item : from) {
    if (auto* existing = find_named(into, item.name_)) {
      *existing = item;
    } else {
      into.push_back(item);
    }
  }
}

// Flatten one template and everything it extends, base templates first.
auto flatten_template(
    Configuration const&      config,
    std::string const&        name,
    std::vector<std::string>& stack,
    Template&                 out
) -> Result<void> {
  if (std::ranges::find(stack, name) != stack.end()) {
    std::vector<std::string> cycle(std::ranges::find(stack, name), stack.end());
    cycle.push_back(name);
    return std::unexpected(core::Error::circular_template(std::move(cycle)));
  }

  Template const* tmpl = config.find_template(name);
  if (tmpl == nullptr) {
    return std::unexpected(core::Error{core::ErrorKind::ConfigError, fmt::format("unknown template '{}'", name), name});
  }

  stack.push_back(name);
  for (auto const& base : tmpl->extend_) {
    if (auto result = flatten_template(config, base, stack, out); !result) {
      return result;
    }
  }
  stack.pop_back();

  if (tmpl->url_) {
    out.url_ = tmpl->url_;
  }
  if (tmpl->shell_) {
    out.shell_ = tmpl->shell_;
  }
  merge(out.variables_, tmpl->variables_);
  merge(out.environment_, tmpl->environment_);
  merge(out.commands_, tmpl->commands_);
  return {};
}

} // namespace

void merge(VariableList& into, VariableList const& from) {
  merge_by_name(into, from);
}

void merge(EnvironmentList& into, EnvironmentList const& from) {
  for (auto const& entry : from) {
    auto it = std::ranges::find_if(into, [&entry](EnvEntry const& e) {
      return e.name_ == entry.name_ && e.mode_ == entry.mode_;
    });
    if (it != into.end()) {
      *it = entry;
    } else {
      into.push_back(entry);
    }
  }
}

void merge(CommandList& into, CommandList const& from) {
  merge_by_name(into, from);
}

void merge(Tree& into, Tree const& from) {
  if (from.path_) {
    into.path_ = from.path_;
  }
  if (from.url_) {
    into.url_ = from.url_;
  }
  if (from.description_) {
    into.description_ = from.description_;
  }
  if (from.shell_) {
    into.shell_ = from.shell_;
  }
  for (auto const& name : from.templates_) {
    if (std::ranges::find(into.templates_, name) == into.templates_.end()) {
      into.templates_.push_back(name);
    }
  }
  merge(into.variables_, from.variables_);
  merge(into.environment_, from.environment_);
  merge(into.commands_, from.commands_);
}

auto Configuration::find_tree(std::string_view name) const -> std::optional<TreeIndex> {
  return index_of(trees_, name);
}

auto Configuration::find_group(std::string_view name) const -> std::optional<GroupIndex> {
  return index_of(groups_, name);
}

auto Configuration::find_garden(std::string_view name) const -> std::optional<GardenIndex> {
  return index_of(gardens_, name);
}

auto Configuration::find_template(std::string_view name) const -> Template const* {
  auto it = std::ranges::find_if(templates_, [name](Template const& t) { return t.name_ == name; });
  return it == templates_.end() ? nullptr : &*it;
}

auto Configuration::tree_shell(TreeIndex tree) const -> std::string const& {
  auto const& shell = trees_.at(tree).shell_;
  return shell ? *shell : shell_;
}

auto Configuration::validate() const -> Result<void> {
  auto conflict = [](std::string const& name, std::string_view a, std::string_view b) {
    return core::Error{
        core::ErrorKind::NameConflict, fmt::format("'{}' is defined as both a {} and a {}", name, a, b), name
    };
  };

  for (auto const& group : groups_) {
    if (find_tree(group.name_)) {
      return std::unexpected(conflict(group.name_, "tree", "group"));
    }
  }
  for (auto const& garden : gardens_) {
    if (find_tree(garden.name_)) {
      return std::unexpected(conflict(garden.name_, "tree", "garden"));
    }
    if (find_group(garden.name_)) {
      return std::unexpected(conflict(garden.name_, "group", "garden"));
    }
  }

  for (auto const& tree : trees_) {
    for (auto const& var : tree.variables_) {
      if (is_builtin_variable(var.name_)) {
        core::log::warn("tree '{}': built-in variable '{}' cannot be redefined; ignoring", tree.name_, var.name_);
      }
    }
  }
  return {};
}

auto Configuration::apply_templates() -> Result<void> {
  for (auto& tree : trees_) {
    if (tree.templates_.empty()) {
      continue;
    }

    Template flat;
    for (auto const& name : tree.templates_) {
      std::vector<std::string> stack;
      if (auto result = flatten_template(*this, name, stack, flat); !result) {
        return result;
      }
    }

    Tree expanded;
    expanded.name_        = tree.name_;
    expanded.url_         = flat.url_;
    expanded.shell_       = flat.shell_;
    expanded.variables_   = std::move(flat.variables_);
    expanded.environment_ = std::move(flat.environment_);
    expanded.commands_    = std::move(flat.commands_);
    merge(expanded, tree);
    tree = std::move(expanded);
  }
  return {};
}

void Configuration::define(std::string name, std::string expr) {
  if (auto* existing = find_named(variables_, name)) {
    existing->expr_ = std::move(expr);
  } else {
    variables_.push_back(Variable{std::move(name), std::move(expr)});
  }
}

auto is_builtin_variable(std::string_view name) noexcept -> bool {
  return name == core::constant::TREE_NAME_VAR ||
         name == core::constant::TREE_PATH_VAR ||
         name == core::constant::ROOT_VAR ||
         name == core::constant::CONFIG_DIR_VAR;
}

} // namespace canopy::config
