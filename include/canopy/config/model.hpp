#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "canopy/core/constants.hpp"
#include "canopy/core/environment.hpp"
#include "canopy/core/error.hpp"

namespace canopy::config {

using core::Result;

struct Variable {
  std::string name_;
  std::string expr_;

  auto operator==(Variable const&) const -> bool = default;
};

using VariableList = std::vector<Variable>;

enum struct EnvMode {
  Set,     // NAME=
  Prepend, // NAME
  Append   // NAME+
};

struct EnvEntry {
  std::string              name_;
  EnvMode                  mode_ = EnvMode::Prepend;
  std::vector<std::string> values_;

  auto operator==(EnvEntry const&) const -> bool = default;
};

using EnvironmentList = std::vector<EnvEntry>;

struct Command {
  std::string              name_;
  std::vector<std::string> lines_;

  auto operator==(Command const&) const -> bool = default;
};

using CommandList = std::vector<Command>;

struct Template {
  std::string                name_;
  std::vector<std::string>   extend_;
  std::optional<std::string> url_;
  std::optional<std::string> shell_;
  VariableList               variables_;
  EnvironmentList            environment_;
  CommandList                commands_;
};

struct Tree {
  std::string                name_;
  std::optional<std::string> path_;
  std::optional<std::string> url_;
  std::optional<std::string> description_;
  std::optional<std::string> shell_;
  std::vector<std::string>   templates_;
  VariableList               variables_;
  EnvironmentList            environment_;
  CommandList                commands_;

  // The path expression; a tree without one lives at <root>/<name>
  [[nodiscard]] auto path_expr() const -> std::string {
    return path_.value_or(name_);
  }
};

struct Group {
  std::string              name_;
  std::vector<std::string> members_;
};

struct Garden {
  std::string              name_;
  std::vector<std::string> trees_;
  std::vector<std::string> groups_;
  VariableList             variables_;
  EnvironmentList          environment_;
  CommandList              commands_;
};

// Index into Configuration::trees_ / groups_ / gardens_
using TreeIndex   = size_t;
using GroupIndex  = size_t;
using GardenIndex = size_t;

class Configuration {
public:
  std::vector<Tree>     trees_;
  std::vector<Group>    groups_;
  std::vector<Garden>   gardens_;
  std::vector<Template> templates_;

  VariableList    variables_;
  EnvironmentList environment_;
  CommandList     commands_;

  std::string root_expr_{core::constant::DEFAULT_ROOT};
  std::string shell_{core::constant::DEFAULT_SHELL};

  // Directory of the first configuration layer; seeds CANOPY_CONFIG_DIR
  std::filesystem::path              config_dir_;
  std::vector<std::filesystem::path> sources_;

  // Ambient environment captured once per run
  core::Environment ambient_;

  [[nodiscard]] auto find_tree(std::string_view name) const -> std::optional<TreeIndex>;
  [[nodiscard]] auto find_group(std::string_view name) const -> std::optional<GroupIndex>;
  [[nodiscard]] auto find_garden(std::string_view name) const -> std::optional<GardenIndex>;
  [[nodiscard]] auto find_template(std::string_view name) const -> Template const*;

  [[nodiscard]] auto tree_shell(TreeIndex tree) const -> std::string const&;

  // Tree/group/garden names must not collide across namespaces
  [[nodiscard]] auto validate() const -> Result<void>;

  // Expand tree templates (and template `extend` chains) into the trees
  auto apply_templates() -> Result<void>;

  // Override or add a global variable
  void define(std::string name, std::string expr);
};

// Layer merging: entries from `from` replace same-named entries in `into`
// (keeping their original position) and new entries are appended.
void merge(VariableList& into, VariableList const& from);
void merge(EnvironmentList& into, EnvironmentList const& from);
void merge(CommandList& into, CommandList const& from);
void merge(Tree& into, Tree const& from);

template<typename List>
auto find_named(List& list, std::string_view name) -> decltype(&list.front()) {
  auto it = std::ranges::find_if(list, [name](auto const& item) { return item.name_ == name; });
  return it == list.end() ? nullptr : &*it;
}

auto is_builtin_variable(std::string_view name) noexcept -> bool;

} // namespace canopy::config
