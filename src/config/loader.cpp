#include "canopy/config/loader.hpp"

#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_set>

#include <yaml.h>

#include <fmt/format.h>

#include "canopy/core/log.hpp"
#include "canopy/core/string_utils.hpp"

namespace canopy::config {

namespace {

namespace fs = std::filesystem;

using core::Error;
using core::ErrorKind;

class YamlDocument {
  yaml_parser_t   parser_{};
  yaml_document_t doc_{};
  bool            loaded_ = false;

public:
  YamlDocument() {
    yaml_parser_initialize(&parser_);
  }

  ~YamlDocument() {
    yaml_parser_delete(&parser_);
    if (loaded_) {
      yaml_document_delete(&doc_);
    }
  }

  YamlDocument(YamlDocument const&)            = delete;
  YamlDocument& operator=(YamlDocument const&) = delete;
  YamlDocument(YamlDocument&&)                 = delete;
  YamlDocument& operator=(YamlDocument&&)      = delete;

  auto load(std::string_view text, std::string const& name) -> Result<void> {
    yaml_parser_set_input_string(&parser_, reinterpret_cast<unsigned char const*>(text.data()), text.size());
    if (yaml_parser_load(&parser_, &doc_) == 0) {
      std::string problem = parser_.problem != nullptr ? parser_.problem : "malformed document";
      return std::unexpected(Error{
          ErrorKind::ConfigError,
          fmt::format("{}:{}: {}", name, parser_.problem_mark.line + 1, problem),
          name
      });
    }
    loaded_ = true;
    return {};
  }

  auto root() -> yaml_node_t* {
    return yaml_document_get_root_node(&doc_);
  }

  auto node(int id) -> yaml_node_t* {
    return yaml_document_get_node(&doc_, id);
  }
};

// Typed access to one loaded document with file:line error reporting
class NodeReader {
  YamlDocument& doc_;
  std::string   name_;

public:
  NodeReader(YamlDocument& doc, std::string name)
      : doc_(doc), name_(std::move(name)) {}

  auto error(yaml_node_t const* node, std::string const& msg) const -> Error {
    auto line = node != nullptr ? node->start_mark.line + 1 : 0;
    return Error{ErrorKind::ConfigError, fmt::format("{}:{}: {}", name_, line, msg), name_};
  }

  static auto is_null(yaml_node_t const* node) -> bool {
    if (node == nullptr) {
      return true;
    }
    if (node->type != YAML_SCALAR_NODE || node->data.scalar.style != YAML_PLAIN_SCALAR_STYLE) {
      return false;
    }
    std::string_view text{reinterpret_cast<char const*>(node->data.scalar.value), node->data.scalar.length};
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
  }

  auto scalar(yaml_node_t const* node, std::string_view what) const -> Result<std::string> {
    if (is_null(node)) {
      return std::string{};
    }
    if (node->type != YAML_SCALAR_NODE) {
      return std::unexpected(error(node, fmt::format("{} must be a string", what)));
    }
    return std::string(reinterpret_cast<char const*>(node->data.scalar.value), node->data.scalar.length);
  }

  // A scalar is a one-element list
  auto string_list(yaml_node_t const* node, std::string_view what) const -> Result<std::vector<std::string>> {
    std::vector<std::string> result;
    if (is_null(node)) {
      return result;
    }
    if (node->type == YAML_SCALAR_NODE) {
      result.emplace_back(reinterpret_cast<char const*>(node->data.scalar.value), node->data.scalar.length);
      return result;
    }
    if (node->type != YAML_SEQUENCE_NODE) {
      return std::unexpected(error(node, fmt::format("{} must be a string or a list of strings", what)));
    }
    for (auto* item = node->data.sequence.items.start; item < node->data.sequence.items.top; ++item) {
      auto value = scalar(doc_.node(*item), what);
      if (!value) {
        return std::unexpected(value.error());
      }
      result.push_back(std::move(*value));
    }
    return result;
  }

  auto for_each_pair(
      yaml_node_t const*                                                          node,
      std::string_view                                                            what,
      std::function<Result<void>(std::string const& key, yaml_node_t* value)> const& fn
  ) const -> Result<void> {
    if (is_null(node)) {
      return {};
    }
    if (node->type != YAML_MAPPING_NODE) {
      return std::unexpected(error(node, fmt::format("{} must be a mapping", what)));
    }

    std::unordered_set<std::string> seen;
    for (auto* pair = node->data.mapping.pairs.start; pair < node->data.mapping.pairs.top; ++pair) {
      yaml_node_t* key_node = doc_.node(pair->key);
      auto         key      = scalar(key_node, fmt::format("{} key", what));
      if (!key) {
        return std::unexpected(key.error());
      }
      if (!seen.insert(*key).second) {
        return std::unexpected(error(key_node, fmt::format("duplicate key '{}' in {}", *key, what)));
      }
      if (auto result = fn(*key, doc_.node(pair->value)); !result) {
        return result;
      }
    }
    return {};
  }

  auto variables(yaml_node_t const* node, std::string_view what) const -> Result<VariableList> {
    VariableList result;
    auto         status = for_each_pair(node, what, [&](std::string const& key, yaml_node_t* value) -> Result<void> {
      auto expr = scalar(value, fmt::format("variable '{}'", key));
      if (!expr) {
        return std::unexpected(expr.error());
      }
      result.push_back(Variable{key, std::move(*expr)});
      return {};
    });
    if (!status) {
      return std::unexpected(status.error());
    }
    return result;
  }

  auto environment(yaml_node_t const* node, std::string_view what) const -> Result<EnvironmentList> {
    EnvironmentList result;
    auto status = for_each_pair(node, what, [&](std::string const& key, yaml_node_t* value) -> Result<void> {
      EnvEntry entry;
      entry.name_ = key;
      if (key.ends_with('=')) {
        entry.mode_ = EnvMode::Set;
        entry.name_.pop_back();
      } else if (key.ends_with('+')) {
        entry.mode_ = EnvMode::Append;
        entry.name_.pop_back();
      } else {
        entry.mode_ = EnvMode::Prepend;
      }
      if (entry.name_.empty()) {
        return std::unexpected(error(value, fmt::format("empty environment variable name in {}", what)));
      }
      auto values = string_list(value, fmt::format("environment '{}'", key));
      if (!values) {
        return std::unexpected(values.error());
      }
      entry.values_ = std::move(*values);
      result.push_back(std::move(entry));
      return {};
    });
    if (!status) {
      return std::unexpected(status.error());
    }
    return result;
  }

  auto commands(yaml_node_t const* node, std::string_view what) const -> Result<CommandList> {
    CommandList result;
    auto        status = for_each_pair(node, what, [&](std::string const& key, yaml_node_t* value) -> Result<void> {
      auto lines = string_list(value, fmt::format("command '{}'", key));
      if (!lines) {
        return std::unexpected(lines.error());
      }
      result.push_back(Command{key, std::move(*lines)});
      return {};
    });
    if (!status) {
      return std::unexpected(status.error());
    }
    return result;
  }

  auto tree(std::string const& name, yaml_node_t const* node) const -> Result<Tree> {
    Tree tree;
    tree.name_ = name;

    // "name: <url>" shorthand
    if (node != nullptr && node->type == YAML_SCALAR_NODE) {
      auto url = scalar(node, "tree url");
      if (!url) {
        return std::unexpected(url.error());
      }
      if (!url->empty()) {
        tree.url_ = std::move(*url);
      }
      return tree;
    }

    auto what   = fmt::format("tree '{}'", name);
    auto status = for_each_pair(node, what, [&](std::string const& key, yaml_node_t* value) -> Result<void> {
      if (key == "path" || key == "url" || key == "description" || key == "shell") {
        auto text = scalar(value, fmt::format("{} {}", what, key));
        if (!text) {
          return std::unexpected(text.error());
        }
        auto& field = key == "path" ? tree.path_ : key == "url" ? tree.url_ : key == "description" ? tree.description_ : tree.shell_;
        field       = std::move(*text);
      } else if (key == "templates") {
        auto names = string_list(value, fmt::format("{} templates", what));
        if (!names) {
          return std::unexpected(names.error());
        }
        tree.templates_ = std::move(*names);
      } else if (key == "variables") {
        auto vars = variables(value, fmt::format("{} variables", what));
        if (!vars) {
          return std::unexpected(vars.error());
        }
        tree.variables_ = std::move(*vars);
      } else if (key == "environment") {
        auto env = environment(value, fmt::format("{} environment", what));
        if (!env) {
          return std::unexpected(env.error());
        }
        tree.environment_ = std::move(*env);
      } else if (key == "commands") {
        auto cmds = commands(value, fmt::format("{} commands", what));
        if (!cmds) {
          return std::unexpected(cmds.error());
        }
        tree.commands_ = std::move(*cmds);
      } else {
        core::log::debug("{}: ignoring key '{}' in {}", name_, key, what);
      }
      return {};
    });
    if (!status) {
      return std::unexpected(status.error());
    }
    return tree;
  }

  auto template_(std::string const& name, yaml_node_t const* node) const -> Result<Template> {
    Template tmpl;
    tmpl.name_ = name;

    auto what   = fmt::format("template '{}'", name);
    auto status = for_each_pair(node, what, [&](std::string const& key, yaml_node_t* value) -> Result<void> {
      if (key == "extend") {
        auto names = string_list(value, fmt::format("{} extend", what));
        if (!names) {
          return std::unexpected(names.error());
        }
        tmpl.extend_ = std::move(*names);
      } else if (key == "url" || key == "shell") {
        auto text = scalar(value, fmt::format("{} {}", what, key));
        if (!text) {
          return std::unexpected(text.error());
        }
        (key == "url" ? tmpl.url_ : tmpl.shell_) = std::move(*text);
      } else if (key == "variables") {
        auto vars = variables(value, fmt::format("{} variables", what));
        if (!vars) {
          return std::unexpected(vars.error());
        }
        tmpl.variables_ = std::move(*vars);
      } else if (key == "environment") {
        auto env = environment(value, fmt::format("{} environment", what));
        if (!env) {
          return std::unexpected(env.error());
        }
        tmpl.environment_ = std::move(*env);
      } else if (key == "commands") {
        auto cmds = commands(value, fmt::format("{} commands", what));
        if (!cmds) {
          return std::unexpected(cmds.error());
        }
        tmpl.commands_ = std::move(*cmds);
      } else {
        core::log::debug("{}: ignoring key '{}' in {}", name_, key, what);
      }
      return {};
    });
    if (!status) {
      return std::unexpected(status.error());
    }
    return tmpl;
  }

  auto garden(std::string const& name, yaml_node_t const* node) const -> Result<Garden> {
    Garden garden;
    garden.name_ = name;

    auto what   = fmt::format("garden '{}'", name);
    auto status = for_each_pair(node, what, [&](std::string const& key, yaml_node_t* value) -> Result<void> {
      if (key == "trees" || key == "groups") {
        auto names = string_list(value, fmt::format("{} {}", what, key));
        if (!names) {
          return std::unexpected(names.error());
        }
        (key == "trees" ? garden.trees_ : garden.groups_) = std::move(*names);
      } else if (key == "variables") {
        auto vars = variables(value, fmt::format("{} variables", what));
        if (!vars) {
          return std::unexpected(vars.error());
        }
        garden.variables_ = std::move(*vars);
      } else if (key == "environment") {
        auto env = environment(value, fmt::format("{} environment", what));
        if (!env) {
          return std::unexpected(env.error());
        }
        garden.environment_ = std::move(*env);
      } else if (key == "commands") {
        auto cmds = commands(value, fmt::format("{} commands", what));
        if (!cmds) {
          return std::unexpected(cmds.error());
        }
        garden.commands_ = std::move(*cmds);
      } else {
        core::log::debug("{}: ignoring key '{}' in {}", name_, key, what);
      }
      return {};
    });
    if (!status) {
      return std::unexpected(status.error());
    }
    return garden;
  }
};

auto read_file(fs::path const& path) -> Result<std::string> {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::unexpected(Error{ErrorKind::ConfigError, fmt::format("cannot read {}", path.string()), path.string()});
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

template<typename List, typename Item>
void replace_or_append(List& list, Item item) {
  if (auto* existing = find_named(list, item.name_)) {
    *existing = std::move(item);
  } else {
    list.push_back(std::move(item));
  }
}

} // namespace

Loader::Loader(core::Environment environment) {
  config_.ambient_ = std::move(environment);
}

auto Loader::add_file(fs::path const& path) -> Result<void> {
  std::error_code ec;
  auto            canonical = fs::weakly_canonical(path, ec);
  if (ec) {
    canonical = fs::absolute(path);
  }

  if (!visited_.insert(canonical).second) {
    core::log::debug("skipping already loaded {}", canonical.string());
    return {};
  }

  auto text = read_file(canonical);
  if (!text) {
    return std::unexpected(text.error());
  }

  if (!has_layer_) {
    config_.config_dir_ = canonical.parent_path();
    has_layer_          = true;
  }
  config_.sources_.push_back(canonical);
  core::log::debug("loading {}", canonical.string());
  return add_document(*text, canonical.parent_path(), canonical.string());
}

auto Loader::add_string(std::string_view text, fs::path const& origin_dir, std::string_view name) -> Result<void> {
  if (!has_layer_) {
    config_.config_dir_ = origin_dir;
    has_layer_          = true;
  }
  return add_document(text, origin_dir, std::string(name));
}

auto Loader::add_document(std::string_view text, fs::path const& origin_dir, std::string const& name)
    -> Result<void> {
  YamlDocument doc;
  if (auto loaded = doc.load(text, name); !loaded) {
    return loaded;
  }

  NodeReader   reader{doc, name};
  yaml_node_t* root = doc.root();
  if (NodeReader::is_null(root)) {
    return {};
  }
  if (root->type != YAML_MAPPING_NODE) {
    return std::unexpected(reader.error(root, "top-level document must be a mapping"));
  }

  // Settings first: includes are layered underneath this document
  std::vector<std::string>   includes;
  std::optional<std::string> root_expr;
  std::optional<std::string> shell;

  auto status = reader.for_each_pair(root, "document", [&](std::string const& key, yaml_node_t* value) -> Result<void> {
    if (key != core::constant::CONFIG_SECTION) {
      return {};
    }
    return reader.for_each_pair(value, key, [&](std::string const& setting, yaml_node_t* node) -> Result<void> {
      if (setting == "includes") {
        auto list = reader.string_list(node, "includes");
        if (!list) {
          return std::unexpected(list.error());
        }
        includes = std::move(*list);
      } else if (setting == "root" || setting == "shell") {
        auto text_value = reader.scalar(node, setting);
        if (!text_value) {
          return std::unexpected(text_value.error());
        }
        (setting == "root" ? root_expr : shell) = std::move(*text_value);
      } else {
        core::log::debug("{}: ignoring setting '{}'", name, setting);
      }
      return {};
    });
  });
  if (!status) {
    return status;
  }

  for (auto const& include : includes) {
    fs::path include_path{include};
    if (include_path.is_relative()) {
      include_path = origin_dir / include_path;
    }
    if (!fs::exists(include_path)) {
      core::log::debug("{}: include {} does not exist", name, include_path.string());
      continue;
    }
    if (auto result = add_file(include_path); !result) {
      return result;
    }
  }

  if (root_expr) {
    config_.root_expr_ = std::move(*root_expr);
  }
  if (shell && !shell->empty()) {
    config_.shell_ = std::move(*shell);
  }

  return reader.for_each_pair(root, "document", [&](std::string const& key, yaml_node_t* value) -> Result<void> {
    if (key == core::constant::CONFIG_SECTION) {
      return {};
    }
    if (key == "variables") {
      auto vars = reader.variables(value, key);
      if (!vars) {
        return std::unexpected(vars.error());
      }
      merge(config_.variables_, *vars);
    } else if (key == "environment") {
      auto env = reader.environment(value, key);
      if (!env) {
        return std::unexpected(env.error());
      }
      merge(config_.environment_, *env);
    } else if (key == "commands") {
      auto cmds = reader.commands(value, key);
      if (!cmds) {
        return std::unexpected(cmds.error());
      }
      merge(config_.commands_, *cmds);
    } else if (key == "trees") {
      return reader.for_each_pair(value, key, [&](std::string const& tree_name, yaml_node_t* node) -> Result<void> {
        auto tree = reader.tree(tree_name, node);
        if (!tree) {
          return std::unexpected(tree.error());
        }
        if (auto* existing = find_named(config_.trees_, tree_name)) {
          merge(*existing, *tree);
        } else {
          config_.trees_.push_back(std::move(*tree));
        }
        return {};
      });
    } else if (key == "groups") {
      return reader.for_each_pair(value, key, [&](std::string const& group_name, yaml_node_t* node) -> Result<void> {
        auto members = reader.string_list(node, fmt::format("group '{}'", group_name));
        if (!members) {
          return std::unexpected(members.error());
        }
        replace_or_append(config_.groups_, Group{group_name, std::move(*members)});
        return {};
      });
    } else if (key == "gardens") {
      return reader.for_each_pair(value, key, [&](std::string const& garden_name, yaml_node_t* node) -> Result<void> {
        auto garden = reader.garden(garden_name, node);
        if (!garden) {
          return std::unexpected(garden.error());
        }
        replace_or_append(config_.gardens_, std::move(*garden));
        return {};
      });
    } else if (key == "templates") {
      return reader.for_each_pair(value, key, [&](std::string const& tmpl_name, yaml_node_t* node) -> Result<void> {
        auto tmpl = reader.template_(tmpl_name, node);
        if (!tmpl) {
          return std::unexpected(tmpl.error());
        }
        replace_or_append(config_.templates_, std::move(*tmpl));
        return {};
      });
    } else {
      core::log::debug("{}: ignoring top-level key '{}'", name, key);
    }
    return {};
  });
}

auto Loader::finish(
    std::optional<std::string> const&                       root_override,
    std::vector<std::pair<std::string, std::string>> const& defines
) -> Result<Configuration> {
  if (root_override) {
    config_.root_expr_ = *root_override;
  }
  for (auto const& [name, value] : defines) {
    config_.define(name, value);
  }
  if (auto result = config_.apply_templates(); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = config_.validate(); !result) {
    return std::unexpected(result.error());
  }
  return std::move(config_);
}

auto search_path(core::Environment const& environment, fs::path const& cwd) -> std::vector<fs::path> {
  std::vector<fs::path> paths;
  paths.push_back(cwd);
  paths.push_back(cwd / "canopy");
  paths.push_back(cwd / "etc" / "canopy");

  if (auto dir = environment.get(core::constant::CONFIG_DIR_VAR); dir && !dir->empty()) {
    paths.emplace_back(*dir);
  }

  if (auto home = environment.get(core::constant::HOME); home && !home->empty()) {
    paths.push_back(fs::path{*home} / ".config" / "canopy");
    paths.push_back(fs::path{*home} / "etc" / "canopy");
  }

  paths.emplace_back("/etc/canopy");
  return paths;
}

auto discover(core::Environment const& environment, fs::path const& cwd) -> Result<fs::path> {
  for (auto const& dir : search_path(environment, cwd)) {
    auto candidate = dir / core::constant::CONFIG_FILE_NAME;
    if (std::error_code ec; fs::is_regular_file(candidate, ec)) {
      core::log::debug("found configuration {}", candidate.string());
      return candidate;
    }
  }
  return std::unexpected(Error{
      ErrorKind::ConfigNotFound, fmt::format("no {} found from {}", core::constant::CONFIG_FILE_NAME, cwd.string())
  });
}

auto load(LoadOptions const& options) -> Result<Configuration> {
  Loader loader{options.environment_};

  auto files = options.config_files_;
  if (files.empty()) {
    auto found = discover(options.environment_, options.cwd_);
    if (!found) {
      return std::unexpected(found.error());
    }
    files.push_back(*found);
  }

  for (auto const& file : files) {
    auto path = file.is_relative() ? options.cwd_ / file : file;
    if (std::error_code ec; !fs::is_regular_file(path, ec)) {
      return std::unexpected(
          Error{ErrorKind::ConfigNotFound, fmt::format("configuration {} does not exist", path.string()), path.string()}
      );
    }
    if (auto result = loader.add_file(path); !result) {
      return std::unexpected(result.error());
    }
  }

  return loader.finish(options.root_override_, options.defines_);
}

} // namespace canopy::config
