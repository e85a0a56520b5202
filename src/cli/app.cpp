#include "canopy/cli/app.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "canopy/config/loader.hpp"
#include "canopy/core/constants.hpp"
#include "canopy/core/log.hpp"
#include "canopy/core/signal.hpp"
#include "canopy/core/string_utils.hpp"
#include "canopy/dispatch/dispatcher.hpp"
#include "canopy/eval/resolver.hpp"
#include "canopy/eval/runner.hpp"
#include "canopy/query/query.hpp"

namespace canopy::cli {

namespace {

namespace fs       = std::filesystem;
namespace constant = core::constant;

constexpr std::string_view SUBCOMMANDS = R"(<subcommand> ...

Subcommands:
  cmd [-b] <query> <command>... [-- <args>...]
  <command> [<query>...] [-- <args>...]
  exec <query> <program> [<args>...]
  eval <expression> [<tree> [<garden>] | <garden>]
  ls [<query>...]
  help)";

auto fail(core::Error const& error) -> int {
  core::log::error("{}", error.describe());
  if (!error.stderr_.empty()) {
    fmt::print(stderr, "{}\n", error.stderr_);
  }
  return core::exit_code_for(error);
}

auto usage(std::string const& message) -> int {
  core::log::error("{}", message);
  fmt::print(stderr, "Try '{} help' for more information.\n", constant::EXE_NAME);
  return core::exit_code::USAGE;
}

// Everything a subcommand needs once the configuration is loaded
struct Session {
  config::Configuration     config_;
  eval::ShellRunner         runner_;
  eval::Resolver            resolver_;
  query::Selector           selector_;
  dispatch::ProcessLauncher launcher_;
  dispatch::Dispatcher      dispatcher_;

  Session(config::Configuration config, query::SelectOptions select, dispatch::DispatchOptions dispatch)
      : config_(std::move(config)),
        runner_(config_.shell_, config_.config_dir_),
        resolver_(config_, runner_),
        selector_(resolver_, std::move(select)),
        dispatcher_(resolver_, launcher_, dispatch) {}

  Session(Session const&)            = delete;
  Session& operator=(Session const&) = delete;
};

auto finish(dispatch::Summary const& summary) -> int {
  if (summary.interrupted_) {
    core::log::warn("interrupted");
  }
  return summary.exit_code();
}

// Any tree, garden or the global layer defines `name`
auto is_known_command(config::Configuration const& config, std::string_view name) -> bool {
  if (config::find_named(config.commands_, name) != nullptr) {
    return true;
  }
  auto defines = [name](auto const& owner) { return config::find_named(owner.commands_, name) != nullptr; };
  return std::ranges::any_of(config.trees_, defines) || std::ranges::any_of(config.gardens_, defines);
}

auto select_trees(Session& session, std::vector<std::string> const& words)
    -> core::Result<std::vector<eval::TreeContext>> {
  auto trees = session.selector_.select(query::Query::parse(words));
  if (trees && trees->empty()) {
    core::log::debug("query '{}' selected no trees", fmt::join(words, " "));
  }
  return trees;
}

auto cmd_command(Session& session, std::vector<std::string> const& rest, dispatch::DispatchOptions options) -> int {
  ArgumentParser parser{"canopy cmd"};
  parser.add_argument("breadth-first", "b").desc("Run each command across all trees before the next command");
  parser.add_argument("keep-going", "k").desc("Continue after a tree fails");

  auto args = parser.parse(rest);
  if (!args) {
    return usage(args.error().message());
  }
  if (args->positional_.size() < 2) {
    return usage("cmd requires a query and at least one command");
  }

  auto trees = select_trees(session, {args->positional_.front()});
  if (!trees) {
    return fail(trees.error());
  }

  options.breadth_first_ = args->has("breadth-first");
  options.keep_going_    = options.keep_going_ || args->has("keep-going");

  std::vector<std::string> commands(args->positional_.begin() + 1, args->positional_.end());
  session.dispatcher_.set_options(options);
  return finish(session.dispatcher_.run(*trees, commands, args->trailing_));
}

auto custom_command(Session& session, std::string const& name, std::vector<std::string> const& rest) -> int {
  if (!is_known_command(session.config_, name)) {
    return usage(fmt::format("unknown command '{}'", name));
  }

  ArgumentParser parser{fmt::format("canopy {}", name)};
  auto           args = parser.parse(rest);
  if (!args) {
    return usage(args.error().message());
  }

  auto words = args->positional_;
  if (words.empty()) {
    words.emplace_back(".");
  }
  auto trees = select_trees(session, words);
  if (!trees) {
    return fail(trees.error());
  }
  return finish(session.dispatcher_.run(*trees, {name}, args->trailing_));
}

auto exec_command(Session& session, std::vector<std::string> rest) -> int {
  if (!rest.empty() && rest.front() == "--") {
    rest.erase(rest.begin());
  }
  if (rest.size() < 2) {
    return usage("exec requires a query and a program");
  }

  auto trees = select_trees(session, {rest.front()});
  if (!trees) {
    return fail(trees.error());
  }
  std::vector<std::string> argv(rest.begin() + 1, rest.end());
  return finish(session.dispatcher_.exec(*trees, argv));
}

auto eval_command(Session& session, std::vector<std::string> const& rest) -> int {
  if (rest.empty() || rest.size() > 3) {
    return usage("eval requires an expression and optionally a tree and a garden");
  }

  auto const& config = session.config_;
  auto        scope  = eval::Scope::global(config);
  if (rest.size() == 2 && !config.find_tree(rest[1])) {
    // A lone garden name evaluates in that garden's scope
    auto garden = config.find_garden(rest[1]);
    if (!garden) {
      return fail(core::Error{
          core::ErrorKind::UnknownTree, fmt::format("unknown tree or garden '{}'", rest[1]), rest[1]
      });
    }
    scope = eval::Scope::garden(config, *garden);
  } else if (rest.size() >= 2) {
    auto tree = config.find_tree(rest[1]);
    if (!tree) {
      return fail(core::Error{core::ErrorKind::UnknownTree, fmt::format("unknown tree '{}'", rest[1]), rest[1]});
    }
    std::optional<config::GardenIndex> garden;
    if (rest.size() == 3) {
      garden = config.find_garden(rest[2]);
      if (!garden) {
        return fail(
            core::Error{core::ErrorKind::UnknownSelector, fmt::format("unknown garden '{}'", rest[2]), rest[2]}
        );
      }
    }
    scope = eval::Scope::tree(config, eval::TreeContext{*tree, garden});
  }

  auto value = session.resolver_.evaluate(scope, rest.front());
  if (!value) {
    return fail(value.error());
  }
  fmt::print("{}\n", *value);
  return core::exit_code::OK;
}

auto ls_command(Session& session, std::vector<std::string> words) -> int {
  if (words.empty()) {
    words.emplace_back("*");
  }
  auto trees = select_trees(session, words);
  if (!trees) {
    return fail(trees.error());
  }

  for (auto const& context : *trees) {
    auto const& tree = session.config_.trees_.at(context.tree_);
    auto        path = session.resolver_.tree_path(context.tree_);
    if (!path) {
      fmt::print("{}\t<{}>\n", tree.name_, path.error().describe());
      continue;
    }
    if (tree.description_) {
      fmt::print("{}\t{}\t{}\n", tree.name_, path->string(), *tree.description_);
    } else {
      fmt::print("{}\t{}\n", tree.name_, path->string());
    }
  }
  return core::exit_code::OK;
}

} // namespace

auto create_default_arg_parser() -> ArgumentParser {
  // clang-format off
  ArgumentParser parser(std::string(constant::EXE_NAME), std::string(constant::EXE_DESC));
  parser.stop_at_positional()
    .usage(std::string(SUBCOMMANDS));

  parser.add_argument("config", "c")
    .nargs(1)
    .multiple()
    .desc("Configuration file, repeat to layer several");
  parser.add_argument("chdir", "C")
    .nargs(1)
    .desc("Change directory before doing anything else");
  parser.add_argument("root", "r")
    .nargs(1)
    .desc("Override the workspace root");
  parser.add_argument("define", "D")
    .nargs(1)
    .multiple()
    .desc("Override a variable: NAME=VALUE");
  parser.add_argument("keep-going", "k")
    .desc("Continue after a tree fails");
  parser.add_argument("strict")
    .desc("Query terms that match nothing are errors");
  parser.add_argument("quiet", "q")
    .desc("Only report warnings and errors");
  parser.add_argument("verbose", "v")
    .desc("Enable debug output");
  parser.add_argument("help", "h")
    .desc("Show help message");
  parser.add_argument("version", "V")
    .desc("Show version message");

  return parser;
  // clang-format on
}

void print_version() {
  fmt::print("{} {} {}\n", constant::EXE_NAME, constant::EXE_DESC, constant::VERSION);
}

auto run(int argc, char const* const* argv) -> int {
  auto parser = create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args) {
    core::log::error("{}", args.error().message());
    fmt::print(stderr, "\n{}", parser.help());
    return core::exit_code::USAGE;
  }

  if (args->has("help")) {
    fmt::print("{}", parser.help());
    return core::exit_code::OK;
  }
  if (args->has("version")) {
    print_version();
    return core::exit_code::OK;
  }

  if (args->has("verbose")) {
    core::log::set_level(core::log::Level::Debug);
  } else if (args->has("quiet")) {
    core::log::set_level(core::log::Level::Warn);
  }

  if (args->positional_.empty()) {
    fmt::print(stderr, "{}", parser.help());
    return core::exit_code::USAGE;
  }

  auto const& subcommand = args->positional_.front();
  if (subcommand == "help") {
    fmt::print("{}", parser.help());
    return core::exit_code::OK;
  }

  if (auto dir = args->get("chdir")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      return fail(core::Error::system(fmt::format("cannot change directory to {}", *dir), ec.value()));
    }
  }

  std::error_code ec;
  auto            cwd = fs::current_path(ec);
  if (ec) {
    return fail(core::Error::system("cannot determine the current directory", ec.value()));
  }

  config::LoadOptions load_options;
  load_options.environment_   = core::Environment::capture();
  load_options.cwd_           = cwd;
  load_options.root_override_ = args->get("root");
  for (auto const& file : args->get_all("config")) {
    load_options.config_files_.emplace_back(file);
  }
  for (auto const& define : args->get_all("define")) {
    std::string name;
    std::string value;
    if (!core::split_assignment(define, name, value) || !core::is_valid_variable_name(name)) {
      return usage(fmt::format("invalid definition '{}', expected NAME=VALUE", define));
    }
    load_options.defines_.emplace_back(std::move(name), std::move(value));
  }

  auto config = config::load(load_options);
  if (!config) {
    return fail(config.error());
  }

  auto& signals = core::SignalManager::instance();
  if (auto installed = signals.install_handlers(); !installed) {
    return fail(installed.error());
  }

  query::SelectOptions select_options;
  select_options.strict_ = args->has("strict");
  select_options.cwd_    = cwd;

  dispatch::DispatchOptions dispatch_options;
  dispatch_options.keep_going_ = args->has("keep-going");
  dispatch_options.quiet_      = args->has("quiet");

  Session session{std::move(*config), std::move(select_options), dispatch_options};

  std::vector<std::string> rest(args->positional_.begin() + 1, args->positional_.end());

  int status = core::exit_code::OK;
  if (subcommand == "cmd") {
    status = cmd_command(session, rest, dispatch_options);
  } else if (subcommand == "exec") {
    status = exec_command(session, std::move(rest));
  } else if (subcommand == "eval") {
    status = eval_command(session, rest);
  } else if (subcommand == "ls") {
    status = ls_command(session, std::move(rest));
  } else {
    status = custom_command(session, subcommand, rest);
  }

  if (auto reset = signals.reset_handlers(); !reset) {
    core::log::warn("{}", reset.error().describe());
  }
  return status;
}

} // namespace canopy::cli
