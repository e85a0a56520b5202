#include "canopy/dispatch/dispatcher.hpp"

#include <filesystem>

#include <fmt/format.h>

#include "canopy/core/log.hpp"
#include "canopy/core/signal.hpp"

namespace canopy::dispatch {

namespace fs = std::filesystem;

auto to_string(Status status) noexcept -> std::string_view {
  switch (status) {
  case Status::Ok:
    return "ok";
  case Status::Failed:
    return "failed";
  case Status::Skipped:
    return "skipped";
  case Status::ResolutionFailed:
    return "resolution failed";
  case Status::Interrupted:
    return "interrupted";
  }
  return "unknown";
}

auto Summary::exit_code() const noexcept -> int {
  for (auto const& result : results_) {
    switch (result.status_) {
    case Status::Failed:
      return result.exit_code_ != 0 ? result.exit_code_ : core::exit_code::SOFTWARE;
    case Status::ResolutionFailed:
      return core::exit_code::DATAERR;
    case Status::Interrupted:
      return core::exit_code::INTERRUPTED;
    case Status::Ok:
    case Status::Skipped:
      break;
    }
  }
  return interrupted_ ? core::exit_code::INTERRUPTED : core::exit_code::OK;
}

auto ProcessLauncher::launch(core::process::Invocation const& invocation) -> Result<int> {
  auto result = core::process::run(invocation);
  if (!result) {
    return std::unexpected(result.error());
  }
  return result->exit_status_;
}

Dispatcher::Dispatcher(eval::Resolver& resolver, Launcher& launcher, DispatchOptions options)
    : resolver_(resolver), launcher_(launcher), options_(options) {}

auto Dispatcher::find_command(eval::TreeContext const& context, std::string_view name) const
    -> config::Command const* {
  auto const& tree = config().trees_.at(context.tree_);
  if (auto const* command = config::find_named(tree.commands_, name)) {
    return command;
  }
  if (context.garden_) {
    auto const& garden = config().gardens_.at(*context.garden_);
    if (auto const* command = config::find_named(garden.commands_, name)) {
      return command;
    }
  }
  return config::find_named(config().commands_, name);
}

void Dispatcher::header(eval::TreeContext const& context, fs::path const& path) const {
  if (options_.quiet_) {
    return;
  }
  fmt::print(stderr, "# {}  {}\n", config().trees_.at(context.tree_).name_, path.string());
}

auto Dispatcher::prepare(eval::TreeContext const& context, TreeResult& result) -> std::optional<Prepared> {
  auto path = resolver_.tree_path(context.tree_);
  if (!path) {
    result.status_ = Status::ResolutionFailed;
    result.error_  = path.error();
    return std::nullopt;
  }

  if (std::error_code ec; !fs::is_directory(*path, ec)) {
    core::log::info("{}: skipping missing tree at {}", result.tree_, path->string());
    result.status_ = Status::Skipped;
    return std::nullopt;
  }

  auto const& environment = this->environment(eval::Scope::tree(config(), context));
  if (!environment) {
    result.status_ = Status::ResolutionFailed;
    result.error_  = environment.error();
    return std::nullopt;
  }

  return Prepared{*path, *environment};
}

auto Dispatcher::environment(eval::Scope const& scope) -> Result<core::Environment> const& {
  if (auto it = environments_.find(scope.id()); it != environments_.end()) {
    return it->second;
  }
  return environments_.emplace(scope.id(), resolver_.environment(scope, config().ambient_)).first->second;
}

auto Dispatcher::run_command(
    eval::TreeContext const&        context,
    std::string const&              name,
    std::vector<std::string> const& args
) -> std::optional<TreeResult> {
  config::Command const* command = find_command(context, name);
  if (command == nullptr) {
    return std::nullopt;
  }

  TreeResult result;
  result.tree_    = config().trees_.at(context.tree_).name_;
  result.command_ = name;

  auto prepared = prepare(context, result);
  if (!prepared) {
    return result;
  }

  auto scope = eval::Scope::tree(config(), context);

  // Resolve every line before running any of them
  std::vector<std::string> scripts;
  for (auto const& line : command->lines_) {
    auto script = resolver_.interpolate(scope, line);
    if (!script) {
      result.status_ = Status::ResolutionFailed;
      result.error_  = script.error();
      return result;
    }
    scripts.push_back(std::move(*script));
  }

  header(context, prepared->path_);

  auto const& shell = config().tree_shell(context.tree_);
  for (auto const& script : scripts) {
    core::process::Invocation invocation;
    invocation.argv_ = core::process::shell_invocation(shell, script);
    invocation.argv_.push_back(name);
    invocation.argv_.insert(invocation.argv_.end(), args.begin(), args.end());
    invocation.working_directory_ = prepared->path_.string();
    invocation.environment_       = prepared->environment_;

    auto status = launcher_.launch(invocation);
    if (!status) {
      result.status_    = Status::Failed;
      result.exit_code_ = core::exit_code_for(status.error());
      result.error_     = status.error();
      return result;
    }

    if (core::SignalManager::instance().interrupted()) {
      result.status_    = Status::Interrupted;
      result.exit_code_ = *status;
      return result;
    }

    if (*status != 0) {
      result.status_    = Status::Failed;
      result.exit_code_ = *status;
      result.error_     = core::Error{
          core::ErrorKind::TreeCommandFailed,
          fmt::format("'{}' exited with status {}", name, *status),
          result.tree_,
          eval::Scope::tree(config(), context).id()
      };
      return result;
    }
  }
  return result;
}

auto Dispatcher::run_argv(eval::TreeContext const& context, std::vector<std::string> const& argv) -> TreeResult {
  TreeResult result;
  result.tree_    = config().trees_.at(context.tree_).name_;
  result.command_ = argv.empty() ? std::string{} : argv.front();

  auto prepared = prepare(context, result);
  if (!prepared) {
    return result;
  }

  auto                      scope = eval::Scope::tree(config(), context);
  core::process::Invocation invocation;
  for (auto const& word : argv) {
    auto arg = resolver_.interpolate(scope, word);
    if (!arg) {
      result.status_ = Status::ResolutionFailed;
      result.error_  = arg.error();
      return result;
    }
    invocation.argv_.push_back(std::move(*arg));
  }
  invocation.working_directory_ = prepared->path_.string();
  invocation.environment_       = std::move(prepared->environment_);

  header(context, prepared->path_);

  auto status = launcher_.launch(invocation);
  if (!status) {
    result.status_    = Status::Failed;
    result.exit_code_ = core::exit_code_for(status.error());
    result.error_     = status.error();
    return result;
  }
  if (core::SignalManager::instance().interrupted()) {
    result.status_    = Status::Interrupted;
    result.exit_code_ = *status;
  } else if (*status != 0) {
    result.status_    = Status::Failed;
    result.exit_code_ = *status;
    result.error_     = core::Error{
        core::ErrorKind::TreeCommandFailed,
        fmt::format("'{}' exited with status {}", result.command_, *status),
        result.tree_,
        scope.id()
    };
  }
  return result;
}

auto Dispatcher::should_stop(Summary& summary, TreeResult const& result) const -> bool {
  switch (result.status_) {
  case Status::Interrupted:
    summary.interrupted_ = true;
    return true;
  case Status::Failed:
  case Status::ResolutionFailed:
    if (result.error_) {
      core::log::error("{}: {}", result.tree_, result.error_->describe());
    }
    return !options_.keep_going_;
  case Status::Ok:
  case Status::Skipped:
    break;
  }
  return false;
}

auto Dispatcher::run(
    std::vector<eval::TreeContext> const& trees,
    std::vector<std::string> const&       commands,
    std::vector<std::string> const&       args
) -> Summary {
  Summary summary;
  auto&   signals = core::SignalManager::instance();

  // Returns false once dispatch has to stop
  auto step = [&](eval::TreeContext const& context, std::string const& command) {
    if (signals.interrupted()) {
      summary.interrupted_ = true;
      return false;
    }
    auto result = run_command(context, command, args);
    if (!result) {
      core::log::debug("{}: no command '{}'", config().trees_.at(context.tree_).name_, command);
      return true;
    }
    summary.results_.push_back(std::move(*result));
    return !should_stop(summary, summary.results_.back());
  };

  if (options_.breadth_first_) {
    for (auto const& command : commands) {
      for (auto const& context : trees) {
        if (!step(context, command)) {
          return summary;
        }
      }
    }
  } else {
    for (auto const& context : trees) {
      for (auto const& command : commands) {
        if (!step(context, command)) {
          return summary;
        }
      }
    }
  }
  return summary;
}

auto Dispatcher::exec(std::vector<eval::TreeContext> const& trees, std::vector<std::string> const& argv) -> Summary {
  Summary summary;
  auto&   signals = core::SignalManager::instance();

  for (auto const& context : trees) {
    if (signals.interrupted()) {
      summary.interrupted_ = true;
      break;
    }
    summary.results_.push_back(run_argv(context, argv));
    if (should_stop(summary, summary.results_.back())) {
      break;
    }
  }
  return summary;
}

} // namespace canopy::dispatch
