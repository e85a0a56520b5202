#include "canopy/core/error.hpp"

#include <cstring>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace canopy::core {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
  case ErrorKind::UndefinedVariable:
    return "undefined variable";
  case ErrorKind::CircularVariableReference:
    return "circular variable reference";
  case ErrorKind::CircularGroupReference:
    return "circular group reference";
  case ErrorKind::CircularTemplateReference:
    return "circular template reference";
  case ErrorKind::CommandExpressionFailed:
    return "command expression failed";
  case ErrorKind::UnknownSelector:
    return "unknown selector";
  case ErrorKind::UnknownTree:
    return "unknown tree";
  case ErrorKind::NameConflict:
    return "name conflict";
  case ErrorKind::TreeCommandFailed:
    return "tree command failed";
  case ErrorKind::ConfigError:
    return "configuration error";
  case ErrorKind::ConfigNotFound:
    return "configuration not found";
  case ErrorKind::UsageError:
    return "usage error";
  case ErrorKind::SystemError:
    return "system error";
  case ErrorKind::Interrupted:
    return "interrupted";
  }
  return "error";
}

Error::Error(ErrorKind kind, std::string msg, std::string subject, std::string scope)
    : kind_(kind), message_(std::move(msg)), subject_(std::move(subject)), scope_(std::move(scope)) {}

auto Error::kind() const noexcept -> ErrorKind {
  return kind_;
}

auto Error::message() const noexcept -> std::string const& {
  return message_;
}

auto Error::subject() const noexcept -> std::string const& {
  return subject_;
}

auto Error::scope() const noexcept -> std::string const& {
  return scope_;
}

auto Error::describe() const -> std::string {
  std::string out = fmt::format("{}: {}", to_string(kind_), message_);
  if (!scope_.empty()) {
    out += fmt::format(" [in {}]", scope_);
  }
  if (!stderr_.empty()) {
    out += fmt::format("\n{}", stderr_);
  }
  return out;
}

auto Error::undefined_variable(std::string name, std::string scope) -> Error {
  auto msg = fmt::format("'{}' is not defined", name);
  return Error{ErrorKind::UndefinedVariable, std::move(msg), std::move(name), std::move(scope)};
}

auto Error::circular_variable(std::vector<std::string> cycle, std::string scope) -> Error {
  Error error{
      ErrorKind::CircularVariableReference,
      fmt::format("{}", fmt::join(cycle, " -> ")),
      cycle.empty() ? std::string{} : cycle.front(),
      std::move(scope)
  };
  error.cycle_ = std::move(cycle);
  return error;
}

auto Error::circular_group(std::vector<std::string> cycle) -> Error {
  Error error{
      ErrorKind::CircularGroupReference,
      fmt::format("{}", fmt::join(cycle, " -> ")),
      cycle.empty() ? std::string{} : cycle.front()
  };
  error.cycle_ = std::move(cycle);
  return error;
}

auto Error::circular_template(std::vector<std::string> cycle) -> Error {
  Error error{
      ErrorKind::CircularTemplateReference,
      fmt::format("{}", fmt::join(cycle, " -> ")),
      cycle.empty() ? std::string{} : cycle.front()
  };
  error.cycle_ = std::move(cycle);
  return error;
}

auto Error::command_failed(std::string command, int exit_code, std::string stderr_text) -> Error {
  Error error{
      ErrorKind::CommandExpressionFailed,
      fmt::format("'{}' exited with status {}", command, exit_code),
      std::move(command)
  };
  error.exit_code_ = exit_code;
  error.stderr_    = std::move(stderr_text);
  return error;
}

auto Error::system(std::string msg, int errnum) -> Error {
  Error error{ErrorKind::SystemError, fmt::format("{}: {}", msg, std::strerror(errnum))};
  error.exit_code_ = errnum;
  return error;
}

auto exit_code_for(Error const& error) noexcept -> int {
  switch (error.kind()) {
  case ErrorKind::UsageError:
  case ErrorKind::UnknownSelector:
  case ErrorKind::UnknownTree:
    return exit_code::USAGE;
  case ErrorKind::UndefinedVariable:
  case ErrorKind::CircularVariableReference:
  case ErrorKind::CircularGroupReference:
  case ErrorKind::CommandExpressionFailed:
    return exit_code::DATAERR;
  case ErrorKind::ConfigNotFound:
    return exit_code::NOINPUT;
  case ErrorKind::ConfigError:
  case ErrorKind::NameConflict:
  case ErrorKind::CircularTemplateReference:
    return exit_code::CONFIG;
  case ErrorKind::SystemError:
    return exit_code::OSERR;
  case ErrorKind::Interrupted:
    return exit_code::INTERRUPTED;
  case ErrorKind::TreeCommandFailed:
    return error.exit_code_ != 0 ? error.exit_code_ : exit_code::SOFTWARE;
  }
  return exit_code::SOFTWARE;
}

} // namespace canopy::core
