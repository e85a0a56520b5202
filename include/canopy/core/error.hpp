#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace canopy::core {

enum struct ErrorKind {
  UndefinedVariable,
  CircularVariableReference,
  CircularGroupReference,
  CircularTemplateReference,
  CommandExpressionFailed,
  UnknownSelector,
  UnknownTree,
  NameConflict,
  TreeCommandFailed,
  ConfigError,
  ConfigNotFound,
  UsageError,
  SystemError,
  Interrupted
};

auto to_string(ErrorKind kind) noexcept -> std::string_view;

struct Error {
  ErrorKind                kind_;
  std::string              message_;
  std::string              subject_;
  std::string              scope_;
  std::vector<std::string> cycle_;
  int                      exit_code_ = 0;
  std::string              stderr_;

  Error(ErrorKind kind, std::string msg, std::string subject = "", std::string scope = "");

  Error(Error const&)                = default;
  Error& operator=(Error const&)     = default;
  Error(Error&&) noexcept            = default;
  Error& operator=(Error&&) noexcept = default;
  ~Error()                           = default;

  [[nodiscard]] auto kind() const noexcept -> ErrorKind;
  [[nodiscard]] auto message() const noexcept -> std::string const&;
  [[nodiscard]] auto subject() const noexcept -> std::string const&;
  [[nodiscard]] auto scope() const noexcept -> std::string const&;

  // One-line rendering: "<kind>: <message> [in <scope>]"
  [[nodiscard]] auto describe() const -> std::string;

  static auto undefined_variable(std::string name, std::string scope) -> Error;
  static auto circular_variable(std::vector<std::string> cycle, std::string scope) -> Error;
  static auto circular_group(std::vector<std::string> cycle) -> Error;
  static auto circular_template(std::vector<std::string> cycle) -> Error;
  static auto command_failed(std::string command, int exit_code, std::string stderr_text) -> Error;
  static auto system(std::string msg, int errnum) -> Error;
};

template<typename T, typename E = Error>
using Result = std::expected<T, E>;

// sysexits(3) values shared by the CLI and dispatcher
namespace exit_code {

inline constexpr int OK          = 0;
inline constexpr int USAGE       = 64;
inline constexpr int DATAERR     = 65;
inline constexpr int NOINPUT     = 66;
inline constexpr int SOFTWARE    = 70;
inline constexpr int OSERR       = 71;
inline constexpr int CONFIG      = 78;
inline constexpr int INTERRUPTED = 130;

} // namespace exit_code

auto exit_code_for(Error const& error) noexcept -> int;

} // namespace canopy::core
