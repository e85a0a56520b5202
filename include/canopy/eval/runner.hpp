#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "canopy/core/error.hpp"

namespace canopy::eval {

using core::Result;

// Executes the text of "$ ..." expressions. Returns stdout with trailing
// newlines removed, or CommandExpressionFailed.
class ExpressionRunner {
public:
  ExpressionRunner()                                   = default;
  ExpressionRunner(ExpressionRunner const&)            = delete;
  ExpressionRunner& operator=(ExpressionRunner const&) = delete;
  ExpressionRunner(ExpressionRunner&&)                 = delete;
  ExpressionRunner& operator=(ExpressionRunner&&)      = delete;
  virtual ~ExpressionRunner()                          = default;

  virtual auto run(std::string const& command) -> Result<std::string> = 0;
};

// Runs expressions through "<shell> -c <command>"
class ShellRunner : public ExpressionRunner {
  std::string                          shell_;
  std::optional<std::filesystem::path> working_directory_;

public:
  explicit ShellRunner(std::string shell, std::optional<std::filesystem::path> working_directory = std::nullopt);

  auto run(std::string const& command) -> Result<std::string> override;

  [[nodiscard]] auto shell() const noexcept -> std::string const& {
    return shell_;
  }
};

} // namespace canopy::eval
