#include "canopy/eval/runner.hpp"

#include "canopy/core/log.hpp"
#include "canopy/core/process.hpp"
#include "canopy/core/string_utils.hpp"

namespace canopy::eval {

ShellRunner::ShellRunner(std::string shell, std::optional<std::filesystem::path> working_directory)
    : shell_(std::move(shell)), working_directory_(std::move(working_directory)) {}

auto ShellRunner::run(std::string const& command) -> Result<std::string> {
  core::process::Invocation invocation;
  invocation.argv_ = core::process::shell_invocation(shell_, command);
  if (working_directory_) {
    invocation.working_directory_ = working_directory_->string();
  }

  core::log::debug("$ {}", command);
  auto output = core::process::capture(invocation);
  if (!output) {
    return std::unexpected(output.error());
  }

  if (!output->result_.success()) {
    return std::unexpected(core::Error::command_failed(
        command, output->result_.exit_status_, core::trim_trailing_newlines(output->stderr_)
    ));
  }
  return core::trim_trailing_newlines(output->stdout_);
}

} // namespace canopy::eval
