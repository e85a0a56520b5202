#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "canopy/core/environment.hpp"
#include "canopy/core/error.hpp"

namespace canopy::core::process {

struct Invocation {
  // argv_[0] is looked up in the PATH of environment_ when it has one,
  // otherwise in ours
  std::vector<std::string>   argv_;
  std::optional<std::string> working_directory_;
  // nullopt inherits the environment of this process
  std::optional<Environment> environment_;
};

struct ProcessResult {
  pid_t pid_         = 0;
  int   exit_status_ = 0;
  bool  signaled_    = false;
  int   signal_      = 0;

  [[nodiscard]] constexpr auto success() const noexcept -> bool {
    return !signaled_ && exit_status_ == 0;
  }
};

struct CapturedOutput {
  ProcessResult result_;
  std::string   stdout_;
  std::string   stderr_;
};

// Run with inherited stdio and wait. The child is registered as the
// foreground process so interrupts can be forwarded to it.
auto run(Invocation const& invocation) -> Result<ProcessResult>;

// Run with stdout and stderr captured, stdin from /dev/null.
auto capture(Invocation const& invocation) -> Result<CapturedOutput>;

// First executable `name` in the environment's PATH. Relative PATH entries
// are taken from `working_directory`.
auto find_program(
    std::string_view                  name,
    Environment const&                environment,
    std::optional<std::string> const& working_directory = std::nullopt
) -> std::optional<std::string>;

auto wait_for(pid_t pid) -> Result<ProcessResult>;

// Shell words such as "bash -e" split into argv, then "-c <script>" appended
auto shell_invocation(std::string_view shell, std::string const& script) -> std::vector<std::string>;

} // namespace canopy::core::process
