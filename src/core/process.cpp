#include "canopy/core/process.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include "canopy/core/constants.hpp"
#include "canopy/core/file_descriptor.hpp"
#include "canopy/core/log.hpp"
#include "canopy/core/signal.hpp"
#include "canopy/core/string_utils.hpp"

extern "C" {
  extern char** environ; // NOLINT
}

namespace canopy::core::process {

namespace {

struct Redirects {
  int  stdout_fd_  = -1;
  int  stderr_fd_  = -1;
  bool null_stdin_ = false;
};

auto spawn(Invocation const& invocation, Redirects const& redirects) -> Result<pid_t> {
  if (invocation.argv_.empty()) {
    return std::unexpected(Error{ErrorKind::UsageError, "cannot spawn an empty command"});
  }

  posix_spawn_file_actions_t file_actions;
  posix_spawnattr_t          attr;

  if (int rc = posix_spawn_file_actions_init(&file_actions); rc != 0) {
    return std::unexpected(Error::system("failed to initialize file actions", rc));
  }

  if (int rc = posix_spawnattr_init(&attr); rc != 0) {
    posix_spawn_file_actions_destroy(&file_actions);
    return std::unexpected(Error::system("failed to initialize spawn attributes", rc));
  }

  auto cleanup = [&]() {
    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attr);
  };

  // The child must not inherit our interrupt handlers' ignore state
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  if (int rc = posix_spawnattr_setsigdefault(&attr, &default_signals); rc != 0) {
    cleanup();
    return std::unexpected(Error::system("failed to set default signals", rc));
  }
  if (int rc = posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF); rc != 0) {
    cleanup();
    return std::unexpected(Error::system("failed to set spawn flags", rc));
  }

  if (redirects.null_stdin_) {
    if (int rc = posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0); rc != 0) {
      cleanup();
      return std::unexpected(Error::system("failed to setup stdin redirection", rc));
    }
  }

  if (redirects.stdout_fd_ >= 0) {
    if (int rc = posix_spawn_file_actions_adddup2(&file_actions, redirects.stdout_fd_, STDOUT_FILENO); rc != 0) {
      cleanup();
      return std::unexpected(Error::system("failed to setup stdout redirection", rc));
    }
  }

  if (redirects.stderr_fd_ >= 0) {
    if (int rc = posix_spawn_file_actions_adddup2(&file_actions, redirects.stderr_fd_, STDERR_FILENO); rc != 0) {
      cleanup();
      return std::unexpected(Error::system("failed to setup stderr redirection", rc));
    }
  }

  if (invocation.working_directory_) {
    int rc = posix_spawn_file_actions_addchdir_np(&file_actions, invocation.working_directory_->c_str());
    if (rc != 0) {
      cleanup();
      return std::unexpected(Error::system("failed to setup working directory", rc));
    }
  }

  std::vector<char*> argv;
  argv.reserve(invocation.argv_.size() + 1);
  for (auto const& arg : invocation.argv_) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::optional<EnvBlock> env_block;
  char**                  envp = ::environ;
  if (invocation.environment_) {
    env_block.emplace(*invocation.environment_);
    envp = env_block->data();
  }

  // A child environment with its own PATH decides where argv[0] is found
  std::string program = invocation.argv_.front();
  bool        search  = true;
  if (invocation.environment_ && invocation.environment_->contains("PATH") &&
      program.find('/') == std::string::npos) {
    auto found = find_program(program, *invocation.environment_, invocation.working_directory_);
    if (!found) {
      cleanup();
      return std::unexpected(Error::system(fmt::format("failed to spawn '{}'", program), ENOENT));
    }
    program = std::move(*found);
    search  = false;
  }

  pid_t pid = 0;
  int   rc  = search ? posix_spawnp(&pid, program.c_str(), &file_actions, &attr, argv.data(), envp)
                     : posix_spawn(&pid, program.c_str(), &file_actions, &attr, argv.data(), envp);
  cleanup();

  if (rc != 0) {
    return std::unexpected(Error::system(fmt::format("failed to spawn '{}'", invocation.argv_.front()), rc));
  }

  log::debug("spawned pid {}: {}", pid, invocation.argv_.front());
  return pid;
}

// Drain both pipes until EOF without letting either one fill up.
auto drain(FileDescriptor& out, FileDescriptor& err, std::string& out_text, std::string& err_text) -> Result<void> {
  std::array<char, 4096> buffer{};
  std::array<pollfd, 2>  fds{
      pollfd{out.get(), POLLIN, 0},
      pollfd{err.get(), POLLIN, 0}
  };
  std::array<std::string*, 2> sinks{&out_text, &err_text};

  size_t open_count = 2;
  while (open_count > 0) {
    if (::poll(fds.data(), fds.size(), -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(Error::system("poll failed", errno));
    }

    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (n > 0) {
        sinks[i]->append(buffer.data(), static_cast<size_t>(n));
        continue;
      }
      if (n == -1 && errno == EINTR) {
        continue;
      }
      if (n == -1) {
        return std::unexpected(Error::system("read failed", errno));
      }
      fds[i].fd = -1;
      --open_count;
    }
  }
  return {};
}

} // namespace

auto find_program(
    std::string_view                  name,
    Environment const&                environment,
    std::optional<std::string> const& working_directory
) -> std::optional<std::string> {
  if (name.find('/') != std::string_view::npos) {
    return std::string(name);
  }

  std::string path = environment.get("PATH").value_or("");
  size_t      pos  = 0;
  while (pos <= path.size()) {
    size_t end = path.find(constant::PATH_SEPARATOR, pos);
    if (end == std::string::npos) {
      end = path.size();
    }

    // An empty element means the current directory
    std::filesystem::path dir{end == pos ? std::string(".") : path.substr(pos, end - pos)};
    if (dir.is_relative() && working_directory) {
      dir = std::filesystem::path{*working_directory} / dir;
    }
    auto candidate = dir / name;

    std::error_code ec;
    if (::access(candidate.c_str(), X_OK) == 0 && !std::filesystem::is_directory(candidate, ec)) {
      return candidate.string();
    }
    pos = end + 1;
  }
  return std::nullopt;
}

auto wait_for(pid_t pid) -> Result<ProcessResult> {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return std::unexpected(Error::system(fmt::format("failed to wait for pid {}", pid), errno));
    }
  }

  ProcessResult result;
  result.pid_ = pid;
  if (WIFEXITED(status)) {
    result.exit_status_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signaled_    = true;
    result.signal_      = WTERMSIG(status);
    result.exit_status_ = 128 + result.signal_;
  }
  return result;
}

auto run(Invocation const& invocation) -> Result<ProcessResult> {
  auto pid = spawn(invocation, Redirects{});
  if (!pid) {
    return std::unexpected(pid.error());
  }

  auto& signals = SignalManager::instance();
  signals.set_foreground_process(*pid);
  auto result = wait_for(*pid);
  signals.clear_foreground_process();
  return result;
}

auto capture(Invocation const& invocation) -> Result<CapturedOutput> {
  auto out_pipe = make_pipe();
  if (!out_pipe) {
    return std::unexpected(out_pipe.error());
  }
  auto err_pipe = make_pipe();
  if (!err_pipe) {
    return std::unexpected(err_pipe.error());
  }

  auto& [out_read, out_write] = *out_pipe;
  auto& [err_read, err_write] = *err_pipe;

  auto pid = spawn(
      invocation,
      Redirects{.stdout_fd_ = out_write.get(), .stderr_fd_ = err_write.get(), .null_stdin_ = true}
  );
  out_write.reset();
  err_write.reset();
  if (!pid) {
    return std::unexpected(pid.error());
  }

  auto& signals = SignalManager::instance();
  signals.set_foreground_process(*pid);

  CapturedOutput output;
  auto           drained = drain(out_read, err_read, output.stdout_, output.stderr_);
  auto           waited  = wait_for(*pid);
  signals.clear_foreground_process();

  if (!drained) {
    return std::unexpected(drained.error());
  }
  if (!waited) {
    return std::unexpected(waited.error());
  }
  output.result_ = *waited;
  return output;
}

auto shell_invocation(std::string_view shell, std::string const& script) -> std::vector<std::string> {
  auto argv = split_words(shell);
  if (argv.empty()) {
    argv.emplace_back("sh");
  }
  argv.emplace_back("-c");
  argv.push_back(script);
  return argv;
}

} // namespace canopy::core::process
