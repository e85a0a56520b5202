#include "canopy/core/signal.hpp"

#include <cerrno>
#include <csignal>

#include <unistd.h>

namespace canopy::core {

void SignalManager::handle_interrupt(int sig, siginfo_t* info, void*) {
  interrupted_ = true;

  pid_t fg_pid = foreground_pid_.load();
  if (fg_pid <= 0 || info == nullptr) {
    return;
  }
  // si_pid is 0 for tty-generated signals
  if (info->si_code == SI_USER && info->si_pid != 0) {
    kill(fg_pid, sig);
  }
}

auto SignalManager::install_handlers() -> Result<void> {
  struct sigaction sa = {};
  sa.sa_flags         = SA_RESTART | SA_SIGINFO;
  sa.sa_sigaction     = handle_interrupt;
  sigemptyset(&sa.sa_mask);

  if (sigaction(SIGINT, &sa, nullptr) == -1) {
    return std::unexpected(Error::system("failed to install SIGINT handler", errno));
  }
  if (sigaction(SIGTERM, &sa, nullptr) == -1) {
    return std::unexpected(Error::system("failed to install SIGTERM handler", errno));
  }
  return {};
}

auto SignalManager::reset_handlers() -> Result<void> {
  struct sigaction sa = {};
  sa.sa_handler       = SIG_DFL;
  sigemptyset(&sa.sa_mask);

  if (sigaction(SIGINT, &sa, nullptr) == -1) {
    return std::unexpected(Error::system("failed to reset SIGINT handler", errno));
  }
  if (sigaction(SIGTERM, &sa, nullptr) == -1) {
    return std::unexpected(Error::system("failed to reset SIGTERM handler", errno));
  }
  return {};
}

void SignalManager::set_foreground_process(pid_t pid) noexcept {
  foreground_pid_.store(pid);
}

void SignalManager::clear_foreground_process() noexcept {
  foreground_pid_.store(0);
}

auto SignalManager::get_foreground_process() const noexcept -> pid_t {
  return foreground_pid_.load();
}

auto SignalManager::interrupted() const noexcept -> bool {
  return interrupted_.load();
}

void SignalManager::raise_interrupt() noexcept {
  interrupted_.store(true);
}

void SignalManager::clear_interrupt() noexcept {
  interrupted_.store(false);
}

} // namespace canopy::core
