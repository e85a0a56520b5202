#pragma once

#include <atomic>
#include <csignal>

#include <sys/types.h>

#include "canopy/core/error.hpp"

namespace canopy::core {

// SIGINT/SIGTERM bookkeeping for the dispatcher. The handler records the
// interrupt and forwards signals sent by another process (kill) to the child
// currently running in the foreground. Terminal-generated signals already
// reach the child through the shared process group.
class SignalManager {
  static inline std::atomic<pid_t> foreground_pid_{0};
  static inline std::atomic<bool>  interrupted_{false};

  static void handle_interrupt(int sig, siginfo_t* info, void* context);

  SignalManager()  = default;
  ~SignalManager() = default;

public:
  SignalManager(SignalManager const&)            = delete;
  SignalManager& operator=(SignalManager const&) = delete;
  SignalManager(SignalManager&&)                 = delete;
  SignalManager& operator=(SignalManager&&)      = delete;

  auto install_handlers() -> Result<void>;
  auto reset_handlers() -> Result<void>;

  void set_foreground_process(pid_t pid) noexcept;
  void clear_foreground_process() noexcept;
  auto get_foreground_process() const noexcept -> pid_t;

  auto interrupted() const noexcept -> bool;
  void raise_interrupt() noexcept;
  void clear_interrupt() noexcept;

  static SignalManager& instance() {
    static SignalManager instance;
    return instance;
  }
};

} // namespace canopy::core
