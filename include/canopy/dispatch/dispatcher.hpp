#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "canopy/config/model.hpp"
#include "canopy/core/error.hpp"
#include "canopy/core/process.hpp"
#include "canopy/eval/resolver.hpp"
#include "canopy/eval/scope.hpp"

namespace canopy::dispatch {

using core::Result;

enum struct Status {
  Ok,
  Failed,
  Skipped,
  ResolutionFailed,
  Interrupted
};

auto to_string(Status status) noexcept -> std::string_view;

struct TreeResult {
  std::string                tree_;
  std::string                command_;
  Status                     status_    = Status::Ok;
  int                        exit_code_ = 0;
  std::optional<core::Error> error_;
};

struct DispatchOptions {
  bool keep_going_    = false;
  bool breadth_first_ = false;
  bool quiet_         = false;
};

struct Summary {
  std::vector<TreeResult> results_;
  bool                    interrupted_ = false;

  // 0, the first failure's exit code, EX_DATAERR for resolution failures
  // or 130 after an interrupt
  [[nodiscard]] auto exit_code() const noexcept -> int;
};

// Starts one prepared invocation and waits for it; returns the exit status
class Launcher {
public:
  Launcher()                           = default;
  Launcher(Launcher const&)            = delete;
  Launcher& operator=(Launcher const&) = delete;
  Launcher(Launcher&&)                 = delete;
  Launcher& operator=(Launcher&&)      = delete;
  virtual ~Launcher()                  = default;

  virtual auto launch(core::process::Invocation const& invocation) -> Result<int> = 0;
};

class ProcessLauncher : public Launcher {
public:
  auto launch(core::process::Invocation const& invocation) -> Result<int> override;
};

class Dispatcher {
  eval::Resolver& resolver_;
  Launcher&       launcher_;
  DispatchOptions options_;

  // Tree environments by scope id, built once per run
  std::map<std::string, Result<core::Environment>> environments_;

  [[nodiscard]] auto config() const noexcept -> config::Configuration const& {
    return resolver_.config();
  }

  // Tree, then garden, then global; nullptr when no layer defines it
  auto find_command(eval::TreeContext const& context, std::string_view name) const -> config::Command const*;

  // nullopt when the tree has no such command
  auto run_command(eval::TreeContext const& context, std::string const& name, std::vector<std::string> const& args)
      -> std::optional<TreeResult>;

  auto run_argv(eval::TreeContext const& context, std::vector<std::string> const& argv) -> TreeResult;

  struct Prepared {
    std::filesystem::path path_;
    core::Environment     environment_;
  };
  auto prepare(eval::TreeContext const& context, TreeResult& result) -> std::optional<Prepared>;
  auto environment(eval::Scope const& scope) -> Result<core::Environment> const&;

  void header(eval::TreeContext const& context, std::filesystem::path const& path) const;
  auto should_stop(Summary& summary, TreeResult const& result) const -> bool;

public:
  Dispatcher(eval::Resolver& resolver, Launcher& launcher, DispatchOptions options);

  void set_options(DispatchOptions options) noexcept {
    options_ = options;
  }

  // Run named commands over the trees: every command per tree, or every
  // tree per command when breadth_first_ is set
  auto run(
      std::vector<eval::TreeContext> const& trees,
      std::vector<std::string> const&       commands,
      std::vector<std::string> const&       args
  ) -> Summary;

  // Run an argv directly in every tree
  auto exec(std::vector<eval::TreeContext> const& trees, std::vector<std::string> const& argv) -> Summary;
};

} // namespace canopy::dispatch
