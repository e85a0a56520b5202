#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "canopy/config/model.hpp"

namespace canopy::config {

struct LoadOptions {
  // Layered in order; empty means search for canopy.yaml
  std::vector<std::filesystem::path>               config_files_;
  std::optional<std::string>                       root_override_;
  std::vector<std::pair<std::string, std::string>> defines_;
  core::Environment                                environment_;
  std::filesystem::path                            cwd_;
};

// Builds a Configuration from one or more YAML layers.
class Loader {
  Configuration                   config_;
  std::set<std::filesystem::path> visited_;
  bool                            has_layer_ = false;

public:
  explicit Loader(core::Environment environment = {});

  auto add_file(std::filesystem::path const& path) -> Result<void>;
  auto add_string(std::string_view text, std::filesystem::path const& origin_dir, std::string_view name = "<string>")
      -> Result<void>;

  // Apply overrides and templates, validate, and hand over the model
  auto finish(
      std::optional<std::string> const&                       root_override = std::nullopt,
      std::vector<std::pair<std::string, std::string>> const& defines       = {}
  ) -> Result<Configuration>;

private:
  auto add_document(std::string_view text, std::filesystem::path const& origin_dir, std::string const& name)
      -> Result<void>;
};

// Candidate directories searched for canopy.yaml, in priority order
auto search_path(core::Environment const& environment, std::filesystem::path const& cwd)
    -> std::vector<std::filesystem::path>;

auto discover(core::Environment const& environment, std::filesystem::path const& cwd)
    -> Result<std::filesystem::path>;

auto load(LoadOptions const& options) -> Result<Configuration>;

} // namespace canopy::config
