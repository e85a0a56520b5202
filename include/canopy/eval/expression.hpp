#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "canopy/eval/runner.hpp"

namespace canopy::eval {

enum struct ExpressionKind {
  Literal,
  Interpolation,
  Command
};

// "$ " prefix marks a command expression
auto classify(std::string_view expr) noexcept -> ExpressionKind;

// Distinct ${name} references in first-use order, command prefix included
auto references(std::string_view expr) -> std::vector<std::string>;

// Resolves one name. nullopt means the name is not defined anywhere in the
// scope; errors are reserved for failures while resolving a defined name.
using Lookup = std::function<Result<std::optional<std::string>>(std::string const& name)>;

class Evaluator {
  ExpressionRunner& runner_;

public:
  explicit Evaluator(ExpressionRunner& runner)
      : runner_(runner) {}

  // Replace ${name} references and unescape $$. `scope` only labels errors.
  auto interpolate(std::string_view text, Lookup const& lookup, std::string_view scope = "") const
      -> Result<std::string>;

  auto evaluate(std::string_view expr, Lookup const& lookup, std::string_view scope = "") const
      -> Result<std::string>;
};

} // namespace canopy::eval
