#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "canopy/config/model.hpp"
#include "canopy/eval/resolver.hpp"
#include "canopy/eval/scope.hpp"

namespace canopy::query {

using core::Result;

enum struct Namespace {
  Any,
  Trees,   // @name
  Groups,  // %name
  Gardens  // :name
};

struct Term {
  std::string pattern_;
  bool        exclude_   = false;
  Namespace   namespace_ = Namespace::Any;

  // "." selects the tree containing the working directory
  [[nodiscard]] auto is_current_directory() const noexcept -> bool {
    return namespace_ == Namespace::Any && pattern_ == ".";
  }

  auto operator==(Term const&) const -> bool = default;
};

class Query {
  std::vector<Term> terms_;

public:
  Query() = default;
  explicit Query(std::vector<Term> terms)
      : terms_(std::move(terms)) {}

  // Whitespace separates terms; several words are read as one query
  static auto parse(std::string_view text) -> Query;
  static auto parse(std::vector<std::string> const& words) -> Query;

  [[nodiscard]] auto terms() const noexcept -> std::vector<Term> const& {
    return terms_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return terms_.empty();
  }
};

struct SelectOptions {
  // An inclusion term that matches nothing is an UnknownSelector error
  bool                  strict_ = false;
  std::filesystem::path cwd_;
};

// Resolves queries into trees, ordered by declaration and deduplicated.
// Exclusions are applied after every inclusion regardless of position.
class Selector {
  eval::Resolver& resolver_;
  SelectOptions   options_;

  [[nodiscard]] auto config() const noexcept -> config::Configuration const& {
    return resolver_.config();
  }

  auto matches(std::string_view pattern, std::string_view name) const -> bool;

  auto expand_group(config::GroupIndex group, std::vector<std::string>& stack, std::vector<config::TreeIndex>& out) const
      -> Result<void>;
  auto expand_garden(config::GardenIndex garden, std::vector<eval::TreeContext>& out) const -> Result<void>;
  auto current_tree() -> std::optional<config::TreeIndex>;

public:
  Selector(eval::Resolver& resolver, SelectOptions options);

  // Trees matched by one term, with the garden each was reached through
  auto match(Term const& term) -> Result<std::vector<eval::TreeContext>>;

  auto select(Query const& query) -> Result<std::vector<eval::TreeContext>>;
};

} // namespace canopy::query
