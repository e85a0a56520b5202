#include "canopy/query/query.hpp"

#include <algorithm>
#include <iterator>
#include <map>

#include <fmt/format.h>

#include "canopy/core/log.hpp"
#include "canopy/core/string_utils.hpp"
#include "canopy/query/glob.hpp"

namespace canopy::query {

namespace {

auto parse_term(std::string_view word) -> Term {
  Term term;
  if (word.starts_with('!')) {
    term.exclude_ = true;
    word.remove_prefix(1);
  }

  if (!word.empty()) {
    switch (word.front()) {
    case '@':
      term.namespace_ = Namespace::Trees;
      word.remove_prefix(1);
      break;
    case '%':
      term.namespace_ = Namespace::Groups;
      word.remove_prefix(1);
      break;
    case ':':
      term.namespace_ = Namespace::Gardens;
      word.remove_prefix(1);
      break;
    default:
      break;
    }
  }

  term.pattern_ = std::string(word);
  return term;
}

// Whether `dir` is `base` or lies below it
auto is_within(std::filesystem::path const& dir, std::filesystem::path const& base) -> bool {
  auto rel = dir.lexically_relative(base);
  if (rel.empty()) {
    return false;
  }
  auto first = *rel.begin();
  return first != "..";
}

void add_unique(std::vector<eval::TreeContext>& out, eval::TreeContext context) {
  auto seen = std::ranges::any_of(out, [&context](eval::TreeContext const& c) { return c.tree_ == context.tree_; });
  if (!seen) {
    out.push_back(context);
  }
}

} // namespace

auto Query::parse(std::string_view text) -> Query {
  std::vector<Term> terms;
  for (auto const& word : core::split_words(text)) {
    terms.push_back(parse_term(word));
  }
  return Query{std::move(terms)};
}

auto Query::parse(std::vector<std::string> const& words) -> Query {
  std::vector<Term> terms;
  for (auto const& word : words) {
    auto parsed = parse(std::string_view{word});
    terms.insert(terms.end(), parsed.terms().begin(), parsed.terms().end());
  }
  return Query{std::move(terms)};
}

Selector::Selector(eval::Resolver& resolver, SelectOptions options)
    : resolver_(resolver), options_(std::move(options)) {}

auto Selector::matches(std::string_view pattern, std::string_view name) const -> bool {
  if (has_glob_characters(pattern)) {
    return glob_match(pattern, name);
  }
  return pattern == name;
}

auto Selector::expand_group(
    config::GroupIndex              group,
    std::vector<std::string>&       stack,
    std::vector<config::TreeIndex>& out
) const -> Result<void> {
  auto const& g = config().groups_.at(group);

  if (auto it = std::ranges::find(stack, g.name_); it != stack.end()) {
    std::vector<std::string> cycle(it, stack.end());
    cycle.push_back(g.name_);
    return std::unexpected(core::Error::circular_group(std::move(cycle)));
  }

  stack.push_back(g.name_);
  for (auto const& member : g.members_) {
    if (auto nested = config().find_group(member)) {
      if (auto result = expand_group(*nested, stack, out); !result) {
        return result;
      }
      continue;
    }

    bool found = false;
    for (config::TreeIndex i = 0; i < config().trees_.size(); ++i) {
      if (matches(member, config().trees_[i].name_)) {
        found = true;
        if (std::ranges::find(out, i) == out.end()) {
          out.push_back(i);
        }
      }
    }
    if (!found) {
      core::log::debug("group '{}': member '{}' matches no tree", g.name_, member);
    }
  }
  stack.pop_back();
  return {};
}

auto Selector::expand_garden(config::GardenIndex garden, std::vector<eval::TreeContext>& out) const -> Result<void> {
  auto const& g = config().gardens_.at(garden);

  for (auto const& pattern : g.trees_) {
    for (config::TreeIndex i = 0; i < config().trees_.size(); ++i) {
      if (matches(pattern, config().trees_[i].name_)) {
        add_unique(out, eval::TreeContext{i, garden});
      }
    }
  }

  for (auto const& pattern : g.groups_) {
    for (config::GroupIndex i = 0; i < config().groups_.size(); ++i) {
      if (!matches(pattern, config().groups_[i].name_)) {
        continue;
      }
      std::vector<std::string>       stack;
      std::vector<config::TreeIndex> trees;
      if (auto result = expand_group(i, stack, trees); !result) {
        return result;
      }
      for (auto tree : trees) {
        add_unique(out, eval::TreeContext{tree, garden});
      }
    }
  }
  return {};
}

auto Selector::current_tree() -> std::optional<config::TreeIndex> {
  auto cwd = options_.cwd_.lexically_normal();

  std::optional<config::TreeIndex> best;
  size_t                           best_depth = 0;
  for (config::TreeIndex i = 0; i < config().trees_.size(); ++i) {
    auto path = resolver_.tree_path(i);
    if (!path) {
      core::log::debug("tree '{}': {}", config().trees_[i].name_, path.error().describe());
      continue;
    }
    if (!is_within(cwd, *path)) {
      continue;
    }
    // The innermost tree wins when trees are nested
    auto depth = static_cast<size_t>(std::distance(path->begin(), path->end()));
    if (!best || depth > best_depth) {
      best       = i;
      best_depth = depth;
    }
  }
  return best;
}

auto Selector::match(Term const& term) -> Result<std::vector<eval::TreeContext>> {
  std::vector<eval::TreeContext> result;

  if (term.is_current_directory()) {
    if (auto tree = current_tree()) {
      result.push_back(eval::TreeContext{*tree, std::nullopt});
    }
    return result;
  }

  auto wants = [&term](Namespace ns) { return term.namespace_ == Namespace::Any || term.namespace_ == ns; };

  if (wants(Namespace::Trees)) {
    for (config::TreeIndex i = 0; i < config().trees_.size(); ++i) {
      if (matches(term.pattern_, config().trees_[i].name_)) {
        add_unique(result, eval::TreeContext{i, std::nullopt});
      }
    }
  }

  if (wants(Namespace::Groups)) {
    for (config::GroupIndex i = 0; i < config().groups_.size(); ++i) {
      if (!matches(term.pattern_, config().groups_[i].name_)) {
        continue;
      }
      std::vector<std::string>       stack;
      std::vector<config::TreeIndex> trees;
      if (auto expanded = expand_group(i, stack, trees); !expanded) {
        return std::unexpected(expanded.error());
      }
      for (auto tree : trees) {
        add_unique(result, eval::TreeContext{tree, std::nullopt});
      }
    }
  }

  if (wants(Namespace::Gardens)) {
    for (config::GardenIndex i = 0; i < config().gardens_.size(); ++i) {
      if (!matches(term.pattern_, config().gardens_[i].name_)) {
        continue;
      }
      if (auto expanded = expand_garden(i, result); !expanded) {
        return std::unexpected(expanded.error());
      }
    }
  }

  return result;
}

auto Selector::select(Query const& query) -> Result<std::vector<eval::TreeContext>> {
  std::map<config::TreeIndex, eval::TreeContext> included;
  std::set<config::TreeIndex>                    excluded;

  for (auto const& term : query.terms()) {
    if (term.exclude_) {
      continue;
    }
    auto matched = match(term);
    if (!matched) {
      return std::unexpected(matched.error());
    }
    if (matched->empty()) {
      if (options_.strict_) {
        return std::unexpected(core::Error{
            core::ErrorKind::UnknownSelector, fmt::format("'{}' matches no tree", term.pattern_), term.pattern_
        });
      }
      core::log::debug("query term '{}' matches no tree", term.pattern_);
    }
    for (auto const& context : *matched) {
      included.emplace(context.tree_, context);
    }
  }

  for (auto const& term : query.terms()) {
    if (!term.exclude_) {
      continue;
    }
    auto matched = match(term);
    if (!matched) {
      return std::unexpected(matched.error());
    }
    for (auto const& context : *matched) {
      excluded.insert(context.tree_);
    }
  }

  std::vector<eval::TreeContext> result;
  for (auto const& [tree, context] : included) {
    if (!excluded.contains(tree)) {
      result.push_back(context);
    }
  }
  return result;
}

} // namespace canopy::query
