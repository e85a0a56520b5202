#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "canopy/eval/resolver.hpp"
#include "test_utils.h"

namespace canopy::eval::test {

using canopy::test::FakeRunner;
using canopy::test::load_yaml;

class ResolverTest : public ::testing::Test {
protected:
  FakeRunner            runner_;
  config::Configuration config_;

  void load(std::string_view yaml, core::Environment env = {}) {
    auto config = load_yaml(yaml, "/workspace", std::move(env));
    ASSERT_TRUE(config.has_value()) << config.error().describe();
    config_ = std::move(*config);
  }

  auto tree_scope(std::string_view tree, std::optional<std::string_view> garden = std::nullopt) -> Scope {
    std::optional<config::GardenIndex> garden_index;
    if (garden) {
      garden_index = config_.find_garden(*garden);
    }
    return Scope::tree(config_, TreeContext{*config_.find_tree(tree), garden_index});
  }
};

TEST_F(ResolverTest, LookupWalksInnermostFirst) {
  load(R"(
variables:
  where: global
  only_global: g
trees:
  app:
    variables:
      where: tree
)");
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.lookup(Scope::global(config_), "where"), "global");
  EXPECT_EQ(resolver.lookup(tree_scope("app"), "where"), "tree");
  EXPECT_EQ(resolver.lookup(tree_scope("app"), "only_global"), "g");
}

TEST_F(ResolverTest, GlobalVariablesEvaluateInTheRequestingScope) {
  load(R"(
variables:
  label: tree-${TREE_NAME}
trees:
  alpha: {}
  beta: {}
)");
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.evaluate(tree_scope("alpha"), "${label}"), "tree-alpha");
  EXPECT_EQ(resolver.evaluate(tree_scope("beta"), "${label}"), "tree-beta");
}

TEST_F(ResolverTest, CommandExpressionsRunOncePerScope) {
  load(R"(
variables:
  version: $ git describe
  banner: v${version}
trees:
  alpha: {}
)");
  runner_.respond("git describe", "1.2.3");
  Resolver resolver{config_, runner_};

  auto global = Scope::global(config_);
  EXPECT_EQ(resolver.lookup(global, "banner"), "v1.2.3");
  EXPECT_EQ(resolver.lookup(global, "version"), "1.2.3");
  EXPECT_EQ(resolver.lookup(global, "version"), "1.2.3");
  EXPECT_EQ(runner_.count("git describe"), 1);

  EXPECT_EQ(resolver.lookup(tree_scope("alpha"), "version"), "1.2.3");
  EXPECT_EQ(runner_.count("git describe"), 2);
  EXPECT_EQ(resolver.lookup(tree_scope("alpha"), "banner"), "v1.2.3");
  EXPECT_EQ(runner_.count("git describe"), 2);
}

TEST_F(ResolverTest, SelfReferenceIsACycle) {
  load("variables: {a: '${a}'}");
  Resolver resolver{config_, runner_};

  auto result = resolver.lookup(Scope::global(config_), "a");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), core::ErrorKind::CircularVariableReference);
  EXPECT_EQ(result.error().cycle_, (std::vector<std::string>{"a", "a"}));
  EXPECT_EQ(result.error().scope(), "global");
}

TEST_F(ResolverTest, MutualReferenceNamesTheFullCycle) {
  load(R"(
variables:
  a: ${b}
  b: x${c}
  c: ${a}
trees:
  app: {}
)");
  Resolver resolver{config_, runner_};

  auto result = resolver.lookup(tree_scope("app"), "a");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), core::ErrorKind::CircularVariableReference);
  EXPECT_EQ(result.error().cycle_, (std::vector<std::string>{"a", "b", "c", "a"}));
  EXPECT_EQ(result.error().scope(), "tree:app");

  // The failed resolution leaves nothing behind
  auto again = resolver.lookup(tree_scope("app"), "b");
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().cycle_, (std::vector<std::string>{"b", "c", "a", "b"}));
}

TEST_F(ResolverTest, LongReferenceChainsDoNotExhaustTheStack) {
  constexpr int length = 20000;
  for (int i = 0; i < length; ++i) {
    config_.variables_.push_back(config::Variable{"v" + std::to_string(i), "${v" + std::to_string(i + 1) + "}"});
  }
  config_.variables_.push_back(config::Variable{"v" + std::to_string(length), "end"});
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.lookup(Scope::global(config_), "v0"), "end");
  EXPECT_EQ(resolver.cache_size(), static_cast<size_t>(length + 1));
}

TEST_F(ResolverTest, LongCycleIsReportedNotOverflowed) {
  constexpr int length = 5000;
  for (int i = 0; i < length; ++i) {
    config_.variables_.push_back(
        config::Variable{"v" + std::to_string(i), "${v" + std::to_string((i + 1) % length) + "}"}
    );
  }
  Resolver resolver{config_, runner_};

  auto result = resolver.lookup(Scope::global(config_), "v0");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), core::ErrorKind::CircularVariableReference);
  EXPECT_EQ(result.error().cycle_.size(), static_cast<size_t>(length + 1));
  EXPECT_EQ(result.error().cycle_.front(), "v0");
  EXPECT_EQ(result.error().cycle_.back(), "v0");
}

TEST_F(ResolverTest, FailedCommandsAreNotRetriedInTheSameScope) {
  load(R"(
variables:
  v: $ boom
  a: ${v}-${v}
  b: ${v}
trees:
  app: {}
)");
  runner_.fail("boom", 2, "no such thing");
  Resolver resolver{config_, runner_};

  auto global = Scope::global(config_);
  auto a      = resolver.lookup(global, "a");
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error().kind(), core::ErrorKind::CommandExpressionFailed);

  auto v = resolver.lookup(global, "v");
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error().kind(), core::ErrorKind::CommandExpressionFailed);
  EXPECT_FALSE(resolver.lookup(global, "b").has_value());
  EXPECT_EQ(runner_.count("boom"), 1);

  // Another scope evaluates the command afresh
  EXPECT_FALSE(resolver.lookup(tree_scope("app"), "v").has_value());
  EXPECT_EQ(runner_.count("boom"), 2);
}

TEST_F(ResolverTest, UndefinedReferenceNamesVariableAndScope) {
  load("trees: {app: {variables: {x: '${nope}'}}}");
  Resolver resolver{config_, runner_};

  auto result = resolver.lookup(tree_scope("app"), "x");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), core::ErrorKind::UndefinedVariable);
  EXPECT_EQ(result.error().subject(), "nope");
  EXPECT_EQ(result.error().scope(), "tree:app");
}

TEST_F(ResolverTest, AmbientEnvironmentIsTheOutermostLayer) {
  core::Environment env;
  env.set("HOME", "/home/user");
  env.set("where", "env");
  load("variables: {where: config}\ntrees: {app: {}}", env);
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.evaluate(tree_scope("app"), "${HOME}/${where}"), "/home/user/config");
  auto missing = resolver.lookup(tree_scope("app"), "missing");
  ASSERT_TRUE(missing.has_value());
  EXPECT_FALSE(missing->has_value());
}

TEST_F(ResolverTest, BuiltinsShadowUserDefinitions) {
  load(R"(
trees:
  app:
    path: src/app
    variables:
      TREE_NAME: other
)");
  Resolver resolver{config_, runner_};

  auto scope = tree_scope("app");
  EXPECT_EQ(resolver.lookup(scope, "TREE_NAME"), "app");
  EXPECT_EQ(resolver.lookup(scope, "TREE_PATH"), "/workspace/src/app");
  EXPECT_EQ(resolver.lookup(scope, "CANOPY_ROOT"), "/workspace");
  EXPECT_EQ(resolver.lookup(scope, "CANOPY_CONFIG_DIR"), "/workspace");
}

TEST_F(ResolverTest, TreePathIsRelativeToRoot) {
  load(R"(
canopy:
  root: ${CANOPY_CONFIG_DIR}/../src
variables:
  base: repos
trees:
  relative: {path: '${base}/${TREE_NAME}'}
  absolute: {path: /srv/absolute/}
  defaulted: {}
)");
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.root(), std::filesystem::path{"/src"});
  EXPECT_EQ(resolver.tree_path(0), std::filesystem::path{"/src/repos/relative"});
  EXPECT_EQ(resolver.tree_path(1), std::filesystem::path{"/srv/absolute"});
  EXPECT_EQ(resolver.tree_path(2), std::filesystem::path{"/src/defaulted"});
}

TEST_F(ResolverTest, RelativeRootIsRelativeToConfigDir) {
  load("canopy: {root: build}\ntrees: {app: {}}");
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.root(), std::filesystem::path{"/workspace/build"});
  EXPECT_EQ(resolver.tree_path(0), std::filesystem::path{"/workspace/build/app"});
}

TEST_F(ResolverTest, RootReferencingItselfIsACycle) {
  load("canopy: {root: '${CANOPY_ROOT}/x'}");
  Resolver resolver{config_, runner_};

  auto result = resolver.root();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), core::ErrorKind::CircularVariableReference);
}

TEST_F(ResolverTest, TreePathCannotDependOnItself) {
  load(R"(
variables:
  where: ${TREE_PATH}
trees:
  app: {path: '${where}'}
)");
  Resolver resolver{config_, runner_};

  // TREE_PATH is not visible while the path itself is being resolved
  auto result = resolver.tree_path(0);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), core::ErrorKind::UndefinedVariable);
  EXPECT_EQ(result.error().subject(), "TREE_PATH");
}

TEST_F(ResolverTest, GardenLayerSitsBetweenTreeAndGlobal) {
  load(R"(
variables:
  stage: none
  level: global
trees:
  api: {}
gardens:
  dev:
    trees: [api]
    variables:
      stage: dev
)");
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.lookup(tree_scope("api"), "stage"), "none");
  EXPECT_EQ(resolver.lookup(tree_scope("api", "dev"), "stage"), "dev");
  EXPECT_EQ(resolver.lookup(tree_scope("api", "dev"), "level"), "global");
  EXPECT_EQ(tree_scope("api", "dev").id(), "garden:dev/tree:api");

  auto garden = Scope::garden(config_, 0);
  EXPECT_EQ(garden.id(), "garden:dev");
  EXPECT_EQ(resolver.lookup(garden, "stage"), "dev");
  EXPECT_EQ(resolver.lookup(garden, "level"), "global");
  auto tree_name = resolver.lookup(garden, "TREE_NAME");
  ASSERT_TRUE(tree_name.has_value());
  EXPECT_FALSE(tree_name->has_value());
}

TEST_F(ResolverTest, ResolveAllListsBuiltinsThenUserVariables) {
  load(R"(
variables:
  a: "1"
  b: ${a}2
trees:
  app:
    variables:
      b: tree
      c: ${b}!
)");
  Resolver resolver{config_, runner_};

  auto all = resolver.resolve_all(tree_scope("app"));
  ASSERT_TRUE(all.has_value()) << all.error().describe();
  VariableMap expected{
      {"CANOPY_CONFIG_DIR", "/workspace"     },
      {"CANOPY_ROOT",       "/workspace"     },
      {"TREE_NAME",         "app"            },
      {"TREE_PATH",         "/workspace/app" },
      {"a",                 "1"              },
      {"b",                 "tree"           },
      {"c",                 "tree!"          },
  };
  EXPECT_EQ(*all, expected);
}

TEST_F(ResolverTest, EnvironmentPrependToInheritedValue) {
  load(R"(
trees:
  tool:
    environment:
      PATH: /opt/tool/bin
)");
  Resolver resolver{config_, runner_};

  core::Environment base;
  base.set("PATH", "/usr/bin");

  auto env = resolver.environment(tree_scope("tool"), base);
  ASSERT_TRUE(env.has_value());
  EXPECT_EQ(env->get("PATH"), "/opt/tool/bin:/usr/bin");
}

TEST_F(ResolverTest, EnvironmentModesApplyGlobalThenGardenThenTree) {
  load(R"(
environment:
  PATH: /global/bin
  FLAGS+: -g
gardens:
  dev:
    trees: [app]
    environment:
      PATH+: /garden/bin
trees:
  app:
    variables:
      prefix: /tree
    environment:
      PATH: ['${prefix}/a', '${prefix}/b']
      FLAGS=: -O2
      NEW+: fresh
)");
  Resolver resolver{config_, runner_};

  core::Environment base;
  base.set("PATH", "/usr/bin");
  base.set("FLAGS", "-Wall");

  auto env = resolver.environment(tree_scope("app", "dev"), base);
  ASSERT_TRUE(env.has_value()) << env.error().describe();
  EXPECT_EQ(env->get("PATH"), "/tree/b:/tree/a:/global/bin:/usr/bin:/garden/bin");
  EXPECT_EQ(env->get("FLAGS"), "-O2");
  EXPECT_EQ(env->get("NEW"), "fresh");
}

TEST_F(ResolverTest, EnvironmentErrorsPropagate) {
  load("trees: {app: {environment: {X: '${undefined}'}}}");
  Resolver resolver{config_, runner_};

  auto env = resolver.environment(tree_scope("app"), {});
  ASSERT_FALSE(env.has_value());
  EXPECT_EQ(env.error().kind(), core::ErrorKind::UndefinedVariable);
}

TEST_F(ResolverTest, InterpolateDoesNotRunCommands) {
  load("trees: {app: {}}");
  Resolver resolver{config_, runner_};

  EXPECT_EQ(resolver.interpolate(tree_scope("app"), "$ echo ${TREE_NAME}"), "$ echo app");
  EXPECT_TRUE(runner_.calls_.empty());
}

} // namespace canopy::eval::test
