#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "canopy/config/model.hpp"
#include "test_utils.h"

namespace canopy::config::test {

using canopy::test::load_yaml;

TEST(ModelTest, TemplatesApplyBeforeTreeEntries) {
  auto config = load_yaml(R"(
templates:
  base:
    shell: bash
    variables:
      flags: -O2
      mode: debug
    commands:
      build: make ${flags}
  python:
    extend: base
    url: https://example.com/default.git
    environment:
      PYTHONPATH: ${TREE_PATH}
trees:
  app:
    templates: python
    variables:
      mode: release
    commands:
      test: pytest
)");
  ASSERT_TRUE(config.has_value()) << config.error().describe();

  auto const& app = config->trees_.at(0);
  EXPECT_EQ(app.url_, "https://example.com/default.git");
  EXPECT_EQ(app.shell_, "bash");
  EXPECT_EQ(app.variables_, (VariableList{{"flags", "-O2"}, {"mode", "release"}}));
  EXPECT_EQ(app.commands_, (CommandList{{"build", {"make ${flags}"}}, {"test", {"pytest"}}}));
  EXPECT_EQ(app.environment_, (EnvironmentList{{"PYTHONPATH", EnvMode::Prepend, {"${TREE_PATH}"}}}));
  EXPECT_EQ(config->tree_shell(0), "bash");
}

TEST(ModelTest, TreeShellFallsBackToWorkspaceShell) {
  auto config = load_yaml(R"(
canopy: {shell: zsh}
trees: {app: {}}
)");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->tree_shell(0), "zsh");
}

TEST(ModelTest, CircularTemplateExtend) {
  auto config = load_yaml(R"(
templates:
  a: {extend: b}
  b: {extend: c}
  c: {extend: a}
trees:
  app: {templates: [a]}
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().kind(), core::ErrorKind::CircularTemplateReference);
  EXPECT_EQ(config.error().cycle_, (std::vector<std::string>{"a", "b", "c", "a"}));
}

TEST(ModelTest, UnknownTemplate) {
  auto config = load_yaml("trees: {app: {templates: nope}}");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().kind(), core::ErrorKind::ConfigError);
  EXPECT_EQ(config.error().subject(), "nope");
}

TEST(ModelTest, GardenNameMayNotShadowGroup) {
  auto config = load_yaml(R"(
trees: {api: {}}
groups: {backend: [api]}
gardens: {backend: {trees: [api]}}
)");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().kind(), core::ErrorKind::NameConflict);
  EXPECT_EQ(config.error().subject(), "backend");
}

TEST(ModelTest, EnvironmentEntriesMergeByNameAndMode) {
  EnvironmentList into{
      {"PATH", EnvMode::Prepend, {"/a"}},
      {"PATH", EnvMode::Append,  {"/z"}},
  };
  merge(into, EnvironmentList{{"PATH", EnvMode::Prepend, {"/b"}}, {"HOME", EnvMode::Set, {"/h"}}});

  EXPECT_EQ(
      into,
      (EnvironmentList{
          {"PATH", EnvMode::Prepend, {"/b"}},
          {"PATH", EnvMode::Append,  {"/z"}},
          {"HOME", EnvMode::Set,     {"/h"}},
  })
  );
}

TEST(ModelTest, DefineOverridesGlobalVariable) {
  Configuration config;
  config.variables_ = {{"prefix", "/usr"}};
  config.define("prefix", "/opt");
  config.define("other", "x");
  EXPECT_EQ(config.variables_, (VariableList{{"prefix", "/opt"}, {"other", "x"}}));
}

TEST(ModelTest, FindByName) {
  auto config = load_yaml(R"(
trees: {alpha: {}, beta: {}}
groups: {both: [alpha, beta]}
gardens: {dev: {trees: [alpha]}}
)");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->find_tree("beta"), 1);
  EXPECT_FALSE(config->find_tree("both").has_value());
  EXPECT_EQ(config->find_group("both"), 0);
  EXPECT_EQ(config->find_garden("dev"), 0);
  EXPECT_EQ(config->find_template("none"), nullptr);
}

TEST(ModelTest, BuiltinNames) {
  EXPECT_TRUE(is_builtin_variable("TREE_NAME"));
  EXPECT_TRUE(is_builtin_variable("TREE_PATH"));
  EXPECT_TRUE(is_builtin_variable("CANOPY_ROOT"));
  EXPECT_TRUE(is_builtin_variable("CANOPY_CONFIG_DIR"));
  EXPECT_FALSE(is_builtin_variable("tree_name"));
}

} // namespace canopy::config::test
