#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "canopy/cli/app.hpp"
#include "canopy/cli/arg_parser.hpp"
#include "test_utils.h"

namespace canopy::cli::test {

using Args = std::vector<std::string>;

class ArgumentParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    parser_ = std::make_unique<ArgumentParser>("test", "Test parser");
  }

  void TearDown() override {
    parser_.reset();
  }

  std::unique_ptr<ArgumentParser> parser_;
};

TEST_F(ArgumentParserTest, FlagOption) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");
  parser_->add_argument("help", "h").desc("Show help");

  auto argv   = std::array<char const*, 3>{"test", "--verbose", "-h"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("verbose"));
  EXPECT_TRUE(result->has("help"));
  EXPECT_EQ(result->get("verbose"), "true");
}

TEST_F(ArgumentParserTest, CombinedShortFlags) {
  parser_->add_argument("keep-going", "k");
  parser_->add_argument("quiet", "q");

  auto result = parser_->parse(Args{"-kq"});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("keep-going"));
  EXPECT_TRUE(result->has("quiet"));
}

TEST_F(ArgumentParserTest, OptionValues) {
  parser_->add_argument("root", "r").nargs(1);
  parser_->add_argument("jobs", "j").nargs(1);

  auto result = parser_->parse(Args{"--root=/srv", "-j", "8"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get("root"), "/srv");
  EXPECT_EQ(result->get<int>("jobs"), 8);
}

TEST_F(ArgumentParserTest, AttachedShortValue) {
  parser_->add_argument("define", "D").nargs(1).multiple();

  auto result = parser_->parse(Args{"-Dprefix=/opt", "-D", "mode=-O2"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get_all("define"), (Args{"prefix=/opt", "mode=-O2"}));
}

TEST_F(ArgumentParserTest, RepeatedOptionReplacesUnlessMultiple) {
  parser_->add_argument("root", "r").nargs(1);
  parser_->add_argument("config", "c").nargs(1).multiple();

  auto result = parser_->parse(Args{"-r", "a", "-r", "b", "-c", "x.yaml", "--config", "y.yaml"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get_all("root"), (Args{"b"}));
  EXPECT_EQ(result->get_all("config"), (Args{"x.yaml", "y.yaml"}));
}

TEST_F(ArgumentParserTest, DefaultValue) {
  parser_->add_argument("shell").nargs(1).default_value("sh");

  auto defaulted = parser_->parse(Args{});
  ASSERT_TRUE(defaulted.has_value());
  EXPECT_EQ(defaulted->get("shell"), "sh");

  auto given = parser_->parse(Args{"--shell", "bash"});
  ASSERT_TRUE(given.has_value());
  EXPECT_EQ(given->get("shell"), "bash");
}

TEST_F(ArgumentParserTest, MissingValueIsAnError) {
  parser_->add_argument("root", "r").nargs(1);

  auto result = parser_->parse(Args{"--root"});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), core::ErrorKind::UsageError);
}

TEST_F(ArgumentParserTest, UnknownOptionIsAnError) {
  auto long_opt = parser_->parse(Args{"--nope"});
  ASSERT_FALSE(long_opt.has_value());
  EXPECT_NE(long_opt.error().message().find("--nope"), std::string::npos);

  auto short_opt = parser_->parse(Args{"-x"});
  ASSERT_FALSE(short_opt.has_value());
}

TEST_F(ArgumentParserTest, FlagRejectsValue) {
  parser_->add_argument("quiet", "q");
  auto result = parser_->parse(Args{"--quiet=yes"});
  ASSERT_FALSE(result.has_value());
}

TEST_F(ArgumentParserTest, DoubleDashCollectsTrailingArguments) {
  parser_->add_argument("breadth-first", "b");

  auto result = parser_->parse(Args{"-b", "* !beta", "build", "--", "-j4", "--verbose"});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("breadth-first"));
  EXPECT_EQ(result->positional_, (Args{"* !beta", "build"}));
  EXPECT_EQ(result->trailing_, (Args{"-j4", "--verbose"}));
}

TEST_F(ArgumentParserTest, StopAtPositionalLeavesSubcommandUntouched) {
  parser_->add_argument("verbose", "v");
  parser_->add_argument("config", "c").nargs(1);
  parser_->stop_at_positional();

  auto result = parser_->parse(Args{"-v", "-c", "a.yaml", "exec", "*", "ls", "-la"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get("config"), "a.yaml");
  EXPECT_EQ(result->positional_, (Args{"exec", "*", "ls", "-la"}));
}

TEST_F(ArgumentParserTest, HelpListsOptions) {
  parser_->add_argument("config", "c").nargs(1).desc("Configuration file");
  parser_->usage("<subcommand>");

  auto help = parser_->help();
  EXPECT_NE(help.find("Usage: test [OPTIONS] <subcommand>"), std::string::npos);
  EXPECT_NE(help.find("-c, --config <value>"), std::string::npos);
  EXPECT_NE(help.find("Configuration file"), std::string::npos);
}

TEST(DefaultArgParserTest, GlobalOptions) {
  auto parser = create_default_arg_parser();
  auto result = parser.parse(Args{"-c", "one.yaml", "-c", "two.yaml", "-D", "x=1", "--strict", "-k", "build", "app"});

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get_all("config"), (Args{"one.yaml", "two.yaml"}));
  EXPECT_EQ(result->get_all("define"), (Args{"x=1"}));
  EXPECT_TRUE(result->has("strict"));
  EXPECT_TRUE(result->has("keep-going"));
  EXPECT_EQ(result->positional_, (Args{"build", "app"}));
}

TEST(RunTest, HelpAndVersionExitCleanly) {
  auto help = std::array<char const*, 2>{"canopy", "--help"};
  EXPECT_EQ(run(static_cast<int>(help.size()), help.data()), 0);

  auto version = std::array<char const*, 2>{"canopy", "-V"};
  EXPECT_EQ(run(static_cast<int>(version.size()), version.data()), 0);
}

TEST(RunTest, UsageErrors) {
  auto none = std::array<char const*, 1>{"canopy"};
  EXPECT_EQ(run(static_cast<int>(none.size()), none.data()), core::exit_code::USAGE);

  auto unknown = std::array<char const*, 3>{"canopy", "--bogus", "ls"};
  EXPECT_EQ(run(static_cast<int>(unknown.size()), unknown.data()), core::exit_code::USAGE);
}

TEST(RunTest, MissingConfigurationFile) {
  auto argv = std::array<char const*, 4>{"canopy", "-c", "/nonexistent/canopy.yaml", "ls"};
  EXPECT_EQ(run(static_cast<int>(argv.size()), argv.data()), core::exit_code::NOINPUT);
}

class EvalCommandTest : public ::testing::Test {
protected:
  canopy::test::TempDir dir_;
  std::string           config_;

  void SetUp() override {
    config_ = dir_.write("canopy.yaml", R"(
variables:
  stage: none
trees:
  api: {}
gardens:
  dev:
    trees: [api]
    variables:
      stage: dev
)").string();
  }

  auto eval(std::vector<char const*> words) -> std::pair<int, std::string> {
    std::vector<char const*> argv{"canopy", "-q", "-c", config_.c_str(), "eval"};
    argv.insert(argv.end(), words.begin(), words.end());
    ::testing::internal::CaptureStdout();
    int code = run(static_cast<int>(argv.size()), argv.data());
    return {code, ::testing::internal::GetCapturedStdout()};
  }
};

TEST_F(EvalCommandTest, Scopes) {
  EXPECT_EQ(eval({"${stage}"}), (std::pair<int, std::string>{0, "none\n"}));
  EXPECT_EQ(eval({"${stage}-${TREE_NAME}", "api"}), (std::pair<int, std::string>{0, "none-api\n"}));
  EXPECT_EQ(eval({"${stage}-${TREE_NAME}", "api", "dev"}), (std::pair<int, std::string>{0, "dev-api\n"}));
  EXPECT_EQ(eval({"${stage}", "dev"}), (std::pair<int, std::string>{0, "dev\n"}));
}

TEST_F(EvalCommandTest, UnknownNames) {
  EXPECT_EQ(eval({"${stage}", "nowhere"}).first, core::exit_code_for(core::Error{core::ErrorKind::UnknownTree, ""}));
  EXPECT_NE(eval({"${stage}", "api", "nowhere"}).first, 0);
}

} // namespace canopy::cli::test
