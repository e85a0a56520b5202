#include <string_view>

#include <gtest/gtest.h>

#include "canopy/query/glob.hpp"

namespace canopy::query::test {

struct GlobCase {
  std::string_view pattern;
  std::string_view name;
  bool             expected;
};

class GlobMatchTest : public ::testing::TestWithParam<GlobCase> {};

TEST_P(GlobMatchTest, Matches) {
  auto const& param = GetParam();
  EXPECT_EQ(glob_match(param.pattern, param.name), param.expected)
      << "pattern '" << param.pattern << "' against '" << param.name << "'";
}

INSTANTIATE_TEST_SUITE_P(
    Patterns,
    GlobMatchTest,
    ::testing::Values(
        GlobCase{"alpha", "alpha", true},
        GlobCase{"alpha", "alphabet", false},
        GlobCase{"*", "anything", true},
        GlobCase{"*", "", true},
        GlobCase{"a*", "alpha", true},
        GlobCase{"*a", "alpha", true},
        GlobCase{"*ph*", "alpha", true},
        GlobCase{"*x*", "alpha", false},
        GlobCase{"a*b*c", "aXbYc", true},
        GlobCase{"a*b*c", "aXbYd", false},
        GlobCase{"?eta", "beta", true},
        GlobCase{"?eta", "eta", false},
        GlobCase{"[ab]eta", "beta", true},
        GlobCase{"[a-c]eta", "ceta", true},
        GlobCase{"[a-c]eta", "zeta", false},
        GlobCase{"[!ab]eta", "zeta", true},
        GlobCase{"[^ab]eta", "beta", false},
        GlobCase{"[]]x", "]x", true},
        GlobCase{"[abc", "[abc", true},
        GlobCase{"lib\\*", "lib*", true},
        GlobCase{"lib\\*", "libc", false},
        GlobCase{"nosuch*", "alpha", false}
    )
);

TEST(GlobTest, HasGlobCharacters) {
  EXPECT_TRUE(has_glob_characters("a*"));
  EXPECT_TRUE(has_glob_characters("?"));
  EXPECT_TRUE(has_glob_characters("[ab]"));
  EXPECT_FALSE(has_glob_characters("alpha"));
  EXPECT_FALSE(has_glob_characters("a-b.c"));
}

} // namespace canopy::query::test
