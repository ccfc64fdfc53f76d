// tests/test_selector.cpp
//
// Selector construction and shell-glob matching.

#include "test_preamble.h"

#include "simpaths/registry/selector.hpp"

using namespace simpaths::registry;

namespace
{

bool glob_matches(std::string_view glob, const std::string &candidate)
{
    auto m = GlobMatcher::compile(glob);
    EXPECT_TRUE(m.ok) << m.message;
    return m.ok && m.content().matches(candidate);
}

} // namespace

TEST(SelectorTest, NoInputSelectsAll)
{
    auto s = make_selector(std::nullopt, std::nullopt);
    ASSERT_TRUE(s.ok);
    EXPECT_TRUE(std::holds_alternative<SelectAll>(s.content()));
}

TEST(SelectorTest, PathsKeepGivenOrder)
{
    auto s = make_selector(std::vector<std::string>{"/you", "/as"}, std::nullopt);
    ASSERT_TRUE(s.ok);
    ASSERT_TRUE(std::holds_alternative<SelectPaths>(s.content()));
    EXPECT_EQ(std::get<SelectPaths>(s.content()).paths, (std::vector<std::string>{"/you", "/as"}));
}

TEST(SelectorTest, PatternSelector)
{
    auto s = make_selector(std::nullopt, std::string("*s*"));
    ASSERT_TRUE(s.ok);
    ASSERT_TRUE(std::holds_alternative<SelectPattern>(s.content()));
    EXPECT_EQ(std::get<SelectPattern>(s.content()).glob, "*s*");
}

TEST(SelectorTest, PathsAndPatternConflict)
{
    auto s = make_selector(std::vector<std::string>{"/as"}, std::string("*"));
    EXPECT_FALSE(s.ok);
    EXPECT_FALSE(s.payload.has_value());
    EXPECT_NE(s.message.find("mutually exclusive"), std::string::npos);
}

TEST(GlobTest, StarMatchesAcrossSlashes)
{
    EXPECT_TRUE(glob_matches("*s*", "/as"));
    EXPECT_TRUE(glob_matches("*s*", "/wish"));
    EXPECT_FALSE(glob_matches("*s*", "/you"));
    EXPECT_TRUE(glob_matches("/runs/*", "/runs/a/b/c"));
    EXPECT_TRUE(glob_matches("*", ""));
}

TEST(GlobTest, MatchIsFullString)
{
    EXPECT_FALSE(glob_matches("as", "/as"));
    EXPECT_TRUE(glob_matches("/as", "/as"));
    EXPECT_FALSE(glob_matches("/a", "/as"));
}

TEST(GlobTest, QuestionMarkAndClasses)
{
    EXPECT_TRUE(glob_matches("/r?n", "/run"));
    EXPECT_FALSE(glob_matches("/r?n", "/rn"));
    EXPECT_TRUE(glob_matches("/run[0-9]", "/run7"));
    EXPECT_FALSE(glob_matches("/run[0-9]", "/runx"));
    EXPECT_TRUE(glob_matches("/run[!0-9]", "/runx"));
    EXPECT_FALSE(glob_matches("/run[!0-9]", "/run7"));
    EXPECT_TRUE(glob_matches("[]]", "]"));
}

TEST(GlobTest, RegexCharactersAreLiteral)
{
    EXPECT_TRUE(glob_matches("/a.b", "/a.b"));
    EXPECT_FALSE(glob_matches("/a.b", "/axb"));
    EXPECT_TRUE(glob_matches("/x+(y)|{z}^$", "/x+(y)|{z}^$"));
    EXPECT_TRUE(glob_matches("/odd[", "/odd["));
    EXPECT_TRUE(glob_matches("/back\\slash", "/back\\slash"));
}

TEST(GlobTest, MalformedRangeIsAnError)
{
    auto m = GlobMatcher::compile("[z-a]");
    EXPECT_FALSE(m.ok);
    EXPECT_NE(m.message.find("invalid pattern"), std::string::npos);
}

TEST(GlobTest, LongCandidatesMatchWithoutDeepRecursion)
{
    auto m = GlobMatcher::compile("*s*");
    ASSERT_TRUE(m.ok) << m.message;
    const std::string hit = std::string(200000, 'a') + "s";
    const std::string miss(200000, 'a');
    EXPECT_TRUE(m.content().matches(hit));
    EXPECT_FALSE(m.content().matches(miss));

    auto tail = GlobMatcher::compile("/run/*/[0-9]?");
    ASSERT_TRUE(tail.ok) << tail.message;
    EXPECT_TRUE(tail.content().matches("/run/" + std::string(100000, 'x') + "/7z"));
    EXPECT_FALSE(tail.content().matches("/run/" + std::string(100000, 'x') + "/z7"));
}

TEST(GlobTest, BacktracksAcrossSeveralStars)
{
    EXPECT_TRUE(glob_matches("*a*b*c", "xxaxxbxxbxxc"));
    EXPECT_FALSE(glob_matches("*a*b*c", "xxaxxbxxbxxcx"));
    EXPECT_TRUE(glob_matches("a**b", "ab"));
    EXPECT_TRUE(glob_matches("[^x]", "^"));
    EXPECT_FALSE(glob_matches("[^x]", "y"));
}
