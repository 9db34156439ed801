/**
 * @file test_glob_pattern.cpp
 * @brief Unit tests for wildcard matching
 */

#include <gtest/gtest.h>

#include <kcenon/webhdfs/core/glob_pattern.h>

namespace kcenon::webhdfs::test {

TEST(GlobPatternTest, HasMagic) {
    EXPECT_TRUE(glob_pattern::has_magic("*.txt"));
    EXPECT_TRUE(glob_pattern::has_magic("part-?"));
    EXPECT_TRUE(glob_pattern::has_magic("[ab]"));
    EXPECT_FALSE(glob_pattern::has_magic("plain/name.txt"));
}

TEST(GlobPatternTest, HiddenNames) {
    EXPECT_TRUE(glob_pattern::is_hidden(".staging"));
    EXPECT_FALSE(glob_pattern::is_hidden("staging"));
    EXPECT_FALSE(glob_pattern::is_hidden(""));
}

TEST(GlobPatternTest, StarAndQuestionMark) {
    EXPECT_TRUE(glob_pattern::matches("report.csv", "*.csv"));
    EXPECT_TRUE(glob_pattern::matches("report.csv", "*"));
    EXPECT_TRUE(glob_pattern::matches("", "*"));
    EXPECT_TRUE(glob_pattern::matches("part-3", "part-?"));
    EXPECT_TRUE(glob_pattern::matches("abcabc", "*b*c"));

    EXPECT_FALSE(glob_pattern::matches("report.csv", "*.txt"));
    EXPECT_FALSE(glob_pattern::matches("part-13", "part-?"));
    EXPECT_FALSE(glob_pattern::matches("Report.csv", "report*"));
}

TEST(GlobPatternTest, BracketExpressions) {
    EXPECT_TRUE(glob_pattern::matches("log1", "log[0-9]"));
    EXPECT_TRUE(glob_pattern::matches("logb", "log[abc]"));
    EXPECT_TRUE(glob_pattern::matches("logz", "log[!0-9]"));
    EXPECT_TRUE(glob_pattern::matches("a]", "a[]]"));

    EXPECT_FALSE(glob_pattern::matches("logx", "log[0-9]"));
    EXPECT_FALSE(glob_pattern::matches("log5", "log[!0-9]"));
}

TEST(GlobPatternTest, UnterminatedBracketIsLiteral) {
    EXPECT_TRUE(glob_pattern::matches("a[b", "a[b"));
    EXPECT_FALSE(glob_pattern::matches("ab", "a[b"));
}

}  // namespace kcenon::webhdfs::test
