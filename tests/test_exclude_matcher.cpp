#include <gtest/gtest.h>
#include <managers/exclude_matcher.hpp>

TEST(ExcludeMatcherTest, GitAlwaysExcluded) {
    ExcludeMatcher matcher({});
    EXPECT_TRUE(matcher.is_excluded(".git"));
    EXPECT_TRUE(matcher.is_excluded(".git/config"));
    EXPECT_TRUE(matcher.is_excluded("vendor/lib/.git/HEAD"));
    EXPECT_FALSE(matcher.is_excluded(".gitignore"));
}

TEST(ExcludeMatcherTest, ComponentMatch) {
    ExcludeMatcher matcher({"node_modules", ".DS_Store"});
    EXPECT_TRUE(matcher.is_excluded("node_modules"));
    EXPECT_TRUE(matcher.is_excluded("web/node_modules/react/index.js"));
    EXPECT_TRUE(matcher.is_excluded("assets/.DS_Store"));
    EXPECT_FALSE(matcher.is_excluded("src/main.cpp"));
}

TEST(ExcludeMatcherTest, WildcardsStayInsideComponent) {
    ExcludeMatcher matcher({"*.log", "build?"});
    EXPECT_TRUE(matcher.is_excluded("debug.log"));
    EXPECT_TRUE(matcher.is_excluded("logs/today.log"));
    EXPECT_TRUE(matcher.is_excluded("build2"));
    EXPECT_FALSE(matcher.is_excluded("build"));
    EXPECT_FALSE(matcher.is_excluded("log.txt"));
}

TEST(ExcludeMatcherTest, FullPathPatterns) {
    ExcludeMatcher matcher({"docs/*.md", "**/generated"});
    EXPECT_TRUE(matcher.is_excluded("docs/guide.md"));
    EXPECT_FALSE(matcher.is_excluded("docs/api/guide.md"));
    EXPECT_FALSE(matcher.is_excluded("README.md"));
    EXPECT_TRUE(matcher.is_excluded("generated"));
    EXPECT_TRUE(matcher.is_excluded("a/b/generated"));
}

TEST(ExcludeMatcherTest, CharacterClasses) {
    ExcludeMatcher matcher({"file[0-9].txt", "[!a]x"});
    EXPECT_TRUE(matcher.is_excluded("file3.txt"));
    EXPECT_FALSE(matcher.is_excluded("fileA.txt"));
    EXPECT_TRUE(matcher.is_excluded("bx"));
    EXPECT_FALSE(matcher.is_excluded("ax"));
}

TEST(ExcludeMatcherTest, TrailingSlashAndBlanks) {
    ExcludeMatcher matcher({"dist/", "  ", ""});
    EXPECT_EQ(matcher.patterns().size(), 1u);
    EXPECT_TRUE(matcher.is_excluded("dist"));
    EXPECT_TRUE(matcher.is_excluded("dist/bundle.js"));
}

TEST(ExcludeMatcherTest, RegexSpecialsAreLiteral) {
    ExcludeMatcher matcher({"a+b(1).txt"});
    EXPECT_TRUE(matcher.is_excluded("a+b(1).txt"));
    EXPECT_FALSE(matcher.is_excluded("aab1.txt"));
}

TEST(ExcludeMatcherTest, GlobToRegex) {
    EXPECT_EQ(ExcludeMatcher::glob_to_regex("*.txt"), "[^/]*\\.txt");
    EXPECT_EQ(ExcludeMatcher::glob_to_regex("a?"), "a[^/]");
    EXPECT_EQ(ExcludeMatcher::glob_to_regex("**/x"), "(?:.*/)?x");
    EXPECT_EQ(ExcludeMatcher::glob_to_regex("[abc"), "\\[abc");
}

TEST(ExcludeMatcherTest, TrailingBackslashIsLiteral) {
    EXPECT_EQ(ExcludeMatcher::glob_to_regex("foo\\"), "foo\\\\");
    EXPECT_EQ(ExcludeMatcher::glob_to_regex("\\d"), "d");
    EXPECT_TRUE(ExcludeMatcher::validate({"foo\\"}).is_ok());

    ExcludeMatcher matcher({"foo\\"});
    EXPECT_FALSE(matcher.error().has_value());
    EXPECT_TRUE(matcher.is_excluded("foo\\"));
    EXPECT_FALSE(matcher.is_excluded("foo"));
}

TEST(ExcludeMatcherTest, ReversedRangeIsReported) {
    ExcludeMatcher matcher({"*.log", "[z-a]"});
    ASSERT_TRUE(matcher.error().has_value());
    EXPECT_NE(matcher.error()->find("[z-a]"), std::string::npos);
    EXPECT_EQ(matcher.patterns(), std::vector<std::string>{"*.log"});
    EXPECT_TRUE(matcher.is_excluded("a.log"));

    auto r = ExcludeMatcher::validate({"dist", "[z-a]"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Usage);
    EXPECT_NE(r.error.find("invalid exclude pattern '[z-a]'"), std::string::npos);
}
