#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/errors.hpp>
#include <core/types.hpp>

TEST(UtilsTest, GitUrlDetection) {
    EXPECT_TRUE(is_git_url("https://github.com/org/skeleton.git"));
    EXPECT_TRUE(is_git_url("ssh://git@host/org/repo"));
    EXPECT_TRUE(is_git_url("file:///srv/templates/base"));
    EXPECT_TRUE(is_git_url("git@github.com:org/repo.git"));

    EXPECT_FALSE(is_git_url("/home/me/templates/base"));
    EXPECT_FALSE(is_git_url("relative/dir"));
    EXPECT_FALSE(is_git_url("/tmp/odd@name:dir"));
}

TEST(UtilsTest, UrlBasename) {
    EXPECT_EQ(url_basename("https://github.com/org/skeleton.git"), "skeleton");
    EXPECT_EQ(url_basename("https://github.com/org/skeleton/"), "skeleton");
    EXPECT_EQ(url_basename("git@github.com:org/repo.git"), "repo");
    EXPECT_EQ(url_basename("git@host:plain"), "plain");
}

TEST(UtilsTest, HashIsStableAndDistinct) {
    auto a = fnv1a_hex("https://example.com/a.git\nmain");
    EXPECT_EQ(a.size(), 16u);
    EXPECT_EQ(a, fnv1a_hex("https://example.com/a.git\nmain"));
    EXPECT_NE(a, fnv1a_hex("https://example.com/a.git\ndev"));
}

TEST(UtilsTest, CommitShapes) {
    EXPECT_TRUE(looks_like_commit("deadbeef"));
    EXPECT_TRUE(looks_like_commit("0123456789abcdef0123456789abcdef01234567"));
    EXPECT_FALSE(looks_like_commit("main"));
    EXPECT_FALSE(looks_like_commit("abc12"));
    EXPECT_FALSE(looks_like_commit("v1.2.3"));
    EXPECT_EQ(short_sha("0123456789abcdef"), "0123456");
    EXPECT_EQ(short_sha("abc"), "abc");
}

TEST(UtilsTest, IsWithinComparesComponents) {
    EXPECT_TRUE(is_within("/srv/tpl", "/srv/tpl"));
    EXPECT_TRUE(is_within("/srv/tpl/sub/dir", "/srv/tpl"));
    EXPECT_FALSE(is_within("/srv/tpl-other", "/srv/tpl"));
    EXPECT_FALSE(is_within("/srv", "/srv/tpl"));
}

TEST(UtilsTest, Trim) {
    std::string s = "  \tvalue \n";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(trimmed("   "), "");
}

TEST(ErrorsTest, ExitCodesAreDistinct) {
    EXPECT_EQ(exit_code_for(ErrorCode::None), 0);
    EXPECT_EQ(exit_code_for(ErrorCode::General), 1);
    EXPECT_EQ(exit_code_for(ErrorCode::Usage), 2);
    EXPECT_EQ(exit_code_for(ErrorCode::RecursiveInit), 11);
    EXPECT_EQ(exit_code_for(ErrorCode::CollisionStrict), 12);
    EXPECT_EQ(exit_code_for(ErrorCode::CollisionNoOverwrite), 13);
    EXPECT_EQ(exit_code_for(ErrorCode::SymlinkCycle), 14);
    EXPECT_EQ(exit_code_for(ErrorCode::GitFailure), 20);
    EXPECT_EQ(exit_code_for(ErrorCode::UpdateFailed), 23);
}

TEST(TypesTest, ModeParsing) {
    EXPECT_EQ(parse_git_mode("no-git").value(), GitMode::NoGit);
    EXPECT_EQ(parse_write_mode("skip-overwrite").value(), WriteMode::SkipOverwrite);
    EXPECT_EQ(parse_symlink_mode("resolve").value(), SymlinkMode::Resolve);
    EXPECT_EQ(parse_color_mode("never").value(), ColorMode::Never);
    EXPECT_FALSE(parse_write_mode("clobber").has_value());
    EXPECT_STREQ(to_string(WriteMode::NoOverwrite), "no-overwrite");
}

TEST(TypesTest, CombinedOutput) {
    ProcessResult r;
    r.stdout_data = "out\n";
    r.stderr_data = "err\n";
    EXPECT_EQ(r.combined_output(), "out\nerr");
}
