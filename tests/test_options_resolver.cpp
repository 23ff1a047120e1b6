#include <gtest/gtest.h>
#include <managers/options_resolver.hpp>

class OptionsResolverTest : public ::testing::Test {
protected:
    Config config;
    TemplateEntry entry;

    void SetUp() override {
        config.set_git(GitMode::Fresh);
        config.set_write_mode(WriteMode::Strict);
        config.set_exclude({"node_modules"});
        config.set_symlinks(SymlinkMode::Default);
        config.set_no_cache(false);

        entry.name = "base";
        entry.location = "/srv/templates/base";
    }
};

TEST_F(OptionsResolverTest, ConfigDefaultsWithoutOverrides) {
    auto r = resolve_options(CliOverrides{}, nullptr, config);
    EXPECT_EQ(r.git, GitMode::Fresh);
    EXPECT_EQ(r.write_mode, WriteMode::Strict);
    EXPECT_EQ(r.exclude, std::vector<std::string>{"node_modules"});
    EXPECT_EQ(r.symlinks, SymlinkMode::Default);
    EXPECT_FALSE(r.no_cache);
    EXPECT_FALSE(r.refresh);
}

TEST_F(OptionsResolverTest, TemplateBeatsConfig) {
    entry.git = GitMode::Preserve;
    entry.write_mode = WriteMode::Overwrite;
    entry.exclude = std::vector<std::string>{"dist"};
    entry.symlinks = SymlinkMode::Literal;
    entry.no_cache = true;

    auto r = resolve_options(CliOverrides{}, &entry, config);
    EXPECT_EQ(r.git, GitMode::Preserve);
    EXPECT_EQ(r.write_mode, WriteMode::Overwrite);
    EXPECT_EQ(r.exclude, std::vector<std::string>{"dist"});
    EXPECT_EQ(r.symlinks, SymlinkMode::Literal);
    EXPECT_TRUE(r.no_cache);
}

TEST_F(OptionsResolverTest, CliBeatsTemplateForEveryField) {
    entry.git = GitMode::Preserve;
    entry.write_mode = WriteMode::Overwrite;
    entry.exclude = std::vector<std::string>{"dist"};
    entry.symlinks = SymlinkMode::Literal;
    entry.no_cache = false;

    CliOverrides cli;
    cli.git = GitMode::NoGit;
    cli.write_mode = WriteMode::SkipOverwrite;
    cli.exclude = std::vector<std::string>{"*.log", "tmp"};
    cli.symlinks = SymlinkMode::Resolve;
    cli.no_cache = true;
    cli.refresh = true;

    auto r = resolve_options(cli, &entry, config);
    EXPECT_EQ(r.git, GitMode::NoGit);
    EXPECT_EQ(r.write_mode, WriteMode::SkipOverwrite);
    EXPECT_EQ(r.exclude, (std::vector<std::string>{"*.log", "tmp"}));
    EXPECT_EQ(r.symlinks, SymlinkMode::Resolve);
    EXPECT_TRUE(r.no_cache);
    EXPECT_TRUE(r.refresh);
}

TEST_F(OptionsResolverTest, EmptyCliExcludeStillReplaces) {
    entry.exclude = std::vector<std::string>{"dist"};
    CliOverrides cli;
    cli.exclude = std::vector<std::string>{};

    auto r = resolve_options(cli, &entry, config);
    EXPECT_TRUE(r.exclude.empty());
}

TEST_F(OptionsResolverTest, PartialTemplateOverridesFallThrough) {
    entry.write_mode = WriteMode::Ask;

    auto r = resolve_options(CliOverrides{}, &entry, config);
    EXPECT_EQ(r.write_mode, WriteMode::Ask);
    EXPECT_EQ(r.git, GitMode::Fresh);
    EXPECT_EQ(r.exclude, std::vector<std::string>{"node_modules"});
}

TEST_F(OptionsResolverTest, TemplateOnlyValuesCarried) {
    entry.git_ref = "v2";
    entry.pre_init = "make prep";
    entry.post_init = "make setup";

    auto r = resolve_options(CliOverrides{}, &entry, config);
    ASSERT_TRUE(r.git_ref.has_value());
    EXPECT_EQ(*r.git_ref, "v2");
    ASSERT_TRUE(r.pre_init.has_value());
    EXPECT_EQ(*r.pre_init, "make prep");
    ASSERT_TRUE(r.post_init.has_value());
    EXPECT_EQ(*r.post_init, "make setup");
}
