#include <gtest/gtest.h>
#include <managers/materializer.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class MaterializerTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path source;
    fs::path target;
    ResolvedOptions options;

    void SetUp() override {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        root = fs::temp_directory_path() / ("templative_materializer_" + name);
        fs::remove_all(root);
        source = root / "source";
        target = root / "target";
        fs::create_directories(source);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(root, ec);
    }

    static void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static int count_entries(const fs::path& dir) {
        if (!fs::exists(dir)) return 0;
        int n = 0;
        for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) n++;
        return n;
    }

    Result<CopySummary> copy(OverwritePrompt prompt = nullptr) {
        MaterializationEngine engine(options, std::move(prompt));
        return engine.copy(source, target);
    }
};

// ── Basic copying ──────────────────────────────────────────

TEST_F(MaterializerTest, CopiesTreeIntoMissingTarget) {
    write_file(source / "a.txt", "alpha");
    write_file(source / "sub" / "b.txt", "beta");

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(target / "a.txt"), "alpha");
    EXPECT_EQ(read_file(target / "sub" / "b.txt"), "beta");
    EXPECT_EQ(r.value.files_written, 2);
    EXPECT_EQ(r.value.directories_created, 1);
}

TEST_F(MaterializerTest, ExcludedPathsNeverAppear) {
    write_file(source / "keep.txt", "k");
    write_file(source / "debug.log", "x");
    write_file(source / "node_modules" / "pkg" / "index.js", "x");
    write_file(source / "src" / "trace.log", "x");
    write_file(source / ".git" / "HEAD", "ref: refs/heads/main");
    options.exclude = {"node_modules", "*.log"};

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(fs::exists(target / "keep.txt"));
    EXPECT_TRUE(fs::exists(target / "src"));
    EXPECT_FALSE(fs::exists(target / "debug.log"));
    EXPECT_FALSE(fs::exists(target / "node_modules"));
    EXPECT_FALSE(fs::exists(target / "src" / "trace.log"));
    EXPECT_FALSE(fs::exists(target / ".git"));
}

TEST_F(MaterializerTest, PlanIsLexicallyOrdered) {
    write_file(source / "b.txt", "");
    write_file(source / "a" / "z.txt", "");
    write_file(source / "c.txt", "");

    MaterializationEngine engine(options);
    auto plan = engine.plan(source, target);
    ASSERT_TRUE(plan.is_ok()) << plan.error;

    std::vector<std::string> order;
    for (const auto& e : plan.value) order.push_back(e.relative.generic_string());
    EXPECT_EQ(order, (std::vector<std::string>{"a", "a/z.txt", "b.txt", "c.txt"}));
}

TEST_F(MaterializerTest, MirrorsPermissions) {
    write_file(source / "run.sh", "#!/bin/sh\n");
    fs::permissions(source / "run.sh", fs::perms::owner_exec, fs::perm_options::add);
    fs::create_directories(source / "locked");
    write_file(source / "locked" / "inside.txt", "data");
    fs::permissions(source / "locked",
                    fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

    auto r = copy();
    fs::permissions(source / "locked", fs::perms::owner_all, fs::perm_options::add);
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto exec = fs::status(target / "run.sh").permissions() & fs::perms::owner_exec;
    EXPECT_NE(exec, fs::perms::none);
    EXPECT_EQ(read_file(target / "locked" / "inside.txt"), "data");
    auto write = fs::status(target / "locked").permissions() & fs::perms::owner_write;
    EXPECT_EQ(write, fs::perms::none);

    fs::permissions(target / "locked", fs::perms::owner_all, fs::perm_options::add);
}

// ── Recursion guard ────────────────────────────────────────

TEST_F(MaterializerTest, TargetInsideSourceIsRejected) {
    write_file(source / "a.txt", "alpha");
    target = source / "nested" / "out";

    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::RecursiveInit);
    EXPECT_FALSE(fs::exists(source / "nested"));
}

TEST_F(MaterializerTest, TargetEqualToSourceIsRejected) {
    write_file(source / "a.txt", "alpha");
    target = source;

    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::RecursiveInit);
    EXPECT_EQ(count_entries(source), 1);
}

TEST_F(MaterializerTest, MissingSourceIsUnreadable) {
    source = root / "does-not-exist";
    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::SourceUnreadable);
}

// ── Write modes ────────────────────────────────────────────

TEST_F(MaterializerTest, StrictRejectsNonEmptyTarget) {
    write_file(source / "a.txt", "alpha");
    write_file(source / "b.txt", "beta");
    write_file(target / "existing.txt", "mine");
    options.write_mode = WriteMode::Strict;

    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::CollisionStrict);
    EXPECT_EQ(count_entries(target), 1);
}

TEST_F(MaterializerTest, StrictAcceptsEmptyTarget) {
    write_file(source / "a.txt", "alpha");
    fs::create_directories(target);
    options.write_mode = WriteMode::Strict;

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(fs::exists(target / "a.txt"));
}

TEST_F(MaterializerTest, NoOverwriteAbortsBeforeAnyWrite) {
    write_file(source / "a.txt", "alpha");
    write_file(source / "m.txt", "collides");
    write_file(source / "z" / "deep.txt", "zeta");
    write_file(target / "m.txt", "mine");
    options.write_mode = WriteMode::NoOverwrite;

    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::CollisionNoOverwrite);
    EXPECT_NE(r.error.find("m.txt"), std::string::npos);
    EXPECT_FALSE(fs::exists(target / "a.txt"));
    EXPECT_FALSE(fs::exists(target / "z"));
    EXPECT_EQ(read_file(target / "m.txt"), "mine");
}

TEST_F(MaterializerTest, NoOverwriteMergesDirectories) {
    write_file(source / "sub" / "new.txt", "n");
    write_file(target / "sub" / "old.txt", "o");
    options.write_mode = WriteMode::NoOverwrite;

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(fs::exists(target / "sub" / "new.txt"));
    EXPECT_TRUE(fs::exists(target / "sub" / "old.txt"));
    EXPECT_EQ(r.value.directories_created, 0);
}

TEST_F(MaterializerTest, SkipOverwriteLeavesCollisionUntouched) {
    write_file(source / "one.txt", "1");
    write_file(source / "two.txt", "2");
    write_file(source / "three.txt", "3");
    write_file(source / "clash.txt", "template");
    write_file(target / "clash.txt", "mine");
    options.write_mode = WriteMode::SkipOverwrite;

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.files_written, 3);
    EXPECT_EQ(r.value.files_skipped, 1);
    EXPECT_EQ(read_file(target / "clash.txt"), "mine");
    EXPECT_EQ(read_file(target / "two.txt"), "2");
}

TEST_F(MaterializerTest, OverwriteReplacesContent) {
    write_file(source / "clash.txt", "template");
    write_file(target / "clash.txt", "mine");
    write_file(target / "unrelated.txt", "keep");
    options.write_mode = WriteMode::Overwrite;

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(target / "clash.txt"), "template");
    EXPECT_EQ(read_file(target / "unrelated.txt"), "keep");
}

TEST_F(MaterializerTest, TypeMismatchIsFileCollision) {
    write_file(source / "thing" / "inner.txt", "i");
    write_file(target / "thing", "a plain file");

    options.write_mode = WriteMode::NoOverwrite;
    auto refused = copy();
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.code, ErrorCode::CollisionNoOverwrite);

    options.write_mode = WriteMode::Overwrite;
    auto replaced = copy();
    ASSERT_TRUE(replaced.is_ok()) << replaced.error;
    EXPECT_TRUE(fs::is_directory(target / "thing"));
    EXPECT_EQ(read_file(target / "thing" / "inner.txt"), "i");
}

TEST_F(MaterializerTest, SkippedDirectoryCountedSeparately) {
    write_file(source / "thing" / "inner.txt", "i");
    write_file(source / "plain.txt", "p");
    write_file(target / "thing", "a plain file");
    options.write_mode = WriteMode::SkipOverwrite;

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.directories_skipped, 1);
    EXPECT_EQ(r.value.files_skipped, 0);
    EXPECT_EQ(r.value.files_written, 1);
    EXPECT_EQ(read_file(target / "thing"), "a plain file");
}

TEST_F(MaterializerTest, AskDeclinedDirectoryIsSkipped) {
    write_file(source / "thing" / "inner.txt", "i");
    write_file(target / "thing", "a plain file");
    options.write_mode = WriteMode::Ask;

    auto r = copy([](const std::string&) { return false; });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.directories_skipped, 1);
    EXPECT_EQ(r.value.files_skipped, 0);
    EXPECT_TRUE(fs::is_regular_file(target / "thing"));
}

TEST_F(MaterializerTest, InvalidExcludeFailsBeforeWrite) {
    write_file(source / "a.txt", "alpha");
    options.exclude = {"[z-a]"};

    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Usage);
    EXPECT_NE(r.error.find("[z-a]"), std::string::npos);
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(MaterializerTest, AskPromptsPerCollision) {
    write_file(source / "a.txt", "new-a");
    write_file(source / "b.txt", "new-b");
    write_file(source / "c.txt", "new-c");
    write_file(target / "a.txt", "old-a");
    write_file(target / "b.txt", "old-b");
    options.write_mode = WriteMode::Ask;

    std::vector<std::string> asked;
    auto r = copy([&](const std::string& path) {
        asked.push_back(path);
        return path == "a.txt";
    });
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(asked, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(read_file(target / "a.txt"), "new-a");
    EXPECT_EQ(read_file(target / "b.txt"), "old-b");
    EXPECT_EQ(read_file(target / "c.txt"), "new-c");
    EXPECT_EQ(r.value.files_skipped, 1);
}

// ── Symlinks ───────────────────────────────────────────────

TEST_F(MaterializerTest, DefaultModeSiblingLinkStaysRelative) {
    write_file(source / "real.txt", "real");
    fs::create_symlink("real.txt", source / "link.txt");
    write_file(source / "docs" / "guide.md", "guide");
    fs::create_symlink(source / "real.txt", source / "docs" / "abs_inside");

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(fs::is_symlink(target / "link.txt"));
    EXPECT_EQ(fs::read_symlink(target / "link.txt"), fs::path("real.txt"));
    ASSERT_TRUE(fs::is_symlink(target / "docs" / "abs_inside"));
    EXPECT_EQ(fs::read_symlink(target / "docs" / "abs_inside"), fs::path("../real.txt"));
    EXPECT_EQ(read_file(target / "link.txt"), "real");
    EXPECT_EQ(r.value.symlinks_created, 2);
    EXPECT_EQ(r.value.symlinks_warned, 0);
}

TEST_F(MaterializerTest, DefaultModeOutsideLinkIsAbsolute) {
    write_file(root / "outside.txt", "outside");
    fs::create_symlink("../outside.txt", source / "out_link");

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto text = fs::read_symlink(target / "out_link");
    EXPECT_TRUE(text.is_absolute());
    EXPECT_EQ(text, fs::canonical(root / "outside.txt"));
}

TEST_F(MaterializerTest, DefaultModeDanglingLinkWarns) {
    write_file(source / "a.txt", "alpha");
    fs::create_symlink("missing.txt", source / "broken");

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.symlinks_warned, 1);
    EXPECT_EQ(r.value.warnings.size(), 1u);
    ASSERT_TRUE(fs::is_symlink(target / "broken"));
    EXPECT_EQ(fs::read_symlink(target / "broken"), fs::path("missing.txt"));
}

TEST_F(MaterializerTest, LiteralModeCopiesLinkText) {
    write_file(root / "outside.txt", "outside");
    fs::create_symlink("../outside.txt", source / "out_link");
    options.symlinks = SymlinkMode::Literal;

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(fs::read_symlink(target / "out_link"), fs::path("../outside.txt"));
}

TEST_F(MaterializerTest, ResolveModeCopiesRealContent) {
    write_file(source / "real.txt", "real");
    fs::create_symlink("real.txt", source / "hop1");
    fs::create_symlink("hop1", source / "hop2");
    write_file(root / "shared" / "lib.txt", "lib");
    fs::create_symlink("../shared", source / "shared_dir");
    options.symlinks = SymlinkMode::Resolve;

    auto r = copy();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(fs::is_symlink(target / "hop2"));
    EXPECT_EQ(read_file(target / "hop2"), "real");
    EXPECT_FALSE(fs::is_symlink(target / "shared_dir"));
    EXPECT_EQ(read_file(target / "shared_dir" / "lib.txt"), "lib");
}

TEST_F(MaterializerTest, ResolveModeCycleAbortsBeforeWrite) {
    write_file(source / "0_first.txt", "first");
    fs::create_symlink("b", source / "a");
    fs::create_symlink("a", source / "b");
    options.symlinks = SymlinkMode::Resolve;

    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::SymlinkCycle);
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(MaterializerTest, ResolveModeSelfContainingDirectoryIsCycle) {
    write_file(source / "sub" / "file.txt", "f");
    fs::create_symlink("..", source / "sub" / "up");
    options.symlinks = SymlinkMode::Resolve;

    auto r = copy();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::SymlinkCycle);
    EXPECT_FALSE(fs::exists(target));
}
