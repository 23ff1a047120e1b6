#include <gtest/gtest.h>
#include <managers/collision_policy.hpp>

TEST(CollisionPolicyTest, NoCollisionAlwaysCreates) {
    for (auto mode : {WriteMode::Strict, WriteMode::NoOverwrite, WriteMode::SkipOverwrite,
                      WriteMode::Overwrite, WriteMode::Ask}) {
        EXPECT_EQ(collision_action(mode, CollisionKind::None), CopyAction::Create)
            << to_string(mode);
    }
}

TEST(CollisionPolicyTest, FileCollisions) {
    EXPECT_EQ(collision_action(WriteMode::Strict, CollisionKind::File), CopyAction::Error);
    EXPECT_EQ(collision_action(WriteMode::NoOverwrite, CollisionKind::File), CopyAction::Error);
    EXPECT_EQ(collision_action(WriteMode::SkipOverwrite, CollisionKind::File), CopyAction::Skip);
    EXPECT_EQ(collision_action(WriteMode::Overwrite, CollisionKind::File), CopyAction::Overwrite);
    EXPECT_EQ(collision_action(WriteMode::Ask, CollisionKind::File), CopyAction::Prompt);
}

TEST(CollisionPolicyTest, DirectoriesMergeOutsideStrict) {
    EXPECT_EQ(collision_action(WriteMode::Strict, CollisionKind::Directory), CopyAction::Error);
    EXPECT_EQ(collision_action(WriteMode::NoOverwrite, CollisionKind::Directory), CopyAction::Merge);
    EXPECT_EQ(collision_action(WriteMode::SkipOverwrite, CollisionKind::Directory), CopyAction::Merge);
    EXPECT_EQ(collision_action(WriteMode::Overwrite, CollisionKind::Directory), CopyAction::Merge);
    EXPECT_EQ(collision_action(WriteMode::Ask, CollisionKind::Directory), CopyAction::Merge);
}

TEST(CollisionPolicyTest, OnlyStrictNeedsEmptyTarget) {
    EXPECT_TRUE(requires_empty_target(WriteMode::Strict));
    EXPECT_FALSE(requires_empty_target(WriteMode::NoOverwrite));
    EXPECT_FALSE(requires_empty_target(WriteMode::Ask));
}
