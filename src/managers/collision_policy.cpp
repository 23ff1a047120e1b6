#include "collision_policy.hpp"
#include <array>

// Rows indexed by WriteMode, columns by CollisionKind {None, File, Directory}.
// Strict never reaches the File/Directory columns in practice because the
// target must be empty; the table still answers Error for them.
static constexpr std::array<std::array<CopyAction, 3>, 5> kCollisionTable = {{
    /* Strict        */ {{CopyAction::Create, CopyAction::Error,     CopyAction::Error}},
    /* NoOverwrite   */ {{CopyAction::Create, CopyAction::Error,     CopyAction::Merge}},
    /* SkipOverwrite */ {{CopyAction::Create, CopyAction::Skip,      CopyAction::Merge}},
    /* Overwrite     */ {{CopyAction::Create, CopyAction::Overwrite, CopyAction::Merge}},
    /* Ask           */ {{CopyAction::Create, CopyAction::Prompt,    CopyAction::Merge}},
}};

static size_t row_for(WriteMode mode) {
    switch (mode) {
        case WriteMode::Strict:        return 0;
        case WriteMode::NoOverwrite:   return 1;
        case WriteMode::SkipOverwrite: return 2;
        case WriteMode::Overwrite:     return 3;
        case WriteMode::Ask:           return 4;
    }
    return 0;
}

static size_t column_for(CollisionKind kind) {
    switch (kind) {
        case CollisionKind::None:      return 0;
        case CollisionKind::File:      return 1;
        case CollisionKind::Directory: return 2;
    }
    return 0;
}

CopyAction collision_action(WriteMode mode, CollisionKind kind) {
    return kCollisionTable[row_for(mode)][column_for(kind)];
}
