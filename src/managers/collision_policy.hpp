#pragma once

#include <core/types.hpp>

// What the destination already holds at a computed path.
enum class CollisionKind {
    None,        // nothing there
    File,        // something that is not a directory-on-directory match
    Directory,   // source and destination are both directories
};

enum class CopyAction {
    Create,      // write a new entry
    Overwrite,   // replace the existing entry
    Skip,        // leave the existing entry alone
    Merge,       // existing directory: descend into it
    Prompt,      // ask the user; the answer becomes Overwrite or Skip
    Error,       // abort the whole copy
};

// (write mode, collision kind) -> action. Total over both enums.
CopyAction collision_action(WriteMode mode, CollisionKind kind);

// Modes that demand an empty target before anything is copied
inline bool requires_empty_target(WriteMode mode) {
    return mode == WriteMode::Strict;
}
