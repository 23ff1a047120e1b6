#pragma once

#include <string>
#include <vector>
#include <set>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include "options_resolver.hpp"
#include "exclude_matcher.hpp"
#include "collision_policy.hpp"

namespace fs = std::filesystem;

struct CopySummary {
    int files_written = 0;
    int files_skipped = 0;
    int directories_skipped = 0;     // template subtree not copied (existing entry kept)
    int symlinks_created = 0;
    int symlinks_warned = 0;
    int directories_created = 0;
    std::vector<std::string> warnings;
};

// Asked once per colliding entry in ask mode. Receives the path relative to
// the target root; true means overwrite, false means keep the existing entry.
using OverwritePrompt = std::function<bool(const std::string& relative_path)>;

enum class EntryKind { Directory, File, Symlink };

// One node of the copy plan. Built completely before anything is written.
struct PlanEntry {
    fs::path relative;                // destination path relative to target root
    EntryKind kind = EntryKind::File;
    CopyAction action = CopyAction::Create;
    fs::path source;                  // file or directory whose contents are copied
    fs::path link_text;               // symlinks only
    fs::perms perms = fs::perms::unknown;
    bool skipped_subtree = false;     // directory not descended into
};

// Reproduces a template tree at a target path under the resolved
// exclusion, write-mode and symlink policies.
//
// copy() runs in two phases. The preflight walks the source in lexical
// order and decides an action for every entry, including all ask-mode
// prompts. Only if the whole plan is free of errors is anything written,
// so collisions and symlink cycles never leave a half-written target.
class MaterializationEngine {
public:
    explicit MaterializationEngine(const ResolvedOptions& options,
                                   OverwritePrompt prompt = nullptr);

    Result<CopySummary> copy(const fs::path& source_root,
                             const fs::path& target_root,
                             StatusCallback callback = nullptr);

    // Preflight only. Exposed for tests and dry runs.
    Result<std::vector<PlanEntry>> plan(const fs::path& source_root,
                                        const fs::path& target_root);

private:
    ResolvedOptions options_;
    ExcludeMatcher matcher_;
    OverwritePrompt prompt_;

    // Per-copy state
    fs::path source_root_;
    fs::path target_root_;
    std::vector<PlanEntry> plan_;
    std::vector<std::string> plan_warnings_;
    int planned_warned_links_ = 0;

    Result<void> check_roots(const fs::path& source_root, const fs::path& target_root);
    Result<void> walk(const fs::path& dir, const fs::path& relative_dir,
                      std::set<fs::path> ancestry, bool parent_is_new);
    Result<void> plan_file(const fs::path& source, const fs::path& relative, bool parent_is_new);
    Result<void> plan_directory(const fs::path& source, const fs::path& relative,
                                const std::set<fs::path>& ancestry, bool parent_is_new);
    Result<void> plan_symlink(const fs::path& link, const fs::path& relative,
                              const std::set<fs::path>& ancestry, bool parent_is_new);
    Result<CopyAction> decide(const fs::path& relative, CollisionKind kind);

    Result<CopySummary> execute(StatusCallback callback);
};
