#include "materializer.hpp"
#include <core/paths.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

MaterializationEngine::MaterializationEngine(const ResolvedOptions& options,
                                             OverwritePrompt prompt)
    : options_(options), matcher_(options.exclude), prompt_(std::move(prompt)) {
}

// ── Helpers ────────────────────────────────────────────────

// Link text for a link at link_relative pointing at target (both inside
// the source root), e.g. "docs/guide" -> "../README.md".
static fs::path relative_link_text(const fs::path& target,
                                   const fs::path& source_root,
                                   const fs::path& link_relative) {
    const fs::path anchor("/");
    fs::path to = (anchor / target.lexically_relative(source_root)).lexically_normal();
    fs::path from = (anchor / link_relative.parent_path()).lexically_normal();
    return to.lexically_relative(from);
}

// Identity of a link in a chain. The link itself may be part of a loop, so
// only its parent directory is canonicalized.
static fs::path link_key(const fs::path& link) {
    std::error_code ec;
    fs::path parent = fs::canonical(link.parent_path(), ec);
    if (ec) return link.lexically_normal();
    return parent / link.filename();
}

static std::string display(const fs::path& relative) {
    return relative.generic_string();
}

// ── Preflight ──────────────────────────────────────────────

Result<void> MaterializationEngine::check_roots(const fs::path& source_root,
                                                const fs::path& target_root) {
    std::error_code ec;
    if (!fs::is_directory(source_root, ec)) {
        return Result<void>::Err(ErrorCode::SourceUnreadable,
            fmt::format("Template source is not a readable directory: {}", source_root.string()));
    }
    source_root_ = fs::canonical(source_root, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::SourceUnreadable,
            fmt::format("Cannot resolve template source {}: {}", source_root.string(), ec.message()));
    }

    target_root_ = fs::weakly_canonical(fs::absolute(target_root), ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::IoFailure,
            fmt::format("Cannot resolve target {}: {}", target_root.string(), ec.message()));
    }

    if (is_within(target_root_, source_root_)) {
        return Result<void>::Err(ErrorCode::RecursiveInit,
            fmt::format("Target {} is inside the template source {}",
                        target_root_.string(), source_root_.string()));
    }

    auto st = fs::symlink_status(target_root_, ec);
    if (!fs::exists(st)) return Result<void>::Ok();

    if (!fs::is_directory(st)) {
        return Result<void>::Err(ErrorCode::IoFailure,
            fmt::format("Target exists and is not a directory: {}", target_root_.string()));
    }

    if (requires_empty_target(options_.write_mode)) {
        try {
            if (!is_dir_empty(target_root_)) {
                return Result<void>::Err(ErrorCode::CollisionStrict,
                    fmt::format("Target directory is not empty: {}", target_root_.string()));
            }
        } catch (const fs::filesystem_error& e) {
            return Result<void>::Err(ErrorCode::IoFailure,
                fmt::format("{}: {}", target_root_.string(), e.code().message()));
        }
    }
    return Result<void>::Ok();
}

static CollisionKind collision_at(const fs::path& dest, bool source_is_dir) {
    std::error_code ec;
    auto st = fs::symlink_status(dest, ec);
    if (!fs::exists(st)) return CollisionKind::None;
    if (source_is_dir && fs::is_directory(st)) return CollisionKind::Directory;
    return CollisionKind::File;
}

Result<CopyAction> MaterializationEngine::decide(const fs::path& relative, CollisionKind kind) {
    CopyAction action = collision_action(options_.write_mode, kind);

    if (action == CopyAction::Prompt) {
        bool yes = prompt_ && prompt_(display(relative));
        return Result<CopyAction>::Ok(yes ? CopyAction::Overwrite : CopyAction::Skip);
    }

    if (action == CopyAction::Error) {
        ErrorCode code = options_.write_mode == WriteMode::Strict
            ? ErrorCode::CollisionStrict : ErrorCode::CollisionNoOverwrite;
        return Result<CopyAction>::Err(code,
            fmt::format("Destination already exists: {}", display(relative)));
    }
    return Result<CopyAction>::Ok(action);
}

Result<void> MaterializationEngine::walk(const fs::path& dir, const fs::path& relative_dir,
                                         std::set<fs::path> ancestry, bool parent_is_new) {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;

    fs::directory_iterator it(dir, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return Result<void>::Err(ErrorCode::SourceUnreadable,
            fmt::format("Cannot read {}: {}", dir.string(), ec.message()));
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& entry : entries) {
        fs::path relative = relative_dir / entry.path().filename();
        if (matcher_.is_excluded(relative)) continue;

        auto st = entry.symlink_status(ec);
        if (ec) {
            return Result<void>::Err(ErrorCode::SourceUnreadable,
                fmt::format("Cannot stat {}: {}", entry.path().string(), ec.message()));
        }

        Result<void> r = Result<void>::Ok();
        if (fs::is_symlink(st)) {
            r = plan_symlink(entry.path(), relative, ancestry, parent_is_new);
        } else if (fs::is_directory(st)) {
            r = plan_directory(entry.path(), relative, ancestry, parent_is_new);
        } else if (fs::is_regular_file(st)) {
            r = plan_file(entry.path(), relative, parent_is_new);
        } else {
            plan_warnings_.push_back(
                fmt::format("Skipping special file {}", display(relative)));
        }
        if (r.is_err()) return r;
    }
    return Result<void>::Ok();
}

Result<void> MaterializationEngine::plan_file(const fs::path& source, const fs::path& relative,
                                              bool parent_is_new) {
    CollisionKind kind = parent_is_new ? CollisionKind::None
                                       : collision_at(target_root_ / relative, false);
    auto action = decide(relative, kind);
    if (action.is_err()) return propagate<void>(action);

    std::error_code ec;
    PlanEntry entry;
    entry.relative = relative;
    entry.kind = EntryKind::File;
    entry.action = action.value;
    entry.source = source;
    entry.perms = fs::status(source, ec).permissions();
    plan_.push_back(std::move(entry));
    return Result<void>::Ok();
}

Result<void> MaterializationEngine::plan_directory(const fs::path& source, const fs::path& relative,
                                                   const std::set<fs::path>& ancestry,
                                                   bool parent_is_new) {
    std::error_code ec;
    fs::path canon = fs::canonical(source, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::SourceUnreadable,
            fmt::format("Cannot resolve {}: {}", source.string(), ec.message()));
    }
    // Only reachable through links in resolve mode
    if (ancestry.count(canon)) {
        return Result<void>::Err(ErrorCode::SymlinkCycle,
            fmt::format("Symlink cycle: {} contains itself ({})", display(relative), canon.string()));
    }

    CollisionKind kind = parent_is_new ? CollisionKind::None
                                       : collision_at(target_root_ / relative, true);
    auto action = decide(relative, kind);
    if (action.is_err()) return propagate<void>(action);

    PlanEntry entry;
    entry.relative = relative;
    entry.kind = EntryKind::Directory;
    entry.action = action.value;
    entry.source = source;
    entry.perms = fs::status(source, ec).permissions();

    if (action.value == CopyAction::Skip) {
        entry.skipped_subtree = true;
        plan_.push_back(std::move(entry));
        return Result<void>::Ok();
    }
    plan_.push_back(std::move(entry));

    std::set<fs::path> below = ancestry;
    below.insert(canon);
    return walk(source, relative, std::move(below), action.value != CopyAction::Merge);
}

Result<void> MaterializationEngine::plan_symlink(const fs::path& link, const fs::path& relative,
                                                 const std::set<fs::path>& ancestry,
                                                 bool parent_is_new) {
    std::error_code ec;
    fs::path text = fs::read_symlink(link, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::SourceUnreadable,
            fmt::format("Cannot read link {}: {}", link.string(), ec.message()));
    }

    auto add_link = [&](const fs::path& link_text) -> Result<void> {
        CollisionKind kind = parent_is_new ? CollisionKind::None
                                           : collision_at(target_root_ / relative, false);
        auto action = decide(relative, kind);
        if (action.is_err()) return propagate<void>(action);

        PlanEntry entry;
        entry.relative = relative;
        entry.kind = EntryKind::Symlink;
        entry.action = action.value;
        entry.source = link;
        entry.link_text = link_text;
        plan_.push_back(std::move(entry));
        return Result<void>::Ok();
    };

    auto add_dangling = [&]() -> Result<void> {
        plan_warnings_.push_back(fmt::format("Dangling symlink {} -> {}",
                                             display(relative), text.string()));
        planned_warned_links_++;
        return add_link(text);
    };

    switch (options_.symlinks) {
        case SymlinkMode::Literal:
            return add_link(text);

        case SymlinkMode::Default: {
            fs::path target = text.is_absolute() ? text : link.parent_path() / text;
            if (!fs::exists(target, ec)) return add_dangling();
            fs::path canon = fs::canonical(target, ec);
            if (ec) return add_dangling();
            if (is_within(canon, source_root_)) {
                return add_link(relative_link_text(canon, source_root_, relative));
            }
            return add_link(canon);
        }

        case SymlinkMode::Resolve: {
            std::set<fs::path> visited;
            fs::path current = link;
            while (fs::is_symlink(fs::symlink_status(current, ec))) {
                fs::path key = link_key(current);
                if (!visited.insert(key).second) {
                    return Result<void>::Err(ErrorCode::SymlinkCycle,
                        fmt::format("Symlink cycle at {} (reached from {})",
                                    key.string(), display(relative)));
                }
                fs::path next = fs::read_symlink(current, ec);
                if (ec) {
                    return Result<void>::Err(ErrorCode::SourceUnreadable,
                        fmt::format("Cannot read link {}: {}", current.string(), ec.message()));
                }
                current = (next.is_absolute() ? next : current.parent_path() / next).lexically_normal();
            }

            auto st = fs::symlink_status(current, ec);
            if (!fs::exists(st)) return add_dangling();
            if (fs::is_directory(st)) return plan_directory(current, relative, ancestry, parent_is_new);
            if (fs::is_regular_file(st)) return plan_file(current, relative, parent_is_new);

            plan_warnings_.push_back(
                fmt::format("Skipping {}: link resolves to a special file", display(relative)));
            return Result<void>::Ok();
        }
    }
    return Result<void>::Ok();
}

Result<std::vector<PlanEntry>> MaterializationEngine::plan(const fs::path& source_root,
                                                           const fs::path& target_root) {
    plan_.clear();
    plan_warnings_.clear();
    planned_warned_links_ = 0;

    if (matcher_.error()) {
        return Result<std::vector<PlanEntry>>::Err(ErrorCode::Usage, *matcher_.error());
    }

    auto roots = check_roots(source_root, target_root);
    if (roots.is_err()) return propagate<std::vector<PlanEntry>>(roots);

    auto walked = walk(source_root_, fs::path(), {source_root_}, false);
    if (walked.is_err()) return propagate<std::vector<PlanEntry>>(walked);

    return Result<std::vector<PlanEntry>>::Ok(plan_);
}

// ── Execution ──────────────────────────────────────────────

Result<CopySummary> MaterializationEngine::execute(StatusCallback callback) {
    CopySummary summary;
    summary.warnings = plan_warnings_;
    summary.symlinks_warned = planned_warned_links_;

    if (callback) {
        callback(fmt::format("Copying {} entries into {}", plan_.size(), target_root_.string()));
    }

    std::vector<const PlanEntry*> created_dirs;
    fs::path current = target_root_;
    try {
        fs::create_directories(target_root_);

        for (const auto& entry : plan_) {
            current = target_root_ / entry.relative;

            if (entry.action == CopyAction::Skip) {
                if (entry.kind == EntryKind::Directory) summary.directories_skipped++;
                else summary.files_skipped++;
                continue;
            }
            if (entry.action == CopyAction::Overwrite) {
                fs::remove_all(current);
            }

            switch (entry.kind) {
                case EntryKind::Directory:
                    if (entry.action == CopyAction::Merge) break;
                    fs::create_directory(current);
                    summary.directories_created++;
                    created_dirs.push_back(&entry);
                    break;

                case EntryKind::File: {
                    fs::copy_file(entry.source, current, fs::copy_options::overwrite_existing);
                    if (entry.perms != fs::perms::unknown) {
                        std::error_code ec;
                        fs::permissions(current, entry.perms, ec);
                    }
                    summary.files_written++;
                    break;
                }

                case EntryKind::Symlink:
                    fs::create_symlink(entry.link_text, current);
                    summary.symlinks_created++;
                    break;
            }
        }
    } catch (const fs::filesystem_error& e) {
        return Result<CopySummary>::Err(ErrorCode::IoFailure,
            fmt::format("{}: {}", current.string(), e.code().message()));
    }

    // Deepest first, so read-only parents are locked only after their children
    for (auto it = created_dirs.rbegin(); it != created_dirs.rend(); ++it) {
        if ((*it)->perms == fs::perms::unknown) continue;
        std::error_code ec;
        fs::permissions(target_root_ / (*it)->relative, (*it)->perms, ec);
    }

    return Result<CopySummary>::Ok(std::move(summary));
}

Result<CopySummary> MaterializationEngine::copy(const fs::path& source_root,
                                                const fs::path& target_root,
                                                StatusCallback callback) {
    auto planned = plan(source_root, target_root);
    if (planned.is_err()) return propagate<CopySummary>(planned);
    return execute(std::move(callback));
}
