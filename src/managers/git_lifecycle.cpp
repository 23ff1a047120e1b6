#include "git_lifecycle.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <system_error>

const char* to_string(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::UpdateAvailable: return "update available";
        case UpdateStatus::UpToDate:        return "up to date";
        case UpdateStatus::Updated:         return "updated";
        case UpdateStatus::Pinned:          return "skipped (pinned to immutable ref)";
        case UpdateStatus::NotCached:       return "not cached";
        case UpdateStatus::Cached:          return "cached";
        case UpdateStatus::CacheDisabled:   return "skipped (cache disabled)";
        case UpdateStatus::NotApplicable:   return "not applicable (local template)";
    }
    return "unknown";
}

GitLifecycleManager::GitLifecycleManager(GitClient& git, GitCache& cache)
    : git_(git), cache_(cache) {
}

static bool has_repository(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir / GIT_DIR_NAME, ec);
}

static std::string describe_ref(const std::string& ref) {
    return ref.empty() ? "HEAD" : ref;
}

// ── Ref resolution ─────────────────────────────────────────

Result<std::string> GitLifecycleManager::remote_commit(const std::string& url,
                                                       const std::string& ref) {
    std::vector<std::string> patterns;
    if (ref.empty()) {
        patterns = {"HEAD"};
    } else {
        patterns = {"refs/heads/" + ref, "refs/tags/" + ref, "refs/tags/" + ref + "^{}"};
    }

    auto result = git_.ls_remote(url, patterns);
    auto checked = git_check(result, "git ls-remote " + url);
    if (checked.is_err()) return propagate<std::string>(checked);

    auto refs = GitClient::parse_ls_remote(result.stdout_data);
    if (ref.empty()) {
        auto it = refs.find("HEAD");
        if (it != refs.end()) return Result<std::string>::Ok(it->second);
    } else {
        // Branch first, then the peeled tag (annotated tags), then the tag itself
        for (const auto& name : {"refs/heads/" + ref, "refs/tags/" + ref + "^{}", "refs/tags/" + ref}) {
            auto it = refs.find(name);
            if (it != refs.end()) return Result<std::string>::Ok(it->second);
        }
        if (looks_like_commit(ref)) return Result<std::string>::Ok(ref);
    }
    return Result<std::string>::Err(ErrorCode::GitFailure,
        fmt::format("ref '{}' not found at {}", describe_ref(ref), url));
}

Result<ResolvedRef> GitLifecycleManager::resolve_local(const fs::path& clone,
                                                       const std::string& ref) {
    ResolvedRef resolved;

    if (ref.empty()) {
        auto head = git_.symbolic_ref(clone, "refs/remotes/origin/HEAD");
        std::string remote_head = trimmed(head.stdout_data);
        auto commit = git_.rev_parse(clone, "HEAD^{commit}");
        if (head.success() && !remote_head.empty()) {
            commit = git_.rev_parse(clone, "refs/remotes/" + remote_head + "^{commit}");
            const std::string prefix = "origin/";
            if (remote_head.compare(0, prefix.size(), prefix) == 0) {
                resolved.branch = remote_head.substr(prefix.size());
            }
        }
        auto checked = git_check(commit, "git rev-parse HEAD");
        if (checked.is_err()) return propagate<ResolvedRef>(checked);
        resolved.commit = trimmed(commit.stdout_data);
        return Result<ResolvedRef>::Ok(resolved);
    }

    auto branch = git_.rev_parse(clone, "refs/remotes/origin/" + ref + "^{commit}");
    if (branch.success()) {
        resolved.commit = trimmed(branch.stdout_data);
        resolved.branch = ref;
        return Result<ResolvedRef>::Ok(resolved);
    }

    auto tag = git_.rev_parse(clone, "refs/tags/" + ref + "^{commit}");
    if (tag.success()) {
        resolved.commit = trimmed(tag.stdout_data);
        return Result<ResolvedRef>::Ok(resolved);
    }

    if (looks_like_commit(ref)) {
        auto commit = git_.rev_parse(clone, ref + "^{commit}");
        if (commit.success()) {
            resolved.commit = trimmed(commit.stdout_data);
            return Result<ResolvedRef>::Ok(resolved);
        }
    }

    return Result<ResolvedRef>::Err(ErrorCode::GitFailure,
        fmt::format("ref '{}' is not a branch, tag or commit of the template repository", ref));
}

Result<ResolvedRef> GitLifecycleManager::checkout_ref(const fs::path& clone,
                                                      const std::string& ref) {
    auto resolved = resolve_local(clone, ref);
    if (resolved.is_err()) return resolved;

    const auto& r = resolved.value;
    auto result = r.branch ? git_.checkout_branch(clone, *r.branch, r.commit)
                           : git_.checkout_detached(clone, r.commit);
    auto checked = git_check(result, "git checkout " + describe_ref(ref));
    if (checked.is_err()) return propagate<ResolvedRef>(checked);
    return resolved;
}

// ── Source preparation ─────────────────────────────────────

void GitLifecycleManager::discard(const std::string& url, const std::string& ref) {
    std::error_code ec;
    auto cached = cache_.find(url, ref);
    fs::remove_all(cached ? cached->path : cache_.path_for(url, ref), ec);
    cache_.erase(url, ref);
    auto saved = cache_.save();
    if (saved.is_err()) warnings_.push_back(saved.error);
}

Result<GitCacheEntry> GitLifecycleManager::ensure_cached(const std::string& url,
                                                         const std::string& ref,
                                                         StatusCallback cb) {
    auto existing = cache_.find(url, ref);
    if (existing && has_repository(existing->path)) {
        return Result<GitCacheEntry>::Ok(*existing);
    }

    GitCacheEntry entry;
    entry.url = url;
    entry.ref = ref;
    entry.path = cache_.path_for(url, ref);

    std::error_code ec;
    fs::remove_all(entry.path, ec);
    fs::create_directories(entry.path.parent_path(), ec);
    if (ec) {
        return Result<GitCacheEntry>::Err(ErrorCode::IoFailure,
            fmt::format("cannot create cache directory {}: {}",
                        entry.path.parent_path().string(), ec.message()));
    }

    if (cb) cb(fmt::format("Cloning {} into cache", url));
    auto cloned = git_check(git_.clone(url, entry.path), "git clone " + url);
    if (cloned.is_err()) {
        fs::remove_all(entry.path, ec);
        return propagate<GitCacheEntry>(cloned);
    }

    auto resolved = checkout_ref(entry.path, ref);
    if (resolved.is_err()) {
        fs::remove_all(entry.path, ec);
        return propagate<GitCacheEntry>(resolved);
    }
    entry.commit = resolved.value.commit;

    cache_.put(entry);
    auto saved = cache_.save();
    if (saved.is_err()) warnings_.push_back(saved.error);
    return Result<GitCacheEntry>::Ok(entry);
}

Result<void> GitLifecycleManager::refresh_clone(const fs::path& clone, GitCacheEntry& cached,
                                                StatusCallback cb) {
    if (cb) cb(fmt::format("Fetching {}", cached.url));
    auto fetched = git_check(git_.fetch(clone), "git fetch " + cached.url);
    if (fetched.is_err()) return fetched;

    auto resolved = checkout_ref(clone, cached.ref);
    if (resolved.is_err()) return propagate<void>(resolved);

    cached.commit = resolved.value.commit;
    cache_.put(cached);
    auto saved = cache_.save();
    if (saved.is_err()) warnings_.push_back(saved.error);
    return Result<void>::Ok();
}

Result<PreparedSource> GitLifecycleManager::from_temp_clone(const TemplateEntry& entry,
                                                            const std::string& ref,
                                                            StatusCallback cb) {
    PreparedSource source;
    source.is_url = true;
    try {
        source.scratch.emplace("templative-clone");
    } catch (const std::system_error& e) {
        return Result<PreparedSource>::Err(ErrorCode::IoFailure, e.what());
    }
    source.path = source.scratch->path() / "repo";

    if (cb) cb(fmt::format("Cloning {}", entry.location));
    auto cloned = git_check(git_.clone(entry.location, source.path), "git clone " + entry.location);
    if (cloned.is_err()) return propagate<PreparedSource>(cloned);

    auto resolved = checkout_ref(source.path, ref);
    if (resolved.is_err()) return propagate<PreparedSource>(resolved);

    source.commit = resolved.value.commit;
    source.has_history = true;
    return Result<PreparedSource>::Ok(std::move(source));
}

Result<PreparedSource> GitLifecycleManager::from_cache(const TemplateEntry& entry,
                                                       const std::string& ref,
                                                       bool refresh,
                                                       StatusCallback cb) {
    const std::string& url = entry.location;
    auto cached = cache_.find(url, ref);

    if (cached && !has_repository(cached->path)) {
        warnings_.push_back(fmt::format("Cache for '{}' is missing its repository; re-cloning",
                                        entry.name));
        discard(url, ref);
        cached.reset();
    }

    if (!cached) {
        auto created = ensure_cached(url, ref, cb);
        if (created.is_err()) {
            if (created.code != ErrorCode::IoFailure) return propagate<PreparedSource>(created);
            warnings_.push_back(fmt::format("Cache unusable ({}); cloning directly", created.error));
            discard(url, ref);
            return from_temp_clone(entry, ref, cb);
        }
        cached = created.value;
    } else if (refresh) {
        auto refreshed = refresh_clone(cached->path, *cached, cb);
        if (refreshed.is_err()) {
            warnings_.push_back(fmt::format("Cache refresh for '{}' failed; cloning directly",
                                            entry.name));
            discard(url, ref);
            return from_temp_clone(entry, ref, cb);
        }
    }

    PreparedSource source;
    source.path = cached->path;
    source.is_url = true;
    source.has_history = true;
    source.commit = cached->commit;
    return Result<PreparedSource>::Ok(std::move(source));
}

Result<PreparedSource> GitLifecycleManager::prepare_source(const TemplateEntry& entry,
                                                           const ResolvedOptions& options,
                                                           StatusCallback cb) {
    if (!is_git_url(entry.location)) {
        std::error_code ec;
        if (!fs::is_directory(entry.location, ec)) {
            return Result<PreparedSource>::Err(ErrorCode::TemplatePathMissing,
                fmt::format("template folder missing for '{}': {}", entry.name, entry.location));
        }
        PreparedSource source;
        source.path = entry.location;
        source.has_history = has_repository(source.path);
        return Result<PreparedSource>::Ok(std::move(source));
    }

    std::string ref = options.git_ref.value_or("");
    if (options.no_cache) return from_temp_clone(entry, ref, cb);
    return from_cache(entry, ref, options.refresh, cb);
}

// ── Post-copy lifecycle ────────────────────────────────────

static bool env_set(const char* name) {
    const char* value = std::getenv(name);
    return value && *value;
}

Result<void> GitLifecycleManager::check_identity(const fs::path& dir) {
    auto configured = [&](const char* key, const char* author_env, const char* committer_env) {
        if (env_set(author_env) && env_set(committer_env)) return true;
        auto result = git_.config_get(dir, key);
        return result.success() && !trimmed(result.stdout_data).empty();
    };

    bool name = configured("user.name", "GIT_AUTHOR_NAME", "GIT_COMMITTER_NAME");
    bool email = configured("user.email", "GIT_AUTHOR_EMAIL", "GIT_COMMITTER_EMAIL");
    if (name && email) return Result<void>::Ok();

    return Result<void>::Err(ErrorCode::GitIdentityMissing,
        "git identity is not configured. Run:\n"
        "  git config --global user.name \"Your Name\"\n"
        "  git config --global user.email \"you@example.com\"");
}

Result<void> GitLifecycleManager::apply_fresh(const fs::path& target, const std::string& name,
                                              StatusCallback cb) {
    std::error_code ec;
    fs::remove_all(target / GIT_DIR_NAME, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::IoFailure,
            fmt::format("{}: {}", (target / GIT_DIR_NAME).string(), ec.message()));
    }

    auto identity = check_identity(target);
    if (identity.is_err()) return identity;

    if (cb) cb("Initializing git repository");
    auto r = git_check(git_.init(target), "git init");
    if (r.is_err()) return r;
    r = git_check(git_.add_all(target), "git add");
    if (r.is_err()) return r;
    return git_check(git_.commit(target, fmt::format(fmt::runtime(FRESH_COMMIT_MESSAGE), name)),
                     "git commit");
}

Result<void> GitLifecycleManager::apply_preserve(const fs::path& target, const std::string& name,
                                                 const PreparedSource& source,
                                                 StatusCallback cb) {
    fs::path dest = target / GIT_DIR_NAME;
    try {
        fs::remove_all(dest);
        fs::copy(source.path / GIT_DIR_NAME, dest,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks);
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(ErrorCode::IoFailure,
            fmt::format("{}: {}", dest.string(), e.code().message()));
    }
    if (cb) cb("Preserved template history");

    auto status = git_.status_porcelain(target);
    auto r = git_check(status, "git status");
    if (r.is_err()) return r;
    if (trimmed(status.stdout_data).empty()) return Result<void>::Ok();

    auto identity = check_identity(target);
    if (identity.is_err()) return identity;

    if (cb) cb("Recording checkpoint commit");
    r = git_check(git_.add_all(target), "git add");
    if (r.is_err()) return r;
    return git_check(git_.commit(target, fmt::format(fmt::runtime(CHECKPOINT_COMMIT_MESSAGE), name)),
                     "git commit");
}

Result<void> GitLifecycleManager::apply(const fs::path& target,
                                        const ResolvedOptions& options,
                                        const TemplateEntry& entry,
                                        const PreparedSource& source,
                                        StatusCallback cb) {
    switch (options.git) {
        case GitMode::NoGit:
            return Result<void>::Ok();

        case GitMode::Fresh:
            return apply_fresh(target, entry.name, cb);

        case GitMode::Preserve:
            if (!source.has_history) {
                warnings_.push_back(fmt::format(
                    "Template '{}' has no git history to preserve; creating a fresh repository",
                    entry.name));
                return apply_fresh(target, entry.name, cb);
            }
            return apply_preserve(target, entry.name, source, cb);
    }
    return Result<void>::Ok();
}

// ── Update ─────────────────────────────────────────────────

Result<UpdateOutcome> GitLifecycleManager::update(const TemplateEntry& entry, bool no_cache,
                                                  bool check, StatusCallback cb) {
    UpdateOutcome outcome;

    if (!is_git_url(entry.location)) {
        outcome.status = UpdateStatus::NotApplicable;
        return Result<UpdateOutcome>::Ok(outcome);
    }
    if (no_cache) {
        outcome.status = UpdateStatus::CacheDisabled;
        return Result<UpdateOutcome>::Ok(outcome);
    }

    std::string ref = entry.git_ref.value_or("");
    if (!ref.empty() && looks_like_commit(ref)) {
        outcome.status = UpdateStatus::Pinned;
        return Result<UpdateOutcome>::Ok(outcome);
    }

    auto cached = cache_.find(entry.location, ref);
    if (!cached || !has_repository(cached->path)) {
        if (check) {
            outcome.status = UpdateStatus::NotCached;
            return Result<UpdateOutcome>::Ok(outcome);
        }
        if (cached) discard(entry.location, ref);
        auto created = ensure_cached(entry.location, ref, cb);
        if (created.is_err()) return propagate<UpdateOutcome>(created);
        outcome.status = UpdateStatus::Cached;
        outcome.new_commit = created.value.commit;
        return Result<UpdateOutcome>::Ok(outcome);
    }

    auto remote = remote_commit(entry.location, ref);
    if (remote.is_err()) return propagate<UpdateOutcome>(remote);

    outcome.old_commit = cached->commit;
    outcome.new_commit = remote.value;
    if (remote.value == cached->commit) {
        outcome.status = UpdateStatus::UpToDate;
        return Result<UpdateOutcome>::Ok(outcome);
    }
    if (check) {
        outcome.status = UpdateStatus::UpdateAvailable;
        return Result<UpdateOutcome>::Ok(outcome);
    }

    auto refreshed = refresh_clone(cached->path, *cached, cb);
    if (refreshed.is_err()) return propagate<UpdateOutcome>(refreshed);

    outcome.status = UpdateStatus::Updated;
    outcome.new_commit = cached->commit;
    return Result<UpdateOutcome>::Ok(outcome);
}
