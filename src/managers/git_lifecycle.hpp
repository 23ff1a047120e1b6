#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include "git_client.hpp"
#include "git_cache.hpp"
#include "options_resolver.hpp"

namespace fs = std::filesystem;

// Directory a template is materialized from. For URL templates this is a
// cache directory or an invocation-scoped clone that is removed when the
// PreparedSource is destroyed.
struct PreparedSource {
    fs::path path;
    bool is_url = false;
    bool has_history = false;        // path/.git is a usable repository
    std::string commit;              // resolved commit (URL templates)
    std::optional<platform::TempDirectory> scratch;
};

enum class UpdateStatus {
    UpdateAvailable,
    UpToDate,
    Updated,
    Pinned,
    NotCached,
    Cached,
    CacheDisabled,
    NotApplicable,
};

const char* to_string(UpdateStatus status);

struct UpdateOutcome {
    UpdateStatus status = UpdateStatus::NotApplicable;
    std::string old_commit;
    std::string new_commit;
};

// Remote ref resolved to a commit. branch is set when the ref names a
// branch (or is the remote default), so checkouts can stay on a branch.
struct ResolvedRef {
    std::string commit;
    std::optional<std::string> branch;
};

class GitLifecycleManager {
public:
    GitLifecycleManager(GitClient& git, GitCache& cache);

    // Locate or fetch the tree to copy from. Local templates must be an
    // existing directory. URL templates are resolved to a commit and served
    // from the cache unless caching is disabled; an unusable cache entry is
    // discarded and replaced by a direct temporary clone.
    Result<PreparedSource> prepare_source(const TemplateEntry& entry,
                                          const ResolvedOptions& options,
                                          StatusCallback cb = nullptr);

    // Post-copy git stage for the target. Does not roll back files on error.
    Result<void> apply(const fs::path& target,
                       const ResolvedOptions& options,
                       const TemplateEntry& entry,
                       const PreparedSource& source,
                       StatusCallback cb = nullptr);

    // Compare (check) or refresh (apply) the cached clone of one template.
    Result<UpdateOutcome> update(const TemplateEntry& entry, bool no_cache, bool check,
                                 StatusCallback cb = nullptr);

    // Clone (url, ref) into the cache if absent and record it.
    Result<GitCacheEntry> ensure_cached(const std::string& url, const std::string& ref,
                                        StatusCallback cb = nullptr);

    // Current commit of ref on the remote, via ls-remote.
    Result<std::string> remote_commit(const std::string& url, const std::string& ref);

    // Resolve ref inside an existing clone (after clone or fetch).
    Result<ResolvedRef> resolve_local(const fs::path& clone, const std::string& ref);

    // user.name / user.email from git config, or the GIT_AUTHOR_* and
    // GIT_COMMITTER_* environment.
    Result<void> check_identity(const fs::path& dir);

    // Non-fatal problems seen so far (cache fallback, preserve fallback)
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    GitClient& git_;
    GitCache& cache_;
    std::vector<std::string> warnings_;

    Result<ResolvedRef> checkout_ref(const fs::path& clone, const std::string& ref);
    Result<PreparedSource> from_cache(const TemplateEntry& entry, const std::string& ref,
                                      bool refresh, StatusCallback cb);
    Result<PreparedSource> from_temp_clone(const TemplateEntry& entry, const std::string& ref,
                                           StatusCallback cb);
    Result<void> refresh_clone(const fs::path& clone, GitCacheEntry& cached, StatusCallback cb);
    void discard(const std::string& url, const std::string& ref);

    Result<void> apply_fresh(const fs::path& target, const std::string& name, StatusCallback cb);
    Result<void> apply_preserve(const fs::path& target, const std::string& name,
                                const PreparedSource& source, StatusCallback cb);
};
