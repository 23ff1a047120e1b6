#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct GitCacheEntry {
    std::string url;
    std::string ref;         // "" = remote default branch
    fs::path path;           // local clone
    std::string commit;      // last resolved commit
};

// Keyed store (url, ref) -> local clone, persisted in <root>/index.yaml.
// Nothing is invalidated automatically; entries change only through put()
// and erase(). Concurrent invocations updating the same key are not guarded.
class GitCache {
public:
    explicit GitCache(fs::path root);

    // Missing index -> empty cache. A malformed index also leaves the cache
    // empty, but is reported so the caller can warn.
    Result<void> load();
    Result<void> save() const;

    std::optional<GitCacheEntry> find(const std::string& url, const std::string& ref) const;
    void put(const GitCacheEntry& entry);
    void erase(const std::string& url, const std::string& ref);

    // Directory a clone for (url, ref) lives in: <root>/repos/<basename>-<hash>
    fs::path path_for(const std::string& url, const std::string& ref) const;

    const fs::path& root() const { return root_; }
    fs::path index_path() const;
    std::vector<GitCacheEntry> entries() const;

private:
    fs::path root_;
    std::map<std::pair<std::string, std::string>, GitCacheEntry> entries_;
};
