#include "git_cache.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

GitCache::GitCache(fs::path root) : root_(std::move(root)) {
}

fs::path GitCache::index_path() const {
    return root_ / CACHE_INDEX_FILENAME;
}

fs::path GitCache::path_for(const std::string& url, const std::string& ref) const {
    std::string base = url_basename(url);
    if (base.empty()) base = "repo";
    return root_ / "repos" / fmt::format("{}-{}", base, fnv1a_hex(url + "\n" + ref));
}

Result<void> GitCache::load() {
    entries_.clear();
    fs::path path = index_path();
    if (!fs::exists(path)) return Result<void>::Ok();

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) return Result<void>::Ok();

        int version = root["version"].as<int>(0);
        if (version != CACHE_INDEX_VERSION) {
            return Result<void>::Err(ErrorCode::IoFailure,
                fmt::format("unsupported cache index version {} in {}", version, path.string()));
        }

        if (root["entries"] && root["entries"].IsSequence()) {
            for (const auto& n : root["entries"]) {
                GitCacheEntry e;
                e.url = n["url"].as<std::string>("");
                e.ref = n["ref"].as<std::string>("");
                e.path = n["path"].as<std::string>("");
                e.commit = n["commit"].as<std::string>("");
                if (e.url.empty() || e.path.empty()) continue;
                entries_[{e.url, e.ref}] = e;
            }
        }
        return Result<void>::Ok();
    } catch (const YAML::Exception& e) {
        entries_.clear();
        return Result<void>::Err(ErrorCode::IoFailure,
            fmt::format("ignoring corrupt cache index {}: {}", path.string(), e.what()));
    }
}

Result<void> GitCache::save() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << CACHE_INDEX_VERSION;
    out << YAML::Key << "entries" << YAML::Value << YAML::BeginSeq;
    for (const auto& [key, e] : entries_) {
        out << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << e.url;
        out << YAML::Key << "ref" << YAML::Value << e.ref;
        out << YAML::Key << "path" << YAML::Value << e.path.string();
        out << YAML::Key << "commit" << YAML::Value << e.commit;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    try {
        fs::create_directories(root_);
        fs::path temp_path = index_path();
        temp_path += ".tmp";
        {
            std::ofstream fout(temp_path);
            if (!fout) {
                return Result<void>::Err(ErrorCode::IoFailure,
                    "failed to write cache index: " + temp_path.string());
            }
            fout << out.c_str() << "\n";
        }
        fs::rename(temp_path, index_path());
        return Result<void>::Ok();
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(ErrorCode::IoFailure,
            std::string("failed to write cache index: ") + e.what());
    }
}

std::optional<GitCacheEntry> GitCache::find(const std::string& url, const std::string& ref) const {
    auto it = entries_.find({url, ref});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void GitCache::put(const GitCacheEntry& entry) {
    entries_[{entry.url, entry.ref}] = entry;
}

void GitCache::erase(const std::string& url, const std::string& ref) {
    entries_.erase({url, ref});
}

std::vector<GitCacheEntry> GitCache::entries() const {
    std::vector<GitCacheEntry> result;
    for (const auto& [key, e] : entries_) result.push_back(e);
    return result;
}
