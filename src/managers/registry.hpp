#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Named template entries persisted in templates.yaml. Entries are keyed by
// name and enumerate in name order.
class TemplateRegistry {
public:
    TemplateRegistry() = default;

    // Load from the default registry path, creating the file on first run
    static Result<TemplateRegistry> load();

    // Load from an explicit path. A missing file yields an empty registry.
    static Result<TemplateRegistry> load_from_path(const fs::path& path);

    Result<void> save() const;
    Result<void> save_to_path(const fs::path& path) const;

    Result<void> add(TemplateEntry entry);
    Result<void> remove(const std::string& name);

    // Replace the entry stored under old_name (the entry may carry a new name).
    Result<void> replace(const std::string& old_name, TemplateEntry entry);

    const TemplateEntry* get(const std::string& name) const;
    bool contains(const std::string& name) const { return templates_.count(name) > 0; }
    bool empty() const { return templates_.empty(); }
    size_t size() const { return templates_.size(); }

    std::vector<TemplateEntry> entries_sorted() const;

private:
    std::map<std::string, TemplateEntry> templates_;
};
