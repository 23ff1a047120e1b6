#include "registry.hpp"
#include <core/constants.hpp>
#include <core/paths.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

static std::optional<std::string> read_optional_string(const YAML::Node& node, const char* key) {
    if (!node[key] || node[key].IsNull()) return std::nullopt;
    return node[key].as<std::string>();
}

template <typename T, typename Parser>
static std::optional<T> read_optional_enum(const YAML::Node& node, const char* key,
                                           Parser parse, const std::string& template_name) {
    if (!node[key] || node[key].IsNull()) return std::nullopt;
    std::string raw = node[key].as<std::string>();
    auto parsed = parse(raw);
    if (!parsed) {
        throw std::runtime_error(fmt::format("template '{}': invalid {} '{}'",
                                             template_name, key, raw));
    }
    return parsed;
}

static TemplateEntry parse_entry(const YAML::Node& n) {
    TemplateEntry e;
    e.name = n["name"].as<std::string>("");
    e.location = n["location"].as<std::string>("");
    if (e.name.empty() || e.location.empty()) {
        throw std::runtime_error("template entry requires 'name' and 'location'");
    }

    e.description = read_optional_string(n, "description");
    e.git_ref = read_optional_string(n, "git_ref");
    e.pre_init = read_optional_string(n, "pre_init");
    e.post_init = read_optional_string(n, "post_init");

    e.git = read_optional_enum<GitMode>(n, "git", parse_git_mode, e.name);
    e.write_mode = read_optional_enum<WriteMode>(n, "write_mode", parse_write_mode, e.name);
    e.symlinks = read_optional_enum<SymlinkMode>(n, "symlinks", parse_symlink_mode, e.name);

    if (n["exclude"] && !n["exclude"].IsNull()) {
        if (n["exclude"].IsSequence()) {
            e.exclude = n["exclude"].as<std::vector<std::string>>();
        } else {
            e.exclude = std::vector<std::string>{n["exclude"].as<std::string>()};
        }
    }

    if (n["no_cache"] && !n["no_cache"].IsNull()) {
        e.no_cache = n["no_cache"].as<bool>();
    }
    return e;
}

static void emit_optional(YAML::Emitter& out, const char* key,
                          const std::optional<std::string>& value) {
    if (value) out << YAML::Key << key << YAML::Value << *value;
}

Result<TemplateRegistry> TemplateRegistry::load() {
    fs::path path = get_registry_path();
    auto result = load_from_path(path);
    if (result.is_err()) return result;

    if (!fs::exists(path)) {
        auto saved = result.value.save_to_path(path);
        if (saved.is_err()) return propagate<TemplateRegistry>(saved);
    }
    return result;
}

Result<TemplateRegistry> TemplateRegistry::load_from_path(const fs::path& path) {
    TemplateRegistry registry;
    if (!fs::exists(path)) {
        return Result<TemplateRegistry>::Ok(registry);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<TemplateRegistry>::Ok(registry);
        }

        int version = root["version"].as<int>(0);
        if (version != REGISTRY_VERSION) {
            return Result<TemplateRegistry>::Err(ErrorCode::RegistryInvalid,
                fmt::format("unsupported registry version {} (expected {})",
                            version, REGISTRY_VERSION));
        }

        if (root["templates"] && root["templates"].IsSequence()) {
            for (const auto& n : root["templates"]) {
                TemplateEntry entry = parse_entry(n);
                if (registry.templates_.count(entry.name)) {
                    return Result<TemplateRegistry>::Err(ErrorCode::RegistryInvalid,
                        fmt::format("duplicate template name '{}' in {}", entry.name, path.string()));
                }
                registry.templates_[entry.name] = entry;
            }
        }

        return Result<TemplateRegistry>::Ok(registry);
    } catch (const std::exception& e) {
        return Result<TemplateRegistry>::Err(ErrorCode::RegistryInvalid,
            fmt::format("failed to parse registry {}: {}", path.string(), e.what()));
    }
}

Result<void> TemplateRegistry::save() const {
    return save_to_path(get_registry_path());
}

Result<void> TemplateRegistry::save_to_path(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << REGISTRY_VERSION;

    out << YAML::Key << "templates" << YAML::Value << YAML::BeginSeq;
    for (const auto& [name, e] : templates_) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << e.name;
        out << YAML::Key << "location" << YAML::Value << e.location;
        emit_optional(out, "description", e.description);
        emit_optional(out, "git_ref", e.git_ref);
        emit_optional(out, "pre_init", e.pre_init);
        emit_optional(out, "post_init", e.post_init);
        if (e.git) out << YAML::Key << "git" << YAML::Value << to_string(*e.git);
        if (e.exclude) {
            out << YAML::Key << "exclude" << YAML::Value << YAML::BeginSeq;
            for (const auto& pattern : *e.exclude) out << pattern;
            out << YAML::EndSeq;
        }
        if (e.write_mode) out << YAML::Key << "write_mode" << YAML::Value << to_string(*e.write_mode);
        if (e.symlinks) out << YAML::Key << "symlinks" << YAML::Value << to_string(*e.symlinks);
        if (e.no_cache) out << YAML::Key << "no_cache" << YAML::Value << *e.no_cache;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    // Write to a sibling temp file, then rename over the original
    try {
        fs::create_directories(path.parent_path());
        fs::path temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream fout(temp_path);
            if (!fout) {
                return Result<void>::Err(ErrorCode::IoFailure,
                    "failed to write registry: " + temp_path.string());
            }
            fout << out.c_str() << "\n";
        }
        fs::rename(temp_path, path);
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorCode::IoFailure,
            std::string("failed to write registry: ") + e.what());
    }
}

Result<void> TemplateRegistry::add(TemplateEntry entry) {
    if (templates_.count(entry.name)) {
        return Result<void>::Err(ErrorCode::TemplateExists,
            "template name already exists: " + entry.name);
    }
    std::string name = entry.name;
    templates_.emplace(name, std::move(entry));
    return Result<void>::Ok();
}

Result<void> TemplateRegistry::remove(const std::string& name) {
    if (!templates_.erase(name)) {
        return Result<void>::Err(ErrorCode::TemplateNotFound, "template not found: " + name);
    }
    return Result<void>::Ok();
}

Result<void> TemplateRegistry::replace(const std::string& old_name, TemplateEntry entry) {
    auto it = templates_.find(old_name);
    if (it == templates_.end()) {
        return Result<void>::Err(ErrorCode::TemplateNotFound, "template not found: " + old_name);
    }
    if (entry.name != old_name && templates_.count(entry.name)) {
        return Result<void>::Err(ErrorCode::TemplateExists,
            "template name already exists: " + entry.name);
    }
    templates_.erase(it);
    std::string name = entry.name;
    templates_.emplace(name, std::move(entry));
    return Result<void>::Ok();
}

const TemplateEntry* TemplateRegistry::get(const std::string& name) const {
    auto it = templates_.find(name);
    if (it == templates_.end()) return nullptr;
    return &it->second;
}

std::vector<TemplateEntry> TemplateRegistry::entries_sorted() const {
    std::vector<TemplateEntry> entries;
    entries.reserve(templates_.size());
    for (const auto& [name, entry] : templates_) {
        entries.push_back(entry);
    }
    return entries;
}
