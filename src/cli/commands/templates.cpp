#include "../templative_cli.hpp"
#include "../theme.hpp"
#include "option_flags.hpp"
#include <core/constants.hpp>
#include <core/paths.hpp>
#include <core/utils.hpp>
#include <managers/exclude_matcher.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

// Canonical directory for a local template, or the URL unchanged.
static Result<std::string> normalize_location(const std::string& raw) {
    if (is_git_url(raw)) return Result<std::string>::Ok(raw);

    std::error_code ec;
    fs::path path = fs::canonical(raw, ec);
    if (ec || !fs::is_directory(path, ec)) {
        return Result<std::string>::Err(ErrorCode::TemplatePathMissing,
            fmt::format("not a directory: {}", raw));
    }
    return Result<std::string>::Ok(path.string());
}

static std::string default_name(const std::string& location) {
    if (is_git_url(location)) return url_basename(location);
    return fs::path(location).filename().string();
}

// "" clears an optional string field
static std::optional<std::string> optional_text(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

// ── add ────────────────────────────────────────────────────

static Result<void> do_add(TemplativeCLI& cli, const ArgReader& args) {
    if (args.positionals().size() > 1) {
        return Result<void>::Err(ErrorCode::Usage, "too many arguments");
    }

    auto location = normalize_location(args.positional(0).value_or("."));
    if (location.is_err()) return propagate<void>(location);

    auto overrides = read_overrides(args);
    if (overrides.is_err()) return propagate<void>(overrides);
    const auto& o = overrides.value;

    TemplateEntry entry;
    entry.location = location.value;
    entry.name = args.get("--name").value_or(default_name(entry.location));
    if (entry.name.empty()) {
        return Result<void>::Err(ErrorCode::Usage, "cannot derive a template name; pass --name");
    }

    if (auto d = args.get("--description")) entry.description = optional_text(*d);
    if (auto r = args.get("--git-ref")) {
        if (!is_git_url(entry.location)) {
            return Result<void>::Err(ErrorCode::Usage, "--git-ref applies only to git URL templates");
        }
        entry.git_ref = optional_text(*r);
    }
    if (auto h = args.get("--pre-init")) entry.pre_init = optional_text(*h);
    if (auto h = args.get("--post-init")) entry.post_init = optional_text(*h);
    entry.git = o.git;
    entry.write_mode = o.write_mode;
    entry.exclude = o.exclude;
    entry.symlinks = o.symlinks;
    entry.no_cache = o.no_cache;

    auto loaded = cli.require_registry();
    if (loaded.is_err()) return loaded;

    auto& registry = cli.registry();
    if (registry.contains(entry.name)) {
        return Result<void>::Err(ErrorCode::TemplateExists,
            fmt::format("template name already exists: {}", entry.name));
    }

    bool no_cache = entry.no_cache.value_or(cli.config().no_cache());
    if (is_git_url(entry.location) && !no_cache) {
        auto cached = cli.lifecycle().ensure_cached(entry.location, entry.git_ref.value_or(""),
                                                    cli.status_callback());
        cli.print_warnings(cli.lifecycle().warnings());
        if (cached.is_err()) return propagate<void>(cached);
        std::cout << theme::log(fmt::format("Cached at {}", short_sha(cached.value.commit)));
    }

    auto added = registry.add(entry);
    if (added.is_err()) return added;
    auto saved = registry.save();
    if (saved.is_err()) return saved;

    std::cout << theme::ok(fmt::format("Added template '{}' -> {}", entry.name, entry.location));
    return Result<void>::Ok();
}

// ── remove ─────────────────────────────────────────────────

static Result<void> do_remove(TemplativeCLI& cli, const ArgReader& args) {
    const auto& names = args.positionals();
    if (names.empty()) return Result<void>::Err(ErrorCode::Usage, "missing template name");

    auto loaded = cli.require_registry();
    if (loaded.is_err()) return loaded;

    auto& registry = cli.registry();
    for (const auto& name : names) {
        if (!registry.contains(name)) {
            return Result<void>::Err(ErrorCode::TemplateNotFound,
                fmt::format("template not found: {}", name));
        }
    }
    for (const auto& name : names) {
        auto removed = registry.remove(name);
        if (removed.is_err()) return removed;
    }

    auto saved = registry.save();
    if (saved.is_err()) return saved;
    for (const auto& name : names) {
        std::cout << theme::ok(fmt::format("Removed template '{}'", name));
    }
    return Result<void>::Ok();
}

// ── change ─────────────────────────────────────────────────

static const std::vector<FlagSpec> CHANGE_FLAGS = {
    {"--name", true},
    {"--description", true},
    {"--location", true},
    {"--git-ref", true},
    {"--pre-init", true},
    {"--post-init", true},
    {"--git-mode", true},
    {"--write-mode", true},
    {"--symlinks", true},
    {"--no-cache", true},
    {"--exclude", true},
    {"--clear-exclude", false},
};

// Applies "--flag <mode|none>" to an optional enum override
template <typename T, typename Parser>
static Result<void> change_enum(const ArgReader& args, const std::string& flag,
                                Parser parse, std::optional<T>& field, bool& changed) {
    auto value = args.get(flag);
    if (!value) return Result<void>::Ok();
    changed = true;
    if (*value == "none") {
        field.reset();
        return Result<void>::Ok();
    }
    auto parsed = parse(flag, *value);
    if (parsed.is_err()) return propagate<void>(parsed);
    field = parsed.value;
    return Result<void>::Ok();
}

static Result<void> do_change(TemplativeCLI& cli, const ArgReader& args) {
    auto name = args.positional(0);
    if (!name) return Result<void>::Err(ErrorCode::Usage, "missing template name");
    if (args.positionals().size() > 1) {
        return Result<void>::Err(ErrorCode::Usage, "too many arguments");
    }
    if (args.has("--exclude") && args.has("--clear-exclude")) {
        return Result<void>::Err(ErrorCode::Usage, "--exclude and --clear-exclude conflict");
    }

    auto loaded = cli.require_registry();
    if (loaded.is_err()) return loaded;

    const TemplateEntry* current = cli.registry().get(*name);
    if (!current) {
        return Result<void>::Err(ErrorCode::TemplateNotFound,
            fmt::format("template not found: {}", *name));
    }

    TemplateEntry entry = *current;
    bool changed = false;

    if (auto v = args.get("--name")) {
        if (trimmed(*v).empty()) return Result<void>::Err(ErrorCode::Usage, "--name cannot be empty");
        entry.name = *v;
        changed = true;
    }
    if (auto v = args.get("--location")) {
        auto location = normalize_location(*v);
        if (location.is_err()) return propagate<void>(location);
        entry.location = location.value;
        changed = true;
    }
    if (auto v = args.get("--description")) { entry.description = optional_text(*v); changed = true; }
    if (auto v = args.get("--git-ref"))     { entry.git_ref = optional_text(*v); changed = true; }
    if (auto v = args.get("--pre-init"))    { entry.pre_init = optional_text(*v); changed = true; }
    if (auto v = args.get("--post-init"))   { entry.post_init = optional_text(*v); changed = true; }

    auto r = change_enum<GitMode>(args, "--git-mode", parse_git_flag, entry.git, changed);
    if (r.is_err()) return r;
    r = change_enum<WriteMode>(args, "--write-mode", parse_write_flag, entry.write_mode, changed);
    if (r.is_err()) return r;
    r = change_enum<SymlinkMode>(args, "--symlinks", parse_symlink_flag, entry.symlinks, changed);
    if (r.is_err()) return r;

    if (auto v = args.get("--no-cache")) {
        if (*v == "none") entry.no_cache.reset();
        else if (*v == "true") entry.no_cache = true;
        else if (*v == "false") entry.no_cache = false;
        else {
            return Result<void>::Err(ErrorCode::Usage,
                fmt::format("invalid --no-cache '{}' (expected true, false or none)", *v));
        }
        changed = true;
    }

    if (args.has("--exclude")) {
        entry.exclude = args.get_all("--exclude");
        auto valid = ExcludeMatcher::validate(*entry.exclude);
        if (valid.is_err()) return valid;
        changed = true;
    }
    if (args.has("--clear-exclude")) { entry.exclude.reset(); changed = true; }

    if (!changed) return Result<void>::Err(ErrorCode::Usage, "nothing to change");

    if (entry.git_ref && !is_git_url(entry.location)) {
        return Result<void>::Err(ErrorCode::Usage, "--git-ref applies only to git URL templates");
    }

    auto replaced = cli.registry().replace(*name, entry);
    if (replaced.is_err()) return replaced;
    auto saved = cli.registry().save();
    if (saved.is_err()) return saved;

    if (entry.name != *name) {
        std::cout << theme::ok(fmt::format("Renamed template '{}' to '{}'", *name, entry.name));
    } else {
        std::cout << theme::ok(fmt::format("Updated template '{}'", entry.name));
    }
    return Result<void>::Ok();
}

// ── list ───────────────────────────────────────────────────

static std::vector<std::string> status_notes(const TemplateEntry& entry) {
    std::vector<std::string> notes;
    if (is_git_url(entry.location)) {
        notes.push_back("(url)");
        if (entry.git_ref) notes.push_back(fmt::format("(git ref {})", *entry.git_ref));
        return notes;
    }

    std::error_code ec;
    fs::path path(entry.location);
    if (!fs::is_directory(path, ec)) {
        notes.push_back("(folder missing)");
        return notes;
    }
    try {
        if (is_dir_empty(path)) notes.push_back("(folder empty)");
    } catch (const fs::filesystem_error&) {
        notes.push_back("(folder unreadable)");
        return notes;
    }
    if (!fs::exists(path / GIT_DIR_NAME, ec)) notes.push_back("(no git)");
    return notes;
}

static Result<void> do_list(TemplativeCLI& cli, const ArgReader& args) {
    if (!args.positionals().empty()) {
        return Result<void>::Err(ErrorCode::Usage, "list takes no arguments");
    }
    auto loaded = cli.require_registry();
    if (loaded.is_err()) return loaded;

    auto entries = cli.registry().entries_sorted();
    if (entries.empty()) {
        std::cout << theme::info("No templates registered. Add one with 'templative add <path>'.");
        return Result<void>::Ok();
    }

    struct Row { std::string name, status, description, location; bool problem; };
    std::vector<Row> rows;
    size_t w_name = 4, w_status = 6, w_desc = 11;

    for (const auto& e : entries) {
        auto notes = status_notes(e);
        std::string status;
        for (const auto& n : notes) status += (status.empty() ? "" : " ") + n;
        bool problem = status.find("missing") != std::string::npos
                    || status.find("empty") != std::string::npos
                    || status.find("unreadable") != std::string::npos;
        if (status.empty()) status = "ok";

        rows.push_back({e.name, status, e.description.value_or(""), e.location, problem});
        w_name = std::max(w_name, e.name.size());
        w_status = std::max(w_status, status.size());
        w_desc = std::max(w_desc, rows.back().description.size());
    }

    std::cout << "\n" << theme::dim(fmt::format("    {:<{}}  {:<{}}  {:<{}}  {}",
                                                "NAME", w_name, "STATUS", w_status,
                                                "DESCRIPTION", w_desc, "LOCATION")) << "\n";
    for (const auto& row : rows) {
        std::string status = fmt::format("{:<{}}", row.status, w_status);
        std::cout << "    " << theme::blue(fmt::format("{:<{}}", row.name, w_name)) << "  "
                  << (row.problem ? theme::yellow(status) : theme::green(status)) << "  "
                  << fmt::format("{:<{}}", row.description, w_desc) << "  "
                  << theme::dim(row.location) << "\n";
    }
    std::cout << "\n";
    return Result<void>::Ok();
}

void register_template_commands(TemplativeCLI& cli) {
    std::vector<FlagSpec> add_flags = OVERRIDE_FLAGS;
    add_flags.insert(add_flags.end(), {
        {"--name", true},
        {"--description", true},
        {"--git-ref", true},
        {"--pre-init", true},
        {"--post-init", true},
    });

    cli.add_command("add", {do_add, add_flags, "add [path|url]", "Register a template"});
    cli.add_command("remove", {do_remove, {}, "remove <template>...", "Unregister templates"});
    cli.add_command("change", {do_change, CHANGE_FLAGS, "change <template>",
                               "Edit a registered template"});
    cli.add_command("list", {do_list, {}, "list", "List registered templates"});
}
