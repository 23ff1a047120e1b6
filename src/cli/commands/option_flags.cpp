#include "option_flags.hpp"
#include <managers/exclude_matcher.hpp>
#include <fmt/format.h>

const std::vector<FlagSpec> OVERRIDE_FLAGS = {
    {"--git-mode", true},
    {"--fresh", false},
    {"--preserve", false},
    {"--no-git", false},
    {"--write-mode", true},
    {"--exclude", true},
    {"--symlinks", true},
    {"--no-cache", false},
};

Result<GitMode> parse_git_flag(const std::string& flag, const std::string& value) {
    auto mode = parse_git_mode(value);
    if (!mode) {
        return Result<GitMode>::Err(ErrorCode::Usage,
            fmt::format("invalid {} '{}' (expected fresh, preserve or no-git)", flag, value));
    }
    return Result<GitMode>::Ok(*mode);
}

Result<WriteMode> parse_write_flag(const std::string& flag, const std::string& value) {
    auto mode = parse_write_mode(value);
    if (!mode) {
        return Result<WriteMode>::Err(ErrorCode::Usage,
            fmt::format("invalid {} '{}' (expected strict, no-overwrite, skip-overwrite, "
                        "overwrite or ask)", flag, value));
    }
    return Result<WriteMode>::Ok(*mode);
}

Result<SymlinkMode> parse_symlink_flag(const std::string& flag, const std::string& value) {
    auto mode = parse_symlink_mode(value);
    if (!mode) {
        return Result<SymlinkMode>::Err(ErrorCode::Usage,
            fmt::format("invalid {} '{}' (expected default, literal or resolve)", flag, value));
    }
    return Result<SymlinkMode>::Ok(*mode);
}

Result<CliOverrides> read_overrides(const ArgReader& args) {
    CliOverrides o;

    std::vector<GitMode> git_modes;
    for (const auto& value : args.get_all("--git-mode")) {
        auto mode = parse_git_flag("--git-mode", value);
        if (mode.is_err()) return propagate<CliOverrides>(mode);
        git_modes.push_back(mode.value);
    }
    if (args.has("--fresh")) git_modes.push_back(GitMode::Fresh);
    if (args.has("--preserve")) git_modes.push_back(GitMode::Preserve);
    if (args.has("--no-git")) git_modes.push_back(GitMode::NoGit);

    for (auto mode : git_modes) {
        if (mode != git_modes.front()) {
            return Result<CliOverrides>::Err(ErrorCode::Usage, "conflicting git mode options");
        }
    }
    if (!git_modes.empty()) o.git = git_modes.front();

    if (auto value = args.get("--write-mode")) {
        auto mode = parse_write_flag("--write-mode", *value);
        if (mode.is_err()) return propagate<CliOverrides>(mode);
        o.write_mode = mode.value;
    }

    if (args.has("--exclude")) {
        o.exclude = args.get_all("--exclude");
        auto valid = ExcludeMatcher::validate(*o.exclude);
        if (valid.is_err()) return propagate<CliOverrides>(valid);
    }

    if (auto value = args.get("--symlinks")) {
        auto mode = parse_symlink_flag("--symlinks", *value);
        if (mode.is_err()) return propagate<CliOverrides>(mode);
        o.symlinks = mode.value;
    }

    if (args.has("--no-cache")) o.no_cache = true;
    o.refresh = args.has("--refresh");
    return Result<CliOverrides>::Ok(o);
}
