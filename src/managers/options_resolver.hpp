#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>

// Values given explicitly on the command line. Unset means "not given".
struct CliOverrides {
    std::optional<GitMode> git;
    std::optional<WriteMode> write_mode;
    std::optional<std::vector<std::string>> exclude;
    std::optional<SymlinkMode> symlinks;
    std::optional<bool> no_cache;
    bool refresh = false;                 // re-fetch a cached URL template
};

// Effective settings for one invocation. Every field holds exactly one value.
struct ResolvedOptions {
    GitMode git = GitMode::Fresh;
    WriteMode write_mode = WriteMode::Strict;
    std::vector<std::string> exclude;
    SymlinkMode symlinks = SymlinkMode::Default;
    bool no_cache = false;
    bool refresh = false;

    // Template-only values, carried through unchanged
    std::optional<std::string> git_ref;
    std::optional<std::string> pre_init;
    std::optional<std::string> post_init;
};

// Per field: CLI value if given, else the template's override if present,
// else the config default. Pure; never fails.
ResolvedOptions resolve_options(const CliOverrides& cli,
                                const TemplateEntry* entry,
                                const Config& config);
