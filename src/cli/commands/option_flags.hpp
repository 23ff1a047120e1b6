#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <managers/options_resolver.hpp>
#include "../args.hpp"

// Flags shared by init, add and change
extern const std::vector<FlagSpec> OVERRIDE_FLAGS;

// Read --git-mode/--fresh/--preserve/--no-git, --write-mode, --exclude,
// --symlinks, --no-cache and --refresh. Invalid values are Usage errors.
Result<CliOverrides> read_overrides(const ArgReader& args);

Result<GitMode> parse_git_flag(const std::string& flag, const std::string& value);
Result<WriteMode> parse_write_flag(const std::string& flag, const std::string& value);
Result<SymlinkMode> parse_symlink_flag(const std::string& flag, const std::string& value);
