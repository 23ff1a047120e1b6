#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Configuration directory holding config.yaml and templates.yaml.
// $TEMPLATIVE_CONFIG_DIR, else $XDG_CONFIG_HOME/templative,
// else $HOME/.config/templative.
fs::path get_config_dir();
fs::path get_config_path();
fs::path get_registry_path();

// Root of the URL template cache.
// $TEMPLATIVE_CACHE_DIR, else $XDG_CACHE_HOME/templative,
// else $HOME/.cache/templative.
fs::path get_cache_root();

// True for targets that must never be initialized into: "/" and $HOME.
// The path should already be canonical.
bool is_dangerous_path(const fs::path& path);

// True if path is a directory with no entries. Throws fs::filesystem_error
// if the directory cannot be read.
bool is_dir_empty(const fs::path& path);
