#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Global defaults. Every field always has a value, so option resolution
// against a Config can never leave anything unset.
class Config {
public:
    Config();

    // Load ~/.config/templative/config.yaml, writing the defaults on first run
    static Result<Config> load();

    // Load from an explicit path. A missing file yields the defaults.
    static Result<Config> load_from_path(const fs::path& path);

    Result<void> save_to_path(const fs::path& path) const;

    // Accessors
    int version() const { return version_; }
    ColorMode color() const { return color_; }
    GitMode git() const { return git_; }
    const std::vector<std::string>& exclude() const { return exclude_; }
    WriteMode write_mode() const { return write_mode_; }
    SymlinkMode symlinks() const { return symlinks_; }
    bool no_cache() const { return no_cache_; }

    // Mutators (used by tests and first-run setup)
    void set_color(ColorMode v) { color_ = v; }
    void set_git(GitMode v) { git_ = v; }
    void set_exclude(std::vector<std::string> v) { exclude_ = std::move(v); }
    void set_write_mode(WriteMode v) { write_mode_ = v; }
    void set_symlinks(SymlinkMode v) { symlinks_ = v; }
    void set_no_cache(bool v) { no_cache_ = v; }

private:
    int version_;
    ColorMode color_ = ColorMode::Auto;
    GitMode git_ = GitMode::Fresh;
    std::vector<std::string> exclude_;
    WriteMode write_mode_ = WriteMode::Strict;
    SymlinkMode symlinks_ = SymlinkMode::Default;
    bool no_cache_ = false;
};
