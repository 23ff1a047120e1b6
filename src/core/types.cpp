#include "types.hpp"

std::string ProcessResult::combined_output() const {
    std::string out = stdout_data;
    if (!stderr_data.empty()) {
        if (!out.empty() && out.back() != '\n') out += '\n';
        out += stderr_data;
    }
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    return out;
}

std::optional<GitMode> parse_git_mode(const std::string& s) {
    if (s == "fresh") return GitMode::Fresh;
    if (s == "preserve") return GitMode::Preserve;
    if (s == "no-git" || s == "none") return GitMode::NoGit;
    return std::nullopt;
}

std::optional<WriteMode> parse_write_mode(const std::string& s) {
    if (s == "strict") return WriteMode::Strict;
    if (s == "no-overwrite") return WriteMode::NoOverwrite;
    if (s == "skip-overwrite") return WriteMode::SkipOverwrite;
    if (s == "overwrite") return WriteMode::Overwrite;
    if (s == "ask") return WriteMode::Ask;
    return std::nullopt;
}

std::optional<SymlinkMode> parse_symlink_mode(const std::string& s) {
    if (s == "default") return SymlinkMode::Default;
    if (s == "literal") return SymlinkMode::Literal;
    if (s == "resolve") return SymlinkMode::Resolve;
    return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(const std::string& s) {
    if (s == "auto") return ColorMode::Auto;
    if (s == "always" || s == "true") return ColorMode::Always;
    if (s == "never" || s == "false") return ColorMode::Never;
    return std::nullopt;
}

const char* to_string(GitMode mode) {
    switch (mode) {
        case GitMode::Fresh:    return "fresh";
        case GitMode::Preserve: return "preserve";
        case GitMode::NoGit:    return "no-git";
    }
    return "fresh";
}

const char* to_string(WriteMode mode) {
    switch (mode) {
        case WriteMode::Strict:        return "strict";
        case WriteMode::NoOverwrite:   return "no-overwrite";
        case WriteMode::SkipOverwrite: return "skip-overwrite";
        case WriteMode::Overwrite:     return "overwrite";
        case WriteMode::Ask:           return "ask";
    }
    return "strict";
}

const char* to_string(SymlinkMode mode) {
    switch (mode) {
        case SymlinkMode::Default: return "default";
        case SymlinkMode::Literal: return "literal";
        case SymlinkMode::Resolve: return "resolve";
    }
    return "default";
}

const char* to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::Auto:   return "auto";
        case ColorMode::Always: return "always";
        case ColorMode::Never:  return "never";
    }
    return "auto";
}
