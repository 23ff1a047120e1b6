#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <regex>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Glob exclusion for template materialization.
//
// A relative path is excluded when any of its components, or the whole
// path, fully matches one of the patterns. ".git" is always excluded.
// Supported syntax: "*" and "?" (never cross "/"), "**" (crosses "/"),
// "[abc]" / "[!abc]" character classes, "\" escapes.
class ExcludeMatcher {
public:
    explicit ExcludeMatcher(const std::vector<std::string>& patterns);

    // path is relative to the template root
    bool is_excluded(const fs::path& relative_path) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

    // Set when a pattern could not be compiled; that pattern never matches
    const std::optional<std::string>& error() const { return error_; }

    // Usage error naming the first pattern that does not compile
    static Result<void> validate(const std::vector<std::string>& patterns);

    // Exposed for tests
    static std::string glob_to_regex(const std::string& glob);

private:
    std::vector<std::string> patterns_;
    std::vector<std::regex> compiled_;
    std::optional<std::string> error_;

    bool matches_any(const std::string& text) const;
};
