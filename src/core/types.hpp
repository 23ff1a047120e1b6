#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Error categories surfaced to the user. Each maps to one process exit code
// (see exit_code_for in errors.hpp).
enum class ErrorCode {
    None,
    General,
    Usage,
    ConfigInvalid,
    RegistryInvalid,
    TemplateNotFound,
    TemplateExists,
    TemplatePathMissing,
    DangerousPath,
    SourceUnreadable,
    RecursiveInit,
    CollisionStrict,
    CollisionNoOverwrite,
    SymlinkCycle,
    IoFailure,
    GitFailure,
    GitIdentityMissing,
    HookFailure,
    UpdateFailed,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorCode::General};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorCode::General};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Forward a failure from one Result type into another.
template <typename To, typename From>
Result<To> propagate(const Result<From>& from) {
    return Result<To>::Err(from.code, from.error);
}

// Child process execution result
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    // stdout followed by stderr, trimmed of trailing newlines
    std::string combined_output() const;
};

// ── Option enums ─────────────────────────────────────────────

enum class GitMode { Fresh, Preserve, NoGit };

enum class WriteMode { Strict, NoOverwrite, SkipOverwrite, Overwrite, Ask };

enum class SymlinkMode { Default, Literal, Resolve };

enum class ColorMode { Auto, Always, Never };

std::optional<GitMode> parse_git_mode(const std::string& s);
std::optional<WriteMode> parse_write_mode(const std::string& s);
std::optional<SymlinkMode> parse_symlink_mode(const std::string& s);
std::optional<ColorMode> parse_color_mode(const std::string& s);

const char* to_string(GitMode mode);
const char* to_string(WriteMode mode);
const char* to_string(SymlinkMode mode);
const char* to_string(ColorMode mode);

// ── Template registry entry ──────────────────────────────────

struct TemplateEntry {
    std::string name;
    std::string location;                        // absolute path or git URL
    std::optional<std::string> description;
    std::optional<std::string> git_ref;          // branch, tag or commit (URL templates)
    std::optional<std::string> pre_init;
    std::optional<std::string> post_init;

    // Per-template overrides of the global defaults
    std::optional<GitMode> git;
    std::optional<std::vector<std::string>> exclude;
    std::optional<WriteMode> write_mode;
    std::optional<SymlinkMode> symlinks;
    std::optional<bool> no_cache;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
