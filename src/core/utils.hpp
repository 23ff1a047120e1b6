#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// True for remote git locations: scheme URLs (https, http, ssh, git, file)
// and scp-like "user@host:path".
bool is_git_url(const std::string& location);

// 64-bit FNV-1a over the input, rendered as 16 lowercase hex digits.
std::string fnv1a_hex(const std::string& input);

// Last path segment of a URL without a trailing ".git", e.g.
// "https://host/org/skeleton.git" -> "skeleton".
std::string url_basename(const std::string& url);

// First SHORT_SHA_LENGTH characters of a commit hash.
std::string short_sha(const std::string& sha);

// True if s is 7-40 hex digits (looks like an abbreviated or full commit).
bool looks_like_commit(const std::string& s);

// True if path equals root or lies below it, comparing path components.
// Both paths should already be canonical.
bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);
