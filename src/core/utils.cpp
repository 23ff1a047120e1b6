#include "utils.hpp"
#include "constants.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

bool is_git_url(const std::string& location) {
    static const char* schemes[] = {"https://", "http://", "ssh://", "git://", "file://"};
    for (const char* scheme : schemes) {
        if (location.rfind(scheme, 0) == 0) return true;
    }

    // scp-like syntax: git@github.com:org/repo.git
    auto at = location.find('@');
    auto colon = location.find(':');
    auto slash = location.find('/');
    return at != std::string::npos && colon != std::string::npos &&
           at < colon && (slash == std::string::npos || colon < slash);
}

std::string fnv1a_hex(const std::string& input) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : input) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf);
}

std::string url_basename(const std::string& url) {
    std::string s = url;
    while (!s.empty() && s.back() == '/') s.pop_back();

    auto cut = s.find_last_of("/:");
    if (cut != std::string::npos) s = s.substr(cut + 1);

    const std::string suffix = ".git";
    if (s.size() > suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        s.erase(s.size() - suffix.size());
    }
    return s.empty() ? "template" : s;
}

std::string short_sha(const std::string& sha) {
    return sha.substr(0, std::min<size_t>(sha.size(), SHORT_SHA_LENGTH));
}

bool looks_like_commit(const std::string& s) {
    if (s.size() < 7 || s.size() > 40) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

bool is_within(const std::filesystem::path& path, const std::filesystem::path& root) {
    auto p = path.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++p) {
        // A trailing separator yields an empty final element; ignore it
        if (r->empty()) continue;
        if (p == path.end() || *p != *r) return false;
    }
    return true;
}
