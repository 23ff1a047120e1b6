#include "platform.hpp"
#include <cstdlib>
#include <cerrno>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

bool stdout_is_terminal() {
    return isatty(STDOUT_FILENO) == 1;
}

// ── TempDirectory ────────────────────────────────────────────

TempDirectory::TempDirectory(const std::string& prefix) {
    std::string pattern = (temp_dir() / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (!mkdtemp(buf.data())) {
        throw std::system_error(errno, std::generic_category(),
                                "failed to create temporary directory " + pattern);
    }
    path_ = fs::path(buf.data());
}

TempDirectory::~TempDirectory() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

} // namespace platform
