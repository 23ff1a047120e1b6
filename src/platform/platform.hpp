#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// True if standard output is attached to a terminal.
bool stdout_is_terminal();

// RAII guard for an invocation-scoped scratch directory.
// The directory is created (mode 0700) by the constructor and removed
// recursively by the destructor.
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix);
    ~TempDirectory();

    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace platform
