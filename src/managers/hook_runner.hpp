#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Runs pre-init / post-init commands through the shell. Whether a failure
// aborts init is the caller's decision; run() only reports it.
class HookRunner {
public:
    explicit HookRunner(std::string shell = "");

    // Captured output (stdout then stderr) goes to cb on success and into
    // the HookFailure message otherwise.
    Result<void> run(const std::string& label, const std::string& command,
                     const fs::path& working_dir, StatusCallback cb = nullptr);

private:
    std::string shell_;
};
