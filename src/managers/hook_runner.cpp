#include "hook_runner.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <sstream>

HookRunner::HookRunner(std::string shell) : shell_(std::move(shell)) {
    if (shell_.empty()) shell_ = HOOK_SHELL;
}

Result<void> HookRunner::run(const std::string& label, const std::string& command,
                             const fs::path& working_dir, StatusCallback cb) {
    if (trimmed(command).empty()) return Result<void>::Ok();

    std::error_code ec;
    if (!fs::is_directory(working_dir, ec)) {
        return Result<void>::Err(ErrorCode::HookFailure,
            fmt::format("{} hook: working directory does not exist: {}",
                        label, working_dir.string()));
    }

    if (cb) cb(fmt::format("Running {} hook: {}", label, command));
    auto result = platform::run_process(shell_, {"-c", command}, working_dir);
    std::string output = result.combined_output();

    if (result.failed()) {
        std::string msg = fmt::format("{} hook failed (exit {}): {}", label, result.exit_code, command);
        if (!output.empty()) msg += "\n" + output;
        return Result<void>::Err(ErrorCode::HookFailure, msg);
    }

    if (cb && !output.empty()) {
        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line)) cb(line);
    }
    return Result<void>::Ok();
}
