#include "git_client.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <sstream>
#include <cstdlib>

GitClient::GitClient(std::string executable) : executable_(std::move(executable)) {
    if (executable_.empty()) {
        const char* env = std::getenv(ENV_GIT);
        executable_ = (env && *env) ? env : DEFAULT_GIT_EXECUTABLE;
    }
}

ProcessResult GitClient::run(const std::vector<std::string>& args, const fs::path& cwd) {
    return platform::run_process(executable_, args, cwd);
}

bool GitClient::available() {
    return run({"--version"}, {}).success();
}

ProcessResult GitClient::init(const fs::path& dir) {
    return run({"init", "--quiet"}, dir);
}

ProcessResult GitClient::add_all(const fs::path& dir) {
    return run({"add", "-A"}, dir);
}

ProcessResult GitClient::commit(const fs::path& dir, const std::string& message) {
    return run({"commit", "--quiet", "--allow-empty", "-m", message}, dir);
}

ProcessResult GitClient::clone(const std::string& url, const fs::path& dest) {
    return run({"clone", "--quiet", url, dest.string()}, {});
}

ProcessResult GitClient::fetch(const fs::path& dir) {
    return run({"fetch", "--quiet", "--tags", "--force", "origin"}, dir);
}

ProcessResult GitClient::checkout_detached(const fs::path& dir, const std::string& commit) {
    return run({"checkout", "--quiet", "--force", "--detach", commit}, dir);
}

ProcessResult GitClient::checkout_branch(const fs::path& dir, const std::string& branch,
                                         const std::string& commit) {
    return run({"checkout", "--quiet", "--force", "-B", branch, commit}, dir);
}

ProcessResult GitClient::rev_parse(const fs::path& dir, const std::string& rev) {
    return run({"rev-parse", "--verify", "--quiet", rev}, dir);
}

ProcessResult GitClient::symbolic_ref(const fs::path& dir, const std::string& name) {
    return run({"symbolic-ref", "--quiet", "--short", name}, dir);
}

ProcessResult GitClient::ls_remote(const std::string& url,
                                   const std::vector<std::string>& patterns) {
    std::vector<std::string> args = {"ls-remote", url};
    args.insert(args.end(), patterns.begin(), patterns.end());
    return run(args, {});
}

ProcessResult GitClient::status_porcelain(const fs::path& dir) {
    return run({"status", "--porcelain"}, dir);
}

ProcessResult GitClient::config_get(const fs::path& dir, const std::string& key) {
    return run({"config", "--get", key}, dir);
}

std::map<std::string, std::string> GitClient::parse_ls_remote(const std::string& output) {
    std::map<std::string, std::string> refs;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        auto tab = line.find('\t');
        if (tab == std::string::npos) continue;
        std::string sha = trimmed(line.substr(0, tab));
        std::string name = trimmed(line.substr(tab + 1));
        if (!sha.empty() && !name.empty()) refs[name] = sha;
    }
    return refs;
}

Result<void> git_check(const ProcessResult& result, const std::string& what) {
    if (result.success()) return Result<void>::Ok();
    std::string output = result.combined_output();
    if (output.empty()) {
        return Result<void>::Err(ErrorCode::GitFailure,
            fmt::format("{} failed (exit {})", what, result.exit_code));
    }
    return Result<void>::Err(ErrorCode::GitFailure,
        fmt::format("{} failed (exit {}):\n{}", what, result.exit_code, output));
}
