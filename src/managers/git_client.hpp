#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Narrow capability over the git executable. Every operation blocks until
// git exits and returns the raw process result; interpretation is left to
// callers (see check() below). Only ref/commit resolution and porcelain
// status are ever parsed from stdout.
class GitClient {
public:
    // executable: git binary to run; empty means $TEMPLATIVE_GIT or "git"
    explicit GitClient(std::string executable = "");
    virtual ~GitClient() = default;

    const std::string& executable() const { return executable_; }
    bool available();

    ProcessResult init(const fs::path& dir);
    ProcessResult add_all(const fs::path& dir);
    ProcessResult commit(const fs::path& dir, const std::string& message);
    ProcessResult clone(const std::string& url, const fs::path& dest);
    ProcessResult fetch(const fs::path& dir);
    ProcessResult checkout_detached(const fs::path& dir, const std::string& commit);
    ProcessResult checkout_branch(const fs::path& dir, const std::string& branch,
                                  const std::string& commit);
    ProcessResult rev_parse(const fs::path& dir, const std::string& rev);
    ProcessResult symbolic_ref(const fs::path& dir, const std::string& name);
    ProcessResult ls_remote(const std::string& url, const std::vector<std::string>& patterns);
    ProcessResult status_porcelain(const fs::path& dir);
    ProcessResult config_get(const fs::path& dir, const std::string& key);

    // ls-remote output as refname -> commit
    static std::map<std::string, std::string> parse_ls_remote(const std::string& output);

protected:
    virtual ProcessResult run(const std::vector<std::string>& args, const fs::path& cwd);

private:
    std::string executable_;
};

// Turn a failed git invocation into a GitFailure carrying git's own output.
Result<void> git_check(const ProcessResult& result, const std::string& what);
