#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include "registry.hpp"
#include "options_resolver.hpp"
#include "materializer.hpp"
#include "git_lifecycle.hpp"
#include "hook_runner.hpp"

namespace fs = std::filesystem;

struct InitRequest {
    std::string template_name;
    fs::path target = ".";
    CliOverrides overrides;
};

struct InitReport {
    fs::path target;                     // canonical target directory
    ResolvedOptions options;
    CopySummary copy;
    std::string commit;                  // template commit (URL templates)
    std::vector<std::string> warnings;   // copy, git and post-init warnings
};

// The init sequence: lookup -> resolve options -> prepare source ->
// target guard -> pre-init -> copy -> git lifecycle -> post-init.
class ProjectInitializer {
public:
    ProjectInitializer(const TemplateRegistry& registry, const Config& config,
                       GitLifecycleManager& lifecycle, HookRunner& hooks,
                       OverwritePrompt prompt = nullptr);

    Result<InitReport> run(const InitRequest& request, StatusCallback cb = nullptr);

private:
    const TemplateRegistry& registry_;
    const Config& config_;
    GitLifecycleManager& lifecycle_;
    HookRunner& hooks_;
    OverwritePrompt prompt_;
};
