#pragma once

#include <string>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <core/config.hpp>
#include "registry.hpp"
#include "git_lifecycle.hpp"

struct TemplateUpdateResult {
    std::string name;
    bool ok = true;
    UpdateOutcome outcome;
    std::string error;
};

using UpdateResultCallback = std::function<void(const TemplateUpdateResult&)>;

// Runs the cache comparison/refresh for one template or for all of them in
// name order. Per-template failures are reported through on_result and do
// not stop the run; the return value is UpdateFailed if any occurred.
class TemplateUpdater {
public:
    TemplateUpdater(const TemplateRegistry& registry, const Config& config,
                    GitLifecycleManager& lifecycle);

    Result<void> run(const std::optional<std::string>& name, bool check,
                     const UpdateResultCallback& on_result,
                     StatusCallback cb = nullptr);

private:
    const TemplateRegistry& registry_;
    const Config& config_;
    GitLifecycleManager& lifecycle_;
};
