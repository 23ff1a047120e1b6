#include "template_updater.hpp"
#include "options_resolver.hpp"
#include <fmt/format.h>
#include <vector>

TemplateUpdater::TemplateUpdater(const TemplateRegistry& registry, const Config& config,
                                 GitLifecycleManager& lifecycle)
    : registry_(registry), config_(config), lifecycle_(lifecycle) {
}

Result<void> TemplateUpdater::run(const std::optional<std::string>& name, bool check,
                                  const UpdateResultCallback& on_result,
                                  StatusCallback cb) {
    std::vector<TemplateEntry> targets;
    if (name) {
        const TemplateEntry* entry = registry_.get(*name);
        if (!entry) {
            return Result<void>::Err(ErrorCode::TemplateNotFound,
                fmt::format("template not found: {}", *name));
        }
        targets.push_back(*entry);
    } else {
        targets = registry_.entries_sorted();
    }

    int failed = 0;
    for (const auto& entry : targets) {
        ResolvedOptions options = resolve_options(CliOverrides{}, &entry, config_);

        TemplateUpdateResult result;
        result.name = entry.name;
        auto outcome = lifecycle_.update(entry, options.no_cache, check, cb);
        if (outcome.is_ok()) {
            result.outcome = outcome.value;
        } else {
            result.ok = false;
            result.error = outcome.error;
            failed++;
        }
        if (on_result) on_result(result);
    }

    if (failed > 0) {
        return Result<void>::Err(ErrorCode::UpdateFailed,
            fmt::format("{} of {} template(s) failed to update", failed, targets.size()));
    }
    return Result<void>::Ok();
}
