#include "project_initializer.hpp"
#include <core/paths.hpp>
#include <fmt/format.h>

ProjectInitializer::ProjectInitializer(const TemplateRegistry& registry, const Config& config,
                                       GitLifecycleManager& lifecycle, HookRunner& hooks,
                                       OverwritePrompt prompt)
    : registry_(registry), config_(config), lifecycle_(lifecycle), hooks_(hooks),
      prompt_(std::move(prompt)) {
}

Result<InitReport> ProjectInitializer::run(const InitRequest& request, StatusCallback cb) {
    const TemplateEntry* entry = registry_.get(request.template_name);
    if (!entry) {
        return Result<InitReport>::Err(ErrorCode::TemplateNotFound,
            fmt::format("template not found: {}", request.template_name));
    }

    InitReport report;
    report.options = resolve_options(request.overrides, entry, config_);

    std::error_code ec;
    report.target = fs::weakly_canonical(fs::absolute(request.target), ec);
    if (ec) {
        return Result<InitReport>::Err(ErrorCode::IoFailure,
            fmt::format("cannot resolve target {}: {}", request.target.string(), ec.message()));
    }

    auto source = lifecycle_.prepare_source(*entry, report.options, cb);
    if (source.is_err()) return propagate<InitReport>(source);
    report.commit = source.value.commit;

    if (is_dangerous_path(report.target)) {
        return Result<InitReport>::Err(ErrorCode::DangerousPath,
            fmt::format("refusing to initialize into {}", report.target.string()));
    }

    // Pre-init failure stops everything before a single file is copied
    if (report.options.pre_init) {
        auto hook = hooks_.run("pre-init", *report.options.pre_init, source.value.path, cb);
        if (hook.is_err()) return propagate<InitReport>(hook);
    }

    MaterializationEngine engine(report.options, prompt_);
    auto copied = engine.copy(source.value.path, report.target, cb);
    if (copied.is_err()) return propagate<InitReport>(copied);
    report.copy = copied.value;
    report.warnings = copied.value.warnings;

    auto git = lifecycle_.apply(report.target, report.options, *entry, source.value, cb);
    for (const auto& w : lifecycle_.warnings()) report.warnings.push_back(w);
    if (git.is_err()) return propagate<InitReport>(git);

    if (report.options.post_init) {
        auto hook = hooks_.run("post-init", *report.options.post_init, report.target, cb);
        if (hook.is_err()) report.warnings.push_back(hook.error);
    }

    return Result<InitReport>::Ok(std::move(report));
}
