#include "../templative_cli.hpp"
#include "../theme.hpp"
#include "option_flags.hpp"
#include <core/utils.hpp>
#include <managers/hook_runner.hpp>
#include <managers/project_initializer.hpp>
#include <iostream>
#include <fmt/format.h>

static Result<void> do_init(TemplativeCLI& cli, const ArgReader& args) {
    auto name = args.positional(0);
    if (!name) return Result<void>::Err(ErrorCode::Usage, "missing template name");
    if (args.positionals().size() > 2) {
        return Result<void>::Err(ErrorCode::Usage, "too many arguments");
    }

    auto overrides = read_overrides(args);
    if (overrides.is_err()) return propagate<void>(overrides);

    auto loaded = cli.require_registry();
    if (loaded.is_err()) return loaded;

    InitRequest request;
    request.template_name = *name;
    request.target = args.positional(1).value_or(".");
    request.overrides = overrides.value;

    HookRunner hooks;
    ProjectInitializer initializer(cli.registry(), cli.config(), cli.lifecycle(), hooks,
                                   [&cli](const std::string& path) {
                                       return cli.confirm_overwrite(path);
                                   });

    auto report = initializer.run(request, cli.status_callback());
    if (report.is_err()) {
        cli.print_warnings(cli.lifecycle().warnings());
        return propagate<void>(report);
    }

    const auto& r = report.value;

    std::cout << theme::ok(fmt::format("Initialized {} from template '{}'",
                                       r.target.string(), *name));
    std::cout << theme::kv("Files", fmt::format("{} written, {} skipped",
                                                r.copy.files_written, r.copy.files_skipped));
    if (r.copy.directories_skipped > 0) {
        std::cout << theme::kv("Dirs", fmt::format("{} skipped", r.copy.directories_skipped));
    }
    if (r.copy.symlinks_created > 0) {
        std::cout << theme::kv("Symlinks", std::to_string(r.copy.symlinks_created));
    }
    std::cout << theme::kv("Git", to_string(r.options.git));
    if (!r.commit.empty()) std::cout << theme::kv("Commit", short_sha(r.commit));
    cli.print_warnings(r.warnings);
    return Result<void>::Ok();
}

void register_init_command(TemplativeCLI& cli) {
    std::vector<FlagSpec> flags = OVERRIDE_FLAGS;
    flags.push_back({"--refresh", false});

    cli.add_command("init", {do_init, flags, "init <template> [path]",
                             "Create a project from a template"});
}
