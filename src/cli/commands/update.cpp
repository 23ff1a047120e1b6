#include "../templative_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <managers/template_updater.hpp>
#include <iostream>
#include <fmt/format.h>

static std::string describe(const UpdateOutcome& o) {
    std::string text = to_string(o.status);
    switch (o.status) {
        case UpdateStatus::UpdateAvailable:
        case UpdateStatus::Updated:
            return fmt::format("{} ({} -> {})", text, short_sha(o.old_commit), short_sha(o.new_commit));
        case UpdateStatus::UpToDate:
        case UpdateStatus::Cached:
            return fmt::format("{} ({})", text, short_sha(o.new_commit));
        default:
            return text;
    }
}

static Result<void> do_update(TemplativeCLI& cli, const ArgReader& args) {
    if (args.positionals().size() > 1) {
        return Result<void>::Err(ErrorCode::Usage, "too many arguments");
    }
    auto loaded = cli.require_registry();
    if (loaded.is_err()) return loaded;

    if (cli.registry().empty() && !args.positional(0)) {
        std::cout << theme::info("No templates registered.");
        return Result<void>::Ok();
    }

    bool check = args.has("--check");
    TemplateUpdater updater(cli.registry(), cli.config(), cli.lifecycle());

    auto result = updater.run(args.positional(0), check,
        [](const TemplateUpdateResult& r) {
            std::string label = theme::bold(fmt::format("{:<20}", r.name));
            if (!r.ok) {
                std::cout << theme::fail(label + " " + r.error);
                return;
            }
            switch (r.outcome.status) {
                case UpdateStatus::UpdateAvailable:
                    std::cout << theme::step(label + " " + theme::yellow(describe(r.outcome)));
                    break;
                case UpdateStatus::Updated:
                case UpdateStatus::Cached:
                case UpdateStatus::UpToDate:
                    std::cout << theme::ok(label + " " + describe(r.outcome));
                    break;
                default:
                    std::cout << theme::info(label + " " + theme::dim(describe(r.outcome)));
                    break;
            }
        },
        cli.status_callback());

    cli.print_warnings(cli.lifecycle().warnings());
    return result;
}

void register_update_command(TemplativeCLI& cli) {
    cli.add_command("update", {do_update, {{"--check", false}}, "update [template] [--check]",
                               "Check or refresh cached git templates"});
}
