#include "templative_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/paths.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <iostream>
#include <cstdlib>

TemplativeCLI::TemplativeCLI() : git_(std::make_unique<GitClient>()) {
    register_init_command(*this);
    register_update_command(*this);
    register_template_commands(*this);
}

void TemplativeCLI::add_command(const std::string& name, Command command) {
    command.flags.push_back({"--help", false});
    commands_[name] = std::move(command);
}

// ── Shared state ───────────────────────────────────────────

Result<void> TemplativeCLI::load_config() {
    auto loaded = Config::load();
    if (loaded.is_err()) return propagate<void>(loaded);
    config_ = loaded.value;
    return Result<void>::Ok();
}

void TemplativeCLI::apply_color_mode() {
    switch (config_.color()) {
        case ColorMode::Always:
            theme::set_color_enabled(true);
            break;
        case ColorMode::Never:
            theme::set_color_enabled(false);
            break;
        case ColorMode::Auto: {
            const char* no_color = std::getenv("NO_COLOR");
            theme::set_color_enabled(platform::stdout_is_terminal() && !(no_color && *no_color));
            break;
        }
    }
}

Result<void> TemplativeCLI::require_registry() {
    if (registry_) return Result<void>::Ok();
    auto loaded = TemplateRegistry::load();
    if (loaded.is_err()) return propagate<void>(loaded);
    registry_ = std::move(loaded.value);
    return Result<void>::Ok();
}

GitCache& TemplativeCLI::cache() {
    if (!cache_) {
        cache_ = std::make_unique<GitCache>(get_cache_root());
        auto loaded = cache_->load();
        if (loaded.is_err()) std::cout << theme::warn(loaded.error);
    }
    return *cache_;
}

GitLifecycleManager& TemplativeCLI::lifecycle() {
    if (!lifecycle_) {
        lifecycle_ = std::make_unique<GitLifecycleManager>(*git_, cache());
    }
    return *lifecycle_;
}

StatusCallback TemplativeCLI::status_callback() const {
    return [](const std::string& msg) {
        std::cout << theme::log(msg);
        std::cout.flush();
    };
}

bool TemplativeCLI::confirm_overwrite(const std::string& relative_path) const {
    std::cout << theme::esc(theme::color::BROWN) << "    Overwrite " << relative_path
              << "? [y/N] " << theme::esc(theme::color::RESET);
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    trim(answer);
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "Yes";
}

void TemplativeCLI::print_warnings(const std::vector<std::string>& warnings) const {
    for (const auto& w : warnings) std::cout << theme::warn(w);
}

// ── Help ───────────────────────────────────────────────────

void TemplativeCLI::print_usage() const {
    std::cout << theme::section(fmt::format("templative {}", TEMPLATIVE_VERSION));
    std::cout << "    Create projects from registered directory templates.\n";
    std::cout << theme::section("Usage");

    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::blue(fmt::format("    templative {:<34}", cmd.usage))
                  << theme::dim(cmd.help) << "\n";
    }
    std::cout << "\n";
    std::cout << theme::dim("    templative --version                        Show version") << "\n"
              << theme::dim("    templative --help                           Show this help") << "\n"
              << theme::dim("    templative <command> --help                 Show command options")
              << "\n\n";
}

void TemplativeCLI::print_command_help(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) return;

    const auto& cmd = it->second;
    std::cout << theme::section("templative " + cmd.usage);
    std::cout << "    " << cmd.help << "\n\n";
    for (const auto& flag : cmd.flags) {
        if (flag.name == "--help") continue;
        std::cout << theme::blue(fmt::format("    {:<16}", flag.name))
                  << theme::dim(flag.takes_value ? "<value>" : "") << "\n";
    }
    std::cout << "\n";
}

// ── Dispatch ───────────────────────────────────────────────

int TemplativeCLI::dispatch(const std::string& name, const std::vector<std::string>& args) {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + name);
        std::cout << theme::step("Run 'templative --help' for available commands.");
        return exit_code_for(ErrorCode::Usage);
    }

    auto parsed = ArgReader::parse(args, it->second.flags);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: templative " + it->second.usage);
        return exit_code_for(parsed.code);
    }
    if (parsed.value.has("--help")) {
        print_command_help(name);
        return 0;
    }

    auto result = it->second.handler(*this, parsed.value);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        if (result.code == ErrorCode::Usage) {
            std::cout << theme::step("Usage: templative " + it->second.usage);
        }
        return exit_code_for(result.code);
    }
    return 0;
}

int TemplativeCLI::run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty() || args[0] == "--help" || args[0] == "-h" || args[0] == "help") {
        apply_color_mode();
        print_usage();
        return args.empty() ? exit_code_for(ErrorCode::Usage) : 0;
    }
    if (args[0] == "--version") {
        std::cout << "templative " << TEMPLATIVE_VERSION << "\n";
        return 0;
    }

    auto loaded = load_config();
    apply_color_mode();
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return exit_code_for(loaded.code);
    }

    std::string name = args[0];
    args.erase(args.begin());
    return dispatch(name, args);
}
