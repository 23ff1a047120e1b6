#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <managers/registry.hpp>
#include <managers/git_client.hpp>
#include <managers/git_cache.hpp>
#include <managers/git_lifecycle.hpp>
#include "args.hpp"

class TemplativeCLI;

// Forward declarations for command registration
void register_init_command(TemplativeCLI& cli);
void register_update_command(TemplativeCLI& cli);
void register_template_commands(TemplativeCLI& cli);

class TemplativeCLI {
public:
    using CommandHandler = std::function<Result<void>(TemplativeCLI&, const ArgReader&)>;

    struct Command {
        CommandHandler handler;
        std::vector<FlagSpec> flags;
        std::string usage;     // e.g. "init <template> [path]"
        std::string help;
    };

    TemplativeCLI();

    void add_command(const std::string& name, Command command);

    // Parse argv, dispatch, print any error. Returns the process exit code.
    int run(int argc, char** argv);

    void print_usage() const;
    void print_command_help(const std::string& name) const;

    // Lazily loaded state shared by the commands
    const Config& config() const { return config_; }
    Result<void> require_registry();
    TemplateRegistry& registry() { return *registry_; }
    GitClient& git() { return *git_; }
    GitCache& cache();
    GitLifecycleManager& lifecycle();

    // Progress lines from managers
    StatusCallback status_callback() const;

    // "Overwrite <path>? [y/N]" on stdin; anything but y/yes is no
    bool confirm_overwrite(const std::string& relative_path) const;

    void print_warnings(const std::vector<std::string>& warnings) const;

private:
    std::map<std::string, Command> commands_;
    Config config_;
    std::optional<TemplateRegistry> registry_;
    std::unique_ptr<GitClient> git_;
    std::unique_ptr<GitCache> cache_;
    std::unique_ptr<GitLifecycleManager> lifecycle_;

    Result<void> load_config();
    void apply_color_mode();
    int dispatch(const std::string& name, const std::vector<std::string>& args);
};
