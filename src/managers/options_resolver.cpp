#include "options_resolver.hpp"

template <typename T>
static T pick(const std::optional<T>& cli, const std::optional<T>* from_template,
              const T& fallback) {
    if (cli) return *cli;
    if (from_template && *from_template) return **from_template;
    return fallback;
}

ResolvedOptions resolve_options(const CliOverrides& cli,
                                const TemplateEntry* entry,
                                const Config& config) {
    ResolvedOptions r;

    r.git        = pick(cli.git,        entry ? &entry->git : nullptr,        config.git());
    r.write_mode = pick(cli.write_mode, entry ? &entry->write_mode : nullptr, config.write_mode());
    r.exclude    = pick(cli.exclude,    entry ? &entry->exclude : nullptr,    config.exclude());
    r.symlinks   = pick(cli.symlinks,   entry ? &entry->symlinks : nullptr,   config.symlinks());
    r.no_cache   = pick(cli.no_cache,   entry ? &entry->no_cache : nullptr,   config.no_cache());
    r.refresh    = cli.refresh;

    if (entry) {
        r.git_ref = entry->git_ref;
        r.pre_init = entry->pre_init;
        r.post_init = entry->post_init;
    }
    return r;
}
