#include "paths.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <cstdlib>

static fs::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return {};
    return fs::path(value);
}

fs::path get_config_dir() {
    auto explicit_dir = env_path(ENV_CONFIG_DIR);
    if (!explicit_dir.empty()) return explicit_dir;

    auto xdg = env_path("XDG_CONFIG_HOME");
    if (!xdg.empty()) return xdg / APP_DIR_NAME;

    return platform::home_dir() / ".config" / APP_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILENAME;
}

fs::path get_registry_path() {
    return get_config_dir() / REGISTRY_FILENAME;
}

fs::path get_cache_root() {
    auto explicit_dir = env_path(ENV_CACHE_DIR);
    if (!explicit_dir.empty()) return explicit_dir;

    auto xdg = env_path("XDG_CACHE_HOME");
    if (!xdg.empty()) return xdg / APP_DIR_NAME;

    return platform::home_dir() / ".cache" / APP_DIR_NAME;
}

bool is_dangerous_path(const fs::path& path) {
    if (path == path.root_path()) return true;

    auto home = env_path("HOME");
    if (home.empty()) return false;

    std::error_code ec;
    auto canonical_home = fs::weakly_canonical(home, ec);
    if (ec) canonical_home = home.lexically_normal();
    return path == canonical_home;
}

bool is_dir_empty(const fs::path& path) {
    return fs::directory_iterator(path) == fs::directory_iterator();
}
