#include "config.hpp"
#include "constants.hpp"
#include "paths.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

Config::Config() : version_(CONFIG_VERSION) {
    for (const char* pattern : DEFAULT_EXCLUDES) {
        exclude_.push_back(pattern);
    }
}

// Read an enum-valued key. Missing keys keep the current default; present
// but unrecognized values are an error so typos do not silently fall back.
template <typename T, typename Parser>
static bool read_enum(const YAML::Node& root, const char* key, Parser parse,
                      T& out, std::string& error) {
    if (!root[key]) return true;
    std::string raw = root[key].as<std::string>("");
    auto parsed = parse(raw);
    if (!parsed) {
        error = fmt::format("invalid value '{}' for '{}'", raw, key);
        return false;
    }
    out = *parsed;
    return true;
}

Result<Config> Config::load() {
    fs::path path = get_config_path();
    auto result = load_from_path(path);
    if (result.is_err()) return result;

    if (!fs::exists(path)) {
        auto saved = result.value.save_to_path(path);
        if (saved.is_err()) return propagate<Config>(saved);
    }
    return result;
}

Result<Config> Config::load_from_path(const fs::path& path) {
    Config config;
    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorCode::ConfigInvalid,
                fmt::format("failed to parse config {}: expected a mapping", path.string()));
        }

        config.version_ = root["version"].as<int>(CONFIG_VERSION);
        if (config.version_ > CONFIG_VERSION) {
            return Result<Config>::Err(ErrorCode::ConfigInvalid,
                fmt::format("unsupported config version {} (expected {})",
                            config.version_, CONFIG_VERSION));
        }

        std::string error;
        if (!read_enum(root, "color", parse_color_mode, config.color_, error) ||
            !read_enum(root, "git", parse_git_mode, config.git_, error) ||
            !read_enum(root, "write_mode", parse_write_mode, config.write_mode_, error) ||
            !read_enum(root, "symlinks", parse_symlink_mode, config.symlinks_, error)) {
            return Result<Config>::Err(ErrorCode::ConfigInvalid,
                fmt::format("failed to parse config {}: {}", path.string(), error));
        }

        if (root["exclude"]) {
            if (root["exclude"].IsSequence()) {
                config.exclude_ = root["exclude"].as<std::vector<std::string>>();
            } else if (root["exclude"].IsScalar()) {
                config.exclude_ = {root["exclude"].as<std::string>()};
            } else if (root["exclude"].IsNull()) {
                config.exclude_.clear();
            }
        }

        config.no_cache_ = root["no_cache"].as<bool>(false);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorCode::ConfigInvalid,
            fmt::format("failed to parse config {}: {}", path.string(), e.what()));
    }
}

Result<void> Config::save_to_path(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << version_;
    out << YAML::Key << "color" << YAML::Value << to_string(color_);
    out << YAML::Key << "git" << YAML::Value << to_string(git_);
    out << YAML::Key << "exclude" << YAML::Value << YAML::BeginSeq;
    for (const auto& pattern : exclude_) {
        out << pattern;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "write_mode" << YAML::Value << to_string(write_mode_);
    out << YAML::Key << "symlinks" << YAML::Value << to_string(symlinks_);
    out << YAML::Key << "no_cache" << YAML::Value << no_cache_;
    out << YAML::EndMap;

    try {
        fs::create_directories(path.parent_path());

        fs::path temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream fout(temp_path);
            if (!fout) {
                return Result<void>::Err(ErrorCode::IoFailure,
                    "failed to write config: " + temp_path.string());
            }
            fout << "# templative global defaults\n" << out.c_str() << "\n";
        }
        fs::rename(temp_path, path);
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorCode::IoFailure,
            std::string("failed to write config: ") + e.what());
    }
}
