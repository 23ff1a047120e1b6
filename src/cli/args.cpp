#include "args.hpp"
#include <fmt/format.h>

static const FlagSpec* find_flag(const std::vector<FlagSpec>& flags, const std::string& name) {
    for (const auto& f : flags) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

Result<ArgReader> ArgReader::parse(const std::vector<std::string>& args,
                                   const std::vector<FlagSpec>& flags) {
    ArgReader reader;
    bool flags_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (flags_done || arg.size() < 2 || arg[0] != '-') {
            reader.positionals_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            flags_done = true;
            continue;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const FlagSpec* spec = find_flag(flags, name);
        if (!spec) {
            return Result<ArgReader>::Err(ErrorCode::Usage, fmt::format("unknown option: {}", name));
        }

        if (!spec->takes_value) {
            if (inline_value) {
                return Result<ArgReader>::Err(ErrorCode::Usage,
                    fmt::format("option {} does not take a value", name));
            }
            reader.values_[name].push_back("");
            continue;
        }

        if (inline_value) {
            reader.values_[name].push_back(*inline_value);
        } else if (i + 1 < args.size()) {
            reader.values_[name].push_back(args[++i]);
        } else {
            return Result<ArgReader>::Err(ErrorCode::Usage,
                fmt::format("option {} requires a value", name));
        }
    }

    return Result<ArgReader>::Ok(reader);
}

std::optional<std::string> ArgReader::get(const std::string& flag) const {
    auto it = values_.find(flag);
    if (it == values_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

std::vector<std::string> ArgReader::get_all(const std::string& flag) const {
    auto it = values_.find(flag);
    if (it == values_.end()) return {};
    return it->second;
}
