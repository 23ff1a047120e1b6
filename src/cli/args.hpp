#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <core/types.hpp>

struct FlagSpec {
    std::string name;        // including leading dashes, e.g. "--write-mode"
    bool takes_value = false;
};

// Command-line arguments after the command word. Flags keep every value in
// order, so repeatable flags (--exclude) and last-wins flags share one store.
class ArgReader {
public:
    // Accepts "--flag value", "--flag=value", and "--" to end flag parsing.
    // Unknown flags and missing values are Usage errors.
    static Result<ArgReader> parse(const std::vector<std::string>& args,
                                   const std::vector<FlagSpec>& flags);

    bool has(const std::string& flag) const { return values_.count(flag) > 0; }

    // Last value given for flag
    std::optional<std::string> get(const std::string& flag) const;

    // Every value given for flag, in order
    std::vector<std::string> get_all(const std::string& flag) const;

    const std::vector<std::string>& positionals() const { return positionals_; }

    std::optional<std::string> positional(size_t index) const {
        if (index >= positionals_.size()) return std::nullopt;
        return positionals_[index];
    }

private:
    std::vector<std::string> positionals_;
    std::map<std::string, std::vector<std::string>> values_;
};
