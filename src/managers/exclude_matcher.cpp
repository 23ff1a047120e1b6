#include "exclude_matcher.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

ExcludeMatcher::ExcludeMatcher(const std::vector<std::string>& patterns) {
    for (auto pattern : patterns) {
        trim(pattern);
        if (pattern.empty()) continue;

        // "dist/" means the same as "dist" here: patterns match components
        while (pattern.size() > 1 && pattern.back() == '/') pattern.pop_back();

        try {
            compiled_.emplace_back(glob_to_regex(pattern));
            patterns_.push_back(pattern);
        } catch (const std::regex_error& e) {
            if (!error_) error_ = fmt::format("invalid exclude pattern '{}': {}", pattern, e.what());
        }
    }
}

Result<void> ExcludeMatcher::validate(const std::vector<std::string>& patterns) {
    ExcludeMatcher matcher(patterns);
    if (matcher.error()) return Result<void>::Err(ErrorCode::Usage, *matcher.error());
    return Result<void>::Ok();
}

bool ExcludeMatcher::is_excluded(const fs::path& relative_path) const {
    for (const auto& component : relative_path) {
        std::string part = component.string();
        if (part.empty() || part == "." || part == "/") continue;
        if (part == GIT_DIR_NAME) return true;
        if (matches_any(part)) return true;
    }
    return matches_any(relative_path.generic_string());
}

bool ExcludeMatcher::matches_any(const std::string& text) const {
    for (const auto& re : compiled_) {
        if (std::regex_match(text, re)) return true;
    }
    return false;
}

std::string ExcludeMatcher::glob_to_regex(const std::string& glob) {
    std::string regex;
    size_t i = 0;

    while (i < glob.size()) {
        char c = glob[i];

        if (c == '\\') {
            // Escaped literal; a trailing "\" is itself literal
            char next = i + 1 < glob.size() ? glob[i + 1] : '\\';
            if (!std::isalnum(static_cast<unsigned char>(next))) regex += '\\';
            regex += next;
            i += 2;
            continue;
        }

        if (c == '*') {
            // Check for **
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                regex += ".*";
                i += 2;
                // "**/" also matches zero directories
                if (i < glob.size() && glob[i] == '/') {
                    regex.pop_back();
                    regex.pop_back();
                    regex += "(?:.*/)?";
                    i++;
                }
            } else {
                regex += "[^/]*";
                i++;
            }
            continue;
        }

        if (c == '?') {
            regex += "[^/]";
            i++;
            continue;
        }

        if (c == '[') {
            size_t close = glob.find(']', i + 2);
            if (close == std::string::npos) {
                // Unterminated class: treat "[" literally
                regex += "\\[";
                i++;
                continue;
            }
            std::string body = glob.substr(i + 1, close - i - 1);
            regex += '[';
            size_t j = 0;
            if (!body.empty() && (body[0] == '!' || body[0] == '^')) {
                regex += '^';
                j = 1;
            }
            for (; j < body.size(); j++) {
                if (body[j] == '\\' || body[j] == '[' || body[j] == ']') regex += '\\';
                regex += body[j];
            }
            regex += ']';
            i = close + 1;
            continue;
        }

        // Everything else is literal
        static const std::string specials = ".^$+(){}|]";
        if (specials.find(c) != std::string::npos) regex += '\\';
        regex += c;
        i++;
    }

    return regex;
}
