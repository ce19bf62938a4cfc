#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "tracker/config.hpp"

namespace clockwork::tracker {

// A name pattern: matches on exact equality, or a full regex match when the
// pattern is a valid regular expression.
class NamePattern {
public:
    explicit NamePattern(std::string pattern);

    bool matches(const std::string& name) const;
    const std::string& text() const { return text_; }

private:
    std::string text_;
    std::optional<std::regex> regex_;
};

// Include/exclude rules for modules and functions.
class FilterRules {
public:
    FilterRules() = default;
    explicit FilterRules(const FilterConfig& config);

    // True when a call to module.function may be recorded.
    bool allows(const std::string& module, const std::string& function) const;

private:
    std::vector<NamePattern> exclude_modules_;
    std::vector<NamePattern> include_modules_;
    std::vector<NamePattern> exclude_functions_;
    std::vector<NamePattern> include_functions_;

    static std::vector<NamePattern> compile(const std::vector<std::string>& patterns);
    static bool any_match(const std::vector<NamePattern>& patterns, const std::string& name);
};

} // namespace clockwork::tracker
