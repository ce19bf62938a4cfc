#include "tracker/filter.hpp"
#include <spdlog/spdlog.h>

namespace clockwork::tracker {

NamePattern::NamePattern(std::string pattern)
    : text_(std::move(pattern)) {
    try {
        regex_.emplace(text_, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        spdlog::warn("Filter pattern '{}' is not a valid regex ({}), matching exactly", text_, e.what());
    }
}

bool NamePattern::matches(const std::string& name) const {
    if (name == text_) return true;
    return regex_ && std::regex_match(name, *regex_);
}

FilterRules::FilterRules(const FilterConfig& config)
    : exclude_modules_(compile(config.exclude_modules))
    , include_modules_(compile(config.include_modules))
    , exclude_functions_(compile(config.exclude_functions))
    , include_functions_(compile(config.include_functions)) {}

bool FilterRules::allows(const std::string& module, const std::string& function) const {
    if (any_match(exclude_modules_, module)) return false;
    if (any_match(exclude_functions_, function)) return false;
    if (!include_modules_.empty() && !any_match(include_modules_, module)) return false;
    if (!include_functions_.empty() && !any_match(include_functions_, function)) return false;
    return true;
}

std::vector<NamePattern> FilterRules::compile(const std::vector<std::string>& patterns) {
    std::vector<NamePattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto& p : patterns) {
        compiled.emplace_back(p);
    }
    return compiled;
}

bool FilterRules::any_match(const std::vector<NamePattern>& patterns, const std::string& name) {
    for (const auto& p : patterns) {
        if (p.matches(name)) return true;
    }
    return false;
}

} // namespace clockwork::tracker
