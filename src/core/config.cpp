#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace clockwork::core::config {

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

std::optional<bool> get_env_bool(const std::string& key) {
    std::string value = get_env(key);
    if (value.empty()) return std::nullopt;

    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;

    spdlog::warn("Ignoring {}={}: not a boolean", key, value);
    return std::nullopt;
}

std::optional<double> get_env_double(const std::string& key) {
    std::string value = get_env(key);
    if (value.empty()) return std::nullopt;

    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // fall through
    }
    spdlog::warn("Ignoring {}={}: not a number", key, value);
    return std::nullopt;
}

} // namespace clockwork::core::config
