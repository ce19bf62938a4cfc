#pragma once
#include <optional>
#include <string>

namespace clockwork::core::config {

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Parse "1/true/yes/on" and "0/false/no/off"; nullopt if unset or unrecognized.
std::optional<bool> get_env_bool(const std::string& key);

// Parse a floating point value; nullopt if unset or malformed.
std::optional<double> get_env_double(const std::string& key);

} // namespace clockwork::core::config
