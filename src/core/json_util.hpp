#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace clockwork::core {

// Copy section[key] into out when present and convertible; otherwise keep
// the current value. Returns true when out was assigned.
template <typename T>
bool read_field(const nlohmann::json& section, const char* key, T& out) {
    if (!section.is_object()) return false;
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return false;
    if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        // get<T>() would wrap negative or oversized numbers silently
        bool in_range = true;
        if (it->is_number_float()) {
            double v = it->template get<double>();
            in_range = v >= 0.0 && v <= static_cast<double>(std::numeric_limits<T>::max());
        } else if (it->is_number_unsigned()) {
            in_range = it->template get<uint64_t>() <= std::numeric_limits<T>::max();
        } else if (it->is_number_integer()) {
            int64_t v = it->template get<int64_t>();
            in_range = v >= 0 && static_cast<uint64_t>(v) <= std::numeric_limits<T>::max();
        }
        if (!in_range) {
            spdlog::warn("Config key '{}' ignored: {} is out of range", key, it->dump());
            return false;
        }
    }
    try {
        out = it->template get<T>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config key '{}' ignored: {}", key, e.what());
        return false;
    }
}

// Sub-object lookup that yields an empty object when missing.
inline const nlohmann::json& section_of(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.is_object()) return empty;
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return empty;
    return *it;
}

} // namespace clockwork::core
