#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Lenient accessors for vendor records: missing keys and wrong types read as
// "absent" instead of throwing.
namespace json_fields {

inline std::string str(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return {};
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// Values that don't fit an int64_t (1e20, NaN, huge unsigned) read as absent.
// Fractions are truncated.
inline std::optional<int64_t> int64(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;

    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) return it->get<int64_t>();

    // 2^63 is exact as a double; every double below it converts.
    constexpr double kLimit = 9223372036854775808.0;
    double value = std::trunc(it->get<double>());
    if (!std::isfinite(value) || value < -kLimit || value >= kLimit) return std::nullopt;
    return static_cast<int64_t>(value);
}

inline bool has(const nlohmann::json& j, const char* key) {
    return j.is_object() && j.contains(key) && !j.at(key).is_null();
}

// Whether a value counts as present and non-empty (null, false, 0, "" don't).
inline bool truthy(const nlohmann::json& j) {
    if (j.is_null()) return false;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number()) return j.get<double>() != 0.0;
    if (j.is_string()) return !j.get_ref<const std::string&>().empty();
    return true;
}

inline bool truthy(const nlohmann::json& j, const char* key) {
    return j.is_object() && j.contains(key) && truthy(j.at(key));
}

} // namespace json_fields
