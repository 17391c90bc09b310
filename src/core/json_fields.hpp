/**
 * @file json_fields.hpp
 * @brief Field readers shared by the nlohmann::json hooks of objects and the device model.
 *
 * Type violations throw std::invalid_argument; callers that decode whole
 * documents turn them into DeserializationError.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace kube_device {

/// Throws std::invalid_argument unless `j` is a JSON object.
inline void require_object(const nlohmann::json& j, const char* what) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string{what} + " must be an object, got " +
                                    j.type_name());
    }
}

/// Reads `key` into `out`; a missing or null field leaves `out` untouched.
template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    it->get_to(out);
}

/**
 * @brief Reads a map of integers under `key`.
 *
 * Unlike get_to(), floats, booleans and integers outside Int's range are
 * rejected instead of being converted.
 */
template <typename Int>
void read_integer_map(const nlohmann::json& j, const char* key, std::map<std::string, Int>& out) {
    static_assert(std::is_integral_v<Int> && std::is_signed_v<Int>);

    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    require_object(*it, key);

    std::map<std::string, Int> values;
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        const auto& value = entry.value();
        bool in_range = false;
        if (value.is_number_unsigned()) {
            in_range = value.get<uint64_t>() <=
                       static_cast<uint64_t>(std::numeric_limits<Int>::max());
        } else if (value.is_number_integer()) {
            auto v = value.get<int64_t>();
            in_range = v >= std::numeric_limits<Int>::min() &&
                       v <= std::numeric_limits<Int>::max();
        }
        if (!in_range) {
            throw std::invalid_argument(std::string{key} + "[\"" + entry.key() +
                                        "\"] must be an integer within range, got " +
                                        value.dump());
        }
        values[entry.key()] = static_cast<Int>(value.get<int64_t>());
    }
    out = std::move(values);
}

}  // namespace kube_device
