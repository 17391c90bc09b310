/**
 * @file quantity.hpp
 * @brief Orchestrator resource quantities ("2", "500m", "16Gi", "1e3").
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace kube_device {

/**
 * @brief A parsed resource quantity that keeps its original spelling.
 *
 * Grammar: [+-]digits[.digits][suffix], where suffix is a decimal SI suffix
 * (n u m k M G T P E), a binary suffix (Ki Mi Gi Ti Pi Ei) or a decimal
 * exponent (e3, E-2). The original text is kept so that objects serialize
 * back exactly as they were read.
 */
class Quantity {
public:
    Quantity() = default;

    [[nodiscard]] static Result<Quantity> parse(std::string_view text);
    [[nodiscard]] static Quantity from_int(int64_t value);

    /// Integer value rounded away from zero; saturates at the int64 range.
    [[nodiscard]] int64_t value() const noexcept;

    [[nodiscard]] const std::string& string() const noexcept { return text_; }

    bool operator==(const Quantity& other) const noexcept { return text_ == other.text_; }

private:
    std::string text_ = "0";
    bool negative_{false};
    uint64_t mantissa_{0};
    int decimal_exponent_{0};
    int binary_exponent_{0};
};

using ResourceQuantities = std::map<std::string, Quantity>;

}  // namespace kube_device
