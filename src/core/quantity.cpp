/**
 * @file quantity.cpp
 * @brief Quantity parsing and integer conversion.
 */

#include "core/quantity.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <optional>
#include <utility>

namespace kube_device {

namespace {

constexpr uint64_t kInt64Max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

/// Largest accepted |exponent| in the "1e3" form.
constexpr int kMaxExponent = 1000;

/// 10^19 is the largest power of ten that fits in uint64_t.
constexpr int kMaxDivisorDigits = 19;

struct Suffix {
    std::string_view text;
    int decimal_exponent;
    int binary_exponent;
};

constexpr std::array<Suffix, 15> kSuffixes{{
    {"n", -9, 0}, {"u", -6, 0}, {"m", -3, 0},
    {"k", 3, 0},  {"M", 6, 0},  {"G", 9, 0},
    {"T", 12, 0}, {"P", 15, 0}, {"E", 18, 0},
    {"Ki", 0, 10}, {"Mi", 0, 20}, {"Gi", 0, 30},
    {"Ti", 0, 40}, {"Pi", 0, 50}, {"Ei", 0, 60},
}};

Error invalid(std::string_view text, std::string_view why) {
    return Error{ErrorCode::Invalid,
                 "invalid quantity \"" + std::string{text} + "\": " + std::string{why}};
}

uint64_t pow10(int n) {
    uint64_t p = 1;
    for (int i = 0; i < n; ++i) p *= 10;
    return p;
}

/// ceil(mantissa * 2^shift / divisor), or nullopt once it exceeds kInt64Max.
std::optional<uint64_t> scaled_ceil_div(uint64_t mantissa, int shift, uint64_t divisor) {
    uint64_t q = mantissa / divisor;
    uint64_t r = mantissa % divisor;
    if (q > kInt64Max) return std::nullopt;
    for (int i = 0; i < shift; ++i) {
        if (q > (kInt64Max >> 1)) return std::nullopt;
        q <<= 1;
        // r < divisor, so compare against divisor - r instead of doubling r.
        if (r >= divisor - r) {
            r -= divisor - r;
            q |= 1;
        } else {
            r <<= 1;
        }
    }
    if (r != 0) {
        if (q == kInt64Max) return std::nullopt;
        ++q;
    }
    return q;
}

}  // namespace

Result<Quantity> Quantity::parse(std::string_view text) {
    if (text.empty()) return invalid(text, "empty");

    Quantity q;
    q.text_ = std::string{text};

    size_t pos = 0;
    if (text[pos] == '+' || text[pos] == '-') {
        q.negative_ = (text[pos] == '-');
        ++pos;
    }

    bool seen_digit = false;
    bool in_fraction = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (in_fraction) return invalid(text, "multiple decimal points");
            in_fraction = true;
            continue;
        }
        if (c < '0' || c > '9') break;
        seen_digit = true;
        auto digit = static_cast<uint64_t>(c - '0');
        if (q.mantissa_ <= (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            q.mantissa_ = q.mantissa_ * 10 + digit;
            if (in_fraction) --q.decimal_exponent_;
        } else if (!in_fraction) {
            // Out of precision: keep the magnitude, drop the low digit.
            ++q.decimal_exponent_;
        }
    }
    if (!seen_digit) return invalid(text, "no digits");

    auto suffix = text.substr(pos);
    if (suffix.empty()) return q;

    for (const auto& s : kSuffixes) {
        if (s.text == suffix) {
            q.decimal_exponent_ += s.decimal_exponent;
            q.binary_exponent_ = s.binary_exponent;
            return q;
        }
    }

    if ((suffix[0] == 'e' || suffix[0] == 'E') && suffix.size() > 1) {
        auto exp_text = suffix.substr(1);
        if (exp_text.front() == '+') exp_text.remove_prefix(1);
        int exponent = 0;
        auto [end, ec] = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(),
                                         exponent);
        if (ec != std::errc{} || end != exp_text.data() + exp_text.size()) {
            return invalid(text, "bad exponent");
        }
        if (exponent > kMaxExponent || exponent < -kMaxExponent) {
            return invalid(text, "exponent out of range");
        }
        q.decimal_exponent_ += exponent;
        return q;
    }

    return invalid(text, "unknown suffix");
}

Quantity Quantity::from_int(int64_t value) {
    Quantity q;
    q.text_ = std::to_string(value);
    q.negative_ = value < 0;
    q.mantissa_ = value < 0 ? static_cast<uint64_t>(-(value + 1)) + 1
                            : static_cast<uint64_t>(value);
    return q;
}

int64_t Quantity::value() const noexcept {
    std::optional<uint64_t> magnitude;

    if (decimal_exponent_ >= 0) {
        magnitude = scaled_ceil_div(mantissa_, binary_exponent_, 1);
        for (int i = 0; magnitude && *magnitude != 0 && i < decimal_exponent_; ++i) {
            if (*magnitude > kInt64Max / 10) {
                magnitude.reset();
            } else {
                *magnitude *= 10;
            }
        }
    } else {
        int shift = -decimal_exponent_;
        int first = std::min(shift, kMaxDivisorDigits);
        magnitude = scaled_ceil_div(mantissa_, binary_exponent_, pow10(first));
        // Nested ceilings equal the ceiling of the whole quotient.
        for (int i = first; magnitude && *magnitude > 1 && i < shift; ++i) {
            *magnitude = *magnitude / 10 + (*magnitude % 10 != 0 ? 1 : 0);
        }
    }

    if (!magnitude) {
        return negative_ ? std::numeric_limits<int64_t>::min()
                         : std::numeric_limits<int64_t>::max();
    }
    auto v = static_cast<int64_t>(*magnitude);
    return negative_ ? -v : v;
}

}  // namespace kube_device
