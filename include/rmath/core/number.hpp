// include/rmath/core/number.hpp — Radix-parameterised arbitrary-precision number value.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <rmath/core/bigint.hpp>
#include <rmath/core/detail/radix.hpp>

namespace rmath::core {

enum class number_kind : std::uint8_t { finite, infinity, quiet_nan, signaling_nan };

// Decomposed view of a number: value = (-1)^negative * mantissa * radix^exponent.
// For NaNs the mantissa holds the diagnostic payload and the exponent is zero.
struct number_parts {
    number_kind kind = number_kind::finite;
    bool negative = false;
    bigint mantissa;
    bigint exponent;

    bool is_finite() const noexcept { return kind == number_kind::finite; }
    bool is_infinity() const noexcept { return kind == number_kind::infinity; }
    bool is_nan() const noexcept {
        return kind == number_kind::quiet_nan || kind == number_kind::signaling_nan;
    }
    bool is_signaling() const noexcept { return kind == number_kind::signaling_nan; }
    bool is_zero() const noexcept { return is_finite() && mantissa.is_zero(); }

    friend bool operator==(const number_parts&, const number_parts&) = default;
};

template <int Radix>
class basic_number {
public:
    static_assert(Radix >= 2, "radix must be at least two");

    static constexpr int radix = Radix;

    basic_number() noexcept = default;

    // Signed mantissa times radix^exponent.
    explicit basic_number(const bigint& mantissa, bigint exponent = bigint::zero())
        : negative_(mantissa.is_negative()),
          mantissa_(mantissa.abs()),
          exponent_(std::move(exponent)) {}

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit basic_number(Int value) : basic_number(bigint(value)) {}

    static basic_number finite(bool negative, bigint magnitude, bigint exponent) {
        if (magnitude.is_negative()) {
            throw std::invalid_argument("mantissa magnitude must be non-negative");
        }
        basic_number result;
        result.negative_ = negative;
        result.mantissa_ = std::move(magnitude);
        result.exponent_ = std::move(exponent);
        return result;
    }

    static basic_number zero(bool negative = false) { return finite(negative, {}, {}); }
    static basic_number one() { return finite(false, bigint::one(), {}); }

    static basic_number infinity(bool negative = false) {
        basic_number result;
        result.kind_ = number_kind::infinity;
        result.negative_ = negative;
        return result;
    }

    static basic_number nan(bigint payload = bigint::zero(), bool negative = false) {
        return make_nan(number_kind::quiet_nan, std::move(payload), negative);
    }

    static basic_number signaling_nan(bigint payload = bigint::zero(), bool negative = false) {
        return make_nan(number_kind::signaling_nan, std::move(payload), negative);
    }

    static basic_number from_parts(number_parts parts) {
        if (parts.is_nan()) {
            return make_nan(parts.kind, std::move(parts.mantissa), parts.negative);
        }
        if (parts.is_infinity()) {
            return infinity(parts.negative);
        }
        return finite(parts.negative, std::move(parts.mantissa), std::move(parts.exponent));
    }

    number_parts parts() const { return {kind_, negative_, mantissa_, exponent_}; }

    number_kind kind() const noexcept { return kind_; }
    bool is_finite() const noexcept { return kind_ == number_kind::finite; }
    bool is_infinity() const noexcept { return kind_ == number_kind::infinity; }
    bool is_nan() const noexcept {
        return kind_ == number_kind::quiet_nan || kind_ == number_kind::signaling_nan;
    }
    bool is_quiet_nan() const noexcept { return kind_ == number_kind::quiet_nan; }
    bool is_signaling_nan() const noexcept { return kind_ == number_kind::signaling_nan; }
    bool is_negative() const noexcept { return negative_; }
    bool is_zero() const noexcept { return is_finite() && mantissa_.is_zero(); }

    const bigint& mantissa() const noexcept { return mantissa_; }
    const bigint& exponent() const noexcept { return exponent_; }
    const bigint& nan_payload() const noexcept { return mantissa_; }

    bigint signed_mantissa() const { return negative_ ? -mantissa_ : mantissa_; }

    std::size_t digits() const { return detail::digit_count(mantissa_, Radix); }

    bigint adjusted_exponent() const {
        return exponent_ + bigint(static_cast<std::uint64_t>(digits())) - bigint(1);
    }

    bool is_integer() const {
        if (!is_finite()) {
            return false;
        }
        if (!exponent_.is_negative() || mantissa_.is_zero()) {
            return true;
        }
        const bigint fraction_digits = -exponent_;
        const std::size_t zeros = detail::trailing_zero_digits(mantissa_, Radix);
        return bigint(static_cast<std::uint64_t>(zeros)) >= fraction_digits;
    }

    // Integer part, truncated toward zero.
    bigint to_bigint() const {
        if (!is_finite()) {
            throw std::overflow_error("value is not finite");
        }
        bigint magnitude;
        if (!exponent_.is_negative()) {
            magnitude = detail::scale_up(mantissa_, Radix, detail::to_size(exponent_));
        } else {
            const bigint drop = -exponent_;
            if (bigint(static_cast<std::uint64_t>(digits())) <= drop) {
                return bigint::zero();
            }
            magnitude = detail::split_low_digits(mantissa_, Radix, detail::to_size(drop)).first;
        }
        return negative_ ? -magnitude : magnitude;
    }

    std::int64_t to_int64() const { return static_cast<std::int64_t>(to_bigint()); }

    // Structural equality: 1.0 and 1.00 differ, as do +0 and -0.
    friend bool operator==(const basic_number& lhs, const basic_number& rhs) noexcept {
        return lhs.kind_ == rhs.kind_ && lhs.negative_ == rhs.negative_ &&
               lhs.mantissa_ == rhs.mantissa_ && lhs.exponent_ == rhs.exponent_;
    }

private:
    static basic_number make_nan(number_kind kind, bigint payload, bool negative) {
        if (payload.is_negative()) {
            throw std::invalid_argument("NaN payload must be non-negative");
        }
        basic_number result;
        result.kind_ = kind;
        result.negative_ = negative;
        result.mantissa_ = std::move(payload);
        return result;
    }

    number_kind kind_ = number_kind::finite;
    bool negative_ = false;
    bigint mantissa_;
    bigint exponent_;
};

using decimal = basic_number<10>;
using bigfloat = basic_number<2>;

} // namespace rmath::core
