// include/rmath/engine/detail/rounding.hpp — Residue classification, precision limits and part builders.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include <rmath/context.hpp>
#include <rmath/core/bigint.hpp>
#include <rmath/core/detail/radix.hpp>
#include <rmath/core/number.hpp>

namespace rmath::engine::detail {

    using core::bigint;
    using core::number_kind;
    using core::number_parts;

    // Position of a discarded fraction relative to half a unit in the last kept digit.
    enum class residue : std::uint8_t { zero, below_half, half, above_half };

    struct precision_limits {
        bool bounded = false;
        std::size_t max_digits = 0;
        bigint max_mantissa;
    };

    precision_limits limits_for(const context &ctx, int radix);

    // Smallest exponent a nonzero result may carry; empty when the context has no range.
    std::optional<bigint> etiny(const context &ctx, const precision_limits &limits);

    // Largest exponent a result may carry once fold-down is applied.
    std::optional<bigint> etop(const context &ctx, const precision_limits &limits);

    inline bigint big(std::size_t value) { return bigint(static_cast<std::uint64_t>(value)); }

    inline number_parts make_finite(bool negative, bigint mantissa, bigint exponent) {
        return {number_kind::finite, negative, std::move(mantissa), std::move(exponent)};
    }

    inline number_parts make_infinity(bool negative) {
        return {number_kind::infinity, negative, bigint{}, bigint{}};
    }

    inline number_parts make_nan(bool negative = false, bigint payload = {}) {
        return {number_kind::quiet_nan, negative, std::move(payload), bigint{}};
    }

    inline number_parts invalid_operation(flags &raised) {
        raised |= flags::invalid;
        return make_nan();
    }

    inline bigint adjusted_exponent(const number_parts &value, int radix) {
        return value.exponent + big(core::detail::digit_count(value.mantissa, radix)) - bigint(1);
    }

    // Classifies `remainder + delta` against half of `unit`, where `delta` is a
    // fraction below one already described by `incoming`.
    inline residue classify(const bigint &remainder, const bigint &unit, residue incoming) {
        if (remainder.is_zero() && incoming == residue::zero) {
            return residue::zero;
        }
        const bigint gap = unit - (remainder << 1);
        if (gap.is_negative()) {
            return residue::above_half;
        }
        if (gap.is_zero()) {
            return incoming == residue::zero ? residue::half : residue::above_half;
        }
        if (gap == bigint(1) && incoming != residue::zero) {
            return incoming;
        }
        return residue::below_half;
    }

    // {magnitude / radix^shift, residue of the discarded digits}.
    inline std::pair<bigint, residue> shift_right_digits(const bigint &magnitude, int radix,
                                                         std::size_t shift, residue incoming) {
        if (shift == 0) {
            return {magnitude, incoming};
        }
        auto [quotient, remainder] = core::detail::split_low_digits(magnitude, radix, shift);
        return {std::move(quotient),
                classify(remainder, core::detail::radix_power(radix, shift), incoming)};
    }

    inline bool round_away(rounding mode, residue discarded, bool negative,
                           std::uint64_t last_digit, int radix) noexcept {
        if (discarded == residue::zero) {
            return false;
        }
        switch (mode) {
        case rounding::half_even:
            return discarded == residue::above_half ||
                   (discarded == residue::half && (last_digit & 1U) != 0);
        case rounding::half_up:
            return discarded != residue::below_half;
        case rounding::half_down:
            return discarded == residue::above_half;
        case rounding::up:
            return true;
        case rounding::down:
            return false;
        case rounding::ceiling:
            return !negative;
        case rounding::floor:
            return negative;
        case rounding::zero_five_up:
            return last_digit == 0 ||
                   (radix > 2 && radix % 2 == 0 &&
                    last_digit == static_cast<std::uint64_t>(radix / 2));
        }
        return false;
    }

    // Rounding modes that keep an overflowing result at the largest finite value.
    inline bool overflow_to_max(rounding mode, bool negative) noexcept {
        switch (mode) {
        case rounding::down:
        case rounding::zero_five_up:
            return true;
        case rounding::ceiling:
            return negative;
        case rounding::floor:
            return !negative;
        default:
            return false;
        }
    }

} // namespace rmath::engine::detail
