// src/engine/quantize.cpp — Rounding to a fixed exponent: quantize, divide-to-exponent, round-to-exponent.

#include <rmath/engine/full_arithmetic.hpp>

#include <utility>

namespace rmath::engine {

namespace {

    // True when `exponent` is not a representable result exponent for the context.
    bool exponent_out_of_range(const bigint &exponent, const context &ctx,
                               const detail::precision_limits &limits) {
        if (!ctx.has_exponent_range()) {
            return false;
        }
        const auto tiny = detail::etiny(ctx, limits);
        return (tiny && exponent < *tiny) || exponent > *ctx.emax();
    }

    // Folds a result whose exponent lies above the clamped top down to it.
    number_parts fold_down(number_parts value, int radix, const context &ctx,
                           const detail::precision_limits &limits, flags &raised) {
        const auto top = detail::etop(ctx, limits);
        if (!top || value.exponent <= *top) {
            return value;
        }
        if (!value.mantissa.is_zero()) {
            value.mantissa = core::detail::scale_up(value.mantissa, radix,
                                                    core::detail::to_size(value.exponent - *top));
        }
        value.exponent = *top;
        raised |= flags::clamped;
        return value;
    }

} // namespace

number_parts full_arithmetic::quantize_ratio(const number_parts &a, const number_parts &b,
                                             const bigint &exponent, const context &ctx,
                                             flags &raised) const {
    if (auto nan = propagate_nan(a, b, ctx, raised)) {
        return *nan;
    }
    const bool negative = a.negative != b.negative;
    if (a.is_infinity()) {
        if (b.is_infinity()) {
            return detail::invalid_operation(raised);
        }
        return detail::make_infinity(negative);
    }
    if (b.mantissa.is_zero() && b.is_finite()) {
        if (a.mantissa.is_zero()) {
            return detail::invalid_operation(raised);
        }
        raised |= flags::divide_by_zero;
        return detail::make_infinity(negative);
    }
    const auto limits = detail::limits_for(ctx, radix_);
    if (exponent_out_of_range(exponent, ctx, limits)) {
        return detail::invalid_operation(raised);
    }
    if (b.is_infinity() || a.mantissa.is_zero()) {
        return fold_down(detail::make_finite(negative, {}, exponent), radix_, ctx, limits, raised);
    }

    // a / b / radix^exponent = (ma / mb) * radix^shift
    const bigint shift = a.exponent - b.exponent - exponent;
    const bigint magnitude =
        detail::adjusted_exponent(a, radix_) - detail::adjusted_exponent(b, radix_) - exponent;
    if (limits.bounded && magnitude > detail::big(limits.max_digits + 1)) {
        return detail::invalid_operation(raised);
    }

    bigint quotient;
    detail::residue rest = detail::residue::zero;
    const bigint lower_bound = -detail::big(core::detail::digit_count(a.mantissa, radix_) + 2);
    if (shift < lower_bound) {
        rest = detail::residue::below_half;
    } else {
        bigint numerator = a.mantissa;
        bigint denominator = b.mantissa;
        if (shift.signum() >= 0) {
            numerator = core::detail::scale_up(numerator, radix_, core::detail::to_size(shift));
        } else {
            denominator =
                core::detail::scale_up(denominator, radix_, core::detail::to_size(-shift));
        }
        auto [whole, fraction] = bigint::div_mod(numerator, denominator);
        quotient = std::move(whole);
        rest = detail::classify(fraction, denominator, detail::residue::zero);
    }
    if (detail::round_away(ctx.rounding_mode(), rest, negative,
                           core::detail::lowest_digit(quotient, radix_), radix_)) {
        quotient += bigint(1);
    }
    if (limits.bounded && quotient > limits.max_mantissa) {
        return detail::invalid_operation(raised);
    }
    if (!quotient.is_zero() && ctx.has_exponent_range()) {
        const bigint adjusted =
            exponent + detail::big(core::detail::digit_count(quotient, radix_)) - bigint(1);
        if (adjusted > *ctx.emax()) {
            return detail::invalid_operation(raised);
        }
        if (adjusted < *ctx.emin()) {
            raised |= flags::subnormal;
        }
    }
    if (rest != detail::residue::zero) {
        raised |= flags::inexact | flags::rounded;
    }
    return fold_down(detail::make_finite(negative, std::move(quotient), exponent), radix_, ctx,
                     limits, raised);
}

number_parts full_arithmetic::rescale(const number_parts &a, const bigint &exponent,
                                      const context &ctx, flags &raised) const {
    static const number_parts unit = detail::make_finite(false, bigint::one(), {});
    number_parts result = quantize_ratio(a, unit, exponent, ctx, raised);
    if (result.is_finite() && !a.mantissa.is_zero() && a.exponent < exponent) {
        raised |= flags::rounded;
    }
    return result;
}

number_parts full_arithmetic::quantize(const number_parts &a, const number_parts &pattern,
                                       const context &ctx, flags &raised) const {
    if (auto nan = propagate_nan(a, pattern, ctx, raised)) {
        return *nan;
    }
    if (a.is_infinity() || pattern.is_infinity()) {
        if (a.is_infinity() && pattern.is_infinity()) {
            return detail::make_infinity(a.negative);
        }
        return detail::invalid_operation(raised);
    }
    return rescale(a, pattern.exponent, ctx, raised);
}

number_parts full_arithmetic::divide_to_exponent(const number_parts &a, const number_parts &b,
                                                 const bigint &exponent, const context &ctx,
                                                 flags &raised) const {
    return quantize_ratio(a, b, exponent, ctx, raised);
}

number_parts full_arithmetic::round_to_exponent_simple(const number_parts &a,
                                                       const bigint &exponent,
                                                       const context &ctx,
                                                       flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    if (a.is_infinity()) {
        return a;
    }
    if (a.exponent >= exponent) {
        return finalize(a, ctx, raised);
    }
    return rescale(a, exponent, ctx, raised);
}

number_parts full_arithmetic::round_to_exponent_no_rounded_flag(const number_parts &a,
                                                                const bigint &exponent,
                                                                const context &ctx,
                                                                flags &raised) const {
    flags local = flags::none;
    number_parts result = round_to_exponent_simple(a, exponent, ctx, local);
    if (!any(local & flags::inexact)) {
        local &= ~flags::rounded;
    }
    raised |= local;
    return result;
}

number_parts full_arithmetic::round_to_exponent_exact(const number_parts &a,
                                                      const bigint &exponent,
                                                      const context &ctx, flags &raised) const {
    flags local = flags::none;
    number_parts result = round_to_exponent_simple(a, exponent, ctx, local);
    if (any(local & flags::inexact)) {
        return detail::invalid_operation(raised);
    }
    raised |= local;
    return result;
}

} // namespace rmath::engine
