// src/engine/navigation.cpp — Adjacent representable values: next-plus, next-minus, next-toward.

#include <rmath/engine/full_arithmetic.hpp>

#include <utility>

namespace rmath::engine {

number_parts full_arithmetic::next_toward_infinity(const number_parts &a, bool upward,
                                                   const context &ctx, flags &raised) const {
    const auto limits = detail::limits_for(ctx, radix_);
    if (a.is_infinity()) {
        if (a.negative != upward) {
            return a;
        }
        return detail::make_finite(a.negative, limits.max_mantissa,
                                   *ctx.emax() - detail::big(limits.max_digits - 1));
    }
    // A step below both the smallest subnormal and the operand's own last digit
    // moves exactly one unit once rounded toward the requested infinity.
    const context directed =
        ctx.with_rounding(upward ? rounding::ceiling : rounding::floor).with_traps(flags::none);
    bigint step_exponent = *detail::etiny(ctx, limits) - bigint(1);
    if (a.is_finite() && a.exponent - bigint(2) < step_exponent) {
        step_exponent = a.exponent - bigint(2);
    }
    const number_parts step = detail::make_finite(!upward, bigint::one(), std::move(step_exponent));
    return add(a, step, directed, raised);
}

number_parts full_arithmetic::next_plus(const number_parts &a, const context &ctx,
                                        flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    if (!ctx.has_max_precision() || !ctx.has_exponent_range()) {
        return detail::invalid_operation(raised);
    }
    flags local = flags::none;
    number_parts result = next_toward_infinity(a, true, ctx, local);
    raised |= local & flags::invalid;
    return result;
}

number_parts full_arithmetic::next_minus(const number_parts &a, const context &ctx,
                                         flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    if (!ctx.has_max_precision() || !ctx.has_exponent_range()) {
        return detail::invalid_operation(raised);
    }
    flags local = flags::none;
    number_parts result = next_toward_infinity(a, false, ctx, local);
    raised |= local & flags::invalid;
    return result;
}

number_parts full_arithmetic::next_toward(const number_parts &a, const number_parts &b,
                                          const context &ctx, flags &raised) const {
    if (auto nan = propagate_nan(a, b, ctx, raised)) {
        return *nan;
    }
    if (!ctx.has_max_precision() || !ctx.has_exponent_range()) {
        return detail::invalid_operation(raised);
    }
    const int order = compare_finite(a, b, false);
    if (order == 0) {
        number_parts result = a;
        result.negative = b.negative;
        return result;
    }
    flags local = flags::none;
    number_parts result = next_toward_infinity(a, order < 0, ctx, local);
    const bool normal = result.is_finite() && !result.mantissa.is_zero() &&
                        detail::adjusted_exponent(result, radix_) >= *ctx.emin();
    if (normal) {
        local &= flags::invalid;
    }
    raised |= local;
    return result;
}

} // namespace rmath::engine
