// src/engine/rounding.cpp — Context rounding, NaN propagation and the single-operand rounding family.

#include <rmath/engine/full_arithmetic.hpp>

#include <initializer_list>
#include <limits>
#include <tuple>
#include <utility>

namespace rmath::engine {

namespace detail {

    precision_limits limits_for(const context &ctx, int radix) {
        precision_limits limits;
        if (!ctx.has_max_precision()) {
            return limits;
        }
        limits.bounded = true;
        if (ctx.precision_in_bits()) {
            limits.max_mantissa = (bigint::one() << ctx.precision()) - bigint(1);
            limits.max_digits = core::detail::digit_count(limits.max_mantissa, radix);
        } else {
            limits.max_mantissa = core::detail::radix_power(radix, ctx.precision()) - bigint(1);
            limits.max_digits = ctx.precision();
        }
        return limits;
    }

    std::optional<bigint> etiny(const context &ctx, const precision_limits &limits) {
        if (!ctx.has_exponent_range() || !limits.bounded) {
            return std::nullopt;
        }
        return *ctx.emin() - big(limits.max_digits - 1);
    }

    std::optional<bigint> etop(const context &ctx, const precision_limits &limits) {
        if (!ctx.has_exponent_range()) {
            return std::nullopt;
        }
        if (ctx.clamp_normal_exponents() && limits.bounded) {
            return *ctx.emax() - big(limits.max_digits - 1);
        }
        return *ctx.emax();
    }

} // namespace detail

namespace {

    std::size_t saturating_size(const bigint &value) {
        if (value.is_negative()) {
            return 0;
        }
        if (!value.fits<std::size_t>()) {
            return std::numeric_limits<std::size_t>::max();
        }
        return static_cast<std::size_t>(value);
    }

} // namespace

full_arithmetic::full_arithmetic(int radix) : radix_(radix) { core::detail::check_radix(radix); }

number_parts full_arithmetic::fit_nan(number_parts nan, const context &ctx) const {
    const auto limits = detail::limits_for(ctx, radix_);
    if (limits.bounded) {
        std::size_t keep = limits.max_digits;
        if (ctx.clamp_normal_exponents() && keep > 0) {
            --keep;
        }
        if (core::detail::digit_count(nan.mantissa, radix_) > keep) {
            nan.mantissa = core::detail::split_low_digits(nan.mantissa, radix_, keep).second;
        }
    }
    nan.exponent = bigint::zero();
    return nan;
}

std::optional<number_parts> full_arithmetic::propagate_nan(const number_parts &a,
                                                           const context &ctx,
                                                           flags &raised) const {
    if (a.is_signaling()) {
        raised |= flags::invalid;
        number_parts quiet = a;
        quiet.kind = core::number_kind::quiet_nan;
        return fit_nan(std::move(quiet), ctx);
    }
    if (a.is_nan()) {
        return fit_nan(a, ctx);
    }
    return std::nullopt;
}

std::optional<number_parts> full_arithmetic::propagate_nan(const number_parts &a,
                                                           const number_parts &b,
                                                           const context &ctx,
                                                           flags &raised) const {
    if (a.is_signaling()) {
        return propagate_nan(a, ctx, raised);
    }
    if (b.is_signaling()) {
        return propagate_nan(b, ctx, raised);
    }
    if (a.is_nan()) {
        return propagate_nan(a, ctx, raised);
    }
    if (b.is_nan()) {
        return propagate_nan(b, ctx, raised);
    }
    return std::nullopt;
}

std::optional<number_parts> full_arithmetic::propagate_nan(const number_parts &a,
                                                           const number_parts &b,
                                                           const number_parts &c,
                                                           const context &ctx,
                                                           flags &raised) const {
    for (const number_parts *operand : {&a, &b, &c}) {
        if (operand->is_signaling()) {
            return propagate_nan(*operand, ctx, raised);
        }
    }
    for (const number_parts *operand : {&a, &b, &c}) {
        if (operand->is_nan()) {
            return propagate_nan(*operand, ctx, raised);
        }
    }
    return std::nullopt;
}

number_parts full_arithmetic::overflow_result(bool negative, const context &ctx,
                                              const detail::precision_limits &limits,
                                              flags &raised) const {
    raised |= flags::overflow | flags::inexact | flags::rounded;
    if (limits.bounded && detail::overflow_to_max(ctx.rounding_mode(), negative)) {
        return detail::make_finite(negative, limits.max_mantissa,
                                   *ctx.emax() - detail::big(limits.max_digits - 1));
    }
    return detail::make_infinity(negative);
}

number_parts full_arithmetic::finalize(number_parts value, const context &ctx, flags &raised,
                                       detail::residue incoming) const {
    if (value.is_nan()) {
        return fit_nan(std::move(value), ctx);
    }
    if (value.is_infinity()) {
        return value;
    }
    const auto limits = detail::limits_for(ctx, radix_);
    const auto tiny = detail::etiny(ctx, limits);
    const auto top = detail::etop(ctx, limits);

    if (value.mantissa.is_zero() && incoming == detail::residue::zero) {
        if (tiny && value.exponent < *tiny) {
            value.exponent = *tiny;
            raised |= flags::clamped;
        } else if (top && value.exponent > *top) {
            value.exponent = *top;
            raised |= flags::clamped;
        }
        return value;
    }

    const std::size_t digits = core::detail::digit_count(value.mantissa, radix_);
    const bigint exact_adjusted = value.exponent + detail::big(digits) - bigint(1);

    bigint shift;
    if (limits.bounded && digits > limits.max_digits) {
        shift = detail::big(digits - limits.max_digits);
    }
    if (tiny && value.exponent + shift < *tiny) {
        shift = *tiny - value.exponent;
    }

    bigint rounded;
    detail::residue rest = detail::residue::zero;
    while (true) {
        if (shift > detail::big(digits)) {
            rounded = bigint::zero();
            rest = detail::residue::below_half;
        } else {
            std::tie(rounded, rest) = detail::shift_right_digits(
                value.mantissa, radix_, core::detail::to_size(shift), incoming);
        }
        if (detail::round_away(ctx.rounding_mode(), rest, value.negative,
                               core::detail::lowest_digit(rounded, radix_), radix_)) {
            rounded += bigint(1);
        }
        if (limits.bounded && rounded > limits.max_mantissa) {
            shift += bigint(1);
            continue;
        }
        break;
    }

    bigint exponent = value.exponent + shift;
    const bool inexact = rest != detail::residue::zero;
    if (shift.signum() > 0) {
        raised |= flags::rounded;
    }
    if (inexact) {
        raised |= flags::inexact | flags::rounded;
    }

    if (ctx.has_exponent_range()) {
        if (exact_adjusted < *ctx.emin()) {
            raised |= flags::subnormal;
            if (inexact) {
                raised |= flags::underflow;
                if (rounded.is_zero()) {
                    raised |= flags::clamped;
                }
            }
        }
        if (!rounded.is_zero()) {
            const bigint adjusted =
                exponent + detail::big(core::detail::digit_count(rounded, radix_)) - bigint(1);
            if (adjusted > *ctx.emax()) {
                return overflow_result(value.negative, ctx, limits, raised);
            }
        }
        if (top && exponent > *top) {
            if (!rounded.is_zero()) {
                rounded = core::detail::scale_up(rounded, radix_,
                                                 core::detail::to_size(exponent - *top));
            }
            exponent = *top;
            raised |= flags::clamped;
        }
    }
    return detail::make_finite(value.negative, std::move(rounded), std::move(exponent));
}

number_parts full_arithmetic::round_to_precision(const number_parts &a, const context &ctx,
                                                 flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    return finalize(a, ctx, raised);
}

number_parts full_arithmetic::round_to_binary_precision(const number_parts &a,
                                                        const context &ctx,
                                                        flags &raised) const {
    return round_to_precision(a, ctx.with_precision_in_bits(true), raised);
}

number_parts full_arithmetic::round_after_conversion(const number_parts &a, const context &ctx,
                                                     flags &raised) const {
    // A converted signaling NaN stays signaling; nothing consumed it yet.
    if (a.is_signaling()) {
        return fit_nan(a, ctx);
    }
    return round_to_precision(a, ctx, raised);
}

number_parts full_arithmetic::plus(const number_parts &a, const context &ctx,
                                   flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    number_parts result = finalize(a, ctx, raised);
    if (result.is_zero() && result.negative && ctx.rounding_mode() != rounding::floor) {
        result.negative = false;
    }
    return result;
}

number_parts full_arithmetic::negate(const number_parts &a, const context &ctx,
                                     flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    number_parts flipped = a;
    flipped.negative = !flipped.negative;
    return finalize(std::move(flipped), ctx, raised);
}

number_parts full_arithmetic::abs(const number_parts &a, const context &ctx,
                                  flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    number_parts positive = a;
    positive.negative = false;
    return finalize(std::move(positive), ctx, raised);
}

number_parts full_arithmetic::reduce(const number_parts &a, const context &ctx,
                                     flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    number_parts result = finalize(a, ctx, raised);
    if (!result.is_finite()) {
        return result;
    }
    if (result.mantissa.is_zero()) {
        return finalize(detail::make_finite(result.negative, bigint{}, bigint{}), ctx, raised);
    }
    std::size_t limit = std::numeric_limits<std::size_t>::max();
    const auto top = detail::etop(ctx, detail::limits_for(ctx, radix_));
    if (top) {
        limit = saturating_size(*top - result.exponent);
    }
    const std::size_t removed = core::detail::strip_trailing_zeros(result.mantissa, radix_, limit);
    result.exponent += detail::big(removed);
    return result;
}

} // namespace rmath::engine
