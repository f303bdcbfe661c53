// src/engine/arithmetic.cpp — Addition, multiplication, division and the integer-division family.

#include <rmath/engine/full_arithmetic.hpp>

#include <utility>

namespace rmath::engine {

namespace {

    bigint signed_value(const bigint &magnitude, bool negative) {
        return negative ? -magnitude : magnitude;
    }

    const bigint &min_of(const bigint &lhs, const bigint &rhs) { return rhs < lhs ? rhs : lhs; }

} // namespace

number_parts full_arithmetic::pad_to_exponent(number_parts value, const bigint &exponent,
                                              const context &ctx, flags &raised) const {
    if (!value.is_finite() || value.mantissa.is_zero() || value.exponent <= exponent) {
        return value;
    }
    const auto limits = detail::limits_for(ctx, radix_);
    bigint allowed = value.exponent - exponent;
    if (limits.bounded) {
        const std::size_t digits = core::detail::digit_count(value.mantissa, radix_);
        const std::size_t room = digits < limits.max_digits ? limits.max_digits - digits : 0;
        if (allowed > detail::big(room)) {
            allowed = detail::big(room);
            raised |= flags::rounded;
        }
    }
    if (const auto tiny = detail::etiny(ctx, limits); tiny && value.exponent - allowed < *tiny) {
        allowed = value.exponent - *tiny;
    }
    if (allowed.signum() <= 0) {
        return value;
    }
    std::size_t pad = core::detail::to_size(allowed);
    bigint padded = core::detail::scale_up(value.mantissa, radix_, pad);
    while (limits.bounded && pad > 0 && padded > limits.max_mantissa) {
        padded = padded.div_mod_small(static_cast<bigint::limb>(radix_)).first;
        --pad;
        raised |= flags::rounded;
    }
    value.mantissa = std::move(padded);
    value.exponent -= detail::big(pad);
    return value;
}

number_parts full_arithmetic::add(const number_parts &a, const number_parts &b,
                                  const context &ctx, flags &raised) const {
    if (auto nan = propagate_nan(a, b, ctx, raised)) {
        return *nan;
    }
    if (a.is_infinity()) {
        if (b.is_infinity() && a.negative != b.negative) {
            return detail::invalid_operation(raised);
        }
        return detail::make_infinity(a.negative);
    }
    if (b.is_infinity()) {
        return detail::make_infinity(b.negative);
    }

    const bool floor_mode = ctx.rounding_mode() == rounding::floor;
    if (a.mantissa.is_zero() && b.mantissa.is_zero()) {
        const bool negative = a.negative == b.negative ? a.negative : floor_mode;
        return finalize(detail::make_finite(negative, {}, min_of(a.exponent, b.exponent)), ctx,
                        raised);
    }
    if (a.mantissa.is_zero() || b.mantissa.is_zero()) {
        const number_parts &zero = a.mantissa.is_zero() ? a : b;
        const number_parts &other = a.mantissa.is_zero() ? b : a;
        // The exact sum is `other` at the lower exponent; round it only once.
        return finalize(pad_to_exponent(other, zero.exponent, ctx, raised), ctx, raised);
    }

    number_parts hi = a;
    number_parts lo = b;
    if (hi.exponent < lo.exponent) {
        std::swap(hi, lo);
    }
    const auto limits = detail::limits_for(ctx, radix_);
    if (limits.bounded) {
        // An operand wholly below the rounding digit only contributes a sticky
        // bit; replace it by a single unit so alignment stays small.
        const bigint precision_floor =
            detail::adjusted_exponent(hi, radix_) - detail::big(limits.max_digits);
        const bigint sticky_exponent = min_of(hi.exponent, precision_floor) - bigint(2);
        if (detail::adjusted_exponent(lo, radix_) <= sticky_exponent) {
            lo.mantissa = bigint::one();
            lo.exponent = sticky_exponent;
        }
    }
    const std::size_t gap = core::detail::to_size(hi.exponent - lo.exponent);
    const bigint sum =
        signed_value(core::detail::scale_up(hi.mantissa, radix_, gap), hi.negative) +
        signed_value(lo.mantissa, lo.negative);
    if (sum.is_zero()) {
        return finalize(detail::make_finite(floor_mode, {}, lo.exponent), ctx, raised);
    }
    return finalize(detail::make_finite(sum.is_negative(), sum.abs(), lo.exponent), ctx, raised);
}

number_parts full_arithmetic::add_ex(const number_parts &a, const number_parts &b,
                                     const context &ctx, bool round_to_operand_precision,
                                     flags &raised) const {
    if (!round_to_operand_precision || !ctx.has_max_precision()) {
        return add(a, b, ctx, raised);
    }
    const auto limits = detail::limits_for(ctx, radix_);
    const auto fit_operand = [&](const number_parts &operand) {
        if (!operand.is_finite() || operand.mantissa <= limits.max_mantissa) {
            return operand;
        }
        return finalize(operand, ctx.without_exponent_range(), raised);
    };
    return add(fit_operand(a), fit_operand(b), ctx, raised);
}

number_parts full_arithmetic::subtract(const number_parts &a, const number_parts &b,
                                       const context &ctx, flags &raised) const {
    number_parts negated = b;
    if (!negated.is_nan()) {
        negated.negative = !negated.negative;
    }
    return add(a, negated, ctx, raised);
}

number_parts full_arithmetic::multiply(const number_parts &a, const number_parts &b,
                                       const context &ctx, flags &raised) const {
    if (auto nan = propagate_nan(a, b, ctx, raised)) {
        return *nan;
    }
    const bool negative = a.negative != b.negative;
    if (a.is_infinity() || b.is_infinity()) {
        if (a.is_zero() || b.is_zero()) {
            return detail::invalid_operation(raised);
        }
        return detail::make_infinity(negative);
    }
    return finalize(
        detail::make_finite(negative, a.mantissa * b.mantissa, a.exponent + b.exponent), ctx,
        raised);
}

number_parts full_arithmetic::multiply_and_add(const number_parts &a, const number_parts &b,
                                               const number_parts &c, const context &ctx,
                                               flags &raised) const {
    if (auto nan = propagate_nan(a, b, c, ctx, raised)) {
        return *nan;
    }
    // The product is exact so the sum is rounded once.
    const number_parts product = multiply(a, b, context::unlimited(), raised);
    if (product.is_nan()) {
        return product;
    }
    return add(product, c, ctx, raised);
}

number_parts full_arithmetic::divide(const number_parts &a, const number_parts &b,
                                     const context &ctx, flags &raised) const {
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
    const auto limits = detail::limits_for(ctx, radix_);
    if (b.is_infinity()) {
        const auto tiny = detail::etiny(ctx, limits);
        if (tiny) {
            raised |= flags::clamped;
        }
        return finalize(detail::make_finite(negative, {}, tiny ? *tiny : bigint{}), ctx, raised);
    }
    if (b.mantissa.is_zero()) {
        if (a.mantissa.is_zero()) {
            return detail::invalid_operation(raised);
        }
        raised |= flags::divide_by_zero;
        return detail::make_infinity(negative);
    }
    const bigint ideal = a.exponent - b.exponent;
    if (a.mantissa.is_zero()) {
        return finalize(detail::make_finite(negative, {}, ideal), ctx, raised);
    }

    if (!limits.bounded) {
        // Unlimited precision only admits terminating quotients.
        const bigint common = bigint::gcd(a.mantissa, b.mantissa);
        bigint denominator = b.mantissa / common;
        std::size_t scale = 0;
        while (denominator != bigint(1)) {
            const bigint factor = bigint::gcd(denominator, bigint(radix_));
            if (factor == bigint(1)) {
                return detail::invalid_operation(raised);
            }
            denominator /= factor;
            ++scale;
        }
        const bigint quotient =
            core::detail::scale_up(a.mantissa / common, radix_, scale) / (b.mantissa / common);
        return finalize(detail::make_finite(negative, quotient, ideal - detail::big(scale)), ctx,
                        raised);
    }

    const std::size_t dividend_digits = core::detail::digit_count(a.mantissa, radix_);
    const std::size_t divisor_digits = core::detail::digit_count(b.mantissa, radix_);
    std::size_t scale = 0;
    if (limits.max_digits + 1 + divisor_digits > dividend_digits) {
        scale = limits.max_digits + 1 + divisor_digits - dividend_digits;
    }
    auto [quotient, remainder] =
        bigint::div_mod(core::detail::scale_up(a.mantissa, radix_, scale), b.mantissa);
    bigint exponent = ideal - detail::big(scale);
    if (remainder.is_zero()) {
        exponent += detail::big(core::detail::strip_trailing_zeros(quotient, radix_, scale));
        return finalize(detail::make_finite(negative, std::move(quotient), std::move(exponent)),
                        ctx, raised);
    }
    const detail::residue rest = detail::classify(remainder, b.mantissa, detail::residue::zero);
    return finalize(detail::make_finite(negative, std::move(quotient), std::move(exponent)), ctx,
                    raised, rest);
}

std::optional<full_arithmetic::integer_division>
full_arithmetic::divide_integer_parts(const number_parts &a, const number_parts &b,
                                      const context &ctx) const {
    const auto limits = detail::limits_for(ctx, radix_);
    const bigint adjusted_a = detail::adjusted_exponent(a, radix_);
    const bigint adjusted_b = detail::adjusted_exponent(b, radix_);
    if (limits.bounded && !a.mantissa.is_zero() &&
        adjusted_a - adjusted_b > detail::big(limits.max_digits)) {
        return std::nullopt;
    }
    const bigint &exponent = min_of(a.exponent, b.exponent);
    bigint dividend = core::detail::scale_up(a.mantissa, radix_,
                                             core::detail::to_size(a.exponent - exponent));
    if (a.mantissa.is_zero() || adjusted_a + bigint(1) < adjusted_b) {
        // |a| lies below |b| / radix; the divisor is left empty.
        return integer_division{bigint{}, std::move(dividend), bigint{}, exponent};
    }
    bigint divisor = core::detail::scale_up(b.mantissa, radix_,
                                            core::detail::to_size(b.exponent - exponent));
    auto [quotient, remainder] = bigint::div_mod(dividend, divisor);
    if (limits.bounded && quotient > limits.max_mantissa) {
        return std::nullopt;
    }
    return integer_division{std::move(quotient), std::move(remainder), std::move(divisor),
                            exponent};
}

number_parts full_arithmetic::divide_to_integer_impl(const number_parts &a, const number_parts &b,
                                                     const context &ctx, bool natural_scale,
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
    if (b.is_infinity()) {
        return finalize(detail::make_finite(negative, {}, {}), ctx, raised);
    }
    if (b.mantissa.is_zero()) {
        if (a.mantissa.is_zero()) {
            return detail::invalid_operation(raised);
        }
        raised |= flags::divide_by_zero;
        return detail::make_infinity(negative);
    }
    auto division = divide_integer_parts(a, b, ctx);
    if (!division) {
        return detail::invalid_operation(raised);
    }
    if (!natural_scale) {
        return finalize(detail::make_finite(negative, std::move(division->quotient), {}), ctx,
                        raised);
    }
    const bigint ideal = a.exponent - b.exponent;
    if (division->quotient.is_zero()) {
        return finalize(detail::make_finite(negative, {}, ideal), ctx, raised);
    }
    number_parts result = detail::make_finite(negative, std::move(division->quotient), {});
    if (ideal.signum() > 0) {
        const std::size_t limit =
            ideal.fits<std::size_t>() ? static_cast<std::size_t>(ideal) : ~std::size_t{0};
        result.exponent =
            detail::big(core::detail::strip_trailing_zeros(result.mantissa, radix_, limit));
    } else if (ideal.signum() < 0) {
        flags padding = flags::none;
        result = pad_to_exponent(std::move(result), ideal, ctx, padding);
    }
    return finalize(std::move(result), ctx, raised);
}

number_parts full_arithmetic::divide_to_integer_natural_scale(const number_parts &a,
                                                              const number_parts &b,
                                                              const context &ctx,
                                                              flags &raised) const {
    return divide_to_integer_impl(a, b, ctx, true, raised);
}

number_parts full_arithmetic::divide_to_integer_zero_scale(const number_parts &a,
                                                           const number_parts &b,
                                                           const context &ctx,
                                                           flags &raised) const {
    return divide_to_integer_impl(a, b, ctx, false, raised);
}

number_parts full_arithmetic::remainder_impl(const number_parts &a, const number_parts &b,
                                             const context &ctx, bool nearest,
                                             flags &raised) const {
    if (auto nan = propagate_nan(a, b, ctx, raised)) {
        return *nan;
    }
    if (a.is_infinity() || b.is_zero()) {
        return detail::invalid_operation(raised);
    }
    if (b.is_infinity()) {
        return finalize(a, ctx, raised);
    }
    auto division = divide_integer_parts(a, b, ctx);
    if (!division) {
        return detail::invalid_operation(raised);
    }
    bool negative = a.negative;
    bigint rest = std::move(division->remainder);
    if (nearest && !rest.is_zero() && !division->divisor.is_zero()) {
        const bigint twice = rest << 1;
        if (twice > division->divisor || (twice == division->divisor && division->quotient.is_odd())) {
            rest = division->divisor - rest;
            negative = !negative;
            const auto limits = detail::limits_for(ctx, radix_);
            if (limits.bounded && division->quotient + bigint(1) > limits.max_mantissa) {
                return detail::invalid_operation(raised);
            }
        }
    }
    return finalize(detail::make_finite(negative, std::move(rest), std::move(division->exponent)),
                    ctx, raised);
}

number_parts full_arithmetic::remainder(const number_parts &a, const number_parts &b,
                                        const context &ctx, flags &raised) const {
    return remainder_impl(a, b, ctx, false, raised);
}

number_parts full_arithmetic::remainder_near(const number_parts &a, const number_parts &b,
                                             const context &ctx, flags &raised) const {
    return remainder_impl(a, b, ctx, true, raised);
}

} // namespace rmath::engine
