// src/engine/native.cpp — 128-bit fast paths mirroring the kernel inside the normal range.

#include <rmath/engine/detail/native.hpp>

#include <algorithm>
#include <limits>
#include <utility>

namespace rmath::engine::detail {

namespace {

    // Intermediates stay below 2^126 so doubling a remainder never wraps.
    constexpr native_uint NATIVE_LIMIT = native_uint{1} << 126;

    residue classify_native(native_uint remainder, native_uint unit, residue incoming) noexcept {
        if (remainder == 0 && incoming == residue::zero) {
            return residue::zero;
        }
        const native_uint twice = remainder << 1;
        if (twice > unit) {
            return residue::above_half;
        }
        if (twice == unit) {
            return incoming == residue::zero ? residue::half : residue::above_half;
        }
        if (unit - twice == 1 && incoming != residue::zero) {
            return incoming;
        }
        return residue::below_half;
    }

    bool in_native_range(std::int64_t exponent) noexcept {
        return exponent >= -NATIVE_EXPONENT_LIMIT && exponent <= NATIVE_EXPONENT_LIMIT;
    }

    number_parts invalid(flags &raised) { return invalid_operation(raised); }

} // namespace

std::optional<native_context> to_native(const context &ctx, int radix) {
    if (!ctx.has_max_precision() || (ctx.precision_in_bits() && radix != 2)) {
        return std::nullopt;
    }
    const native_uint limit = native_uint{1} << NATIVE_MANTISSA_BITS;
    native_uint power = 1;
    for (std::size_t index = 0; index < ctx.precision(); ++index) {
        power *= static_cast<native_uint>(radix);
        if (power >= limit) {
            return std::nullopt;
        }
    }
    native_context native;
    native.radix = radix;
    native.precision = static_cast<unsigned>(ctx.precision());
    native.max_mantissa = power - 1;
    native.mode = ctx.rounding_mode();
    if (ctx.has_exponent_range()) {
        const auto emin = to_native_exponent(*ctx.emin());
        const auto emax = to_native_exponent(*ctx.emax());
        if (!emin || !emax) {
            return std::nullopt;
        }
        native.has_range = true;
        native.emin = *emin;
        native.emax = *emax;
        native.etiny = *emin - static_cast<std::int64_t>(native.precision - 1);
        native.etop = ctx.clamp_normal_exponents()
                          ? *emax - static_cast<std::int64_t>(native.precision - 1)
                          : *emax;
    }
    return native;
}

std::optional<std::int64_t> to_native_exponent(const bigint &exponent) {
    if (!exponent.fits<std::int64_t>()) {
        return std::nullopt;
    }
    const auto value = static_cast<std::int64_t>(exponent);
    if (!in_native_range(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<native_value> to_native(const number_parts &value) {
    if (!value.is_finite() || value.mantissa.bit_length() > NATIVE_MANTISSA_BITS) {
        return std::nullopt;
    }
    const auto exponent = to_native_exponent(value.exponent);
    if (!exponent) {
        return std::nullopt;
    }
    return native_value{value.negative, value.mantissa.magnitude_uint128(), *exponent};
}

number_parts to_parts(const native_value &value) {
    return make_finite(value.negative, bigint::from_uint128(value.mantissa),
                       bigint(value.exponent));
}

native_arithmetic::native_arithmetic(int radix) : radix_(radix) {
    core::detail::check_radix(radix);
    const auto base = static_cast<native_uint>(radix);
    powers_[0] = 1;
    while (max_power_ < 128 &&
           powers_[max_power_] <= std::numeric_limits<native_uint>::max() / base) {
        powers_[max_power_ + 1] = powers_[max_power_] * base;
        ++max_power_;
    }
}

unsigned native_arithmetic::digits(native_uint mantissa) const noexcept {
    unsigned count = 1;
    while (count <= max_power_ && powers_[count] <= mantissa) {
        ++count;
    }
    return count;
}

std::optional<native_uint> native_arithmetic::scale(native_uint mantissa,
                                                    std::int64_t digits) const {
    if (digits < 0 || digits > static_cast<std::int64_t>(max_power_)) {
        return std::nullopt;
    }
    if (mantissa == 0 || digits == 0) {
        return mantissa;
    }
    const native_uint factor = powers_[digits];
    if (mantissa >= NATIVE_LIMIT / factor) {
        return std::nullopt;
    }
    return mantissa * factor;
}

std::optional<native_value> native_arithmetic::finish(native_value value, residue incoming,
                                                      const native_context &ctx,
                                                      flags &raised) const {
    if (value.mantissa == 0) {
        if (incoming != residue::zero ||
            (ctx.has_range && (value.exponent < ctx.etiny || value.exponent > ctx.etop))) {
            return std::nullopt;
        }
        return value;
    }
    const unsigned count = digits(value.mantissa);
    unsigned shift = count > ctx.precision ? count - ctx.precision : 0;
    if (ctx.has_range) {
        if (value.exponent + static_cast<std::int64_t>(shift) < ctx.etiny ||
            value.exponent + static_cast<std::int64_t>(count) - 1 < ctx.emin) {
            return std::nullopt;
        }
    }

    native_uint rounded = 0;
    residue rest = residue::zero;
    while (true) {
        if (shift > max_power_) {
            return std::nullopt;
        }
        if (shift > count) {
            rounded = 0;
            rest = residue::below_half;
        } else if (shift == 0) {
            rounded = value.mantissa;
            rest = incoming;
        } else {
            const native_uint unit = power(shift);
            rounded = value.mantissa / unit;
            rest = classify_native(value.mantissa % unit, unit, incoming);
        }
        const auto last = static_cast<std::uint64_t>(rounded % static_cast<native_uint>(radix_));
        if (round_away(ctx.mode, rest, value.negative, last, radix_)) {
            ++rounded;
        }
        if (rounded > ctx.max_mantissa) {
            ++shift;
            continue;
        }
        break;
    }

    flags local = flags::none;
    if (shift > 0) {
        local |= flags::rounded;
    }
    if (rest != residue::zero) {
        local |= flags::inexact | flags::rounded;
    }
    const std::int64_t exponent = value.exponent + static_cast<std::int64_t>(shift);
    if (ctx.has_range) {
        if (rounded != 0 &&
            exponent + static_cast<std::int64_t>(digits(rounded)) - 1 > ctx.emax) {
            return std::nullopt;
        }
        if (exponent > ctx.etop) {
            return std::nullopt;
        }
    }
    raised |= local;
    return native_value{value.negative, rounded, exponent};
}

std::optional<native_value> native_arithmetic::pad(native_value value, std::int64_t exponent,
                                                   const native_context &ctx,
                                                   flags &raised) const {
    if (value.mantissa == 0 || value.exponent <= exponent) {
        return value;
    }
    std::int64_t allowed = value.exponent - exponent;
    const unsigned count = digits(value.mantissa);
    const std::int64_t room =
        count < ctx.precision ? static_cast<std::int64_t>(ctx.precision - count) : 0;
    if (allowed > room) {
        allowed = room;
        raised |= flags::rounded;
    }
    if (ctx.has_range && value.exponent - allowed < ctx.etiny) {
        allowed = value.exponent - ctx.etiny;
    }
    if (allowed <= 0) {
        return value;
    }
    const auto padded = scale(value.mantissa, allowed);
    if (!padded) {
        return std::nullopt;
    }
    value.mantissa = *padded;
    value.exponent -= allowed;
    return value;
}

std::optional<native_value> native_arithmetic::add_values(native_value a, native_value b,
                                                          const native_context &ctx,
                                                          flags &raised) const {
    const bool floor_mode = ctx.mode == rounding::floor;
    if (a.mantissa == 0 && b.mantissa == 0) {
        const bool negative = a.negative == b.negative ? a.negative : floor_mode;
        return finish({negative, 0, std::min(a.exponent, b.exponent)}, residue::zero, ctx,
                      raised);
    }
    if (a.mantissa == 0 || b.mantissa == 0) {
        const native_value &zero = a.mantissa == 0 ? a : b;
        const native_value &other = a.mantissa == 0 ? b : a;
        flags local = flags::none;
        const auto padded = pad(other, zero.exponent, ctx, local);
        if (!padded) {
            return std::nullopt;
        }
        auto rounded = finish(*padded, residue::zero, ctx, local);
        if (rounded) {
            raised |= local;
        }
        return rounded;
    }

    native_value hi = a;
    native_value lo = b;
    if (hi.exponent < lo.exponent) {
        std::swap(hi, lo);
    }
    const std::int64_t precision_floor =
        adjusted(hi) - static_cast<std::int64_t>(ctx.precision);
    const std::int64_t sticky_exponent = std::min(hi.exponent, precision_floor) - 2;
    if (adjusted(lo) <= sticky_exponent) {
        lo.mantissa = 1;
        lo.exponent = sticky_exponent;
    }
    const auto scaled = scale(hi.mantissa, hi.exponent - lo.exponent);
    if (!scaled || lo.mantissa >= NATIVE_LIMIT) {
        return std::nullopt;
    }
    native_value sum{hi.negative, 0, lo.exponent};
    if (hi.negative == lo.negative) {
        sum.mantissa = *scaled + lo.mantissa;
    } else if (*scaled >= lo.mantissa) {
        sum.mantissa = *scaled - lo.mantissa;
    } else {
        sum.mantissa = lo.mantissa - *scaled;
        sum.negative = lo.negative;
    }
    if (sum.mantissa == 0) {
        sum.negative = floor_mode;
    }
    return finish(sum, residue::zero, ctx, raised);
}

std::optional<number_parts> native_arithmetic::add(const number_parts &a, const number_parts &b,
                                                   const native_context &ctx,
                                                   flags &raised) const {
    const auto lhs = to_native(a);
    const auto rhs = to_native(b);
    if (!lhs || !rhs) {
        return std::nullopt;
    }
    flags local = flags::none;
    const auto sum = add_values(*lhs, *rhs, ctx, local);
    if (!sum) {
        return std::nullopt;
    }
    raised |= local;
    return to_parts(*sum);
}

std::optional<number_parts> native_arithmetic::multiply(const number_parts &a,
                                                        const number_parts &b,
                                                        const native_context &ctx,
                                                        flags &raised) const {
    const auto lhs = to_native(a);
    const auto rhs = to_native(b);
    if (!lhs || !rhs) {
        return std::nullopt;
    }
    flags local = flags::none;
    const auto product = finish({lhs->negative != rhs->negative, lhs->mantissa * rhs->mantissa,
                                 lhs->exponent + rhs->exponent},
                                residue::zero, ctx, local);
    if (!product) {
        return std::nullopt;
    }
    raised |= local;
    return to_parts(*product);
}

std::optional<number_parts> native_arithmetic::multiply_and_add(const number_parts &a,
                                                                const number_parts &b,
                                                                const number_parts &c,
                                                                const native_context &ctx,
                                                                flags &raised) const {
    const auto lhs = to_native(a);
    const auto rhs = to_native(b);
    const auto addend = to_native(c);
    if (!lhs || !rhs || !addend) {
        return std::nullopt;
    }
    const native_value product{lhs->negative != rhs->negative, lhs->mantissa * rhs->mantissa,
                               lhs->exponent + rhs->exponent};
    flags local = flags::none;
    const auto sum = add_values(product, *addend, ctx, local);
    if (!sum) {
        return std::nullopt;
    }
    raised |= local;
    return to_parts(*sum);
}

std::optional<number_parts> native_arithmetic::divide(const number_parts &a, const number_parts &b,
                                                      const native_context &ctx,
                                                      flags &raised) const {
    const auto lhs = to_native(a);
    const auto rhs = to_native(b);
    if (!lhs || !rhs || rhs->mantissa == 0) {
        return std::nullopt;
    }
    const bool negative = lhs->negative != rhs->negative;
    const std::int64_t ideal = lhs->exponent - rhs->exponent;
    flags local = flags::none;
    std::optional<native_value> result;
    if (lhs->mantissa == 0) {
        result = finish({negative, 0, ideal}, residue::zero, ctx, local);
    } else {
        const unsigned dividend_digits = digits(lhs->mantissa);
        const unsigned divisor_digits = digits(rhs->mantissa);
        unsigned extra = 0;
        if (ctx.precision + 1 + divisor_digits > dividend_digits) {
            extra = ctx.precision + 1 + divisor_digits - dividend_digits;
        }
        const auto numerator = scale(lhs->mantissa, extra);
        if (!numerator) {
            return std::nullopt;
        }
        native_uint quotient = *numerator / rhs->mantissa;
        const native_uint remainder = *numerator % rhs->mantissa;
        std::int64_t exponent = ideal - static_cast<std::int64_t>(extra);
        if (remainder == 0) {
            const auto base = static_cast<native_uint>(radix_);
            for (unsigned stripped = 0; stripped < extra && quotient % base == 0; ++stripped) {
                quotient /= base;
                ++exponent;
            }
            result = finish({negative, quotient, exponent}, residue::zero, ctx, local);
        } else {
            result = finish({negative, quotient, exponent},
                            classify_native(remainder, rhs->mantissa, residue::zero), ctx, local);
        }
    }
    if (!result) {
        return std::nullopt;
    }
    raised |= local;
    return to_parts(*result);
}

std::optional<native_arithmetic::division>
native_arithmetic::divide_integer(const native_value &a, const native_value &b,
                                  const native_context &ctx) const {
    const std::int64_t adjusted_a = adjusted(a);
    const std::int64_t adjusted_b = adjusted(b);
    if (a.mantissa != 0 && adjusted_a - adjusted_b > static_cast<std::int64_t>(ctx.precision)) {
        division result;
        result.fits = false;
        return result;
    }
    const std::int64_t exponent = std::min(a.exponent, b.exponent);
    const auto dividend = scale(a.mantissa, a.exponent - exponent);
    if (!dividend) {
        return std::nullopt;
    }
    if (a.mantissa == 0 || adjusted_a + 1 < adjusted_b) {
        return division{0, *dividend, 0, exponent, true};
    }
    const auto divisor = scale(b.mantissa, b.exponent - exponent);
    if (!divisor) {
        return std::nullopt;
    }
    division result{*dividend / *divisor, *dividend % *divisor, *divisor, exponent, true};
    if (result.quotient > ctx.max_mantissa) {
        result.fits = false;
    }
    return result;
}

std::optional<number_parts> native_arithmetic::divide_to_integer_zero_scale(
    const number_parts &a, const number_parts &b, const native_context &ctx,
    flags &raised) const {
    const auto lhs = to_native(a);
    const auto rhs = to_native(b);
    if (!lhs || !rhs || rhs->mantissa == 0) {
        return std::nullopt;
    }
    const auto division = divide_integer(*lhs, *rhs, ctx);
    if (!division) {
        return std::nullopt;
    }
    if (!division->fits) {
        return invalid(raised);
    }
    flags local = flags::none;
    const auto result = finish({lhs->negative != rhs->negative, division->quotient, 0},
                               residue::zero, ctx, local);
    if (!result) {
        return std::nullopt;
    }
    raised |= local;
    return to_parts(*result);
}

std::optional<number_parts> native_arithmetic::remainder(const number_parts &a,
                                                         const number_parts &b, bool nearest,
                                                         const native_context &ctx,
                                                         flags &raised) const {
    const auto lhs = to_native(a);
    const auto rhs = to_native(b);
    if (!lhs || !rhs || rhs->mantissa == 0) {
        return std::nullopt;
    }
    const auto division = divide_integer(*lhs, *rhs, ctx);
    if (!division) {
        return std::nullopt;
    }
    if (!division->fits) {
        return invalid(raised);
    }
    bool negative = lhs->negative;
    native_uint rest = division->remainder;
    if (nearest && rest != 0 && division->divisor != 0) {
        const native_uint twice = rest << 1;
        if (twice > division->divisor ||
            (twice == division->divisor && (division->quotient & 1U) != 0)) {
            rest = division->divisor - rest;
            negative = !negative;
            if (division->quotient + 1 > ctx.max_mantissa) {
                return invalid(raised);
            }
        }
    }
    flags local = flags::none;
    const auto result = finish({negative, rest, division->exponent}, residue::zero, ctx, local);
    if (!result) {
        return std::nullopt;
    }
    raised |= local;
    return to_parts(*result);
}

std::optional<number_parts> native_arithmetic::round_signed(const number_parts &a,
                                                            sign_rule rule,
                                                            const native_context &ctx,
                                                            flags &raised) const {
    auto value = to_native(a);
    if (!value) {
        return std::nullopt;
    }
    if (rule == sign_rule::flip) {
        value->negative = !value->negative;
    } else if (rule == sign_rule::clear) {
        value->negative = false;
    }
    flags local = flags::none;
    auto result = finish(*value, residue::zero, ctx, local);
    if (!result) {
        return std::nullopt;
    }
    if (rule == sign_rule::plus && result->mantissa == 0 && result->negative &&
        ctx.mode != rounding::floor) {
        result->negative = false;
    }
    raised |= local;
    return to_parts(*result);
}

std::optional<number_parts> native_arithmetic::reduce(const number_parts &a,
                                                      const native_context &ctx,
                                                      flags &raised) const {
    const auto value = to_native(a);
    if (!value) {
        return std::nullopt;
    }
    flags local = flags::none;
    auto result = finish(*value, residue::zero, ctx, local);
    if (!result) {
        return std::nullopt;
    }
    if (result->mantissa == 0) {
        result = finish({result->negative, 0, 0}, residue::zero, ctx, local);
        if (!result) {
            return std::nullopt;
        }
    } else {
        const auto base = static_cast<native_uint>(radix_);
        while (result->mantissa % base == 0 &&
               (!ctx.has_range || result->exponent < ctx.etop)) {
            result->mantissa /= base;
            ++result->exponent;
        }
    }
    raised |= local;
    return to_parts(*result);
}

std::optional<number_parts> native_arithmetic::rescale(const number_parts &a,
                                                       std::int64_t exponent,
                                                       bool keep_when_coarser,
                                                       const native_context &ctx,
                                                       flags &raised) const {
    const auto value = to_native(a);
    if (!value) {
        return std::nullopt;
    }
    flags local = flags::none;
    if (keep_when_coarser && value->exponent >= exponent) {
        const auto result = finish(*value, residue::zero, ctx, local);
        if (!result) {
            return std::nullopt;
        }
        raised |= local;
        return to_parts(*result);
    }
    if (ctx.has_range && (exponent < ctx.etiny || exponent > ctx.emax)) {
        return invalid(raised);
    }
    // Results above the clamped top are folded down by the full engine.
    if (ctx.has_range && exponent > ctx.etop) {
        return std::nullopt;
    }
    if (value->mantissa == 0) {
        return make_finite(value->negative, {}, bigint(exponent));
    }
    const std::int64_t shift = value->exponent - exponent;
    if (adjusted(*value) - exponent > static_cast<std::int64_t>(ctx.precision) + 1) {
        return invalid(raised);
    }
    native_uint quotient = 0;
    residue rest = residue::zero;
    const auto count = static_cast<std::int64_t>(digits(value->mantissa));
    if (shift < -(count + 2)) {
        rest = residue::below_half;
    } else if (shift >= 0) {
        const auto scaled = scale(value->mantissa, shift);
        if (!scaled) {
            return std::nullopt;
        }
        quotient = *scaled;
    } else {
        if (-shift > static_cast<std::int64_t>(max_power_)) {
            return std::nullopt;
        }
        const native_uint unit = power(static_cast<unsigned>(-shift));
        quotient = value->mantissa / unit;
        rest = classify_native(value->mantissa % unit, unit, residue::zero);
    }
    const auto last = static_cast<std::uint64_t>(quotient % static_cast<native_uint>(radix_));
    if (round_away(ctx.mode, rest, value->negative, last, radix_)) {
        ++quotient;
    }
    if (quotient > ctx.max_mantissa) {
        return invalid(raised);
    }
    if (quotient != 0 && ctx.has_range) {
        const std::int64_t result_adjusted =
            exponent + static_cast<std::int64_t>(digits(quotient)) - 1;
        if (result_adjusted > ctx.emax) {
            return invalid(raised);
        }
        if (result_adjusted < ctx.emin) {
            local |= flags::subnormal;
        }
    }
    if (rest != residue::zero) {
        local |= flags::inexact | flags::rounded;
    }
    if (value->exponent < exponent) {
        local |= flags::rounded;
    }
    raised |= local;
    return to_parts({value->negative, quotient, exponent});
}

std::optional<int> native_arithmetic::compare(const number_parts &a, const number_parts &b,
                                              bool by_magnitude) const {
    const auto lhs = to_native(a);
    const auto rhs = to_native(b);
    if (!lhs || !rhs) {
        return std::nullopt;
    }
    const auto sign_of = [by_magnitude](const native_value &value) {
        if (value.mantissa == 0) {
            return 0;
        }
        return (value.negative && !by_magnitude) ? -1 : 1;
    };
    const int sign_a = sign_of(*lhs);
    const int sign_b = sign_of(*rhs);
    if (sign_a != sign_b) {
        return sign_a < sign_b ? -1 : 1;
    }
    if (sign_a == 0) {
        return 0;
    }
    const std::int64_t adjusted_a = adjusted(*lhs);
    const std::int64_t adjusted_b = adjusted(*rhs);
    int magnitude = 0;
    if (adjusted_a != adjusted_b) {
        magnitude = adjusted_a < adjusted_b ? -1 : 1;
    } else {
        const std::int64_t low = std::min(lhs->exponent, rhs->exponent);
        const auto left = scale(lhs->mantissa, lhs->exponent - low);
        const auto right = scale(rhs->mantissa, rhs->exponent - low);
        if (!left || !right) {
            return std::nullopt;
        }
        magnitude = *left < *right ? -1 : (*left > *right ? 1 : 0);
    }
    return sign_a * magnitude;
}

std::optional<number_parts> native_arithmetic::min_max(const number_parts &a,
                                                       const number_parts &b, bool want_max,
                                                       bool by_magnitude,
                                                       const native_context &ctx,
                                                       flags &raised) const {
    const auto ordering = compare(a, b, by_magnitude);
    if (!ordering) {
        return std::nullopt;
    }
    int order = *ordering;
    if (order == 0) {
        if (a.negative != b.negative) {
            order = a.negative ? -1 : 1;
        } else if (a.negative) {
            order = a.exponent < b.exponent ? 1 : -1;
        } else {
            order = a.exponent > b.exponent ? 1 : -1;
        }
    }
    if (!want_max) {
        order = -order;
    }
    return round_signed(order > 0 ? a : b, sign_rule::keep, ctx, raised);
}

} // namespace rmath::engine::detail
