// src/engine/elementary.cpp — Correctly rounded pi, ln, log10, exp, square root and power.

#include <rmath/engine/full_arithmetic.hpp>

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace rmath::engine {

namespace {

    // Working precision grows by half until both ends of the error interval round alike.
    constexpr int MAX_REFINEMENTS = 24;
    constexpr std::size_t EXACT_POWER_DIGITS = 4096;
    constexpr std::uint64_t MAX_ROOT_DEGREE = 1024;

    // Numbers as raw integers over radix^digits.
    class fixed_point {
    public:
        fixed_point(int radix, std::size_t digits)
            : radix_(radix), digits_(digits), one_(core::detail::radix_power(radix, digits)) {}

        int radix() const noexcept { return radix_; }
        std::size_t digits() const noexcept { return digits_; }
        const bigint &one() const noexcept { return one_; }

        bigint scale(const bigint &value) const {
            return radix_ == 2 ? value << digits_ : value * one_;
        }
        bigint unscale(const bigint &value) const {
            return radix_ == 2 ? value >> digits_ : value / one_;
        }
        bigint mul(const bigint &lhs, const bigint &rhs) const { return unscale(lhs * rhs); }
        bigint div(const bigint &lhs, const bigint &rhs) const { return scale(lhs) / rhs; }

        // Truncated image of a finite value.
        bigint from(const number_parts &value) const {
            const bigint shift = value.exponent + detail::big(digits_);
            bigint raw;
            if (shift.signum() >= 0) {
                raw = core::detail::scale_up(value.mantissa, radix_, core::detail::to_size(shift));
            } else if (-shift <= detail::big(core::detail::digit_count(value.mantissa, radix_))) {
                raw = core::detail::split_low_digits(value.mantissa, radix_,
                                                     core::detail::to_size(-shift))
                          .first;
            }
            return value.negative ? -raw : raw;
        }

    private:
        int radix_;
        std::size_t digits_;
        bigint one_;
    };

    // Raw fixed-point value with an absolute error bound in units of the last place.
    struct estimate {
        bigint value;
        bigint error;
    };

    // value * radix^exponent, exact to within error * radix^exponent.
    struct approximation {
        bigint value;
        bigint error;
        bigint exponent;
    };

    estimate atanh_series(const fixed_point &fx, const bigint &t) {
        const bigint t2 = fx.mul(t, t);
        bigint power = t;
        bigint sum;
        std::uint64_t terms = 0;
        for (std::uint64_t k = 1; !power.is_zero(); k += 2, ++terms) {
            sum += power / bigint(k);
            power = fx.mul(power, t2);
        }
        return {std::move(sum), bigint(3 * terms + 4)};
    }

    estimate ln2(const fixed_point &fx) {
        const estimate half = atanh_series(fx, fx.one() / bigint(3));
        return {half.value << 1, (half.error + bigint(2)) << 1};
    }

    // ln(z) for a raw z of at least one, reducing by powers of two first.
    estimate ln_scaled(const fixed_point &fx, bigint z, bigint error) {
        std::uint64_t halvings = 0;
        const bigint limit = fx.one() * bigint(3);
        while ((z << 1) >= limit) {
            z = z >> 1;
            error += bigint(1);
            ++halvings;
        }
        const bigint t = fx.div(z - fx.one(), z + fx.one());
        const estimate series = atanh_series(fx, t);
        estimate result{series.value << 1, (series.error + error + bigint(1)) << 1};
        if (halvings > 0) {
            const estimate log_two = ln2(fx);
            result.value += log_two.value * bigint(halvings);
            result.error += log_two.error * bigint(halvings);
        }
        return result;
    }

    estimate ln_radix(const fixed_point &fx) {
        return ln_scaled(fx, fx.scale(bigint(fx.radix())), bigint::zero());
    }

    // ln of a positive finite value.
    estimate ln_value(const fixed_point &fx, const number_parts &x) {
        const std::size_t digits = core::detail::digit_count(x.mantissa, fx.radix());
        const bigint adjusted = x.exponent + detail::big(digits) - bigint(1);
        const bigint leading =
            fx.from(detail::make_finite(false, x.mantissa, -detail::big(digits - 1)));
        estimate result = ln_scaled(fx, leading, bigint(1));
        if (!adjusted.is_zero()) {
            const estimate log_radix = ln_radix(fx);
            result.value += log_radix.value * adjusted;
            result.error += log_radix.error * adjusted.abs() + bigint(1);
        }
        return result;
    }

    std::size_t exp_halvings(std::size_t digits) {
        return 8 + static_cast<std::size_t>(std::sqrt(static_cast<double>(digits)));
    }

    // Guard digits that absorb the error growth of the squaring phase.
    std::size_t exp_guard(std::size_t digits, int radix) {
        const double bits = static_cast<double>(exp_halvings(digits) + 4);
        return static_cast<std::size_t>(bits / std::log2(static_cast<double>(radix))) + 4;
    }

    // exp(z) as {value, error, k}: the result is value / one * radix^k.
    struct scaled_estimate {
        bigint value;
        bigint error;
        bigint shift;
    };

    scaled_estimate exp_scaled(const fixed_point &fx, const bigint &z, const bigint &error) {
        const estimate log_radix = ln_radix(fx);
        auto [k, rest] = bigint::div_mod(z, log_radix.value);
        if ((rest.abs() << 1) >= log_radix.value) {
            k += z.is_negative() ? bigint(-1) : bigint(1);
        }
        const bigint reduced = z - k * log_radix.value;
        const bigint reduced_error = error + k.abs() * log_radix.error + bigint(1);

        const std::size_t halvings = exp_halvings(fx.digits());
        const bigint s = reduced >> halvings;
        bigint sum = fx.one() + s;
        bigint term = s;
        std::uint64_t terms = 0;
        for (std::uint64_t n = 2; !term.is_zero(); ++n, ++terms) {
            term = fx.mul(term, s) / bigint(n);
            sum += term;
        }
        bigint sum_error = (reduced_error >> halvings) + bigint(2 * terms + 4);
        for (std::size_t step = 0; step < halvings; ++step) {
            const bigint factor = fx.unscale(sum) + bigint(1);
            sum = fx.mul(sum, sum);
            sum_error = ((sum_error * factor) << 1) + bigint(1);
        }
        return {std::move(sum), std::move(sum_error), std::move(k)};
    }

    estimate atan_inverse(const fixed_point &fx, std::uint64_t n) {
        const bigint square(n * n);
        bigint power = fx.one() / bigint(n);
        bigint sum;
        std::uint64_t terms = 0;
        for (std::uint64_t k = 1; !power.is_zero(); k += 2, ++terms) {
            const bigint term = power / bigint(k);
            if (((k >> 1) & 1U) == 0) {
                sum += term;
            } else {
                sum -= term;
            }
            power = power / square;
        }
        return {std::move(sum), bigint(2 * terms + 2)};
    }

    // Machin: pi = 16 atan(1/5) - 4 atan(1/239).
    estimate pi_estimate(const fixed_point &fx) {
        const estimate fifth = atan_inverse(fx, 5);
        const estimate far = atan_inverse(fx, 239);
        return {(fifth.value << 4) - (far.value << 2), (fifth.error << 4) + (far.error << 2)};
    }

    bigint floor_divide(const bigint &value, const bigint &divisor) {
        auto [quotient, rest] = bigint::div_mod(value, divisor);
        if (!rest.is_zero() && rest.is_negative() != divisor.is_negative()) {
            quotient -= bigint(1);
        }
        return quotient;
    }

    std::size_t saturating_digits(const bigint &value) {
        if (value.signum() <= 0) {
            return 0;
        }
        return value.fits<std::size_t>() ? static_cast<std::size_t>(value) : 1U << 20;
    }

    // Integer value of a finite integral number.
    bigint integer_value(const number_parts &value, int radix) {
        bigint magnitude;
        if (value.exponent.signum() >= 0) {
            magnitude = core::detail::scale_up(value.mantissa, radix,
                                               core::detail::to_size(value.exponent));
        } else {
            magnitude = core::detail::split_low_digits(value.mantissa, radix,
                                                       core::detail::to_size(-value.exponent))
                            .first;
        }
        return value.negative ? -magnitude : magnitude;
    }

    bool is_integral(const number_parts &value, int radix) {
        if (!value.is_finite()) {
            return false;
        }
        if (value.exponent.signum() >= 0 || value.mantissa.is_zero()) {
            return true;
        }
        const std::size_t zeros = core::detail::trailing_zero_digits(value.mantissa, radix);
        return detail::big(zeros) >= -value.exponent;
    }

    bool is_odd_integer(const number_parts &value, int radix) {
        if (!is_integral(value, radix) || value.mantissa.is_zero()) {
            return false;
        }
        if (value.exponent.signum() > 0) {
            return radix % 2 != 0 && value.mantissa.is_odd();
        }
        return integer_value(value, radix).is_odd();
    }

    bool is_exactly_one(const number_parts &value, int radix) {
        if (!value.is_finite() || value.negative || value.exponent.signum() > 0) {
            return false;
        }
        const bigint &exponent = value.exponent;
        if (detail::big(core::detail::digit_count(value.mantissa, radix)) !=
            -exponent + bigint(1)) {
            return false;
        }
        return value.mantissa == core::detail::radix_power(radix, core::detail::to_size(-exponent));
    }

    // value in [lo, hi] * radix^exponent; exact when lo == hi.
    struct bounds {
        bigint lo;
        bigint hi;
        bigint exponent;
    };

    void truncate_bounds(bounds &value, int radix, std::size_t digits) {
        const std::size_t current = core::detail::digit_count(value.hi, radix);
        if (current <= digits) {
            return;
        }
        const std::size_t drop = current - digits;
        value.lo = core::detail::split_low_digits(value.lo, radix, drop).first;
        auto [high, rest] = core::detail::split_low_digits(value.hi, radix, drop);
        if (!rest.is_zero()) {
            high += bigint(1);
        }
        value.hi = std::move(high);
        value.exponent += detail::big(drop);
    }

    bounds multiply_bounds(const bounds &lhs, const bounds &rhs, int radix, std::size_t digits) {
        bounds product{lhs.lo * rhs.lo, lhs.hi * rhs.hi, lhs.exponent + rhs.exponent};
        truncate_bounds(product, radix, digits);
        return product;
    }

    // base^n kept to `digits` digits, with directed truncation on each side.
    bounds power_bounds(const bigint &base, std::uint64_t n, int radix, std::size_t digits) {
        bounds result{bigint::one(), bigint::one(), bigint{}};
        bounds square{base, base, bigint{}};
        truncate_bounds(square, radix, digits);
        while (n > 0) {
            if ((n & 1U) != 0) {
                result = multiply_bounds(result, square, radix, digits);
            }
            n >>= 1;
            if (n > 0) {
                square = multiply_bounds(square, square, radix, digits);
            }
        }
        return result;
    }

    // Rounds an approximation whose error shrinks with the working precision,
    // accepting it once both ends of its error interval round to the same result.
    template <typename Approximate>
    number_parts correctly_rounded(const full_arithmetic &kernel, const context &ctx,
                                   std::size_t extra_digits, flags &raised,
                                   Approximate &&approximate) {
        const auto limits = detail::limits_for(ctx, kernel.radix());
        std::size_t digits = limits.max_digits + 8 + extra_digits;
        for (int attempt = 0; attempt < MAX_REFINEMENTS; ++attempt, digits += digits / 2) {
            const approximation guess = approximate(digits);
            bigint lo = guess.value - guess.error;
            bigint hi = guess.value + guess.error;
            if (lo.is_zero() || hi.is_zero() || lo.is_negative() != hi.is_negative()) {
                continue;
            }
            const bool negative = lo.is_negative();
            if (negative) {
                std::swap(lo, hi);
                lo = -lo;
                hi = -hi;
            }
            if (core::detail::digit_count(lo, kernel.radix()) < limits.max_digits + 2) {
                continue;
            }
            flags low_flags = flags::none;
            flags high_flags = flags::none;
            const number_parts low =
                kernel.finalize(detail::make_finite(negative, std::move(lo), guess.exponent), ctx,
                                low_flags, detail::residue::below_half);
            const number_parts high = kernel.finalize(
                detail::make_finite(negative, hi - bigint(1), guess.exponent), ctx, high_flags,
                detail::residue::above_half);
            if (low == high && low_flags == high_flags) {
                raised |= low_flags;
                return low;
            }
        }
        throw std::runtime_error("elementary function did not converge");
    }

    // Magnitude beyond which exp certainly overflows or underflows the context.
    bigint exp_limit(const context &ctx, const detail::precision_limits &limits, int radix) {
        if (!ctx.has_exponent_range()) {
            return bigint::one() << 62;
        }
        return (ctx.emax()->abs() + ctx.emin()->abs() + detail::big(limits.max_digits) +
                bigint(10)) *
               bigint(radix);
    }

    // log10 of a magnitude, usable past the range of double.
    double log10_magnitude(const bigint &value) {
        const std::size_t bits = value.bit_length();
        if (bits < 1000) {
            return std::log10(value.to_double_approx());
        }
        const std::size_t drop = bits - 64;
        return std::log10((value >> drop).to_double_approx()) +
               static_cast<double>(drop) * std::log10(2.0);
    }

    double to_double(const bigint &value, int radix, std::size_t digits) {
        return value.to_double_approx() / std::pow(static_cast<double>(radix), digits);
    }

} // namespace

number_parts full_arithmetic::pi(const context &ctx, flags &raised) const {
    if (!ctx.has_max_precision()) {
        return detail::invalid_operation(raised);
    }
    return correctly_rounded(*this, ctx, 2, raised, [&](std::size_t digits) {
        const fixed_point fx(radix_, digits + 4);
        const estimate value = pi_estimate(fx);
        return approximation{value.value, value.error, -detail::big(fx.digits())};
    });
}

number_parts full_arithmetic::ln(const number_parts &a, const context &ctx,
                                 flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    if (a.is_zero()) {
        return detail::make_infinity(true);
    }
    if (a.negative) {
        return detail::invalid_operation(raised);
    }
    if (a.is_infinity()) {
        return a;
    }
    if (is_exactly_one(a, radix_)) {
        return finalize(detail::make_finite(false, {}, {}), ctx, raised);
    }
    if (!ctx.has_max_precision()) {
        return detail::invalid_operation(raised);
    }
    // Near one the logarithm loses leading digits; carry them as guard digits.
    flags ignored = flags::none;
    const number_parts offset =
        subtract(a, detail::make_finite(false, bigint::one(), {}), context::unlimited(), ignored);
    const std::size_t extra =
        saturating_digits(-detail::adjusted_exponent(offset, radix_)) +
        saturating_digits(detail::big(detail::adjusted_exponent(a, radix_).abs().bit_length()));
    return correctly_rounded(*this, ctx, extra, raised, [&](std::size_t digits) {
        const fixed_point fx(radix_, digits);
        const estimate value = ln_value(fx, a);
        return approximation{value.value, value.error, -detail::big(fx.digits())};
    });
}

number_parts full_arithmetic::log10(const number_parts &a, const context &ctx,
                                    flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    if (a.is_zero()) {
        return detail::make_infinity(true);
    }
    if (a.negative) {
        return detail::invalid_operation(raised);
    }
    if (a.is_infinity()) {
        return a;
    }

    // Exact powers of ten give exact integers.
    const double estimate_log =
        log10_magnitude(a.mantissa) +
        (a.exponent.fits<std::int64_t>()
             ? static_cast<double>(static_cast<std::int64_t>(a.exponent)) *
                   std::log10(static_cast<double>(radix_))
             : std::numeric_limits<double>::infinity());
    if (std::isfinite(estimate_log) && std::fabs(estimate_log) < 100000.0) {
        const auto nearest = static_cast<std::int64_t>(std::llround(estimate_log));
        const bool positive_exponent = a.exponent.signum() >= 0;
        const std::size_t exponent_size = core::detail::to_size(a.exponent.abs());
        const bigint lhs_numerator =
            positive_exponent ? core::detail::scale_up(a.mantissa, radix_, exponent_size)
                              : a.mantissa;
        const bigint lhs_denominator =
            positive_exponent ? bigint::one() : core::detail::radix_power(radix_, exponent_size);
        for (std::int64_t k = nearest - 1; k <= nearest + 1; ++k) {
            const std::uint64_t magnitude =
                static_cast<std::uint64_t>(k < 0 ? -k : k);
            const bigint ten_power = bigint::pow(bigint(10), magnitude);
            const bool equal = k >= 0 ? lhs_numerator == ten_power * lhs_denominator
                                      : lhs_numerator * ten_power == lhs_denominator;
            if (equal) {
                return finalize(detail::make_finite(k < 0, bigint(magnitude), {}), ctx, raised);
            }
        }
    }
    if (!ctx.has_max_precision()) {
        return detail::invalid_operation(raised);
    }
    flags ignored = flags::none;
    const number_parts offset =
        subtract(a, detail::make_finite(false, bigint::one(), {}), context::unlimited(), ignored);
    const std::size_t extra = saturating_digits(-detail::adjusted_exponent(offset, radix_)) + 2;
    const number_parts ten = detail::make_finite(false, bigint(10), {});
    return correctly_rounded(*this, ctx, extra, raised, [&](std::size_t digits) {
        const fixed_point fx(radix_, digits + 2);
        const estimate numerator = ln_value(fx, a);
        const estimate denominator = ln_value(fx, ten);
        const bigint quotient = fx.div(numerator.value, denominator.value);
        const bigint error =
            (fx.scale(numerator.error) + quotient.abs() * denominator.error) / denominator.value +
            bigint(2);
        return approximation{quotient, error, -detail::big(fx.digits())};
    });
}

number_parts full_arithmetic::exp(const number_parts &a, const context &ctx,
                                  flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    // Exact results; they bypass context rounding.
    if (a.is_infinity()) {
        return a.negative ? detail::make_finite(false, {}, {}) : a;
    }
    if (a.mantissa.is_zero()) {
        return detail::make_finite(false, bigint::one(), {});
    }
    if (!ctx.has_max_precision()) {
        return detail::invalid_operation(raised);
    }
    const auto limits = detail::limits_for(ctx, radix_);
    const bigint adjusted = detail::adjusted_exponent(a, radix_);
    // Below this size exp(x) and 1 + x round identically.
    if (adjusted <= -detail::big(2 * limits.max_digits + 6)) {
        return add(detail::make_finite(false, bigint::one(), {}), a, ctx, raised);
    }
    const number_parts magnitude = detail::make_finite(false, a.mantissa, a.exponent);
    const bigint limit = exp_limit(ctx, limits, radix_);
    if (compare(magnitude, detail::make_finite(false, limit, {})) > 0) {
        if (!a.negative) {
            if (ctx.has_exponent_range()) {
                return overflow_result(false, ctx, limits, raised);
            }
            raised |= flags::overflow | flags::inexact | flags::rounded;
            return detail::make_infinity(false);
        }
        if (ctx.has_exponent_range()) {
            return finalize(detail::make_finite(false, bigint::one(),
                                                *detail::etiny(ctx, limits) - bigint(2)),
                            ctx, raised, detail::residue::below_half);
        }
        raised |= flags::underflow | flags::inexact | flags::rounded;
        return detail::make_finite(false, {}, {});
    }
    const std::size_t extra = saturating_digits(adjusted) + 4;
    return correctly_rounded(*this, ctx, extra, raised, [&](std::size_t digits) {
        const fixed_point fx(radix_, digits + exp_guard(digits, radix_));
        const scaled_estimate value = exp_scaled(fx, fx.from(a), bigint(1));
        return approximation{value.value, value.error, value.shift - detail::big(fx.digits())};
    });
}

number_parts full_arithmetic::square_root(const number_parts &a, const context &ctx,
                                          flags &raised) const {
    if (auto nan = propagate_nan(a, ctx, raised)) {
        return *nan;
    }
    if (a.negative && !a.is_zero()) {
        return detail::invalid_operation(raised);
    }
    if (a.is_infinity()) {
        return a;
    }
    const bigint ideal = floor_divide(a.exponent, bigint(2));
    if (a.mantissa.is_zero()) {
        return finalize(detail::make_finite(a.negative, {}, ideal), ctx, raised);
    }
    const auto limits = detail::limits_for(ctx, radix_);
    bigint exponent = ideal;
    if (limits.bounded) {
        const bigint digits = detail::big(core::detail::digit_count(a.mantissa, radix_));
        const bigint wide = floor_divide(digits + a.exponent, bigint(2)) -
                            detail::big(limits.max_digits + 2);
        if (wide < exponent) {
            exponent = wide;
        }
    }
    const bigint scaled = core::detail::scale_up(
        a.mantissa, radix_, core::detail::to_size(a.exponent - (exponent << 1)));
    bigint root = bigint::isqrt(scaled);
    const bigint rest = scaled - root * root;
    if (rest.is_zero()) {
        exponent += detail::big(core::detail::strip_trailing_zeros(
            root, radix_, core::detail::to_size(ideal - exponent)));
        return finalize(detail::make_finite(false, std::move(root), std::move(exponent)), ctx,
                        raised);
    }
    if (!limits.bounded) {
        return detail::invalid_operation(raised);
    }
    const detail::residue fraction =
        rest > root ? detail::residue::above_half : detail::residue::below_half;
    return finalize(detail::make_finite(false, std::move(root), std::move(exponent)), ctx, raised,
                    fraction);
}

number_parts full_arithmetic::power(const number_parts &a, const number_parts &b,
                                    const context &ctx, flags &raised) const {
    if (auto nan = propagate_nan(a, b, ctx, raised)) {
        return *nan;
    }
    const auto limits = detail::limits_for(ctx, radix_);
    const number_parts one = detail::make_finite(false, bigint::one(), {});

    if (b.is_infinity()) {
        if (a.negative && !a.is_zero()) {
            return detail::invalid_operation(raised);
        }
        const int order = compare(detail::make_finite(false, a.mantissa, a.exponent), one);
        if (a.is_infinity() || order > 0) {
            return b.negative ? detail::make_finite(false, {}, {}) : detail::make_infinity(false);
        }
        if (order < 0) {
            return b.negative ? detail::make_infinity(false) : detail::make_finite(false, {}, {});
        }
        raised |= flags::inexact | flags::rounded;
        if (!limits.bounded) {
            return one;
        }
        return detail::make_finite(false, core::detail::radix_power(radix_, limits.max_digits - 1),
                                   -detail::big(limits.max_digits - 1));
    }

    const bool integral = is_integral(b, radix_);
    const bool negative = a.negative && is_odd_integer(b, radix_);
    if (a.is_infinity()) {
        if (b.mantissa.is_zero()) {
            return finalize(one, ctx, raised);
        }
        if (!integral && a.negative) {
            return detail::invalid_operation(raised);
        }
        return b.negative ? detail::make_finite(negative, {}, {}) : detail::make_infinity(negative);
    }
    if (a.mantissa.is_zero()) {
        if (b.mantissa.is_zero()) {
            return detail::invalid_operation(raised);
        }
        return b.negative ? detail::make_infinity(negative) : detail::make_finite(negative, {}, {});
    }
    if (!integral && a.negative) {
        return detail::invalid_operation(raised);
    }
    if (b.mantissa.is_zero()) {
        return finalize(one, ctx, raised);
    }
    if (!integral && is_exactly_one(a, radix_)) {
        raised |= flags::inexact | flags::rounded;
        if (!limits.bounded) {
            return one;
        }
        return finalize(
            detail::make_finite(false, core::detail::radix_power(radix_, limits.max_digits - 1),
                                -detail::big(limits.max_digits - 1)),
            ctx, raised);
    }

    // Exact or directed-interval integer power of `base`.
    const auto integer_power = [&](const number_parts &base,
                                   const bigint &n) -> std::optional<number_parts> {
        const bigint count = n.abs();
        if (!count.fits<std::uint64_t>()) {
            return std::nullopt;
        }
        const auto steps = static_cast<std::uint64_t>(count);
        bigint stripped = base.mantissa;
        const std::size_t zeros = core::detail::strip_trailing_zeros(
            stripped, radix_, std::numeric_limits<std::size_t>::max());
        const bigint base_exponent = base.exponent + detail::big(zeros);
        const std::size_t digits = core::detail::digit_count(stripped, radix_);
        const bool small =
            stripped == bigint(1) ||
            (digits - 1) * static_cast<double>(steps) <
                static_cast<double>(limits.bounded ? 4 * limits.max_digits + EXACT_POWER_DIGITS
                                                   : std::numeric_limits<std::size_t>::max());
        if (small) {
            number_parts exact = detail::make_finite(negative, bigint::pow(stripped, steps),
                                                     base_exponent * count);
            if (n.is_negative()) {
                return divide(one, exact, ctx, raised);
            }
            return pad_to_exponent(finalize(std::move(exact), ctx, raised),
                                   base.exponent * count, ctx, raised);
        }
        const std::size_t guard = 64 - static_cast<std::size_t>(std::countl_zero(steps)) + 4;
        return correctly_rounded(*this, ctx, guard, raised, [&](std::size_t working) {
            bounds value = power_bounds(stripped, steps, radix_, working + guard);
            value.exponent += base_exponent * count;
            if (n.is_negative()) {
                const std::size_t scale =
                    core::detail::digit_count(value.hi, radix_) + working + guard;
                const bigint numerator = core::detail::radix_power(radix_, scale);
                auto [upper, rest] = bigint::div_mod(numerator, value.lo);
                if (!rest.is_zero()) {
                    upper += bigint(1);
                }
                value = bounds{numerator / value.hi, std::move(upper),
                               -value.exponent - detail::big(scale)};
            }
            bigint centre = (value.lo + value.hi) >> 1;
            bigint error = ((value.hi - value.lo) >> 1) + bigint(1);
            if (negative) {
                centre = -centre;
            }
            return approximation{std::move(centre), std::move(error), value.exponent};
        });
    };

    if (integral && detail::adjusted_exponent(b, radix_) < bigint(64)) {
        if (auto result = integer_power(a, integer_value(b, radix_))) {
            return *result;
        }
    }

    // y = p / q in lowest terms with a small q: try an exact q-th root first.
    if (!integral && b.exponent.signum() < 0 && -b.exponent <= bigint(16)) {
        const bigint denominator_full =
            core::detail::radix_power(radix_, core::detail::to_size(-b.exponent));
        const bigint common = bigint::gcd(b.mantissa, denominator_full);
        const bigint denominator = denominator_full / common;
        if (denominator <= bigint(MAX_ROOT_DEGREE)) {
            const auto degree = static_cast<std::uint64_t>(denominator);
            const bigint exponent = floor_divide(a.exponent, denominator);
            const bigint radicand = core::detail::scale_up(
                a.mantissa, radix_, core::detail::to_size(a.exponent - exponent * denominator));
            const bigint root = bigint::iroot(radicand, degree);
            if (bigint::pow(root, degree) == radicand) {
                const bigint numerator = b.negative ? -(b.mantissa / common) : b.mantissa / common;
                if (auto result =
                        integer_power(detail::make_finite(false, root, exponent), numerator)) {
                    return *result;
                }
            }
        }
    }

    if (!limits.bounded) {
        return detail::invalid_operation(raised);
    }

    // General case: exp(y ln x), screened for certain overflow first.
    const number_parts base = detail::make_finite(false, a.mantissa, a.exponent);
    constexpr std::size_t SCREEN_DIGITS = 20;
    const fixed_point screen(radix_, SCREEN_DIGITS);
    const double log_estimate = to_double(ln_value(screen, base).value, radix_, SCREEN_DIGITS);
    const double y_estimate =
        b.exponent.fits<int>()
            ? b.mantissa.to_double_approx() *
                  std::pow(static_cast<double>(radix_), static_cast<int>(b.exponent))
            : (b.exponent.is_negative() ? 0.0 : std::numeric_limits<double>::infinity());
    const double z_estimate = (b.negative ? -y_estimate : y_estimate) * log_estimate;
    const double limit = exp_limit(ctx, limits, radix_).to_double_approx();
    if (!std::isfinite(z_estimate) || std::fabs(z_estimate) > limit) {
        if (z_estimate > 0) {
            if (ctx.has_exponent_range()) {
                return overflow_result(negative, ctx, limits, raised);
            }
            raised |= flags::overflow | flags::inexact | flags::rounded;
            return detail::make_infinity(negative);
        }
        if (ctx.has_exponent_range()) {
            return finalize(detail::make_finite(negative, bigint::one(),
                                                *detail::etiny(ctx, limits) - bigint(2)),
                            ctx, raised, detail::residue::below_half);
        }
        raised |= flags::underflow | flags::inexact | flags::rounded;
        return detail::make_finite(negative, {}, {});
    }
    const double magnitude_digits =
        std::log(std::fabs(z_estimate) + 1.0) / std::log(static_cast<double>(radix_));
    const std::size_t extra = static_cast<std::size_t>(magnitude_digits) + 4;
    return correctly_rounded(*this, ctx, extra, raised, [&](std::size_t digits) {
        const fixed_point fx(radix_, digits + exp_guard(digits, radix_));
        const estimate log_base = ln_value(fx, base);
        bigint z = log_base.value * b.mantissa;
        bigint z_error = log_base.error * b.mantissa;
        if (b.exponent.signum() >= 0) {
            const std::size_t shift = core::detail::to_size(b.exponent);
            z = core::detail::scale_up(z, radix_, shift);
            z_error = core::detail::scale_up(z_error, radix_, shift);
        } else {
            const std::size_t shift = core::detail::to_size(-b.exponent);
            z = core::detail::split_low_digits(z.abs(), radix_, shift).first *
                bigint(z.signum());
            z_error = core::detail::split_low_digits(z_error, radix_, shift).first + bigint(1);
        }
        if (b.negative) {
            z = -z;
        }
        const scaled_estimate value = exp_scaled(fx, z, z_error + bigint(1));
        return approximation{negative ? -value.value : value.value, value.error,
                             value.shift - detail::big(fx.digits())};
    });
}

} // namespace rmath::engine
