// include/rmath/engine/full_arithmetic.hpp — Radix-generic arithmetic kernel over decomposed numbers.

#pragma once

#include <optional>

#include <rmath/context.hpp>
#include <rmath/core/bigint.hpp>
#include <rmath/core/number.hpp>
#include <rmath/engine/detail/rounding.hpp>

namespace rmath::engine {

using core::bigint;
using core::number_parts;

// Implements every operation with general decimal arithmetic semantics for one
// radix. Conditions are OR-ed into `raised`; trapping is left to the caller.
// Instances hold only the radix and are safe to share between threads.
class full_arithmetic {
public:
    explicit full_arithmetic(int radix);

    int radix() const noexcept { return radix_; }

    // Rounds an exact value (plus an optional discarded fraction below one
    // unit of its last digit) to the context and applies the exponent range.
    number_parts finalize(number_parts value, const context& ctx, flags& raised,
                          detail::residue incoming = detail::residue::zero) const;

    // arithmetic
    number_parts add(const number_parts& a, const number_parts& b, const context& ctx,
                     flags& raised) const;
    number_parts add_ex(const number_parts& a, const number_parts& b, const context& ctx,
                        bool round_to_operand_precision, flags& raised) const;
    number_parts subtract(const number_parts& a, const number_parts& b, const context& ctx,
                          flags& raised) const;
    number_parts multiply(const number_parts& a, const number_parts& b, const context& ctx,
                          flags& raised) const;
    number_parts multiply_and_add(const number_parts& a, const number_parts& b,
                                  const number_parts& c, const context& ctx,
                                  flags& raised) const;
    number_parts divide(const number_parts& a, const number_parts& b, const context& ctx,
                        flags& raised) const;
    number_parts divide_to_exponent(const number_parts& a, const number_parts& b,
                                    const bigint& exponent, const context& ctx,
                                    flags& raised) const;
    number_parts divide_to_integer_natural_scale(const number_parts& a, const number_parts& b,
                                                 const context& ctx, flags& raised) const;
    number_parts divide_to_integer_zero_scale(const number_parts& a, const number_parts& b,
                                              const context& ctx, flags& raised) const;
    number_parts remainder(const number_parts& a, const number_parts& b, const context& ctx,
                           flags& raised) const;
    number_parts remainder_near(const number_parts& a, const number_parts& b,
                                const context& ctx, flags& raised) const;
    number_parts negate(const number_parts& a, const context& ctx, flags& raised) const;
    number_parts abs(const number_parts& a, const context& ctx, flags& raised) const;

    // comparison
    int compare(const number_parts& a, const number_parts& b) const;
    number_parts compare_to_with_context(const number_parts& a, const number_parts& b,
                                         bool treat_quiet_nan_as_signaling, const context& ctx,
                                         flags& raised) const;
    number_parts min(const number_parts& a, const number_parts& b, const context& ctx,
                     flags& raised) const;
    number_parts max(const number_parts& a, const number_parts& b, const context& ctx,
                     flags& raised) const;
    number_parts min_magnitude(const number_parts& a, const number_parts& b, const context& ctx,
                               flags& raised) const;
    number_parts max_magnitude(const number_parts& a, const number_parts& b, const context& ctx,
                               flags& raised) const;

    // rounding and quantization
    number_parts round_to_precision(const number_parts& a, const context& ctx,
                                    flags& raised) const;
    number_parts round_to_binary_precision(const number_parts& a, const context& ctx,
                                           flags& raised) const;
    number_parts round_after_conversion(const number_parts& a, const context& ctx,
                                        flags& raised) const;
    number_parts plus(const number_parts& a, const context& ctx, flags& raised) const;
    number_parts quantize(const number_parts& a, const number_parts& pattern, const context& ctx,
                          flags& raised) const;
    number_parts round_to_exponent_exact(const number_parts& a, const bigint& exponent,
                                         const context& ctx, flags& raised) const;
    number_parts round_to_exponent_simple(const number_parts& a, const bigint& exponent,
                                          const context& ctx, flags& raised) const;
    number_parts round_to_exponent_no_rounded_flag(const number_parts& a, const bigint& exponent,
                                                   const context& ctx, flags& raised) const;
    number_parts reduce(const number_parts& a, const context& ctx, flags& raised) const;

    // navigation
    number_parts next_minus(const number_parts& a, const context& ctx, flags& raised) const;
    number_parts next_plus(const number_parts& a, const context& ctx, flags& raised) const;
    number_parts next_toward(const number_parts& a, const number_parts& b, const context& ctx,
                             flags& raised) const;

    // elementary functions
    number_parts pi(const context& ctx, flags& raised) const;
    number_parts power(const number_parts& a, const number_parts& b, const context& ctx,
                       flags& raised) const;
    number_parts log10(const number_parts& a, const context& ctx, flags& raised) const;
    number_parts ln(const number_parts& a, const context& ctx, flags& raised) const;
    number_parts exp(const number_parts& a, const context& ctx, flags& raised) const;
    number_parts square_root(const number_parts& a, const context& ctx, flags& raised) const;

private:
    // Quiet NaN result for the operands, or nothing when none is a NaN.
    std::optional<number_parts> propagate_nan(const number_parts& a, const context& ctx,
                                              flags& raised) const;
    std::optional<number_parts> propagate_nan(const number_parts& a, const number_parts& b,
                                              const context& ctx, flags& raised) const;
    std::optional<number_parts> propagate_nan(const number_parts& a, const number_parts& b,
                                              const number_parts& c, const context& ctx,
                                              flags& raised) const;
    number_parts fit_nan(number_parts nan, const context& ctx) const;

    number_parts overflow_result(bool negative, const context& ctx,
                                 const detail::precision_limits& limits, flags& raised) const;

    // Rescales `a` to exactly `exponent`, rounding by the context mode.
    number_parts rescale(const number_parts& a, const bigint& exponent, const context& ctx,
                         flags& raised) const;
    number_parts quantize_ratio(const number_parts& a, const number_parts& b,
                                const bigint& exponent, const context& ctx, flags& raised) const;

    // Truncated a / b over magnitudes aligned to the smaller exponent.
    struct integer_division {
        bigint quotient;
        bigint remainder;
        bigint divisor;
        bigint exponent;
    };
    // Empty when the quotient needs more digits than the context allows.
    std::optional<integer_division> divide_integer_parts(const number_parts& a,
                                                         const number_parts& b,
                                                         const context& ctx) const;
    number_parts pad_to_exponent(number_parts value, const bigint& exponent, const context& ctx,
                                 flags& raised) const;
    number_parts remainder_impl(const number_parts& a, const number_parts& b, const context& ctx,
                                bool nearest, flags& raised) const;
    number_parts divide_to_integer_impl(const number_parts& a, const number_parts& b,
                                        const context& ctx, bool natural_scale,
                                        flags& raised) const;

    number_parts min_max(const number_parts& a, const number_parts& b, const context& ctx,
                         bool want_max, bool by_magnitude, flags& raised) const;
    int compare_finite(const number_parts& a, const number_parts& b, bool by_magnitude) const;

    number_parts next_toward_infinity(const number_parts& a, bool upward, const context& ctx,
                                      flags& raised) const;

    int radix_;
};

} // namespace rmath::engine
