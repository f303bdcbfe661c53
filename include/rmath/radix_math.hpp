// include/rmath/radix_math.hpp — Dispatch facade routing each operation to the full or simplified engine.

#pragma once

#include <utility>

#include <rmath/context.hpp>
#include <rmath/core/traits.hpp>
#include <rmath/engine/full_engine.hpp>
#include <rmath/engine/simplified_engine.hpp>

namespace rmath {

using core::bigint;

enum class engine_kind { full, simplified };

inline engine_kind select_engine(const context& ctx) noexcept {
    return ctx.is_simplified() ? engine_kind::simplified : engine_kind::full;
}

// Context used by every overload that takes none: unlimited precision,
// half-even rounding, no exponent range, no traps, full engine.
inline const context& default_context() {
    static const context value = context::unlimited();
    return value;
}

// Public entry point. Every operation takes its operands, the context and a
// status receiving the raised conditions, and is routed by select_engine().
// The overloads without a context run under default_context() and discard the
// flags. pi() has no such overload: its precision must always be named.
template <typename T>
class radix_math {
public:
    static_assert(core::is_radix_numeric_v<T>,
                  "radix_math requires a number_traits specialisation");

    using value_type = T;

    radix_math() : simplified_(full_) {}

    radix_math(const radix_math&) = delete;
    radix_math& operator=(const radix_math&) = delete;

    const engine::full_engine<T>& full() const noexcept { return full_; }
    const engine::simplified_engine<T>& simplified() const noexcept { return simplified_; }

    // arithmetic

    T add(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.add(a, b, ctx, st); });
    }
    T add(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return add(a, b, ctx, st); });
    }

    // With `round_to_operand_precision`, operands wider than the precision are
    // rounded before the addition.
    T add_ex(const T& a, const T& b, const context& ctx, bool round_to_operand_precision,
             status& st) const {
        return dispatch(ctx, [&](const auto& e) {
            return e.add_ex(a, b, ctx, round_to_operand_precision, st);
        });
    }
    T add_ex(const T& a, const T& b, bool round_to_operand_precision) const {
        return unbounded([&](const context& ctx, status& st) {
            return add_ex(a, b, ctx, round_to_operand_precision, st);
        });
    }

    T subtract(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.subtract(a, b, ctx, st); });
    }
    T subtract(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return subtract(a, b, ctx, st); });
    }

    T multiply(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.multiply(a, b, ctx, st); });
    }
    T multiply(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return multiply(a, b, ctx, st); });
    }

    // a * b + c with a single rounding.
    T multiply_and_add(const T& a, const T& b, const T& c, const context& ctx,
                       status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.multiply_and_add(a, b, c, ctx, st); });
    }
    T multiply_and_add(const T& a, const T& b, const T& c) const {
        return unbounded(
            [&](const context& ctx, status& st) { return multiply_and_add(a, b, c, ctx, st); });
    }

    // Without a precision a non-terminating quotient is invalid.
    T divide(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.divide(a, b, ctx, st); });
    }
    T divide(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return divide(a, b, ctx, st); });
    }

    T divide_to_exponent(const T& a, const T& b, const bigint& exponent, const context& ctx,
                         status& st) const {
        return dispatch(ctx,
                        [&](const auto& e) { return e.divide_to_exponent(a, b, exponent, ctx, st); });
    }
    T divide_to_exponent(const T& a, const T& b, const bigint& exponent) const {
        return unbounded([&](const context& ctx, status& st) {
            return divide_to_exponent(a, b, exponent, ctx, st);
        });
    }

    T divide_to_integer_natural_scale(const T& a, const T& b, const context& ctx,
                                      status& st) const {
        return dispatch(ctx, [&](const auto& e) {
            return e.divide_to_integer_natural_scale(a, b, ctx, st);
        });
    }
    T divide_to_integer_natural_scale(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) {
            return divide_to_integer_natural_scale(a, b, ctx, st);
        });
    }

    T divide_to_integer_zero_scale(const T& a, const T& b, const context& ctx,
                                   status& st) const {
        return dispatch(ctx,
                        [&](const auto& e) { return e.divide_to_integer_zero_scale(a, b, ctx, st); });
    }
    T divide_to_integer_zero_scale(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) {
            return divide_to_integer_zero_scale(a, b, ctx, st);
        });
    }

    T remainder(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.remainder(a, b, ctx, st); });
    }
    T remainder(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return remainder(a, b, ctx, st); });
    }

    T remainder_near(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.remainder_near(a, b, ctx, st); });
    }
    T remainder_near(const T& a, const T& b) const {
        return unbounded(
            [&](const context& ctx, status& st) { return remainder_near(a, b, ctx, st); });
    }

    T negate(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.negate(a, ctx, st); });
    }
    T negate(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return negate(a, ctx, st); });
    }

    T abs(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.abs(a, ctx, st); });
    }
    T abs(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return abs(a, ctx, st); });
    }

    // comparison

    // Total ordering, always computed by the full engine.
    int compare(const T& a, const T& b) const { return full_.compare(a, b); }

    // -1, 0 or 1 as a number; NaN when either operand is one.
    T compare_to_with_context(const T& a, const T& b, bool treat_quiet_nan_as_signaling,
                              const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) {
            return e.compare_to_with_context(a, b, treat_quiet_nan_as_signaling, ctx, st);
        });
    }
    T compare_to_with_context(const T& a, const T& b, bool treat_quiet_nan_as_signaling) const {
        return unbounded([&](const context& ctx, status& st) {
            return compare_to_with_context(a, b, treat_quiet_nan_as_signaling, ctx, st);
        });
    }

    T min(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.min(a, b, ctx, st); });
    }
    T min(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return min(a, b, ctx, st); });
    }

    T max(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.max(a, b, ctx, st); });
    }
    T max(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return max(a, b, ctx, st); });
    }

    T min_magnitude(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.min_magnitude(a, b, ctx, st); });
    }
    T min_magnitude(const T& a, const T& b) const {
        return unbounded(
            [&](const context& ctx, status& st) { return min_magnitude(a, b, ctx, st); });
    }

    T max_magnitude(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.max_magnitude(a, b, ctx, st); });
    }
    T max_magnitude(const T& a, const T& b) const {
        return unbounded(
            [&](const context& ctx, status& st) { return max_magnitude(a, b, ctx, st); });
    }

    // rounding

    T round_to_precision(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.round_to_precision(a, ctx, st); });
    }
    T round_to_precision(const T& a) const {
        return unbounded(
            [&](const context& ctx, status& st) { return round_to_precision(a, ctx, st); });
    }

    // Reads the context precision as a count of bits.
    T round_to_binary_precision(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx,
                        [&](const auto& e) { return e.round_to_binary_precision(a, ctx, st); });
    }
    T round_to_binary_precision(const T& a) const {
        return unbounded(
            [&](const context& ctx, status& st) { return round_to_binary_precision(a, ctx, st); });
    }

    // Like round_to_precision, but a signaling NaN stays signaling.
    T round_after_conversion(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.round_after_conversion(a, ctx, st); });
    }
    T round_after_conversion(const T& a) const {
        return unbounded(
            [&](const context& ctx, status& st) { return round_after_conversion(a, ctx, st); });
    }

    T plus(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.plus(a, ctx, st); });
    }
    T plus(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return plus(a, ctx, st); });
    }

    // Rescales `a` to the exponent of `pattern`.
    T quantize(const T& a, const T& pattern, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.quantize(a, pattern, ctx, st); });
    }
    T quantize(const T& a, const T& pattern) const {
        return unbounded(
            [&](const context& ctx, status& st) { return quantize(a, pattern, ctx, st); });
    }

    // Invalid when the rescale would discard nonzero digits.
    T round_to_exponent_exact(const T& a, const bigint& exponent, const context& ctx,
                              status& st) const {
        return dispatch(ctx, [&](const auto& e) {
            return e.round_to_exponent_exact(a, exponent, ctx, st);
        });
    }
    T round_to_exponent_exact(const T& a, const bigint& exponent) const {
        return unbounded([&](const context& ctx, status& st) {
            return round_to_exponent_exact(a, exponent, ctx, st);
        });
    }

    T round_to_exponent_simple(const T& a, const bigint& exponent, const context& ctx,
                               status& st) const {
        return dispatch(ctx, [&](const auto& e) {
            return e.round_to_exponent_simple(a, exponent, ctx, st);
        });
    }
    T round_to_exponent_simple(const T& a, const bigint& exponent) const {
        return unbounded([&](const context& ctx, status& st) {
            return round_to_exponent_simple(a, exponent, ctx, st);
        });
    }

    T round_to_exponent_no_rounded_flag(const T& a, const bigint& exponent, const context& ctx,
                                        status& st) const {
        return dispatch(ctx, [&](const auto& e) {
            return e.round_to_exponent_no_rounded_flag(a, exponent, ctx, st);
        });
    }
    T round_to_exponent_no_rounded_flag(const T& a, const bigint& exponent) const {
        return unbounded([&](const context& ctx, status& st) {
            return round_to_exponent_no_rounded_flag(a, exponent, ctx, st);
        });
    }

    T reduce(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.reduce(a, ctx, st); });
    }
    T reduce(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return reduce(a, ctx, st); });
    }

    // navigation

    T next_minus(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.next_minus(a, ctx, st); });
    }
    T next_minus(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return next_minus(a, ctx, st); });
    }

    T next_plus(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.next_plus(a, ctx, st); });
    }
    T next_plus(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return next_plus(a, ctx, st); });
    }

    T next_toward(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.next_toward(a, b, ctx, st); });
    }
    T next_toward(const T& a, const T& b) const {
        return unbounded(
            [&](const context& ctx, status& st) { return next_toward(a, b, ctx, st); });
    }

    // elementary functions

    // An unlimited precision yields an invalid NaN.
    T pi(const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.pi(ctx, st); });
    }

    T power(const T& a, const T& b, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.power(a, b, ctx, st); });
    }
    T power(const T& a, const T& b) const {
        return unbounded([&](const context& ctx, status& st) { return power(a, b, ctx, st); });
    }

    T log10(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.log10(a, ctx, st); });
    }
    T log10(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return log10(a, ctx, st); });
    }

    T ln(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.ln(a, ctx, st); });
    }
    T ln(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return ln(a, ctx, st); });
    }

    T exp(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.exp(a, ctx, st); });
    }
    T exp(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return exp(a, ctx, st); });
    }

    T square_root(const T& a, const context& ctx, status& st) const {
        return dispatch(ctx, [&](const auto& e) { return e.square_root(a, ctx, st); });
    }
    T square_root(const T& a) const {
        return unbounded([&](const context& ctx, status& st) { return square_root(a, ctx, st); });
    }

private:
    template <typename Operation>
    T dispatch(const context& ctx, Operation&& operation) const {
        if (select_engine(ctx) == engine_kind::simplified) {
            return std::forward<Operation>(operation)(simplified_);
        }
        return std::forward<Operation>(operation)(full_);
    }

    template <typename Operation>
    static T unbounded(Operation&& operation) {
        status discarded;
        return std::forward<Operation>(operation)(default_context(), discarded);
    }

    engine::full_engine<T> full_;
    engine::simplified_engine<T> simplified_;
};

using decimal_math = radix_math<core::decimal>;
using bigfloat_math = radix_math<core::bigfloat>;

} // namespace rmath
