// include/rmath/engine/simplified_engine.hpp — Fixed-width fast paths with explicit fallback to the full engine.

#pragma once

#include <optional>
#include <utility>

#include <rmath/context.hpp>
#include <rmath/core/traits.hpp>
#include <rmath/engine/detail/native.hpp>
#include <rmath/engine/full_engine.hpp>

namespace rmath::engine {

// Same operation surface as full_engine. An operation takes its 128-bit path
// when the context has a precision below 2^62 with exponents inside +/-2^40 and
// every operand is finite with a mantissa of at most 62 bits; the result then
// matches the full engine exactly. Everything else falls back to the full
// engine explicitly:
//
//   native, falling back per call   add, add_ex, subtract, multiply,
//                                   multiply_and_add, divide,
//                                   divide_to_integer_zero_scale, remainder,
//                                   remainder_near, negate, abs, plus, reduce,
//                                   round_to_precision, round_to_binary_precision,
//                                   round_after_conversion, quantize,
//                                   round_to_exponent_*, compare_to_with_context,
//                                   min, max, min_magnitude, max_magnitude
//   always the full engine          compare, divide_to_exponent,
//                                   divide_to_integer_natural_scale, next_*,
//                                   pi, power, log10, ln, exp, square_root
template <typename T>
class simplified_engine {
public:
    using value_type = T;
    using traits = core::number_traits<T>;

    explicit simplified_engine(const full_engine<T>& full) : full_(full), native_(traits::radix) {}

    simplified_engine(const simplified_engine&) = delete;
    simplified_engine& operator=(const simplified_engine&) = delete;

    T add(const T& a, const T& b, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.add(parts(a), parts(b), nc, raised);
            },
            [&] { return full_.add(a, b, ctx, st); });
    }

    T add_ex(const T& a, const T& b, const context& ctx, bool round_to_operand_precision,
             status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc,
                flags& raised) -> std::optional<number_parts> {
                const number_parts lhs = parts(a);
                const number_parts rhs = parts(b);
                if (round_to_operand_precision &&
                    (!fits_precision(lhs, nc) || !fits_precision(rhs, nc))) {
                    return std::nullopt;
                }
                return native_.add(lhs, rhs, nc, raised);
            },
            [&] { return full_.add_ex(a, b, ctx, round_to_operand_precision, st); });
    }

    T subtract(const T& a, const T& b, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                number_parts rhs = parts(b);
                rhs.negative = !rhs.negative;
                return native_.add(parts(a), rhs, nc, raised);
            },
            [&] { return full_.subtract(a, b, ctx, st); });
    }

    T multiply(const T& a, const T& b, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.multiply(parts(a), parts(b), nc, raised);
            },
            [&] { return full_.multiply(a, b, ctx, st); });
    }

    T multiply_and_add(const T& a, const T& b, const T& c, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.multiply_and_add(parts(a), parts(b), parts(c), nc, raised);
            },
            [&] { return full_.multiply_and_add(a, b, c, ctx, st); });
    }

    T divide(const T& a, const T& b, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.divide(parts(a), parts(b), nc, raised);
            },
            [&] { return full_.divide(a, b, ctx, st); });
    }

    T divide_to_exponent(const T& a, const T& b, const bigint& exponent, const context& ctx,
                         status& st) const {
        return full_.divide_to_exponent(a, b, exponent, ctx, st);
    }

    T divide_to_integer_natural_scale(const T& a, const T& b, const context& ctx,
                                      status& st) const {
        return full_.divide_to_integer_natural_scale(a, b, ctx, st);
    }

    T divide_to_integer_zero_scale(const T& a, const T& b, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.divide_to_integer_zero_scale(parts(a), parts(b), nc, raised);
            },
            [&] { return full_.divide_to_integer_zero_scale(a, b, ctx, st); });
    }

    T remainder(const T& a, const T& b, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.remainder(parts(a), parts(b), false, nc, raised);
            },
            [&] { return full_.remainder(a, b, ctx, st); });
    }

    T remainder_near(const T& a, const T& b, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.remainder(parts(a), parts(b), true, nc, raised);
            },
            [&] { return full_.remainder_near(a, b, ctx, st); });
    }

    T negate(const T& a, const context& ctx, status& st) const {
        return signed_rounding(a, detail::sign_rule::flip, ctx, st,
                               [&] { return full_.negate(a, ctx, st); });
    }

    T abs(const T& a, const context& ctx, status& st) const {
        return signed_rounding(a, detail::sign_rule::clear, ctx, st,
                               [&] { return full_.abs(a, ctx, st); });
    }

    int compare(const T& a, const T& b) const { return full_.compare(a, b); }

    T compare_to_with_context(const T& a, const T& b, bool treat_quiet_nan_as_signaling,
                              const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context&, flags&) -> std::optional<number_parts> {
                const auto order = native_.compare(parts(a), parts(b), false);
                if (!order) {
                    return std::nullopt;
                }
                return detail::make_finite(*order < 0, bigint(*order < 0 ? -*order : *order), {});
            },
            [&] {
                return full_.compare_to_with_context(a, b, treat_quiet_nan_as_signaling, ctx, st);
            });
    }

    T min(const T& a, const T& b, const context& ctx, status& st) const {
        return extremum(a, b, false, false, ctx, st, [&] { return full_.min(a, b, ctx, st); });
    }

    T max(const T& a, const T& b, const context& ctx, status& st) const {
        return extremum(a, b, true, false, ctx, st, [&] { return full_.max(a, b, ctx, st); });
    }

    T min_magnitude(const T& a, const T& b, const context& ctx, status& st) const {
        return extremum(a, b, false, true, ctx, st,
                        [&] { return full_.min_magnitude(a, b, ctx, st); });
    }

    T max_magnitude(const T& a, const T& b, const context& ctx, status& st) const {
        return extremum(a, b, true, true, ctx, st,
                        [&] { return full_.max_magnitude(a, b, ctx, st); });
    }

    T round_to_precision(const T& a, const context& ctx, status& st) const {
        return signed_rounding(a, detail::sign_rule::keep, ctx, st,
                               [&] { return full_.round_to_precision(a, ctx, st); });
    }

    T round_to_binary_precision(const T& a, const context& ctx, status& st) const {
        const context bits = ctx.with_precision_in_bits(true);
        if (const auto nc = detail::to_native(bits, traits::radix)) {
            flags raised = flags::none;
            if (auto result = native_.round_signed(parts(a), detail::sign_rule::keep, *nc, raised)) {
                st.raise(raised, ctx);
                return traits::create(std::move(*result));
            }
        }
        return full_.round_to_binary_precision(a, ctx, st);
    }

    T round_after_conversion(const T& a, const context& ctx, status& st) const {
        return signed_rounding(a, detail::sign_rule::keep, ctx, st,
                               [&] { return full_.round_after_conversion(a, ctx, st); });
    }

    T plus(const T& a, const context& ctx, status& st) const {
        return signed_rounding(a, detail::sign_rule::plus, ctx, st,
                               [&] { return full_.plus(a, ctx, st); });
    }

    T quantize(const T& a, const T& pattern, const context& ctx, status& st) const {
        const number_parts target = parts(pattern);
        const auto exponent =
            target.is_finite() ? detail::to_native_exponent(target.exponent) : std::nullopt;
        if (!exponent) {
            return full_.quantize(a, pattern, ctx, st);
        }
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.rescale(parts(a), *exponent, false, nc, raised);
            },
            [&] { return full_.quantize(a, pattern, ctx, st); });
    }

    T round_to_exponent_exact(const T& a, const bigint& exponent, const context& ctx,
                              status& st) const {
        return to_exponent(a, exponent, ctx, st, [](flags& raised, number_parts& result) {
            if (any(raised & flags::inexact)) {
                raised = flags::none;
                result = detail::invalid_operation(raised);
            }
        }, [&] { return full_.round_to_exponent_exact(a, exponent, ctx, st); });
    }

    T round_to_exponent_simple(const T& a, const bigint& exponent, const context& ctx,
                               status& st) const {
        return to_exponent(a, exponent, ctx, st, [](flags&, number_parts&) {},
                           [&] { return full_.round_to_exponent_simple(a, exponent, ctx, st); });
    }

    T round_to_exponent_no_rounded_flag(const T& a, const bigint& exponent, const context& ctx,
                                        status& st) const {
        return to_exponent(a, exponent, ctx, st, [](flags& raised, number_parts&) {
            if (!any(raised & flags::inexact)) {
                raised &= ~flags::rounded;
            }
        }, [&] { return full_.round_to_exponent_no_rounded_flag(a, exponent, ctx, st); });
    }

    T reduce(const T& a, const context& ctx, status& st) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.reduce(parts(a), nc, raised);
            },
            [&] { return full_.reduce(a, ctx, st); });
    }

    T next_minus(const T& a, const context& ctx, status& st) const {
        return full_.next_minus(a, ctx, st);
    }

    T next_plus(const T& a, const context& ctx, status& st) const {
        return full_.next_plus(a, ctx, st);
    }

    T next_toward(const T& a, const T& b, const context& ctx, status& st) const {
        return full_.next_toward(a, b, ctx, st);
    }

    T pi(const context& ctx, status& st) const { return full_.pi(ctx, st); }

    T power(const T& a, const T& b, const context& ctx, status& st) const {
        return full_.power(a, b, ctx, st);
    }

    T log10(const T& a, const context& ctx, status& st) const { return full_.log10(a, ctx, st); }

    T ln(const T& a, const context& ctx, status& st) const { return full_.ln(a, ctx, st); }

    T exp(const T& a, const context& ctx, status& st) const { return full_.exp(a, ctx, st); }

    T square_root(const T& a, const context& ctx, status& st) const {
        return full_.square_root(a, ctx, st);
    }

private:
    static number_parts parts(const T& value) { return traits::decompose(value); }

    static bool fits_precision(const number_parts& value, const detail::native_context& nc) {
        return !value.is_finite() ||
               (value.mantissa.fits_uint128() && value.mantissa.magnitude_uint128() <= nc.max_mantissa);
    }

    template <typename Fast, typename Fallback>
    T fast_or(const context& ctx, status& st, Fast&& fast, Fallback&& fallback) const {
        if (const auto nc = detail::to_native(ctx, traits::radix)) {
            flags raised = flags::none;
            if (auto result = fast(*nc, raised)) {
                st.raise(raised, ctx);
                return traits::create(std::move(*result));
            }
        }
        return fallback();
    }

    template <typename Fallback>
    T signed_rounding(const T& a, detail::sign_rule rule, const context& ctx, status& st,
                      Fallback&& fallback) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.round_signed(parts(a), rule, nc, raised);
            },
            std::forward<Fallback>(fallback));
    }

    template <typename Fallback>
    T extremum(const T& a, const T& b, bool want_max, bool by_magnitude, const context& ctx,
               status& st, Fallback&& fallback) const {
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc, flags& raised) {
                return native_.min_max(parts(a), parts(b), want_max, by_magnitude, nc, raised);
            },
            std::forward<Fallback>(fallback));
    }

    template <typename Adjust, typename Fallback>
    T to_exponent(const T& a, const bigint& exponent, const context& ctx, status& st,
                  Adjust&& adjust, Fallback&& fallback) const {
        const auto target = detail::to_native_exponent(exponent);
        if (!target) {
            return fallback();
        }
        return fast_or(
            ctx, st,
            [&](const detail::native_context& nc,
                flags& raised) -> std::optional<number_parts> {
                flags local = flags::none;
                auto result = native_.rescale(parts(a), *target, true, nc, local);
                if (!result) {
                    return std::nullopt;
                }
                adjust(local, *result);
                raised |= local;
                return result;
            },
            std::forward<Fallback>(fallback));
    }

    const full_engine<T>& full_;
    detail::native_arithmetic native_;
};

} // namespace rmath::engine
