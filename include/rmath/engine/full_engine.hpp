// include/rmath/engine/full_engine.hpp — Typed front of the arithmetic kernel for one value representation.

#pragma once

#include <type_traits>
#include <utility>

#include <rmath/context.hpp>
#include <rmath/core/traits.hpp>
#include <rmath/engine/full_arithmetic.hpp>

namespace rmath::engine {

// Complete arithmetic for any type with a number_traits specialisation.
// Every operation decomposes its operands, runs the kernel, records the raised
// conditions in `st` (throwing trap_error for trapped ones) and rebuilds a T.
template <typename T>
class full_engine {
public:
    static_assert(core::is_radix_numeric_v<T>,
                  "full_engine requires a number_traits specialisation");

    using value_type = T;
    using traits = core::number_traits<T>;

    full_engine() : kernel_(traits::radix) {}

    full_engine(const full_engine&) = delete;
    full_engine& operator=(const full_engine&) = delete;

    const full_arithmetic& kernel() const noexcept { return kernel_; }

    T add(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.add(parts(a), parts(b), ctx, raised); });
    }

    T add_ex(const T& a, const T& b, const context& ctx, bool round_to_operand_precision,
             status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.add_ex(parts(a), parts(b), ctx, round_to_operand_precision, raised);
        });
    }

    T subtract(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.subtract(parts(a), parts(b), ctx, raised); });
    }

    T multiply(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.multiply(parts(a), parts(b), ctx, raised); });
    }

    T multiply_and_add(const T& a, const T& b, const T& c, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.multiply_and_add(parts(a), parts(b), parts(c), ctx, raised);
        });
    }

    T divide(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.divide(parts(a), parts(b), ctx, raised); });
    }

    T divide_to_exponent(const T& a, const T& b, const bigint& exponent, const context& ctx,
                         status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.divide_to_exponent(parts(a), parts(b), exponent, ctx, raised);
        });
    }

    T divide_to_integer_natural_scale(const T& a, const T& b, const context& ctx,
                                      status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.divide_to_integer_natural_scale(parts(a), parts(b), ctx, raised);
        });
    }

    T divide_to_integer_zero_scale(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.divide_to_integer_zero_scale(parts(a), parts(b), ctx, raised);
        });
    }

    T remainder(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.remainder(parts(a), parts(b), ctx, raised); });
    }

    T remainder_near(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.remainder_near(parts(a), parts(b), ctx, raised);
        });
    }

    T negate(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.negate(parts(a), ctx, raised); });
    }

    T abs(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.abs(parts(a), ctx, raised); });
    }

    // Total order: NaNs sort above everything and equal each other.
    int compare(const T& a, const T& b) const { return kernel_.compare(parts(a), parts(b)); }

    T compare_to_with_context(const T& a, const T& b, bool treat_quiet_nan_as_signaling,
                              const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.compare_to_with_context(parts(a), parts(b),
                                                   treat_quiet_nan_as_signaling, ctx, raised);
        });
    }

    T min(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.min(parts(a), parts(b), ctx, raised); });
    }

    T max(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.max(parts(a), parts(b), ctx, raised); });
    }

    T min_magnitude(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.min_magnitude(parts(a), parts(b), ctx, raised);
        });
    }

    T max_magnitude(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.max_magnitude(parts(a), parts(b), ctx, raised);
        });
    }

    T round_to_precision(const T& a, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.round_to_precision(parts(a), ctx, raised); });
    }

    T round_to_binary_precision(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.round_to_binary_precision(parts(a), ctx, raised);
        });
    }

    T round_after_conversion(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.round_after_conversion(parts(a), ctx, raised);
        });
    }

    T plus(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.plus(parts(a), ctx, raised); });
    }

    T quantize(const T& a, const T& pattern, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.quantize(parts(a), parts(pattern), ctx, raised);
        });
    }

    T round_to_exponent_exact(const T& a, const bigint& exponent, const context& ctx,
                              status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.round_to_exponent_exact(parts(a), exponent, ctx, raised);
        });
    }

    T round_to_exponent_simple(const T& a, const bigint& exponent, const context& ctx,
                               status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.round_to_exponent_simple(parts(a), exponent, ctx, raised);
        });
    }

    T round_to_exponent_no_rounded_flag(const T& a, const bigint& exponent, const context& ctx,
                                        status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.round_to_exponent_no_rounded_flag(parts(a), exponent, ctx, raised);
        });
    }

    T reduce(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.reduce(parts(a), ctx, raised); });
    }

    T next_minus(const T& a, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.next_minus(parts(a), ctx, raised); });
    }

    T next_plus(const T& a, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.next_plus(parts(a), ctx, raised); });
    }

    T next_toward(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) {
            return kernel_.next_toward(parts(a), parts(b), ctx, raised);
        });
    }

    T pi(const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.pi(ctx, raised); });
    }

    T power(const T& a, const T& b, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.power(parts(a), parts(b), ctx, raised); });
    }

    T log10(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.log10(parts(a), ctx, raised); });
    }

    T ln(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.ln(parts(a), ctx, raised); });
    }

    T exp(const T& a, const context& ctx, status& st) const {
        return run(ctx, st, [&](flags& raised) { return kernel_.exp(parts(a), ctx, raised); });
    }

    T square_root(const T& a, const context& ctx, status& st) const {
        return run(ctx, st,
                   [&](flags& raised) { return kernel_.square_root(parts(a), ctx, raised); });
    }

private:
    static number_parts parts(const T& value) { return traits::decompose(value); }

    template <typename Operation>
    static T run(const context& ctx, status& st, Operation&& operation) {
        flags raised = flags::none;
        number_parts result = std::forward<Operation>(operation)(raised);
        st.raise(raised, ctx);
        return traits::create(std::move(result));
    }

    full_arithmetic kernel_;
};

} // namespace rmath::engine
