// include/rmath/engine/detail/native.hpp — Fixed-width fast paths used by the simplified engine.

#pragma once

#include <cstdint>
#include <optional>

#include <rmath/context.hpp>
#include <rmath/core/bigint.hpp>
#include <rmath/core/number.hpp>
#include <rmath/engine/detail/rounding.hpp>

namespace rmath::engine::detail {

    using native_uint = core::detail::limb_uint128;

    // How round_signed treats the operand's sign before rounding.
    enum class sign_rule : std::uint8_t { keep, flip, clear, plus };

    inline constexpr int NATIVE_MANTISSA_BITS = 62;
    inline constexpr std::int64_t NATIVE_EXPONENT_LIMIT = std::int64_t{1} << 40;

    // Finite operand held in machine words.
    struct native_value {
        bool negative = false;
        native_uint mantissa = 0;
        std::int64_t exponent = 0;
    };

    // Context reduced to machine words. Only built for contexts whose largest
    // mantissa stays below 2^62 and whose exponent range lies within +/-2^40.
    struct native_context {
        int radix = 10;
        unsigned precision = 0;
        native_uint max_mantissa = 0;
        rounding mode = rounding::half_even;
        bool has_range = false;
        std::int64_t emin = 0;
        std::int64_t emax = 0;
        std::int64_t etiny = 0;
        std::int64_t etop = 0;
    };

    std::optional<native_context> to_native(const context &ctx, int radix);
    std::optional<native_value> to_native(const number_parts &value);
    std::optional<std::int64_t> to_native_exponent(const bigint &exponent);

    // Exact results computed in 128-bit words. Every operation returns nothing
    // (and leaves `raised` untouched) when an operand, an intermediate or the
    // result falls outside the fixed-width domain: a special value, a
    // subnormal, overflowing or clamped result, or a carry past 128 bits.
    class native_arithmetic {
    public:
        explicit native_arithmetic(int radix);

        int radix() const noexcept { return radix_; }

        std::optional<number_parts> add(const number_parts &a, const number_parts &b,
                                        const native_context &ctx, flags &raised) const;
        std::optional<number_parts> multiply(const number_parts &a, const number_parts &b,
                                             const native_context &ctx, flags &raised) const;
        std::optional<number_parts> multiply_and_add(const number_parts &a,
                                                     const number_parts &b,
                                                     const number_parts &c,
                                                     const native_context &ctx,
                                                     flags &raised) const;
        std::optional<number_parts> divide(const number_parts &a, const number_parts &b,
                                           const native_context &ctx, flags &raised) const;
        std::optional<number_parts> divide_to_integer_zero_scale(const number_parts &a,
                                                                 const number_parts &b,
                                                                 const native_context &ctx,
                                                                 flags &raised) const;
        std::optional<number_parts> remainder(const number_parts &a, const number_parts &b,
                                              bool nearest, const native_context &ctx,
                                              flags &raised) const;

        // Sign changes and plain rounding: negate, abs, plus and round-to-precision.
        std::optional<number_parts> round_signed(const number_parts &a, sign_rule rule,
                                                 const native_context &ctx,
                                                 flags &raised) const;
        std::optional<number_parts> reduce(const number_parts &a, const native_context &ctx,
                                           flags &raised) const;
        std::optional<number_parts> rescale(const number_parts &a, std::int64_t exponent,
                                            bool keep_when_coarser, const native_context &ctx,
                                            flags &raised) const;

        std::optional<int> compare(const number_parts &a, const number_parts &b,
                                   bool by_magnitude) const;
        std::optional<number_parts> min_max(const number_parts &a, const number_parts &b,
                                            bool want_max, bool by_magnitude,
                                            const native_context &ctx, flags &raised) const;

    private:
        // Rounds an exact value to the context, mirroring full_arithmetic::finalize
        // inside the normal range.
        std::optional<native_value> finish(native_value value, residue incoming,
                                           const native_context &ctx, flags &raised) const;
        std::optional<native_value> add_values(native_value a, native_value b,
                                               const native_context &ctx, flags &raised) const;
        std::optional<native_value> pad(native_value value, std::int64_t exponent,
                                        const native_context &ctx, flags &raised) const;
        struct division {
            native_uint quotient = 0;
            native_uint remainder = 0;
            native_uint divisor = 0;
            std::int64_t exponent = 0;
            bool fits = true;
        };
        std::optional<division> divide_integer(const native_value &a, const native_value &b,
                                               const native_context &ctx) const;
        std::optional<native_uint> scale(native_uint mantissa, std::int64_t digits) const;
        native_uint power(unsigned exponent) const noexcept { return powers_[exponent]; }
        unsigned digits(native_uint mantissa) const noexcept;
        std::int64_t adjusted(const native_value &value) const noexcept {
            return value.exponent + static_cast<std::int64_t>(digits(value.mantissa)) - 1;
        }

        int radix_;
        unsigned max_power_ = 0;
        native_uint powers_[129] = {};
    };

    number_parts to_parts(const native_value &value);

} // namespace rmath::engine::detail
