// include/rmath/convert.hpp — Conversions between radices, host doubles and integers.

#pragma once

#include <cstdint>
#include <type_traits>
#include <utility>

#include <rmath/context.hpp>
#include <rmath/core/bigint.hpp>
#include <rmath/core/detail/radix.hpp>
#include <rmath/core/number.hpp>
#include <rmath/engine/full_arithmetic.hpp>
#include <rmath/io/options.hpp>

namespace rmath {

// Value of `value` in radix To, correctly rounded to `ctx`. Integral values
// are rounded directly; fractions are divided out in the target radix, so a
// fraction that does not terminate there needs a precision. A signaling NaN
// stays signaling.
template <int To, int From>
core::basic_number<To> convert_radix(const core::basic_number<From>& value, const context& ctx,
                                     status& st) {
    using core::bigint;
    const engine::full_arithmetic kernel(To);
    flags raised = flags::none;
    core::number_parts result;
    if (!value.is_finite() || !value.exponent().is_negative()) {
        core::number_parts whole = value.parts();
        if (whole.is_finite()) {
            whole.mantissa = core::detail::scale_up(whole.mantissa, From,
                                                    core::detail::to_size(whole.exponent));
            whole.exponent = bigint::zero();
        }
        result = kernel.round_after_conversion(whole, ctx, raised);
    } else {
        const std::size_t places = core::detail::to_size(-value.exponent());
        const core::number_parts numerator{core::number_kind::finite, value.is_negative(),
                                           value.mantissa(), bigint::zero()};
        const core::number_parts denominator{core::number_kind::finite, false,
                                             core::detail::radix_power(From, places),
                                             bigint::zero()};
        result = kernel.divide(numerator, denominator, ctx, raised);
    }
    st.raise(raised, ctx);
    return core::basic_number<To>::from_parts(std::move(result));
}

// Exact binary value of a double; NaN payloads are not carried.
core::bigfloat from_double(double value);

// Nearest double (half-even), with gradual underflow and overflow to infinity.
double to_double(const core::bigfloat& value);

template <int Radix>
double to_double(const core::basic_number<Radix>& value) {
    if constexpr (Radix == 2) {
        return to_double(static_cast<const core::bigfloat&>(value));
    } else {
        status ignored;
        const context binary64 = context::binary64().with_rounding(rounding::half_even);
        return to_double(convert_radix<2>(value, binary64, ignored));
    }
}

// Exact decimal expansion of a double.
core::decimal decimal_from_double(double value);

// Applies a host number-conversion policy to a parsed decimal.
core::decimal apply_conversion(const core::decimal& value, io::number_conversion kind);

// True when the value is an integer inside the range of Int.
template <typename Int, int Radix>
bool can_fit(const core::basic_number<Radix>& value) {
    static_assert(std::is_integral_v<Int>, "can_fit requires an integral type");
    if (!value.is_integer()) {
        return false;
    }
    // Beyond 128 radix digits the value is outside every integral type.
    if (value.adjusted_exponent() > core::bigint(128)) {
        return false;
    }
    return value.to_bigint().template fits<Int>();
}

template <int Radix>
bool can_fit_int32(const core::basic_number<Radix>& value) {
    return can_fit<std::int32_t>(value);
}

template <int Radix>
bool can_fit_int64(const core::basic_number<Radix>& value) {
    return can_fit<std::int64_t>(value);
}

// Like can_fit, after truncating any fraction toward zero.
template <typename Int, int Radix>
bool can_truncated_fit(const core::basic_number<Radix>& value) {
    static_assert(std::is_integral_v<Int>, "can_truncated_fit requires an integral type");
    if (!value.is_finite() || value.adjusted_exponent() > core::bigint(128)) {
        return false;
    }
    return value.to_bigint().template fits<Int>();
}

} // namespace rmath
