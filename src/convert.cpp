// src/convert.cpp — Host double conversions and number-conversion policies.

#include <rmath/convert.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace rmath {

namespace {

constexpr int DOUBLE_MANTISSA_BITS = std::numeric_limits<double>::digits;

core::decimal integral_decimal(const core::decimal& value) {
    return core::decimal(value.to_bigint());
}

} // namespace

core::bigfloat from_double(double value) {
    const bool negative = std::signbit(value);
    if (std::isnan(value)) {
        return core::bigfloat::nan(core::bigint::zero(), negative);
    }
    if (std::isinf(value)) {
        return core::bigfloat::infinity(negative);
    }
    if (value == 0.0) {
        return core::bigfloat::zero(negative);
    }
    int exponent = 0;
    const double fraction = std::frexp(std::fabs(value), &exponent);
    const auto mantissa =
        static_cast<std::uint64_t>(std::ldexp(fraction, DOUBLE_MANTISSA_BITS));
    return core::bigfloat::finite(negative, core::bigint(mantissa),
                                  core::bigint(exponent - DOUBLE_MANTISSA_BITS));
}

double to_double(const core::bigfloat& value) {
    if (value.is_nan()) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        return value.is_negative() ? -nan : nan;
    }
    if (value.is_infinity()) {
        return value.is_negative() ? -std::numeric_limits<double>::infinity()
                                   : std::numeric_limits<double>::infinity();
    }
    const context binary64 = context::binary64().with_rounding(rounding::half_even);
    const engine::full_arithmetic kernel(2);
    flags raised = flags::none;
    const core::number_parts rounded = kernel.round_to_precision(value.parts(), binary64, raised);
    if (rounded.is_infinity()) {
        return rounded.negative ? -std::numeric_limits<double>::infinity()
                                : std::numeric_limits<double>::infinity();
    }
    const auto mantissa = static_cast<std::uint64_t>(rounded.mantissa);
    const double magnitude =
        std::ldexp(static_cast<double>(mantissa), static_cast<int>(rounded.exponent));
    return rounded.negative ? -magnitude : magnitude;
}

core::decimal decimal_from_double(double value) {
    status ignored;
    return convert_radix<10>(from_double(value), context::unlimited(), ignored);
}

core::decimal apply_conversion(const core::decimal& value, io::number_conversion kind) {
    switch (kind) {
    case io::number_conversion::full:
        return value;
    case io::number_conversion::double_precision:
        return decimal_from_double(to_double(value));
    case io::number_conversion::int_or_float:
        if (value.is_integer()) {
            return integral_decimal(value);
        }
        return decimal_from_double(to_double(value));
    case io::number_conversion::int_or_float_from_double: {
        const core::decimal rounded = decimal_from_double(to_double(value));
        return rounded.is_integer() ? integral_decimal(rounded) : rounded;
    }
    }
    return value;
}

} // namespace rmath
