// tests/unit/test_convert.cpp — Unit tests for radix conversion, host doubles and integral range checks.

#include <rmath/rmathlib.hpp>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

namespace {

using rmath::context;
using rmath::flags;
using rmath::status;
using rmath::core::bigfloat;
using rmath::core::bigint;
using rmath::core::decimal;

decimal d(std::string_view text) { return rmath::io::decimal_from_string(text); }

bool expect_text(const decimal& actual, std::string_view expected, std::string_view label) {
    const std::string text = rmath::io::to_string(actual);
    if (text == expected) {
        return true;
    }
    std::cerr << label << ": got " << text << ", expected " << expected << "\n";
    return false;
}

bool test_doubles() {
    const bigfloat half = rmath::from_double(0.5);
    status st;
    if (rmath::to_double(half) != 0.5 ||
        rmath::io::to_string(rmath::convert_radix<10>(half, context::unlimited(), st)) != "0.5") {
        std::cerr << "0.5 conversion failed\n";
        return false;
    }
    if (!expect_text(rmath::decimal_from_double(0.1),
                     "0.1000000000000000055511151231257827021181583404541015625",
                     "exact expansion of 0.1")) {
        return false;
    }
    if (!expect_text(rmath::decimal_from_double(-0.0), "-0", "negative zero") ||
        !expect_text(rmath::decimal_from_double(std::numeric_limits<double>::infinity()),
                     "Infinity", "infinity")) {
        return false;
    }
    for (const double value : {1.0, -2.5, 0.1, 1e300, 5e-324, 123456.789, -1e-310}) {
        if (rmath::to_double(rmath::decimal_from_double(value)) != value) {
            std::cerr << "double roundtrip failed for " << value << "\n";
            return false;
        }
    }
    if (rmath::to_double(d("0.1")) != 0.1 || rmath::to_double(d("1E+400")) !=
                                                 std::numeric_limits<double>::infinity()) {
        std::cerr << "decimal to double failed\n";
        return false;
    }
    const double tiny = rmath::to_double(d("-1E-400"));
    if (tiny != 0.0 || !std::signbit(tiny)) {
        std::cerr << "underflow to negative zero failed\n";
        return false;
    }
    if (!std::isnan(rmath::to_double(d("NaN")))) {
        std::cerr << "NaN conversion failed\n";
        return false;
    }
    return true;
}

bool test_radix_conversion() {
    status st;
    const decimal five_eighths =
        rmath::convert_radix<10>(rmath::io::bigfloat_from_string("101p-3"), context::unlimited(), st);
    if (!expect_text(five_eighths, "0.625", "binary fraction to decimal")) {
        return false;
    }
    const bigfloat integral =
        rmath::convert_radix<2>(d("1.2E+2"), context::unlimited(), st);
    if (integral.mantissa() != bigint(120) || integral.exponent() != bigint(0)) {
        std::cerr << "integral decimal to binary failed\n";
        return false;
    }
    if (st.value() != flags::none) {
        std::cerr << "exact conversions raised " << rmath::to_string(st.value()) << "\n";
        return false;
    }
    status rounded;
    const bigfloat tenth =
        rmath::convert_radix<2>(d("0.1"), context::binary32().with_traps(flags::none), rounded);
    if (tenth.mantissa() != bigint(13421773) || tenth.exponent() != bigint(-27) ||
        !rounded.has(flags::inexact)) {
        std::cerr << "0.1 to binary32 failed: " << rmath::io::to_string(tenth) << "\n";
        return false;
    }
    status endless;
    if (!rmath::convert_radix<2>(d("0.1"), context::unlimited(), endless).is_nan() ||
        !endless.has(flags::invalid)) {
        std::cerr << "non-terminating conversion without precision must be invalid\n";
        return false;
    }
    status signaling;
    const bigfloat kept =
        rmath::convert_radix<2>(decimal::signaling_nan(bigint(9)), context::unlimited(), signaling);
    if (!kept.is_signaling_nan() || signaling.value() != flags::none) {
        std::cerr << "converted signaling NaN must stay signaling\n";
        return false;
    }
    return true;
}

bool test_integral_checks() {
    if (!rmath::can_fit_int32(d("2147483647")) || rmath::can_fit_int32(d("2147483648")) ||
        !rmath::can_fit_int32(d("-2147483648")) || !rmath::can_fit_int32(d("1.00E+3"))) {
        std::cerr << "int32 range check failed\n";
        return false;
    }
    if (!rmath::can_fit_int64(d("9223372036854775807")) ||
        rmath::can_fit_int64(d("9223372036854775808")) || rmath::can_fit_int64(d("2.5")) ||
        rmath::can_fit_int64(d("Infinity")) || rmath::can_fit_int64(d("1E+999999"))) {
        std::cerr << "int64 range check failed\n";
        return false;
    }
    if (!rmath::can_truncated_fit<std::int32_t>(d("2.5")) ||
        !rmath::can_truncated_fit<std::int32_t>(d("-2147483648.9")) ||
        rmath::can_truncated_fit<std::int32_t>(d("NaN")) ||
        !rmath::can_truncated_fit<std::uint8_t>(d("255.99")) ||
        rmath::can_truncated_fit<std::uint8_t>(d("256"))) {
        std::cerr << "truncated range check failed\n";
        return false;
    }
    if (d("2.5").to_bigint() != bigint(2) || d("-2.5").to_bigint() != bigint(-2)) {
        std::cerr << "truncating conversion failed\n";
        return false;
    }
    return true;
}

bool test_conversion_policies() {
    using rmath::io::number_conversion;
    const decimal tenth = d("0.1");
    if (!expect_text(rmath::apply_conversion(tenth, number_conversion::full), "0.1", "full") ||
        !expect_text(rmath::apply_conversion(tenth, number_conversion::double_precision),
                     "0.1000000000000000055511151231257827021181583404541015625", "double")) {
        return false;
    }
    if (!expect_text(rmath::apply_conversion(d("12.000"), number_conversion::int_or_float), "12",
                     "integral kept as integer") ||
        !expect_text(rmath::apply_conversion(d("0.5"), number_conversion::int_or_float), "0.5",
                     "fraction through double")) {
        return false;
    }
    if (!expect_text(rmath::apply_conversion(d("9007199254740993"),
                                             number_conversion::int_or_float_from_double),
                     "9007199254740992", "integer rounded through double")) {
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_doubles()) {
        return 1;
    }
    if (!test_radix_conversion()) {
        return 1;
    }
    if (!test_integral_checks()) {
        return 1;
    }
    if (!test_conversion_policies()) {
        return 1;
    }
    std::cout << "convert passed\n";
    return 0;
}
