// tests/unit/test_rounding.cpp — Unit tests for quantize, reduce, precision rounding and adjacent values.

#include <rmath/rmathlib.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace {

using rmath::context;
using rmath::flags;
using rmath::rounding;
using rmath::status;
using rmath::core::bigfloat;
using rmath::core::bigint;
using rmath::core::decimal;

const rmath::decimal_math& math() {
    static const rmath::decimal_math instance;
    return instance;
}

decimal d(std::string_view text) { return rmath::io::decimal_from_string(text); }

context basic() { return context::basic().with_traps(flags::none); }

bool expect(const decimal& actual, std::string_view expected, std::string_view label) {
    const std::string text = rmath::io::to_string(actual);
    if (text == expected) {
        return true;
    }
    std::cerr << label << ": got " << text << ", expected " << expected << "\n";
    return false;
}

bool expect_flags(const status& st, flags expected, std::string_view label) {
    if (st.value() == expected) {
        return true;
    }
    std::cerr << label << ": flags " << rmath::to_string(st.value()) << ", expected "
              << rmath::to_string(expected) << "\n";
    return false;
}

bool test_quantize() {
    const context ctx = basic();
    status exact;
    if (!expect(math().quantize(d("2.17"), d("0.001"), ctx, exact), "2.170", "pad") ||
        !expect(math().quantize(d("2.17"), d("0.01"), ctx, exact), "2.17", "same exponent") ||
        !expect(math().quantize(d("0"), d("1E+5"), ctx, exact), "0E+5", "zero") ||
        !expect(math().quantize(d("217"), d("1E-1"), ctx, exact), "217.0", "pad integer") ||
        !expect(math().quantize(d("-Inf"), d("Infinity"), ctx, exact), "-Infinity", "infinities")) {
        return false;
    }
    if (!expect_flags(exact, flags::none, "exact quantize")) {
        return false;
    }
    status rounded;
    if (!expect(math().quantize(d("2.17"), d("0.1"), ctx, rounded), "2.2", "round up") ||
        !expect(math().quantize(d("2.17"), d("1E+0"), ctx, rounded), "2", "to units") ||
        !expect(math().quantize(d("2.17"), d("1E+1"), ctx, rounded), "0E+1", "to tens") ||
        !expect(math().quantize(d("-0.1"), d("1"), ctx, rounded), "-0", "negative to zero") ||
        !expect(math().quantize(d("217"), d("1E+1"), ctx, rounded), "2.2E+2", "integer to tens") ||
        !expect(math().quantize(d("217"), d("1E+2"), ctx, rounded), "2E+2", "integer to hundreds")) {
        return false;
    }
    if (!expect_flags(rounded, flags::inexact | flags::rounded, "rounded quantize")) {
        return false;
    }
    status too_long;
    if (!math().quantize(d("1"), d("1E-9"), ctx, too_long).is_nan() ||
        !expect_flags(too_long, flags::invalid, "coefficient wider than precision")) {
        return false;
    }
    status mixed;
    if (!math().quantize(d("Inf"), d("1"), ctx, mixed).is_nan() ||
        !expect_flags(mixed, flags::invalid, "infinity against finite")) {
        return false;
    }
    status exponent_range;
    if (!math().quantize(d("1"), d("1E+1000000000"), ctx, exponent_range).is_nan() ||
        !exponent_range.has(flags::invalid)) {
        std::cerr << "target exponent out of range accepted\n";
        return false;
    }
    return true;
}

// Sixteen digits, exponents within +/-384 and fold-down of large exponents.
context clamped_decimal64() {
    return context{}
        .with_precision(16)
        .with_exponent_range(bigint(-384), bigint(384))
        .with_clamp_normal_exponents(true);
}

bool test_quantize_above_clamped_top() {
    for (const bool simplified : {false, true}) {
        const context ctx = clamped_decimal64().with_simplified(simplified);
        status vanishing;
        if (!expect(math().quantize(d("1"), d("1E+380"), ctx, vanishing), "0E+369",
                    "nonzero rounded away and folded") ||
            !expect_flags(vanishing, flags::inexact | flags::rounded | flags::clamped,
                          "nonzero rounded away and folded")) {
            return false;
        }
        status zero;
        if (!expect(math().quantize(d("0"), d("1E+380"), ctx, zero), "0E+369", "zero folded") ||
            !expect_flags(zero, flags::clamped, "zero folded")) {
            return false;
        }
        status kept;
        if (!expect(math().quantize(d("1.2E+371"), d("1E+370"), ctx, kept), "1.20E+371",
                    "coefficient padded by the fold") ||
            !expect_flags(kept, flags::clamped, "coefficient padded by the fold")) {
            return false;
        }
        status above;
        if (!math().quantize(d("1"), d("1E+385"), ctx, above).is_nan() ||
            !expect_flags(above, flags::invalid, "target exponent above emax")) {
            return false;
        }
    }
    return true;
}

bool test_reduce() {
    const context ctx = basic();
    status st;
    if (!expect(math().reduce(d("2.1"), ctx, st), "2.1", "reduce nothing") ||
        !expect(math().reduce(d("-2.0"), ctx, st), "-2", "reduce fraction zero") ||
        !expect(math().reduce(d("1.200"), ctx, st), "1.2", "reduce trailing zeros") ||
        !expect(math().reduce(d("-120"), ctx, st), "-1.2E+2", "reduce integer") ||
        !expect(math().reduce(d("120.00"), ctx, st), "1.2E+2", "reduce mixed") ||
        !expect(math().reduce(d("0.00"), ctx, st), "0", "reduce zero")) {
        return false;
    }
    return expect_flags(st, flags::none, "reduce");
}

bool test_round_to_precision() {
    status st;
    const context five = basic().with_precision(5);
    if (!expect(math().round_to_precision(d("1.23456789"), five, st), "1.2346", "five digits") ||
        !expect_flags(st, flags::inexact | flags::rounded, "five digits")) {
        return false;
    }
    status shortened;
    if (!expect(math().round_to_precision(d("1.2300000"), five, shortened), "1.2300",
                "trailing zeros dropped") ||
        !expect_flags(shortened, flags::rounded, "trailing zeros dropped")) {
        return false;
    }
    status bits;
    if (!expect(math().round_to_binary_precision(d("12345"), basic().with_precision(10), bits),
                "1.23E+4", "ten-bit coefficient") ||
        !expect_flags(bits, flags::inexact | flags::rounded, "ten-bit coefficient")) {
        return false;
    }
    const rmath::bigfloat_math binary;
    status binary_bits;
    const bigfloat rounded = binary.round_to_binary_precision(
        bigfloat::finite(false, bigint(255), bigint(0)), context{}.with_precision(4), binary_bits);
    if (rounded.mantissa() != bigint(8) || rounded.exponent() != bigint(5)) {
        std::cerr << "binary rounding of 255 to four bits failed: " << rmath::io::to_string(rounded)
                  << "\n";
        return false;
    }
    status conversion;
    const decimal signaling =
        math().round_after_conversion(decimal::signaling_nan(bigint(3)), basic(), conversion);
    if (!signaling.is_signaling_nan() || !expect_flags(conversion, flags::none, "converted sNaN")) {
        std::cerr << "conversion rounding must keep a signaling NaN\n";
        return false;
    }
    status converted;
    if (!expect(math().round_after_conversion(d("0.1000000000000000055511151231257827"), basic(),
                                              converted),
                "0.100000000", "conversion rounding")) {
        return false;
    }
    return true;
}

bool test_round_to_exponent() {
    const context ctx = basic();
    status simple;
    if (!expect(math().round_to_exponent_simple(d("2.17"), bigint(-1), ctx, simple), "2.2",
                "simple rounds") ||
        !expect_flags(simple, flags::inexact | flags::rounded, "simple rounds")) {
        return false;
    }
    status kept;
    if (!expect(math().round_to_exponent_simple(d("2.1"), bigint(-3), ctx, kept), "2.1",
                "simple never pads")) {
        return false;
    }
    status exact;
    if (!math().round_to_exponent_exact(d("2.17"), bigint(-1), ctx, exact).is_nan() ||
        !expect_flags(exact, flags::invalid, "exact rejects lost digits")) {
        return false;
    }
    status exact_ok;
    if (!expect(math().round_to_exponent_exact(d("2.10"), bigint(-1), ctx, exact_ok), "2.1",
                "exact drops a zero") ||
        !expect_flags(exact_ok, flags::rounded, "exact drops a zero")) {
        return false;
    }
    status quiet;
    if (!expect(math().round_to_exponent_no_rounded_flag(d("2.10"), bigint(-1), ctx, quiet), "2.1",
                "no rounded flag") ||
        !expect_flags(quiet, flags::none, "no rounded flag")) {
        return false;
    }
    status lossy;
    if (!expect(math().round_to_exponent_no_rounded_flag(d("2.15"), bigint(-1), ctx, lossy), "2.2",
                "no rounded flag when inexact") ||
        !expect_flags(lossy, flags::inexact | flags::rounded, "no rounded flag when inexact")) {
        return false;
    }
    if (!expect(math().round_to_exponent_simple(d("2.5"), bigint(0),
                                                ctx.with_rounding(rounding::half_even), simple),
                "2", "half even to units")) {
        return false;
    }
    return true;
}

bool test_sign_rounding() {
    const context ctx = basic();
    status st;
    if (!expect(math().plus(d("1.23456789012"), ctx, st), "1.23456789", "plus rounds") ||
        !expect(math().abs(d("-0"), ctx, st), "0", "abs of negative zero") ||
        !expect(math().plus(d("-0"), ctx.with_rounding(rounding::floor), st), "-0",
                "plus keeps negative zero under floor")) {
        return false;
    }
    return true;
}

bool test_navigation() {
    const context ctx = basic().with_rounding(rounding::half_even);
    status st;
    if (!expect(math().next_plus(d("1"), ctx, st), "1.00000001", "next plus") ||
        !expect(math().next_minus(d("1"), ctx, st), "0.999999999", "next minus") ||
        !expect(math().next_plus(d("-1.00000003"), ctx, st), "-1.00000002", "next plus negative") ||
        !expect(math().next_minus(d("0"), ctx, st), "-1E-1000000007", "next minus zero") ||
        !expect(math().next_plus(d("-Infinity"), ctx, st), "-9.99999999E+999999999",
                "next plus from -Infinity") ||
        !expect(math().next_plus(d("Infinity"), ctx, st), "Infinity", "next plus Infinity") ||
        !expect(math().next_plus(d("9.99999999E+999999999"), ctx, st), "Infinity",
                "next plus largest finite")) {
        return false;
    }
    if (!expect_flags(st, flags::none, "next plus and minus raise nothing")) {
        return false;
    }
    status toward;
    if (!expect(math().next_toward(d("1"), d("2"), ctx, toward), "1.00000001", "toward up") ||
        !expect(math().next_toward(d("1"), d("0"), ctx, toward), "0.999999999", "toward down") ||
        !expect(math().next_toward(d("0"), d("-0"), ctx, toward), "-0", "toward equal takes sign")) {
        return false;
    }
    if (!expect_flags(toward, flags::none, "toward normal values")) {
        return false;
    }
    status subnormal;
    (void)math().next_toward(d("0"), d("1"), ctx, subnormal);
    if (!subnormal.has(flags::underflow) || !subnormal.has(flags::subnormal)) {
        std::cerr << "stepping into the subnormal range must flag underflow\n";
        return false;
    }
    for (const bool simplified : {false, true}) {
        const context narrow = context{}
                                   .with_precision(2)
                                   .with_exponent_range(bigint(-5), bigint(6))
                                   .with_simplified(simplified);
        const context folded = context{}
                                   .with_precision(2)
                                   .with_exponent_range(bigint(-12), bigint(12))
                                   .with_clamp_normal_exponents(true)
                                   .with_simplified(simplified);
        status below_tiny;
        if (!expect(math().next_plus(d("-6370E-18"), narrow, below_tiny), "-0.000000",
                    "next plus below the smallest subnormal") ||
            !expect(math().next_minus(d("9E-18"), folded, below_tiny), "0E-13",
                    "next minus below the smallest subnormal") ||
            !expect(math().next_plus(d("0E-20"), narrow, below_tiny), "0.000001",
                    "next plus from a zero below the smallest subnormal")) {
            return false;
        }
    }
    status unbounded;
    if (!math().next_plus(d("1"), context::unlimited(), unbounded).is_nan() ||
        !expect_flags(unbounded, flags::invalid, "next plus without precision")) {
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_quantize()) {
        return 1;
    }
    if (!test_quantize_above_clamped_top()) {
        return 1;
    }
    if (!test_reduce()) {
        return 1;
    }
    if (!test_round_to_precision()) {
        return 1;
    }
    if (!test_round_to_exponent()) {
        return 1;
    }
    if (!test_sign_rounding()) {
        return 1;
    }
    if (!test_navigation()) {
        return 1;
    }
    std::cout << "rounding passed\n";
    return 0;
}
