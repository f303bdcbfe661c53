// tests/unit/test_elementary.cpp — Unit tests for pi, square root, exponentials, logarithms and powers.

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

bool expect_invalid(const decimal& actual, const status& st, std::string_view label) {
    if (actual.is_quiet_nan() && st.has(flags::invalid)) {
        return true;
    }
    std::cerr << label << ": expected an invalid operation, got " << rmath::io::to_string(actual)
              << "\n";
    return false;
}

bool test_pi() {
    status st;
    if (!expect(math().pi(basic(), st), "3.14159265", "pi nine digits") ||
        !expect(math().pi(basic().with_precision(20), st), "3.1415926535897932385",
                "pi twenty digits")) {
        return false;
    }
    if (!st.has(flags::inexact) || !st.has(flags::rounded)) {
        std::cerr << "pi must be inexact\n";
        return false;
    }
    if (!expect(math().pi(basic().with_precision(5).with_rounding(rounding::down), st), "3.1415",
                "pi rounded down")) {
        return false;
    }
    status unlimited;
    if (!expect_invalid(math().pi(context::unlimited(), unlimited), unlimited,
                        "pi without precision")) {
        return false;
    }
    const rmath::bigfloat_math binary;
    status binary_status;
    const bigfloat binary_pi = binary.pi(context::binary64(), binary_status);
    if (rmath::to_double(binary_pi) != 3.141592653589793) {
        std::cerr << "binary64 pi mismatch\n";
        return false;
    }
    return true;
}

bool test_square_root() {
    const context ctx = basic();
    status st;
    if (!expect(math().square_root(d("0"), ctx, st), "0", "sqrt zero") ||
        !expect(math().square_root(d("-0"), ctx, st), "-0", "sqrt negative zero") ||
        !expect(math().square_root(d("100"), ctx, st), "10", "sqrt exact") ||
        !expect(math().square_root(d("1.00"), ctx, st), "1.0", "sqrt ideal exponent") ||
        !expect(math().square_root(d("0.0400"), ctx, st), "0.20", "sqrt exact fraction") ||
        !expect(math().square_root(d("Infinity"), ctx, st), "Infinity", "sqrt infinity")) {
        return false;
    }
    if (st.value() != flags::none) {
        std::cerr << "exact square roots raised " << rmath::to_string(st.value()) << "\n";
        return false;
    }
    status rounded;
    if (!expect(math().square_root(d("0.39"), ctx, rounded), "0.624499800", "sqrt 0.39") ||
        !expect(math().square_root(d("7"), ctx, rounded), "2.64575131", "sqrt 7")) {
        return false;
    }
    status negative;
    if (!expect_invalid(math().square_root(d("-1"), ctx, negative), negative, "sqrt -1")) {
        return false;
    }
    status unbounded;
    if (!expect(math().square_root(d("16"), context::unlimited(), unbounded), "4",
                "exact root without precision") ||
        !expect_invalid(math().square_root(d("2"), context::unlimited(), unbounded), unbounded,
                        "irrational root without precision")) {
        return false;
    }
    return true;
}

bool test_exp() {
    const context ctx = basic();
    status st;
    if (!expect(math().exp(d("1"), ctx, st), "2.71828183", "exp 1") ||
        !expect(math().exp(d("2"), ctx, st), "7.38905610", "exp 2") ||
        !expect(math().exp(d("-1"), ctx, st), "0.367879441", "exp -1")) {
        return false;
    }
    status exact;
    if (!expect(math().exp(d("0"), ctx, exact), "1", "exp 0") ||
        !expect(math().exp(d("-Infinity"), ctx, exact), "0", "exp -Infinity") ||
        !expect(math().exp(d("Infinity"), ctx, exact), "Infinity", "exp Infinity")) {
        return false;
    }
    if (exact.value() != flags::none) {
        std::cerr << "exact exponentials raised " << rmath::to_string(exact.value()) << "\n";
        return false;
    }
    const context folded = context{}
                               .with_precision(16)
                               .with_exponent_range(rmath::core::bigint(-12), rmath::core::bigint(12))
                               .with_clamp_normal_exponents(true);
    status exact_folded;
    if (!expect(math().exp(d("-Infinity"), folded, exact_folded), "0",
                "exp -Infinity is exact under fold-down") ||
        !expect(math().exp(d("0"), folded, exact_folded), "1", "exp 0 is exact under fold-down")) {
        return false;
    }
    if (exact_folded.value() != flags::none) {
        std::cerr << "exact exponentials under fold-down raised "
                  << rmath::to_string(exact_folded.value()) << "\n";
        return false;
    }
    status overflow;
    if (!expect(math().exp(d("1E+11"), ctx, overflow), "Infinity", "exp overflow") ||
        !overflow.has(flags::overflow)) {
        return false;
    }
    status underflow;
    const decimal tiny = math().exp(d("-1E+11"), ctx, underflow);
    if (!tiny.is_zero() || !underflow.has(flags::underflow)) {
        std::cerr << "exp of a large negative value must underflow to zero\n";
        return false;
    }
    return true;
}

bool test_logarithms() {
    const context ctx = basic();
    status st;
    if (!expect(math().ln(d("10"), ctx, st), "2.30258509", "ln 10") ||
        !expect(math().ln(d("2"), ctx, st), "0.693147181", "ln 2") ||
        !expect(math().ln(d("0"), ctx, st), "-Infinity", "ln 0") ||
        !expect(math().ln(d("1"), ctx, st), "0", "ln 1") ||
        !expect(math().ln(d("Infinity"), ctx, st), "Infinity", "ln Infinity")) {
        return false;
    }
    status negative;
    if (!expect_invalid(math().ln(d("-1"), ctx, negative), negative, "ln -1")) {
        return false;
    }
    status exact;
    if (!expect(math().log10(d("100"), ctx, exact), "2", "log10 100") ||
        !expect(math().log10(d("0.001"), ctx, exact), "-3", "log10 0.001") ||
        !expect(math().log10(d("1"), ctx, exact), "0", "log10 1")) {
        return false;
    }
    if (exact.value() != flags::none) {
        std::cerr << "exact powers of ten raised " << rmath::to_string(exact.value()) << "\n";
        return false;
    }
    if (!expect(math().log10(d("2"), ctx, st), "0.301029996", "log10 2") ||
        !expect(math().log10(d("0"), ctx, st), "-Infinity", "log10 0")) {
        return false;
    }
    // Exact powers of ten need no precision at all.
    if (!expect(math().log10(d("1E+7")), "7", "log10 without context")) {
        return false;
    }
    status negative_log;
    if (!expect_invalid(math().log10(d("-2"), ctx, negative_log), negative_log, "log10 -2")) {
        return false;
    }
    return true;
}

bool test_power() {
    const context ctx = basic();
    status st;
    if (!expect(math().power(d("2"), d("10"), ctx, st), "1024", "2^10") ||
        !expect(math().power(d("2"), d("-2"), ctx, st), "0.25", "2^-2") ||
        !expect(math().power(d("-2"), d("3"), ctx, st), "-8", "(-2)^3") ||
        !expect(math().power(d("7"), d("0"), ctx, st), "1", "x^0")) {
        return false;
    }
    status irrational;
    if (!expect(math().power(d("2"), d("0.5"), ctx, irrational), "1.41421356", "2^0.5") ||
        !irrational.has(flags::inexact)) {
        return false;
    }
    status root;
    if (math().compare(math().power(d("4"), d("0.5"), ctx, root), d("2")) != 0) {
        std::cerr << "4^0.5 must equal 2\n";
        return false;
    }
    status zero_zero;
    if (!expect_invalid(math().power(d("0"), d("0"), ctx, zero_zero), zero_zero, "0^0")) {
        return false;
    }
    status negative_base;
    if (!expect_invalid(math().power(d("-2"), d("0.5"), ctx, negative_base), negative_base,
                        "negative base with fraction")) {
        return false;
    }
    status infinite;
    if (!expect(math().power(d("0"), d("-1"), ctx, infinite), "Infinity", "0^-1") ||
        !expect(math().power(d("2"), d("-Infinity"), ctx, infinite), "0", "2^-Infinity") ||
        !expect(math().power(d("0.5"), d("Infinity"), ctx, infinite), "0", "0.5^Infinity") ||
        !expect(math().power(d("-Infinity"), d("3"), ctx, infinite), "-Infinity", "(-inf)^3")) {
        return false;
    }
    // Integral powers need no precision when the result is exact.
    if (!expect(math().power(d("3"), d("4")), "81", "power without context")) {
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_pi()) {
        return 1;
    }
    if (!test_square_root()) {
        return 1;
    }
    if (!test_exp()) {
        return 1;
    }
    if (!test_logarithms()) {
        return 1;
    }
    if (!test_power()) {
        return 1;
    }
    std::cout << "elementary passed\n";
    return 0;
}
