// tests/unit/test_bigint_ops.cpp — Unit tests for bigint arithmetic, roots and text conversion.

#include <rmath/rmathlib.hpp>

#include <compare>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using rmath::core::bigint;

bool check_equal(const bigint& lhs, const bigint& rhs, std::string_view label) {
    if (lhs == rhs) {
        return true;
    }
    std::cerr << label << " mismatch: " << rmath::io::to_string(lhs)
              << " != " << rmath::io::to_string(rhs) << "\n";
    return false;
}

bool test_string_roundtrip(std::mt19937_64& rng) {
    const std::vector<int> bases = {2, 3, 7, 10, 16, 36};
    for (int base : bases) {
        for (int iteration = 0; iteration < 16; ++iteration) {
            const bigint original = rmath::util::random_bigint(rng, 200);
            const std::string text = rmath::io::to_string(original, base);
            const auto parsed = rmath::io::from_string<bigint>(text, base);
            if (!check_equal(original, parsed, "string roundtrip")) {
                return false;
            }
        }
    }
    if (rmath::io::to_string(bigint(-255), 16) != "-ff") {
        std::cerr << "hex rendering mismatch\n";
        return false;
    }
    const bigint big = rmath::io::from_string<bigint>("123456789012345678901234567890");
    if (rmath::io::to_string(big) != "123456789012345678901234567890") {
        std::cerr << "long decimal rendering mismatch\n";
        return false;
    }
    try {
        (void)rmath::io::from_string<bigint>("12x4");
        std::cerr << "invalid digit accepted\n";
        return false;
    } catch (const std::invalid_argument&) {
    }
    return true;
}

bool test_add_sub_properties(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 64; ++iteration) {
        const bigint a = rmath::util::random_bigint(rng, 190);
        const bigint b = rmath::util::random_bigint(rng, 70);
        const bigint sum = a + b;
        if (!check_equal(sum - b, a, "addition identity")) {
            return false;
        }
        if (!check_equal((a - b) + b, a, "subtraction identity")) {
            return false;
        }
    }
    return true;
}

bool test_wide_multiplication(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 8; ++iteration) {
        const bigint a = rmath::util::random_bigint(rng, 5000);
        const bigint b = rmath::util::random_bigint(rng, 3000);
        const bigint c = rmath::util::random_bigint(rng, 900);
        if (b.is_zero()) {
            continue;
        }
        const bigint product = a * b;
        if (!check_equal(product, b * a, "commutativity") ||
            !check_equal(a * (b + c), product + a * c, "distributivity") ||
            !check_equal(product / b, a, "quotient of product") ||
            !check_equal(product % b, bigint::zero(), "remainder of product")) {
            return false;
        }
    }
    // All-ones limbs carry through every column.
    const bigint ones = (bigint::one() << 4096) - bigint::one();
    return check_equal(ones * ones,
                       (bigint::one() << 8192) - (bigint::one() << 4097) + bigint::one(),
                       "square of 2^4096 - 1");
}

bool test_div_mod(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 64; ++iteration) {
        const bigint dividend = rmath::util::random_bigint(rng, 300);
        bigint divisor = rmath::util::random_bigint(rng, 120);
        if (divisor.is_zero()) {
            divisor = bigint(7);
        }
        const auto [quotient, remainder] = bigint::div_mod(dividend, divisor);
        if (!check_equal(quotient * divisor + remainder, dividend, "div_mod reconstruction")) {
            return false;
        }
        if (remainder.compare_magnitude(divisor) != std::strong_ordering::less) {
            std::cerr << "remainder not below divisor\n";
            return false;
        }
        if (!remainder.is_zero() && remainder.is_negative() != dividend.is_negative()) {
            std::cerr << "remainder sign does not follow the dividend\n";
            return false;
        }
    }
    const auto [q, r] = bigint::div_mod(bigint(-7), bigint(2));
    return check_equal(q, bigint(-3), "truncating quotient") &&
           check_equal(r, bigint(-1), "truncating remainder");
}

bool test_small_division(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const bigint value = rmath::util::random_bigint(rng, 256, false);
        const auto [quotient, remainder] = value.div_mod_small(1'000'000'007ULL);
        if (!check_equal(quotient * bigint(1'000'000'007ULL) + bigint(remainder), value,
                         "div_mod_small")) {
            return false;
        }
        if (value.mod_small(1'000'000'007ULL) != remainder) {
            std::cerr << "mod_small disagrees with div_mod_small\n";
            return false;
        }
    }
    return true;
}

bool test_shifts() {
    const bigint one = bigint::one();
    const bigint big = one << 200;
    if (big.bit_length() != 201 || big.trailing_zero_bits() != 200) {
        std::cerr << "shift bit accounting failed\n";
        return false;
    }
    if (!check_equal(big >> 199, bigint(2), "right shift")) {
        return false;
    }
    return check_equal((bigint(-5) << 3), bigint(-40), "signed left shift");
}

bool test_number_theory() {
    if (!check_equal(bigint::gcd(bigint(84), bigint(-36)), bigint(12), "gcd")) {
        return false;
    }
    if (!check_equal(bigint::pow(bigint(10), 30),
                     rmath::io::from_string<bigint>("1000000000000000000000000000000"), "pow")) {
        return false;
    }
    if (!check_equal(bigint::iroot(bigint(1000001), 3), bigint(100), "cube root floor")) {
        return false;
    }
    if (!check_equal(bigint::isqrt(bigint(99)), bigint(9), "isqrt floor")) {
        return false;
    }
    const bigint square = bigint::pow(bigint(12345678901LL), 2);
    if (!check_equal(bigint::isqrt(square), bigint(12345678901LL), "isqrt exact")) {
        return false;
    }
    const bigint cube = bigint::pow(bigint(987654321), 3);
    if (!check_equal(bigint::iroot(cube, 3), bigint(987654321), "iroot exact")) {
        return false;
    }
    if (!check_equal(bigint::iroot(cube - bigint(1), 3), bigint(987654320), "iroot floor")) {
        return false;
    }
    try {
        (void)bigint::isqrt(bigint(-1));
        std::cerr << "isqrt accepted a negative value\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

bool test_integral_conversions() {
    const bigint max64(INT64_MAX);
    if (!max64.fits<std::int64_t>() || (max64 + bigint(1)).fits<std::int64_t>()) {
        std::cerr << "int64 range check failed\n";
        return false;
    }
    if (!bigint(INT64_MIN).fits<std::int64_t>()) {
        std::cerr << "int64 minimum rejected\n";
        return false;
    }
    if (static_cast<std::int64_t>(bigint(-123456789)) != -123456789) {
        std::cerr << "int64 conversion failed\n";
        return false;
    }
    const auto wide = (static_cast<unsigned __int128>(1) << 100) + 3;
    const bigint from_wide = bigint::from_uint128(wide);
    if (!from_wide.fits_uint128() || from_wide.magnitude_uint128() != wide) {
        std::cerr << "uint128 roundtrip failed\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0x5eed1234ULL);
    if (!test_string_roundtrip(rng)) {
        return 1;
    }
    if (!test_add_sub_properties(rng)) {
        return 1;
    }
    if (!test_div_mod(rng)) {
        return 1;
    }
    if (!test_small_division(rng)) {
        return 1;
    }
    if (!test_wide_multiplication(rng)) {
        return 1;
    }
    if (!test_shifts()) {
        return 1;
    }
    if (!test_number_theory()) {
        return 1;
    }
    if (!test_integral_conversions()) {
        return 1;
    }
    std::cout << "bigint_ops passed\n";
    return 0;
}
