// include/rmath/util/random.hpp — Random bigints and numbers for tests and benchmarks.

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>

#include <rmath/core/bigint.hpp>
#include <rmath/core/number.hpp>

namespace rmath::util {

// Uniform magnitude below 2^bits, negated with probability one half when allowed.
inline core::bigint random_bigint(std::mt19937_64& generator, std::size_t bits,
                                  bool allow_negative = true) {
    if (bits == 0) {
        return core::bigint::zero();
    }
    core::bigint value;
    std::size_t produced = 0;
    while (produced < bits) {
        const std::size_t take = bits - produced < 64 ? bits - produced : 64;
        std::uint64_t word = generator();
        if (take < 64) {
            word &= (std::uint64_t{1} << take) - 1;
        }
        value = (value << take) + core::bigint(word);
        produced += take;
    }
    if (allow_negative) {
        std::bernoulli_distribution sign_dist(0.5);
        if (sign_dist(generator) && !value.is_zero()) {
            value = -value;
        }
    }
    return value;
}

// Finite number with a mantissa below radix^max_digits and an exponent in
// [-exponent_span, exponent_span].
template <int Radix>
core::basic_number<Radix> random_number(std::mt19937_64& generator, std::size_t max_digits,
                                        std::int64_t exponent_span) {
    std::uniform_int_distribution<std::size_t> digit_dist(1, max_digits);
    const std::size_t digits = digit_dist(generator);
    core::bigint mantissa;
    std::uniform_int_distribution<int> radix_digit(0, Radix - 1);
    for (std::size_t index = 0; index < digits; ++index) {
        mantissa = mantissa * core::bigint(Radix) + core::bigint(radix_digit(generator));
    }
    std::uniform_int_distribution<std::int64_t> exponent_dist(-exponent_span, exponent_span);
    std::bernoulli_distribution sign_dist(0.5);
    return core::basic_number<Radix>::finite(sign_dist(generator), std::move(mantissa),
                                             core::bigint(exponent_dist(generator)));
}

// Like random_number, but an occasional zero, infinity or NaN as well.
template <int Radix>
core::basic_number<Radix> random_operand(std::mt19937_64& generator, std::size_t max_digits,
                                         std::int64_t exponent_span) {
    std::uniform_int_distribution<int> pick(0, 19);
    std::bernoulli_distribution sign_dist(0.5);
    switch (pick(generator)) {
        case 0:
            return core::basic_number<Radix>::zero(sign_dist(generator));
        case 1:
            return core::basic_number<Radix>::infinity(sign_dist(generator));
        case 2:
            return core::basic_number<Radix>::nan();
        default:
            return random_number<Radix>(generator, max_digits, exponent_span);
    }
}

} // namespace rmath::util
