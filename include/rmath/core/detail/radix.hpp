// include/rmath/core/detail/radix.hpp — Radix powers and digit-level helpers over bigint magnitudes.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include <rmath/core/bigint.hpp>

namespace rmath::core::detail {

    inline constexpr std::size_t RADIX_POWER_CACHE = 1024;

    inline void check_radix(int radix) {
        if (radix < 2 || radix > 1 << 16) {
            throw std::invalid_argument("radix must lie in 2..65536");
        }
    }

    // radix^exponent, memoised per thread for small exponents.
    inline bigint radix_power(int radix, std::size_t exponent) {
        thread_local std::vector<std::pair<int, std::vector<bigint>>> caches;
        if (radix == 2) {
            return bigint::one() << exponent;
        }
        if (exponent >= RADIX_POWER_CACHE) {
            check_radix(radix);
            return bigint::pow(bigint(radix), exponent);
        }
        std::vector<bigint> *powers = nullptr;
        for (auto &[cached_radix, table] : caches) {
            if (cached_radix == radix) {
                powers = &table;
                break;
            }
        }
        if (powers == nullptr) {
            check_radix(radix);
            caches.emplace_back(radix, std::vector<bigint>{bigint::one()});
            powers = &caches.back().second;
        }
        while (powers->size() <= exponent) {
            powers->push_back(powers->back() * bigint(radix));
        }
        return (*powers)[exponent];
    }

    inline std::size_t to_size(const bigint &value) {
        if (value.is_negative() || !value.fits<std::size_t>()) {
            throw std::overflow_error("digit count exceeds the addressable range");
        }
        return static_cast<std::size_t>(value);
    }

    inline bigint scale_up(const bigint &magnitude, int radix, std::size_t count) {
        if (count == 0 || magnitude.is_zero()) {
            return magnitude;
        }
        if (radix == 2) {
            return magnitude << count;
        }
        return magnitude * radix_power(radix, count);
    }

    // Number of radix digits in a magnitude; zero has one digit.
    inline std::size_t digit_count(const bigint &magnitude, int radix) {
        if (magnitude.is_zero()) {
            return 1;
        }
        const std::size_t bits = magnitude.bit_length();
        if (radix == 2) {
            return bits;
        }
        const double per_digit = std::log2(static_cast<double>(radix));
        std::size_t estimate =
            static_cast<std::size_t>(static_cast<double>(bits - 1) / per_digit) + 1;
        if (estimate == 0) {
            estimate = 1;
        }
        const bigint value = magnitude.abs();
        while (estimate > 1 && radix_power(radix, estimate - 1) > value) {
            --estimate;
        }
        while (radix_power(radix, estimate) <= value) {
            ++estimate;
        }
        return estimate;
    }

    // Splits off the lowest `count` digits: {magnitude / radix^count, magnitude % radix^count}.
    inline std::pair<bigint, bigint> split_low_digits(const bigint &magnitude, int radix,
                                                      std::size_t count) {
        if (count == 0) {
            return {magnitude, bigint::zero()};
        }
        if (radix == 2) {
            const bigint high = magnitude >> count;
            return {high, magnitude - (high << count)};
        }
        return bigint::div_mod(magnitude, radix_power(radix, count));
    }

    inline std::uint64_t lowest_digit(const bigint &magnitude, int radix) {
        return magnitude.mod_small(static_cast<std::uint64_t>(radix));
    }

    inline std::size_t trailing_zero_digits(const bigint &magnitude, int radix) {
        if (magnitude.is_zero()) {
            return 0;
        }
        if (radix == 2) {
            return magnitude.trailing_zero_bits();
        }
        std::size_t count = 0;
        bigint cursor = magnitude;
        while (true) {
            auto [quotient, remainder] = cursor.div_mod_small(static_cast<std::uint64_t>(radix));
            if (remainder != 0) {
                return count;
            }
            cursor = std::move(quotient);
            ++count;
        }
    }

    // Removes up to `limit` trailing zero digits; returns the number removed.
    inline std::size_t strip_trailing_zeros(bigint &magnitude, int radix, std::size_t limit) {
        if (magnitude.is_zero() || limit == 0) {
            return 0;
        }
        if (radix == 2) {
            const std::size_t zeros = std::min(magnitude.trailing_zero_bits(), limit);
            magnitude = magnitude >> zeros;
            return zeros;
        }
        std::size_t count = 0;
        while (count < limit) {
            auto [quotient, remainder] =
                magnitude.div_mod_small(static_cast<std::uint64_t>(radix));
            if (remainder != 0) {
                break;
            }
            magnitude = std::move(quotient);
            ++count;
        }
        return count;
    }

} // namespace rmath::core::detail
