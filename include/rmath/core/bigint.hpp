// include/rmath/core/bigint.hpp — Sign-magnitude arbitrary-precision integer for mantissas and exponents.

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace rmath::core {

namespace detail {
#if !defined(__SIZEOF_INT128__)
#error "rmath::core::bigint requires __int128 support"
#endif

using limb = std::uint64_t;
using limb_int128 = __int128_t;
using limb_uint128 = unsigned __int128;

inline constexpr int LIMB_BITS = 64;
} // namespace detail

class bigint {
public:
    using limb = detail::limb;

    bigint() noexcept = default;
    bigint(const bigint&) = default;
    bigint(bigint&&) noexcept = default;
    bigint& operator=(const bigint&) = default;
    bigint& operator=(bigint&&) noexcept = default;

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    bigint(Int value) {
        if (value == 0) {
            return;
        }
        detail::limb_uint128 magnitude = 0;
        if constexpr (std::is_signed_v<Int>) {
            negative_ = (value < 0);
            const detail::limb_int128 wide = static_cast<detail::limb_int128>(value);
            magnitude = negative_ ? static_cast<detail::limb_uint128>(-wide)
                                  : static_cast<detail::limb_uint128>(wide);
        } else {
            magnitude = static_cast<detail::limb_uint128>(value);
        }
        while (magnitude != 0) {
            limbs_.push_back(static_cast<limb>(magnitude));
            magnitude >>= detail::LIMB_BITS;
        }
    }

    static bigint zero() noexcept { return {}; }
    static bigint one() { return bigint(1); }

    static bigint from_uint128(detail::limb_uint128 magnitude, bool negative = false) {
        bigint result;
        while (magnitude != 0) {
            result.limbs_.push_back(static_cast<limb>(magnitude));
            magnitude >>= detail::LIMB_BITS;
        }
        result.negative_ = negative && !result.is_zero();
        return result;
    }

    bool is_zero() const noexcept { return limbs_.empty(); }
    bool is_negative() const noexcept { return negative_; }
    bool is_odd() const noexcept { return !limbs_.empty() && (limbs_[0] & 1U) != 0; }
    bool is_even() const noexcept { return !is_odd(); }
    int signum() const noexcept {
        if (is_zero()) {
            return 0;
        }
        return negative_ ? -1 : 1;
    }

    std::size_t bit_length() const noexcept {
        if (limbs_.empty()) {
            return 0;
        }
        return (limbs_.size() - 1) * detail::LIMB_BITS +
               static_cast<std::size_t>(detail::LIMB_BITS - std::countl_zero(limbs_.back()));
    }

    std::size_t trailing_zero_bits() const noexcept {
        std::size_t count = 0;
        for (const limb value : limbs_) {
            if (value != 0) {
                return count + static_cast<std::size_t>(std::countr_zero(value));
            }
            count += detail::LIMB_BITS;
        }
        return 0;
    }

    bool fits_uint128() const noexcept { return limbs_.size() <= 2; }

    // Magnitude as an unsigned 128-bit value; the caller checks fits_uint128().
    detail::limb_uint128 magnitude_uint128() const noexcept {
        detail::limb_uint128 value = 0;
        if (!limbs_.empty()) {
            value = limbs_[0];
        }
        if (limbs_.size() > 1) {
            value |= static_cast<detail::limb_uint128>(limbs_[1]) << detail::LIMB_BITS;
        }
        return value;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    bool fits() const noexcept {
        if (is_zero()) {
            return true;
        }
        if constexpr (std::is_unsigned_v<Int>) {
            if (negative_) {
                return false;
            }
        }
        if (limbs_.size() > 2) {
            return false;
        }
        const detail::limb_uint128 magnitude = magnitude_uint128();
        if (negative_) {
            const detail::limb_uint128 limit =
                static_cast<detail::limb_uint128>(-(static_cast<detail::limb_int128>(
                    std::numeric_limits<Int>::min())));
            return magnitude <= limit;
        }
        return magnitude <= static_cast<detail::limb_uint128>(std::numeric_limits<Int>::max());
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit operator Int() const {
        if (!fits<Int>()) {
            throw std::overflow_error("bigint does not fit in target type");
        }
        if (is_zero()) {
            return static_cast<Int>(0);
        }
        const detail::limb_uint128 magnitude = magnitude_uint128();
        if (negative_) {
            return static_cast<Int>(-static_cast<detail::limb_int128>(magnitude));
        }
        return static_cast<Int>(magnitude);
    }

    // Nearest double; saturates to +/-infinity for magnitudes beyond the double range.
    double to_double_approx() const noexcept {
        if (is_zero()) {
            return 0.0;
        }
        const std::size_t bits = bit_length();
        double value = 0.0;
        if (bits <= 128) {
            value = static_cast<double>(magnitude_uint128());
        } else {
            const std::size_t drop = bits - 64;
            const bigint top = abs() >> drop;
            value = std::ldexp(static_cast<double>(top.limbs_[0]),
                               static_cast<int>(std::min<std::size_t>(drop, 4096)));
        }
        return negative_ ? -value : value;
    }

    bigint abs() const noexcept {
        bigint copy = *this;
        copy.negative_ = false;
        return copy;
    }

    friend std::strong_ordering operator<=>(const bigint& lhs, const bigint& rhs) noexcept {
        return lhs.compare(rhs);
    }

    friend bool operator==(const bigint& lhs, const bigint& rhs) noexcept {
        return lhs.negative_ == rhs.negative_ && lhs.limbs_ == rhs.limbs_;
    }

    std::strong_ordering compare_magnitude(const bigint& other) const noexcept {
        return compare_magnitudes(limbs_, other.limbs_);
    }

    bigint& operator+=(const bigint& other) { return accumulate(other, other.negative_); }
    bigint& operator-=(const bigint& other) { return accumulate(other, !other.negative_); }

    bigint& operator*=(const bigint& other) {
        if (is_zero() || other.is_zero()) {
            limbs_.clear();
            negative_ = false;
            return *this;
        }
        limbs_ = multiply_magnitude(limbs_, other.limbs_);
        negative_ = negative_ != other.negative_;
        return *this;
    }

    bigint operator-() const {
        bigint result = *this;
        result.negative_ = !negative_ && !is_zero();
        return result;
    }

    bigint& operator/=(const bigint& other) {
        auto [quotient, remainder] = div_mod(*this, other);
        *this = std::move(quotient);
        return *this;
    }

    bigint& operator%=(const bigint& other) {
        auto [quotient, remainder] = div_mod(*this, other);
        *this = std::move(remainder);
        return *this;
    }

    friend bigint operator+(bigint lhs, const bigint& rhs) {
        lhs += rhs;
        return lhs;
    }
    friend bigint operator-(bigint lhs, const bigint& rhs) {
        lhs -= rhs;
        return lhs;
    }
    friend bigint operator*(bigint lhs, const bigint& rhs) {
        lhs *= rhs;
        return lhs;
    }
    friend bigint operator/(bigint lhs, const bigint& rhs) {
        lhs /= rhs;
        return lhs;
    }
    friend bigint operator%(bigint lhs, const bigint& rhs) {
        lhs %= rhs;
        return lhs;
    }

    // Shifts act on the magnitude; the sign is kept (so >> truncates toward zero).
    bigint operator<<(std::size_t count) const {
        if (is_zero() || count == 0) {
            return *this;
        }
        bigint result;
        result.limbs_ = shift_left_bits(limbs_, count);
        result.negative_ = negative_;
        result.normalize();
        return result;
    }

    bigint operator>>(std::size_t count) const {
        if (is_zero() || count == 0) {
            return *this;
        }
        bigint result;
        result.limbs_ = shift_right_bits(limbs_, count);
        result.negative_ = negative_;
        result.normalize();
        return result;
    }

    // Truncating division: the quotient rounds toward zero and the remainder
    // takes the sign of the dividend.
    static std::pair<bigint, bigint> div_mod(const bigint& dividend, const bigint& divisor) {
        if (divisor.is_zero()) {
            throw std::domain_error("division by zero");
        }
        if (dividend.is_zero()) {
            return {bigint::zero(), bigint::zero()};
        }
        bigint quotient;
        bigint remainder;
        if (dividend.compare_magnitude(divisor) == std::strong_ordering::less) {
            remainder = dividend;
            return {quotient, remainder};
        }
        auto [quotient_digits, remainder_digits] =
            divide_magnitude(dividend.limbs_, divisor.limbs_);
        quotient.limbs_ = std::move(quotient_digits);
        remainder.limbs_ = std::move(remainder_digits);
        quotient.normalize();
        remainder.normalize();
        quotient.negative_ =
            !quotient.is_zero() && (dividend.is_negative() != divisor.is_negative());
        remainder.negative_ = !remainder.is_zero() && dividend.is_negative();
        return {quotient, remainder};
    }

    // Single-limb division of the magnitude; returns the quotient (signed like
    // *this) and the magnitude of the remainder.
    std::pair<bigint, limb> div_mod_small(limb divisor) const {
        if (divisor == 0) {
            throw std::domain_error("division by zero");
        }
        bigint quotient;
        detail::limb_uint128 remainder = 0;
        quotient.limbs_.resize(limbs_.size());
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            const detail::limb_uint128 current =
                (remainder << detail::LIMB_BITS) | limbs_[index];
            quotient.limbs_[index] = static_cast<limb>(current / divisor);
            remainder = current % divisor;
        }
        quotient.normalize();
        quotient.negative_ = negative_ && !quotient.is_zero();
        return {quotient, static_cast<limb>(remainder)};
    }

    limb mod_small(limb divisor) const {
        if (divisor == 0) {
            throw std::domain_error("division by zero");
        }
        detail::limb_uint128 remainder = 0;
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            remainder = ((remainder << detail::LIMB_BITS) | limbs_[index]) % divisor;
        }
        return static_cast<limb>(remainder);
    }

    static bigint gcd(bigint lhs, bigint rhs) {
        lhs = lhs.abs();
        rhs = rhs.abs();
        while (!rhs.is_zero()) {
            bigint remainder = lhs % rhs;
            lhs = std::move(rhs);
            rhs = std::move(remainder);
        }
        return lhs;
    }

    static bigint pow(bigint base, std::uint64_t exponent) {
        bigint result = bigint::one();
        while (exponent != 0) {
            if ((exponent & 1U) != 0) {
                result *= base;
            }
            exponent >>= 1U;
            if (exponent != 0) {
                base *= base;
            }
        }
        return result;
    }

    // Floor of the square root of a non-negative value.
    static bigint isqrt(const bigint& value) {
        if (value.is_negative()) {
            throw std::domain_error("square root of a negative integer");
        }
        if (value.is_zero()) {
            return bigint::zero();
        }
        bigint estimate = bigint::one() << ((value.bit_length() + 1) / 2);
        while (true) {
            bigint next = (estimate + value / estimate) >> 1;
            if (next >= estimate) {
                return estimate;
            }
            estimate = std::move(next);
        }
    }

    // Floor of the k-th root of a non-negative value.
    static bigint iroot(const bigint& value, std::uint64_t k) {
        if (k == 0) {
            throw std::domain_error("zeroth root");
        }
        if (value.is_negative()) {
            throw std::domain_error("root of a negative integer");
        }
        if (value.is_zero() || k == 1) {
            return value;
        }
        const std::size_t bits = value.bit_length();
        if (k >= bits) {
            return bigint::one();
        }
        bigint estimate = bigint::one() << ((bits + k - 1) / k);
        const bigint k_value(k);
        const bigint k_minus_one(k - 1);
        while (true) {
            bigint next = (k_minus_one * estimate + value / pow(estimate, k - 1)) / k_value;
            if (next >= estimate) {
                return estimate;
            }
            estimate = std::move(next);
        }
    }

    bool test_bit(std::size_t bit) const noexcept {
        const std::size_t index = bit / detail::LIMB_BITS;
        if (index >= limbs_.size()) {
            return false;
        }
        return ((limbs_[index] >> (bit % detail::LIMB_BITS)) & 1U) != 0;
    }

private:
    using magnitude = std::vector<limb>;

    static constexpr std::size_t KARATSUBA_THRESHOLD = 32;

    // Adds |other| with the sign `other_negative` to *this.
    bigint& accumulate(const bigint& other, bool other_negative) {
        if (other.is_zero()) {
            return *this;
        }
        if (is_zero()) {
            limbs_ = other.limbs_;
            negative_ = other_negative;
            return *this;
        }
        if (negative_ == other_negative) {
            limbs_ = add_magnitude(limbs_, other.limbs_);
            return *this;
        }
        const auto order = compare_magnitudes(limbs_, other.limbs_);
        if (order == 0) {
            limbs_.clear();
            negative_ = false;
        } else if (order > 0) {
            limbs_ = subtract_magnitude(limbs_, other.limbs_);
        } else {
            limbs_ = subtract_magnitude(other.limbs_, limbs_);
            negative_ = other_negative;
        }
        return *this;
    }

    static void normalize_magnitude(magnitude& digits) {
        while (!digits.empty() && digits.back() == 0) {
            digits.pop_back();
        }
    }

    static std::strong_ordering compare_magnitudes(const magnitude& lhs,
                                                   const magnitude& rhs) noexcept {
        if (lhs.size() != rhs.size()) {
            return lhs.size() <=> rhs.size();
        }
        const auto [left, right] = std::mismatch(lhs.rbegin(), lhs.rend(), rhs.rbegin());
        if (left == lhs.rend()) {
            return std::strong_ordering::equal;
        }
        return *left <=> *right;
    }

    // target[0, n) += source[0, m) with m <= n; returns the carry out of the top limb.
    static limb add_in_place(limb* target, std::size_t n, const limb* source,
                             std::size_t m) noexcept {
        limb carry = 0;
        std::size_t index = 0;
        for (; index < m; ++index) {
            const detail::limb_uint128 sum =
                static_cast<detail::limb_uint128>(target[index]) + source[index] + carry;
            target[index] = static_cast<limb>(sum);
            carry = static_cast<limb>(sum >> detail::LIMB_BITS);
        }
        for (; carry != 0 && index < n; ++index) {
            carry = ++target[index] == 0 ? 1 : 0;
        }
        return carry;
    }

    // target[0, n) -= source[0, m) with m <= n; returns the borrow out of the top limb.
    static limb subtract_in_place(limb* target, std::size_t n, const limb* source,
                                  std::size_t m) noexcept {
        limb borrow = 0;
        std::size_t index = 0;
        for (; index < m; ++index) {
            const limb minuend = target[index];
            const limb partial = minuend - source[index];
            target[index] = partial - borrow;
            borrow = (minuend < source[index] || partial < borrow) ? 1 : 0;
        }
        for (; borrow != 0 && index < n; ++index) {
            borrow = target[index]-- == 0 ? 1 : 0;
        }
        return borrow;
    }

    // target[0, n) += source[0, n) * factor; returns the limb carried past target[n - 1].
    static limb add_product_row(limb* target, const limb* source, std::size_t n,
                                limb factor) noexcept {
        detail::limb_uint128 carry = 0;
        for (std::size_t index = 0; index < n; ++index) {
            const detail::limb_uint128 product =
                static_cast<detail::limb_uint128>(source[index]) * factor + target[index] + carry;
            target[index] = static_cast<limb>(product);
            carry = product >> detail::LIMB_BITS;
        }
        return static_cast<limb>(carry);
    }

    static magnitude shift_left_bits(const magnitude& digits, std::size_t count) {
        const std::size_t limb_shift = count / detail::LIMB_BITS;
        const unsigned bit_shift = static_cast<unsigned>(count % detail::LIMB_BITS);
        magnitude result(limb_shift, 0);
        result.reserve(limb_shift + digits.size() + 1);
        if (bit_shift == 0) {
            result.insert(result.end(), digits.begin(), digits.end());
            return result;
        }
        limb carry = 0;
        for (const limb value : digits) {
            result.push_back((value << bit_shift) | carry);
            carry = value >> (detail::LIMB_BITS - bit_shift);
        }
        if (carry != 0) {
            result.push_back(carry);
        }
        return result;
    }

    static magnitude shift_right_bits(const magnitude& digits, std::size_t count) {
        const std::size_t limb_shift = count / detail::LIMB_BITS;
        const unsigned bit_shift = static_cast<unsigned>(count % detail::LIMB_BITS);
        if (limb_shift >= digits.size()) {
            return {};
        }
        magnitude result(digits.begin() + static_cast<std::ptrdiff_t>(limb_shift),
                                 digits.end());
        if (bit_shift == 0) {
            return result;
        }
        for (std::size_t index = 0; index < result.size(); ++index) {
            limb value = result[index] >> bit_shift;
            if (index + 1 < result.size()) {
                value |= result[index + 1] << (detail::LIMB_BITS - bit_shift);
            }
            result[index] = value;
        }
        normalize_magnitude(result);
        return result;
    }

    static magnitude add_magnitude(const magnitude& lhs, const magnitude& rhs) {
        const bool lhs_longer = lhs.size() >= rhs.size();
        magnitude result = lhs_longer ? lhs : rhs;
        const magnitude& shorter = lhs_longer ? rhs : lhs;
        result.push_back(0);
        add_in_place(result.data(), result.size(), shorter.data(), shorter.size());
        normalize_magnitude(result);
        return result;
    }

    // Requires lhs >= rhs.
    static magnitude subtract_magnitude(const magnitude& lhs, const magnitude& rhs) {
        magnitude result = lhs;
        subtract_in_place(result.data(), result.size(), rhs.data(), rhs.size());
        normalize_magnitude(result);
        return result;
    }

    // Product of two limb ranges as exactly lhs_size + rhs_size limbs.
    static magnitude multiply_range(const limb* lhs, std::size_t lhs_size, const limb* rhs,
                                    std::size_t rhs_size) {
        magnitude result(lhs_size + rhs_size, 0);
        if (lhs_size == 0 || rhs_size == 0) {
            return result;
        }
        if (std::min(lhs_size, rhs_size) < KARATSUBA_THRESHOLD) {
            for (std::size_t row = 0; row < rhs_size; ++row) {
                result[lhs_size + row] =
                    add_product_row(result.data() + row, lhs, lhs_size, rhs[row]);
            }
            return result;
        }
        // (a1 B + a0)(b1 B + b0) = z2 B^2 + z1 B + z0 with
        // z1 = (a0 + a1)(b0 + b1) - z0 - z2.
        const std::size_t half = std::min(lhs_size, rhs_size) / 2;
        const std::size_t lhs_high = lhs_size - half;
        const std::size_t rhs_high = rhs_size - half;
        const magnitude z0 = multiply_range(lhs, half, rhs, half);
        const magnitude z2 = multiply_range(lhs + half, lhs_high, rhs + half, rhs_high);
        auto fold = [half](const limb* digits, std::size_t high) {
            magnitude sum(digits + half, digits + half + high);
            sum.push_back(0);
            add_in_place(sum.data(), sum.size(), digits, half);
            return sum;
        };
        const magnitude lhs_sum = fold(lhs, lhs_high);
        const magnitude rhs_sum = fold(rhs, rhs_high);
        magnitude z1 = multiply_range(lhs_sum.data(), lhs_sum.size(), rhs_sum.data(),
                                      rhs_sum.size());
        subtract_in_place(z1.data(), z1.size(), z0.data(), z0.size());
        subtract_in_place(z1.data(), z1.size(), z2.data(), z2.size());
        normalize_magnitude(z1);
        std::copy(z0.begin(), z0.end(), result.begin());
        std::copy(z2.begin(), z2.end(), result.begin() + static_cast<std::ptrdiff_t>(2 * half));
        add_in_place(result.data() + half, result.size() - half, z1.data(), z1.size());
        return result;
    }

    static magnitude multiply_magnitude(const magnitude& lhs, const magnitude& rhs) {
        magnitude result = multiply_range(lhs.data(), lhs.size(), rhs.data(), rhs.size());
        normalize_magnitude(result);
        return result;
    }

    // Knuth algorithm D; requires |dividend| >= |divisor| > 0.
    static std::pair<magnitude, magnitude>
    divide_magnitude(const magnitude& dividend, const magnitude& divisor) {
        if (divisor.size() == 1) {
            const limb single = divisor[0];
            magnitude quotient(dividend.size(), 0);
            detail::limb_uint128 remainder = 0;
            for (std::size_t index = dividend.size(); index-- > 0;) {
                const detail::limb_uint128 current =
                    (remainder << detail::LIMB_BITS) | dividend[index];
                quotient[index] = static_cast<limb>(current / single);
                remainder = current % single;
            }
            normalize_magnitude(quotient);
            magnitude rest;
            if (remainder != 0) {
                rest.push_back(static_cast<limb>(remainder));
            }
            return {quotient, rest};
        }
        const unsigned shift = static_cast<unsigned>(std::countl_zero(divisor.back()));
        const magnitude v = shift_left_bits(divisor, shift);
        magnitude u = shift_left_bits(dividend, shift);
        if (u.size() == dividend.size()) {
            u.push_back(0);
        }
        const std::size_t n = v.size();
        const std::size_t m = dividend.size() - n;
        magnitude quotient(m + 1, 0);
        const detail::limb_uint128 base = static_cast<detail::limb_uint128>(1) << detail::LIMB_BITS;
        for (std::size_t j = m + 1; j-- > 0;) {
            const detail::limb_uint128 numerator =
                (static_cast<detail::limb_uint128>(u[j + n]) << detail::LIMB_BITS) | u[j + n - 1];
            detail::limb_uint128 qhat = numerator / v[n - 1];
            detail::limb_uint128 rhat = numerator % v[n - 1];
            while (qhat >= base ||
                   qhat * v[n - 2] > ((rhat << detail::LIMB_BITS) | u[j + n - 2])) {
                --qhat;
                rhat += v[n - 1];
                if (rhat >= base) {
                    break;
                }
            }
            limb borrow = 0;
            detail::limb_uint128 carry = 0;
            for (std::size_t i = 0; i < n; ++i) {
                const detail::limb_uint128 product = qhat * v[i] + carry;
                carry = product >> detail::LIMB_BITS;
                const detail::limb_uint128 difference =
                    static_cast<detail::limb_uint128>(u[i + j]) - static_cast<limb>(product) -
                    borrow;
                u[i + j] = static_cast<limb>(difference);
                borrow = (difference >> detail::LIMB_BITS) != 0 ? 1 : 0;
            }
            const detail::limb_uint128 top =
                static_cast<detail::limb_uint128>(u[j + n]) - carry - borrow;
            u[j + n] = static_cast<limb>(top);
            quotient[j] = static_cast<limb>(qhat);
            if ((top >> detail::LIMB_BITS) != 0) {
                --quotient[j];
                detail::limb_uint128 add_carry = 0;
                for (std::size_t i = 0; i < n; ++i) {
                    const detail::limb_uint128 sum =
                        static_cast<detail::limb_uint128>(u[i + j]) + v[i] + add_carry;
                    u[i + j] = static_cast<limb>(sum);
                    add_carry = sum >> detail::LIMB_BITS;
                }
                u[j + n] = static_cast<limb>(u[j + n] + add_carry);
            }
        }
        normalize_magnitude(quotient);
        u.resize(n);
        magnitude remainder = shift_right_bits(u, shift);
        normalize_magnitude(remainder);
        return {quotient, remainder};
    }

    std::strong_ordering compare(const bigint& other) const noexcept {
        if (negative_ != other.negative_) {
            return negative_ ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        return negative_ ? compare_magnitudes(other.limbs_, limbs_)
                         : compare_magnitudes(limbs_, other.limbs_);
    }

    void normalize() {
        normalize_magnitude(limbs_);
        if (limbs_.empty()) {
            negative_ = false;
        }
    }

    magnitude limbs_;
    bool negative_ = false;
};

} // namespace rmath::core
