// include/rmath/io/format.hpp — Text rendering of bigint and radix numbers.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <rmath/context.hpp>
#include <rmath/core/bigint.hpp>
#include <rmath/core/detail/radix.hpp>
#include <rmath/core/number.hpp>

namespace rmath::io {

    namespace detail {

        inline char digit_char(std::uint64_t digit) {
            return digit < 10 ? static_cast<char>('0' + digit)
                              : static_cast<char>('a' + (digit - 10));
        }

        // Digits of |value| in `base`, most significant first; "0" for zero.
        inline std::string magnitude_digits(const core::bigint &value, int base) {
            if (base < 2 || base > 36) {
                throw std::invalid_argument("supported bases are 2..36");
            }
            if (value.is_zero()) {
                return "0";
            }
            // Largest power of the base that fits a limb, peeled off per division.
            const auto step = static_cast<std::uint64_t>(base);
            std::uint64_t chunk = step;
            std::size_t chunk_digits = 1;
            while (chunk <= UINT64_MAX / step) {
                chunk *= step;
                ++chunk_digits;
            }
            core::bigint cursor = value.abs();
            std::string digits;
            while (!cursor.is_zero()) {
                auto [quotient, remainder] = cursor.div_mod_small(chunk);
                cursor = std::move(quotient);
                for (std::size_t index = 0; index < chunk_digits; ++index) {
                    if (cursor.is_zero() && remainder == 0) {
                        break;
                    }
                    digits.push_back(digit_char(remainder % step));
                    remainder /= step;
                }
            }
            std::reverse(digits.begin(), digits.end());
            return digits;
        }

        template <int Radix>
        std::string special_string(const core::basic_number<Radix> &value) {
            std::string text = value.is_negative() ? "-" : "";
            if (value.is_infinity()) {
                return text + "Infinity";
            }
            text += value.is_signaling_nan() ? "sNaN" : "NaN";
            if (!value.nan_payload().is_zero()) {
                text += magnitude_digits(value.nan_payload(), Radix);
            }
            return text;
        }

    } // namespace detail

    inline std::string to_string(const core::bigint &value, int base = 10) {
        std::string digits = detail::magnitude_digits(value, base);
        if (value.is_negative()) {
            digits.insert(digits.begin(), '-');
        }
        return digits;
    }

    // Scientific string. Decimals follow the general decimal arithmetic
    // to-scientific-string rules ("1.23E+5", "0.00012", "-0E-7"). Other radices
    // print the mantissa in that radix followed by "p" and the decimal power of
    // the radix ("101p-3" is 5/8 in radix 2).
    template <int Radix>
    std::string to_string(const core::basic_number<Radix> &value) {
        static_assert(Radix >= 2 && Radix <= 25, "text form supports radices 2..25");
        if (!value.is_finite()) {
            return detail::special_string(value);
        }
        std::string text = value.is_negative() ? "-" : "";
        const std::string digits = detail::magnitude_digits(value.mantissa(), Radix);
        const core::bigint &exponent = value.exponent();
        if constexpr (Radix != 10) {
            text += digits;
            if (!exponent.is_zero()) {
                text += 'p';
                text += to_string(exponent);
            }
            return text;
        } else {
            const core::bigint length(static_cast<std::uint64_t>(digits.size()));
            const core::bigint adjusted = exponent + length - core::bigint(1);
            if (exponent.is_zero()) {
                return text + digits;
            }
            if (exponent.is_negative() && adjusted >= core::bigint(-6)) {
                // Plain notation; the point sits inside or just before the digits.
                const std::size_t fraction = core::detail::to_size(-exponent);
                if (fraction < digits.size()) {
                    const std::size_t point = digits.size() - fraction;
                    return text + digits.substr(0, point) + '.' + digits.substr(point);
                }
                return text + "0." + std::string(fraction - digits.size(), '0') + digits;
            }
            text += digits.front();
            if (digits.size() > 1) {
                text += '.';
                text.append(digits, 1, std::string::npos);
            }
            text += 'E';
            text += adjusted.is_negative() ? '-' : '+';
            text += to_string(adjusted.abs());
            return text;
        }
    }

    // Positional notation without an exponent; trailing zeros are written out.
    template <int Radix>
    std::string to_plain_string(const core::basic_number<Radix> &value) {
        if (!value.is_finite()) {
            return detail::special_string(value);
        }
        std::string text = value.is_negative() ? "-" : "";
        const std::string digits = detail::magnitude_digits(value.mantissa(), Radix);
        const core::bigint &exponent = value.exponent();
        if (!exponent.is_negative()) {
            if (value.is_zero()) {
                return text + "0";
            }
            return text + digits + std::string(core::detail::to_size(exponent), '0');
        }
        const std::size_t fraction = core::detail::to_size(-exponent);
        if (fraction < digits.size()) {
            const std::size_t point = digits.size() - fraction;
            return text + digits.substr(0, point) + '.' + digits.substr(point);
        }
        return text + "0." + std::string(fraction - digits.size(), '0') + digits;
    }

    inline std::ostream &operator<<(std::ostream &os, const core::bigint &value) {
        return os << to_string(value);
    }

    template <int Radix>
    std::ostream &operator<<(std::ostream &os, const core::basic_number<Radix> &value) {
        return os << to_string(value);
    }

    inline std::ostream &operator<<(std::ostream &os, rounding mode) {
        return os << rmath::to_string(mode);
    }

    inline std::ostream &operator<<(std::ostream &os, flags value) {
        return os << rmath::to_string(value);
    }

} // namespace rmath::io

namespace std {

    template <> struct formatter<rmath::core::bigint, char> : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const rmath::core::bigint &value, FormatContext &ctx) const {
            const std::string text = rmath::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

    template <int Radix>
    struct formatter<rmath::core::basic_number<Radix>, char>
        : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const rmath::core::basic_number<Radix> &value, FormatContext &ctx) const {
            const std::string text = rmath::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

} // namespace std
