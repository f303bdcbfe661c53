// include/rmath/io/parse.hpp — Parsing bigint and radix numbers from text.

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include <rmath/core/bigint.hpp>
#include <rmath/core/number.hpp>

namespace rmath::io {

    namespace detail {

        inline int digit_value(char ch, int base) noexcept {
            int value = -1;
            if (ch >= '0' && ch <= '9') {
                value = ch - '0';
            } else if (ch >= 'a' && ch <= 'z') {
                value = ch - 'a' + 10;
            } else if (ch >= 'A' && ch <= 'Z') {
                value = ch - 'A' + 10;
            }
            return value < base ? value : -1;
        }

        inline bool starts_with_ignoring_case(std::string_view text, std::string_view prefix) {
            if (text.size() < prefix.size()) {
                return false;
            }
            for (std::size_t index = 0; index < prefix.size(); ++index) {
                if (std::tolower(static_cast<unsigned char>(text[index])) != prefix[index]) {
                    return false;
                }
            }
            return true;
        }

        // Accumulates unsigned digits in limb-sized chunks.
        inline core::bigint parse_digits(std::string_view digits, int base) {
            if (digits.empty()) {
                throw std::invalid_argument("empty digit sequence");
            }
            std::uint64_t chunk_limit = 1;
            int chunk_digits = 0;
            while (chunk_limit <= UINT32_MAX) {
                chunk_limit *= static_cast<std::uint64_t>(base);
                ++chunk_digits;
            }
            core::bigint accumulator;
            std::size_t pos = 0;
            while (pos < digits.size()) {
                std::uint64_t chunk_value = 0;
                std::uint64_t scale = 1;
                for (int taken = 0; taken < chunk_digits && pos < digits.size(); ++taken, ++pos) {
                    const int digit = digit_value(digits[pos], base);
                    if (digit < 0) {
                        throw std::invalid_argument("invalid digit in string");
                    }
                    chunk_value = chunk_value * static_cast<std::uint64_t>(base) +
                                  static_cast<std::uint64_t>(digit);
                    scale *= static_cast<std::uint64_t>(base);
                }
                accumulator *= core::bigint(scale);
                if (chunk_value != 0) {
                    accumulator += core::bigint(chunk_value);
                }
            }
            return accumulator;
        }

        inline core::bigint parse_signed_decimal(std::string_view text) {
            bool negative = false;
            if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
                negative = text.front() == '-';
                text.remove_prefix(1);
            }
            core::bigint value = parse_digits(text, 10);
            return negative ? -value : value;
        }

    } // namespace detail

    template <typename Int>
    inline Int from_string(std::string_view text, int base = 10) {
        static_assert(std::is_same_v<Int, core::bigint>, "from_string<Int> supports bigint");
        if (base < 2 || base > 36) {
            throw std::invalid_argument("supported bases are 2..36");
        }
        if (text.empty()) {
            throw std::invalid_argument("empty string");
        }
        bool negative = false;
        if (text.front() == '+' || text.front() == '-') {
            negative = text.front() == '-';
            text.remove_prefix(1);
            if (text.empty()) {
                throw std::invalid_argument("string has only a sign");
            }
        }
        core::bigint value = detail::parse_digits(text, base);
        return negative ? -value : value;
    }

    // Reads the syntax written by to_string: an optional sign, then
    // "Infinity"/"Inf", "NaN" or "sNaN" with optional payload digits, or digits
    // with an optional point. Decimals take an "E" exponent; other radices take
    // "p" followed by a decimal power of the radix. Special names are matched
    // without regard to case.
    template <int Radix>
    core::basic_number<Radix> parse_number(std::string_view text) {
        static_assert(Radix >= 2 && Radix <= 25, "text form supports radices 2..25");
        using number = core::basic_number<Radix>;
        if (text.empty()) {
            throw std::invalid_argument("empty string");
        }
        bool negative = false;
        if (text.front() == '+' || text.front() == '-') {
            negative = text.front() == '-';
            text.remove_prefix(1);
            if (text.empty()) {
                throw std::invalid_argument("string has only a sign");
            }
        }
        if (detail::starts_with_ignoring_case(text, "inf")) {
            if (text.size() == 3 ||
                (text.size() == 8 && detail::starts_with_ignoring_case(text, "infinity"))) {
                return number::infinity(negative);
            }
            throw std::invalid_argument("malformed infinity");
        }
        if (detail::starts_with_ignoring_case(text, "nan")) {
            const std::string_view payload = text.substr(3);
            return number::nan(payload.empty() ? core::bigint{} : detail::parse_digits(payload, Radix),
                               negative);
        }
        if (detail::starts_with_ignoring_case(text, "snan")) {
            const std::string_view payload = text.substr(4);
            return number::signaling_nan(
                payload.empty() ? core::bigint{} : detail::parse_digits(payload, Radix), negative);
        }

        const char exponent_marker = Radix == 10 ? 'e' : 'p';
        std::size_t marker = std::string_view::npos;
        for (std::size_t index = 0; index < text.size(); ++index) {
            if (std::tolower(static_cast<unsigned char>(text[index])) == exponent_marker) {
                marker = index;
                break;
            }
        }
        const std::string_view coefficient = text.substr(0, marker);
        core::bigint exponent;
        if (marker != std::string_view::npos) {
            exponent = detail::parse_signed_decimal(text.substr(marker + 1));
        }

        const std::size_t point = coefficient.find('.');
        std::string_view integral = coefficient;
        std::string_view fraction;
        if (point != std::string_view::npos) {
            integral = coefficient.substr(0, point);
            fraction = coefficient.substr(point + 1);
            if (integral.empty() && fraction.empty()) {
                throw std::invalid_argument("number has no digits");
            }
        }
        core::bigint mantissa = integral.empty() ? core::bigint{} : detail::parse_digits(integral, Radix);
        if (!fraction.empty()) {
            const core::bigint tail = detail::parse_digits(fraction, Radix);
            mantissa = mantissa * core::detail::radix_power(Radix, fraction.size()) + tail;
            exponent -= core::bigint(static_cast<std::uint64_t>(fraction.size()));
        }
        return number::finite(negative, std::move(mantissa), std::move(exponent));
    }

    inline core::decimal decimal_from_string(std::string_view text) { return parse_number<10>(text); }

    inline core::bigfloat bigfloat_from_string(std::string_view text) { return parse_number<2>(text); }

} // namespace rmath::io
