// src/context.cpp — Context presets, validation and flag naming.

#include <rmath/context.hpp>

#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace rmath {

namespace {

struct flag_entry {
    flags flag;
    std::string_view name;
};

constexpr std::array<flag_entry, 8> FLAG_NAMES{{
    {flags::inexact, "inexact"},
    {flags::rounded, "rounded"},
    {flags::subnormal, "subnormal"},
    {flags::underflow, "underflow"},
    {flags::overflow, "overflow"},
    {flags::clamped, "clamped"},
    {flags::invalid, "invalid"},
    {flags::divide_by_zero, "divide_by_zero"},
}};

struct rounding_entry {
    rounding mode;
    std::string_view name;
};

constexpr std::array<rounding_entry, 8> ROUNDING_NAMES{{
    {rounding::half_even, "half_even"},
    {rounding::half_up, "half_up"},
    {rounding::half_down, "half_down"},
    {rounding::up, "up"},
    {rounding::down, "down"},
    {rounding::ceiling, "ceiling"},
    {rounding::floor, "floor"},
    {rounding::zero_five_up, "zero_five_up"},
}};

bool equals_ignoring_case(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto a = std::tolower(static_cast<unsigned char>(lhs[index]));
        const auto b = std::tolower(static_cast<unsigned char>(rhs[index]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

// Most severe condition first; the order trapped names are listed in.
constexpr std::array<flags, 8> SEVERITY{flags::invalid,   flags::divide_by_zero,
                                        flags::overflow,  flags::underflow,
                                        flags::subnormal, flags::clamped,
                                        flags::inexact,   flags::rounded};

std::string trap_message(flags trapped) {
    std::string message = "trapped condition";
    char separator = ':';
    for (const flags candidate : SEVERITY) {
        if (any(trapped & candidate)) {
            message.push_back(separator);
            if (separator == ':') {
                message.push_back(' ');
            }
            message.append(flag_name(candidate));
            separator = ',';
        }
    }
    return message;
}

context ieee_binary(std::size_t bits, int emin, int emax) {
    return context{}
        .with_precision(bits)
        .with_precision_in_bits(true)
        .with_exponent_range(core::bigint(emin), core::bigint(emax));
}

context ieee_decimal(std::size_t digits, int emin, int emax) {
    return context{}
        .with_precision(digits)
        .with_exponent_range(core::bigint(emin), core::bigint(emax))
        .with_clamp_normal_exponents(true);
}

} // namespace

std::string_view to_string(rounding mode) noexcept {
    for (const auto& entry : ROUNDING_NAMES) {
        if (entry.mode == mode) {
            return entry.name;
        }
    }
    return "half_even";
}

std::optional<rounding> rounding_from_string(std::string_view text) noexcept {
    for (const auto& entry : ROUNDING_NAMES) {
        if (equals_ignoring_case(entry.name, text)) {
            return entry.mode;
        }
    }
    return std::nullopt;
}

std::string_view flag_name(flags single) noexcept {
    for (const auto& entry : FLAG_NAMES) {
        if (entry.flag == single) {
            return entry.name;
        }
    }
    return "none";
}

std::optional<flags> flag_from_string(std::string_view text) noexcept {
    for (const auto& entry : FLAG_NAMES) {
        if (equals_ignoring_case(entry.name, text)) {
            return entry.flag;
        }
    }
    if (equals_ignoring_case("none", text)) {
        return flags::none;
    }
    return std::nullopt;
}

std::string to_string(flags value) {
    if (!any(value)) {
        return "none";
    }
    std::string text;
    for (const auto& entry : FLAG_NAMES) {
        if (any(value & entry.flag)) {
            if (!text.empty()) {
                text.push_back(',');
            }
            text.append(entry.name);
        }
    }
    return text;
}

trap_error::trap_error(flags trapped)
    : std::domain_error(trap_message(trapped)), trapped_(trapped) {}

context context::with_precision(std::size_t digits) const {
    context copy = *this;
    copy.precision_ = digits;
    return copy;
}

context context::with_rounding(rounding mode) const {
    context copy = *this;
    copy.rounding_ = mode;
    return copy;
}

context context::with_exponent_range(core::bigint emin, core::bigint emax) const {
    if (emin > emax) {
        throw std::invalid_argument("emin must not exceed emax");
    }
    context copy = *this;
    copy.emin_ = std::move(emin);
    copy.emax_ = std::move(emax);
    return copy;
}

context context::without_exponent_range() const {
    context copy = *this;
    copy.emin_.reset();
    copy.emax_.reset();
    return copy;
}

context context::with_traps(flags trapped) const {
    context copy = *this;
    copy.traps_ = trapped & all_flags();
    return copy;
}

context context::with_simplified(bool simplified) const {
    context copy = *this;
    copy.simplified_ = simplified;
    return copy;
}

context context::with_precision_in_bits(bool bits) const {
    context copy = *this;
    copy.precision_in_bits_ = bits;
    return copy;
}

context context::with_clamp_normal_exponents(bool clamp) const {
    context copy = *this;
    copy.clamp_normal_exponents_ = clamp;
    return copy;
}

context context::unlimited() { return context{}; }

context context::basic() {
    return context{}
        .with_precision(9)
        .with_rounding(rounding::half_up)
        .with_exponent_range(core::bigint(-999999999), core::bigint(999999999))
        .with_traps(flags::invalid | flags::divide_by_zero | flags::overflow | flags::underflow);
}

context context::decimal32() { return ieee_decimal(7, -95, 96); }
context context::decimal64() { return ieee_decimal(16, -383, 384); }
context context::decimal128() { return ieee_decimal(34, -6143, 6144); }

context context::binary16() { return ieee_binary(11, -14, 15); }
context context::binary32() { return ieee_binary(24, -126, 127); }
context context::binary64() { return ieee_binary(53, -1022, 1023); }

void status::raise(flags raised, const context& ctx) {
    flags_ |= raised;
    const flags trapped = raised & ctx.traps();
    if (any(trapped)) {
        throw trap_error(trapped);
    }
}

} // namespace rmath
