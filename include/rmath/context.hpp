// include/rmath/context.hpp — Precision context, condition flags and the flag accumulator.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <rmath/core/bigint.hpp>

namespace rmath {

enum class rounding : std::uint8_t {
    half_even,
    half_up,
    half_down,
    up,
    down,
    ceiling,
    floor,
    zero_five_up
};

enum class flags : std::uint32_t {
    none = 0,
    inexact = 1U << 0,
    rounded = 1U << 1,
    subnormal = 1U << 2,
    underflow = 1U << 3,
    overflow = 1U << 4,
    clamped = 1U << 5,
    invalid = 1U << 6,
    divide_by_zero = 1U << 7
};

constexpr flags operator|(flags lhs, flags rhs) noexcept {
    return static_cast<flags>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr flags operator&(flags lhs, flags rhs) noexcept {
    return static_cast<flags>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

constexpr flags operator~(flags value) noexcept {
    return static_cast<flags>(~static_cast<std::uint32_t>(value) & 0xFFU);
}

constexpr flags& operator|=(flags& lhs, flags rhs) noexcept {
    lhs = lhs | rhs;
    return lhs;
}

constexpr flags& operator&=(flags& lhs, flags rhs) noexcept {
    lhs = lhs & rhs;
    return lhs;
}

constexpr bool any(flags value) noexcept { return value != flags::none; }

constexpr flags all_flags() noexcept {
    return flags::inexact | flags::rounded | flags::subnormal | flags::underflow |
           flags::overflow | flags::clamped | flags::invalid | flags::divide_by_zero;
}

std::string_view to_string(rounding mode) noexcept;
std::optional<rounding> rounding_from_string(std::string_view text) noexcept;

std::string_view flag_name(flags single) noexcept;
std::optional<flags> flag_from_string(std::string_view text) noexcept;

// Comma-separated flag names, or "none".
std::string to_string(flags value);

// Thrown when an operation raises a condition the context traps. The flags
// are recorded in the status before the throw.
class trap_error : public std::domain_error {
public:
    explicit trap_error(flags trapped);

    flags trapped() const noexcept { return trapped_; }

private:
    flags trapped_;
};

// Immutable arithmetic configuration. A default-constructed context is the
// universal default: unlimited precision, half-even rounding, unbounded
// exponents, no traps, full engine.
class context {
public:
    context() = default;

    std::size_t precision() const noexcept { return precision_; }
    bool has_max_precision() const noexcept { return precision_ != 0; }
    rounding rounding_mode() const noexcept { return rounding_; }
    const std::optional<core::bigint>& emin() const noexcept { return emin_; }
    const std::optional<core::bigint>& emax() const noexcept { return emax_; }
    bool has_exponent_range() const noexcept { return emin_.has_value(); }
    flags traps() const noexcept { return traps_; }
    bool is_simplified() const noexcept { return simplified_; }
    bool precision_in_bits() const noexcept { return precision_in_bits_; }
    bool clamp_normal_exponents() const noexcept { return clamp_normal_exponents_; }

    context with_precision(std::size_t digits) const;
    context with_rounding(rounding mode) const;
    context with_exponent_range(core::bigint emin, core::bigint emax) const;
    context without_exponent_range() const;
    context with_traps(flags trapped) const;
    context with_simplified(bool simplified) const;
    context with_precision_in_bits(bool bits) const;
    context with_clamp_normal_exponents(bool clamp) const;

    static context unlimited();
    static context basic();
    static context decimal32();
    static context decimal64();
    static context decimal128();
    static context binary16();
    static context binary32();
    static context binary64();

    friend bool operator==(const context&, const context&) = default;

private:
    std::size_t precision_ = 0;
    rounding rounding_ = rounding::half_even;
    std::optional<core::bigint> emin_;
    std::optional<core::bigint> emax_;
    flags traps_ = flags::none;
    bool simplified_ = false;
    bool precision_in_bits_ = false;
    bool clamp_normal_exponents_ = false;
};

// Write-only flag accumulator supplied per call. Flags are never cleared by
// the engines.
class status {
public:
    status() noexcept = default;

    flags value() const noexcept { return flags_; }
    bool has(flags condition) const noexcept { return any(flags_ & condition); }
    void clear() noexcept { flags_ = flags::none; }

    // Records `raised`, then throws trap_error when any of them is trapped by `ctx`.
    void raise(flags raised, const context& ctx);

private:
    flags flags_ = flags::none;
};

} // namespace rmath
