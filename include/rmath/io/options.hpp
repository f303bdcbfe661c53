// include/rmath/io/options.hpp — Semicolon-separated option strings for contexts and number conversion.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <rmath/context.hpp>

namespace rmath::io {

// How a host-side number enters the library.
enum class number_conversion : std::uint8_t {
    full,                     // exact value, any magnitude
    double_precision,         // rounded to a binary64 value
    int_or_float,             // integers exactly, everything else as binary64
    int_or_float_from_double  // binary64 first, then kept exact when integral
};

std::string_view to_string(number_conversion kind) noexcept;

// Unknown names map to number_conversion::full.
number_conversion number_conversion_from_string(std::string_view text) noexcept;

// "key=value;key=value" with keys compared case-insensitively. Whitespace
// around keys and values is ignored, empty entries are skipped and a later
// entry overrides an earlier one with the same key.
class option_string {
public:
    explicit option_string(std::string_view text);

    std::optional<std::string_view> get(std::string_view key) const;

    // True for "1", "true", "yes" or "on" in any case; any other value is false.
    bool get_boolean(std::string_view key, bool fallback) const;

    // Value converted to lower case, or `fallback` when the key is absent.
    std::string get_lowercase(std::string_view key, std::string_view fallback) const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

struct conversion_options {
    number_conversion conversion = number_conversion::full;
    bool allow_duplicate_keys = false;
    bool replace_surrogates = false;

    // Reads "numberconversion", "allowduplicatekeys" and "replacesurrogates".
    static conversion_options parse(std::string_view text);

    // "numberconversion=...;allowduplicatekeys=...;replacesurrogates=..."
    std::string to_string() const;

    friend bool operator==(const conversion_options&, const conversion_options&) = default;
};

// Builds a context from keys "precision", "rounding", "emin" and "emax" (both
// or neither), "traps" (comma-separated flag names), "simplified", "bits" and
// "clamp". Absent keys keep the unlimited default; malformed values throw
// std::invalid_argument.
context parse_context(std::string_view text);

// Inverse of parse_context; the exponent keys are written only with a range.
std::string to_string(const context& ctx);

} // namespace rmath::io
