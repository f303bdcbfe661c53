// src/io/options.cpp — Option-string parsing and context serialisation.

#include <rmath/io/options.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <stdexcept>
#include <string>

#include <rmath/io/format.hpp>
#include <rmath/io/parse.hpp>

namespace rmath::io {

namespace {

struct conversion_entry {
    number_conversion kind;
    std::string_view name;
};

constexpr std::array<conversion_entry, 4> CONVERSION_NAMES{{
    {number_conversion::full, "full"},
    {number_conversion::double_precision, "double"},
    {number_conversion::int_or_float, "intorfloat"},
    {number_conversion::int_or_float_from_double, "intorfloatfromdouble"},
}};

std::string_view trim(std::string_view text) noexcept {
    const auto is_whitespace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)); };
    std::size_t start = 0;
    while (start < text.size() && is_whitespace(text[start])) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && is_whitespace(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string lowercase(std::string_view text) {
    std::string result(text);
    for (char& ch : result) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return result;
}

std::size_t parse_precision(std::string_view text) {
    std::size_t value = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc{} || end != text.data() + text.size()) {
        throw std::invalid_argument("precision must be a non-negative integer");
    }
    return value;
}

flags parse_traps(std::string_view text) {
    flags result = flags::none;
    while (!text.empty()) {
        const std::size_t comma = text.find(',');
        const std::string_view name = trim(text.substr(0, comma));
        if (!name.empty()) {
            const auto flag = flag_from_string(name);
            if (!flag) {
                throw std::invalid_argument("unknown flag name: " + std::string(name));
            }
            result |= *flag;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return result;
}

const char* boolean_text(bool value) noexcept { return value ? "true" : "false"; }

} // namespace

std::string_view to_string(number_conversion kind) noexcept {
    for (const auto& entry : CONVERSION_NAMES) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "full";
}

number_conversion number_conversion_from_string(std::string_view text) noexcept {
    for (const auto& entry : CONVERSION_NAMES) {
        if (entry.name == text) {
            return entry.kind;
        }
    }
    return number_conversion::full;
}

option_string::option_string(std::string_view text) {
    while (!text.empty()) {
        const std::size_t separator = text.find(';');
        const std::string_view entry = trim(text.substr(0, separator));
        if (!entry.empty()) {
            const std::size_t equals = entry.find('=');
            if (equals == std::string_view::npos) {
                throw std::invalid_argument("option entry lacks '=': " + std::string(entry));
            }
            std::string key = lowercase(trim(entry.substr(0, equals)));
            if (key.empty()) {
                throw std::invalid_argument("option entry has an empty key");
            }
            std::string value(trim(entry.substr(equals + 1)));
            bool replaced = false;
            for (auto& existing : entries_) {
                if (existing.first == key) {
                    existing.second = std::move(value);
                    replaced = true;
                    break;
                }
            }
            if (!replaced) {
                entries_.emplace_back(std::move(key), std::move(value));
            }
        }
        if (separator == std::string_view::npos) {
            break;
        }
        text.remove_prefix(separator + 1);
    }
}

std::optional<std::string_view> option_string::get(std::string_view key) const {
    const std::string wanted = lowercase(key);
    for (const auto& [name, value] : entries_) {
        if (name == wanted) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

bool option_string::get_boolean(std::string_view key, bool fallback) const {
    const auto value = get(key);
    if (!value) {
        return fallback;
    }
    const std::string text = lowercase(*value);
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

std::string option_string::get_lowercase(std::string_view key, std::string_view fallback) const {
    const auto value = get(key);
    return lowercase(value ? *value : fallback);
}

conversion_options conversion_options::parse(std::string_view text) {
    const option_string parser(text);
    conversion_options options;
    options.allow_duplicate_keys = parser.get_boolean("allowduplicatekeys", false);
    options.replace_surrogates = parser.get_boolean("replacesurrogates", false);
    options.conversion =
        number_conversion_from_string(parser.get_lowercase("numberconversion", "full"));
    return options;
}

std::string conversion_options::to_string() const {
    std::string text = "numberconversion=";
    text += io::to_string(conversion);
    text += ";allowduplicatekeys=";
    text += boolean_text(allow_duplicate_keys);
    text += ";replacesurrogates=";
    text += boolean_text(replace_surrogates);
    return text;
}

context parse_context(std::string_view text) {
    const option_string parser(text);
    context ctx;
    if (const auto precision = parser.get("precision")) {
        ctx = ctx.with_precision(parse_precision(*precision));
    }
    if (const auto mode = parser.get("rounding")) {
        const auto parsed = rounding_from_string(*mode);
        if (!parsed) {
            throw std::invalid_argument("unknown rounding mode: " + std::string(*mode));
        }
        ctx = ctx.with_rounding(*parsed);
    }
    const auto emin = parser.get("emin");
    const auto emax = parser.get("emax");
    if (emin.has_value() != emax.has_value()) {
        throw std::invalid_argument("emin and emax must be given together");
    }
    if (emin) {
        ctx = ctx.with_exponent_range(from_string<core::bigint>(*emin),
                                      from_string<core::bigint>(*emax));
    }
    if (const auto traps = parser.get("traps")) {
        ctx = ctx.with_traps(parse_traps(*traps));
    }
    ctx = ctx.with_simplified(parser.get_boolean("simplified", false))
              .with_precision_in_bits(parser.get_boolean("bits", false))
              .with_clamp_normal_exponents(parser.get_boolean("clamp", false));
    return ctx;
}

std::string to_string(const context& ctx) {
    std::string text = "precision=" + std::to_string(ctx.precision());
    text += ";rounding=";
    text += rmath::to_string(ctx.rounding_mode());
    if (ctx.has_exponent_range()) {
        text += ";emin=" + to_string(*ctx.emin());
        text += ";emax=" + to_string(*ctx.emax());
    }
    text += ";traps=" + rmath::to_string(ctx.traps());
    text += ";simplified=";
    text += boolean_text(ctx.is_simplified());
    text += ";bits=";
    text += boolean_text(ctx.precision_in_bits());
    text += ";clamp=";
    text += boolean_text(ctx.clamp_normal_exponents());
    return text;
}

} // namespace rmath::io
