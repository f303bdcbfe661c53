// tests/unit/test_context_options.cpp — Unit tests for contexts, status flags, traps and option strings.

#include <rmath/rmathlib.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using rmath::context;
using rmath::flags;
using rmath::rounding;
using rmath::core::bigint;

bool test_presets() {
    const context unlimited = context::unlimited();
    if (unlimited.has_max_precision() || unlimited.has_exponent_range() ||
        unlimited.traps() != flags::none || unlimited.is_simplified() ||
        unlimited.rounding_mode() != rounding::half_even) {
        std::cerr << "unlimited context is not the universal default\n";
        return false;
    }
    if (!(unlimited == context{})) {
        std::cerr << "default-constructed context differs from unlimited\n";
        return false;
    }
    const context d64 = context::decimal64();
    if (d64.precision() != 16 || *d64.emin() != bigint(-383) || *d64.emax() != bigint(384) ||
        !d64.clamp_normal_exponents()) {
        std::cerr << "decimal64 preset mismatch\n";
        return false;
    }
    const context b32 = context::binary32();
    if (b32.precision() != 24 || !b32.precision_in_bits() || *b32.emin() != bigint(-126)) {
        std::cerr << "binary32 preset mismatch\n";
        return false;
    }
    const context basic = context::basic();
    if (basic.precision() != 9 || basic.rounding_mode() != rounding::half_up ||
        !rmath::any(basic.traps() & flags::divide_by_zero)) {
        std::cerr << "basic preset mismatch\n";
        return false;
    }
    try {
        (void)context{}.with_exponent_range(bigint(5), bigint(-5));
        std::cerr << "emin above emax accepted\n";
        return false;
    } catch (const std::invalid_argument&) {
    }
    return true;
}

bool test_status_and_traps() {
    rmath::status st;
    const context quiet = context{}.with_precision(5);
    st.raise(flags::inexact | flags::rounded, quiet);
    st.raise(flags::clamped, quiet);
    if (!st.has(flags::inexact) || !st.has(flags::clamped) || st.has(flags::overflow)) {
        std::cerr << "status does not accumulate flags\n";
        return false;
    }
    if (rmath::to_string(st.value()) != "inexact,rounded,clamped") {
        std::cerr << "flag naming mismatch: " << rmath::to_string(st.value()) << "\n";
        return false;
    }
    const context trapping = quiet.with_traps(flags::divide_by_zero);
    rmath::status trapped_status;
    try {
        trapped_status.raise(flags::divide_by_zero, trapping);
        std::cerr << "trapped condition did not throw\n";
        return false;
    } catch (const rmath::trap_error& error) {
        if (error.trapped() != flags::divide_by_zero ||
            std::string(error.what()) != "trapped condition: divide_by_zero") {
            std::cerr << "trap error content mismatch\n";
            return false;
        }
    }
    if (!trapped_status.has(flags::divide_by_zero)) {
        std::cerr << "trapped flag not recorded before the throw\n";
        return false;
    }
    const context several = quiet.with_traps(flags::inexact | flags::overflow);
    rmath::status several_status;
    try {
        several_status.raise(flags::overflow | flags::inexact | flags::rounded, several);
        std::cerr << "trapped overflow did not throw\n";
        return false;
    } catch (const rmath::trap_error& error) {
        if (error.trapped() != (flags::overflow | flags::inexact) ||
            std::string(error.what()) != "trapped condition: overflow,inexact") {
            std::cerr << "trap error must name every trapped condition: " << error.what() << "\n";
            return false;
        }
    }
    return true;
}

bool test_names() {
    for (const auto mode : {rounding::half_even, rounding::half_up, rounding::half_down, rounding::up,
                            rounding::down, rounding::ceiling, rounding::floor,
                            rounding::zero_five_up}) {
        const auto parsed = rmath::rounding_from_string(rmath::to_string(mode));
        if (!parsed || *parsed != mode) {
            std::cerr << "rounding name roundtrip failed for " << rmath::to_string(mode) << "\n";
            return false;
        }
    }
    if (rmath::rounding_from_string("HALF_EVEN") != rounding::half_even ||
        rmath::rounding_from_string("sideways").has_value()) {
        std::cerr << "rounding name lookup failed\n";
        return false;
    }
    if (rmath::flag_from_string("Overflow") != flags::overflow) {
        std::cerr << "flag name lookup failed\n";
        return false;
    }
    return true;
}

bool test_option_string() {
    const rmath::io::option_string options(
        " AllowDuplicateKeys = yes ; numberconversion=IntOrFloat;;flag=0; flag = ON ");
    if (!options.get_boolean("allowduplicatekeys", false)) {
        std::cerr << "boolean option with mixed-case key not read\n";
        return false;
    }
    if (!options.get_boolean("FLAG", false)) {
        std::cerr << "later duplicate key did not override\n";
        return false;
    }
    if (options.get_lowercase("numberconversion", "full") != "intorfloat") {
        std::cerr << "lowercase option read failed\n";
        return false;
    }
    if (options.get("missing").has_value() || options.get_boolean("missing", true) != true) {
        std::cerr << "absent key fallback failed\n";
        return false;
    }
    const rmath::io::option_string falsy("a=2;b=no;c=");
    if (falsy.get_boolean("a", true) || falsy.get_boolean("b", true) || falsy.get_boolean("c", true)) {
        std::cerr << "non-true values must read as false\n";
        return false;
    }
    try {
        const rmath::io::option_string broken("precision");
        std::cerr << "entry without '=' accepted\n";
        return false;
    } catch (const std::invalid_argument&) {
    }
    return true;
}

bool test_conversion_options() {
    const auto defaults = rmath::io::conversion_options::parse("");
    if (defaults.conversion != rmath::io::number_conversion::full || defaults.allow_duplicate_keys ||
        defaults.replace_surrogates) {
        std::cerr << "conversion defaults mismatch\n";
        return false;
    }
    const auto parsed =
        rmath::io::conversion_options::parse("numberconversion=intorfloatfromdouble;allowduplicatekeys=1;ReplaceSurrogates=yes");
    if (parsed.conversion != rmath::io::number_conversion::int_or_float_from_double ||
        !parsed.allow_duplicate_keys || !parsed.replace_surrogates) {
        std::cerr << "conversion options parse mismatch\n";
        return false;
    }
    if (parsed.to_string() !=
        "numberconversion=intorfloatfromdouble;allowduplicatekeys=true;replacesurrogates=true") {
        std::cerr << "conversion options rendering mismatch: " << parsed.to_string() << "\n";
        return false;
    }
    if (rmath::io::conversion_options::parse(parsed.to_string()) != parsed) {
        std::cerr << "conversion options roundtrip failed\n";
        return false;
    }
    if (rmath::io::conversion_options::parse("numberconversion=bogus").conversion !=
        rmath::io::number_conversion::full) {
        std::cerr << "unknown conversion did not fall back to full\n";
        return false;
    }
    return true;
}

bool test_context_strings() {
    const context parsed = rmath::io::parse_context(
        "Precision=16; rounding=floor; emin=-383; emax=384; traps=invalid,overflow; simplified=true; clamp=on");
    const context expected = context{}
                                 .with_precision(16)
                                 .with_rounding(rounding::floor)
                                 .with_exponent_range(bigint(-383), bigint(384))
                                 .with_traps(flags::invalid | flags::overflow)
                                 .with_simplified(true)
                                 .with_clamp_normal_exponents(true);
    if (!(parsed == expected)) {
        std::cerr << "context parse mismatch: " << rmath::io::to_string(parsed) << "\n";
        return false;
    }
    if (!(rmath::io::parse_context(rmath::io::to_string(parsed)) == parsed)) {
        std::cerr << "context string roundtrip failed\n";
        return false;
    }
    if (rmath::io::to_string(context::unlimited()) !=
        "precision=0;rounding=half_even;traps=none;simplified=false;bits=false;clamp=false") {
        std::cerr << "unlimited context rendering mismatch: "
                  << rmath::io::to_string(context::unlimited()) << "\n";
        return false;
    }
    const std::vector<std::string> invalid = {"precision=-1", "rounding=sideways", "emin=-3",
                                              "traps=invalid,bogus", "emin=4;emax=1"};
    for (const auto& text : invalid) {
        try {
            (void)rmath::io::parse_context(text);
            std::cerr << "accepted malformed context '" << text << "'\n";
            return false;
        } catch (const std::invalid_argument&) {
        }
    }
    return true;
}

} // namespace

int main() {
    if (!test_presets()) {
        return 1;
    }
    if (!test_status_and_traps()) {
        return 1;
    }
    if (!test_names()) {
        return 1;
    }
    if (!test_option_string()) {
        return 1;
    }
    if (!test_conversion_options()) {
        return 1;
    }
    if (!test_context_strings()) {
        return 1;
    }
    std::cout << "context_options passed\n";
    return 0;
}
