// tests/unit/test_engine_equivalence.cpp — Fuzz-style check that the simplified engine matches the full engine.

#include <rmath/rmathlib.hpp>

#include <cstdint>
#include <iostream>
#include <random>
#include <string_view>
#include <vector>

namespace {

    using rmath::context;
    using rmath::flags;
    using rmath::rounding;
    using rmath::status;
    using rmath::core::bigint;

    template <int Radix> struct engines {
        rmath::engine::full_engine<rmath::core::basic_number<Radix>> full;
        rmath::engine::simplified_engine<rmath::core::basic_number<Radix>> simplified{full};
    };

    std::vector<context> fuzz_contexts() {
        const std::vector<rounding> modes = {rounding::half_even, rounding::half_up,
                                             rounding::half_down, rounding::up,
                                             rounding::down,      rounding::ceiling,
                                             rounding::floor,     rounding::zero_five_up};
        std::vector<context> contexts;
        for (const std::size_t precision : {1, 5, 9, 16, 18}) {
            for (const auto mode : modes) {
                const context base = context{}.with_precision(precision).with_rounding(mode);
                contexts.push_back(base);
                contexts.push_back(base.with_exponent_range(bigint(-20), bigint(20)));
                contexts.push_back(base.with_exponent_range(bigint(-12), bigint(12))
                                       .with_clamp_normal_exponents(true));
            }
        }
        return contexts;
    }

    template <typename Number>
    bool report(std::string_view operation, const Number &a, const Number &b, const context &ctx,
                const Number &fast, const Number &full, flags fast_flags, flags full_flags) {
        if (fast == full && fast_flags == full_flags) {
            return true;
        }
        std::cerr << "engine mismatch in " << operation << "(" << rmath::io::to_string(a) << ", "
                  << rmath::io::to_string(b) << ") under " << rmath::io::to_string(ctx)
                  << ": simplified " << rmath::io::to_string(fast) << " ["
                  << rmath::to_string(fast_flags) << "], full " << rmath::io::to_string(full)
                  << " [" << rmath::to_string(full_flags) << "]\n";
        return false;
    }

    template <int Radix, typename Operation>
    bool check(const engines<Radix> &pair, std::string_view name, const context &ctx,
               const rmath::core::basic_number<Radix> &a, const rmath::core::basic_number<Radix> &b,
               Operation operation) {
        status fast_status;
        status full_status;
        const auto fast = operation(pair.simplified, a, b, ctx, fast_status);
        const auto full = operation(pair.full, a, b, ctx, full_status);
        return report(name, a, b, ctx, fast, full, fast_status.value(), full_status.value());
    }

    template <int Radix>
    bool run_equivalence_fuzz(std::mt19937_64 &rng, int iterations, std::size_t max_digits) {
        const engines<Radix> pair;
        const auto contexts = fuzz_contexts();
        std::uniform_int_distribution<std::size_t> pick_context(0, contexts.size() - 1);
        for (int iteration = 0; iteration < iterations; ++iteration) {
            const context &ctx = contexts[pick_context(rng)];
            const auto a = rmath::util::random_operand<Radix>(rng, max_digits, 24);
            const auto b = rmath::util::random_operand<Radix>(rng, max_digits, 24);
            const auto c = rmath::util::random_operand<Radix>(rng, max_digits, 24);
            const bigint target = b.is_finite() ? b.exponent() : bigint(-3);
            const bool ok =
                check(pair, "add", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.add(x, y, k, s);
                      }) &&
                check(pair, "add_ex", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.add_ex(x, y, k, true, s);
                      }) &&
                check(pair, "subtract", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.subtract(x, y, k, s);
                      }) &&
                check(pair, "multiply", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.multiply(x, y, k, s);
                      }) &&
                check(pair, "multiply_and_add", ctx, a, b,
                      [&c](const auto &e, const auto &x, const auto &y, const context &k,
                           status &s) { return e.multiply_and_add(x, y, c, k, s); }) &&
                check(pair, "divide", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.divide(x, y, k, s);
                      }) &&
                check(pair, "divide_to_integer_zero_scale", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.divide_to_integer_zero_scale(x, y, k, s);
                      }) &&
                check(pair, "remainder", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.remainder(x, y, k, s);
                      }) &&
                check(pair, "remainder_near", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.remainder_near(x, y, k, s);
                      }) &&
                check(pair, "quantize", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.quantize(x, y, k, s);
                      }) &&
                check(pair, "round_to_exponent_exact", ctx, a, b,
                      [&target](const auto &e, const auto &x, const auto &, const context &k,
                                status &s) { return e.round_to_exponent_exact(x, target, k, s); }) &&
                check(pair, "round_to_exponent_simple", ctx, a, b,
                      [&target](const auto &e, const auto &x, const auto &, const context &k,
                                status &s) { return e.round_to_exponent_simple(x, target, k, s); }) &&
                check(pair, "round_to_exponent_no_rounded_flag", ctx, a, b,
                      [&target](const auto &e, const auto &x, const auto &, const context &k,
                                status &s) {
                          return e.round_to_exponent_no_rounded_flag(x, target, k, s);
                      }) &&
                check(pair, "negate", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &, const context &k, status &s) {
                          return e.negate(x, k, s);
                      }) &&
                check(pair, "abs", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &, const context &k, status &s) {
                          return e.abs(x, k, s);
                      }) &&
                check(pair, "plus", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &, const context &k, status &s) {
                          return e.plus(x, k, s);
                      }) &&
                check(pair, "reduce", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &, const context &k, status &s) {
                          return e.reduce(x, k, s);
                      }) &&
                check(pair, "round_to_precision", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &, const context &k, status &s) {
                          return e.round_to_precision(x, k, s);
                      }) &&
                check(pair, "round_after_conversion", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &, const context &k, status &s) {
                          return e.round_after_conversion(x, k, s);
                      }) &&
                check(pair, "compare_to_with_context", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.compare_to_with_context(x, y, false, k, s);
                      }) &&
                check(pair, "min", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.min(x, y, k, s);
                      }) &&
                check(pair, "max", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.max(x, y, k, s);
                      }) &&
                check(pair, "min_magnitude", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.min_magnitude(x, y, k, s);
                      }) &&
                check(pair, "max_magnitude", ctx, a, b,
                      [](const auto &e, const auto &x, const auto &y, const context &k, status &s) {
                          return e.max_magnitude(x, y, k, s);
                      });
            if (!ok) {
                return false;
            }
        }
        return true;
    }

    bool run_binary_precision_fuzz(std::mt19937_64 &rng, int iterations) {
        const engines<2> pair;
        std::uniform_int_distribution<std::size_t> bits(1, 60);
        for (int iteration = 0; iteration < iterations; ++iteration) {
            const context ctx = context{}.with_precision(bits(rng)).with_exponent_range(
                bigint(-40), bigint(40));
            const auto a = rmath::util::random_operand<2>(rng, 90, 50);
            const bool ok = check(pair, "round_to_binary_precision", ctx, a, a,
                                  [](const auto &e, const auto &x, const auto &, const context &k,
                                     status &s) { return e.round_to_binary_precision(x, k, s); });
            if (!ok) {
                return false;
            }
        }
        return true;
    }

} // namespace

int main() {
    std::mt19937_64 rng(0x5eed0e9aULL);
    if (!run_equivalence_fuzz<10>(rng, 3000, 12)) {
        return 1;
    }
    // Mantissas wider than the fixed-width domain exercise the fallback path.
    if (!run_equivalence_fuzz<10>(rng, 300, 30)) {
        return 1;
    }
    if (!run_equivalence_fuzz<2>(rng, 2000, 40)) {
        return 1;
    }
    if (!run_binary_precision_fuzz(rng, 500)) {
        return 1;
    }
    std::cout << "engine_equivalence passed\n";
    return 0;
}
