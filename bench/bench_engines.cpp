// bench/bench_engines.cpp — Benchmark for the full and simplified engines behind the dispatch facade.

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>

#include <rmath/rmathlib.hpp>

namespace {

    enum class Operation : std::uint64_t {
        Add,
        Multiply,
        Divide,
        Quantize,
        SquareRoot,
    };

    constexpr std::size_t OPERAND_POOL = 256;

    constexpr std::uint64_t seed_offset(Operation op, bool simplified) noexcept {
        return 0x5a5a5a5a5a5a5a5aull + (static_cast<std::uint64_t>(op) << 4) +
               (simplified ? 0x2u : 0x1u);
    }

    const rmath::decimal_math &math() {
        static const rmath::decimal_math instance;
        return instance;
    }

    std::vector<rmath::decimal> operand_pool(std::mt19937_64 &rng, std::size_t max_digits) {
        std::vector<rmath::decimal> pool;
        pool.reserve(OPERAND_POOL);
        while (pool.size() < OPERAND_POOL) {
            auto value = rmath::util::random_number<10>(rng, max_digits, 8);
            if (!value.is_zero()) {
                pool.push_back(std::move(value));
            }
        }
        return pool;
    }

    void bench_decimal_operation(benchmark::State &state, Operation op, bool simplified,
                                 std::uint64_t seed) {
        std::mt19937_64 rng(seed + static_cast<std::uint64_t>(state.thread_index()));
        const auto digits = static_cast<std::size_t>(state.range(0));
        const auto lhs = operand_pool(rng, digits);
        const auto rhs = operand_pool(rng, digits);
        const rmath::context ctx = rmath::context::decimal64().with_simplified(simplified);
        const rmath::decimal pattern = rmath::io::decimal_from_string("0.01");
        std::size_t index = 0;
        for (auto _ : state) {
            const auto &a = lhs[index % OPERAND_POOL];
            const auto &b = rhs[index % OPERAND_POOL];
            ++index;
            rmath::status st;
            rmath::decimal result;
            switch (op) {
            case Operation::Add:
                result = math().add(a, b, ctx, st);
                break;
            case Operation::Multiply:
                result = math().multiply(a, b, ctx, st);
                break;
            case Operation::Divide:
                result = math().divide(a, b, ctx, st);
                break;
            case Operation::Quantize:
                result = math().quantize(a, pattern, ctx, st);
                break;
            case Operation::SquareRoot:
                result = math().square_root(math().abs(a, ctx, st), ctx, st);
                break;
            }
            benchmark::DoNotOptimize(result);
        }
        state.SetItemsProcessed(state.iterations());
    }

    void bench_pi(benchmark::State &state) {
        const rmath::context ctx =
            rmath::context{}.with_precision(static_cast<std::size_t>(state.range(0)));
        for (auto _ : state) {
            rmath::status st;
            benchmark::DoNotOptimize(math().pi(ctx, st));
        }
    }

} // namespace

BENCHMARK_CAPTURE(bench_decimal_operation, add_full, Operation::Add, false,
                  seed_offset(Operation::Add, false))
    ->Arg(8)
    ->Arg(16);
BENCHMARK_CAPTURE(bench_decimal_operation, add_simplified, Operation::Add, true,
                  seed_offset(Operation::Add, true))
    ->Arg(8)
    ->Arg(16);

BENCHMARK_CAPTURE(bench_decimal_operation, multiply_full, Operation::Multiply, false,
                  seed_offset(Operation::Multiply, false))
    ->Arg(8)
    ->Arg(16);
BENCHMARK_CAPTURE(bench_decimal_operation, multiply_simplified, Operation::Multiply, true,
                  seed_offset(Operation::Multiply, true))
    ->Arg(8)
    ->Arg(16);

BENCHMARK_CAPTURE(bench_decimal_operation, divide_full, Operation::Divide, false,
                  seed_offset(Operation::Divide, false))
    ->Arg(8)
    ->Arg(16);
BENCHMARK_CAPTURE(bench_decimal_operation, divide_simplified, Operation::Divide, true,
                  seed_offset(Operation::Divide, true))
    ->Arg(8)
    ->Arg(16);

BENCHMARK_CAPTURE(bench_decimal_operation, quantize_full, Operation::Quantize, false,
                  seed_offset(Operation::Quantize, false))
    ->Arg(8);
BENCHMARK_CAPTURE(bench_decimal_operation, quantize_simplified, Operation::Quantize, true,
                  seed_offset(Operation::Quantize, true))
    ->Arg(8);

BENCHMARK_CAPTURE(bench_decimal_operation, square_root_full, Operation::SquareRoot, false,
                  seed_offset(Operation::SquareRoot, false))
    ->Arg(16);

BENCHMARK(bench_pi)->Arg(16)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
