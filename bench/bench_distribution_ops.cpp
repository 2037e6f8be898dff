// bench/bench_distribution_ops.cpp — Benchmark for distribution arithmetic on both representations.

#include <cstdint>
#include <random>

#include <benchmark/benchmark.h>

#include <padist/dist/distribution.hpp>
#include <padist/dist/space.hpp>
#include <padist/util/random.hpp>

namespace {

    enum class Operation : std::uint64_t {
        Add,
        Scale,
        Act,
        SolveDiffEqn,
    };

    constexpr std::uint64_t seed_offset(Operation op, bool bounded) noexcept {
        return 0xa5a5a5a5a5a5a5a5ull + (static_cast<std::uint64_t>(op) << 4) + (bounded ? 0x2u : 0x1u);
    }

    template <bool Bounded>
    void bench_distribution_operation(benchmark::State &state, Operation op, std::uint64_t seed) {
        const long precision = 10;
        const auto space = padist::dist::make_overconvergent_space(
            2, 5, precision,
            Bounded ? padist::dist::implementation::bounded : padist::dist::implementation::vector);
        std::mt19937_64 rng(seed + static_cast<std::uint64_t>(state.thread_index()));
        const padist::core::matrix2 translation(1, 1, 0, 1);
        for (auto _ : state) {
            state.PauseTiming();
            const auto lhs = space->random_element(precision, rng);
            const auto rhs = space->random_element(precision, rng);
            const auto g = padist::util::random_sigma0_matrix(rng, 5, 20);
            auto measure_zero = lhs.moments();
            if (!measure_zero.empty()) {
                measure_zero[0] = 0;
            }
            const auto difference = space->make(measure_zero);
            state.ResumeTiming();
            switch (op) {
            case Operation::Add:
                benchmark::DoNotOptimize(lhs + rhs);
                break;
            case Operation::Scale:
                benchmark::DoNotOptimize(lhs.scale(12));
                break;
            case Operation::Act:
                benchmark::DoNotOptimize(lhs.act_right(g));
                break;
            case Operation::SolveDiffEqn:
                benchmark::DoNotOptimize(difference.solve_diff_eqn().act_right(translation));
                break;
            }
        }
    }

} // namespace

BENCHMARK_CAPTURE(bench_distribution_operation<false>, add_vector, Operation::Add,
                  seed_offset(Operation::Add, false));
BENCHMARK_CAPTURE(bench_distribution_operation<true>, add_bounded, Operation::Add,
                  seed_offset(Operation::Add, true));

BENCHMARK_CAPTURE(bench_distribution_operation<false>, scale_vector, Operation::Scale,
                  seed_offset(Operation::Scale, false));
BENCHMARK_CAPTURE(bench_distribution_operation<true>, scale_bounded, Operation::Scale,
                  seed_offset(Operation::Scale, true));

BENCHMARK_CAPTURE(bench_distribution_operation<false>, act_vector, Operation::Act,
                  seed_offset(Operation::Act, false));
BENCHMARK_CAPTURE(bench_distribution_operation<true>, act_bounded, Operation::Act,
                  seed_offset(Operation::Act, true));

BENCHMARK_CAPTURE(bench_distribution_operation<false>, solve_vector, Operation::SolveDiffEqn,
                  seed_offset(Operation::SolveDiffEqn, false));
BENCHMARK_CAPTURE(bench_distribution_operation<true>, solve_bounded, Operation::SolveDiffEqn,
                  seed_offset(Operation::SolveDiffEqn, true));

BENCHMARK_MAIN();
