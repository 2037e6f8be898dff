// bench/bench_acting_matrix.cpp — Benchmark for acting-matrix construction and cache hits.

#include <cstdint>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>

#include <padist/action/weight_k_action.hpp>
#include <padist/dist/space.hpp>
#include <padist/util/random.hpp>

namespace {

    enum class Backend : std::uint64_t {
        Exact,
        Residue,
        Bounded,
    };

    constexpr std::uint64_t seed_offset(Backend backend) noexcept {
        return 0x5a5a5a5a5a5a5a5aull + (static_cast<std::uint64_t>(backend) << 4);
    }

    padist::dist::space_ptr space_for(Backend backend, long precision) {
        const auto impl = backend == Backend::Bounded ? padist::dist::implementation::bounded
                                                      : padist::dist::implementation::vector;
        return padist::dist::make_overconvergent_space(2, 5, precision, impl);
    }

    // Builds matrices directly, bypassing the cache.
    void bench_construction(benchmark::State &state, Backend backend, std::uint64_t seed) {
        const auto precision = static_cast<std::size_t>(state.range(0));
        const auto space = space_for(backend, static_cast<long>(precision));
        const auto &action = space->action();
        std::mt19937_64 rng(seed + static_cast<std::uint64_t>(state.thread_index()));
        for (auto _ : state) {
            const auto g = padist::util::random_sigma0_matrix(rng, 5, 50);
            switch (backend) {
            case Backend::Exact:
                benchmark::DoNotOptimize(action.compute_exact(g.key(), precision));
                break;
            case Backend::Residue:
                benchmark::DoNotOptimize(action.compute_residue(g.key(), precision));
                break;
            case Backend::Bounded:
                benchmark::DoNotOptimize(action.compute_bounded(g.key(), precision));
                break;
            }
        }
    }

    // Repeated requests for a handful of matrices, served from the cache after warm-up.
    void bench_cached(benchmark::State &state) {
        const auto precision = static_cast<std::size_t>(state.range(0));
        const auto space = space_for(Backend::Residue, static_cast<long>(precision));
        std::mt19937_64 rng(seed_offset(Backend::Residue));
        std::vector<padist::core::matrix2> matrices;
        for (int index = 0; index < 8; ++index) {
            matrices.push_back(padist::util::random_sigma0_matrix(rng, 5, 50));
        }
        std::size_t cursor = 0;
        for (auto _ : state) {
            benchmark::DoNotOptimize(space->action().acting_matrix(matrices[cursor], precision));
            cursor = (cursor + 1) % matrices.size();
        }
    }

} // namespace

BENCHMARK_CAPTURE(bench_construction, exact, Backend::Exact, seed_offset(Backend::Exact))
    ->RangeMultiplier(2)
    ->Range(4, 32);
BENCHMARK_CAPTURE(bench_construction, residue, Backend::Residue, seed_offset(Backend::Residue))
    ->RangeMultiplier(2)
    ->Range(4, 32);
BENCHMARK_CAPTURE(bench_construction, bounded, Backend::Bounded, seed_offset(Backend::Bounded))
    ->DenseRange(4, 12, 4);
BENCHMARK(bench_cached)->RangeMultiplier(2)->Range(4, 32)->Threads(1)->Threads(4);

BENCHMARK_MAIN();
