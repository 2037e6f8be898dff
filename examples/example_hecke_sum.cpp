// examples/example_hecke_sum.cpp — Sums the U_p coset action over worker threads sharing one cache.

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

#include <padist/padist.hpp>

int
main(int argc, char **argv) {
    using padist::core::matrix2;
    using padist::dist::distribution;
    using padist::io::operator<<;

    const long p = argc > 1 ? std::atol(argv[1]) : 5;
    const long precision = argc > 2 ? std::atol(argv[2]) : 12;
    const unsigned workers = std::max(1u, std::min(4u, std::thread::hardware_concurrency()));
    padist::util::set_verbosity(1);

    const auto space = padist::dist::make_overconvergent_space(2, p, precision);
    std::mt19937_64 rng(2024);
    const distribution v = space->random_element(std::nullopt, rng);

    // U_p = sum over a mod p of v | [1 a; 0 p]
    const padist::core::sigma0 monoid = space->monoid();
    std::vector<padist::core::sigma0_element> cosets;
    for (long a = 0; a < p; ++a) {
        cosets.push_back(monoid(matrix2(1, a, 0, p)));
    }

    std::vector<distribution> partial(workers, space->zero());
    std::vector<std::thread> threads;
    for (unsigned worker = 0; worker < workers; ++worker) {
        threads.emplace_back([&, worker] {
            for (std::size_t index = worker; index < cosets.size(); index += workers) {
                partial[worker] = partial[worker] + v.act_right(cosets[index]);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    distribution parallel = space->zero();
    for (const auto &piece : partial) {
        parallel = parallel + piece;
    }

    distribution serial = space->zero();
    for (const auto &g : cosets) {
        serial = serial + v.act_right(g);
    }

    std::cout << "v       = " << v << "\n";
    std::cout << "U_p(v)  = " << parallel << "\n";
    std::cout << "cached acting matrices: " << space->action().cache_size() << "\n";
    std::cout << (parallel == serial ? "parallel and serial sums agree\n"
                                     : "parallel and serial sums differ\n");
    return parallel == serial ? 0 : 1;
}
