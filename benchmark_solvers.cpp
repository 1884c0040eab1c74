#include "RandomScenarioGenerator.hpp"
#include "SpatialOptimizer.hpp"
#include "SLSQP.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using Clock = std::chrono::steady_clock;

// Wall time of one call, in milliseconds.
template <class F>
double elapsed_ms(F&& f) {
    const Clock::time_point start = Clock::now();
    std::forward<F>(f)();
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

// Per-method timing summary: Welford mean/variance plus the extremes.
struct TimingSummary {
    int samples = 0;
    double mean_ms = 0.0;
    double sq_dev = 0.0;
    double min_ms = std::numeric_limits<double>::infinity();
    double max_ms = 0.0;

    void add(double ms) {
        ++samples;
        const double before = ms - mean_ms;
        mean_ms += before / samples;
        sq_dev += before * (ms - mean_ms);
        min_ms = std::min(min_ms, ms);
        max_ms = std::max(max_ms, ms);
    }

    double stddev_ms() const {
        return samples > 1 ? std::sqrt(sq_dev / (samples - 1)) : 0.0;
    }
};

int main(int argc, char** argv) {
    std::cout.setf(std::ios::fixed);
    std::cout.precision(9);

    // ./benchmark_solvers 100
    int num_trials = 50;
    if (argc >= 2) {
        num_trials = std::stoi(argv[1]);
    }
    if (num_trials <= 0) {
        std::cerr << "Error: trials must be positive.\n";
        return 1;
    }

    const int n_values[] = {3, 10, 100, 1000};

    const std::string filename = "benchmark_results.csv";
    std::ofstream ofs(filename);
    if (!ofs) {
        std::cerr << "Error: could not open " << filename << " for writing.\n";
        return 1;
    }

    ofs << "n,method,mean_ms,std_ms,min_ms,max_ms,max_disagreement_km,num_trials\n";

    try {
        for (int n : n_values) {
            TimingSummary stats_unconstrained;
            TimingSummary stats_lagrange;
            TimingSummary stats_slsqp;
            double max_gap = 0.0;

            const unsigned long long base_seed = 12345ull + 10ull * static_cast<unsigned long long>(n);

            for (int trial = 0; trial < num_trials; ++trial) {
                RandomScenarioGenerator::Options opt;
                opt.n = n;
                opt.origin = GeodeticPoint{-34.6, -58.38};
                opt.spread_km = 5.0;
                opt.vertical_street = (trial % 5 == 0);
                opt.seed = base_seed + static_cast<unsigned long long>(trial);

                RandomScenarioGenerator gen(opt);
                const auto sc = gen.generate();

                // Each run gets its own optimizer; nothing is shared between trials
                const SpatialOptimizer so(sc.origin, sc.amenities);
                const LinearConstraint street(so.projector().to_planar(sc.street_a),
                                              so.projector().to_planar(sc.street_b));

                OptimizationResult unc{}, con{};
                NloptResult num{};

                stats_unconstrained.add(elapsed_ms([&]() { unc = so.optimize(); }));
                stats_lagrange.add(elapsed_ms([&]() { con = so.optimize_on_line(sc.street_a, sc.street_b); }));
                stats_slsqp.add(elapsed_ms([&]() {
                    num = minimize_slsqp(so.model(), unc.planar, &street, NloptOptions{});
                }));

                const double gap = std::hypot(num.point.x - con.planar.x, num.point.y - con.planar.y);
                if (gap > max_gap) max_gap = gap;
            }

            auto write_row = [&](const std::string& method, const TimingSummary& st, double gap) {
                ofs << n << ","
                    << method << ","
                    << st.mean_ms << ","
                    << st.stddev_ms() << ","
                    << st.min_ms << ","
                    << st.max_ms << ","
                    << gap << ","
                    << st.samples << "\n";
            };

            write_row("Analytic-Unconstrained", stats_unconstrained, 0.0);
            write_row("Analytic-Lagrange",      stats_lagrange,      0.0);
            write_row("SLSQP",                  stats_slsqp,         max_gap);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    ofs.close();
    std::cerr << "Wrote CSV to " << filename << "\n";
    return 0;
}
