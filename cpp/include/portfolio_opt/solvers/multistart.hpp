#pragma once

#include "swarm.hpp"
#include <exception>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace portfolio_opt {

/**
 * Runs several independent swarms from pre-split seeds and keeps the best.
 *
 * Seeds are split sequentially from the master seed before the parallel
 * region, and the winner is picked in start order, so the result does not
 * depend on thread scheduling. Each start owns its own swarm.
 */
class MultiStartOptimizer {
public:
    struct Config {
        int n_starts{4};
        int n_threads{0};   // 0: OpenMP default
    };

    MultiStartOptimizer(
        const SwarmOptimizer::Config& swarm_config,
        const Config& config,
        const ConstraintEvaluator::Config& evaluator_config = {}
    ) : swarm_(swarm_config, evaluator_config), config_(config) {}

    [[nodiscard]] OptimizationResult optimize(
        const OptimizationRequest& request,
        uint64_t seed,
        const StopCondition& stop = {}
    ) const;

    [[nodiscard]] const SwarmOptimizer& swarm() const { return swarm_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    SwarmOptimizer swarm_;
    Config config_;
};

// Implementation

inline OptimizationResult MultiStartOptimizer::optimize(
    const OptimizationRequest& request,
    uint64_t seed,
    const StopCondition& stop
) const {
    const int n_starts = std::max(1, config_.n_starts);
    if (n_starts == 1) {
        return swarm_.optimize(request, seed, stop);
    }

    // Pre-split seeds (must be done sequentially for reproducibility)
    RNG master(seed);
    std::vector<uint64_t> seeds;
    seeds.reserve(static_cast<size_t>(n_starts));
    for (int k = 0; k < n_starts; ++k) {
        seeds.push_back(master.next_u64());
    }

    std::vector<OptimizationResult> results(static_cast<size_t>(n_starts));
    std::vector<std::exception_ptr> errors(static_cast<size_t>(n_starts));

    auto run_start = [&](int k) {
        try {
            results[static_cast<size_t>(k)] = swarm_.optimize(request, seeds[static_cast<size_t>(k)], stop);
        } catch (...) {
            errors[static_cast<size_t>(k)] = std::current_exception();
        }
    };

    #ifdef _OPENMP
    const int n_threads = config_.n_threads > 0 ? config_.n_threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(n_threads)
    for (int k = 0; k < n_starts; ++k) {
        run_start(k);
    }
    #else
    for (int k = 0; k < n_starts; ++k) {
        run_start(k);
    }
    #endif

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    size_t best = 0;
    for (size_t k = 1; k < results.size(); ++k) {
        if (results[k].score.fitness > results[best].score.fitness) {
            best = k;
        }
    }

    OptimizationResult winner = std::move(results[best]);
    winner.seed = seed;
    return winner;
}

}  // namespace portfolio_opt
