#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "portfolio_opt/portfolio_opt.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>

using namespace portfolio_opt;
using namespace portfolio_opt::testing;
using Catch::Approx;

namespace {

SwarmOptimizer::Config small_config() {
    SwarmOptimizer::Config config;
    config.n_particles = 20;
    config.max_iterations = 60;
    return config;
}

void require_valid_candidate(const OptimizationResult& result, const OptimizationRequest& request) {
    REQUIRE(result.weights.size() == static_cast<size_t>(request.dimension));
    REQUIRE(weight_sum(result.weights) == Approx(1.0).margin(1e-9));
    for (size_t i = 0; i < result.weights.size(); ++i) {
        REQUIRE(result.weights[i] >= request.lower_bounds[i]);
        REQUIRE(result.weights[i] <= request.upper_bounds[i]);
    }
}

}  // namespace

TEST_CASE("RNG", "[swarm]") {
    SECTION("Reproducibility") {
        RNG rng1(42);
        RNG rng2(42);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(rng1.next() == rng2.next());
        }
    }

    SECTION("Uniform distribution") {
        RNG rng(123);
        double sum = 0.0;
        int n = 10000;
        for (int i = 0; i < n; ++i) {
            double v = rng.uniform();
            REQUIRE(v >= 0.0);
            REQUIRE(v < 1.0);
            sum += v;
        }
        REQUIRE(sum / n == Approx(0.5).margin(0.05));
    }

    SECTION("Ranged uniform") {
        RNG rng(7);
        for (int i = 0; i < 1000; ++i) {
            double v = rng.uniform(-0.25, 0.75);
            REQUIRE(v >= -0.25);
            REQUIRE(v < 0.75);
        }
    }

    SECTION("Split streams differ") {
        RNG rng(42);
        RNG child = rng.split();
        REQUIRE(child.next() != rng.next());
    }

    SECTION("Requested seeds are used as given") {
        REQUIRE(seed_or_secure(uint64_t{0}) == 0);
        REQUIRE(seed_or_secure(uint64_t{12345}) == 12345);
        REQUIRE(seed_or_secure(std::numeric_limits<uint64_t>::max()) == std::numeric_limits<uint64_t>::max());
        // Without a request, two draws from the entropy source almost surely differ
        REQUIRE(seed_or_secure(std::nullopt) != seed_or_secure(std::nullopt));
    }
}

TEST_CASE("Swarm candidates", "[swarm]") {
    SwarmOptimizer optimizer(small_config());

    SECTION("Returned weights lie on the bounded simplex") {
        const OptimizationRequest request = make_mixed_request();
        for (uint64_t seed : {1ULL, 2ULL, 3ULL, 99ULL}) {
            const OptimizationResult result = optimizer.optimize(request, seed);
            require_valid_candidate(result, request);
            REQUIRE(result.seed == seed);
        }
    }

    SECTION("Initial population lies on the bounded simplex") {
        const OptimizationRequest request = make_mixed_request();
        RNG rng(5);
        const auto swarm = optimizer.init_swarm(request, rng);
        REQUIRE(swarm.particles.size() == 20);
        for (const auto& p : swarm.particles) {
            REQUIRE(weight_sum(p.position) == Approx(1.0).margin(1e-9));
            REQUIRE(p.best_score.fitness <= swarm.best_score.fitness);
        }
    }

    SECTION("Result score matches the evaluator on the returned weights") {
        const OptimizationRequest request = make_mixed_request();
        const OptimizationResult result = optimizer.optimize(request, 11);
        const Score rescored = optimizer.evaluator().evaluate(result.weights, request);
        REQUIRE(rescored.fitness == result.score.fitness);
        REQUIRE(rescored.feasible == result.score.feasible);
    }

    SECTION("Constraints with slack at the optimum are satisfied") {
        OptimizationRequest request = make_mixed_request();
        request.redistribution_threshold = 1.0;
        request.min_yield = 0.01;
        request.required_income = 3000.0;

        SwarmOptimizer::Config config;
        config.n_particles = 40;
        config.max_iterations = 300;
        const OptimizationResult result = SwarmOptimizer(config).optimize(request, 2024);
        REQUIRE(result.score.feasible);
        require_valid_candidate(result, request);
    }
}

TEST_CASE("Swarm determinism and monotonicity", "[swarm]") {
    const OptimizationRequest request = make_mixed_request();

    SECTION("Same seed gives identical results") {
        SwarmOptimizer optimizer(small_config());
        const OptimizationResult a = optimizer.optimize(request, 1234);
        const OptimizationResult b = optimizer.optimize(request, 1234);
        REQUIRE(a.weights == b.weights);
        REQUIRE(a.score.fitness == b.score.fitness);
        REQUIRE(a.iterations == b.iterations);
        REQUIRE(a.fitness_history == b.fitness_history);
    }

    SECTION("Parallel initial evaluation does not change the result") {
        SwarmOptimizer::Config config = small_config();
        const OptimizationResult serial = SwarmOptimizer(config).optimize(request, 77);
        config.eval_threads = 4;
        const OptimizationResult parallel = SwarmOptimizer(config).optimize(request, 77);
        REQUIRE(serial.weights == parallel.weights);
    }

    SECTION("Global best never decreases") {
        SwarmOptimizer::Config config = small_config();
        config.stagnation_window = 0;
        const OptimizationResult result = SwarmOptimizer(config).optimize(request, 8);
        REQUIRE(result.fitness_history.size() == static_cast<size_t>(result.iterations));
        for (size_t i = 1; i < result.fitness_history.size(); ++i) {
            REQUIRE(result.fitness_history[i] >= result.fitness_history[i - 1]);
        }
        REQUIRE(result.fitness_history.back() == result.score.fitness);
    }

    SECTION("Manual stepping keeps the global best") {
        SwarmOptimizer optimizer(small_config());
        RNG rng(3);
        auto swarm = optimizer.init_swarm(request, rng);
        double best = swarm.best_score.fitness;
        for (int i = 0; i < 20; ++i) {
            const bool improved = optimizer.step(swarm, request, rng);
            REQUIRE(swarm.best_score.fitness >= best);
            REQUIRE(improved == (swarm.best_score.fitness > best));
            best = swarm.best_score.fitness;
        }
    }
}

TEST_CASE("Swarm scenarios", "[swarm]") {
    SECTION("Dominant asset takes the whole allocation") {
        OptimizationRequest request = make_request(3);
        request.columns.div_growth_rates = {0.5, 0.0, 0.0};
        request.columns.cagr_rates = {0.5, 0.0, 0.0};
        request.columns.yields = {0.5, 0.0, 0.0};
        request.columns.expense_ratios = {0.0, 0.0, 0.0};

        SwarmOptimizer::Config config;
        config.max_iterations = 300;
        const OptimizationResult result = SwarmOptimizer(config).optimize(request, 42);
        REQUIRE(result.score.feasible);
        REQUIRE(result.weights[0] > 0.95);
        require_valid_candidate(result, request);
    }

    SECTION("Unsatisfiable floor exhausts the budget and reports the violation") {
        OptimizationRequest request = make_mixed_request();
        request.min_cagr = 0.5;

        SwarmOptimizer::Config config = small_config();
        config.stagnation_window = 0;
        const OptimizationResult result = SwarmOptimizer(config).optimize(request, 5);
        REQUIRE_FALSE(result.score.feasible);
        REQUIRE(result.termination_reason == TerminationReason::MaxIterations);
        REQUIRE(result.iterations == config.max_iterations);

        double cagr = 0.0;
        for (size_t i = 0; i < result.weights.size(); ++i) {
            cagr += result.weights[i] * request.columns.cagr_rates[i];
        }
        REQUIRE(result.score.violations.cagr == Approx(0.5 - cagr));
    }

    SECTION("Unreachable bounds are reported, not rejected") {
        OptimizationRequest request = make_request(3);
        request.upper_bounds = {0.2, 0.2, 0.2};
        const OptimizationResult result = SwarmOptimizer(small_config()).optimize(request, 1);
        REQUIRE_FALSE(result.score.feasible);
        REQUIRE(result.score.violations.simplex == Approx(0.4));
    }

    SECTION("Deadline shorter than the iteration budget") {
        SwarmOptimizer::Config config;
        config.max_iterations = 10000000;
        config.stagnation_window = 0;
        const OptimizationResult result = SwarmOptimizer(config).optimize(
            make_mixed_request(), 3, StopCondition::after(std::chrono::milliseconds(50))
        );
        REQUIRE(result.termination_reason == TerminationReason::DeadlineExceeded);
        REQUIRE(result.iterations < config.max_iterations);
        REQUIRE(weight_sum(result.weights) == Approx(1.0).margin(1e-9));
    }

    SECTION("Expired deadline returns the initial best") {
        const OptimizationResult result = SwarmOptimizer(small_config()).optimize(
            make_mixed_request(), 3, StopCondition::after(std::chrono::milliseconds(0))
        );
        REQUIRE(result.termination_reason == TerminationReason::DeadlineExceeded);
        REQUIRE(result.iterations == 0);
        REQUIRE(result.weights.size() == 5);
    }

    SECTION("Cancellation wins over the deadline") {
        std::atomic<bool> cancel{true};
        StopCondition stop = StopCondition::after(std::chrono::milliseconds(0));
        stop.cancel_flag = &cancel;
        const OptimizationResult result = SwarmOptimizer(small_config()).optimize(make_mixed_request(), 3, stop);
        REQUIRE(result.termination_reason == TerminationReason::Cancelled);
    }

    SECTION("Stagnation stops a converged search") {
        OptimizationRequest request = make_request(4);   // Every allocation scores the same
        SwarmOptimizer::Config config = small_config();
        config.max_iterations = 1000;
        config.stagnation_window = 10;
        const OptimizationResult result = SwarmOptimizer(config).optimize(request, 9);
        REQUIRE(result.termination_reason == TerminationReason::Stagnation);
        REQUIRE(result.iterations == 10);
    }

    SECTION("Invalid configuration") {
        SwarmOptimizer::Config config;
        config.n_particles = 0;
        REQUIRE_THROWS_AS(SwarmOptimizer(config).optimize(make_request(2), 1), std::invalid_argument);
    }

    SECTION("Malformed requests are rejected before any evaluation") {
        OptimizationRequest request = make_mixed_request();
        request.columns.yields.resize(2);
        REQUIRE_THROWS_AS(SwarmOptimizer(small_config()).optimize(request, 1), ValidationError);

        request = make_mixed_request();
        request.columns.cagr_rates.clear();
        REQUIRE_THROWS_AS(MultiStartOptimizer(small_config(), {}).optimize(request, 1), ValidationError);
    }
}

TEST_CASE("Multi-start", "[swarm]") {
    const OptimizationRequest request = make_mixed_request();
    MultiStartOptimizer::Config multistart;
    multistart.n_starts = 4;

    SECTION("Deterministic for a fixed seed") {
        MultiStartOptimizer optimizer(small_config(), multistart);
        const OptimizationResult a = optimizer.optimize(request, 31);
        const OptimizationResult b = optimizer.optimize(request, 31);
        REQUIRE(a.weights == b.weights);
        REQUIRE(a.score.fitness == b.score.fitness);
        REQUIRE(a.seed == 31);
        require_valid_candidate(a, request);
    }

    SECTION("Thread count does not change the winner") {
        multistart.n_threads = 1;
        const OptimizationResult serial = MultiStartOptimizer(small_config(), multistart).optimize(request, 31);
        multistart.n_threads = 4;
        const OptimizationResult parallel = MultiStartOptimizer(small_config(), multistart).optimize(request, 31);
        REQUIRE(serial.weights == parallel.weights);
    }

    SECTION("Winner is the best of the individual starts") {
        MultiStartOptimizer optimizer(small_config(), multistart);
        const OptimizationResult best = optimizer.optimize(request, 31);

        RNG master(31);
        SwarmOptimizer single(small_config());
        for (int k = 0; k < multistart.n_starts; ++k) {
            const OptimizationResult start = single.optimize(request, master.next_u64());
            REQUIRE(best.score.fitness >= start.score.fitness);
        }
    }

    SECTION("Single start is a plain swarm run") {
        multistart.n_starts = 1;
        const OptimizationResult multi = MultiStartOptimizer(small_config(), multistart).optimize(request, 17);
        const OptimizationResult single = SwarmOptimizer(small_config()).optimize(request, 17);
        REQUIRE(multi.weights == single.weights);
    }
}
