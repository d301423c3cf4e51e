#include <chrono>
#include <iostream>
#include <string>
#include "portfolio_opt/portfolio_opt.hpp"
#include "sample_request.hpp"

using namespace portfolio_opt;

int main(int argc, char** argv) {
    int num_iterations = 500;
    int num_starts = 4;
    if (argc > 1) {
        try {
            num_iterations = std::stoi(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "Invalid iteration count, using default.\n";
        }
    }
    if (argc > 2) {
        try {
            num_starts = std::stoi(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "Invalid start count, using default.\n";
        }
    }

    const OptimizationRequest request = sample_request();
    const uint64_t seed = 42;

    SwarmOptimizer::Config config;
    config.max_iterations = num_iterations;
    config.stagnation_window = 0;    // Run the full budget

    auto benchmark = [&](const std::string& name, auto&& run) {
        // Warmup
        (void)run(seed);

        auto start = std::chrono::high_resolution_clock::now();
        const OptimizationResult result = run(seed + 1);
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        double seconds = duration.count() / 1e6;

        std::cout << "\n[" << name << "]\n";
        std::cout << "Iterations:      " << result.iterations << "\n";
        std::cout << "Time:            " << seconds << " s\n";
        std::cout << "Iter/s:          " << result.iterations / seconds << "\n";
        std::cout << "Fitness:         " << result.score.fitness << "\n";
        std::cout << "Feasible:        " << result.score.feasible << "\n";
    };

    SwarmOptimizer swarm(config);
    benchmark("Swarm", [&](uint64_t s) { return swarm.optimize(request, s); });

    MultiStartOptimizer::Config multistart;
    multistart.n_starts = num_starts;
    MultiStartOptimizer multi(config, multistart);
    benchmark("MultiStart x" + std::to_string(num_starts), [&](uint64_t s) { return multi.optimize(request, s); });

    return 0;
}
