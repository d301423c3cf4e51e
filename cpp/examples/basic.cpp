#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include "portfolio_opt/portfolio_opt.hpp"
#include "sample_request.hpp"

using namespace portfolio_opt;

int main(int argc, char** argv) {
    std::cout << "Portfolio Optimization Example\n";
    std::cout << "==============================\n\n";

    // Request from a JSON file, or the built-in sample
    OptimizationRequest request;
    try {
        if (argc > 1) {
            std::ifstream in(argv[1]);
            if (!in) {
                std::cerr << "Cannot open " << argv[1] << "\n";
                return 1;
            }
            std::stringstream body;
            body << in.rdbuf();
            request = parse_request(body.str());
        } else {
            request = sample_request();
        }
        validate_request(request);
    } catch (const ValidationError& e) {
        std::cerr << "Invalid request (" << e.field() << "): " << e.what() << "\n";
        return 1;
    }

    uint64_t seed = request.seed.value_or(42);
    if (argc > 2) {
        try {
            seed = std::stoull(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "Invalid seed, using " << seed << ".\n";
        }
    }

    std::cout << "Assets:          " << request.dimension << "\n";
    std::cout << "Filing status:   " << to_string(request.filing_status) << "\n";
    std::cout << "Seed:            " << seed << "\n\n";

    SwarmOptimizer::Config config;
    config.n_particles = 40;
    config.max_iterations = 300;
    config.verbose = true;

    SwarmOptimizer optimizer(config);
    const OptimizationResult result = optimizer.optimize(request, seed, StopCondition::after(std::chrono::seconds(10)));

    const Metrics& m = result.score.metrics;
    std::cout << "\n[Result]\n";
    std::cout << "Feasible:        " << (result.score.feasible ? "yes" : "no") << "\n";
    std::cout << "Fitness:         " << result.score.fitness << "\n";
    std::cout << "Iterations:      " << result.iterations << " (" << to_string(result.termination_reason) << ")\n";
    std::cout << "Div growth:      " << m.agg_div_growth << "\n";
    std::cout << "CAGR:            " << m.agg_cagr << "\n";
    std::cout << "Net yield:       " << m.agg_yield << "\n";
    std::cout << "After-tax:       " << std::fixed << std::setprecision(2) << m.after_tax_income << "\n";
    std::cout << "Sector HHI:      " << m.sector_hhi << "\n\n";

    std::cout << "Weights:\n";
    std::cout << std::setprecision(4);
    for (size_t i = 0; i < result.weights.size(); ++i) {
        std::cout << "  [" << i << "] " << result.weights[i] << "\n";
    }

    std::cout << "\nJSON:\n" << to_json(result).dump(2) << "\n";
    return 0;
}
