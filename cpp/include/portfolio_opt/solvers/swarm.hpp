#pragma once

#include "stop_condition.hpp"
#include "../core/types.hpp"
#include "../core/validation.hpp"
#include "../constraints/evaluator.hpp"
#include "../constraints/simplex.hpp"
#include "../random/rng.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace portfolio_opt {

/**
 * Particle Swarm Optimization over portfolio weights.
 *
 * PSO maintains a swarm of candidate allocations (particles) that explore
 * the bounded simplex. Each particle has:
 * - Position: current weight vector (sum == 1, within bounds)
 * - Velocity: direction and speed of movement
 * - Personal best: best position this particle has found
 * - Global best: best position any particle has found
 *
 * Particles update their velocities based on:
 * - Inertia (w): continue in current direction
 * - Cognitive (c1): move toward personal best
 * - Social (c2): move toward global best
 *
 * After every move the position is clamped to the bounds and repaired
 * onto the simplex with a capped number of passes. The global best is
 * replaced only on strict improvement, so its fitness never decreases.
 *
 * A swarm is owned by a single optimize() call; nothing is shared between
 * runs, so concurrent optimize() calls on one instance are safe.
 */
class SwarmOptimizer {
public:
    struct Config {
        int n_particles{40};            // Number of particles in swarm
        int max_iterations{200};        // Iteration budget
        double w{0.7};                  // Inertia weight (0.4-0.9 typical)
        double c1{1.5};                 // Cognitive coefficient
        double c2{1.5};                 // Social coefficient
        double init_velocity{0.1};      // Initial velocity, fraction of bound range
        double vel_max{0.2};            // Maximum velocity, fraction of bound range
        int stagnation_window{25};      // Stop after this many flat iterations (0 disables)
        double stagnation_epsilon{1e-9};
        int repair_passes{8};           // Cap on simplex repair passes per move
        int eval_threads{1};            // OpenMP threads for the initial evaluation
        bool verbose{false};
    };

    struct Particle {
        Weights position;
        std::vector<double> velocity;
        Weights best_position;
        Score best_score;
    };

    struct Swarm {
        std::vector<Particle> particles;
        Weights best_position;
        Score best_score;
    };

    SwarmOptimizer() = default;
    explicit SwarmOptimizer(const Config& config, const ConstraintEvaluator::Config& evaluator_config = {})
        : config_(config), evaluator_(evaluator_config) {}

    // Run a full search. Throws ValidationError for a malformed request.
    [[nodiscard]] OptimizationResult optimize(
        const OptimizationRequest& request,
        uint64_t seed,
        const StopCondition& stop = {}
    ) const;

    // Draw and evaluate the initial population
    [[nodiscard]] Swarm init_swarm(const OptimizationRequest& request, RNG& rng) const;

    // One sweep over all particles; returns true if the global best improved
    bool step(Swarm& swarm, const OptimizationRequest& request, RNG& rng) const;

    [[nodiscard]] const Config& config() const { return config_; }
    Config& config() { return config_; }
    [[nodiscard]] const ConstraintEvaluator& evaluator() const { return evaluator_; }

private:
    Config config_;
    ConstraintEvaluator evaluator_;

    // Clip velocity to a fraction of each coordinate's bound range
    void clip_velocity(Particle& p, const OptimizationRequest& request) const;

    // Clamp to bounds and repair onto the simplex
    void repair(Weights& position, const OptimizationRequest& request) const;

    void check_config() const;
};

// Implementation

inline void SwarmOptimizer::check_config() const {
    if (config_.n_particles < 1) {
        throw std::invalid_argument("SwarmOptimizer requires at least one particle");
    }
    if (config_.max_iterations < 0) {
        throw std::invalid_argument("SwarmOptimizer max_iterations must be non-negative");
    }
}

inline void SwarmOptimizer::clip_velocity(Particle& p, const OptimizationRequest& request) const {
    for (size_t d = 0; d < p.velocity.size(); ++d) {
        const double v_max = config_.vel_max * (request.upper_bounds[d] - request.lower_bounds[d]);
        p.velocity[d] = std::clamp(p.velocity[d], -v_max, v_max);
    }
}

inline void SwarmOptimizer::repair(Weights& position, const OptimizationRequest& request) const {
    (void)project_to_simplex(
        position, request.lower_bounds, request.upper_bounds, config_.repair_passes
    );
}

inline SwarmOptimizer::Swarm SwarmOptimizer::init_swarm(const OptimizationRequest& request, RNG& rng) const {
    check_config();
    const size_t n_assets = static_cast<size_t>(request.dimension);
    const int n_particles = config_.n_particles;

    Swarm swarm;
    swarm.particles.resize(static_cast<size_t>(n_particles));

    // Positions and velocities are drawn sequentially for reproducibility
    for (auto& p : swarm.particles) {
        p.position.resize(n_assets);
        p.velocity.resize(n_assets);
        for (size_t d = 0; d < n_assets; ++d) {
            const double lo = request.lower_bounds[d];
            const double hi = request.upper_bounds[d];
            const double v0 = config_.init_velocity * (hi - lo);
            p.position[d] = rng.uniform(lo, hi);
            p.velocity[d] = rng.uniform(-v0, v0);
        }
        repair(p.position, request);
        p.best_position = p.position;
    }

    // Evaluation is pure and may run in parallel
    std::vector<std::exception_ptr> errors(static_cast<size_t>(n_particles));
    #ifdef _OPENMP
    #pragma omp parallel for schedule(static) num_threads(std::max(1, config_.eval_threads)) if(config_.eval_threads > 1)
    #endif
    for (int i = 0; i < n_particles; ++i) {
        try {
            auto& p = swarm.particles[static_cast<size_t>(i)];
            p.best_score = evaluator_.evaluate(p.position, request);
        } catch (...) {
            errors[static_cast<size_t>(i)] = std::current_exception();
        }
    }
    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    // Seed global best (first particle wins ties)
    const Particle* best = &swarm.particles[0];
    for (const auto& p : swarm.particles) {
        if (p.best_score.fitness > best->best_score.fitness) {
            best = &p;
        }
    }
    swarm.best_position = best->best_position;
    swarm.best_score = best->best_score;
    return swarm;
}

inline bool SwarmOptimizer::step(Swarm& swarm, const OptimizationRequest& request, RNG& rng) const {
    bool improved = false;

    for (auto& p : swarm.particles) {
        // v = w*v + c1*r1*(pbest - x) + c2*r2*(gbest - x), fresh r1/r2 per dimension
        for (size_t d = 0; d < p.position.size(); ++d) {
            const double r1 = rng.uniform();
            const double r2 = rng.uniform();
            p.velocity[d] = config_.w * p.velocity[d]
                          + config_.c1 * r1 * (p.best_position[d] - p.position[d])
                          + config_.c2 * r2 * (swarm.best_position[d] - p.position[d]);
        }

        clip_velocity(p, request);

        for (size_t d = 0; d < p.position.size(); ++d) {
            p.position[d] += p.velocity[d];
        }
        repair(p.position, request);

        // Evaluate new position
        Score score = evaluator_.evaluate(p.position, request);

        // Update personal best
        if (score.fitness > p.best_score.fitness) {
            p.best_position = p.position;
            p.best_score = score;

            // Update global best
            if (score.fitness > swarm.best_score.fitness) {
                swarm.best_position = p.position;
                swarm.best_score = std::move(score);
                improved = true;
            }
        }
    }

    return improved;
}

inline OptimizationResult SwarmOptimizer::optimize(
    const OptimizationRequest& request,
    uint64_t seed,
    const StopCondition& stop
) const {
    validate_request(request);
    RNG rng(seed);
    Swarm swarm = init_swarm(request, rng);

    OptimizationResult result;
    result.seed = seed;
    result.termination_reason = TerminationReason::MaxIterations;
    result.fitness_history.reserve(static_cast<size_t>(config_.max_iterations));

    int stagnant = 0;
    int iteration = 0;
    for (;;) {
        if (iteration >= config_.max_iterations) {
            result.termination_reason = TerminationReason::MaxIterations;
            break;
        }
        // Cooperative cancellation: only consulted between iterations
        if (const auto reason = stop.check()) {
            result.termination_reason = *reason;
            break;
        }

        const double previous_best = swarm.best_score.fitness;
        (void)step(swarm, request, rng);
        ++iteration;
        result.fitness_history.push_back(swarm.best_score.fitness);

        if (config_.verbose && iteration % 50 == 0) {
            std::cout << "[swarm] iter " << iteration
                      << " best=" << swarm.best_score.fitness
                      << " feasible=" << swarm.best_score.feasible << "\n";
        }

        if (config_.stagnation_window > 0) {
            if (swarm.best_score.fitness - previous_best < config_.stagnation_epsilon) {
                ++stagnant;
            } else {
                stagnant = 0;
            }
            if (stagnant >= config_.stagnation_window) {
                result.termination_reason = TerminationReason::Stagnation;
                break;
            }
        }
    }

    result.weights = std::move(swarm.best_position);
    result.score = std::move(swarm.best_score);
    result.iterations = iteration;
    ensure_finite(result);

    if (config_.verbose) {
        std::cout << "[swarm] done after " << result.iterations << " iterations ("
                  << to_string(result.termination_reason) << "), fitness="
                  << result.score.fitness << "\n";
    }
    return result;
}

}  // namespace portfolio_opt
