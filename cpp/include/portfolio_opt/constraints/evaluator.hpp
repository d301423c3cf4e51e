#pragma once

#include "../core/types.hpp"
#include <span>

namespace portfolio_opt {

/**
 * Scores a candidate allocation against a request.
 *
 * fitness = div_pref * div_growth + cagr_pref * cagr + yield_pref * net_yield
 *         - penalty_coefficient * sum(violation^2)
 *
 * The squared penalty keeps a usable slope near the feasible boundary while
 * ranking violating candidates below feasible ones once the coefficient is
 * large relative to the objective. The evaluator holds only configuration,
 * so a single instance can be shared across threads.
 */
class ConstraintEvaluator {
public:
    struct Config {
        double penalty_coefficient{1e6};
        double tolerance{1e-6};     // Max violation still counted as satisfied
    };

    ConstraintEvaluator() = default;
    explicit ConstraintEvaluator(const Config& config) : config_(config) {}

    [[nodiscard]] Score evaluate(std::span<const double> weights, const OptimizationRequest& request) const;

    [[nodiscard]] Metrics compute_metrics(std::span<const double> weights, const OptimizationRequest& request) const;

    [[nodiscard]] Violations compute_violations(
        std::span<const double> weights,
        const Metrics& metrics,
        const OptimizationRequest& request
    ) const;

    // Herfindahl-Hirschman index of per-sector weight shares, scaled by 10000
    [[nodiscard]] static double sector_hhi(std::span<const double> weights, std::span<const int> sectors);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

}  // namespace portfolio_opt
