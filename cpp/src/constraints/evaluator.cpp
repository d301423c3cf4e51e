#include "portfolio_opt/constraints/evaluator.hpp"
#include "portfolio_opt/constraints/simplex.hpp"
#include "portfolio_opt/tax/tax_model.hpp"
#include "portfolio_opt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>

namespace portfolio_opt {

namespace {

double weighted_sum(std::span<const double> weights, const std::vector<double>& values) {
    double sum = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        sum += weights[i] * values[i];
    }
    return sum;
}

}  // namespace

double ConstraintEvaluator::sector_hhi(std::span<const double> weights, std::span<const int> sectors) {
    std::map<int, double> allocations;
    double total = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        allocations[sectors[i]] += weights[i];
        total += weights[i];
    }
    if (total <= 0.0) {
        return 0.0;
    }

    double hhi = 0.0;
    for (const auto& [sector, allocation] : allocations) {
        const double share = allocation / total;
        hhi += share * share;
    }
    return hhi * 10000.0;
}

Metrics ConstraintEvaluator::compute_metrics(
    std::span<const double> weights,
    const OptimizationRequest& request
) const {
    const auto& columns = request.columns;
    Metrics metrics;

    metrics.agg_div_growth = weighted_sum(weights, columns.div_growth_rates);
    metrics.agg_cagr = weighted_sum(weights, columns.cagr_rates);
    metrics.gross_yield = weighted_sum(weights, columns.yields);
    metrics.expense_ratio = weighted_sum(weights, columns.expense_ratios);
    metrics.agg_yield = metrics.gross_yield - metrics.expense_ratio;

    double qualified = 0.0;
    double non_qualified = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        const double income = weights[i] * columns.yields[i] * request.initial_capital;
        if (columns.qualified[i]) {
            qualified += income;
        } else {
            non_qualified += income;
        }
    }
    if (!std::isfinite(qualified) || !std::isfinite(non_qualified)) {
        throw InternalFault("dividend income is not finite");
    }
    // Pools cannot go below zero for tax purposes
    metrics.qualified_income = std::max(0.0, qualified);
    metrics.non_qualified_income = std::max(0.0, non_qualified);

    // Net portfolio income: dividends minus the tax they add on top of salary
    const double with_portfolio = after_tax_income(
        metrics.qualified_income,
        request.salary + metrics.non_qualified_income,
        request.filing_status
    );
    const double salary_only = after_tax_income(0.0, request.salary, request.filing_status);
    metrics.after_tax_income = with_portfolio - salary_only;

    metrics.sector_hhi = sector_hhi(weights, columns.sector);
    return metrics;
}

Violations ConstraintEvaluator::compute_violations(
    std::span<const double> weights,
    const Metrics& metrics,
    const OptimizationRequest& request
) const {
    Violations v;
    v.div_growth = std::max(0.0, request.min_div_growth - metrics.agg_div_growth);
    v.cagr = std::max(0.0, request.min_cagr - metrics.agg_cagr);
    v.yield = std::max(0.0, request.min_yield - metrics.agg_yield);
    v.income = std::max(0.0, request.required_income - metrics.after_tax_income);

    const double n = static_cast<double>(weights.size());
    const double max_weight = *std::max_element(weights.begin(), weights.end());
    v.diversification = std::max(0.0, max_weight - (1.0 / n + request.redistribution_threshold));

    if (request.max_sector_hhi) {
        v.sector = std::max(0.0, metrics.sector_hhi - *request.max_sector_hhi) / 10000.0;
    }

    v.simplex = simplex_residual(weights, request.lower_bounds, request.upper_bounds);
    return v;
}

Score ConstraintEvaluator::evaluate(std::span<const double> weights, const OptimizationRequest& request) const {
    if (weights.empty() || weights.size() != static_cast<size_t>(request.dimension)) {
        throw std::invalid_argument(
            "evaluate: expected " + std::to_string(request.dimension) +
            " weights, got " + std::to_string(weights.size())
        );
    }

    Score score;
    score.metrics = compute_metrics(weights, request);
    score.violations = compute_violations(weights, score.metrics, request);

    const double objective = request.div_preference * score.metrics.agg_div_growth
                           + request.cagr_preference * score.metrics.agg_cagr
                           + request.yield_preference * score.metrics.agg_yield;
    score.fitness = objective - config_.penalty_coefficient * score.violations.sum_squared();
    score.feasible = score.violations.max() <= config_.tolerance;
    return score;
}

}  // namespace portfolio_opt
