#include "portfolio_opt/core/validation.hpp"
#include "portfolio_opt/core/errors.hpp"
#include "portfolio_opt/tax/tax_model.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace portfolio_opt {

namespace {

// Largest money amount or annual income the tax model is asked to handle
constexpr double kMaxAmount = 1e15;

void require(bool condition, const std::string& field, const std::string& message) {
    if (!condition) {
        throw ValidationError(field, field + ": " + message);
    }
}

template <typename T>
void require_length(const std::vector<T>& values, size_t n, const std::string& field) {
    require(
        values.size() == n, field,
        "expected " + std::to_string(n) + " entries, got " + std::to_string(values.size())
    );
}

void require_finite(const std::vector<double>& values, const std::string& field) {
    for (size_t i = 0; i < values.size(); ++i) {
        require(std::isfinite(values[i]), field, "entry " + std::to_string(i) + " is not finite");
    }
}

void require_non_negative(double value, const std::string& field) {
    require(std::isfinite(value), field, "must be finite");
    require(value >= 0.0, field, "must be non-negative");
}

void require_amount(double value, const std::string& field) {
    require_non_negative(value, field);
    require(value <= kMaxAmount, field, "must not exceed 1e15");
}

// Upper bound on |dividend income| over every weight vector inside the bounds
double max_dividend_income(const OptimizationRequest& request) {
    double exposure = 0.0;
    for (size_t i = 0; i < request.columns.yields.size(); ++i) {
        const double weight = std::max(std::abs(request.lower_bounds[i]), std::abs(request.upper_bounds[i]));
        exposure += weight * std::abs(request.columns.yields[i]);
    }
    return exposure * request.initial_capital;
}

bool finite_metrics(const Metrics& m) {
    return std::isfinite(m.agg_div_growth) && std::isfinite(m.agg_cagr)
        && std::isfinite(m.agg_yield) && std::isfinite(m.gross_yield)
        && std::isfinite(m.expense_ratio) && std::isfinite(m.after_tax_income)
        && std::isfinite(m.sector_hhi);
}

}  // namespace

void validate_request(const OptimizationRequest& request) {
    require(request.dimension > 0, "dimension", "must be a positive integer");
    const size_t n = static_cast<size_t>(request.dimension);

    require_length(request.lower_bounds, n, "lower_bounds");
    require_length(request.upper_bounds, n, "upper_bounds");
    require_finite(request.lower_bounds, "lower_bounds");
    require_finite(request.upper_bounds, "upper_bounds");
    for (size_t i = 0; i < n; ++i) {
        require(
            request.lower_bounds[i] <= request.upper_bounds[i], "lower_bounds",
            "entry " + std::to_string(i) + " exceeds its upper bound"
        );
    }

    const auto& columns = request.columns;
    require_length(columns.div_growth_rates, n, "columns.div_growth_rates");
    require_length(columns.cagr_rates, n, "columns.cagr_rates");
    require_length(columns.yields, n, "columns.yields");
    require_length(columns.expense_ratios, n, "columns.expense_ratios");
    require_length(columns.sector, n, "columns.sector");
    require_length(columns.qualified, n, "columns.qualified");
    require_finite(columns.div_growth_rates, "columns.div_growth_rates");
    require_finite(columns.cagr_rates, "columns.cagr_rates");
    require_finite(columns.yields, "columns.yields");
    require_finite(columns.expense_ratios, "columns.expense_ratios");

    require_amount(request.initial_capital, "initial_capital");
    require_amount(request.salary, "salary");
    require_amount(request.required_income, "required_income");
    const double income = max_dividend_income(request);
    require(
        std::isfinite(income) && income <= kMaxAmount, "initial_capital",
        "dividend income at these yields and bounds exceeds 1e15"
    );
    require(std::isfinite(request.min_div_growth), "min_div_growth", "must be finite");
    require(std::isfinite(request.min_cagr), "min_cagr", "must be finite");
    require(std::isfinite(request.min_yield), "min_yield", "must be finite");
    require_non_negative(request.div_preference, "div_preference");
    require_non_negative(request.cagr_preference, "cagr_preference");
    require_non_negative(request.yield_preference, "yield_preference");
    require_non_negative(request.redistribution_threshold, "redistribution_threshold");

    if (request.max_sector_hhi) {
        const double hhi = *request.max_sector_hhi;
        require(std::isfinite(hhi) && hhi > 0.0 && hhi <= 10000.0, "max_sector_hhi", "must be in (0, 10000]");
    }
    if (request.timeout_ms) {
        require(*request.timeout_ms > 0, "timeout_ms", "must be positive");
    }

    // Throws InvalidFilingStatus for values outside the enumeration
    (void)bracket_table(request.filing_status);
}

void ensure_finite(const OptimizationResult& result) {
    for (double w : result.weights) {
        if (!std::isfinite(w)) {
            throw InternalFault("non-finite weight in optimization result");
        }
    }
    if (!std::isfinite(result.score.fitness) || !finite_metrics(result.score.metrics)) {
        throw InternalFault("non-finite fitness or metric in optimization result");
    }
}

}  // namespace portfolio_opt
