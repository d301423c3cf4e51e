#pragma once

#include "portfolio_opt/portfolio_opt.hpp"
#include <vector>

namespace portfolio_opt::testing {

// Request over n assets with unit bounds, zero floors and identical columns
inline OptimizationRequest make_request(int n) {
    OptimizationRequest request;
    request.dimension = n;
    request.lower_bounds.assign(static_cast<size_t>(n), 0.0);
    request.upper_bounds.assign(static_cast<size_t>(n), 1.0);
    request.initial_capital = 100000.0;
    request.salary = 50000.0;
    request.required_income = 0.0;
    request.div_preference = 1.0;
    request.cagr_preference = 1.0;
    request.yield_preference = 1.0;
    request.filing_status = FilingStatus::Single;
    request.redistribution_threshold = 1.0;

    auto& c = request.columns;
    c.div_growth_rates.assign(static_cast<size_t>(n), 0.05);
    c.cagr_rates.assign(static_cast<size_t>(n), 0.07);
    c.yields.assign(static_cast<size_t>(n), 0.03);
    c.expense_ratios.assign(static_cast<size_t>(n), 0.001);
    c.sector.resize(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        c.sector[static_cast<size_t>(i)] = i;
    }
    c.qualified.assign(static_cast<size_t>(n), true);
    return request;
}

// Five assets with distinct characteristics and mixed qualified status
inline OptimizationRequest make_mixed_request() {
    OptimizationRequest request = make_request(5);
    request.lower_bounds = {0.0, 0.05, 0.0, 0.0, 0.1};
    request.upper_bounds = {0.5, 0.5, 0.4, 0.6, 0.5};
    request.initial_capital = 400000.0;
    request.required_income = 5000.0;
    request.min_div_growth = 0.04;
    request.min_cagr = 0.06;
    request.min_yield = 0.02;
    request.redistribution_threshold = 0.25;
    auto& c = request.columns;
    c.div_growth_rates = {0.08, 0.05, 0.02, 0.10, 0.06};
    c.cagr_rates = {0.10, 0.07, 0.04, 0.12, 0.08};
    c.yields = {0.015, 0.035, 0.060, 0.010, 0.030};
    c.expense_ratios = {0.0003, 0.0006, 0.0035, 0.0010, 0.0008};
    c.sector = {1, 2, 3, 1, 4};
    c.qualified = {true, true, false, true, true};
    return request;
}

inline double weight_sum(const std::vector<double>& weights) {
    double sum = 0.0;
    for (double w : weights) sum += w;
    return sum;
}

}  // namespace portfolio_opt::testing
