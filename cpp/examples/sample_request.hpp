#pragma once

#include "portfolio_opt/portfolio_opt.hpp"

// Small five-asset universe shared by the example programs
inline portfolio_opt::OptimizationRequest sample_request() {
    portfolio_opt::OptimizationRequest request;
    request.dimension = 5;
    request.lower_bounds = {0.0, 0.0, 0.0, 0.0, 0.0};
    request.upper_bounds = {0.4, 0.4, 0.4, 0.4, 0.4};
    request.initial_capital = 500000.0;
    request.salary = 60000.0;
    request.required_income = 12000.0;
    request.min_div_growth = 0.04;
    request.min_cagr = 0.06;
    request.min_yield = 0.025;
    request.div_preference = 1.0;
    request.cagr_preference = 1.0;
    request.yield_preference = 1.0;
    request.filing_status = portfolio_opt::FilingStatus::Single;
    request.redistribution_threshold = 0.2;
    request.columns.div_growth_rates = {0.08, 0.05, 0.02, 0.10, 0.06};
    request.columns.cagr_rates = {0.10, 0.07, 0.04, 0.12, 0.08};
    request.columns.yields = {0.015, 0.035, 0.060, 0.010, 0.030};
    request.columns.expense_ratios = {0.0003, 0.0006, 0.0035, 0.0010, 0.0008};
    request.columns.sector = {1, 2, 3, 1, 4};
    request.columns.qualified = {true, true, false, true, true};
    return request;
}
