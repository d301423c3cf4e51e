#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portfolio_opt {

// Candidate allocation: one weight per asset, fully invested (sum == 1)
using Weights = std::vector<double>;

// Tax filing status; each value maps to an immutable bracket table
enum class FilingStatus {
    Single,
    MarriedFilingJointly,
    MarriedFilingSeparately,
    HeadOfHousehold
};

// Per-asset data, every column has exactly `dimension` entries
struct AssetColumns {
    std::vector<double> div_growth_rates;
    std::vector<double> cagr_rates;
    std::vector<double> yields;
    std::vector<double> expense_ratios;
    std::vector<int> sector;        // Categorical sector code
    std::vector<bool> qualified;    // Dividend receives the qualified rate
};

struct OptimizationRequest {
    int dimension{0};
    std::vector<double> lower_bounds;
    std::vector<double> upper_bounds;

    double initial_capital{0.0};
    double salary{0.0};
    double required_income{0.0};

    // Constraint floors
    double min_div_growth{0.0};
    double min_cagr{0.0};
    double min_yield{0.0};

    // Relative objective weights (need not sum to 1)
    double div_preference{0.0};
    double cagr_preference{0.0};
    double yield_preference{0.0};

    FilingStatus filing_status{FilingStatus::Single};

    // Max weight above the equal-weight baseline 1/N
    double redistribution_threshold{1.0};

    AssetColumns columns;

    // Optional knobs
    std::optional<uint64_t> seed;            // Fixed RNG seed for reproducible runs
    std::optional<double> max_sector_hhi;    // Sector HHI ceiling, scaled to [0, 10000]
    std::optional<int64_t> timeout_ms;       // Per-request deadline override
};

// Portfolio-level metrics of a candidate
struct Metrics {
    double agg_div_growth{0.0};
    double agg_cagr{0.0};
    double agg_yield{0.0};          // Net of expense ratios
    double gross_yield{0.0};
    double expense_ratio{0.0};
    double qualified_income{0.0};
    double non_qualified_income{0.0};
    double after_tax_income{0.0};   // Dividend income net of the tax it adds on top of salary
    double sector_hhi{0.0};
};

// Non-negative violation magnitudes, zero when the constraint holds
struct Violations {
    double div_growth{0.0};
    double cagr{0.0};
    double yield{0.0};
    double income{0.0};
    double diversification{0.0};
    double sector{0.0};
    double simplex{0.0};    // Sum/bounds residual when the bounds cannot reach sum == 1

    [[nodiscard]] double sum_squared() const {
        return div_growth * div_growth + cagr * cagr + yield * yield
             + income * income + diversification * diversification
             + sector * sector + simplex * simplex;
    }

    [[nodiscard]] double max() const {
        return std::max({div_growth, cagr, yield, income, diversification, sector, simplex});
    }
};

struct Score {
    bool feasible{false};
    double fitness{0.0};    // Higher is better
    Metrics metrics;
    Violations violations;
};

enum class TerminationReason {
    MaxIterations,
    Stagnation,
    DeadlineExceeded,
    Cancelled
};

struct OptimizationResult {
    Weights weights;
    Score score;
    int iterations{0};
    TerminationReason termination_reason{TerminationReason::MaxIterations};
    uint64_t seed{0};
    std::vector<double> fitness_history;   // Global best after each iteration
};

// String forms used on the wire
[[nodiscard]] const char* to_string(FilingStatus status);
[[nodiscard]] FilingStatus parse_filing_status(std::string_view name);

[[nodiscard]] const char* to_string(TerminationReason reason);
[[nodiscard]] TerminationReason parse_termination_reason(std::string_view name);

}  // namespace portfolio_opt
