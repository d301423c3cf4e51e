#pragma once

#include <span>

namespace portfolio_opt {

struct ProjectionResult {
    bool feasible{false};   // Sum reached 1 within tolerance with all bounds respected
    double residual{0.0};   // |sum - 1| after the last pass
    int passes{0};
};

// Repair weights onto {sum == 1, lower <= w <= upper}.
//
// Each pass clamps to the bounds and then moves every weight toward the
// bound on the side that fixes the sum, proportionally to its remaining
// headroom. An excess over zero lower bounds is a plain proportional
// rescale.
// The loop is capped at `max_passes`; when the bounds cannot reach
// sum == 1 the weights end up saturated at the bounds and the result is
// reported infeasible.
[[nodiscard]] ProjectionResult project_to_simplex(
    std::span<double> weights,
    std::span<const double> lower,
    std::span<const double> upper,
    int max_passes = 8,
    double tolerance = 1e-12
);

// Whether any point satisfies both the bounds and the sum constraint
[[nodiscard]] bool simplex_reachable(std::span<const double> lower, std::span<const double> upper);

// Residual of a weight vector: |sum - 1| plus total bound excess
[[nodiscard]] double simplex_residual(
    std::span<const double> weights,
    std::span<const double> lower,
    std::span<const double> upper
);

}  // namespace portfolio_opt
