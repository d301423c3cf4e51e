#include "portfolio_opt/constraints/simplex.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace portfolio_opt {

namespace {

double total(std::span<const double> values) {
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum;
}

void clamp_to_bounds(std::span<double> weights, std::span<const double> lower, std::span<const double> upper) {
    for (size_t i = 0; i < weights.size(); ++i) {
        // Non-finite coordinates restart from the lower bound
        if (!std::isfinite(weights[i])) {
            weights[i] = lower[i];
        }
        weights[i] = std::clamp(weights[i], lower[i], upper[i]);
    }
}

}  // namespace

ProjectionResult project_to_simplex(
    std::span<double> weights,
    std::span<const double> lower,
    std::span<const double> upper,
    int max_passes,
    double tolerance
) {
    if (weights.size() != lower.size() || weights.size() != upper.size()) {
        throw std::invalid_argument("project_to_simplex: weights and bounds differ in size");
    }

    ProjectionResult result;
    clamp_to_bounds(weights, lower, upper);

    for (int pass = 0; pass < max_passes; ++pass) {
        const double deficit = 1.0 - total(weights);
        if (std::abs(deficit) <= tolerance) {
            break;
        }
        ++result.passes;

        double headroom = 0.0;
        if (deficit > 0.0) {
            for (size_t i = 0; i < weights.size(); ++i) headroom += upper[i] - weights[i];
        } else {
            for (size_t i = 0; i < weights.size(); ++i) headroom += weights[i] - lower[i];
        }
        if (headroom <= 0.0) {
            break;  // Saturated at the bounds
        }

        const double fraction = std::min(1.0, std::abs(deficit) / headroom);
        for (size_t i = 0; i < weights.size(); ++i) {
            if (deficit > 0.0) {
                weights[i] += fraction * (upper[i] - weights[i]);
            } else {
                weights[i] -= fraction * (weights[i] - lower[i]);
            }
        }
        clamp_to_bounds(weights, lower, upper);
    }

    result.residual = std::abs(1.0 - total(weights));
    result.feasible = result.residual <= tolerance;
    return result;
}

bool simplex_reachable(std::span<const double> lower, std::span<const double> upper) {
    return total(lower) <= 1.0 && total(upper) >= 1.0;
}

double simplex_residual(
    std::span<const double> weights,
    std::span<const double> lower,
    std::span<const double> upper
) {
    double residual = std::abs(1.0 - total(weights));
    for (size_t i = 0; i < weights.size(); ++i) {
        residual += std::max(0.0, lower[i] - weights[i]);
        residual += std::max(0.0, weights[i] - upper[i]);
    }
    return residual;
}

}  // namespace portfolio_opt
