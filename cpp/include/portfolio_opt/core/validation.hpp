#pragma once

#include "types.hpp"

namespace portfolio_opt {

// Structural and range checks on a request. Throws ValidationError naming
// the first offending field; no optimization work is done on failure.
void validate_request(const OptimizationRequest& request);

// Throws InternalFault if any weight, metric or the fitness is NaN/inf.
void ensure_finite(const OptimizationResult& result);

}  // namespace portfolio_opt
