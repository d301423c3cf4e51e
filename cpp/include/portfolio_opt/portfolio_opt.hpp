#pragma once

// Core types and structures
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/validation.hpp"

// Tax model
#include "tax/tax_model.hpp"

// Constraints
#include "constraints/simplex.hpp"
#include "constraints/evaluator.hpp"

// Solvers
#include "solvers/solvers.hpp"

// Service
#include "service/governor.hpp"
#include "service/json_codec.hpp"
#include "service/http_server.hpp"

// Random number generation
#include "random/rng.hpp"
