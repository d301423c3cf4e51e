#pragma once

// Stop conditions shared by all solvers
#include "stop_condition.hpp"

// Solver implementations
#include "swarm.hpp"
#include "multistart.hpp"
