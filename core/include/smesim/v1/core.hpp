#pragma once

// =============================================================================
// smesim v1 - Stochastic Master Equation Integration Core
// =============================================================================
// Main header of the library. It provides:
// - Vectorized superoperators for monitored open quantum systems
// - Milstein and strong order 1.5 Taylor steppers with exact derivative terms
// - Unconditional and homodyne trajectory integrators
// - Grid convergence analysis over parallel trajectory batches
// =============================================================================

#include "smesim/v1/numeric_types.hpp"
#include "smesim/v1/errors.hpp"
#include "smesim/v1/noise.hpp"
#include "smesim/v1/trajectory.hpp"
#include "smesim/v1/concepts.hpp"
#include "smesim/v1/liouvillian.hpp"
#include "smesim/v1/derivative_terms.hpp"
#include "smesim/v1/sde.hpp"
#include "smesim/v1/ode_backend.hpp"
#include "smesim/v1/integrators.hpp"
#include "smesim/v1/grid_convergence.hpp"
#include "smesim/v1/study.hpp"
