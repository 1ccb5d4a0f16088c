#pragma once

// =============================================================================
// smesim v1 - Linear ODE Backends
// =============================================================================
// Unconditional master equations are linear and time independent,
// d rho / dt = L rho. Two backends are available:
// - MatrixExponential: exact propagator exp(L dt) per interval (always built)
// - Cvode: SUNDIALS CVODE, BDF with a dense linear solver and the exact
//   constant Jacobian L (built when SUNDIALS is found)
// =============================================================================

#include "smesim/v1/numeric_types.hpp"

#include <span>
#include <string>
#include <vector>

namespace smesim::v1 {

enum class OdeBackend {
    MatrixExponential,
    Cvode
};

[[nodiscard]] constexpr const char* to_string(OdeBackend backend) noexcept {
    switch (backend) {
        case OdeBackend::MatrixExponential: return "matrix_exponential";
        case OdeBackend::Cvode: return "cvode";
        default: return "unknown";
    }
}

struct LinearOdeOptions {
    OdeBackend backend = OdeBackend::MatrixExponential;
    Real rel_tol = 1e-8;
    Real abs_tol = 1e-10;
    long max_steps = 100000;
};

/// Whether the CVODE backend was compiled into this build
[[nodiscard]] bool cvode_available() noexcept;

/// Solve d rho / dt = L rho from rho0 = rho(times[0]), returning one state per
/// time point with rho0 first.
/// Throws InvalidGridError / DimensionMismatchError for bad inputs and
/// IntegrationError when the backend fails or is not available.
[[nodiscard]] std::vector<Vector> solve_linear_ode(const Matrix& L,
                                                   const Vector& rho0,
                                                   std::span<const Real> times,
                                                   const LinearOdeOptions& options = {});

}  // namespace smesim::v1
