#pragma once

// =============================================================================
// smesim v1 - Error Taxonomy
// =============================================================================
// Boundary checks throw one of the exception types below. Batch operations
// record per-trajectory failures with the ConvergenceError enum instead, so one
// failed trajectory never aborts or corrupts the rest of the batch.
// =============================================================================

#include <stdexcept>
#include <string>

namespace smesim::v1 {

/// Time grid incompatible with the requested operation (too short, not
/// increasing, not evenly spaced, interval count not divisible as required)
class InvalidGridError : public std::invalid_argument {
public:
    explicit InvalidGridError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Array length or matrix shape does not match the grid / basis it is used with
class DimensionMismatchError : public std::invalid_argument {
public:
    explicit DimensionMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Degenerate numerics, e.g. log of a zero norm in the rate formula or a
/// non-finite state produced by a step
class NumericalDegeneracyError : public std::runtime_error {
public:
    explicit NumericalDegeneracyError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Deterministic ODE backend failed or is not available in this build
class IntegrationError : public std::runtime_error {
public:
    explicit IntegrationError(const std::string& what)
        : std::runtime_error(what) {}
};

// =============================================================================
// Per-trajectory error kinds
// =============================================================================

enum class ConvergenceError {
    None,
    InvalidGrid,
    DimensionMismatch,
    NumericalDegeneracy,
    IntegrationFailure,
    Unexpected          // Any other std::exception thrown by the integrator
};

[[nodiscard]] inline constexpr const char* to_string(ConvergenceError err) noexcept {
    switch (err) {
        case ConvergenceError::None: return "None";
        case ConvergenceError::InvalidGrid: return "InvalidGrid";
        case ConvergenceError::DimensionMismatch: return "DimensionMismatch";
        case ConvergenceError::NumericalDegeneracy: return "NumericalDegeneracy";
        case ConvergenceError::IntegrationFailure: return "IntegrationFailure";
        case ConvergenceError::Unexpected: return "Unexpected";
        default: return "Unknown";
    }
}

}  // namespace smesim::v1
