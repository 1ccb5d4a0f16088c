#pragma once

// =============================================================================
// smesim v1 - Numeric Types Foundation
// =============================================================================
// This header provides the numeric types shared by the integration engine:
// - Real / Complex scalar aliases
// - Index type matching Eigen's storage index
// - Dense real vectors and matrices for vectorized density operators
// - Dense complex matrices for physical operators (coupling, Hamiltonian, basis)
// =============================================================================

#include <Eigen/Dense>

#include <complex>
#include <concepts>
#include <cstddef>
#include <limits>
#include <random>
#include <vector>

namespace smesim::v1 {

// =============================================================================
// Scalar Types
// =============================================================================

using Real = double;
using Complex = std::complex<Real>;

/// Concept for valid Real types
template<typename T>
concept RealType = std::floating_point<T>;

/// Traits for Real type characteristics
template<RealType T>
struct RealTraits {
    static constexpr T epsilon = std::numeric_limits<T>::epsilon();
    static constexpr T infinity = std::numeric_limits<T>::infinity();

    /// Relative tolerance used when checking that a grid is evenly spaced
    static constexpr T grid_spacing_reltol = T{1e-9};

    /// Tolerance used when checking Hermiticity / identity structure of a basis
    static constexpr T structure_tol = T{1e-10};
};

// =============================================================================
// Index and Dense Types
// =============================================================================

using Index = Eigen::Index;

/// Vectorized density operator (column of basis coefficients)
using Vector = Eigen::VectorXd;

/// Real superoperator matrix acting on vectorized density operators
using Matrix = Eigen::MatrixXd;

/// Row vector used for linear functionals such as k^T
using RowVector = Eigen::RowVectorXd;

/// Physical operator in the system Hilbert space
using ComplexMatrix = Eigen::MatrixXcd;

// =============================================================================
// Random Number Generation
// =============================================================================

/// Random engine handed explicitly to every trajectory task
using RandomEngine = std::mt19937_64;

}  // namespace smesim::v1
