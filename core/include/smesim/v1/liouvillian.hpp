#pragma once

// =============================================================================
// smesim v1 - Vectorized Superoperators
// =============================================================================
// This header provides the operator-construction layer consumed by the
// integrators:
// - Basis validation (Hermitian, orthogonal, identity component last)
// - vectorize / unvectorize of Hermitian operators in a basis
// - Real matrices of Lindblad, Hamiltonian, squeezing and homodyne
//   superoperators acting on vectorized density operators
//
// Vectorization: rho = sum_i r_i b_i with r_i = Re Tr(b_i^dag rho) / Tr(b_i^dag b_i).
// The identity component r_{d-1} is carried as the last coordinate; trace
// preserving superoperators have a zero last row.
// =============================================================================

#include "smesim/v1/numeric_types.hpp"

#include <functional>
#include <utility>
#include <vector>

namespace smesim::v1 {

using Basis = std::vector<ComplexMatrix>;

/// Superoperator acting on operators of the system Hilbert space
using SuperOperator = std::function<ComplexMatrix(const ComplexMatrix&)>;

/// Linear part G and nonlinear functional k^T of the homodyne measurement
/// superoperator H[c] rho = c rho + rho c^dag - Tr[(c + c^dag) rho] rho,
/// vectorized as b(r) = (k^T r) r + G r
struct WienerOperator {
    Matrix G;
    RowVector k_T;
};

// =============================================================================
// Basis Handling
// =============================================================================

/// Throws DimensionMismatchError / std::invalid_argument unless the basis is
/// non-empty, square, Hermitian, pairwise orthogonal, and its last element is
/// proportional to the identity
void validate_basis(const Basis& basis);

/// Hilbert-space dimension of the basis elements
[[nodiscard]] Index hilbert_dimension(const Basis& basis);

/// Coefficients of a Hermitian operator in the basis, one per element with the
/// identity coefficient last. Integrators take this full vector as their state.
[[nodiscard]] Vector vectorize(const ComplexMatrix& op, const Basis& basis);

/// Operator with the given basis coefficients
[[nodiscard]] ComplexMatrix unvectorize(const Vector& coeffs, const Basis& basis);

/// Trace of the operator represented by `coeffs` (only the identity component
/// contributes)
[[nodiscard]] Real vectorized_trace(const Vector& coeffs, const Basis& basis);

// =============================================================================
// Superoperator Matrices
// =============================================================================

/// Real matrix M with (M r)_i = Re Tr(b_i^dag S(rho)) / Tr(b_i^dag b_i)
[[nodiscard]] Matrix superoperator_matrix(const SuperOperator& op, const Basis& basis);

/// D[c] rho = c rho c^dag - (c^dag c rho + rho c^dag c) / 2
[[nodiscard]] Matrix diffusion_op(const ComplexMatrix& c, const Basis& basis);

/// -i [H, rho]
[[nodiscard]] Matrix hamiltonian_op(const ComplexMatrix& H, const Basis& basis);

/// (M^* [c, [c, rho]] + M [c^dag, [c^dag, rho]]) / 2
[[nodiscard]] Matrix double_comm_op(const ComplexMatrix& c, Complex M, const Basis& basis);

/// Vectorized homodyne superoperator for measurement operator c
[[nodiscard]] WienerOperator wiener_op(const ComplexMatrix& c, const Basis& basis);

// =============================================================================
// Gaussian Bath Models
// =============================================================================

/// Squeezed thermal bath parameters. squeezing = M, thermal = N.
/// Physical baths satisfy |M|^2 <= N (N + 1).
struct GaussianBath {
    Complex squeezing{0.0, 0.0};
    Real thermal = 0.0;

    [[nodiscard]] static GaussianBath vacuum() { return {}; }

    /// Throws std::invalid_argument for N < 0 or |M|^2 > N (N + 1)
    void validate() const;
};

/// (N + 1) D[c] + N D[c^dag] + squeezing double commutator - i [H, .]
[[nodiscard]] Matrix gaussian_drift_op(const ComplexMatrix& c,
                                       const GaussianBath& bath,
                                       const ComplexMatrix& H,
                                       const Basis& basis);

/// ((N + M^* + 1) c - (N + M) c^dag) / sqrt(2 (Re M + N) + 1)
[[nodiscard]] ComplexMatrix homodyne_measurement_op(const ComplexMatrix& c,
                                                     const GaussianBath& bath);

}  // namespace smesim::v1
