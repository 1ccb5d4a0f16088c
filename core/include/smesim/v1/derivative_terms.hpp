#pragma once

// =============================================================================
// smesim v1 - Drift/Diffusion Derivative-Term Algebra
// =============================================================================
// Conditional homodyne master equations in vectorized form have
//
//   drift      a(rho) = Q rho
//   diffusion  b(rho) = (k^T rho) rho + G rho
//
// b is quadratic in rho, so its directional derivatives depend on the state and
// are re-evaluated every step. All terms below are closed forms built from the
// operator products cached once in HomodyneOperators; none is approximated.
//
// Notation: s = k^T rho, t = k^T G rho, u = k^T G^2 rho.
// =============================================================================

#include "smesim/v1/liouvillian.hpp"
#include "smesim/v1/numeric_types.hpp"

namespace smesim::v1 {

// =============================================================================
// Precomputed Operator Products
// =============================================================================

/// Immutable operator products for one conditional master equation.
/// Built once per integrator and shared read-only by every step and trajectory.
class HomodyneOperators {
public:
    /// Build from a drift matrix Q and homodyne pair (G, k^T).
    /// Throws DimensionMismatchError for inconsistent shapes.
    HomodyneOperators(Matrix Q, Matrix G, RowVector k_T);

    /// Build from physical parameters of a Gaussian bath homodyne setup
    [[nodiscard]] static HomodyneOperators from_physical(const ComplexMatrix& coupling,
                                                         const GaussianBath& bath,
                                                         const ComplexMatrix& hamiltonian,
                                                         const Basis& basis);

    [[nodiscard]] Index dimension() const { return Q_.rows(); }

    [[nodiscard]] const Matrix& Q() const { return Q_; }
    [[nodiscard]] const Matrix& G() const { return G_; }
    [[nodiscard]] const RowVector& k_T() const { return k_T_; }

    [[nodiscard]] const Matrix& G2() const { return G2_; }
    [[nodiscard]] const Matrix& G3() const { return G3_; }
    [[nodiscard]] const Matrix& Q2() const { return Q2_; }
    [[nodiscard]] const Matrix& QG() const { return QG_; }
    [[nodiscard]] const Matrix& GQ() const { return GQ_; }
    [[nodiscard]] const RowVector& k_T_G() const { return k_T_G_; }
    [[nodiscard]] const RowVector& k_T_G2() const { return k_T_G2_; }
    [[nodiscard]] const RowVector& k_T_Q() const { return k_T_Q_; }

private:
    Matrix Q_;
    Matrix G_;
    RowVector k_T_;

    Matrix G2_;
    Matrix G3_;
    Matrix Q2_;
    Matrix QG_;
    Matrix GQ_;
    RowVector k_T_G_;
    RowVector k_T_G2_;
    RowVector k_T_Q_;
};

// =============================================================================
// Fields
// =============================================================================

/// a(rho) = Q rho
[[nodiscard]] Vector drift(const HomodyneOperators& ops, const Vector& rho);

/// b(rho) = (k^T rho) rho + G rho
[[nodiscard]] Vector diffusion(const HomodyneOperators& ops, const Vector& rho);

// =============================================================================
// Derivative Terms
// =============================================================================

/// (b . grad) b = (t + 2 s^2) rho + G^2 rho + 2 s G rho
[[nodiscard]] Vector b_dx_b(const HomodyneOperators& ops, const Vector& rho);

/// (b . grad) a = QG rho + s Q rho
[[nodiscard]] Vector b_dx_a(const HomodyneOperators& ops, const Vector& rho);

/// (a . grad) b = GQ rho + s Q rho + (k^T Q rho) rho
[[nodiscard]] Vector a_dx_b(const HomodyneOperators& ops, const Vector& rho);

/// (a . grad) a = Q^2 rho
[[nodiscard]] Vector a_dx_a(const HomodyneOperators& ops, const Vector& rho);

/// (b . grad)((b . grad) b)
///   = G^3 rho + 3 s G^2 rho + (3 t + 6 s^2) G rho + (u + 6 s t + 6 s^3) rho
[[nodiscard]] Vector b_dx_b_dx_b(const HomodyneOperators& ops, const Vector& rho);

/// Half the second derivative of b contracted twice with b:
///   (1/2) sum_ij b_i b_j d_i d_j b = (k^T b) b
[[nodiscard]] Vector b_b_dxdx_b(const HomodyneOperators& ops, const Vector& rho);

// =============================================================================
// Field adaptor for the generic SDE steppers
// =============================================================================

/// Exposes the homodyne drift, diffusion and derivative terms through the
/// member interface the steppers in sde.hpp are written against.
/// Holds a reference: the operators must outlive the field.
class HomodyneField {
public:
    explicit HomodyneField(const HomodyneOperators& ops) : ops_(ops) {}

    [[nodiscard]] Vector drift(const Vector& rho) const { return v1::drift(ops_, rho); }
    [[nodiscard]] Vector diffusion(const Vector& rho) const { return v1::diffusion(ops_, rho); }
    [[nodiscard]] Vector b_dx_b(const Vector& rho) const { return v1::b_dx_b(ops_, rho); }
    [[nodiscard]] Vector b_dx_a(const Vector& rho) const { return v1::b_dx_a(ops_, rho); }
    [[nodiscard]] Vector a_dx_b(const Vector& rho) const { return v1::a_dx_b(ops_, rho); }
    [[nodiscard]] Vector a_dx_a(const Vector& rho) const { return v1::a_dx_a(ops_, rho); }
    [[nodiscard]] Vector b_dx_b_dx_b(const Vector& rho) const { return v1::b_dx_b_dx_b(ops_, rho); }
    [[nodiscard]] Vector b_b_dxdx_b(const Vector& rho) const { return v1::b_b_dxdx_b(ops_, rho); }

private:
    const HomodyneOperators& ops_;
};

}  // namespace smesim::v1
