#include "smesim/v1/derivative_terms.hpp"

#include "smesim/v1/errors.hpp"

#include <string>
#include <utility>

namespace smesim::v1 {

HomodyneOperators::HomodyneOperators(Matrix Q, Matrix G, RowVector k_T)
    : Q_(std::move(Q))
    , G_(std::move(G))
    , k_T_(std::move(k_T)) {
    const Index d = Q_.rows();
    if (d == 0 || Q_.cols() != d) {
        throw DimensionMismatchError("drift matrix Q must be square and non-empty");
    }
    if (G_.rows() != d || G_.cols() != d) {
        throw DimensionMismatchError("diffusion matrix G is " + std::to_string(G_.rows()) + "x" +
                                     std::to_string(G_.cols()) + ", expected " +
                                     std::to_string(d) + "x" + std::to_string(d));
    }
    if (k_T_.size() != d) {
        throw DimensionMismatchError("k^T has " + std::to_string(k_T_.size()) +
                                     " entries, expected " + std::to_string(d));
    }

    G2_ = G_ * G_;
    G3_ = G2_ * G_;
    Q2_ = Q_ * Q_;
    QG_ = Q_ * G_;
    GQ_ = G_ * Q_;
    k_T_G_ = k_T_ * G_;
    k_T_G2_ = k_T_ * G2_;
    k_T_Q_ = k_T_ * Q_;
}

HomodyneOperators HomodyneOperators::from_physical(const ComplexMatrix& coupling,
                                                   const GaussianBath& bath,
                                                   const ComplexMatrix& hamiltonian,
                                                   const Basis& basis) {
    validate_basis(basis);
    Matrix Q = gaussian_drift_op(coupling, bath, hamiltonian, basis);
    WienerOperator w = wiener_op(homodyne_measurement_op(coupling, bath), basis);
    return HomodyneOperators(std::move(Q), std::move(w.G), std::move(w.k_T));
}

Vector drift(const HomodyneOperators& ops, const Vector& rho) {
    return ops.Q() * rho;
}

Vector diffusion(const HomodyneOperators& ops, const Vector& rho) {
    const Real s = (ops.k_T() * rho).value();
    return s * rho + ops.G() * rho;
}

Vector b_dx_b(const HomodyneOperators& ops, const Vector& rho) {
    const Real s = (ops.k_T() * rho).value();
    const Real t = (ops.k_T_G() * rho).value();
    return (t + 2.0 * s * s) * rho + ops.G2() * rho + 2.0 * s * (ops.G() * rho);
}

Vector b_dx_a(const HomodyneOperators& ops, const Vector& rho) {
    const Real s = (ops.k_T() * rho).value();
    return ops.QG() * rho + s * (ops.Q() * rho);
}

Vector a_dx_b(const HomodyneOperators& ops, const Vector& rho) {
    const Real s = (ops.k_T() * rho).value();
    const Real kq = (ops.k_T_Q() * rho).value();
    return ops.GQ() * rho + s * (ops.Q() * rho) + kq * rho;
}

Vector a_dx_a(const HomodyneOperators& ops, const Vector& rho) {
    return ops.Q2() * rho;
}

Vector b_dx_b_dx_b(const HomodyneOperators& ops, const Vector& rho) {
    const Real s = (ops.k_T() * rho).value();
    const Real t = (ops.k_T_G() * rho).value();
    const Real u = (ops.k_T_G2() * rho).value();
    return ops.G3() * rho
         + 3.0 * s * (ops.G2() * rho)
         + (3.0 * t + 6.0 * s * s) * (ops.G() * rho)
         + (u + 6.0 * s * t + 6.0 * s * s * s) * rho;
}

Vector b_b_dxdx_b(const HomodyneOperators& ops, const Vector& rho) {
    const Vector b = diffusion(ops, rho);
    return (ops.k_T() * b).value() * b;
}

}  // namespace smesim::v1
