#include "smesim/v1/liouvillian.hpp"

#include "smesim/v1/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace smesim::v1 {

namespace {

/// Tr(A^dag B)
[[nodiscard]] Complex hs_inner(const ComplexMatrix& A, const ComplexMatrix& B) {
    return (A.conjugate().cwiseProduct(B)).sum();
}

[[nodiscard]] std::vector<Real> basis_norms(const Basis& basis) {
    std::vector<Real> norms(basis.size());
    for (std::size_t i = 0; i < basis.size(); ++i) {
        norms[i] = hs_inner(basis[i], basis[i]).real();
    }
    return norms;
}

void require_operator_shape(const ComplexMatrix& op, const Basis& basis, const char* what) {
    const Index n = hilbert_dimension(basis);
    if (op.rows() != n || op.cols() != n) {
        throw DimensionMismatchError(std::string(what) + " is " + std::to_string(op.rows()) +
                                     "x" + std::to_string(op.cols()) +
                                     " but the basis acts on dimension " + std::to_string(n));
    }
}

}  // namespace

// =============================================================================
// Basis Handling
// =============================================================================

Index hilbert_dimension(const Basis& basis) {
    if (basis.empty()) {
        throw DimensionMismatchError("basis is empty");
    }
    return basis.front().rows();
}

void validate_basis(const Basis& basis) {
    const Index n = hilbert_dimension(basis);
    if (n == 0) {
        throw DimensionMismatchError("basis elements have zero dimension");
    }
    if (static_cast<Index>(basis.size()) > n * n) {
        throw DimensionMismatchError("basis has " + std::to_string(basis.size()) +
                                     " elements but dimension " + std::to_string(n) +
                                     " admits at most " + std::to_string(n * n));
    }

    const Real tol = RealTraits<Real>::structure_tol;
    const auto norms = basis_norms(basis);

    for (std::size_t i = 0; i < basis.size(); ++i) {
        const auto& b = basis[i];
        if (b.rows() != n || b.cols() != n) {
            throw DimensionMismatchError("basis element " + std::to_string(i) +
                                         " is not " + std::to_string(n) + "x" +
                                         std::to_string(n));
        }
        if (norms[i] <= tol) {
            throw std::invalid_argument("basis element " + std::to_string(i) + " is zero");
        }
        if ((b - b.adjoint()).norm() > tol * std::sqrt(norms[i])) {
            throw std::invalid_argument("basis element " + std::to_string(i) +
                                        " is not Hermitian");
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (std::abs(hs_inner(basis[j], b)) > tol * std::sqrt(norms[i] * norms[j])) {
                throw std::invalid_argument("basis elements " + std::to_string(j) + " and " +
                                            std::to_string(i) + " are not orthogonal");
            }
        }
    }

    const auto& last = basis.back();
    const Complex diag = last(0, 0);
    ComplexMatrix scaled_identity = ComplexMatrix::Identity(n, n) * diag;
    if (std::abs(diag) <= tol ||
        (last - scaled_identity).norm() > tol * std::sqrt(norms.back())) {
        throw std::invalid_argument("last basis element must be proportional to the identity");
    }
}

Vector vectorize(const ComplexMatrix& op, const Basis& basis) {
    require_operator_shape(op, basis, "operator");
    const auto norms = basis_norms(basis);

    Vector coeffs(static_cast<Index>(basis.size()));
    for (std::size_t i = 0; i < basis.size(); ++i) {
        coeffs[static_cast<Index>(i)] = hs_inner(basis[i], op).real() / norms[i];
    }
    return coeffs;
}

ComplexMatrix unvectorize(const Vector& coeffs, const Basis& basis) {
    if (coeffs.size() != static_cast<Index>(basis.size())) {
        throw DimensionMismatchError("coefficient vector has " + std::to_string(coeffs.size()) +
                                     " entries but the basis has " +
                                     std::to_string(basis.size()) + " elements");
    }
    const Index n = hilbert_dimension(basis);
    ComplexMatrix op = ComplexMatrix::Zero(n, n);
    for (std::size_t i = 0; i < basis.size(); ++i) {
        op += coeffs[static_cast<Index>(i)] * basis[i];
    }
    return op;
}

Real vectorized_trace(const Vector& coeffs, const Basis& basis) {
    if (coeffs.size() != static_cast<Index>(basis.size())) {
        throw DimensionMismatchError("coefficient vector does not match the basis size");
    }
    Real trace = 0.0;
    for (std::size_t i = 0; i < basis.size(); ++i) {
        trace += coeffs[static_cast<Index>(i)] * basis[i].trace().real();
    }
    return trace;
}

// =============================================================================
// Superoperator Matrices
// =============================================================================

Matrix superoperator_matrix(const SuperOperator& op, const Basis& basis) {
    const auto d = static_cast<Index>(basis.size());
    const auto norms = basis_norms(basis);

    Matrix M(d, d);
    for (Index j = 0; j < d; ++j) {
        const ComplexMatrix image = op(basis[static_cast<std::size_t>(j)]);
        for (Index i = 0; i < d; ++i) {
            const auto ui = static_cast<std::size_t>(i);
            M(i, j) = hs_inner(basis[ui], image).real() / norms[ui];
        }
    }
    return M;
}

Matrix diffusion_op(const ComplexMatrix& c, const Basis& basis) {
    require_operator_shape(c, basis, "coupling operator");
    const ComplexMatrix c_dag = c.adjoint();
    const ComplexMatrix c_dag_c = c_dag * c;
    return superoperator_matrix(
        [&](const ComplexMatrix& rho) -> ComplexMatrix {
            return c * rho * c_dag - 0.5 * (c_dag_c * rho + rho * c_dag_c);
        },
        basis);
}

Matrix hamiltonian_op(const ComplexMatrix& H, const Basis& basis) {
    require_operator_shape(H, basis, "Hamiltonian");
    const Complex minus_i(0.0, -1.0);
    return superoperator_matrix(
        [&](const ComplexMatrix& rho) -> ComplexMatrix {
            return minus_i * (H * rho - rho * H);
        },
        basis);
}

Matrix double_comm_op(const ComplexMatrix& c, Complex M, const Basis& basis) {
    require_operator_shape(c, basis, "coupling operator");
    const ComplexMatrix c_dag = c.adjoint();
    return superoperator_matrix(
        [&](const ComplexMatrix& rho) -> ComplexMatrix {
            const ComplexMatrix inner = c * rho - rho * c;
            const ComplexMatrix inner_dag = c_dag * rho - rho * c_dag;
            return 0.5 * std::conj(M) * (c * inner - inner * c) +
                   0.5 * M * (c_dag * inner_dag - inner_dag * c_dag);
        },
        basis);
}

WienerOperator wiener_op(const ComplexMatrix& c, const Basis& basis) {
    require_operator_shape(c, basis, "measurement operator");
    const ComplexMatrix c_dag = c.adjoint();
    const ComplexMatrix x_op = c + c_dag;

    WienerOperator w;
    w.G = superoperator_matrix(
        [&](const ComplexMatrix& rho) -> ComplexMatrix {
            return c * rho + rho * c_dag;
        },
        basis);

    w.k_T.resize(static_cast<Index>(basis.size()));
    for (std::size_t j = 0; j < basis.size(); ++j) {
        w.k_T[static_cast<Index>(j)] = -(x_op * basis[j]).trace().real();
    }
    return w;
}

// =============================================================================
// Gaussian Bath Models
// =============================================================================

void GaussianBath::validate() const {
    if (!std::isfinite(thermal) || thermal < 0.0) {
        throw std::invalid_argument("thermal occupation N must be finite and non-negative");
    }
    if (!std::isfinite(squeezing.real()) || !std::isfinite(squeezing.imag())) {
        throw std::invalid_argument("squeezing parameter M must be finite");
    }
    const Real bound = thermal * (thermal + 1.0);
    if (std::norm(squeezing) > bound * (1.0 + 1e-12) + 1e-15) {
        throw std::invalid_argument("squeezing violates |M|^2 <= N (N + 1)");
    }
}

Matrix gaussian_drift_op(const ComplexMatrix& c,
                         const GaussianBath& bath,
                         const ComplexMatrix& H,
                         const Basis& basis) {
    bath.validate();
    const ComplexMatrix c_dag = c.adjoint();
    return (bath.thermal + 1.0) * diffusion_op(c, basis) +
           bath.thermal * diffusion_op(c_dag, basis) +
           double_comm_op(c, bath.squeezing, basis) +
           hamiltonian_op(H, basis);
}

ComplexMatrix homodyne_measurement_op(const ComplexMatrix& c, const GaussianBath& bath) {
    bath.validate();
    const Real norm_sq = 2.0 * (bath.squeezing.real() + bath.thermal) + 1.0;
    if (norm_sq <= 0.0) {
        throw std::invalid_argument("homodyne normalization 2 (Re M + N) + 1 must be positive");
    }
    const Complex M = bath.squeezing;
    const Real N = bath.thermal;
    const ComplexMatrix c_dag = c.adjoint();
    return ((N + std::conj(M) + 1.0) * c - (N + M) * c_dag) / std::sqrt(norm_sq);
}

}  // namespace smesim::v1
