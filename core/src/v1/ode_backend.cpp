#include "smesim/v1/ode_backend.hpp"

#include "smesim/v1/errors.hpp"
#include "smesim/v1/noise.hpp"

#include <unsupported/Eigen/MatrixFunctions>

#include <cmath>
#include <sstream>
#include <string>

#ifdef SMESIM_HAS_SUNDIALS
#include <cvode/cvode.h>
#include <cvode/cvode_ls.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_context.h>
#include <sunlinsol/sunlinsol_dense.h>
#include <sunmatrix/sunmatrix_dense.h>
#endif

namespace smesim::v1 {

namespace {

void validate_inputs(const Matrix& L, const Vector& rho0, std::span<const Real> times) {
    validate_time_grid(times);
    if (L.rows() != L.cols()) {
        throw DimensionMismatchError("generator L must be square, got " +
                                     std::to_string(L.rows()) + "x" + std::to_string(L.cols()));
    }
    if (rho0.size() != L.rows()) {
        throw DimensionMismatchError("initial state has dimension " + std::to_string(rho0.size()) +
                                     " but L acts on dimension " + std::to_string(L.rows()));
    }
}

[[nodiscard]] std::vector<Vector> solve_matrix_exponential(const Matrix& L,
                                                           const Vector& rho0,
                                                           std::span<const Real> times) {
    std::vector<Vector> states;
    states.reserve(times.size());
    states.push_back(rho0);

    // Evenly spaced grids reuse the same propagator.
    Real cached_dt = -1.0;
    Matrix propagator;
    for (std::size_t i = 1; i < times.size(); ++i) {
        const Real dt = times[i] - times[i - 1];
        if (std::abs(dt - cached_dt) > RealTraits<Real>::grid_spacing_reltol * dt) {
            propagator = (L * dt).exp();
            cached_dt = dt;
        }
        Vector next = propagator * states.back();
        if (!next.allFinite()) {
            throw IntegrationError("matrix exponential produced a non-finite state at t=" +
                                   std::to_string(times[i]));
        }
        states.push_back(std::move(next));
    }
    return states;
}

#ifdef SMESIM_HAS_SUNDIALS

struct CvodeUserData {
    const Matrix* L = nullptr;
};

[[nodiscard]] int linear_rhs(sunrealtype /*t*/, N_Vector y, N_Vector ydot, void* user_data) {
    const auto* data = static_cast<const CvodeUserData*>(user_data);
    const Index n = data->L->rows();
    Eigen::Map<const Vector> y_map(N_VGetArrayPointer(y), n);
    Eigen::Map<Vector> ydot_map(N_VGetArrayPointer(ydot), n);
    ydot_map.noalias() = (*data->L) * y_map;
    return 0;
}

[[nodiscard]] int linear_jacobian(sunrealtype /*t*/,
                                  N_Vector /*y*/,
                                  N_Vector /*fy*/,
                                  SUNMatrix jac,
                                  void* user_data,
                                  N_Vector /*tmp1*/,
                                  N_Vector /*tmp2*/,
                                  N_Vector /*tmp3*/) {
    const auto* data = static_cast<const CvodeUserData*>(user_data);
    const Matrix& L = *data->L;
    for (Index j = 0; j < L.cols(); ++j) {
        for (Index i = 0; i < L.rows(); ++i) {
            SM_ELEMENT_D(jac, i, j) = static_cast<sunrealtype>(L(i, j));
        }
    }
    return 0;
}

[[nodiscard]] std::vector<Vector> solve_cvode(const Matrix& L,
                                              const Vector& rho0,
                                              std::span<const Real> times,
                                              const LinearOdeOptions& options) {
    const auto n = static_cast<sunindextype>(rho0.size());
    CvodeUserData user_data{&L};

    SUNContext sunctx = nullptr;
    if (SUNContext_Create(nullptr, &sunctx) != 0 || sunctx == nullptr) {
        throw IntegrationError("SUNDIALS context creation failed");
    }

    N_Vector y = N_VNew_Serial(n, sunctx);
    SUNMatrix jac = nullptr;
    SUNLinearSolver linear_solver = nullptr;
    void* solver_mem = nullptr;

    auto cleanup = [&]() {
        if (solver_mem) {
            CVodeFree(&solver_mem);
        }
        if (linear_solver) {
            SUNLinSolFree(linear_solver);
        }
        if (jac) {
            SUNMatDestroy(jac);
        }
        if (y) {
            N_VDestroy(y);
        }
        if (sunctx) {
            SUNContext_Free(&sunctx);
        }
    };

    auto fail = [&](const std::string& what, int flag) {
        cleanup();
        std::ostringstream oss;
        oss << "CVODE " << what << " failed (flag=" << flag << ")";
        throw IntegrationError(oss.str());
    };

    if (!y) {
        cleanup();
        throw IntegrationError("SUNDIALS state vector allocation failed");
    }
    Eigen::Map<Vector>(N_VGetArrayPointer(y), rho0.size()) = rho0;

    solver_mem = CVodeCreate(CV_BDF, sunctx);
    if (!solver_mem) {
        cleanup();
        throw IntegrationError("CVodeCreate failed");
    }

    int flag = CVodeInit(solver_mem, linear_rhs, static_cast<sunrealtype>(times.front()), y);
    if (flag != CV_SUCCESS) fail("CVodeInit", flag);

    flag = CVodeSStolerances(solver_mem, options.rel_tol, options.abs_tol);
    if (flag != CV_SUCCESS) fail("CVodeSStolerances", flag);

    flag = CVodeSetUserData(solver_mem, &user_data);
    if (flag != CV_SUCCESS) fail("CVodeSetUserData", flag);

    flag = CVodeSetMaxNumSteps(solver_mem, options.max_steps);
    if (flag != CV_SUCCESS) fail("CVodeSetMaxNumSteps", flag);

    jac = SUNDenseMatrix(n, n, sunctx);
    linear_solver = jac ? SUNLinSol_Dense(y, jac, sunctx) : nullptr;
    if (!jac || !linear_solver) {
        cleanup();
        throw IntegrationError("SUNDIALS dense matrix/linear solver allocation failed");
    }

    flag = CVodeSetLinearSolver(solver_mem, linear_solver, jac);
    if (flag != CVLS_SUCCESS) fail("CVodeSetLinearSolver", flag);

    flag = CVodeSetJacFn(solver_mem, linear_jacobian);
    if (flag != CVLS_SUCCESS) fail("CVodeSetJacFn", flag);

    std::vector<Vector> states;
    states.reserve(times.size());
    states.push_back(rho0);

    for (std::size_t i = 1; i < times.size(); ++i) {
        sunrealtype tret = 0.0;
        flag = CVode(solver_mem, static_cast<sunrealtype>(times[i]), y, &tret, CV_NORMAL);
        if (flag < 0) {
            fail("solve at t=" + std::to_string(times[i]), flag);
        }
        states.emplace_back(Eigen::Map<const Vector>(N_VGetArrayPointer(y), rho0.size()));
    }

    cleanup();
    return states;
}

#endif

}  // namespace

bool cvode_available() noexcept {
#ifdef SMESIM_HAS_SUNDIALS
    return true;
#else
    return false;
#endif
}

std::vector<Vector> solve_linear_ode(const Matrix& L,
                                     const Vector& rho0,
                                     std::span<const Real> times,
                                     const LinearOdeOptions& options) {
    validate_inputs(L, rho0, times);

    switch (options.backend) {
        case OdeBackend::MatrixExponential:
            return solve_matrix_exponential(L, rho0, times);
        case OdeBackend::Cvode:
#ifdef SMESIM_HAS_SUNDIALS
            return solve_cvode(L, rho0, times, options);
#else
            throw IntegrationError("CVODE backend requested but smesim was built without SUNDIALS");
#endif
    }
    throw IntegrationError("unknown ODE backend");
}

}  // namespace smesim::v1
