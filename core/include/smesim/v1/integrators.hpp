#pragma once

// =============================================================================
// smesim v1 - Trajectory Integrators
// =============================================================================
// Every integrator satisfies the TrajectoryIntegrator concept:
//
//   integrate(x0, times, noise) -> Trajectory
//   integrate(x0, times, rng)   -> Trajectory   (draws the noise itself)
//
// States are full coefficient vectors in the integrator's basis, one entry per
// basis element with the identity coefficient included (see vectorize()). A
// vector that drops the identity entry is rejected with DimensionMismatchError.
//
// Unconditional integrators solve the linear master equation with an ODE
// backend and ignore the noise. Homodyne integrators drive one of the
// stochastic steppers in sde.hpp over the grid.
// =============================================================================

#include "smesim/v1/concepts.hpp"
#include "smesim/v1/derivative_terms.hpp"
#include "smesim/v1/liouvillian.hpp"
#include "smesim/v1/noise.hpp"
#include "smesim/v1/numeric_types.hpp"
#include "smesim/v1/ode_backend.hpp"
#include "smesim/v1/sde.hpp"
#include "smesim/v1/trajectory.hpp"

#include <concepts>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace smesim::v1 {

/// Physical description of a monitored system shared by all integrator kinds
struct HomodyneSystem {
    ComplexMatrix coupling;
    ComplexMatrix hamiltonian;
    Basis basis;
};

// =============================================================================
// Unconditional (deterministic) integrators
// =============================================================================

/// d rho / dt = D[c] rho
class UnconditionalVacuumIntegrator {
public:
    UnconditionalVacuumIntegrator(const ComplexMatrix& coupling,
                                  const Basis& basis,
                                  LinearOdeOptions ode_options = {});

    /// From a precomputed generator matrix
    explicit UnconditionalVacuumIntegrator(Matrix generator, LinearOdeOptions ode_options = {});

    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       const NoiseIncrements& noise) const;
    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       RandomEngine& rng) const;

    [[nodiscard]] Index dimension() const { return generator_.rows(); }
    [[nodiscard]] bool consumes_noise() const { return false; }
    [[nodiscard]] bool requires_multiple_ito() const { return false; }
    [[nodiscard]] const Matrix& generator() const { return generator_; }
    [[nodiscard]] const LinearOdeOptions& ode_options() const { return ode_options_; }

private:
    Matrix generator_;
    LinearOdeOptions ode_options_;
};

/// d rho / dt = ((N + 1) D[c] + N D[c^dag] + squeezing terms - i [H, .]) rho
class UnconditionalGaussianIntegrator {
public:
    UnconditionalGaussianIntegrator(const ComplexMatrix& coupling,
                                    const GaussianBath& bath,
                                    const ComplexMatrix& hamiltonian,
                                    const Basis& basis,
                                    LinearOdeOptions ode_options = {});

    explicit UnconditionalGaussianIntegrator(Matrix generator, LinearOdeOptions ode_options = {});

    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       const NoiseIncrements& noise) const;
    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       RandomEngine& rng) const;

    [[nodiscard]] Index dimension() const { return generator_.rows(); }
    [[nodiscard]] bool consumes_noise() const { return false; }
    [[nodiscard]] bool requires_multiple_ito() const { return false; }
    [[nodiscard]] const Matrix& generator() const { return generator_; }
    [[nodiscard]] const LinearOdeOptions& ode_options() const { return ode_options_; }

private:
    Matrix generator_;
    LinearOdeOptions ode_options_;
};

// =============================================================================
// Conditional homodyne integrators
// =============================================================================

/// Milstein scheme for the Gaussian bath homodyne master equation
class MilsteinHomodyneIntegrator {
public:
    MilsteinHomodyneIntegrator(const ComplexMatrix& coupling,
                               const GaussianBath& bath,
                               const ComplexMatrix& hamiltonian,
                               const Basis& basis);

    explicit MilsteinHomodyneIntegrator(HomodyneOperators operators);

    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       const NoiseIncrements& noise) const;
    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       RandomEngine& rng) const;

    [[nodiscard]] Index dimension() const { return operators_.dimension(); }
    [[nodiscard]] bool consumes_noise() const { return true; }
    [[nodiscard]] bool requires_multiple_ito() const { return false; }
    [[nodiscard]] const HomodyneOperators& operators() const { return operators_; }

private:
    HomodyneOperators operators_;
};

/// Strong order 1.5 Taylor scheme for the Gaussian bath homodyne master equation
class Taylor15HomodyneIntegrator {
public:
    Taylor15HomodyneIntegrator(const ComplexMatrix& coupling,
                               const GaussianBath& bath,
                               const ComplexMatrix& hamiltonian,
                               const Basis& basis);

    explicit Taylor15HomodyneIntegrator(HomodyneOperators operators);

    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       const NoiseIncrements& noise) const;
    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       RandomEngine& rng) const;

    [[nodiscard]] Index dimension() const { return operators_.dimension(); }
    [[nodiscard]] bool consumes_noise() const { return true; }
    /// Needs U2 for the double Ito integral dZ
    [[nodiscard]] bool requires_multiple_ito() const { return true; }
    [[nodiscard]] const HomodyneOperators& operators() const { return operators_; }

private:
    HomodyneOperators operators_;
};

/// Milstein without the 1/2 on the correction term. Negative control for the
/// grid convergence analyzer; reuses the Milstein operator setup.
class FaultyMilsteinHomodyneIntegrator {
public:
    FaultyMilsteinHomodyneIntegrator(const ComplexMatrix& coupling,
                                     const GaussianBath& bath,
                                     const ComplexMatrix& hamiltonian,
                                     const Basis& basis);

    explicit FaultyMilsteinHomodyneIntegrator(HomodyneOperators operators);

    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       const NoiseIncrements& noise) const;
    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       RandomEngine& rng) const;

    [[nodiscard]] Index dimension() const { return milstein_.dimension(); }
    [[nodiscard]] bool consumes_noise() const { return true; }
    [[nodiscard]] bool requires_multiple_ito() const { return false; }
    [[nodiscard]] const HomodyneOperators& operators() const { return milstein_.operators(); }

private:
    MilsteinHomodyneIntegrator milstein_;
};

static_assert(TrajectoryIntegrator<UnconditionalVacuumIntegrator>);
static_assert(TrajectoryIntegrator<UnconditionalGaussianIntegrator>);
static_assert(TrajectoryIntegrator<MilsteinHomodyneIntegrator>);
static_assert(TrajectoryIntegrator<Taylor15HomodyneIntegrator>);
static_assert(TrajectoryIntegrator<FaultyMilsteinHomodyneIntegrator>);

// =============================================================================
// Runtime selection
// =============================================================================

enum class IntegratorKind {
    Milstein,
    Taylor15,
    FaultyMilstein,
    UnconditionalVacuum,
    UnconditionalGaussian
};

[[nodiscard]] constexpr const char* to_string(IntegratorKind kind) noexcept {
    switch (kind) {
        case IntegratorKind::Milstein: return "milstein";
        case IntegratorKind::Taylor15: return "taylor_1_5";
        case IntegratorKind::FaultyMilstein: return "faulty_milstein";
        case IntegratorKind::UnconditionalVacuum: return "unconditional_vacuum";
        case IntegratorKind::UnconditionalGaussian: return "unconditional_gaussian";
        default: return "unknown";
    }
}

/// Inverse of to_string(IntegratorKind); nullopt for unknown names
[[nodiscard]] std::optional<IntegratorKind> parse_integrator_kind(std::string_view name);

/// Closed set of integrators selectable at runtime
class AnyIntegrator {
public:
    using Variant = std::variant<MilsteinHomodyneIntegrator,
                                 Taylor15HomodyneIntegrator,
                                 FaultyMilsteinHomodyneIntegrator,
                                 UnconditionalVacuumIntegrator,
                                 UnconditionalGaussianIntegrator>;

    template<typename I>
        requires(!std::same_as<std::remove_cvref_t<I>, AnyIntegrator> &&
                 std::constructible_from<Variant, I>)
    AnyIntegrator(I integrator) : impl_(std::move(integrator)) {}

    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       const NoiseIncrements& noise) const;
    [[nodiscard]] Trajectory integrate(const Vector& x0,
                                       std::span<const Real> times,
                                       RandomEngine& rng) const;

    [[nodiscard]] Index dimension() const;
    [[nodiscard]] bool consumes_noise() const;
    [[nodiscard]] bool requires_multiple_ito() const;
    [[nodiscard]] IntegratorKind kind() const;

    [[nodiscard]] const Variant& variant() const { return impl_; }

private:
    Variant impl_;
};

static_assert(TrajectoryIntegrator<AnyIntegrator>);

/// Build the integrator of the given kind. The vacuum kind ignores `bath`.
[[nodiscard]] AnyIntegrator make_integrator(IntegratorKind kind,
                                            const HomodyneSystem& system,
                                            const GaussianBath& bath = GaussianBath::vacuum(),
                                            const LinearOdeOptions& ode_options = {});

}  // namespace smesim::v1
