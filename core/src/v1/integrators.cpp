#include "smesim/v1/integrators.hpp"

#include "smesim/v1/errors.hpp"

#include <string>
#include <utility>

namespace smesim::v1 {

namespace {

void require_state_dimension(const Vector& x0, Index expected) {
    if (x0.size() != expected) {
        throw DimensionMismatchError("initial state has dimension " + std::to_string(x0.size()) +
                                     ", integrator expects " + std::to_string(expected));
    }
}

[[nodiscard]] Trajectory solve_unconditional(const Matrix& generator,
                                             const LinearOdeOptions& ode_options,
                                             const Vector& x0,
                                             std::span<const Real> times) {
    require_state_dimension(x0, generator.rows());
    Trajectory traj;
    traj.states = solve_linear_ode(generator, x0, times, ode_options);
    traj.times.assign(times.begin(), times.end());
    return traj;
}

template<SdeScheme S>
[[nodiscard]] Trajectory solve_homodyne(const HomodyneOperators& operators,
                                        const Vector& x0,
                                        std::span<const Real> times,
                                        const NoiseIncrements& noise) {
    require_state_dimension(x0, operators.dimension());
    return integrate_sde<S>(HomodyneField(operators), x0, times, noise);
}

template<SdeScheme S>
[[nodiscard]] Trajectory solve_homodyne(const HomodyneOperators& operators,
                                        const Vector& x0,
                                        std::span<const Real> times,
                                        RandomEngine& rng) {
    validate_time_grid(times);
    const auto noise = NoiseIncrements::sample(interval_count(times), rng, requires_multiple_ito(S));
    return solve_homodyne<S>(operators, x0, times, noise);
}

}  // namespace

// =============================================================================
// UnconditionalVacuumIntegrator
// =============================================================================

UnconditionalVacuumIntegrator::UnconditionalVacuumIntegrator(const ComplexMatrix& coupling,
                                                             const Basis& basis,
                                                             LinearOdeOptions ode_options)
    : generator_(diffusion_op(coupling, basis))
    , ode_options_(ode_options) {}

UnconditionalVacuumIntegrator::UnconditionalVacuumIntegrator(Matrix generator,
                                                             LinearOdeOptions ode_options)
    : generator_(std::move(generator))
    , ode_options_(ode_options) {
    if (generator_.rows() == 0 || generator_.rows() != generator_.cols()) {
        throw DimensionMismatchError("generator must be square and non-empty");
    }
}

Trajectory UnconditionalVacuumIntegrator::integrate(const Vector& x0,
                                                    std::span<const Real> times,
                                                    const NoiseIncrements& /*noise*/) const {
    return solve_unconditional(generator_, ode_options_, x0, times);
}

Trajectory UnconditionalVacuumIntegrator::integrate(const Vector& x0,
                                                    std::span<const Real> times,
                                                    RandomEngine& /*rng*/) const {
    return solve_unconditional(generator_, ode_options_, x0, times);
}

// =============================================================================
// UnconditionalGaussianIntegrator
// =============================================================================

UnconditionalGaussianIntegrator::UnconditionalGaussianIntegrator(const ComplexMatrix& coupling,
                                                                 const GaussianBath& bath,
                                                                 const ComplexMatrix& hamiltonian,
                                                                 const Basis& basis,
                                                                 LinearOdeOptions ode_options)
    : generator_(gaussian_drift_op(coupling, bath, hamiltonian, basis))
    , ode_options_(ode_options) {}

UnconditionalGaussianIntegrator::UnconditionalGaussianIntegrator(Matrix generator,
                                                                 LinearOdeOptions ode_options)
    : generator_(std::move(generator))
    , ode_options_(ode_options) {
    if (generator_.rows() == 0 || generator_.rows() != generator_.cols()) {
        throw DimensionMismatchError("generator must be square and non-empty");
    }
}

Trajectory UnconditionalGaussianIntegrator::integrate(const Vector& x0,
                                                      std::span<const Real> times,
                                                      const NoiseIncrements& /*noise*/) const {
    return solve_unconditional(generator_, ode_options_, x0, times);
}

Trajectory UnconditionalGaussianIntegrator::integrate(const Vector& x0,
                                                      std::span<const Real> times,
                                                      RandomEngine& /*rng*/) const {
    return solve_unconditional(generator_, ode_options_, x0, times);
}

// =============================================================================
// MilsteinHomodyneIntegrator
// =============================================================================

MilsteinHomodyneIntegrator::MilsteinHomodyneIntegrator(const ComplexMatrix& coupling,
                                                       const GaussianBath& bath,
                                                       const ComplexMatrix& hamiltonian,
                                                       const Basis& basis)
    : operators_(HomodyneOperators::from_physical(coupling, bath, hamiltonian, basis)) {}

MilsteinHomodyneIntegrator::MilsteinHomodyneIntegrator(HomodyneOperators operators)
    : operators_(std::move(operators)) {}

Trajectory MilsteinHomodyneIntegrator::integrate(const Vector& x0,
                                                 std::span<const Real> times,
                                                 const NoiseIncrements& noise) const {
    return solve_homodyne<SdeScheme::Milstein>(operators_, x0, times, noise);
}

Trajectory MilsteinHomodyneIntegrator::integrate(const Vector& x0,
                                                 std::span<const Real> times,
                                                 RandomEngine& rng) const {
    return solve_homodyne<SdeScheme::Milstein>(operators_, x0, times, rng);
}

// =============================================================================
// Taylor15HomodyneIntegrator
// =============================================================================

Taylor15HomodyneIntegrator::Taylor15HomodyneIntegrator(const ComplexMatrix& coupling,
                                                       const GaussianBath& bath,
                                                       const ComplexMatrix& hamiltonian,
                                                       const Basis& basis)
    : operators_(HomodyneOperators::from_physical(coupling, bath, hamiltonian, basis)) {}

Taylor15HomodyneIntegrator::Taylor15HomodyneIntegrator(HomodyneOperators operators)
    : operators_(std::move(operators)) {}

Trajectory Taylor15HomodyneIntegrator::integrate(const Vector& x0,
                                                 std::span<const Real> times,
                                                 const NoiseIncrements& noise) const {
    return solve_homodyne<SdeScheme::Taylor15>(operators_, x0, times, noise);
}

Trajectory Taylor15HomodyneIntegrator::integrate(const Vector& x0,
                                                 std::span<const Real> times,
                                                 RandomEngine& rng) const {
    return solve_homodyne<SdeScheme::Taylor15>(operators_, x0, times, rng);
}

// =============================================================================
// FaultyMilsteinHomodyneIntegrator
// =============================================================================

FaultyMilsteinHomodyneIntegrator::FaultyMilsteinHomodyneIntegrator(const ComplexMatrix& coupling,
                                                                   const GaussianBath& bath,
                                                                   const ComplexMatrix& hamiltonian,
                                                                   const Basis& basis)
    : milstein_(coupling, bath, hamiltonian, basis) {}

FaultyMilsteinHomodyneIntegrator::FaultyMilsteinHomodyneIntegrator(HomodyneOperators operators)
    : milstein_(std::move(operators)) {}

Trajectory FaultyMilsteinHomodyneIntegrator::integrate(const Vector& x0,
                                                       std::span<const Real> times,
                                                       const NoiseIncrements& noise) const {
    return solve_homodyne<SdeScheme::FaultyMilstein>(operators(), x0, times, noise);
}

Trajectory FaultyMilsteinHomodyneIntegrator::integrate(const Vector& x0,
                                                       std::span<const Real> times,
                                                       RandomEngine& rng) const {
    return solve_homodyne<SdeScheme::FaultyMilstein>(operators(), x0, times, rng);
}

// =============================================================================
// Runtime selection
// =============================================================================

std::optional<IntegratorKind> parse_integrator_kind(std::string_view name) {
    for (auto kind : {IntegratorKind::Milstein,
                      IntegratorKind::Taylor15,
                      IntegratorKind::FaultyMilstein,
                      IntegratorKind::UnconditionalVacuum,
                      IntegratorKind::UnconditionalGaussian}) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

Trajectory AnyIntegrator::integrate(const Vector& x0,
                                    std::span<const Real> times,
                                    const NoiseIncrements& noise) const {
    return std::visit([&](const auto& integrator) { return integrator.integrate(x0, times, noise); },
                      impl_);
}

Trajectory AnyIntegrator::integrate(const Vector& x0,
                                    std::span<const Real> times,
                                    RandomEngine& rng) const {
    return std::visit([&](const auto& integrator) { return integrator.integrate(x0, times, rng); },
                      impl_);
}

Index AnyIntegrator::dimension() const {
    return std::visit([](const auto& integrator) { return integrator.dimension(); }, impl_);
}

bool AnyIntegrator::consumes_noise() const {
    return std::visit([](const auto& integrator) { return integrator.consumes_noise(); }, impl_);
}

bool AnyIntegrator::requires_multiple_ito() const {
    return std::visit([](const auto& integrator) { return integrator.requires_multiple_ito(); },
                      impl_);
}

IntegratorKind AnyIntegrator::kind() const {
    switch (impl_.index()) {
        case 0: return IntegratorKind::Milstein;
        case 1: return IntegratorKind::Taylor15;
        case 2: return IntegratorKind::FaultyMilstein;
        case 3: return IntegratorKind::UnconditionalVacuum;
        default: return IntegratorKind::UnconditionalGaussian;
    }
}

AnyIntegrator make_integrator(IntegratorKind kind,
                              const HomodyneSystem& system,
                              const GaussianBath& bath,
                              const LinearOdeOptions& ode_options) {
    validate_basis(system.basis);
    bath.validate();

    switch (kind) {
        case IntegratorKind::Milstein:
            return MilsteinHomodyneIntegrator(system.coupling, bath, system.hamiltonian, system.basis);
        case IntegratorKind::Taylor15:
            return Taylor15HomodyneIntegrator(system.coupling, bath, system.hamiltonian, system.basis);
        case IntegratorKind::FaultyMilstein:
            return FaultyMilsteinHomodyneIntegrator(system.coupling, bath, system.hamiltonian,
                                                    system.basis);
        case IntegratorKind::UnconditionalVacuum:
            return UnconditionalVacuumIntegrator(system.coupling, system.basis, ode_options);
        case IntegratorKind::UnconditionalGaussian:
            return UnconditionalGaussianIntegrator(system.coupling, bath, system.hamiltonian,
                                                   system.basis, ode_options);
    }
    throw std::invalid_argument("unknown integrator kind");
}

}  // namespace smesim::v1
