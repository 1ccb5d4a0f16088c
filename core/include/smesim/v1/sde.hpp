#pragma once

// =============================================================================
// smesim v1 - Stochastic Stepper Schemes
// =============================================================================
// This header provides:
// - Scheme identifiers and their strong orders
// - Per-interval increments (dt, dW, dZ) from standard-normal primitives
// - One-step Milstein, faulty Milstein and strong order 1.5 Taylor updates for
//   autonomous SDEs dX = a(X) dt + b(X) dW with scalar noise
// - A fixed-grid driver that produces the whole trajectory
// =============================================================================

#include "smesim/v1/concepts.hpp"
#include "smesim/v1/errors.hpp"
#include "smesim/v1/noise.hpp"
#include "smesim/v1/numeric_types.hpp"
#include "smesim/v1/trajectory.hpp"

#include <cmath>
#include <numbers>
#include <span>
#include <string>

namespace smesim::v1 {

// =============================================================================
// Scheme Types
// =============================================================================

enum class SdeScheme {
    Milstein,        // Strong order 1.0
    FaultyMilstein,  // Milstein without the 1/2 on the correction, order 0.5
    Taylor15         // Strong order 1.5 Kloeden-Platen Taylor scheme
};

/// Strong convergence order of a scheme
[[nodiscard]] constexpr Real scheme_strong_order(SdeScheme s) noexcept {
    switch (s) {
        case SdeScheme::Milstein: return 1.0;
        case SdeScheme::FaultyMilstein: return 0.5;
        case SdeScheme::Taylor15: return 1.5;
        default: return 0.5;
    }
}

/// Whether the scheme consumes the multiple Ito primitive U2
[[nodiscard]] constexpr bool requires_multiple_ito(SdeScheme s) noexcept {
    return s == SdeScheme::Taylor15;
}

[[nodiscard]] constexpr const char* to_string(SdeScheme s) noexcept {
    switch (s) {
        case SdeScheme::Milstein: return "milstein";
        case SdeScheme::FaultyMilstein: return "faulty_milstein";
        case SdeScheme::Taylor15: return "taylor_1_5";
        default: return "unknown";
    }
}

// =============================================================================
// Step Increments
// =============================================================================

/// Increments of one interval: dW = int dW_s, dZ = int (W_s - W_t) ds
struct StepIncrements {
    Real dt = 0.0;
    Real dW = 0.0;
    Real dZ = 0.0;

    /// dW = u1 sqrt(dt), dZ = dt^{3/2} (u1 + u2 / sqrt(3)) / 2
    [[nodiscard]] static StepIncrements from_normals(Real dt, Real u1, Real u2 = 0.0) noexcept {
        const Real sqrt_dt = std::sqrt(dt);
        StepIncrements inc;
        inc.dt = dt;
        inc.dW = u1 * sqrt_dt;
        inc.dZ = 0.5 * dt * sqrt_dt * (u1 + u2 * std::numbers::inv_sqrt3);
        return inc;
    }
};

// =============================================================================
// One-Step Updates
// =============================================================================

/// x + a dt + b dW + (1/2) (b . grad) b (dW^2 - dt)
template<MilsteinField F>
[[nodiscard]] Vector milstein_step(const F& field, const Vector& x, const StepIncrements& inc) {
    const Real dW = inc.dW;
    return x + field.drift(x) * inc.dt
             + field.diffusion(x) * dW
             + 0.5 * field.b_dx_b(x) * (dW * dW - inc.dt);
}

/// Milstein with the 1/2 on the correction term dropped. Kept as a negative
/// control for the grid convergence analyzer: it converges with order 0.5.
template<MilsteinField F>
[[nodiscard]] Vector faulty_milstein_step(const F& field, const Vector& x, const StepIncrements& inc) {
    const Real dW = inc.dW;
    return x + field.drift(x) * inc.dt
             + field.diffusion(x) * dW
             + field.b_dx_b(x) * (dW * dW - inc.dt);
}

/// Strong order 1.5 Taylor step (Kloeden & Platen 10.4.1, scalar noise):
///
///   x + a dt + b dW + 1/2 L1 b (dW^2 - dt) + L1 a dZ + L0 b (dW dt - dZ)
///     + 1/2 L0 a dt^2 + 1/2 L1 L1 b (dW^2 / 3 - dt) dW
///
/// with L1 = b . grad and L0 = a . grad + 1/2 b b : grad grad.
template<Taylor15Field F>
[[nodiscard]] Vector taylor_1_5_step(const F& field, const Vector& x, const StepIncrements& inc) {
    const Real dt = inc.dt;
    const Real dW = inc.dW;
    const Real dZ = inc.dZ;

    const Vector L0_b = field.a_dx_b(x) + field.b_b_dxdx_b(x);

    return x + field.drift(x) * dt
             + field.diffusion(x) * dW
             + 0.5 * field.b_dx_b(x) * (dW * dW - dt)
             + field.b_dx_a(x) * dZ
             + L0_b * (dW * dt - dZ)
             + 0.5 * field.a_dx_a(x) * (dt * dt)
             + 0.5 * field.b_dx_b_dx_b(x) * ((dW * dW / 3.0 - dt) * dW);
}

/// Dispatch a single step for a scheme known at compile time
template<SdeScheme S, MilsteinField F>
[[nodiscard]] Vector sde_step(const F& field, const Vector& x, const StepIncrements& inc) {
    if constexpr (S == SdeScheme::Milstein) {
        return milstein_step(field, x, inc);
    } else if constexpr (S == SdeScheme::FaultyMilstein) {
        return faulty_milstein_step(field, x, inc);
    } else {
        static_assert(Taylor15Field<F>, "Taylor 1.5 needs every derivative term");
        return taylor_1_5_step(field, x, inc);
    }
}

// =============================================================================
// Fixed-Grid Driver
// =============================================================================

/// Advance x0 over every interval of `times`, returning all states with x0
/// first. Grid and noise are validated before any step is taken; a step that
/// produces a non-finite state raises NumericalDegeneracyError.
template<SdeScheme S, MilsteinField F>
[[nodiscard]] Trajectory integrate_sde(const F& field,
                                       const Vector& x0,
                                       std::span<const Real> times,
                                       const NoiseIncrements& noise) {
    validate_time_grid(times);
    const std::size_t intervals = interval_count(times);
    validate_noise(noise, intervals, requires_multiple_ito(S));

    Trajectory traj;
    traj.times.assign(times.begin(), times.end());
    traj.states.reserve(times.size());
    traj.states.push_back(x0);

    for (std::size_t n = 0; n < intervals; ++n) {
        const Real u2 = requires_multiple_ito(S) ? noise.u2[n] : 0.0;
        const auto inc = StepIncrements::from_normals(times[n + 1] - times[n], noise.u1[n], u2);

        Vector next = sde_step<S>(field, traj.states.back(), inc);
        if (!next.allFinite()) {
            throw NumericalDegeneracyError(std::string(to_string(S)) +
                                           " step produced a non-finite state at interval " +
                                           std::to_string(n));
        }
        traj.states.push_back(std::move(next));
    }

    return traj;
}

}  // namespace smesim::v1
