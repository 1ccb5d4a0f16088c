#pragma once

// =============================================================================
// smesim v1 - Concepts for Fields, Steppers and Integrators
// =============================================================================
// This header defines concepts that constrain template parameters for:
// - Drift/diffusion fields consumed by the Milstein and Taylor steppers
// - Trajectory integrators consumed by the grid convergence analyzer
// =============================================================================

#include "smesim/v1/noise.hpp"
#include "smesim/v1/numeric_types.hpp"
#include "smesim/v1/trajectory.hpp"

#include <concepts>
#include <span>

namespace smesim::v1 {

// =============================================================================
// Field Concepts
// =============================================================================

/// A drift a(x) and diffusion b(x) with the (b . grad) b term Milstein needs
template<typename F>
concept MilsteinField = requires(const F& field, const Vector& x) {
    { field.drift(x) } -> std::convertible_to<Vector>;
    { field.diffusion(x) } -> std::convertible_to<Vector>;
    { field.b_dx_b(x) } -> std::convertible_to<Vector>;
};

/// A field exposing every derivative term of the strong order 1.5 Taylor scheme
template<typename F>
concept Taylor15Field = MilsteinField<F> && requires(const F& field, const Vector& x) {
    { field.b_dx_a(x) } -> std::convertible_to<Vector>;
    { field.a_dx_b(x) } -> std::convertible_to<Vector>;
    { field.a_dx_a(x) } -> std::convertible_to<Vector>;
    { field.b_dx_b_dx_b(x) } -> std::convertible_to<Vector>;
    { field.b_b_dxdx_b(x) } -> std::convertible_to<Vector>;
};

// =============================================================================
// Integrator Concept
// =============================================================================

/// Anything that turns an initial state, a time grid and noise increments into
/// a trajectory. Deterministic integrators accept and ignore the noise.
/// requires_multiple_ito() is true when supplied noise must carry U2.
template<typename I>
concept TrajectoryIntegrator = requires(const I& integrator,
                                        const Vector& x0,
                                        std::span<const Real> times,
                                        const NoiseIncrements& noise,
                                        RandomEngine& rng) {
    { integrator.integrate(x0, times, noise) } -> std::same_as<Trajectory>;
    { integrator.integrate(x0, times, rng) } -> std::same_as<Trajectory>;
    { integrator.dimension() } -> std::convertible_to<Index>;
    { integrator.consumes_noise() } -> std::convertible_to<bool>;
    { integrator.requires_multiple_ito() } -> std::convertible_to<bool>;
};

}  // namespace smesim::v1
