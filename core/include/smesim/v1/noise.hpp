#pragma once

// =============================================================================
// smesim v1 - Time Grids, Noise Increments and Increment Coarsening
// =============================================================================
// This header provides:
// - Uniform time grid construction and validation
// - NoiseIncrements: standard-normal primitives U1 (Wiener) and U2 (multiple Ito)
// - coarsen(): dyadic coarsening of a grid together with its increments, so the
//   coarse level sees the same Brownian path as the fine level
// =============================================================================

#include "smesim/v1/numeric_types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace smesim::v1 {

// =============================================================================
// Noise Increments
// =============================================================================

/// Standard-normal samples for each time interval of a grid.
///
/// u1 builds the Wiener increment dW = u1 * sqrt(dt). u2 builds the multiple
/// Ito increment dZ = dt^{3/2} (u1 + u2 / sqrt(3)) / 2. u2 may be left empty
/// when only Wiener increments are consumed.
struct NoiseIncrements {
    std::vector<Real> u1;
    std::vector<Real> u2;

    [[nodiscard]] std::size_t intervals() const { return u1.size(); }
    [[nodiscard]] bool has_u2() const { return !u2.empty(); }

    /// Draw independent standard-normal samples for `intervals` intervals
    [[nodiscard]] static NoiseIncrements sample(std::size_t intervals,
                                                RandomEngine& rng,
                                                bool with_u2 = true);
};

/// A coarsened grid with the increments that belong to it
struct CoarseGrid {
    std::vector<Real> times;
    NoiseIncrements noise;
};

// =============================================================================
// Time Grid Helpers
// =============================================================================

/// Evenly spaced grid with `intervals` intervals on [t_start, t_stop]
[[nodiscard]] std::vector<Real> uniform_grid(Real t_start, Real t_stop, std::size_t intervals);

/// Number of intervals of a grid (0 for an empty grid)
[[nodiscard]] inline std::size_t interval_count(std::span<const Real> times) noexcept {
    return times.empty() ? 0 : times.size() - 1;
}

/// Throws InvalidGridError unless the grid has at least two finite, strictly
/// increasing points
void validate_time_grid(std::span<const Real> times);

/// validate_time_grid() plus an even-spacing check
void validate_uniform_grid(std::span<const Real> times);

/// Throws DimensionMismatchError unless u1 (and u2, when required or present)
/// has exactly `intervals` entries
void validate_noise(const NoiseIncrements& noise, std::size_t intervals, bool require_u2);

// =============================================================================
// Increment Coarsening
// =============================================================================

/// Halve the sampling frequency of an evenly spaced grid.
///
/// Times are every other point. For each pair (2i, 2i+1) of fine intervals:
///   U1'_i = (U1_{2i} + U1_{2i+1}) / sqrt(2)
///   U2'_i = (sqrt(3) (U1_{2i} - U1_{2i+1}) + U2_{2i} + U2_{2i+1}) / (2 sqrt(2))
/// The coarse dW and dZ are then exactly the sums of the fine ones over the
/// coarse interval. When noise.u2 is empty only U1' is produced.
[[nodiscard]] CoarseGrid coarsen(std::span<const Real> times, const NoiseIncrements& noise);

/// Apply coarsen() `levels` times
[[nodiscard]] CoarseGrid coarsen(std::span<const Real> times,
                                 const NoiseIncrements& noise,
                                 int levels);

}  // namespace smesim::v1
