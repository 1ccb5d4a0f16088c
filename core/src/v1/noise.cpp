#include "smesim/v1/noise.hpp"

#include "smesim/v1/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace smesim::v1 {

NoiseIncrements NoiseIncrements::sample(std::size_t intervals, RandomEngine& rng, bool with_u2) {
    std::normal_distribution<Real> normal(0.0, 1.0);

    NoiseIncrements noise;
    noise.u1.resize(intervals);
    for (auto& u : noise.u1) {
        u = normal(rng);
    }
    if (with_u2) {
        noise.u2.resize(intervals);
        for (auto& u : noise.u2) {
            u = normal(rng);
        }
    }
    return noise;
}

std::vector<Real> uniform_grid(Real t_start, Real t_stop, std::size_t intervals) {
    if (intervals == 0) {
        throw InvalidGridError("uniform grid needs at least one interval");
    }
    if (!std::isfinite(t_start) || !std::isfinite(t_stop) || t_stop <= t_start) {
        throw InvalidGridError("uniform grid needs finite t_start < t_stop");
    }

    std::vector<Real> times(intervals + 1);
    const Real h = (t_stop - t_start) / static_cast<Real>(intervals);
    for (std::size_t i = 0; i < intervals; ++i) {
        times[i] = t_start + static_cast<Real>(i) * h;
    }
    times[intervals] = t_stop;
    return times;
}

void validate_time_grid(std::span<const Real> times) {
    if (times.size() < 2) {
        throw InvalidGridError("time grid needs at least two points, got " +
                               std::to_string(times.size()));
    }
    for (std::size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i])) {
            throw InvalidGridError("time grid contains a non-finite point at index " +
                                   std::to_string(i));
        }
        if (i > 0 && times[i] <= times[i - 1]) {
            throw InvalidGridError("time grid is not strictly increasing at index " +
                                   std::to_string(i));
        }
    }
}

void validate_uniform_grid(std::span<const Real> times) {
    validate_time_grid(times);

    const Real h = times[1] - times[0];
    const Real tol = RealTraits<Real>::grid_spacing_reltol *
                     std::max(h, std::abs(times.back() - times.front()));
    for (std::size_t i = 1; i < times.size(); ++i) {
        if (std::abs((times[i] - times[i - 1]) - h) > tol) {
            throw InvalidGridError("time grid is not evenly spaced at interval " +
                                   std::to_string(i - 1));
        }
    }
}

void validate_noise(const NoiseIncrements& noise, std::size_t intervals, bool require_u2) {
    if (noise.u1.size() != intervals) {
        throw DimensionMismatchError("U1 has " + std::to_string(noise.u1.size()) +
                                     " entries but the grid has " + std::to_string(intervals) +
                                     " intervals");
    }
    if (require_u2 || noise.has_u2()) {
        if (noise.u2.size() != intervals) {
            throw DimensionMismatchError("U2 has " + std::to_string(noise.u2.size()) +
                                         " entries but the grid has " +
                                         std::to_string(intervals) + " intervals");
        }
    }
}

CoarseGrid coarsen(std::span<const Real> times, const NoiseIncrements& noise) {
    validate_uniform_grid(times);
    const std::size_t fine = interval_count(times);
    if (fine % 2 != 0) {
        throw InvalidGridError("coarsening needs an even number of intervals, got " +
                               std::to_string(fine));
    }
    validate_noise(noise, fine, false);

    const std::size_t coarse = fine / 2;
    constexpr Real inv_sqrt2 = 1.0 / std::numbers::sqrt2;
    constexpr Real u2_scale = 1.0 / (2.0 * std::numbers::sqrt2);

    CoarseGrid out;
    out.times.resize(coarse + 1);
    for (std::size_t i = 0; i <= coarse; ++i) {
        out.times[i] = times[2 * i];
    }

    out.noise.u1.resize(coarse);
    for (std::size_t i = 0; i < coarse; ++i) {
        out.noise.u1[i] = (noise.u1[2 * i] + noise.u1[2 * i + 1]) * inv_sqrt2;
    }

    if (noise.has_u2()) {
        out.noise.u2.resize(coarse);
        for (std::size_t i = 0; i < coarse; ++i) {
            const Real even = noise.u1[2 * i];
            const Real odd = noise.u1[2 * i + 1];
            out.noise.u2[i] = (std::numbers::sqrt3 * (even - odd) +
                               noise.u2[2 * i] + noise.u2[2 * i + 1]) * u2_scale;
        }
    }

    return out;
}

CoarseGrid coarsen(std::span<const Real> times, const NoiseIncrements& noise, int levels) {
    if (levels < 0) {
        throw InvalidGridError("coarsening level count must be non-negative");
    }
    CoarseGrid current{std::vector<Real>(times.begin(), times.end()), noise};
    for (int level = 0; level < levels; ++level) {
        current = coarsen(current.times, current.noise);
    }
    return current;
}

}  // namespace smesim::v1
