#include "smesim/v1/grid_convergence.hpp"

#include <cmath>
#include <numbers>
#include <random>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace smesim::v1 {

RateMeasurement rate_from_final_states(const Vector& fine,
                                       const Vector& half,
                                       const Vector& quarter) {
    if (fine.size() != half.size() || fine.size() != quarter.size()) {
        throw DimensionMismatchError("final states of the three resolutions differ in dimension");
    }

    RateMeasurement m;
    m.coarse_error = l1_norm(quarter - half);
    m.fine_error = l1_norm(half - fine);

    if (!std::isfinite(m.coarse_error) || !std::isfinite(m.fine_error)) {
        throw NumericalDegeneracyError("error norm is not finite");
    }
    if (m.coarse_error == 0.0 || m.fine_error == 0.0) {
        throw NumericalDegeneracyError("error norm is zero, the rate is undefined");
    }

    m.rate = (std::log(m.coarse_error) - std::log(m.fine_error)) / std::numbers::ln2;
    return m;
}

int resolve_thread_count(int n_jobs) {
    if (n_jobs > 0) {
        return n_jobs;
    }
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

RandomEngine trajectory_engine(std::uint64_t seed, std::size_t index) {
    const auto idx = static_cast<std::uint64_t>(index);
    std::seed_seq seq{static_cast<std::uint32_t>(seed),
                      static_cast<std::uint32_t>(seed >> 32),
                      static_cast<std::uint32_t>(idx),
                      static_cast<std::uint32_t>(idx >> 32)};
    return RandomEngine(seq);
}

void validate_convergence_grid(std::span<const Real> times) {
    validate_uniform_grid(times);
    const std::size_t intervals = interval_count(times);
    if (intervals % 4 != 0) {
        throw InvalidGridError("grid convergence needs a multiple of 4 intervals, got " +
                               std::to_string(intervals));
    }
}

namespace detail {

void validate_batch(Index dimension,
                    bool require_u2,
                    const Vector& rho0,
                    std::span<const Real> times,
                    const ConvergenceOptions& options) {
    validate_convergence_grid(times);

    if (rho0.size() != dimension) {
        throw DimensionMismatchError("initial state has dimension " + std::to_string(rho0.size()) +
                                     ", integrator expects " + std::to_string(dimension));
    }

    if (options.noise_batch.empty()) {
        if (options.trajectories == 0) {
            throw std::invalid_argument("trajectory count must be positive");
        }
        return;
    }

    const std::size_t intervals = interval_count(times);
    for (std::size_t i = 0; i < options.noise_batch.size(); ++i) {
        try {
            validate_noise(options.noise_batch[i], intervals, require_u2);
        } catch (const DimensionMismatchError& e) {
            throw DimensionMismatchError("noise batch entry " + std::to_string(i) + ": " + e.what());
        }
    }
}

}  // namespace detail

RateSummary summarize(const std::vector<RateEstimate>& estimates) {
    RateSummary summary;

    std::vector<Real> rates;
    rates.reserve(estimates.size());
    for (const auto& e : estimates) {
        if (e.ok()) {
            rates.push_back(*e.rate);
        } else {
            ++summary.failures;
        }
    }

    summary.count = rates.size();
    if (rates.empty()) {
        return summary;
    }

    Real sum = 0.0;
    for (Real r : rates) sum += r;
    summary.mean = sum / static_cast<Real>(rates.size());

    if (rates.size() > 1) {
        Real sq = 0.0;
        for (Real r : rates) sq += (r - summary.mean) * (r - summary.mean);
        summary.stddev = std::sqrt(sq / static_cast<Real>(rates.size() - 1));
    }

    std::sort(rates.begin(), rates.end());
    summary.min = rates.front();
    summary.max = rates.back();
    const std::size_t mid = rates.size() / 2;
    summary.median = rates.size() % 2 == 1 ? rates[mid] : 0.5 * (rates[mid - 1] + rates[mid]);

    return summary;
}

std::string RateSummary::to_string() const {
    std::ostringstream oss;
    oss << "rates=" << count
        << " failures=" << failures
        << " mean=" << mean
        << " stddev=" << stddev
        << " median=" << median
        << " min=" << min
        << " max=" << max;
    return oss.str();
}

}  // namespace smesim::v1
