#pragma once

// =============================================================================
// smesim v1 - Grid Convergence Analysis
// =============================================================================
// Empirical strong order of an integrator from three nested resolutions driven
// by the same Brownian path:
//
//   rate = [log ||rho_4(T) - rho_2(T)||_1 - log ||rho_2(T) - rho(T)||_1] / log 2
//
// where rho runs on the supplied grid, rho_2 on the grid coarsened once and
// rho_4 on the grid coarsened twice. strong_grid_convergence() repeats this for
// a batch of trajectories, one OpenMP task per trajectory.
// =============================================================================

#include "smesim/v1/concepts.hpp"
#include "smesim/v1/errors.hpp"
#include "smesim/v1/noise.hpp"
#include "smesim/v1/numeric_types.hpp"
#include "smesim/v1/trajectory.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace smesim::v1 {

// =============================================================================
// Results
// =============================================================================

/// Rate with the two error norms it was computed from
struct RateMeasurement {
    Real rate = 0.0;
    Real coarse_error = 0.0;  // ||rho_4(T) - rho_2(T)||_1
    Real fine_error = 0.0;    // ||rho_2(T) - rho(T)||_1
};

/// Outcome of one trajectory in a batch: either a rate or the failure kind
struct RateEstimate {
    std::size_t index = 0;
    std::optional<Real> rate;
    Real coarse_error = 0.0;
    Real fine_error = 0.0;
    ConvergenceError error = ConvergenceError::None;
    std::string message;

    [[nodiscard]] bool ok() const { return rate.has_value(); }

    [[nodiscard]] std::string to_csv() const {
        return std::to_string(index) + "," +
               (rate ? std::to_string(*rate) : std::string()) + "," +
               std::to_string(coarse_error) + "," +
               std::to_string(fine_error) + "," +
               to_string(error) + "," +
               message;
    }

    [[nodiscard]] static std::string csv_header() {
        return "index,rate,coarse_error,fine_error,status,message";
    }
};

/// Statistics over the successful rates of a batch
struct RateSummary {
    std::size_t count = 0;
    std::size_t failures = 0;
    Real mean = 0.0;
    Real stddev = 0.0;
    Real median = 0.0;
    Real min = 0.0;
    Real max = 0.0;

    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] RateSummary summarize(const std::vector<RateEstimate>& estimates);

// =============================================================================
// Convergence Logger
// =============================================================================

using ConvergenceLogCallback = std::function<void(const RateEstimate&)>;

/// Collects per-trajectory outcomes of a batch. Disabled by default.
/// The batch analyzer feeds it in trajectory order once all tasks finished.
class ConvergenceLogger {
public:
    ConvergenceLogger() = default;

    void set_enabled(bool enabled) { enabled_ = enabled; }
    [[nodiscard]] bool is_enabled() const { return enabled_; }

    void set_callback(ConvergenceLogCallback callback) {
        callback_ = std::move(callback);
    }

    /// Log an outcome (no-op if disabled)
    void log(const RateEstimate& entry) {
        if (!enabled_) return;

        if (buffer_.size() < max_buffer_size_) {
            buffer_.push_back(entry);
        }

        if (callback_) {
            callback_(entry);
        }

        ++total_entries_;
        if (entry.ok()) {
            sum_rate_ += *entry.rate;
        } else {
            ++failures_;
        }
    }

    [[nodiscard]] const std::vector<RateEstimate>& buffer() const { return buffer_; }
    void clear_buffer() { buffer_.clear(); }

    /// Export buffer to CSV string
    [[nodiscard]] std::string to_csv() const {
        std::string result = RateEstimate::csv_header() + "\n";
        for (const auto& entry : buffer_) {
            result += entry.to_csv() + "\n";
        }
        return result;
    }

    [[nodiscard]] std::size_t total_entries() const { return total_entries_; }
    [[nodiscard]] std::size_t failures() const { return failures_; }
    [[nodiscard]] Real average_rate() const {
        const std::size_t ok = total_entries_ - failures_;
        return ok > 0 ? sum_rate_ / static_cast<Real>(ok) : 0.0;
    }

    void reset() {
        buffer_.clear();
        total_entries_ = 0;
        failures_ = 0;
        sum_rate_ = 0.0;
    }

    void set_max_buffer_size(std::size_t size) { max_buffer_size_ = size; }

private:
    bool enabled_ = false;
    ConvergenceLogCallback callback_;
    std::vector<RateEstimate> buffer_;
    std::size_t max_buffer_size_ = 10000;

    std::size_t total_entries_ = 0;
    std::size_t failures_ = 0;
    Real sum_rate_ = 0.0;
};

// =============================================================================
// Options
// =============================================================================

struct ConvergenceOptions {
    std::size_t trajectories = 256;
    int n_jobs = 1;                              // 1 = sequential, <= 0 = all threads
    std::uint64_t seed = 0;
    std::vector<NoiseIncrements> noise_batch;    // Overrides `trajectories` when non-empty
    ConvergenceLogger* logger = nullptr;
};

// =============================================================================
// Building Blocks
// =============================================================================

/// Entrywise absolute sum
[[nodiscard]] inline Real l1_norm(const Vector& v) { return v.cwiseAbs().sum(); }

/// Rate from the final states of the fine, once-coarsened and twice-coarsened
/// runs. Throws NumericalDegeneracyError when either norm is zero or not finite.
[[nodiscard]] RateMeasurement rate_from_final_states(const Vector& fine,
                                                     const Vector& half,
                                                     const Vector& quarter);

/// Worker count for an n_jobs request: n_jobs itself when positive, otherwise
/// every available thread (1 without OpenMP)
[[nodiscard]] int resolve_thread_count(int n_jobs);

/// Random engine of trajectory `index` in a batch seeded with `seed`
[[nodiscard]] RandomEngine trajectory_engine(std::uint64_t seed, std::size_t index);

/// Throws InvalidGridError unless `times` is evenly spaced with a multiple of
/// four intervals
void validate_convergence_grid(std::span<const Real> times);

// =============================================================================
// Single Trajectory
// =============================================================================

/// Integrate at three nested resolutions with correlated noise and measure
/// the rate
template<TrajectoryIntegrator I>
[[nodiscard]] RateMeasurement measure_rate(const I& integrator,
                                           const Vector& rho0,
                                           std::span<const Real> times,
                                           const NoiseIncrements& noise) {
    validate_convergence_grid(times);
    validate_noise(noise, interval_count(times), integrator.requires_multiple_ito());

    const CoarseGrid half = coarsen(times, noise);
    const CoarseGrid quarter = coarsen(half.times, half.noise);

    const Trajectory fine_run = integrator.integrate(rho0, times, noise);
    const Trajectory half_run = integrator.integrate(rho0, half.times, half.noise);
    const Trajectory quarter_run = integrator.integrate(rho0, quarter.times, quarter.noise);

    return rate_from_final_states(fine_run.final_state(),
                                  half_run.final_state(),
                                  quarter_run.final_state());
}

/// Same as measure_rate(), drawing U1 and U2 from `rng` first
template<TrajectoryIntegrator I>
[[nodiscard]] RateMeasurement measure_rate(const I& integrator,
                                           const Vector& rho0,
                                           std::span<const Real> times,
                                           RandomEngine& rng) {
    validate_convergence_grid(times);
    const auto noise = NoiseIncrements::sample(interval_count(times), rng, true);
    return measure_rate(integrator, rho0, times, noise);
}

template<TrajectoryIntegrator I>
[[nodiscard]] Real calc_rate(const I& integrator,
                             const Vector& rho0,
                             std::span<const Real> times,
                             const NoiseIncrements& noise) {
    return measure_rate(integrator, rho0, times, noise).rate;
}

template<TrajectoryIntegrator I>
[[nodiscard]] Real calc_rate(const I& integrator,
                             const Vector& rho0,
                             std::span<const Real> times,
                             RandomEngine& rng) {
    return measure_rate(integrator, rho0, times, rng).rate;
}

// =============================================================================
// Batch
// =============================================================================

namespace detail {

/// Run one trajectory, turning its failure into the returned record.
/// Runs inside the parallel region, so no std::exception may escape.
template<TrajectoryIntegrator I>
[[nodiscard]] RateEstimate estimate_trajectory(const I& integrator,
                                               const Vector& rho0,
                                               std::span<const Real> times,
                                               const ConvergenceOptions& options,
                                               std::size_t index) {
    RateEstimate estimate;
    estimate.index = index;

    auto record_failure = [&](ConvergenceError kind, const char* what) {
        estimate.rate.reset();
        estimate.error = kind;
        estimate.message = what;
    };

    try {
        RateMeasurement measurement;
        if (!options.noise_batch.empty()) {
            measurement = measure_rate(integrator, rho0, times, options.noise_batch[index]);
        } else {
            RandomEngine rng = trajectory_engine(options.seed, index);
            measurement = measure_rate(integrator, rho0, times, rng);
        }
        estimate.rate = measurement.rate;
        estimate.coarse_error = measurement.coarse_error;
        estimate.fine_error = measurement.fine_error;
    } catch (const InvalidGridError& e) {
        record_failure(ConvergenceError::InvalidGrid, e.what());
    } catch (const DimensionMismatchError& e) {
        record_failure(ConvergenceError::DimensionMismatch, e.what());
    } catch (const NumericalDegeneracyError& e) {
        record_failure(ConvergenceError::NumericalDegeneracy, e.what());
    } catch (const IntegrationError& e) {
        record_failure(ConvergenceError::IntegrationFailure, e.what());
    } catch (const std::exception& e) {
        record_failure(ConvergenceError::Unexpected, e.what());
    }

    return estimate;
}

void validate_batch(Index dimension,
                    bool require_u2,
                    const Vector& rho0,
                    std::span<const Real> times,
                    const ConvergenceOptions& options);

}  // namespace detail

/// Rate of every trajectory of a batch, in input order. The grid, the initial
/// state and the noise batch are validated up front and throw; failures of
/// single trajectories are recorded in their RateEstimate. Results depend on
/// the seed only, never on n_jobs.
template<TrajectoryIntegrator I>
[[nodiscard]] std::vector<RateEstimate> strong_grid_convergence(const I& integrator,
                                                                const Vector& rho0,
                                                                std::span<const Real> times,
                                                                const ConvergenceOptions& options = {}) {
    detail::validate_batch(static_cast<Index>(integrator.dimension()),
                           integrator.requires_multiple_ito(), rho0, times, options);

    const std::size_t count = options.noise_batch.empty() ? options.trajectories
                                                          : options.noise_batch.size();
    std::vector<RateEstimate> results(count);

    const int threads = resolve_thread_count(options.n_jobs);
    const auto n = static_cast<std::int64_t>(count);

#pragma omp parallel for num_threads(threads) schedule(dynamic) if (threads > 1)
    for (std::int64_t i = 0; i < n; ++i) {
        const auto index = static_cast<std::size_t>(i);
        results[index] = detail::estimate_trajectory(integrator, rho0, times, options, index);
    }

    if (options.logger) {
        for (const auto& estimate : results) {
            options.logger->log(estimate);
        }
    }

    return results;
}

}  // namespace smesim::v1
