#include "smesim/v1/study.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace smesim::v1 {

ConvergenceStudyResult run_convergence_study(const ConvergenceStudyConfig& config,
                                             const HomodyneSystem& system,
                                             const Vector& rho0,
                                             std::vector<NoiseIncrements> noise_batch,
                                             ConvergenceLogger* logger) {
    if (config.noise == NoiseSource::Supplied && noise_batch.empty()) {
        throw std::invalid_argument("study configured for supplied noise but no noise batch given");
    }
    if (config.noise == NoiseSource::Generated && !noise_batch.empty()) {
        throw std::invalid_argument("study configured for generated noise but a noise batch was given");
    }

    auto wall_start = std::chrono::high_resolution_clock::now();

    ConvergenceStudyResult result;
    result.integrator = config.integrator;
    result.times = uniform_grid(config.t_start, config.t_stop, config.intervals);

    const AnyIntegrator integrator = make_integrator(config.integrator, system, config.bath, config.ode);

    ConvergenceOptions options;
    options.trajectories = config.trajectories;
    options.n_jobs = config.n_jobs;
    options.seed = config.seed;
    options.noise_batch = std::move(noise_batch);
    options.logger = logger;

    result.estimates = strong_grid_convergence(integrator, rho0, result.times, options);
    result.summary = summarize(result.estimates);

    const int threads = resolve_thread_count(config.n_jobs);
    result.telemetry.trajectories = result.estimates.size();
    result.telemetry.threads_used =
        static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(threads),
                                               std::max<std::size_t>(result.estimates.size(), 1)));

    auto wall_end = std::chrono::high_resolution_clock::now();
    result.telemetry.wall_time_seconds = std::chrono::duration<Real>(wall_end - wall_start).count();

    return result;
}

}  // namespace smesim::v1
