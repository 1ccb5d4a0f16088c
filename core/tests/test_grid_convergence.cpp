#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "smesim/v1/errors.hpp"
#include "smesim/v1/grid_convergence.hpp"
#include "smesim/v1/integrators.hpp"
#include "smesim/v1/sde.hpp"
#include "smesim/v1/study.hpp"
#include "qubit_fixtures.hpp"
#include <cmath>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using namespace smesim::v1;
using namespace smesim::test;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

HomodyneSystem qubit_system() {
    return HomodyneSystem{lowering(), zero_hamiltonian(), pauli_basis()};
}

template<typename I>
I vacuum_integrator() {
    return I(lowering(), GaussianBath::vacuum(), zero_hamiltonian(), pauli_basis());
}

std::vector<NoiseIncrements> sample_batch(std::size_t count, std::size_t intervals, unsigned seed,
                                          bool with_u2 = true) {
    RandomEngine rng(seed);
    std::vector<NoiseIncrements> batch;
    for (std::size_t i = 0; i < count; ++i) {
        batch.push_back(NoiseIncrements::sample(intervals, rng, with_u2));
    }
    return batch;
}

/// Driftless linear test equation dX = sigma X dW, where the 1/2 b.grad(b)
/// term is the leading correction
struct GeometricNoiseField {
    Real sigma = 0.25;

    Vector drift(const Vector& x) const { return Vector::Zero(x.size()); }
    Vector diffusion(const Vector& x) const { return sigma * x; }
    Vector b_dx_b(const Vector& x) const { return sigma * sigma * x; }
};

/// Scalar integrator for GeometricNoiseField
template<SdeScheme S>
struct GeometricNoiseIntegrator {
    GeometricNoiseField field;

    Trajectory integrate(const Vector& x0, std::span<const Real> times, const NoiseIncrements& noise) const {
        return integrate_sde<S>(field, x0, times, noise);
    }
    Trajectory integrate(const Vector& x0, std::span<const Real> times, RandomEngine& rng) const {
        return integrate(x0, times, NoiseIncrements::sample(interval_count(times), rng, false));
    }
    Index dimension() const { return 1; }
    bool consumes_noise() const { return true; }
    bool requires_multiple_ito() const { return false; }
};

static_assert(TrajectoryIntegrator<GeometricNoiseIntegrator<SdeScheme::Milstein>>);

/// Integrator whose backend fails with an exception outside the library taxonomy
struct ThrowingIntegrator {
    Trajectory integrate(const Vector&, std::span<const Real>, const NoiseIncrements&) const {
        throw std::runtime_error("backend exploded");
    }
    Trajectory integrate(const Vector&, std::span<const Real>, RandomEngine&) const {
        throw std::runtime_error("backend exploded");
    }
    Index dimension() const { return 4; }
    bool consumes_noise() const { return true; }
    bool requires_multiple_ito() const { return false; }
};

Vector unit_scalar() {
    return Vector::Ones(1);
}

RateEstimate ok_estimate(std::size_t index, Real rate) {
    RateEstimate e;
    e.index = index;
    e.rate = rate;
    return e;
}

RateEstimate failed_estimate(std::size_t index) {
    RateEstimate e;
    e.index = index;
    e.error = ConvergenceError::NumericalDegeneracy;
    e.message = "zero norm";
    return e;
}

}  // namespace

// =============================================================================
// Building blocks
// =============================================================================

TEST_CASE("rate_from_final_states - log ratio of the error norms", "[convergence]") {
    Vector fine = Vector::Zero(2);
    Vector half(2);
    half << 1e-3, 0.0;
    Vector quarter(2);
    quarter << 1e-3, 4e-3;

    const auto m = rate_from_final_states(fine, half, quarter);
    CHECK_THAT(m.rate, WithinAbs(2.0, 1e-12));
    CHECK_THAT(m.coarse_error, WithinAbs(4e-3, 1e-15));
    CHECK_THAT(m.fine_error, WithinAbs(1e-3, 1e-15));

    SECTION("Zero norm") {
        REQUIRE_THROWS_AS(rate_from_final_states(fine, fine, quarter), NumericalDegeneracyError);
    }

    SECTION("Non-finite norm") {
        Vector broken = half;
        broken[1] = std::numeric_limits<Real>::quiet_NaN();
        REQUIRE_THROWS_AS(rate_from_final_states(fine, broken, quarter), NumericalDegeneracyError);
    }

    SECTION("Dimension mismatch") {
        REQUIRE_THROWS_AS(rate_from_final_states(fine, half, Vector::Zero(3)), DimensionMismatchError);
    }
}

TEST_CASE("validate_convergence_grid - multiple of four intervals", "[convergence][grid]") {
    REQUIRE_NOTHROW(validate_convergence_grid(uniform_grid(0.0, 1.0, 64)));
    REQUIRE_THROWS_AS(validate_convergence_grid(uniform_grid(0.0, 1.0, 66)), InvalidGridError);
    REQUIRE_THROWS_AS(validate_convergence_grid(uniform_grid(0.0, 1.0, 2)), InvalidGridError);
}

TEST_CASE("trajectory_engine - depends on seed and index only", "[convergence]") {
    auto a = trajectory_engine(5, 3);
    auto b = trajectory_engine(5, 3);
    auto c = trajectory_engine(5, 4);
    auto d = trajectory_engine(6, 3);

    const auto first = a();
    CHECK(first == b());
    CHECK(first != c());
    CHECK(first != d());
    CHECK(resolve_thread_count(3) == 3);
    CHECK(resolve_thread_count(0) >= 1);
}

TEST_CASE("measure_rate - single trajectory", "[convergence]") {
    const auto integrator = vacuum_integrator<MilsteinHomodyneIntegrator>();
    const auto times = uniform_grid(0.0, 1.0, 64);
    RandomEngine rng(8);
    const auto noise = NoiseIncrements::sample(64, rng);

    const auto m = measure_rate(integrator, plus_state(), times, noise);
    CHECK(std::isfinite(m.rate));
    CHECK(m.coarse_error > 0.0);
    CHECK(calc_rate(integrator, plus_state(), times, noise) == m.rate);

    REQUIRE_THROWS_AS(calc_rate(integrator, plus_state(), uniform_grid(0.0, 1.0, 62), rng),
                      InvalidGridError);
}

// =============================================================================
// Batch analyzer
// =============================================================================

TEST_CASE("strong_grid_convergence - reference qubit scenario", "[convergence][batch]") {
    // 64 steps over [0, 1], 256 trajectories, vacuum homodyne, sequential
    const auto times = uniform_grid(0.0, 1.0, 64);
    ConvergenceOptions options;
    options.trajectories = 256;
    options.seed = 2018;

    const auto milstein = strong_grid_convergence(
        vacuum_integrator<MilsteinHomodyneIntegrator>(), plus_state(), times, options);
    const auto taylor = strong_grid_convergence(
        vacuum_integrator<Taylor15HomodyneIntegrator>(), plus_state(), times, options);

    REQUIRE(milstein.size() == 256);
    REQUIRE(taylor.size() == 256);
    for (std::size_t i = 0; i < milstein.size(); ++i) {
        CHECK(milstein[i].index == i);
        CHECK(taylor[i].index == i);
    }

    // The 16-step level can leave the physical region on rare paths and give
    // outlying rates, so the order checks below run on a finer grid
    CHECK(summarize(milstein).count + summarize(milstein).failures == 256);
    CHECK(summarize(taylor).count + summarize(taylor).failures == 256);
}

TEST_CASE("strong_grid_convergence - Milstein and Taylor orders on the qubit", "[convergence][batch]") {
    const auto times = uniform_grid(0.0, 1.0, 256);
    ConvergenceOptions options;
    options.trajectories = 1024;
    options.n_jobs = 0;
    options.seed = 2018;

    const auto milstein = summarize(strong_grid_convergence(
        vacuum_integrator<MilsteinHomodyneIntegrator>(), plus_state(), times, options));
    const auto taylor = summarize(strong_grid_convergence(
        vacuum_integrator<Taylor15HomodyneIntegrator>(), plus_state(), times, options));
    const auto faulty = summarize(strong_grid_convergence(
        vacuum_integrator<FaultyMilsteinHomodyneIntegrator>(), plus_state(), times, options));

    INFO("Milstein " << milstein.to_string());
    INFO("Taylor " << taylor.to_string());
    INFO("Faulty " << faulty.to_string());

    CHECK(milstein.failures == 0);
    CHECK(milstein.count == 1024);
    CHECK(milstein.mean >= 0.8);
    CHECK(milstein.mean <= 1.2);
    CHECK(taylor.mean >= 1.2);
    CHECK(taylor.mean <= 1.8);
    CHECK(milstein.mean - faulty.mean > 0.2);
}

TEST_CASE("strong_grid_convergence - faulty Milstein on the linear test equation", "[convergence][batch]") {
    const auto times = uniform_grid(0.0, 1.0, 64);
    ConvergenceOptions options;
    options.trajectories = 16384;
    options.n_jobs = 0;
    options.seed = 2018;

    const auto milstein = summarize(strong_grid_convergence(
        GeometricNoiseIntegrator<SdeScheme::Milstein>{}, unit_scalar(), times, options));
    const auto faulty = summarize(strong_grid_convergence(
        GeometricNoiseIntegrator<SdeScheme::FaultyMilstein>{}, unit_scalar(), times, options));

    INFO("Milstein " << milstein.to_string());
    INFO("Faulty " << faulty.to_string());

    CHECK(milstein.failures == 0);
    CHECK(faulty.failures == 0);
    CHECK(milstein.mean >= 0.8);
    CHECK(milstein.mean <= 1.2);
    CHECK(faulty.mean <= 0.6);
    CHECK(milstein.mean - faulty.mean > 0.2);
}

TEST_CASE("strong_grid_convergence - independent of the worker count", "[convergence][batch][parallel]") {
    const auto integrator = vacuum_integrator<Taylor15HomodyneIntegrator>();
    const auto times = uniform_grid(0.0, 1.0, 32);

    ConvergenceOptions sequential;
    sequential.trajectories = 40;
    sequential.seed = 77;
    ConvergenceOptions parallel = sequential;
    parallel.n_jobs = 4;

    const auto a = strong_grid_convergence(integrator, plus_state(), times, sequential);
    const auto b = strong_grid_convergence(integrator, plus_state(), times, parallel);

    REQUIRE(a.size() == 40);
    REQUIRE(b.size() == 40);
    for (std::size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].index == i);
        CHECK(b[i].index == i);
        REQUIRE(a[i].ok());
        REQUIRE(b[i].ok());
        CHECK(*a[i].rate == *b[i].rate);
    }
}

TEST_CASE("strong_grid_convergence - explicit noise batch", "[convergence][batch]") {
    const auto integrator = vacuum_integrator<MilsteinHomodyneIntegrator>();
    const auto times = uniform_grid(0.0, 1.0, 32);

    SECTION("Batch size overrides the trajectory count") {
        ConvergenceOptions options;
        options.trajectories = 1000;
        options.noise_batch = sample_batch(5, 32, 9);

        const auto results = strong_grid_convergence(integrator, plus_state(), times, options);
        REQUIRE(results.size() == 5);
        for (std::size_t i = 0; i < results.size(); ++i) {
            REQUIRE(results[i].ok());
            CHECK(*results[i].rate == calc_rate(integrator, plus_state(), times, options.noise_batch[i]));
        }
    }

    SECTION("Wrong entry length is rejected up front") {
        ConvergenceOptions options;
        options.noise_batch = sample_batch(3, 32, 9);
        options.noise_batch[1] = sample_batch(1, 16, 10).front();
        REQUIRE_THROWS_AS(strong_grid_convergence(integrator, plus_state(), times, options),
                          DimensionMismatchError);
    }

    SECTION("Non-finite entry fails only its own trajectory") {
        ConvergenceOptions options;
        options.noise_batch = sample_batch(4, 32, 12);
        options.noise_batch[2].u1[5] = std::numeric_limits<Real>::quiet_NaN();

        const auto results = strong_grid_convergence(integrator, plus_state(), times, options);
        REQUIRE(results.size() == 4);
        CHECK(results[0].ok());
        CHECK(results[1].ok());
        CHECK_FALSE(results[2].ok());
        CHECK(results[2].error == ConvergenceError::NumericalDegeneracy);
        CHECK(results[3].ok());
    }
}

TEST_CASE("strong_grid_convergence - batch validation", "[convergence][batch][errors]") {
    const auto integrator = vacuum_integrator<MilsteinHomodyneIntegrator>();

    REQUIRE_THROWS_AS(strong_grid_convergence(integrator, plus_state(), uniform_grid(0.0, 1.0, 30)),
                      InvalidGridError);
    REQUIRE_THROWS_AS(strong_grid_convergence(integrator, Vector::Zero(3), uniform_grid(0.0, 1.0, 32)),
                      DimensionMismatchError);

    ConvergenceOptions none;
    none.trajectories = 0;
    REQUIRE_THROWS_AS(strong_grid_convergence(integrator, plus_state(), uniform_grid(0.0, 1.0, 32), none),
                      std::invalid_argument);

    SECTION("Wiener-only batch for a scheme that needs U2") {
        const auto taylor = vacuum_integrator<Taylor15HomodyneIntegrator>();
        ConvergenceOptions options;
        options.noise_batch = sample_batch(3, 32, 14, false);

        REQUIRE_THROWS_AS(strong_grid_convergence(taylor, plus_state(), uniform_grid(0.0, 1.0, 32), options),
                          DimensionMismatchError);
        REQUIRE_THROWS_WITH(strong_grid_convergence(taylor, plus_state(), uniform_grid(0.0, 1.0, 32), options),
                            ContainsSubstring("noise batch entry 0"));
        REQUIRE_THROWS_AS(calc_rate(taylor, plus_state(), uniform_grid(0.0, 1.0, 32), options.noise_batch[0]),
                          DimensionMismatchError);

        const auto results = strong_grid_convergence(integrator, plus_state(), uniform_grid(0.0, 1.0, 32), options);
        REQUIRE(results.size() == 3);
        for (const auto& r : results) {
            CHECK(r.ok());
        }
    }
}

TEST_CASE("strong_grid_convergence - foreign exceptions stay in their trajectory", "[convergence][batch][errors]") {
    const ThrowingIntegrator integrator;
    const auto times = uniform_grid(0.0, 1.0, 16);
    ConvergenceOptions options;
    options.trajectories = 4;

    SECTION("Sequential") {
        options.n_jobs = 1;
        std::vector<RateEstimate> results;
        REQUIRE_NOTHROW(results = strong_grid_convergence(integrator, plus_state(), times, options));
        REQUIRE(results.size() == 4);
        for (std::size_t i = 0; i < results.size(); ++i) {
            CHECK(results[i].index == i);
            CHECK_FALSE(results[i].ok());
            CHECK(results[i].error == ConvergenceError::Unexpected);
            CHECK(results[i].message == "backend exploded");
        }
        CHECK(summarize(results).failures == 4);
    }

    SECTION("Parallel") {
        options.n_jobs = 3;
        const auto results = strong_grid_convergence(integrator, plus_state(), times, options);
        REQUIRE(results.size() == 4);
        for (const auto& r : results) {
            CHECK(r.error == ConvergenceError::Unexpected);
        }
    }

    CHECK(std::string(to_string(ConvergenceError::Unexpected)) == "Unexpected");
}

TEST_CASE("strong_grid_convergence - ground state is degenerate", "[convergence][batch]") {
    const auto integrator = vacuum_integrator<MilsteinHomodyneIntegrator>();
    ConvergenceOptions options;
    options.trajectories = 8;

    const auto results = strong_grid_convergence(integrator, ground_state(), uniform_grid(0.0, 1.0, 16), options);
    const auto summary = summarize(results);
    CHECK(summary.count == 0);
    CHECK(summary.failures == 8);
    for (const auto& r : results) {
        CHECK(r.error == ConvergenceError::NumericalDegeneracy);
    }
}

TEST_CASE("strong_grid_convergence - unconditional integrator ignores noise", "[convergence][batch]") {
    const AnyIntegrator integrator = make_integrator(IntegratorKind::UnconditionalVacuum, qubit_system());
    ConvergenceOptions options;
    options.trajectories = 3;

    const auto results = strong_grid_convergence(integrator, plus_state(), uniform_grid(0.0, 1.0, 16), options);
    REQUIRE(results.size() == 3);

    // Exact propagators agree to rounding, so the outcome may be degenerate,
    // but it is the same for every trajectory
    for (const auto& r : results) {
        CHECK(r.error == results.front().error);
        CHECK(r.rate == results.front().rate);
    }
}

// =============================================================================
// Summary and logger
// =============================================================================

TEST_CASE("summarize - statistics over successful rates", "[convergence][summary]") {
    const std::vector<RateEstimate> estimates{
        ok_estimate(0, 1.0), ok_estimate(1, 2.0), failed_estimate(2), ok_estimate(3, 4.0), ok_estimate(4, 3.0)};

    const auto s = summarize(estimates);
    CHECK(s.count == 4);
    CHECK(s.failures == 1);
    CHECK_THAT(s.mean, WithinAbs(2.5, 1e-15));
    CHECK_THAT(s.median, WithinAbs(2.5, 1e-15));
    CHECK_THAT(s.stddev, WithinAbs(std::sqrt(5.0 / 3.0), 1e-14));
    CHECK(s.min == 1.0);
    CHECK(s.max == 4.0);
    CHECK_THAT(s.to_string(), ContainsSubstring("failures=1"));

    const auto empty = summarize({});
    CHECK(empty.count == 0);
    CHECK(empty.mean == 0.0);
}

TEST_CASE("ConvergenceLogger - collects outcomes in trajectory order", "[convergence][logger]") {
    const auto integrator = vacuum_integrator<MilsteinHomodyneIntegrator>();
    const auto times = uniform_grid(0.0, 1.0, 16);

    ConvergenceLogger logger;
    ConvergenceOptions options;
    options.trajectories = 6;
    options.n_jobs = 2;
    options.logger = &logger;

    SECTION("Disabled by default") {
        CHECK_FALSE(logger.is_enabled());
        (void)strong_grid_convergence(integrator, plus_state(), times, options);
        CHECK(logger.total_entries() == 0);
        CHECK(logger.buffer().empty());
    }

    SECTION("Enabled with callback") {
        std::vector<std::size_t> seen;
        logger.set_enabled(true);
        logger.set_callback([&](const RateEstimate& e) { seen.push_back(e.index); });

        const auto results = strong_grid_convergence(integrator, plus_state(), times, options);

        CHECK(logger.total_entries() == 6);
        CHECK(logger.failures() == 0);
        CHECK(seen == std::vector<std::size_t>{0, 1, 2, 3, 4, 5});
        CHECK_THAT(logger.average_rate(), WithinAbs(summarize(results).mean, 1e-12));

        const auto csv = logger.to_csv();
        CHECK_THAT(csv, ContainsSubstring(RateEstimate::csv_header()));
        CHECK_THAT(csv, ContainsSubstring(",None,"));

        logger.reset();
        CHECK(logger.total_entries() == 0);
    }

    SECTION("Buffer limit") {
        logger.set_enabled(true);
        logger.set_max_buffer_size(2);
        (void)strong_grid_convergence(integrator, plus_state(), times, options);
        CHECK(logger.buffer().size() == 2);
        CHECK(logger.total_entries() == 6);
    }
}

// =============================================================================
// Study runner
// =============================================================================

TEST_CASE("run_convergence_study - generated noise", "[convergence][study]") {
    ConvergenceStudyConfig config;
    config.integrator = IntegratorKind::Milstein;
    config.trajectories = 12;
    config.intervals = 32;
    config.seed = 4;

    const auto result = run_convergence_study(config, qubit_system(), plus_state());
    CHECK(result.integrator == IntegratorKind::Milstein);
    CHECK(result.times.size() == 33);
    CHECK(result.estimates.size() == 12);
    CHECK(result.telemetry.trajectories == 12);
    CHECK(result.telemetry.threads_used == 1);
    CHECK(result.telemetry.wall_time_seconds >= 0.0);
    CHECK(result.summary.count + result.summary.failures == 12);

    // Same configuration, same rates
    const auto again = run_convergence_study(config, qubit_system(), plus_state());
    for (std::size_t i = 0; i < result.estimates.size(); ++i) {
        CHECK(result.estimates[i].rate == again.estimates[i].rate);
    }
}

TEST_CASE("run_convergence_study - noise source must match the batch", "[convergence][study][errors]") {
    ConvergenceStudyConfig config;
    config.intervals = 16;

    SECTION("Supplied without a batch") {
        config.noise = NoiseSource::Supplied;
        REQUIRE_THROWS_AS(run_convergence_study(config, qubit_system(), plus_state()), std::invalid_argument);
    }

    SECTION("Generated with a batch") {
        REQUIRE_THROWS_AS(run_convergence_study(config, qubit_system(), plus_state(), sample_batch(2, 16, 1)),
                          std::invalid_argument);
    }

    SECTION("Supplied with a batch") {
        config.noise = NoiseSource::Supplied;
        const auto result = run_convergence_study(config, qubit_system(), plus_state(), sample_batch(3, 16, 1));
        CHECK(result.estimates.size() == 3);
    }
}
