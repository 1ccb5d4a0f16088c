// =============================================================================
// smesim v1 - Python Bindings
// =============================================================================
// - Basis helpers and superoperator construction
// - Unconditional and homodyne integrators
// - Increment coarsening, rate estimation and batch convergence analysis
// - YAML study configuration
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/complex.h>
#include <pybind11/stl/filesystem.h>

#include "smesim/v1/core.hpp"
#include "smesim/v1/parser/yaml_config.hpp"

namespace py = pybind11;
using namespace smesim::v1;

namespace {

/// Seeded engine for Python callers, which cannot hold a RandomEngine
[[nodiscard]] RandomEngine engine_from_seed(std::uint64_t seed) {
    return trajectory_engine(seed, 0);
}

template<TrajectoryIntegrator I, typename Class>
void bind_integrate(Class& cls) {
    cls.def("integrate",
            [](const I& self, const Vector& x0, const std::vector<Real>& times, const NoiseIncrements& noise) {
                return self.integrate(x0, times, noise);
            },
            py::arg("initial_state"), py::arg("times"), py::arg("noise"))
        .def("integrate",
             [](const I& self, const Vector& x0, const std::vector<Real>& times, std::uint64_t seed) {
                 RandomEngine rng = engine_from_seed(seed);
                 return self.integrate(x0, times, rng);
             },
             py::arg("initial_state"), py::arg("times"), py::arg("seed"))
        .def_property_readonly("dimension", &I::dimension)
        .def_property_readonly("consumes_noise", &I::consumes_noise)
        .def_property_readonly("requires_multiple_ito", &I::requires_multiple_ito);
}

template<TrajectoryIntegrator I>
void bind_analysis(py::module_& m) {
    m.def("calc_rate",
          [](const I& integrator, const Vector& rho0, const std::vector<Real>& times,
             const NoiseIncrements& noise) {
              return calc_rate(integrator, rho0, times, noise);
          },
          py::arg("integrator"), py::arg("rho0"), py::arg("times"), py::arg("noise"));

    m.def("calc_rate",
          [](const I& integrator, const Vector& rho0, const std::vector<Real>& times, std::uint64_t seed) {
              RandomEngine rng = engine_from_seed(seed);
              return calc_rate(integrator, rho0, times, rng);
          },
          py::arg("integrator"), py::arg("rho0"), py::arg("times"), py::arg("seed"));

    m.def("strong_grid_convergence",
          [](const I& integrator, const Vector& rho0, const std::vector<Real>& times,
             const ConvergenceOptions& options) {
              py::gil_scoped_release release;
              return strong_grid_convergence(integrator, rho0, times, options);
          },
          py::arg("integrator"), py::arg("rho0"), py::arg("times"),
          py::arg("options") = ConvergenceOptions{});
}

}  // namespace

void init_smesim_module(py::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    py::enum_<ConvergenceError>(m, "ConvergenceError", "Per-trajectory failure kind")
        .value("None_", ConvergenceError::None)
        .value("InvalidGrid", ConvergenceError::InvalidGrid)
        .value("DimensionMismatch", ConvergenceError::DimensionMismatch)
        .value("NumericalDegeneracy", ConvergenceError::NumericalDegeneracy)
        .value("IntegrationFailure", ConvergenceError::IntegrationFailure)
        .value("Unexpected", ConvergenceError::Unexpected);

    py::enum_<OdeBackend>(m, "OdeBackend", "Linear ODE backend")
        .value("MatrixExponential", OdeBackend::MatrixExponential)
        .value("Cvode", OdeBackend::Cvode);

    py::enum_<IntegratorKind>(m, "IntegratorKind", "Runtime integrator selection")
        .value("Milstein", IntegratorKind::Milstein)
        .value("Taylor15", IntegratorKind::Taylor15)
        .value("FaultyMilstein", IntegratorKind::FaultyMilstein)
        .value("UnconditionalVacuum", IntegratorKind::UnconditionalVacuum)
        .value("UnconditionalGaussian", IntegratorKind::UnconditionalGaussian);

    py::enum_<NoiseSource>(m, "NoiseSource")
        .value("Generated", NoiseSource::Generated)
        .value("Supplied", NoiseSource::Supplied);

    // =========================================================================
    // Exceptions
    // =========================================================================

    py::register_exception<InvalidGridError>(m, "InvalidGridError", PyExc_ValueError);
    py::register_exception<DimensionMismatchError>(m, "DimensionMismatchError", PyExc_ValueError);
    py::register_exception<NumericalDegeneracyError>(m, "NumericalDegeneracyError", PyExc_ArithmeticError);
    py::register_exception<IntegrationError>(m, "IntegrationError", PyExc_RuntimeError);

    // =========================================================================
    // Noise and grids
    // =========================================================================

    py::class_<NoiseIncrements>(m, "NoiseIncrements", "Standard-normal primitives U1, U2 per interval")
        .def(py::init<>())
        .def(py::init([](std::vector<Real> u1, std::vector<Real> u2) {
                 return NoiseIncrements{std::move(u1), std::move(u2)};
             }),
             py::arg("u1"), py::arg("u2") = std::vector<Real>{})
        .def_readwrite("u1", &NoiseIncrements::u1)
        .def_readwrite("u2", &NoiseIncrements::u2)
        .def_property_readonly("intervals", &NoiseIncrements::intervals)
        .def_static("sample",
                    [](std::size_t intervals, std::uint64_t seed, bool with_u2) {
                        RandomEngine rng = engine_from_seed(seed);
                        return NoiseIncrements::sample(intervals, rng, with_u2);
                    },
                    py::arg("intervals"), py::arg("seed"), py::arg("with_u2") = true);

    py::class_<CoarseGrid>(m, "CoarseGrid")
        .def_readonly("times", &CoarseGrid::times)
        .def_readonly("noise", &CoarseGrid::noise);

    m.def("uniform_grid", &uniform_grid, py::arg("t_start"), py::arg("t_stop"), py::arg("intervals"));
    m.def("coarsen",
          [](const std::vector<Real>& times, const NoiseIncrements& noise, int levels) {
              return coarsen(times, noise, levels);
          },
          py::arg("times"), py::arg("noise"), py::arg("levels") = 1);

    // =========================================================================
    // Operators
    // =========================================================================

    py::class_<GaussianBath>(m, "GaussianBath", "Squeezed thermal bath (M, N)")
        .def(py::init<>())
        .def(py::init([](Complex squeezing, Real thermal) { return GaussianBath{squeezing, thermal}; }),
             py::arg("squeezing"), py::arg("thermal"))
        .def_readwrite("squeezing", &GaussianBath::squeezing)
        .def_readwrite("thermal", &GaussianBath::thermal)
        .def("validate", &GaussianBath::validate);

    m.def("validate_basis", &validate_basis, py::arg("basis"));
    m.def("vectorize", &vectorize, py::arg("op"), py::arg("basis"));
    m.def("unvectorize", &unvectorize, py::arg("coeffs"), py::arg("basis"));
    m.def("diffusion_op", &diffusion_op, py::arg("c"), py::arg("basis"));
    m.def("hamiltonian_op", &hamiltonian_op, py::arg("H"), py::arg("basis"));
    m.def("double_comm_op", &double_comm_op, py::arg("c"), py::arg("M"), py::arg("basis"));
    m.def("gaussian_drift_op", &gaussian_drift_op,
          py::arg("c"), py::arg("bath"), py::arg("H"), py::arg("basis"));
    m.def("homodyne_measurement_op", &homodyne_measurement_op, py::arg("c"), py::arg("bath"));

    py::class_<HomodyneOperators>(m, "HomodyneOperators")
        .def(py::init<Matrix, Matrix, RowVector>(), py::arg("Q"), py::arg("G"), py::arg("k_T"))
        .def_static("from_physical", &HomodyneOperators::from_physical,
                    py::arg("coupling"), py::arg("bath"), py::arg("hamiltonian"), py::arg("basis"))
        .def_property_readonly("Q", &HomodyneOperators::Q)
        .def_property_readonly("G", &HomodyneOperators::G)
        .def_property_readonly("k_T", &HomodyneOperators::k_T);

    py::class_<HomodyneSystem>(m, "HomodyneSystem")
        .def(py::init([](ComplexMatrix coupling, ComplexMatrix hamiltonian, Basis basis) {
                 return HomodyneSystem{std::move(coupling), std::move(hamiltonian), std::move(basis)};
             }),
             py::arg("coupling"), py::arg("hamiltonian"), py::arg("basis"))
        .def_readwrite("coupling", &HomodyneSystem::coupling)
        .def_readwrite("hamiltonian", &HomodyneSystem::hamiltonian)
        .def_readwrite("basis", &HomodyneSystem::basis);

    // =========================================================================
    // Integrators
    // =========================================================================

    py::class_<Trajectory>(m, "Trajectory")
        .def_readonly("times", &Trajectory::times)
        .def_readonly("states", &Trajectory::states);

    py::class_<LinearOdeOptions>(m, "LinearOdeOptions")
        .def(py::init<>())
        .def_readwrite("backend", &LinearOdeOptions::backend)
        .def_readwrite("rel_tol", &LinearOdeOptions::rel_tol)
        .def_readwrite("abs_tol", &LinearOdeOptions::abs_tol)
        .def_readwrite("max_steps", &LinearOdeOptions::max_steps);
    m.def("cvode_available", &cvode_available);

    py::class_<UnconditionalVacuumIntegrator> vacuum(m, "UnconditionalVacuumIntegrator");
    vacuum.def(py::init<const ComplexMatrix&, const Basis&, LinearOdeOptions>(),
               py::arg("coupling"), py::arg("basis"), py::arg("ode_options") = LinearOdeOptions{});
    bind_integrate<UnconditionalVacuumIntegrator>(vacuum);

    py::class_<UnconditionalGaussianIntegrator> gaussian(m, "UnconditionalGaussianIntegrator");
    gaussian.def(py::init<const ComplexMatrix&, const GaussianBath&, const ComplexMatrix&, const Basis&,
                          LinearOdeOptions>(),
                 py::arg("coupling"), py::arg("bath"), py::arg("hamiltonian"), py::arg("basis"),
                 py::arg("ode_options") = LinearOdeOptions{});
    bind_integrate<UnconditionalGaussianIntegrator>(gaussian);

    py::class_<MilsteinHomodyneIntegrator> milstein(m, "MilsteinHomodyneIntegrator");
    milstein.def(py::init<const ComplexMatrix&, const GaussianBath&, const ComplexMatrix&, const Basis&>(),
                 py::arg("coupling"), py::arg("bath"), py::arg("hamiltonian"), py::arg("basis"))
        .def(py::init<HomodyneOperators>(), py::arg("operators"));
    bind_integrate<MilsteinHomodyneIntegrator>(milstein);

    py::class_<Taylor15HomodyneIntegrator> taylor(m, "Taylor15HomodyneIntegrator");
    taylor.def(py::init<const ComplexMatrix&, const GaussianBath&, const ComplexMatrix&, const Basis&>(),
               py::arg("coupling"), py::arg("bath"), py::arg("hamiltonian"), py::arg("basis"))
        .def(py::init<HomodyneOperators>(), py::arg("operators"));
    bind_integrate<Taylor15HomodyneIntegrator>(taylor);

    py::class_<FaultyMilsteinHomodyneIntegrator> faulty(m, "FaultyMilsteinHomodyneIntegrator");
    faulty.def(py::init<const ComplexMatrix&, const GaussianBath&, const ComplexMatrix&, const Basis&>(),
               py::arg("coupling"), py::arg("bath"), py::arg("hamiltonian"), py::arg("basis"))
        .def(py::init<HomodyneOperators>(), py::arg("operators"));
    bind_integrate<FaultyMilsteinHomodyneIntegrator>(faulty);

    // =========================================================================
    // Convergence analysis
    // =========================================================================

    py::class_<RateEstimate>(m, "RateEstimate")
        .def_readonly("index", &RateEstimate::index)
        .def_readonly("rate", &RateEstimate::rate)
        .def_readonly("coarse_error", &RateEstimate::coarse_error)
        .def_readonly("fine_error", &RateEstimate::fine_error)
        .def_readonly("error", &RateEstimate::error)
        .def_readonly("message", &RateEstimate::message)
        .def("ok", &RateEstimate::ok);

    py::class_<RateSummary>(m, "RateSummary")
        .def_readonly("count", &RateSummary::count)
        .def_readonly("failures", &RateSummary::failures)
        .def_readonly("mean", &RateSummary::mean)
        .def_readonly("stddev", &RateSummary::stddev)
        .def_readonly("median", &RateSummary::median)
        .def_readonly("min", &RateSummary::min)
        .def_readonly("max", &RateSummary::max)
        .def("__str__", &RateSummary::to_string);
    m.def("summarize", &summarize, py::arg("estimates"));

    // The logger pointer is not exposed; Python callers read the returned list.
    py::class_<ConvergenceOptions>(m, "ConvergenceOptions")
        .def(py::init<>())
        .def_readwrite("trajectories", &ConvergenceOptions::trajectories)
        .def_readwrite("n_jobs", &ConvergenceOptions::n_jobs)
        .def_readwrite("seed", &ConvergenceOptions::seed)
        .def_readwrite("noise_batch", &ConvergenceOptions::noise_batch);

    bind_analysis<MilsteinHomodyneIntegrator>(m);
    bind_analysis<Taylor15HomodyneIntegrator>(m);
    bind_analysis<FaultyMilsteinHomodyneIntegrator>(m);
    bind_analysis<UnconditionalVacuumIntegrator>(m);
    bind_analysis<UnconditionalGaussianIntegrator>(m);

    // =========================================================================
    // Studies and configuration
    // =========================================================================

    py::class_<ConvergenceStudyConfig>(m, "ConvergenceStudyConfig")
        .def(py::init<>())
        .def_readwrite("integrator", &ConvergenceStudyConfig::integrator)
        .def_readwrite("trajectories", &ConvergenceStudyConfig::trajectories)
        .def_readwrite("n_jobs", &ConvergenceStudyConfig::n_jobs)
        .def_readwrite("seed", &ConvergenceStudyConfig::seed)
        .def_readwrite("noise", &ConvergenceStudyConfig::noise)
        .def_readwrite("t_start", &ConvergenceStudyConfig::t_start)
        .def_readwrite("t_stop", &ConvergenceStudyConfig::t_stop)
        .def_readwrite("intervals", &ConvergenceStudyConfig::intervals)
        .def_readwrite("bath", &ConvergenceStudyConfig::bath)
        .def_readwrite("ode", &ConvergenceStudyConfig::ode);

    py::class_<StudyTelemetry>(m, "StudyTelemetry")
        .def_readonly("wall_time_seconds", &StudyTelemetry::wall_time_seconds)
        .def_readonly("threads_used", &StudyTelemetry::threads_used)
        .def_readonly("trajectories", &StudyTelemetry::trajectories);

    py::class_<ConvergenceStudyResult>(m, "ConvergenceStudyResult")
        .def_readonly("integrator", &ConvergenceStudyResult::integrator)
        .def_readonly("times", &ConvergenceStudyResult::times)
        .def_readonly("estimates", &ConvergenceStudyResult::estimates)
        .def_readonly("summary", &ConvergenceStudyResult::summary)
        .def_readonly("telemetry", &ConvergenceStudyResult::telemetry);

    m.def("run_convergence_study",
          [](const ConvergenceStudyConfig& config, const HomodyneSystem& system, const Vector& rho0,
             std::vector<NoiseIncrements> noise_batch) {
              py::gil_scoped_release release;
              return run_convergence_study(config, system, rho0, std::move(noise_batch));
          },
          py::arg("config"), py::arg("system"), py::arg("rho0"),
          py::arg("noise_batch") = std::vector<NoiseIncrements>{});

    py::class_<parser::YamlConfigParserOptions>(m, "YamlConfigParserOptions")
        .def(py::init<>())
        .def_readwrite("strict", &parser::YamlConfigParserOptions::strict);

    py::class_<parser::YamlConfigParser>(m, "YamlConfigParser")
        .def(py::init<parser::YamlConfigParserOptions>(),
             py::arg("options") = parser::YamlConfigParserOptions{})
        .def("load", &parser::YamlConfigParser::load, py::arg("path"))
        .def("load_string", &parser::YamlConfigParser::load_string, py::arg("content"))
        .def_property_readonly("errors", &parser::YamlConfigParser::errors)
        .def_property_readonly("warnings", &parser::YamlConfigParser::warnings);
}

PYBIND11_MODULE(_smesim, m) {
    m.doc() = "smesim stochastic master equation integrators (C++ extension)";
    init_smesim_module(m);
}
