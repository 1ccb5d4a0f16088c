#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "smesim/v1/parser/yaml_config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace smesim::v1;
using namespace smesim::v1::parser;
using Catch::Matchers::WithinAbs;

namespace {

bool has_diagnostic(const std::vector<std::string>& messages, const std::string& code) {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string& m) { return m.find(code) != std::string::npos; });
}

const std::string kFullDocument = R"(schema: smesim-v1
version: 1
study:
  integrator: milstein
  trajectories: 128
  n_jobs: 4
  seed: 2018
  noise: supplied
grid:
  t_start: 0.0
  t_stop: 2.0
  intervals: 128
bath:
  squeezing: [0.2, -0.1]
  thermal: 0.3
ode:
  backend: matrix_exponential
  rel_tol: 1.0e-9
  abs_tol: 1.0e-11
  max_steps: 5000
)";

}  // namespace

TEST_CASE("YamlConfigParser - full document", "[yaml]") {
    YamlConfigParser parser;
    const auto config = parser.load_string(kFullDocument);

    INFO((parser.errors().empty() ? std::string() : parser.errors().front()));
    REQUIRE(parser.errors().empty());
    CHECK(parser.warnings().empty());

    CHECK(config.integrator == IntegratorKind::Milstein);
    CHECK(config.trajectories == 128);
    CHECK(config.n_jobs == 4);
    CHECK(config.seed == 2018);
    CHECK(config.noise == NoiseSource::Supplied);
    CHECK(config.t_stop == 2.0);
    CHECK(config.intervals == 128);
    CHECK_THAT(config.bath.squeezing.real(), WithinAbs(0.2, 1e-15));
    CHECK_THAT(config.bath.squeezing.imag(), WithinAbs(-0.1, 1e-15));
    CHECK_THAT(config.bath.thermal, WithinAbs(0.3, 1e-15));
    CHECK(config.ode.backend == OdeBackend::MatrixExponential);
    CHECK(config.ode.max_steps == 5000);
}

TEST_CASE("YamlConfigParser - defaults for omitted sections", "[yaml]") {
    YamlConfigParser parser;
    const auto config = parser.load_string("schema: smesim-v1\nbath:\n  squeezing: 0.1\n");

    REQUIRE(parser.errors().empty());
    CHECK(config.integrator == IntegratorKind::Taylor15);
    CHECK(config.trajectories == 256);
    CHECK(config.intervals == 64);
    CHECK(config.bath.squeezing.imag() == 0.0);
    CHECK_THAT(config.bath.squeezing.real(), WithinAbs(0.1, 1e-15));
}

TEST_CASE("YamlConfigParser - unknown fields", "[yaml][strict]") {
    const std::string yaml = "schema: smesim-v1\nstudy:\n  integrator: milstein\n  tolerance: 3\n";

    SECTION("Strict mode rejects") {
        YamlConfigParser parser;
        (void)parser.load_string(yaml);
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_UNKNOWN_FIELD"));
        CHECK(has_diagnostic(parser.errors(), "study.tolerance"));
    }

    SECTION("Lenient mode warns") {
        YamlConfigParser parser(YamlConfigParserOptions{.strict = false});
        const auto config = parser.load_string(yaml);
        CHECK(parser.errors().empty());
        CHECK(has_diagnostic(parser.warnings(), "SMESIM_YAML_W_FIELD_IGNORED"));
        CHECK(config.integrator == IntegratorKind::Milstein);
    }
}

TEST_CASE("YamlConfigParser - diagnostics", "[yaml][errors]") {
    YamlConfigParser parser;

    SECTION("Missing schema") {
        (void)parser.load_string("study:\n  trajectories: 4\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_MISSING_FIELD"));
    }

    SECTION("Wrong schema") {
        (void)parser.load_string("schema: pulse-v1\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_SCHEMA"));
    }

    SECTION("Unsupported version") {
        (void)parser.load_string("schema: smesim-v1\nversion: 2\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_SCHEMA"));
    }

    SECTION("Type mismatch") {
        (void)parser.load_string("schema: smesim-v1\nstudy:\n  trajectories: many\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_TYPE_MISMATCH"));
    }

    SECTION("Section is not a map") {
        (void)parser.load_string("schema: smesim-v1\ngrid: [1, 2]\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_TYPE_MISMATCH"));
    }

    SECTION("Unknown integrator") {
        (void)parser.load_string("schema: smesim-v1\nstudy:\n  integrator: euler\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_INTEGRATOR_INVALID"));
    }

    SECTION("Unknown noise source") {
        (void)parser.load_string("schema: smesim-v1\nstudy:\n  noise: pink\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_NOISE_SOURCE_INVALID"));
    }

    SECTION("Unknown ODE backend") {
        (void)parser.load_string("schema: smesim-v1\node:\n  backend: rk4\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_ODE_BACKEND_INVALID"));
    }

    SECTION("Interval count not a multiple of 4") {
        (void)parser.load_string("schema: smesim-v1\ngrid:\n  intervals: 66\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_GRID_INVALID"));
    }

    SECTION("Empty time window") {
        (void)parser.load_string("schema: smesim-v1\ngrid:\n  t_start: 1.0\n  t_stop: 1.0\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_GRID_INVALID"));
    }

    SECTION("Unphysical bath") {
        (void)parser.load_string("schema: smesim-v1\nbath:\n  thermal: -0.5\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_PARAM_INVALID"));
        CHECK(has_diagnostic(parser.errors(), "bath: "));
    }

    SECTION("Zero trajectories") {
        (void)parser.load_string("schema: smesim-v1\nstudy:\n  trajectories: 0\n");
        CHECK(has_diagnostic(parser.errors(), "SMESIM_YAML_E_PARAM_INVALID"));
    }

    SECTION("Malformed YAML") {
        (void)parser.load_string("schema: [smesim-v1\n");
        CHECK(has_diagnostic(parser.errors(), "YAML parse error"));
    }
}

TEST_CASE("YamlConfigParser - CVODE request", "[yaml][cvode]") {
    YamlConfigParser parser;
    const auto config = parser.load_string("schema: smesim-v1\node:\n  backend: cvode\n");

    REQUIRE(parser.errors().empty());
    CHECK(config.ode.backend == OdeBackend::Cvode);
    CHECK(has_diagnostic(parser.warnings(), "SMESIM_YAML_W_CVODE_UNAVAILABLE") == !cvode_available());
}

TEST_CASE("YamlConfigParser - load from file", "[yaml][file]") {
    YamlConfigParser parser;

    SECTION("Missing file") {
        (void)parser.load("/nonexistent/smesim_study.yaml");
        REQUIRE(parser.errors().size() == 1);
        CHECK(parser.errors().front().find("Cannot open file") != std::string::npos);
    }

    SECTION("Existing file") {
        const auto path = std::filesystem::temp_directory_path() / "smesim_test_study.yaml";
        {
            std::ofstream out(path);
            out << kFullDocument;
        }
        const auto config = parser.load(path);
        std::filesystem::remove(path);

        REQUIRE(parser.errors().empty());
        CHECK(config.trajectories == 128);
    }
}
