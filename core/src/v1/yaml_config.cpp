#include "smesim/v1/parser/yaml_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace smesim::v1::parser {

namespace {

constexpr const char* kSchemaId = "smesim-v1";
constexpr const char* kDiagUnknownField = "SMESIM_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "SMESIM_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagMissingField = "SMESIM_YAML_E_MISSING_FIELD";
constexpr const char* kDiagSchema = "SMESIM_YAML_E_SCHEMA";
constexpr const char* kDiagInvalidIntegrator = "SMESIM_YAML_E_INTEGRATOR_INVALID";
constexpr const char* kDiagInvalidNoiseSource = "SMESIM_YAML_E_NOISE_SOURCE_INVALID";
constexpr const char* kDiagInvalidOdeBackend = "SMESIM_YAML_E_ODE_BACKEND_INVALID";
constexpr const char* kDiagInvalidGrid = "SMESIM_YAML_E_GRID_INVALID";
constexpr const char* kDiagInvalidParameter = "SMESIM_YAML_E_PARAM_INVALID";
constexpr const char* kDiagIgnoredField = "SMESIM_YAML_W_FIELD_IGNORED";
constexpr const char* kDiagCvodeUnavailable = "SMESIM_YAML_W_CVODE_UNAVAILABLE";

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(
        errors,
        kDiagTypeMismatch,
        "Type mismatch at '" + path + "' (expected " + expected +
            ", got " + yaml_node_class(received) + ")");
}

/// Converts a scalar node, recording a type mismatch on failure
template<typename T>
std::optional<T> parse_scalar(const YAML::Node& node,
                              const std::string& path,
                              const std::string& expected,
                              std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
}

std::optional<Real> parse_real(const YAML::Node& node,
                               const std::string& path,
                               std::vector<std::string>& errors) {
    auto value = parse_scalar<Real>(node, path, "number", errors);
    if (value && !std::isfinite(*value)) {
        push_error(errors, kDiagInvalidParameter, "Non-finite value at '" + path + "'");
        return std::nullopt;
    }
    return value;
}

/// Counts must be non-negative integers
std::optional<std::size_t> parse_count(const YAML::Node& node,
                                       const std::string& path,
                                       std::vector<std::string>& errors) {
    auto value = parse_scalar<long long>(node, path, "integer", errors);
    if (!value) {
        return std::nullopt;
    }
    if (*value < 0) {
        push_error(errors, kDiagInvalidParameter,
                   "Negative count at '" + path + "': " + std::to_string(*value));
        return std::nullopt;
    }
    return static_cast<std::size_t>(*value);
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   std::vector<std::string>& warnings,
                   bool strict) {
    if (!node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) != allowed.end()) {
            continue;
        }
        if (strict) {
            push_error(errors, kDiagUnknownField, "Unknown field at '" + context + "." + key + "'");
        } else {
            push_warning(warnings, kDiagIgnoredField, "Ignoring unknown field '" + context + "." + key + "'");
        }
    }
}

/// Section nodes must be maps when present
bool require_map(const YAML::Node& node, const std::string& path, std::vector<std::string>& errors) {
    if (!node) {
        return false;
    }
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, path, "map", node);
        return false;
    }
    return true;
}

std::optional<Complex> parse_squeezing(const YAML::Node& node,
                                       const std::string& path,
                                       std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (node.IsScalar()) {
        auto re = parse_real(node, path, errors);
        if (!re) return std::nullopt;
        return Complex(*re, 0.0);
    }
    if (!node.IsSequence() || node.size() != 2) {
        push_type_mismatch_error(errors, path, "number or [real, imaginary]", node);
        return std::nullopt;
    }
    auto re = parse_real(node[0], path + "[0]", errors);
    auto im = parse_real(node[1], path + "[1]", errors);
    if (!re || !im) return std::nullopt;
    return Complex(*re, *im);
}

}  // namespace

YamlConfigParser::YamlConfigParser(YamlConfigParserOptions options)
    : options_(options) {}

ConvergenceStudyConfig YamlConfigParser::load(const std::filesystem::path& path) {
    errors_.clear();
    warnings_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.push_back("Cannot open file: " + path.string());
        return ConvergenceStudyConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

ConvergenceStudyConfig YamlConfigParser::load_string(const std::string& content) {
    ConvergenceStudyConfig config;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, config);
    if (errors_.empty()) {
        validate_semantics(config);
    }
    return config;
}

void YamlConfigParser::parse_yaml(const std::string& content, ConvergenceStudyConfig& config) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root || !root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, {"schema", "version", "study", "grid", "bath", "ode"},
                  "root", errors_, warnings_, options_.strict);

    if (!root["schema"]) {
        push_error(errors_, kDiagMissingField, "Missing required field 'schema'");
        return;
    }
    const auto schema = parse_scalar<std::string>(root["schema"], "root.schema", "string", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        push_error(errors_, kDiagSchema, "Unsupported schema: " + *schema);
        return;
    }
    if (root["version"]) {
        const auto version = parse_scalar<int>(root["version"], "root.version", "integer", errors_);
        if (version && *version != 1) {
            push_error(errors_, kDiagSchema, "Unsupported schema version: " + std::to_string(*version));
            return;
        }
    }

    // Study
    const YAML::Node study = root["study"];
    if (require_map(study, "study", errors_)) {
        validate_keys(study, {"integrator", "trajectories", "n_jobs", "seed", "noise"},
                      "study", errors_, warnings_, options_.strict);

        if (auto name = parse_scalar<std::string>(study["integrator"], "study.integrator", "string", errors_)) {
            if (auto kind = parse_integrator_kind(*name)) {
                config.integrator = *kind;
            } else {
                push_error(errors_, kDiagInvalidIntegrator,
                           "Unknown integrator '" + *name +
                               "' (expected milstein, taylor_1_5, faulty_milstein, "
                               "unconditional_vacuum or unconditional_gaussian)");
            }
        }
        if (auto n = parse_count(study["trajectories"], "study.trajectories", errors_)) {
            config.trajectories = *n;
        }
        if (auto jobs = parse_scalar<int>(study["n_jobs"], "study.n_jobs", "integer", errors_)) {
            config.n_jobs = *jobs;
        }
        if (auto seed = parse_scalar<std::uint64_t>(study["seed"], "study.seed", "unsigned integer", errors_)) {
            config.seed = *seed;
        }
        if (auto noise = parse_scalar<std::string>(study["noise"], "study.noise", "string", errors_)) {
            if (*noise == to_string(NoiseSource::Generated)) {
                config.noise = NoiseSource::Generated;
            } else if (*noise == to_string(NoiseSource::Supplied)) {
                config.noise = NoiseSource::Supplied;
            } else {
                push_error(errors_, kDiagInvalidNoiseSource,
                           "Unknown noise source '" + *noise + "' (expected generated or supplied)");
            }
        }
    }

    // Grid
    const YAML::Node grid = root["grid"];
    if (require_map(grid, "grid", errors_)) {
        validate_keys(grid, {"t_start", "t_stop", "intervals"}, "grid", errors_, warnings_, options_.strict);
        if (auto v = parse_real(grid["t_start"], "grid.t_start", errors_)) config.t_start = *v;
        if (auto v = parse_real(grid["t_stop"], "grid.t_stop", errors_)) config.t_stop = *v;
        if (auto n = parse_count(grid["intervals"], "grid.intervals", errors_)) config.intervals = *n;
    }

    // Bath
    const YAML::Node bath = root["bath"];
    if (require_map(bath, "bath", errors_)) {
        validate_keys(bath, {"squeezing", "thermal"}, "bath", errors_, warnings_, options_.strict);
        if (auto m = parse_squeezing(bath["squeezing"], "bath.squeezing", errors_)) {
            config.bath.squeezing = *m;
        }
        if (auto n = parse_real(bath["thermal"], "bath.thermal", errors_)) {
            config.bath.thermal = *n;
        }
    }

    // ODE backend
    const YAML::Node ode = root["ode"];
    if (require_map(ode, "ode", errors_)) {
        validate_keys(ode, {"backend", "rel_tol", "abs_tol", "max_steps"}, "ode", errors_, warnings_,
                      options_.strict);
        if (auto name = parse_scalar<std::string>(ode["backend"], "ode.backend", "string", errors_)) {
            if (*name == to_string(OdeBackend::MatrixExponential)) {
                config.ode.backend = OdeBackend::MatrixExponential;
            } else if (*name == to_string(OdeBackend::Cvode)) {
                config.ode.backend = OdeBackend::Cvode;
            } else {
                push_error(errors_, kDiagInvalidOdeBackend,
                           "Unknown ODE backend '" + *name + "' (expected matrix_exponential or cvode)");
            }
        }
        if (auto v = parse_real(ode["rel_tol"], "ode.rel_tol", errors_)) config.ode.rel_tol = *v;
        if (auto v = parse_real(ode["abs_tol"], "ode.abs_tol", errors_)) config.ode.abs_tol = *v;
        if (auto v = parse_scalar<long>(ode["max_steps"], "ode.max_steps", "integer", errors_)) {
            config.ode.max_steps = *v;
        }
    }
}

void YamlConfigParser::validate_semantics(const ConvergenceStudyConfig& config) {
    if (config.trajectories == 0) {
        push_error(errors_, kDiagInvalidParameter, "study.trajectories must be positive");
    }
    if (config.intervals == 0 || config.intervals % 4 != 0) {
        push_error(errors_, kDiagInvalidGrid,
                   "grid.intervals must be a positive multiple of 4, got " +
                       std::to_string(config.intervals));
    }
    if (config.t_stop <= config.t_start) {
        push_error(errors_, kDiagInvalidGrid, "grid.t_stop must be greater than grid.t_start");
    }
    try {
        config.bath.validate();
    } catch (const std::invalid_argument& e) {
        push_error(errors_, kDiagInvalidParameter, std::string("bath: ") + e.what());
    }
    if (config.ode.rel_tol <= 0.0 || config.ode.abs_tol <= 0.0) {
        push_error(errors_, kDiagInvalidParameter, "ode tolerances must be positive");
    }
    if (config.ode.max_steps <= 0) {
        push_error(errors_, kDiagInvalidParameter, "ode.max_steps must be positive");
    }
    if (config.ode.backend == OdeBackend::Cvode && !cvode_available()) {
        push_warning(warnings_, kDiagCvodeUnavailable,
                     "ode.backend is cvode but this build has no SUNDIALS; unconditional runs will fail");
    }
}

}  // namespace smesim::v1::parser
