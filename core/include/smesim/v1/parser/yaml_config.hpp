#pragma once

#include "smesim/v1/study.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace smesim::v1::parser {

struct YamlConfigParserOptions {
    bool strict = true;              // Fail on unknown fields
};

class YamlConfigParser {
public:
    explicit YamlConfigParser(YamlConfigParserOptions options = {});

    // Parse from file
    ConvergenceStudyConfig load(const std::filesystem::path& path);

    // Parse from string
    ConvergenceStudyConfig load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlConfigParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, ConvergenceStudyConfig& config);
    void validate_semantics(const ConvergenceStudyConfig& config);
};

}  // namespace smesim::v1::parser
