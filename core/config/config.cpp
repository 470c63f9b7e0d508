#include "config/config.hpp"
#include "common/errors.hpp"

#include <re2/re2.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace atdd {

namespace {

template <typename T>
void readValue(const YAML::Node& section, const char* key, T& out, const char* section_name) {
    const YAML::Node value = section[key];
    if (!value) return;
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value for ") + section_name + "." + key + ": " + e.what());
    }
}

void readSandbox(const YAML::Node& node, EngineConfig& config) {
    SandboxConfig& s = config.sandbox;
    readValue(node, "docker_image", s.docker_image, "sandbox");
    readValue(node, "docker_binary", s.docker_binary, "sandbox");
    readValue(node, "memory_limit", s.memory_limit, "sandbox");
    readValue(node, "cpu_quota", s.cpu_quota, "sandbox");
    readValue(node, "cpu_period", s.cpu_period, "sandbox");
    readValue(node, "pids_limit", s.pids_limit, "sandbox");
    readValue(node, "execution_timeout", s.execution_timeout, "sandbox");
    readValue(node, "workspace_prefix", s.workspace_prefix, "sandbox");
    config.refinement.execution_timeout = s.execution_timeout;
}

void readParser(const YAML::Node& node, OutcomeParserConfig& p) {
    readValue(node, "failure_window_chars", p.failure_window_chars, "parser");
    readValue(node, "max_message_chars", p.max_message_chars, "parser");
    readValue(node, "max_message_lines", p.max_message_lines, "parser");
}

void readClassifier(const YAML::Node& node, ClassifierConfig& c) {
    readValue(node, "max_error_messages", c.max_error_messages, "classifier");
    readValue(node, "failure_message_chars", c.failure_message_chars, "classifier");
    readValue(node, "stderr_line_chars", c.stderr_line_chars, "classifier");
}

void readReward(const YAML::Node& node, RewardWeights& w) {
    readValue(node, "test_passing_max", w.test_passing_max, "reward");
    readValue(node, "partial_correctness_max", w.partial_correctness_max, "reward");
    readValue(node, "code_quality_max", w.code_quality_max, "reward");
    readValue(node, "efficiency_max", w.efficiency_max, "reward");
    readValue(node, "improvement_scale", w.improvement_scale, "reward");
    readValue(node, "convergence_bonus", w.convergence_bonus, "reward");
    readValue(node, "timeout_penalty", w.timeout_penalty, "reward");
    readValue(node, "error_penalty", w.error_penalty, "reward");
    readValue(node, "syntax_penalty", w.syntax_penalty, "reward");
}

void readRefinement(const YAML::Node& node, RefinementConfig& r) {
    readValue(node, "max_iterations", r.max_iterations, "refinement");
    readValue(node, "min_improvement", r.min_improvement, "refinement");
    readValue(node, "patience", r.patience, "refinement");
    readValue(node, "syntax_retry_limit", r.syntax_retry_limit, "refinement");
    readValue(node, "run_budget_seconds", r.run_budget_seconds, "refinement");
    std::string policy;
    readValue(node, "syntax_failure_policy", policy, "refinement");
    if (!policy.empty()) r.syntax_failure_policy = parseSyntaxFailurePolicy(policy);
}

void readLogging(const YAML::Node& node, LoggingConfig& l) {
    readValue(node, "name", l.name, "logging");
    readValue(node, "level", l.level, "logging");
    readValue(node, "pattern", l.pattern, "logging");
    readValue(node, "file", l.file_path, "logging");
    readValue(node, "console", l.console, "logging");
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

int envInt(const char* name, const char* value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (value[used] != '\0') throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " must be an integer, got '" + value + "'");
    }
}

double envDouble(const char* name, const char* value) {
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (value[used] != '\0') throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " must be a number, got '" + value + "'");
    }
}

EngineConfig fromNode(const YAML::Node& root) {
    EngineConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw ConfigError("configuration root must be a mapping");

    if (root["sandbox"]) readSandbox(root["sandbox"], config);
    if (root["parser"]) readParser(root["parser"], config.parser);
    if (root["classifier"]) readClassifier(root["classifier"], config.classifier);
    if (root["reward"]) readReward(root["reward"], config.reward);
    if (root["refinement"]) readRefinement(root["refinement"], config.refinement);
    if (root["logging"]) readLogging(root["logging"], config.logging);
    return config;
}

void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigError(message);
}

} // namespace

SyntaxFailurePolicy parseSyntaxFailurePolicy(const std::string& text) {
    if (text == "halt") return SyntaxFailurePolicy::Halt;
    if (text == "keep_previous") return SyntaxFailurePolicy::KeepPrevious;
    throw ConfigError("unknown syntax_failure_policy '" + text + "' (expected halt or keep_previous)");
}

EngineConfig parseConfig(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed YAML: ") + e.what());
    }
    return fromNode(root);
}

EngineConfig loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot read configuration file " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("malformed YAML in " + path + ": " + e.what());
    }
    return fromNode(root);
}

void applyEnvironmentOverrides(EngineConfig& config) {
    if (const char* v = env("ATDD_MAX_ITERATIONS")) {
        config.refinement.max_iterations = envInt("ATDD_MAX_ITERATIONS", v);
    }
    if (const char* v = env("ATDD_EXECUTION_TIMEOUT")) {
        config.sandbox.execution_timeout = envDouble("ATDD_EXECUTION_TIMEOUT", v);
        config.refinement.execution_timeout = config.sandbox.execution_timeout;
    }
    if (const char* v = env("ATDD_DOCKER_IMAGE")) config.sandbox.docker_image = v;
    if (const char* v = env("ATDD_MAX_MEMORY")) config.sandbox.memory_limit = v;
    if (const char* v = env("ATDD_CPU_QUOTA")) {
        config.sandbox.cpu_quota = envInt("ATDD_CPU_QUOTA", v);
    }
    if (const char* v = env("ATDD_MIN_IMPROVEMENT_THRESHOLD")) {
        config.refinement.min_improvement = envDouble("ATDD_MIN_IMPROVEMENT_THRESHOLD", v);
    }
    if (const char* v = env("ATDD_CONVERGENCE_PATIENCE")) {
        config.refinement.patience = envInt("ATDD_CONVERGENCE_PATIENCE", v);
    }
    if (const char* v = env("ATDD_LOG_LEVEL")) config.logging.level = v;
}

void validate(const EngineConfig& config) {
    static const RE2 memory_size("(?i)\\d+[bkmg]?");
    static const char* const kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                          "error", "err", "critical", "off"};

    const SandboxConfig& s = config.sandbox;
    require(!s.docker_image.empty(), "sandbox.docker_image must not be empty");
    require(RE2::FullMatch(s.memory_limit, memory_size),
            "sandbox.memory_limit must look like 50m, got '" + s.memory_limit + "'");
    require(s.cpu_period >= 1000 && s.cpu_period <= 1000000, "sandbox.cpu_period must be in [1000, 1000000]");
    require(s.cpu_quota >= 1000, "sandbox.cpu_quota must be at least 1000");
    require(s.pids_limit > 0, "sandbox.pids_limit must be positive");
    require(s.execution_timeout > 0.0, "sandbox.execution_timeout must be positive");

    const OutcomeParserConfig& p = config.parser;
    require(p.failure_window_chars > 0, "parser.failure_window_chars must be positive");
    require(p.max_message_chars > 0, "parser.max_message_chars must be positive");
    require(p.max_message_lines > 0, "parser.max_message_lines must be positive");

    require(config.classifier.max_error_messages > 0, "classifier.max_error_messages must be positive");

    const RewardWeights& w = config.reward;
    require(w.test_passing_max >= 0 && w.partial_correctness_max >= 0 && w.code_quality_max >= 0 &&
            w.efficiency_max >= 0 && w.improvement_scale >= 0 && w.convergence_bonus >= 0,
            "reward maxima must be non-negative");
    require(w.timeout_penalty <= 0 && w.error_penalty <= 0 && w.syntax_penalty <= 0,
            "reward penalties must not be positive");

    const RefinementConfig& r = config.refinement;
    require(r.max_iterations >= 1, "refinement.max_iterations must be at least 1");
    require(r.patience >= 1, "refinement.patience must be at least 1");
    require(r.min_improvement >= 0.0 && r.min_improvement <= 1.0, "refinement.min_improvement must be in [0, 1]");
    require(r.syntax_retry_limit >= 0, "refinement.syntax_retry_limit must not be negative");
    require(r.run_budget_seconds >= 0.0, "refinement.run_budget_seconds must not be negative");
    require(r.execution_timeout > 0.0, "refinement.execution_timeout must be positive");

    bool known_level = false;
    for (const char* level : kLevels) {
        if (config.logging.level == level) known_level = true;
    }
    require(known_level, "unknown logging.level '" + config.logging.level + "'");
}

} // namespace atdd
