#pragma once

#include "analysis/failure_classifier.hpp"
#include "logging/logger.hpp"
#include "outcome/outcome_parser.hpp"
#include "refinement/refinement_controller.hpp"
#include "reward/reward.hpp"
#include "sandbox/sandbox_engine.hpp"
#include <string>

namespace atdd {

/// Every tunable of the engine in one value object.
struct EngineConfig {
    SandboxConfig sandbox;
    OutcomeParserConfig parser;
    ClassifierConfig classifier;
    RewardWeights reward;
    RefinementConfig refinement;
    LoggingConfig logging;
};

/// Parse a YAML document. Every key is optional; absent keys keep their
/// defaults. Throws ConfigError on malformed YAML or mistyped values.
EngineConfig parseConfig(const std::string& yaml_text);

/// parseConfig() on the contents of a file. Throws ConfigError when the
/// file cannot be read.
EngineConfig loadConfig(const std::string& path);

/// Apply ATDD_* environment variables on top of `config`.
void applyEnvironmentOverrides(EngineConfig& config);

/// Throws ConfigError naming the first out-of-range value.
void validate(const EngineConfig& config);

/// "halt" or "keep_previous".
SyntaxFailurePolicy parseSyntaxFailurePolicy(const std::string& text);

} // namespace atdd
