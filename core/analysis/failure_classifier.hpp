#pragma once

#include "analysis/failure_analysis.hpp"
#include "outcome/test_outcome.hpp"
#include "logging/logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace atdd {

struct ClassifierConfig {
    size_t max_error_messages = 10;
    size_t failure_message_chars = 200;  // first line of each failure message
    size_t stderr_line_chars = 300;
};

/// Failure Classifier: maps a TestOutcome to a FailureAnalysis.
///
/// Classification precedence (first match wins):
/// 1. timed out
/// 2. "DID NOT RAISE" (missing validation, checked before AssertionError)
/// 3. exception-name table, in table order
/// 4. every executed test failed  -> logic error
/// 5. some tests failed           -> partial failure
/// 6. unknown
class FailureClassifier {
public:
    explicit FailureClassifier(ClassifierConfig config = {}, LoggerPtr logger = nullptr);

    FailureAnalysis classify(const TestOutcome& outcome,
                             const std::optional<std::string>& candidate_source = std::nullopt) const;

    ErrorKind classifyKind(const TestOutcome& outcome) const;

    std::vector<std::string> extractErrorMessages(const TestOutcome& outcome) const;

    std::vector<std::string> suggestFixes(ErrorKind kind,
                                          const TestOutcome& outcome,
                                          const std::optional<std::string>& candidate_source) const;

    const ClassifierConfig& config() const { return config_; }

private:
    ClassifierConfig config_;
    LoggerPtr logger_;
};

/// Names introduced by top-level and nested `def`/`class` statements.
std::vector<std::string> definedNames(const std::string& source);

} // namespace atdd
