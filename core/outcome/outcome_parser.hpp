#pragma once

#include "outcome/test_outcome.hpp"
#include "logging/logger.hpp"
#include <cstddef>
#include <string>

namespace atdd {

struct OutcomeParserConfig {
    size_t failure_window_chars = 1000;  // text scanned after each FAILED marker
    size_t max_message_chars = 500;
    int max_message_lines = 3;
};

/// Outcome Parser: converts pytest text output into a TestOutcome.
/// Pure with respect to its input; malformed text yields zero counts.
class OutcomeParser {
public:
    explicit OutcomeParser(OutcomeParserConfig config = {}, LoggerPtr logger = nullptr);

    TestOutcome parse(const RawExecution& raw) const;

    const OutcomeParserConfig& config() const { return config_; }

private:
    OutcomeParserConfig config_;
    LoggerPtr logger_;

    /// Fill counts from the summary line. Returns true if a "passed"
    /// clause was present.
    bool parseSummary(const std::string& output, TestOutcome& outcome) const;

    void parseFailures(const std::string& output, TestOutcome& outcome) const;

    std::string extractMessage(const std::string& window) const;
};

} // namespace atdd
