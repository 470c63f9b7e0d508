#pragma once

#include <string>
#include <vector>

namespace atdd {

// ─── Error Kind ────────────────────────────────────────────────
// Root-cause taxonomy for a failed execution.

enum class ErrorKind {
    Assertion,
    Type,
    Value,
    Attribute,
    Index,
    Key,
    ZeroDivision,
    Name,
    Syntax,
    ImportMissing,
    Timeout,
    LogicError,
    PartialFailure,
    Unknown
};

/// Stable identifier ("assertion", "zeroDivision", "partialFailure", ...).
std::string errorKindName(ErrorKind kind);

/// Fixed one-line root cause for a kind.
std::string rootCauseFor(ErrorKind kind);

// ─── Failure Analysis ──────────────────────────────────────────
// Derived from exactly one TestOutcome.

struct FailureAnalysis {
    ErrorKind error_kind = ErrorKind::Unknown;
    std::vector<std::string> failing_tests;
    std::vector<std::string> error_messages;   // most informative first, bounded
    std::string root_cause;
    std::vector<std::string> suggested_fixes;  // highest priority first

    /// Render the feedback block handed to the candidate generator.
    /// At most `max_items` failing tests and error messages are listed.
    std::string feedback(size_t max_items = 10) const;
};

} // namespace atdd
