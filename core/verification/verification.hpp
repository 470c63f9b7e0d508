#pragma once

#include "verification/python_lexer.hpp"
#include "verification/quality_metrics.hpp"
#include <string>
#include <vector>

namespace atdd {

/// Result of a syntax pre-check.
struct SyntaxReport {
    bool valid = false;
    int line = 0;          // 0 = whole source
    std::string message;
};

/// Syntax Checker: rejects candidates that could never be imported, before
/// a sandbox execution is spent on them.
class SyntaxChecker {
public:
    SyntaxReport check(const std::string& source) const;

    /// Bounded normalization: strips stray markdown fences and appends the
    /// colon missing from block headers. The result must be re-checked.
    std::string repair(const std::string& source) const;

private:
    PythonLexer lexer_;
};

/// Module names whose import counts as a security issue.
const std::vector<std::string>& blockedModules();

/// Builtins whose call counts as a security issue.
const std::vector<std::string>& blockedCalls();

/// RE2 pattern matching a bare call to any of `names`. Method calls such as
/// `obj.eval(` and longer identifiers such as `retrieval(` do not match.
std::string callPattern(const std::vector<std::string>& names);

/// Static Analyzer: quality metrics and structural profile of a candidate.
class StaticAnalyzer {
public:
    QualityMetrics analyze(const std::string& source) const;

    /// Number of decision points plus one. 0 when the source does not lex.
    int complexity(const std::vector<LogicalLine>& lines) const;
    int lintErrors(const std::string& source, const std::vector<LogicalLine>& lines) const;
    int securityIssues(const std::vector<LogicalLine>& lines) const;
    SourceProfile profile(const LexResult& lexed) const;

private:
    PythonLexer lexer_;
    SyntaxChecker syntax_;
};

} // namespace atdd
