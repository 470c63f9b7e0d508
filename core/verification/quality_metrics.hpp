#pragma once

#include <string>
#include <vector>

namespace atdd {

// ─── Source Profile ────────────────────────────────────────────
// Structural facts about a candidate, consumed by the reward dimensions.

struct RecursiveFunction {
    std::string name;
    int self_calls = 0;
    bool memoized = false;
};

struct SourceProfile {
    bool conclusive = false;                 // false when the source could not be analyzed
    std::vector<std::string> idioms;         // list_comprehension, dict_comprehension,
                                             // context_manager, generator_expression, f_string
    std::vector<std::string> smells;         // bare_except, global_statement,
                                             // long_function_<name>, magic_numbers
    int documented_definitions = 0;
    int max_loop_depth = 0;
    std::vector<RecursiveFunction> recursive_functions;
    bool halving = false;                    // mid-point or shift-by-one patterns

    bool hasIdiom(const std::string& idiom) const;
    bool isRecursive() const { return !recursive_functions.empty(); }
};

// ─── Quality Metrics ───────────────────────────────────────────

struct QualityMetrics {
    int complexity = 0;              // McCabe-style, 0 on syntax error
    int lint_error_count = 0;
    int security_issue_count = 0;
    bool has_syntax_error = false;
    int line_count = 0;              // non-blank lines
    SourceProfile profile;
};

} // namespace atdd
