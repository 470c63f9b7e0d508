#pragma once

#include "analysis/failure_analysis.hpp"
#include "outcome/test_outcome.hpp"
#include "reward/reward.hpp"
#include "verification/quality_metrics.hpp"
#include <string>
#include <vector>

namespace atdd {

enum class Phase {
    Init,
    Iterating,
    Converged,
    Stagnated,
    BudgetExhausted,
    Failed,
    Cancelled
};

/// "init", "iterating", "converged", "stagnated", "budgetExhausted", "failed", "cancelled".
std::string phaseName(Phase phase);

inline bool isTerminal(Phase phase) {
    return phase != Phase::Init && phase != Phase::Iterating;
}

/// What to run when regenerated candidates keep failing the syntax check.
enum class SyntaxFailurePolicy {
    Halt,           // stop the run as Failed
    KeepPrevious    // re-run the previous candidate
};

/// FNV-1a 64-bit digest of the candidate source, as 16 hex digits.
std::string candidateHash(const std::string& source);

// ─── Iteration Record ──────────────────────────────────────────
// One executed candidate. Appended to the state, never modified.

struct IterationRecord {
    int index = 0;                  // 1-based
    std::string candidate_hash;
    TestOutcome outcome;
    FailureAnalysis analysis;
    QualityMetrics quality;
    RewardBreakdown reward;
    double duration_seconds = 0.0;
};

// ─── Refinement State ──────────────────────────────────────────

struct RefinementState {
    std::vector<IterationRecord> iterations;
    int best_index = -1;            // position in `iterations`, -1 = none
    std::string best_code;
    double best_pass_rate = 0.0;
    double best_reward = 0.0;
    int no_improvement_streak = 0;
    bool converged = false;

    Phase phase = Phase::Init;
    std::string stop_reason;
    int generation_errors = 0;
    int syntax_rejections = 0;

    const IterationRecord* best() const;
    const IterationRecord* last() const;

    /// Human-readable audit of the run: one line per iteration plus the
    /// stop reason and the last analysis.
    std::string summary() const;
};

struct RefinementResult {
    std::string best_code;
    RefinementState state;

    /// False when no candidate was ever executed.
    bool hasResult() const { return state.best_index >= 0; }
};

} // namespace atdd
