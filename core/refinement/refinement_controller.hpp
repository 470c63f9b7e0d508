#pragma once

#include "refinement/refinement_state.hpp"
#include "analysis/failure_classifier.hpp"
#include "common/cancellation.hpp"
#include "generation/candidate_generator.hpp"
#include "logging/logger.hpp"
#include "outcome/outcome_parser.hpp"
#include "reward/default_reward.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "verification/verification.hpp"

#include <optional>
#include <string>

namespace atdd {

/// Refinement loop parameters.
struct RefinementConfig {
    int max_iterations = 5;
    double min_improvement = 0.1;       // pass-rate change below this counts as flat
    int patience = 2;                   // iterations without a new best before stopping
    double execution_timeout = 30.0;    // seconds per sandbox run
    int syntax_retry_limit = 1;         // regenerations after a syntax rejection
    SyntaxFailurePolicy syntax_failure_policy = SyntaxFailurePolicy::Halt;
    double run_budget_seconds = 0.0;    // 0 = no wall-clock budget
};

/// Refinement Controller: drives generate → execute → parse → classify →
/// score until the candidate converges, stagnates or the budget runs out.
/// The only component that remembers anything across iterations.
class RefinementController {
public:
    RefinementController(SandboxEngine& sandbox,
                         CandidateGenerator& generator,
                         RefinementConfig config = {},
                         LoggerPtr logger = nullptr);

    /// Runs the loop. `initial_candidate` is executed first when given,
    /// otherwise the generator is asked for one without feedback.
    /// Throws InfrastructureError when the sandbox backend is unreachable.
    RefinementResult run(const ProblemSpec& spec,
                         const std::string& oracle_source,
                         const std::optional<std::string>& initial_candidate = std::nullopt,
                         const CancellationToken* cancel = nullptr);

    void setParserConfig(const OutcomeParserConfig& config);
    void setClassifierConfig(const ClassifierConfig& config);
    void setRewardWeights(const RewardWeights& weights);

    const RefinementConfig& config() const { return config_; }

private:
    /// Generated, syntax-checked candidate; nullopt after moving the state
    /// to Failed.
    std::optional<std::string> generateCandidate(const ProblemSpec& spec,
                                                 const std::string& oracle_source,
                                                 const std::optional<std::string>& feedback,
                                                 const std::string& previous_code,
                                                 RefinementState& state);

    /// Applies the lexicographic (pass rate, reward) rule. Returns true
    /// when the record became the new best.
    bool updateBest(RefinementState& state, const IterationRecord& record,
                    const std::string& code) const;

    /// The converged iteration always becomes the returned candidate.
    void adoptConverged(RefinementState& state, const IterationRecord& record,
                        const std::string& code) const;

    void finish(RefinementState& state, Phase phase, const std::string& reason) const;

    SandboxEngine& sandbox_;
    CandidateGenerator& generator_;
    RefinementConfig config_;
    LoggerPtr logger_;

    OutcomeParser parser_;
    FailureClassifier classifier_;
    StaticAnalyzer analyzer_;
    SyntaxChecker syntax_;
    RewardCalculator reward_;
};

} // namespace atdd
