#include "reward/progress_reward.hpp"

namespace atdd {

// ─── Improvement ───────────────────────────────────────────────

DimensionScore ImprovementReward::compute(const RewardContext& context) const {
    DimensionScore score;
    score.max_reward = scale_;

    if (!context.previous_pass_rate) {
        score.note = "First iteration";
        return score;
    }

    double delta = context.outcome.passRate() - *context.previous_pass_rate;
    score.metrics["delta"] = delta;
    if (delta > 0.0) {
        score.reward = scale_ * delta;
        score.tags.push_back("improved");
    } else if (delta < 0.0) {
        score.tags.push_back("regressed");
    }
    return score;
}

std::string ImprovementReward::name() const { return "improvement"; }

// ─── Convergence ───────────────────────────────────────────────

DimensionScore ConvergenceReward::compute(const RewardContext& context) const {
    DimensionScore score;
    score.max_reward = bonus_;
    if (context.outcome.total > 0 && context.outcome.passRate() == 1.0) {
        score.reward = bonus_;
        score.tags.push_back("converged");
    }
    return score;
}

std::string ConvergenceReward::name() const { return "convergence"; }

} // namespace atdd
