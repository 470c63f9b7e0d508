#include "reward/default_reward.hpp"
#include "reward/test_passing_reward.hpp"
#include "reward/partial_correctness_reward.hpp"
#include "reward/code_quality_reward.hpp"
#include "reward/efficiency_reward.hpp"
#include "reward/progress_reward.hpp"

namespace atdd {

RewardCalculator makeDefaultRewardCalculator(const RewardWeights& weights) {
    RewardCalculator reward(weights);
    reward.addDimension(std::make_unique<TestPassingReward>(weights.test_passing_max));
    reward.addDimension(std::make_unique<PartialCorrectnessReward>(weights.partial_correctness_max));
    reward.addDimension(std::make_unique<CodeQualityReward>(weights.code_quality_max));
    reward.addDimension(std::make_unique<EfficiencyReward>(weights.efficiency_max));
    reward.addDimension(std::make_unique<ImprovementReward>(weights.improvement_scale));
    reward.addDimension(std::make_unique<ConvergenceReward>(weights.convergence_bonus));
    return reward;
}

} // namespace atdd
