#pragma once

#include "reward/reward.hpp"

namespace atdd {

/// Weighted mix of complexity, idiom use, code smells and documentation.
class CodeQualityReward : public RewardDimension {
public:
    explicit CodeQualityReward(double max_reward = 10.0) : max_reward_(max_reward) {}

    DimensionScore compute(const RewardContext& context) const override;
    std::string name() const override;

    /// 1 at complexity ≤ 5, 0 at ≥ 15, linear in between.
    static double complexityScore(int complexity);
    static double idiomScore(const SourceProfile& profile);
    /// In [-1, 0].
    static double smellPenalty(const SourceProfile& profile);
    static double documentationScore(const SourceProfile& profile);

private:
    double max_reward_;
};

} // namespace atdd
