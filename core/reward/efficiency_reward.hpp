#pragma once

#include "reward/reward.hpp"

namespace atdd {

/// Wall-clock speed of the run and the estimated asymptotic class.
class EfficiencyReward : public RewardDimension {
public:
    explicit EfficiencyReward(double max_reward = 10.0) : max_reward_(max_reward) {}

    DimensionScore compute(const RewardContext& context) const override;
    std::string name() const override;

    static double timeScore(double seconds);

    /// "O(1)", "O(n)", "O(n^2)", ... or "unknown".
    static std::string complexityClass(const SourceProfile& profile);
    static double complexityClassScore(const std::string& complexity_class);

private:
    double max_reward_;
};

} // namespace atdd
