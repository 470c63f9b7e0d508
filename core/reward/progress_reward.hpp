#pragma once

#include "reward/reward.hpp"

namespace atdd {

/// Pass-rate gain over the previous iteration.
class ImprovementReward : public RewardDimension {
public:
    explicit ImprovementReward(double scale = 10.0) : scale_(scale) {}

    DimensionScore compute(const RewardContext& context) const override;
    std::string name() const override;

private:
    double scale_;
};

/// Flat bonus once every test passes.
class ConvergenceReward : public RewardDimension {
public:
    explicit ConvergenceReward(double bonus = 5.0) : bonus_(bonus) {}

    DimensionScore compute(const RewardContext& context) const override;
    std::string name() const override;

private:
    double bonus_;
};

} // namespace atdd
