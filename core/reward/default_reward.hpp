#pragma once

#include "reward/reward.hpp"

namespace atdd {

/// Calculator wired with the six standard dimensions.
RewardCalculator makeDefaultRewardCalculator(const RewardWeights& weights = {});

} // namespace atdd
