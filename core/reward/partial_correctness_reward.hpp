#pragma once

#include "reward/reward.hpp"
#include <optional>
#include <string>
#include <utility>

namespace atdd {

/// Credit for failures that came close: compares the expected and actual
/// values quoted in each failure message.
class PartialCorrectnessReward : public RewardDimension {
public:
    explicit PartialCorrectnessReward(double max_reward = 15.0) : max_reward_(max_reward) {}

    DimensionScore compute(const RewardContext& context) const override;
    std::string name() const override;

    /// (expected, actual) quoted in a failure message, if any.
    static std::optional<std::pair<std::string, std::string>> extractValues(const std::string& message);

    /// Similarity in [0, 1]. Numbers compare by relative error, text by
    /// normalized edit distance.
    static double similarity(const std::string& expected, const std::string& actual);

private:
    double max_reward_;
};

/// Edit distance between two strings.
size_t levenshtein(const std::string& a, const std::string& b);

} // namespace atdd
