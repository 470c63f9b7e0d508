#include "reward/reward.hpp"
#include <algorithm>

namespace atdd {

double RewardBreakdown::reward(const std::string& dimension) const {
    auto it = dimensions.find(dimension);
    return it != dimensions.end() ? it->second.reward : 0.0;
}

RewardCalculator::RewardCalculator(RewardWeights weights)
    : weights_(weights) {}

void RewardCalculator::addDimension(std::unique_ptr<RewardDimension> dimension) {
    dimensions_.push_back(std::move(dimension));
}

RewardBreakdown RewardCalculator::score(const TestOutcome& outcome,
                                        const QualityMetrics& quality,
                                        double execution_seconds,
                                        std::optional<double> previous_pass_rate) const {
    RewardContext context{outcome, quality, execution_seconds, previous_pass_rate};

    RewardBreakdown bd;
    for (const auto& dim : dimensions_) {
        DimensionScore score = dim->compute(context);
        bd.total += score.reward;
        bd.dimensions[dim->name()] = std::move(score);
    }
    bd.penalties = penalties(outcome, quality);
    bd.total += bd.penalties;
    return bd;
}

double RewardCalculator::penalties(const TestOutcome& outcome, const QualityMetrics& quality) const {
    double penalty = 0.0;
    if (outcome.timed_out) penalty += weights_.timeout_penalty;
    if (outcome.errored > 0) penalty += weights_.error_penalty * outcome.errored;
    if (quality.has_syntax_error) penalty += weights_.syntax_penalty;
    return std::min(0.0, penalty);
}

} // namespace atdd
