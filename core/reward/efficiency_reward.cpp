#include "reward/efficiency_reward.hpp"
#include <map>

namespace atdd {

double EfficiencyReward::timeScore(double seconds) {
    if (seconds < 0.5) return 1.0;
    if (seconds < 1.0) return 0.8;
    if (seconds < 2.0) return 0.6;
    if (seconds < 5.0) return 0.4;
    if (seconds < 10.0) return 0.2;
    return 0.1;
}

std::string EfficiencyReward::complexityClass(const SourceProfile& profile) {
    if (!profile.conclusive) return "unknown";

    if (profile.isRecursive()) {
        for (const auto& fn : profile.recursive_functions) {
            if (!fn.memoized && fn.self_calls >= 2) return "O(2^n)";
        }
        return "O(n)";
    }

    if (profile.max_loop_depth >= 3) return "O(n^3)";
    if (profile.max_loop_depth == 2) return "O(n^2)";
    if (profile.max_loop_depth == 1) return profile.halving ? "O(n log n)" : "O(n)";
    return "O(1)";
}

double EfficiencyReward::complexityClassScore(const std::string& complexity_class) {
    static const std::map<std::string, double> scores = {
        {"O(1)", 1.0},     {"O(log n)", 0.9}, {"O(n)", 0.8},   {"O(n log n)", 0.6},
        {"O(n^2)", 0.4},   {"O(n^3)", 0.2},   {"O(2^n)", 0.1},
    };
    auto it = scores.find(complexity_class);
    return it != scores.end() ? it->second : 0.5;
}

DimensionScore EfficiencyReward::compute(const RewardContext& context) const {
    DimensionScore score;
    score.max_reward = max_reward_;

    double time = timeScore(context.execution_seconds);
    std::string big_o = complexityClass(context.quality.profile);
    double cls = complexityClassScore(big_o);

    score.reward = (0.7 * time + 0.3 * cls) * max_reward_;
    score.metrics["execution_seconds"] = context.execution_seconds;
    score.metrics["time_score"] = time;
    score.metrics["complexity_class_score"] = cls;
    score.tags.push_back(big_o);
    score.note = "Estimated " + big_o;
    return score;
}

std::string EfficiencyReward::name() const { return "efficiency"; }

} // namespace atdd
