#include "reward/code_quality_reward.hpp"
#include <algorithm>

namespace atdd {

namespace {

constexpr double kComplexityWeight = 0.4;
constexpr double kIdiomWeight      = 0.3;
constexpr double kSmellWeight      = 0.2;
constexpr double kDocWeight        = 0.1;

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

double CodeQualityReward::complexityScore(int complexity) {
    if (complexity <= 5) return 1.0;
    if (complexity >= 15) return 0.0;
    return 1.0 - (complexity - 5) / 10.0;
}

double CodeQualityReward::idiomScore(const SourceProfile& profile) {
    double score = 0.0;
    for (const auto& idiom : profile.idioms) {
        if (idiom == "list_comprehension") score += 0.1;
        else if (idiom == "dict_comprehension") score += 0.1;
        else if (idiom == "context_manager") score += 0.15;
        else if (idiom == "generator_expression") score += 0.1;
        else if (idiom == "f_string") score += 0.05;
    }
    return std::min(1.0, score);
}

double CodeQualityReward::smellPenalty(const SourceProfile& profile) {
    double penalty = 0.0;
    for (const auto& smell : profile.smells) {
        if (smell == "bare_except") penalty -= 0.2;
        else if (smell == "global_statement") penalty -= 0.15;
        else if (startsWith(smell, "long_function_")) penalty -= 0.1;
        else if (smell == "magic_numbers") penalty -= 0.05;
    }
    return std::max(-1.0, penalty);
}

double CodeQualityReward::documentationScore(const SourceProfile& profile) {
    return std::min(1.0, 0.3 * profile.documented_definitions);
}

DimensionScore CodeQualityReward::compute(const RewardContext& context) const {
    const QualityMetrics& quality = context.quality;
    DimensionScore score;
    score.max_reward = max_reward_;

    if (quality.has_syntax_error) {
        score.note = "Syntax error, quality not assessed";
        score.tags.push_back("syntax_error");
        return score;
    }

    const SourceProfile& profile = quality.profile;
    double complexity = complexityScore(quality.complexity);
    double idioms = idiomScore(profile);
    double smells = smellPenalty(profile);
    double docs = documentationScore(profile);

    double combined = kComplexityWeight * complexity + kIdiomWeight * idioms +
                      kSmellWeight * smells + kDocWeight * docs;
    score.reward = std::clamp(combined, 0.0, 1.0) * max_reward_;

    score.metrics["complexity"] = quality.complexity;
    score.metrics["complexity_score"] = complexity;
    score.metrics["idiom_score"] = idioms;
    score.metrics["smell_penalty"] = smells;
    score.metrics["documentation_score"] = docs;
    score.tags = profile.idioms;
    score.tags.insert(score.tags.end(), profile.smells.begin(), profile.smells.end());
    return score;
}

std::string CodeQualityReward::name() const { return "code_quality"; }

} // namespace atdd
