#pragma once

#include "outcome/test_outcome.hpp"
#include "verification/quality_metrics.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace atdd {

// ─── Dimension Score ───────────────────────────────────────────
// One named reward term with the evidence that produced it.

struct DimensionScore {
    double reward = 0.0;
    double max_reward = 0.0;
    std::map<std::string, double> metrics;
    std::vector<std::string> tags;
    std::string note;
};

// ─── Reward Breakdown ──────────────────────────────────────────
// The total is the sum of all dimension rewards plus the (non-positive)
// penalties.

struct RewardBreakdown {
    std::map<std::string, DimensionScore> dimensions;
    double penalties = 0.0;
    double total = 0.0;

    /// Reward of a named dimension, 0 when absent.
    double reward(const std::string& dimension) const;
};

// ─── Reward Weights ────────────────────────────────────────────

struct RewardWeights {
    double test_passing_max        = 50.0;
    double partial_correctness_max = 15.0;
    double code_quality_max        = 10.0;
    double efficiency_max          = 10.0;
    double improvement_scale       = 10.0;   // reward per unit of pass-rate gain
    double convergence_bonus       = 5.0;

    double timeout_penalty = -8.0;
    double error_penalty   = -3.0;           // per errored test
    double syntax_penalty  = -5.0;
};

// ─── Reward Context ────────────────────────────────────────────
// Everything a dimension may look at. Dimensions keep no state.

struct RewardContext {
    const TestOutcome& outcome;
    const QualityMetrics& quality;
    double execution_seconds = 0.0;
    std::optional<double> previous_pass_rate;
};

// ─── Reward Dimension ──────────────────────────────────────────
// Abstract base class for individual reward terms.

class RewardDimension {
public:
    virtual ~RewardDimension() = default;

    virtual DimensionScore compute(const RewardContext& context) const = 0;

    /// Stable dimension name used as the breakdown key.
    virtual std::string name() const = 0;
};

// ─── Reward Calculator ─────────────────────────────────────────
// Combines reward dimensions and penalties into one breakdown.

class RewardCalculator {
public:
    explicit RewardCalculator(RewardWeights weights = {});

    void addDimension(std::unique_ptr<RewardDimension> dimension);

    RewardBreakdown score(const TestOutcome& outcome,
                          const QualityMetrics& quality,
                          double execution_seconds,
                          std::optional<double> previous_pass_rate = std::nullopt) const;

    /// Sum of the penalties that apply to this outcome. Always ≤ 0.
    double penalties(const TestOutcome& outcome, const QualityMetrics& quality) const;

    const RewardWeights& weights() const { return weights_; }
    size_t dimensionCount() const { return dimensions_.size(); }

private:
    RewardWeights weights_;
    std::vector<std::unique_ptr<RewardDimension>> dimensions_;
};

} // namespace atdd
