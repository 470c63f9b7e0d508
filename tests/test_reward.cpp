#include <gtest/gtest.h>
#include "reward/reward.hpp"
#include "reward/default_reward.hpp"
#include "reward/test_passing_reward.hpp"
#include "reward/partial_correctness_reward.hpp"
#include "reward/code_quality_reward.hpp"
#include "reward/efficiency_reward.hpp"
#include "reward/progress_reward.hpp"

using namespace atdd;

namespace {

TestOutcome outcomeOf(int passed, int failed, int errored = 0) {
    TestOutcome o;
    o.passed = passed;
    o.failed = failed;
    o.errored = errored;
    o.total = passed + failed + errored;
    return o;
}

QualityMetrics simpleQuality() {
    QualityMetrics q;
    q.complexity = 3;
    q.line_count = 4;
    q.profile.conclusive = true;
    return q;
}

} // namespace

// ─── Test Passing ──────────────────────────────────────────────

TEST(RewardTest, TestPassingScalesWithPassRate) {
    TestOutcome o = outcomeOf(3, 1);
    QualityMetrics q = simpleQuality();
    TestPassingReward dim;

    DimensionScore s = dim.compute({o, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(s.reward, 37.5);
    EXPECT_DOUBLE_EQ(s.max_reward, 50.0);
    EXPECT_TRUE(s.tags.empty());
    EXPECT_EQ(s.note, "3/4 tests passed");
}

TEST(RewardTest, TestPassingAllPassedTag) {
    TestOutcome o = outcomeOf(4, 0);
    QualityMetrics q = simpleQuality();
    DimensionScore s = TestPassingReward().compute({o, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(s.reward, 50.0);
    ASSERT_EQ(s.tags.size(), 1u);
    EXPECT_EQ(s.tags[0], "all_passed");
}

// ─── Partial Correctness ───────────────────────────────────────

TEST(RewardTest, ExtractValuesFromAssert) {
    auto values = PartialCorrectnessReward::extractValues("AssertionError: assert 4 == 5");
    ASSERT_TRUE(values);
    EXPECT_EQ(values->first, "5");   // expected is the right-hand side
    EXPECT_EQ(values->second, "4");
}

TEST(RewardTest, ExtractValuesFromExpectedButGot) {
    auto values = PartialCorrectnessReward::extractValues("Expected: [1, 2] but got [2, 1]");
    ASSERT_TRUE(values);
    EXPECT_EQ(values->first, "[1, 2]");
    EXPECT_EQ(values->second, "[2, 1]");
}

TEST(RewardTest, ExtractValuesFromInequality) {
    auto values = PartialCorrectnessReward::extractValues("values differ: 5 != 7");
    ASSERT_TRUE(values);
    EXPECT_EQ(values->first, "5");
    EXPECT_EQ(values->second, "7");

    EXPECT_FALSE(PartialCorrectnessReward::extractValues("Test failed"));
}

TEST(RewardTest, NumericSimilarity) {
    EXPECT_DOUBLE_EQ(PartialCorrectnessReward::similarity("5", "4"), 0.8);
    EXPECT_DOUBLE_EQ(PartialCorrectnessReward::similarity("0", "0"), 1.0);
    EXPECT_DOUBLE_EQ(PartialCorrectnessReward::similarity("0", "3"), 0.0);
    EXPECT_DOUBLE_EQ(PartialCorrectnessReward::similarity("2", "10"), 0.0);  // clamped
}

TEST(RewardTest, TextSimilarity) {
    EXPECT_EQ(levenshtein("kitten", "sitting"), 3u);
    EXPECT_DOUBLE_EQ(PartialCorrectnessReward::similarity("hello", "HALLO"), 0.8);
    EXPECT_DOUBLE_EQ(PartialCorrectnessReward::similarity("abc", ""), 0.0);
    EXPECT_DOUBLE_EQ(PartialCorrectnessReward::similarity("", ""), 1.0);
}

TEST(RewardTest, PartialCorrectnessAveragesParsedFailures) {
    TestOutcome o = outcomeOf(1, 3);
    o.failures = {
        {"test_a", "AssertionError: assert 4 == 5"},
        {"test_b", "AssertionError: assert 0 == 3"},
        {"test_c", "Test failed"},
    };
    QualityMetrics q = simpleQuality();

    DimensionScore s = PartialCorrectnessReward().compute({o, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(s.metrics["parsed"], 2.0);
    EXPECT_NEAR(s.metrics["average_similarity"], 0.4, 1e-9);  // zero similarity still counts
    EXPECT_NEAR(s.reward, 6.0, 1e-9);
    ASSERT_EQ(s.tags.size(), 1u);
    EXPECT_EQ(s.tags[0], "close:test_a");
}

TEST(RewardTest, PartialCorrectnessNotes) {
    QualityMetrics q = simpleQuality();

    TestOutcome clean = outcomeOf(2, 0);
    DimensionScore none = PartialCorrectnessReward().compute({clean, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(none.reward, 0.0);
    EXPECT_EQ(none.note, "No failures to analyze");

    TestOutcome opaque = outcomeOf(0, 1);
    opaque.failures = {{"test_x", "Test failed"}};
    DimensionScore unparsed = PartialCorrectnessReward().compute({opaque, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(unparsed.reward, 0.0);
    EXPECT_EQ(unparsed.note, "No expected/actual values found in failure messages");
}

// ─── Code Quality ──────────────────────────────────────────────

TEST(RewardTest, CodeQualitySimpleSource) {
    TestOutcome o = outcomeOf(1, 0);
    QualityMetrics q = simpleQuality();
    DimensionScore s = CodeQualityReward().compute({o, q, 0.1, std::nullopt});
    EXPECT_NEAR(s.reward, 4.0, 1e-9);  // only the complexity term contributes
}

TEST(RewardTest, CodeQualitySyntaxErrorIsZero) {
    TestOutcome o = outcomeOf(0, 1);
    QualityMetrics q = simpleQuality();
    q.has_syntax_error = true;

    DimensionScore s = CodeQualityReward().compute({o, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(s.reward, 0.0);
    ASSERT_EQ(s.tags.size(), 1u);
    EXPECT_EQ(s.tags[0], "syntax_error");
}

TEST(RewardTest, CodeQualityComponentScores) {
    EXPECT_DOUBLE_EQ(CodeQualityReward::complexityScore(5), 1.0);
    EXPECT_DOUBLE_EQ(CodeQualityReward::complexityScore(10), 0.5);
    EXPECT_DOUBLE_EQ(CodeQualityReward::complexityScore(20), 0.0);

    SourceProfile p;
    p.smells = {"bare_except", "global_statement", "long_function_f", "magic_numbers"};
    EXPECT_NEAR(CodeQualityReward::smellPenalty(p), -0.5, 1e-9);

    p.documented_definitions = 5;
    EXPECT_DOUBLE_EQ(CodeQualityReward::documentationScore(p), 1.0);

    p.idioms = {"context_manager", "f_string"};
    EXPECT_NEAR(CodeQualityReward::idiomScore(p), 0.2, 1e-9);
}

TEST(RewardTest, CodeQualityNeverNegative) {
    TestOutcome o = outcomeOf(1, 0);
    QualityMetrics q = simpleQuality();
    q.complexity = 30;
    q.profile.smells = {"bare_except", "bare_except", "bare_except", "global_statement"};

    DimensionScore s = CodeQualityReward().compute({o, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(s.reward, 0.0);
}

// ─── Efficiency ────────────────────────────────────────────────

TEST(RewardTest, ComplexityClasses) {
    SourceProfile p;
    EXPECT_EQ(EfficiencyReward::complexityClass(p), "unknown");

    p.conclusive = true;
    EXPECT_EQ(EfficiencyReward::complexityClass(p), "O(1)");

    p.max_loop_depth = 1;
    EXPECT_EQ(EfficiencyReward::complexityClass(p), "O(n)");
    p.halving = true;
    EXPECT_EQ(EfficiencyReward::complexityClass(p), "O(n log n)");

    p.max_loop_depth = 2;
    EXPECT_EQ(EfficiencyReward::complexityClass(p), "O(n^2)");

    p.recursive_functions = {{"fib", 2, false}};
    EXPECT_EQ(EfficiencyReward::complexityClass(p), "O(2^n)");
    p.recursive_functions[0].memoized = true;
    EXPECT_EQ(EfficiencyReward::complexityClass(p), "O(n)");
}

TEST(RewardTest, EfficiencyCombinesTimeAndClass) {
    TestOutcome o = outcomeOf(1, 0);
    QualityMetrics q = simpleQuality();
    q.profile.max_loop_depth = 2;

    DimensionScore fast = EfficiencyReward().compute({o, q, 0.1, std::nullopt});
    EXPECT_NEAR(fast.reward, 8.2, 1e-9);  // 0.7 * 1.0 + 0.3 * 0.4

    q.profile.conclusive = false;
    DimensionScore slow = EfficiencyReward().compute({o, q, 12.0, std::nullopt});
    EXPECT_NEAR(slow.reward, 2.2, 1e-9);  // 0.7 * 0.1 + 0.3 * 0.5
    EXPECT_EQ(slow.tags[0], "unknown");
}

TEST(RewardTest, TimeScoreSteps) {
    EXPECT_DOUBLE_EQ(EfficiencyReward::timeScore(0.2), 1.0);
    EXPECT_DOUBLE_EQ(EfficiencyReward::timeScore(1.5), 0.6);
    EXPECT_DOUBLE_EQ(EfficiencyReward::timeScore(30.0), 0.1);
}

// ─── Improvement & Convergence ─────────────────────────────────

TEST(RewardTest, ImprovementFirstIterationIsZero) {
    TestOutcome o = outcomeOf(3, 1);
    QualityMetrics q = simpleQuality();
    DimensionScore s = ImprovementReward().compute({o, q, 0.1, std::nullopt});
    EXPECT_DOUBLE_EQ(s.reward, 0.0);
    EXPECT_EQ(s.note, "First iteration");
}

TEST(RewardTest, ImprovementRewardsGainOnly) {
    TestOutcome o = outcomeOf(3, 1);
    QualityMetrics q = simpleQuality();

    DimensionScore gain = ImprovementReward().compute({o, q, 0.1, 0.25});
    EXPECT_DOUBLE_EQ(gain.reward, 5.0);
    EXPECT_EQ(gain.tags[0], "improved");

    DimensionScore loss = ImprovementReward().compute({o, q, 0.1, 1.0});
    EXPECT_DOUBLE_EQ(loss.reward, 0.0);
    EXPECT_EQ(loss.tags[0], "regressed");
}

TEST(RewardTest, ConvergenceBonus) {
    QualityMetrics q = simpleQuality();
    TestOutcome done = outcomeOf(4, 0);
    TestOutcome empty = outcomeOf(0, 0);
    EXPECT_DOUBLE_EQ(ConvergenceReward().compute({done, q, 0.1, std::nullopt}).reward, 5.0);
    EXPECT_DOUBLE_EQ(ConvergenceReward().compute({empty, q, 0.1, std::nullopt}).reward, 0.0);
}

// ─── Calculator ────────────────────────────────────────────────

TEST(RewardTest, DefaultCalculatorDimensions) {
    RewardCalculator calc = makeDefaultRewardCalculator();
    EXPECT_EQ(calc.dimensionCount(), 6u);

    RewardBreakdown bd = calc.score(outcomeOf(3, 1), simpleQuality(), 0.1);
    for (const char* name : {"test_passing", "partial_correctness", "code_quality",
                             "efficiency", "improvement", "convergence"}) {
        EXPECT_EQ(bd.dimensions.count(name), 1u) << name;
    }
    EXPECT_DOUBLE_EQ(bd.reward("missing"), 0.0);
}

TEST(RewardTest, PenaltiesAreNonPositive) {
    RewardCalculator calc = makeDefaultRewardCalculator();
    TestOutcome o = outcomeOf(1, 0, 2);
    o.timed_out = true;
    QualityMetrics q = simpleQuality();
    q.has_syntax_error = true;

    EXPECT_DOUBLE_EQ(calc.penalties(o, q), -19.0);  // -8 timeout, 2 * -3 errors, -5 syntax
    EXPECT_DOUBLE_EQ(calc.penalties(outcomeOf(2, 0), simpleQuality()), 0.0);

    RewardWeights odd;
    odd.timeout_penalty = 4.0;
    RewardCalculator lenient(odd);
    TestOutcome slow = outcomeOf(1, 0);
    slow.timed_out = true;
    EXPECT_DOUBLE_EQ(lenient.penalties(slow, simpleQuality()), 0.0);
}

TEST(RewardTest, TotalIsSumOfParts) {
    RewardCalculator calc = makeDefaultRewardCalculator();
    TestOutcome o = outcomeOf(2, 1, 1);
    o.failures = {{"test_a", "assert 9 == 10"}};

    RewardBreakdown bd = calc.score(o, simpleQuality(), 0.3, 0.25);
    double sum = bd.penalties;
    for (const auto& [name, dim] : bd.dimensions) {
        EXPECT_GE(dim.reward, 0.0) << name;
        EXPECT_LE(dim.reward, dim.max_reward) << name;
        sum += dim.reward;
    }
    EXPECT_NEAR(bd.total, sum, 1e-9);
    EXPECT_DOUBLE_EQ(bd.penalties, -3.0);
}

TEST(RewardTest, WeightsScaleDimensions) {
    RewardWeights weights;
    weights.test_passing_max = 100.0;
    RewardCalculator calc = makeDefaultRewardCalculator(weights);

    RewardBreakdown bd = calc.score(outcomeOf(1, 1), simpleQuality(), 0.1);
    EXPECT_DOUBLE_EQ(bd.reward("test_passing"), 50.0);
}
