#include <gtest/gtest.h>
#include "refinement/refinement_controller.hpp"
#include "refinement/run_budget.hpp"
#include "fake_backend.hpp"

#include <chrono>
#include <thread>

using namespace atdd;

namespace {

const char* const kOracle =
    "from impl import add\n"
    "\n"
    "def test_case_0():\n"
    "    assert add(0, 1) == 1\n";

const char* const kCleanAdd = "def add(a, b):\n    return a + b\n";

ProblemSpec addSpec() {
    ProblemSpec spec;
    spec.function_name = "add";
    spec.description = "Add two integers.";
    spec.parameters = {{"a", "int", "first operand"}, {"b", "int", "second operand"}};
    spec.return_type = "int";
    return spec;
}

std::string variant(int n) {
    return "def add(a, b):\n    return a + b  # v" + std::to_string(n) + "\n";
}

/// Owns the fakes and the engine around a controller under test.
struct Harness {
    ScriptedBackend* backend = nullptr;
    std::unique_ptr<SandboxEngine> engine;
    ScriptedGenerator generator;

    Harness() {
        auto owned = std::make_unique<ScriptedBackend>();
        backend = owned.get();
        engine = std::make_unique<SandboxEngine>(SandboxConfig{}, std::move(owned));
    }

    RefinementResult run(const RefinementConfig& config,
                         const std::optional<std::string>& initial = std::nullopt,
                         const CancellationToken* cancel = nullptr) {
        RefinementController controller(*engine, generator, config);
        return controller.run(addSpec(), kOracle, initial, cancel);
    }
};

} // namespace

// ─── Termination ───────────────────────────────────────────────

TEST(RefinementTest, ConvergesWhenAllTestsPass) {
    Harness h;
    h.backend->script = {pytestRun(1, 1), pytestRun(2, 0)};
    h.generator.codes = {variant(2)};

    RefinementResult r = h.run({}, std::string(kCleanAdd));
    const RefinementState& s = r.state;

    EXPECT_EQ(s.phase, Phase::Converged);
    EXPECT_TRUE(s.converged);
    EXPECT_EQ(s.stop_reason, "all tests passed");
    ASSERT_EQ(s.iterations.size(), 2u);
    EXPECT_EQ(s.best_index, 1);
    EXPECT_EQ(r.best_code, variant(2));
    EXPECT_DOUBLE_EQ(s.best_pass_rate, 1.0);

    // Only the refinement call went to the generator, and it carried feedback.
    ASSERT_EQ(h.generator.calls(), 1u);
    ASSERT_TRUE(h.generator.feedbacks[0]);
    EXPECT_NE(h.generator.feedbacks[0]->find("Error Type: assertion"), std::string::npos);
    EXPECT_NE(h.generator.feedbacks[0]->find("test_case_0"), std::string::npos);
}

TEST(RefinementTest, ConvergedCandidateIsReturnedDespiteSkips) {
    Harness h;
    RawExecution with_skip;
    with_skip.stdout_text = "==== 3 passed, 1 skipped in 0.05s ====\n";
    with_skip.duration_seconds = 0.05;
    h.backend->script = {pytestRun(4, 1), with_skip};
    h.generator.codes = {variant(2)};

    RefinementResult r = h.run({}, variant(1));
    const RefinementState& s = r.state;

    EXPECT_EQ(s.phase, Phase::Converged);
    EXPECT_TRUE(s.converged);
    ASSERT_EQ(s.iterations.size(), 2u);
    EXPECT_DOUBLE_EQ(s.iterations[1].outcome.passRate(), 0.75);
    EXPECT_EQ(s.best_index, 1);
    EXPECT_EQ(r.best_code, variant(2));
    EXPECT_DOUBLE_EQ(s.best_reward, s.iterations[1].reward.total);
    EXPECT_DOUBLE_EQ(s.best_pass_rate, 0.8);  // never lowered
}

TEST(RefinementTest, FirstCandidateComesFromGenerator) {
    Harness h;
    h.backend->script = {pytestRun(3, 0)};
    h.generator.codes = {kCleanAdd};

    RefinementResult r = h.run({});
    EXPECT_EQ(r.state.phase, Phase::Converged);
    ASSERT_EQ(h.generator.calls(), 1u);
    EXPECT_FALSE(h.generator.feedbacks[0]);  // initial request has no feedback
    EXPECT_EQ(h.backend->candidates[0], kCleanAdd);
    EXPECT_EQ(h.backend->oracles[0], kOracle);
}

TEST(RefinementTest, StagnatesOnFlatPassRate) {
    Harness h;
    h.backend->script = {pytestRun(2, 3), pytestRun(4, 1), pytestRun(4, 1)};
    h.generator.codes = {variant(2), variant(2)};

    RefinementResult r = h.run({}, std::string(kCleanAdd));
    const RefinementState& s = r.state;

    EXPECT_EQ(s.phase, Phase::Stagnated);
    EXPECT_EQ(s.stop_reason, "pass-rate change below minimum improvement");
    EXPECT_EQ(s.iterations.size(), 3u);
    EXPECT_EQ(s.no_improvement_streak, 1);
    EXPECT_EQ(s.best_index, 1);  // the earlier 0.8 run also earned the improvement reward
    EXPECT_EQ(r.best_code, variant(2));
    EXPECT_DOUBLE_EQ(s.best_pass_rate, 0.8);
}

TEST(RefinementTest, StagnatesAfterPatience) {
    Harness h;
    h.backend->script = {pytestRun(3, 1), pytestRun(1, 3), pytestRun(2, 2)};
    h.generator.codes = {variant(2), variant(3)};

    RefinementConfig config;
    config.min_improvement = 0.0;
    RefinementResult r = h.run(config, std::string(kCleanAdd));

    EXPECT_EQ(r.state.phase, Phase::Stagnated);
    EXPECT_EQ(r.state.stop_reason, "no improvement for 2 iterations");
    EXPECT_EQ(r.state.best_index, 0);
    EXPECT_EQ(r.best_code, kCleanAdd);
}

TEST(RefinementTest, EqualPassRateKeepsHigherReward) {
    Harness h;
    h.backend->script = {pytestRun(7, 3), pytestRun(7, 3)};
    h.generator.codes = {
        "def add(a, b):\n"
        "    global total\n"
        "    try:\n"
        "        return a + b\n"
        "    except:\n"
        "        return 0\n"};

    RefinementConfig config;
    config.max_iterations = 2;
    RefinementResult r = h.run(config, std::string(kCleanAdd));
    const RefinementState& s = r.state;

    ASSERT_EQ(s.iterations.size(), 2u);
    EXPECT_DOUBLE_EQ(s.iterations[0].outcome.passRate(), s.iterations[1].outcome.passRate());
    EXPECT_GT(s.iterations[0].reward.total, s.iterations[1].reward.total);
    EXPECT_EQ(s.best_index, 0);
    EXPECT_EQ(r.best_code, kCleanAdd);
    EXPECT_EQ(s.phase, Phase::BudgetExhausted);
}

TEST(RefinementTest, IterationBudgetBoundsExecutions) {
    Harness h;
    h.backend->script = {pytestRun(1, 1)};
    h.generator.codes = {variant(1), variant(2), variant(3), variant(4)};

    RefinementConfig config;
    config.max_iterations = 3;
    config.patience = 10;
    config.min_improvement = 0.0;
    RefinementResult r = h.run(config);

    EXPECT_EQ(h.backend->runs(), 3u);
    EXPECT_EQ(r.state.iterations.size(), 3u);
    EXPECT_EQ(r.state.phase, Phase::BudgetExhausted);
    EXPECT_EQ(r.state.stop_reason, "reached max iterations (3)");
}

TEST(RefinementTest, BestPassRateIsMonotonic) {
    Harness h;
    h.backend->script = {pytestRun(2, 2), pytestRun(1, 3), pytestRun(3, 1), pytestRun(2, 2)};
    h.generator.codes = {variant(1), variant(2), variant(3), variant(4)};

    RefinementConfig config;
    config.max_iterations = 4;
    config.patience = 10;
    config.min_improvement = 0.0;
    RefinementResult r = h.run(config);
    const RefinementState& s = r.state;

    ASSERT_EQ(s.iterations.size(), 4u);
    EXPECT_EQ(s.best_index, 2);
    EXPECT_DOUBLE_EQ(s.best_pass_rate, 0.75);
    EXPECT_EQ(r.best_code, variant(3));
    for (const auto& it : s.iterations) {
        EXPECT_LE(it.outcome.passRate(), s.best_pass_rate);
    }
    for (size_t i = 0; i < s.iterations.size(); i++) {
        EXPECT_EQ(s.iterations[i].index, static_cast<int>(i) + 1);
        EXPECT_EQ(s.iterations[i].candidate_hash, candidateHash(h.backend->candidates[i]));
    }
}

// ─── Generator Failures ────────────────────────────────────────

TEST(RefinementTest, GeneratorErrorKeepsBest) {
    Harness h;
    h.backend->script = {pytestRun(1, 1)};
    h.generator.fail = true;

    RefinementResult r = h.run({}, std::string(kCleanAdd));
    EXPECT_EQ(r.state.phase, Phase::Failed);
    EXPECT_EQ(r.state.stop_reason, "generation error: model quota exceeded");
    EXPECT_EQ(r.state.generation_errors, 1);
    EXPECT_TRUE(r.hasResult());
    EXPECT_EQ(r.best_code, kCleanAdd);
}

TEST(RefinementTest, GeneratorErrorWithoutCandidate) {
    Harness h;
    h.generator.fail = true;

    RefinementResult r = h.run({});
    EXPECT_EQ(r.state.phase, Phase::Failed);
    EXPECT_FALSE(r.hasResult());
    EXPECT_TRUE(r.best_code.empty());
    EXPECT_EQ(h.backend->runs(), 0u);
}

TEST(RefinementTest, InfrastructureErrorPropagates) {
    Harness h;
    h.backend->unreachable = true;
    EXPECT_THROW(h.run({}, std::string(kCleanAdd)), InfrastructureError);
}

// ─── Syntax Handling ───────────────────────────────────────────

TEST(RefinementTest, RepairableCandidateIsRepaired) {
    Harness h;
    h.backend->script = {pytestRun(2, 0)};
    h.generator.codes = {"def add(a, b)\n    return a + b\n"};

    RefinementResult r = h.run({});
    EXPECT_EQ(r.state.syntax_rejections, 0);
    ASSERT_EQ(h.backend->runs(), 1u);
    EXPECT_EQ(h.backend->candidates[0], kCleanAdd);
}

TEST(RefinementTest, SyntaxFailureHalts) {
    Harness h;
    h.backend->script = {pytestRun(1, 1)};
    h.generator.codes = {"def add(a, b:\n    return a\n"};

    RefinementResult r = h.run({}, std::string(kCleanAdd));
    const RefinementState& s = r.state;

    EXPECT_EQ(s.phase, Phase::Failed);
    EXPECT_EQ(s.syntax_rejections, 2);  // first attempt plus one retry
    EXPECT_EQ(s.stop_reason, "generated candidate failed syntax validation (line 1): '(' was never closed");
    EXPECT_EQ(h.backend->runs(), 1u);
    EXPECT_EQ(r.best_code, kCleanAdd);

    ASSERT_EQ(h.generator.calls(), 2u);
    ASSERT_TRUE(h.generator.feedbacks[1]);
    EXPECT_NE(h.generator.feedbacks[1]->find("SYNTAX ERROR in the previous attempt (line 1)"),
              std::string::npos);
    EXPECT_NE(h.generator.feedbacks[1]->find("Error Type:"), std::string::npos);  // original feedback kept
}

TEST(RefinementTest, SyntaxFailureKeepsPrevious) {
    Harness h;
    h.backend->script = {pytestRun(1, 1)};
    h.generator.codes = {"def add(a, b:\n    return a\n"};

    RefinementConfig config;
    config.max_iterations = 2;
    config.syntax_failure_policy = SyntaxFailurePolicy::KeepPrevious;
    RefinementResult r = h.run(config, std::string(kCleanAdd));

    ASSERT_EQ(h.backend->runs(), 2u);
    EXPECT_EQ(h.backend->candidates[1], kCleanAdd);
    EXPECT_EQ(r.state.phase, Phase::BudgetExhausted);
}

// ─── Cancellation ──────────────────────────────────────────────

TEST(RefinementTest, CancelBeforeStart) {
    Harness h;
    CancellationToken token;
    token.cancel();

    RefinementResult r = h.run({}, std::string(kCleanAdd), &token);
    EXPECT_EQ(r.state.phase, Phase::Failed);
    EXPECT_EQ(h.backend->runs(), 0u);
    EXPECT_FALSE(r.hasResult());
}

TEST(RefinementTest, CancelDuringFirstRun) {
    Harness h;
    CancellationToken token;
    h.backend->script = {pytestRun(1, 1)};
    h.backend->on_run = [&token](size_t) { token.cancel(); };

    RefinementResult r = h.run({}, std::string(kCleanAdd), &token);
    EXPECT_EQ(r.state.phase, Phase::Failed);
    EXPECT_EQ(r.state.stop_reason, "cancelled before any iteration completed");
    EXPECT_TRUE(r.state.iterations.empty());
}

TEST(RefinementTest, CancelAfterProgressKeepsBest) {
    Harness h;
    CancellationToken token;
    h.backend->script = {pytestRun(1, 1)};
    h.backend->on_run = [&token](size_t index) {
        if (index == 1) token.cancel();
    };
    h.generator.codes = {variant(2)};

    RefinementResult r = h.run({}, std::string(kCleanAdd), &token);
    EXPECT_EQ(r.state.phase, Phase::Cancelled);
    EXPECT_EQ(r.state.iterations.size(), 1u);
    EXPECT_TRUE(r.hasResult());
    EXPECT_EQ(r.best_code, kCleanAdd);
}

// ─── State Helpers ─────────────────────────────────────────────

TEST(RefinementTest, PhaseNames) {
    EXPECT_EQ(phaseName(Phase::Converged), "converged");
    EXPECT_EQ(phaseName(Phase::BudgetExhausted), "budgetExhausted");
    EXPECT_TRUE(isTerminal(Phase::Stagnated));
    EXPECT_FALSE(isTerminal(Phase::Iterating));
}

TEST(RefinementTest, CandidateHashIsFnv1a) {
    EXPECT_EQ(candidateHash(""), "cbf29ce484222325");
    EXPECT_EQ(candidateHash("a"), "af63dc4c8601ec8c");
    EXPECT_NE(candidateHash(variant(1)), candidateHash(variant(2)));
}

TEST(RefinementTest, SummaryDescribesRun) {
    Harness h;
    h.backend->script = {pytestRun(1, 1), pytestRun(2, 0)};
    h.generator.codes = {variant(2)};

    RefinementResult r = h.run({}, std::string(kCleanAdd));
    std::string text = r.state.summary();
    EXPECT_EQ(text.rfind("phase=converged iterations=2 best_iteration=2", 0), 0u);
    EXPECT_NE(text.find("stop_reason: all tests passed"), std::string::npos);
    EXPECT_EQ(text.find("Last analysis:"), std::string::npos);  // last run passed
}

TEST(RefinementTest, RunBudgetLimits) {
    RunBudget budget(2, 0.0);
    EXPECT_FALSE(budget.exhaustedReason());
    budget.recordIteration();
    EXPECT_FALSE(budget.exhaustedReason());  // no wall-clock limit
    budget.recordIteration();
    ASSERT_TRUE(budget.exhaustedReason());
    EXPECT_EQ(*budget.exhaustedReason(), "reached max iterations (2)");

    RunBudget timed(10, 0.001);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(timed.exhaustedReason());
    EXPECT_EQ(*timed.exhaustedReason(), "run wall-clock budget spent");
}
