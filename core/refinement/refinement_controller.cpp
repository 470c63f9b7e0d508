#include "refinement/refinement_controller.hpp"
#include "refinement/run_budget.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace atdd {

RefinementController::RefinementController(SandboxEngine& sandbox,
                                           CandidateGenerator& generator,
                                           RefinementConfig config,
                                           LoggerPtr logger)
    : sandbox_(sandbox),
      generator_(generator),
      config_(config),
      logger_(orNull(std::move(logger))),
      parser_({}, logger_),
      classifier_({}, logger_),
      reward_(makeDefaultRewardCalculator()) {}

void RefinementController::setParserConfig(const OutcomeParserConfig& config) {
    parser_ = OutcomeParser(config, logger_);
}

void RefinementController::setClassifierConfig(const ClassifierConfig& config) {
    classifier_ = FailureClassifier(config, logger_);
}

void RefinementController::setRewardWeights(const RewardWeights& weights) {
    reward_ = makeDefaultRewardCalculator(weights);
}

void RefinementController::finish(RefinementState& state, Phase phase, const std::string& reason) const {
    state.phase = phase;
    state.stop_reason = reason;
    if (phase == Phase::Converged) state.converged = true;
    logger_->info("Refinement stopped phase={} iterations={} best_pass_rate={:.3f} reason={}",
                  phaseName(phase), state.iterations.size(), state.best_pass_rate, reason);
}

bool RefinementController::updateBest(RefinementState& state, const IterationRecord& record,
                                      const std::string& code) const {
    const double pass_rate = record.outcome.passRate();
    const double reward = record.reward.total;

    bool better = state.best_index < 0 ||
                  pass_rate > state.best_pass_rate ||
                  (pass_rate == state.best_pass_rate && reward > state.best_reward);
    if (!better) return false;

    state.best_index = static_cast<int>(state.iterations.size()) - 1;
    state.best_code = code;
    state.best_pass_rate = pass_rate;
    state.best_reward = reward;
    logger_->info("New best solution iteration={} pass_rate={:.3f} reward={:.2f} tests_passed={}",
                  record.index, pass_rate, reward, record.outcome.passed);
    return true;
}

void RefinementController::adoptConverged(RefinementState& state, const IterationRecord& record,
                                          const std::string& code) const {
    const int index = static_cast<int>(state.iterations.size()) - 1;
    if (state.best_index == index) return;

    // Skipped tests lower the pass rate of a converged run below an earlier
    // partial one. The best pass rate keeps its high-water mark.
    state.best_index = index;
    state.best_code = code;
    state.best_pass_rate = std::max(state.best_pass_rate, record.outcome.passRate());
    state.best_reward = record.reward.total;
    logger_->info("Converged candidate replaces best iteration={} pass_rate={:.3f} skipped={}",
                  record.index, record.outcome.passRate(), record.outcome.skipped);
}

std::optional<std::string> RefinementController::generateCandidate(
        const ProblemSpec& spec,
        const std::string& oracle_source,
        const std::optional<std::string>& feedback,
        const std::string& previous_code,
        RefinementState& state) {
    std::optional<std::string> request = feedback;
    SyntaxReport last_error;

    for (int attempt = 0; attempt <= config_.syntax_retry_limit; attempt++) {
        std::string code;
        try {
            code = generator_.generate(spec, oracle_source, request);
        } catch (const InfrastructureError&) {
            throw;
        } catch (const std::exception& e) {
            state.generation_errors++;
            logger_->error("Code generation failed error={}", e.what());
            finish(state, Phase::Failed, std::string("generation error: ") + e.what());
            return std::nullopt;
        }

        SyntaxReport report = syntax_.check(code);
        if (report.valid) return code;

        std::string repaired = syntax_.repair(code);
        if (syntax_.check(repaired).valid) {
            logger_->warn("Repaired generated candidate line={} error={}", report.line, report.message);
            return repaired;
        }

        state.syntax_rejections++;
        last_error = report;
        logger_->error("Generated candidate has syntax errors attempt={} line={} error={}",
                       attempt + 1, report.line, report.message);

        std::string note = "SYNTAX ERROR in the previous attempt (line " +
                           std::to_string(report.line) + "): " + report.message +
                           "\nReturn complete, syntactically valid Python.";
        request = request && !request->empty() ? *request + "\n\n" + note : note;
    }

    if (config_.syntax_failure_policy == SyntaxFailurePolicy::KeepPrevious && !previous_code.empty()) {
        logger_->warn("Keeping previous candidate after syntax failures retries={}", config_.syntax_retry_limit);
        return previous_code;
    }

    finish(state, Phase::Failed,
           "generated candidate failed syntax validation (line " + std::to_string(last_error.line) +
           "): " + last_error.message);
    return std::nullopt;
}

RefinementResult RefinementController::run(const ProblemSpec& spec,
                                           const std::string& oracle_source,
                                           const std::optional<std::string>& initial_candidate,
                                           const CancellationToken* cancel) {
    RefinementResult result;
    RefinementState& state = result.state;
    state.phase = Phase::Iterating;

    RunBudget budget(config_.max_iterations, config_.run_budget_seconds);

    std::optional<std::string> feedback;
    std::optional<double> previous_pass_rate;
    std::string previous_code;

    logger_->info("Starting refinement loop function={} max_iterations={}",
                  spec.function_name, config_.max_iterations);

    auto cancelled = [&] {
        if (state.iterations.empty()) {
            finish(state, Phase::Failed, "cancelled before any iteration completed");
        } else {
            finish(state, Phase::Cancelled, "cancelled by caller");
        }
    };

    while (!isTerminal(state.phase)) {
        if (isCancelled(cancel)) {
            cancelled();
            break;
        }
        if (auto spent = budget.exhaustedReason()) {
            finish(state, Phase::BudgetExhausted, *spent);
            break;
        }

        const int index = static_cast<int>(state.iterations.size()) + 1;
        logger_->info("Refinement iteration {}/{}", index, config_.max_iterations);

        std::string code;
        if (index == 1 && initial_candidate) {
            code = *initial_candidate;
        } else {
            auto generated = generateCandidate(spec, oracle_source, feedback, previous_code, state);
            if (!generated) break;
            code = std::move(*generated);
        }
        if (isCancelled(cancel)) {
            cancelled();
            break;
        }

        const auto start = std::chrono::steady_clock::now();
        RawExecution raw = sandbox_.execute(code, oracle_source, config_.execution_timeout, cancel);
        if (raw.cancelled) {
            cancelled();
            break;
        }

        IterationRecord record;
        record.index = index;
        record.candidate_hash = candidateHash(code);
        record.outcome = parser_.parse(raw);
        record.quality = analyzer_.analyze(code);
        record.analysis = classifier_.classify(record.outcome, code);
        record.reward = reward_.score(record.outcome, record.quality, raw.duration_seconds, previous_pass_rate);
        record.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        budget.recordIteration();

        state.iterations.push_back(std::move(record));
        const IterationRecord& current = state.iterations.back();
        const TestOutcome& outcome = current.outcome;
        const double pass_rate = outcome.passRate();
        logger_->info("Iteration {} results passed={} failed={} errors={} reward={:.2f} pass_rate={:.3f}",
                      index, outcome.passed, outcome.failed, outcome.errored,
                      current.reward.total, pass_rate);

        if (updateBest(state, current, code)) {
            state.no_improvement_streak = 0;
        } else {
            state.no_improvement_streak++;
        }

        if (outcome.allPassed()) {
            adoptConverged(state, current, code);
            finish(state, Phase::Converged, "all tests passed");
            break;
        }
        if (state.no_improvement_streak >= config_.patience) {
            finish(state, Phase::Stagnated,
                   "no improvement for " + std::to_string(state.no_improvement_streak) + " iterations");
            break;
        }
        if (index > 2 && previous_pass_rate &&
            std::fabs(pass_rate - *previous_pass_rate) < config_.min_improvement &&
            state.no_improvement_streak >= 1) {
            finish(state, Phase::Stagnated, "pass-rate change below minimum improvement");
            break;
        }

        feedback = current.analysis.feedback();
        logger_->info("Failure analysis error_type={} failing_tests={}",
                      errorKindName(current.analysis.error_kind), current.analysis.failing_tests.size());
        logger_->debug("Feedback for refinement feedback_length={}", feedback->size());

        previous_pass_rate = pass_rate;
        previous_code = std::move(code);
    }

    result.best_code = state.best_code;
    return result;
}

} // namespace atdd
