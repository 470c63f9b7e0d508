// PyBind11 bindings for the atdd C++ core.
// Exposes the data model, parser, classifier, analyzers, reward calculator,
// sandbox engine, configuration and refinement controller to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DATDD_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "analysis/failure_classifier.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "generation/prompt_generator.hpp"
#include "outcome/outcome_parser.hpp"
#include "refinement/refinement_controller.hpp"
#include "reward/default_reward.hpp"
#include "reward/efficiency_reward.hpp"
#include "sandbox/docker_backend.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "verification/verification.hpp"

namespace py = pybind11;

namespace {

// ── Trampolines: Python subclasses of the generation interfaces ──

class PyCandidateGenerator : public atdd::CandidateGenerator {
public:
    using atdd::CandidateGenerator::CandidateGenerator;

    std::string generate(const atdd::ProblemSpec& spec,
                         const std::string& oracle_source,
                         const std::optional<std::string>& feedback) override {
        PYBIND11_OVERRIDE_PURE(std::string, atdd::CandidateGenerator, generate,
                               spec, oracle_source, feedback);
    }
};

class PyTextGenerator : public atdd::TextGenerator {
public:
    using atdd::TextGenerator::TextGenerator;

    std::optional<std::string> generate(const std::string& prompt) override {
        PYBIND11_OVERRIDE_PURE(std::optional<std::string>, atdd::TextGenerator, generate, prompt);
    }

    std::string name() const override {
        PYBIND11_OVERRIDE_PURE(std::string, atdd::TextGenerator, name);
    }
};

} // namespace

PYBIND11_MODULE(atdd_bindings, m) {
    m.doc() = "atdd C++ Core Bindings";

    // ── Errors ──
    py::register_exception<atdd::InfrastructureError>(m, "InfrastructureError", PyExc_RuntimeError);
    py::register_exception<atdd::GenerationError>(m, "GenerationError", PyExc_RuntimeError);
    py::register_exception<atdd::ConfigError>(m, "ConfigError", PyExc_ValueError);

    // ── Outcome ──
    py::class_<atdd::RawExecution>(m, "RawExecution")
        .def(py::init<>())
        .def_readwrite("stdout", &atdd::RawExecution::stdout_text)
        .def_readwrite("stderr", &atdd::RawExecution::stderr_text)
        .def_readwrite("exit_code", &atdd::RawExecution::exit_code)
        .def_readwrite("timed_out", &atdd::RawExecution::timed_out)
        .def_readwrite("cancelled", &atdd::RawExecution::cancelled)
        .def_readwrite("duration_seconds", &atdd::RawExecution::duration_seconds);

    py::class_<atdd::FailureRecord>(m, "FailureRecord")
        .def(py::init<>())
        .def_readwrite("test_name", &atdd::FailureRecord::test_name)
        .def_readwrite("message", &atdd::FailureRecord::message);

    py::class_<atdd::TestOutcome>(m, "TestOutcome")
        .def(py::init<>())
        .def_readonly("passed", &atdd::TestOutcome::passed)
        .def_readonly("failed", &atdd::TestOutcome::failed)
        .def_readonly("errored", &atdd::TestOutcome::errored)
        .def_readonly("skipped", &atdd::TestOutcome::skipped)
        .def_readonly("total", &atdd::TestOutcome::total)
        .def_readonly("duration_seconds", &atdd::TestOutcome::duration_seconds)
        .def_readonly("failures", &atdd::TestOutcome::failures)
        .def_readonly("stdout", &atdd::TestOutcome::stdout_text)
        .def_readonly("stderr", &atdd::TestOutcome::stderr_text)
        .def_readonly("exit_code", &atdd::TestOutcome::exit_code)
        .def_readonly("timed_out", &atdd::TestOutcome::timed_out)
        .def("pass_rate", &atdd::TestOutcome::passRate)
        .def("all_passed", &atdd::TestOutcome::allPassed);

    py::class_<atdd::OutcomeParserConfig>(m, "OutcomeParserConfig")
        .def(py::init<>())
        .def_readwrite("failure_window_chars", &atdd::OutcomeParserConfig::failure_window_chars)
        .def_readwrite("max_message_chars", &atdd::OutcomeParserConfig::max_message_chars)
        .def_readwrite("max_message_lines", &atdd::OutcomeParserConfig::max_message_lines);

    py::class_<atdd::OutcomeParser>(m, "OutcomeParser")
        .def(py::init([](atdd::OutcomeParserConfig config) {
                 return atdd::OutcomeParser(config);
             }),
             py::arg("config") = atdd::OutcomeParserConfig{})
        .def("parse", &atdd::OutcomeParser::parse);

    // ── Analysis ──
    py::enum_<atdd::ErrorKind>(m, "ErrorKind")
        .value("ASSERTION", atdd::ErrorKind::Assertion)
        .value("TYPE", atdd::ErrorKind::Type)
        .value("VALUE", atdd::ErrorKind::Value)
        .value("ATTRIBUTE", atdd::ErrorKind::Attribute)
        .value("INDEX", atdd::ErrorKind::Index)
        .value("KEY", atdd::ErrorKind::Key)
        .value("ZERO_DIVISION", atdd::ErrorKind::ZeroDivision)
        .value("NAME", atdd::ErrorKind::Name)
        .value("SYNTAX", atdd::ErrorKind::Syntax)
        .value("IMPORT_MISSING", atdd::ErrorKind::ImportMissing)
        .value("TIMEOUT", atdd::ErrorKind::Timeout)
        .value("LOGIC_ERROR", atdd::ErrorKind::LogicError)
        .value("PARTIAL_FAILURE", atdd::ErrorKind::PartialFailure)
        .value("UNKNOWN", atdd::ErrorKind::Unknown);
    m.def("error_kind_name", &atdd::errorKindName);

    py::class_<atdd::FailureAnalysis>(m, "FailureAnalysis")
        .def(py::init<>())
        .def_readonly("error_kind", &atdd::FailureAnalysis::error_kind)
        .def_readonly("failing_tests", &atdd::FailureAnalysis::failing_tests)
        .def_readonly("error_messages", &atdd::FailureAnalysis::error_messages)
        .def_readonly("root_cause", &atdd::FailureAnalysis::root_cause)
        .def_readonly("suggested_fixes", &atdd::FailureAnalysis::suggested_fixes)
        .def("feedback", &atdd::FailureAnalysis::feedback, py::arg("max_items") = 10);

    py::class_<atdd::ClassifierConfig>(m, "ClassifierConfig")
        .def(py::init<>())
        .def_readwrite("max_error_messages", &atdd::ClassifierConfig::max_error_messages);

    py::class_<atdd::FailureClassifier>(m, "FailureClassifier")
        .def(py::init([](atdd::ClassifierConfig config) {
                 return atdd::FailureClassifier(config);
             }),
             py::arg("config") = atdd::ClassifierConfig{})
        .def("classify", &atdd::FailureClassifier::classify,
             py::arg("outcome"), py::arg("candidate_source") = std::nullopt);

    // ── Verification ──
    py::class_<atdd::SyntaxReport>(m, "SyntaxReport")
        .def_readonly("valid", &atdd::SyntaxReport::valid)
        .def_readonly("line", &atdd::SyntaxReport::line)
        .def_readonly("message", &atdd::SyntaxReport::message);

    py::class_<atdd::SyntaxChecker>(m, "SyntaxChecker")
        .def(py::init<>())
        .def("check", &atdd::SyntaxChecker::check)
        .def("repair", &atdd::SyntaxChecker::repair);

    py::class_<atdd::SourceProfile>(m, "SourceProfile")
        .def_readonly("conclusive", &atdd::SourceProfile::conclusive)
        .def_readonly("idioms", &atdd::SourceProfile::idioms)
        .def_readonly("smells", &atdd::SourceProfile::smells)
        .def_readonly("documented_definitions", &atdd::SourceProfile::documented_definitions)
        .def_readonly("max_loop_depth", &atdd::SourceProfile::max_loop_depth)
        .def_readonly("halving", &atdd::SourceProfile::halving);

    py::class_<atdd::QualityMetrics>(m, "QualityMetrics")
        .def(py::init<>())
        .def_readonly("complexity", &atdd::QualityMetrics::complexity)
        .def_readonly("lint_error_count", &atdd::QualityMetrics::lint_error_count)
        .def_readonly("security_issue_count", &atdd::QualityMetrics::security_issue_count)
        .def_readonly("has_syntax_error", &atdd::QualityMetrics::has_syntax_error)
        .def_readonly("line_count", &atdd::QualityMetrics::line_count)
        .def_readonly("profile", &atdd::QualityMetrics::profile)
        .def("complexity_class", [](const atdd::QualityMetrics& q) {
            return atdd::EfficiencyReward::complexityClass(q.profile);
        });

    py::class_<atdd::StaticAnalyzer>(m, "StaticAnalyzer")
        .def(py::init<>())
        .def("analyze", &atdd::StaticAnalyzer::analyze);

    // ── Reward ──
    py::class_<atdd::DimensionScore>(m, "DimensionScore")
        .def_readonly("reward", &atdd::DimensionScore::reward)
        .def_readonly("max_reward", &atdd::DimensionScore::max_reward)
        .def_readonly("metrics", &atdd::DimensionScore::metrics)
        .def_readonly("tags", &atdd::DimensionScore::tags)
        .def_readonly("note", &atdd::DimensionScore::note);

    py::class_<atdd::RewardBreakdown>(m, "RewardBreakdown")
        .def_readonly("dimensions", &atdd::RewardBreakdown::dimensions)
        .def_readonly("penalties", &atdd::RewardBreakdown::penalties)
        .def_readonly("total", &atdd::RewardBreakdown::total);

    py::class_<atdd::RewardWeights>(m, "RewardWeights")
        .def(py::init<>())
        .def_readwrite("test_passing_max", &atdd::RewardWeights::test_passing_max)
        .def_readwrite("partial_correctness_max", &atdd::RewardWeights::partial_correctness_max)
        .def_readwrite("code_quality_max", &atdd::RewardWeights::code_quality_max)
        .def_readwrite("efficiency_max", &atdd::RewardWeights::efficiency_max)
        .def_readwrite("improvement_scale", &atdd::RewardWeights::improvement_scale)
        .def_readwrite("convergence_bonus", &atdd::RewardWeights::convergence_bonus)
        .def_readwrite("timeout_penalty", &atdd::RewardWeights::timeout_penalty)
        .def_readwrite("error_penalty", &atdd::RewardWeights::error_penalty)
        .def_readwrite("syntax_penalty", &atdd::RewardWeights::syntax_penalty);

    py::class_<atdd::RewardCalculator>(m, "RewardCalculator")
        .def("score", &atdd::RewardCalculator::score,
             py::arg("outcome"), py::arg("quality"), py::arg("execution_seconds"),
             py::arg("previous_pass_rate") = std::nullopt)
        .def("dimension_count", &atdd::RewardCalculator::dimensionCount);

    m.def("make_default_reward_calculator", &atdd::makeDefaultRewardCalculator,
          py::arg("weights") = atdd::RewardWeights{});

    // ── Sandbox ──
    py::class_<atdd::SandboxConfig>(m, "SandboxConfig")
        .def(py::init<>())
        .def_readwrite("docker_image", &atdd::SandboxConfig::docker_image)
        .def_readwrite("docker_binary", &atdd::SandboxConfig::docker_binary)
        .def_readwrite("memory_limit", &atdd::SandboxConfig::memory_limit)
        .def_readwrite("cpu_quota", &atdd::SandboxConfig::cpu_quota)
        .def_readwrite("cpu_period", &atdd::SandboxConfig::cpu_period)
        .def_readwrite("pids_limit", &atdd::SandboxConfig::pids_limit)
        .def_readwrite("execution_timeout", &atdd::SandboxConfig::execution_timeout);

    py::class_<atdd::CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel", &atdd::CancellationToken::cancel)
        .def("is_cancelled", &atdd::CancellationToken::isCancelled)
        .def("reset", &atdd::CancellationToken::reset);

    py::class_<atdd::SandboxEngine>(m, "SandboxEngine")
        .def("initialize", &atdd::SandboxEngine::initialize,
             py::call_guard<py::gil_scoped_release>())
        .def("execute", &atdd::SandboxEngine::execute,
             py::arg("candidate_source"), py::arg("oracle_source"),
             py::arg("timeout_seconds") = 0.0, py::arg("cancel") = nullptr,
             py::call_guard<py::gil_scoped_release>());

    m.def("make_docker_sandbox",
          [](const atdd::SandboxConfig& config) { return atdd::makeDockerSandbox(config); },
          py::arg("config") = atdd::SandboxConfig{});

    // ── Generation ──
    py::class_<atdd::ParameterSpec>(m, "ParameterSpec")
        .def(py::init<>())
        .def_readwrite("name", &atdd::ParameterSpec::name)
        .def_readwrite("type_hint", &atdd::ParameterSpec::type_hint)
        .def_readwrite("description", &atdd::ParameterSpec::description);

    py::class_<atdd::ExampleSpec>(m, "ExampleSpec")
        .def(py::init<>())
        .def_readwrite("input", &atdd::ExampleSpec::input)
        .def_readwrite("output", &atdd::ExampleSpec::output);

    py::class_<atdd::ProblemSpec>(m, "ProblemSpec")
        .def(py::init<>())
        .def_readwrite("function_name", &atdd::ProblemSpec::function_name)
        .def_readwrite("description", &atdd::ProblemSpec::description)
        .def_readwrite("parameters", &atdd::ProblemSpec::parameters)
        .def_readwrite("return_type", &atdd::ProblemSpec::return_type)
        .def_readwrite("constraints", &atdd::ProblemSpec::constraints)
        .def_readwrite("examples", &atdd::ProblemSpec::examples)
        .def_readwrite("edge_cases", &atdd::ProblemSpec::edge_cases);

    py::class_<atdd::CandidateGenerator, PyCandidateGenerator>(m, "CandidateGenerator")
        .def(py::init<>())
        .def("generate", &atdd::CandidateGenerator::generate);

    py::class_<atdd::TextGenerator, PyTextGenerator, std::shared_ptr<atdd::TextGenerator>>(m, "TextGenerator")
        .def(py::init<>())
        .def("generate", &atdd::TextGenerator::generate)
        .def("name", &atdd::TextGenerator::name);

    py::class_<atdd::PromptCandidateGenerator, atdd::CandidateGenerator>(m, "PromptCandidateGenerator")
        .def(py::init([](std::shared_ptr<atdd::TextGenerator> backend) {
                 return std::make_unique<atdd::PromptCandidateGenerator>(std::move(backend));
             }),
             py::keep_alive<1, 2>())
        .def("build_prompt", &atdd::PromptCandidateGenerator::buildPrompt)
        .def_static("extract_code", &atdd::PromptCandidateGenerator::extractCode);

    // ── Refinement ──
    py::enum_<atdd::Phase>(m, "Phase")
        .value("INIT", atdd::Phase::Init)
        .value("ITERATING", atdd::Phase::Iterating)
        .value("CONVERGED", atdd::Phase::Converged)
        .value("STAGNATED", atdd::Phase::Stagnated)
        .value("BUDGET_EXHAUSTED", atdd::Phase::BudgetExhausted)
        .value("FAILED", atdd::Phase::Failed)
        .value("CANCELLED", atdd::Phase::Cancelled);

    py::enum_<atdd::SyntaxFailurePolicy>(m, "SyntaxFailurePolicy")
        .value("HALT", atdd::SyntaxFailurePolicy::Halt)
        .value("KEEP_PREVIOUS", atdd::SyntaxFailurePolicy::KeepPrevious);

    py::class_<atdd::RefinementConfig>(m, "RefinementConfig")
        .def(py::init<>())
        .def_readwrite("max_iterations", &atdd::RefinementConfig::max_iterations)
        .def_readwrite("min_improvement", &atdd::RefinementConfig::min_improvement)
        .def_readwrite("patience", &atdd::RefinementConfig::patience)
        .def_readwrite("execution_timeout", &atdd::RefinementConfig::execution_timeout)
        .def_readwrite("syntax_retry_limit", &atdd::RefinementConfig::syntax_retry_limit)
        .def_readwrite("syntax_failure_policy", &atdd::RefinementConfig::syntax_failure_policy)
        .def_readwrite("run_budget_seconds", &atdd::RefinementConfig::run_budget_seconds);

    py::class_<atdd::IterationRecord>(m, "IterationRecord")
        .def_readonly("index", &atdd::IterationRecord::index)
        .def_readonly("candidate_hash", &atdd::IterationRecord::candidate_hash)
        .def_readonly("outcome", &atdd::IterationRecord::outcome)
        .def_readonly("analysis", &atdd::IterationRecord::analysis)
        .def_readonly("quality", &atdd::IterationRecord::quality)
        .def_readonly("reward", &atdd::IterationRecord::reward)
        .def_readonly("duration_seconds", &atdd::IterationRecord::duration_seconds);

    py::class_<atdd::RefinementState>(m, "RefinementState")
        .def_readonly("iterations", &atdd::RefinementState::iterations)
        .def_readonly("best_index", &atdd::RefinementState::best_index)
        .def_readonly("best_pass_rate", &atdd::RefinementState::best_pass_rate)
        .def_readonly("best_reward", &atdd::RefinementState::best_reward)
        .def_readonly("no_improvement_streak", &atdd::RefinementState::no_improvement_streak)
        .def_readonly("converged", &atdd::RefinementState::converged)
        .def_readonly("phase", &atdd::RefinementState::phase)
        .def_readonly("stop_reason", &atdd::RefinementState::stop_reason)
        .def_readonly("generation_errors", &atdd::RefinementState::generation_errors)
        .def_readonly("syntax_rejections", &atdd::RefinementState::syntax_rejections)
        .def("summary", &atdd::RefinementState::summary);

    py::class_<atdd::RefinementResult>(m, "RefinementResult")
        .def_readonly("best_code", &atdd::RefinementResult::best_code)
        .def_readonly("state", &atdd::RefinementResult::state)
        .def("has_result", &atdd::RefinementResult::hasResult);

    py::class_<atdd::RefinementController>(m, "RefinementController")
        .def(py::init([](atdd::SandboxEngine& sandbox, atdd::CandidateGenerator& generator,
                         atdd::RefinementConfig config) {
                 return std::make_unique<atdd::RefinementController>(sandbox, generator, config);
             }),
             py::arg("sandbox"), py::arg("generator"), py::arg("config") = atdd::RefinementConfig{},
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("set_reward_weights", &atdd::RefinementController::setRewardWeights)
        .def("run", &atdd::RefinementController::run,
             py::arg("spec"), py::arg("oracle_source"),
             py::arg("initial_candidate") = std::nullopt, py::arg("cancel") = nullptr,
             py::call_guard<py::gil_scoped_release>());

    // ── Configuration ──
    py::class_<atdd::LoggingConfig>(m, "LoggingConfig")
        .def(py::init<>())
        .def_readwrite("level", &atdd::LoggingConfig::level)
        .def_readwrite("file_path", &atdd::LoggingConfig::file_path);

    py::class_<atdd::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("sandbox", &atdd::EngineConfig::sandbox)
        .def_readwrite("parser", &atdd::EngineConfig::parser)
        .def_readwrite("classifier", &atdd::EngineConfig::classifier)
        .def_readwrite("reward", &atdd::EngineConfig::reward)
        .def_readwrite("refinement", &atdd::EngineConfig::refinement)
        .def_readwrite("logging", &atdd::EngineConfig::logging);

    m.def("load_config", &atdd::loadConfig);
    m.def("parse_config", &atdd::parseConfig);
    m.def("apply_environment_overrides", &atdd::applyEnvironmentOverrides);
    m.def("validate", &atdd::validate);
}
