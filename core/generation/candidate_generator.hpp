#pragma once

#include <optional>
#include <string>
#include <vector>

namespace atdd {

// ─── Problem Specification ─────────────────────────────────────
// Structured description of the function a candidate must implement.

struct ParameterSpec {
    std::string name;
    std::string type_hint;
    std::string description;
};

struct ExampleSpec {
    std::string input;
    std::string output;
};

struct ProblemSpec {
    std::string function_name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    std::string return_type;
    std::vector<std::string> constraints;
    std::vector<ExampleSpec> examples;
    std::vector<std::string> edge_cases;
};

// ─── Candidate Generator ───────────────────────────────────────
// Produces candidate source text. The refinement controller depends only
// on this interface.

class CandidateGenerator {
public:
    virtual ~CandidateGenerator() = default;

    /// `feedback` is absent on the first call. Throws GenerationError when
    /// no candidate can be produced.
    virtual std::string generate(const ProblemSpec& spec,
                                 const std::string& oracle_source,
                                 const std::optional<std::string>& feedback) = 0;
};

// ─── Text Generator ────────────────────────────────────────────
// One implementation per text-generation backend.

class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    /// Completion for `prompt`, or nullopt when the backend gave nothing.
    virtual std::optional<std::string> generate(const std::string& prompt) = 0;

    virtual std::string name() const = 0;
};

} // namespace atdd
