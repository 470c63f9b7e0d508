#pragma once

#include "generation/candidate_generator.hpp"
#include "logging/logger.hpp"
#include <memory>
#include <optional>
#include <string>

namespace atdd {

struct PromptGeneratorConfig {
    size_t max_examples = 3;
    size_t max_edge_cases = 3;
    size_t max_oracle_chars = 4000;   // oracle excerpt included in refinement prompts
};

/// Prompt Candidate Generator: turns a TextGenerator into a
/// CandidateGenerator. Builds the prompt, then cleans the completion down
/// to importable source.
class PromptCandidateGenerator : public CandidateGenerator {
public:
    PromptCandidateGenerator(std::shared_ptr<TextGenerator> backend,
                             PromptGeneratorConfig config = {},
                             LoggerPtr logger = nullptr);

    std::string generate(const ProblemSpec& spec,
                         const std::string& oracle_source,
                         const std::optional<std::string>& feedback) override;

    /// Initial prompt when `feedback` is absent, refinement prompt otherwise.
    std::string buildPrompt(const ProblemSpec& spec,
                            const std::string& oracle_source,
                            const std::optional<std::string>& feedback) const;

    /// Code inside the first ```python fence, else the first generic fence,
    /// with any prose before the first definition or import removed.
    static std::string extractCode(const std::string& response);

    /// Prepends `from typing import ...` for hints used without an import.
    static std::string ensureTypingImports(const std::string& code);

    /// Drops lines importing blocked modules or calling eval/exec/__import__.
    static std::string removeDangerousLines(const std::string& code);

private:
    std::shared_ptr<TextGenerator> backend_;
    PromptGeneratorConfig config_;
    LoggerPtr logger_;
};

} // namespace atdd
