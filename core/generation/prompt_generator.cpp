#include "generation/prompt_generator.hpp"
#include "verification/verification.hpp"
#include "common/errors.hpp"

#include <re2/re2.h>
#include <sstream>
#include <vector>

namespace atdd {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines, size_t from = 0) {
    std::string out;
    for (size_t i = from; i < lines.size(); i++) {
        if (i > from) out += '\n';
        out += lines[i];
    }
    return out;
}

/// Text between `open` and the next fence, or nullopt when unclosed/absent.
std::optional<std::string> fenced(const std::string& text, const std::string& open) {
    size_t start = text.find(open);
    if (start == std::string::npos) return std::nullopt;
    start += open.size();
    size_t end = text.find("```", start);
    if (end == std::string::npos) return std::nullopt;
    return trim(text.substr(start, end - start));
}

} // namespace

PromptCandidateGenerator::PromptCandidateGenerator(std::shared_ptr<TextGenerator> backend,
                                                   PromptGeneratorConfig config,
                                                   LoggerPtr logger)
    : backend_(std::move(backend)), config_(config), logger_(orNull(std::move(logger))) {
    if (!backend_) throw GenerationError("prompt generator requires a text generator");
}

std::string PromptCandidateGenerator::buildPrompt(const ProblemSpec& spec,
                                                  const std::string& oracle_source,
                                                  const std::optional<std::string>& feedback) const {
    std::ostringstream prompt;
    const std::string& fn = spec.function_name;

    if (feedback && !feedback->empty()) {
        prompt << "Fix the Python code based on this test failure feedback:\n\n"
               << *feedback << "\n\n"
               << "CRITICAL: The function name MUST be '" << fn << "'\n"
               << "Function Description: " << spec.description << "\n\n"
               << "Parameters:\n";
        for (const auto& param : spec.parameters) {
            prompt << "  - " << param.name << ": " << param.type_hint << "\n";
        }
        prompt << "\nReturn Type: " << spec.return_type << "\n";
        if (!oracle_source.empty()) {
            prompt << "\nThe implementation is imported from impl.py by these tests:\n"
                   << oracle_source.substr(0, config_.max_oracle_chars) << "\n";
        }
        prompt << "\nGenerate ONLY the corrected Python implementation code for the function '" << fn << "'.\n"
               << "DO NOT generate any other function.\n"
               << "Ensure all tests pass.\n"
               << "Use proper type hints and follow PEP 8.\n\n"
               << "Generate the complete function implementation:";
        return prompt.str();
    }

    prompt << "Generate a Python function with the following specification:\n\n"
           << "Function Name: " << fn << "\n"
           << "Description: " << spec.description << "\n\n"
           << "Parameters:\n";
    for (const auto& param : spec.parameters) {
        prompt << "  - " << param.name << ": " << param.type_hint;
        if (!param.description.empty()) prompt << " - " << param.description;
        prompt << "\n";
    }
    prompt << "\nReturn Type: " << spec.return_type << "\n";

    if (!spec.constraints.empty()) {
        prompt << "\nConstraints:\n";
        for (const auto& c : spec.constraints) prompt << "  - " << c << "\n";
    }
    if (!spec.examples.empty()) {
        prompt << "\nExamples:\n";
        for (size_t i = 0; i < spec.examples.size() && i < config_.max_examples; i++) {
            prompt << "  Input: " << spec.examples[i].input
                   << " -> Output: " << spec.examples[i].output << "\n";
        }
    }
    if (!spec.edge_cases.empty()) {
        prompt << "\nEdge Cases to Handle:\n";
        for (size_t i = 0; i < spec.edge_cases.size() && i < config_.max_edge_cases; i++) {
            prompt << "  - " << spec.edge_cases[i] << "\n";
        }
    }

    prompt << "\nRequirements:\n"
           << "- CRITICAL: The function name MUST be exactly '" << fn << "' (not any other name)\n"
           << "- Implement ONLY the function " << fn << "\n"
           << "- Use proper type hints matching the specification above\n"
           << "- Handle edge cases gracefully\n"
           << "- Follow PEP 8 style guide\n"
           << "- Include a comprehensive docstring\n"
           << "- Do NOT include test code or examples\n"
           << "- Do NOT generate any other functions\n"
           << "- Generate complete, working implementation\n\n"
           << "Generate ONLY the Python function '" << fn << "':";
    return prompt.str();
}

std::string PromptCandidateGenerator::extractCode(const std::string& response) {
    std::string code = response;
    if (auto block = fenced(response, "```python")) {
        code = *block;
    } else if (response.find("```python") == std::string::npos) {
        if (auto generic = fenced(response, "```")) code = *generic;
    }

    std::vector<std::string> lines = splitLines(code);
    for (size_t i = 0; i < lines.size(); i++) {
        std::string stripped = trim(lines[i]);
        if (startsWith(stripped, "def ") || startsWith(stripped, "async def ") ||
            startsWith(stripped, "class ") || startsWith(stripped, "import ") ||
            startsWith(stripped, "from ") || startsWith(stripped, "@")) {
            if (i > 0) code = joinLines(lines, i);
            break;
        }
    }

    return trim(ensureTypingImports(code));
}

std::string PromptCandidateGenerator::ensureTypingImports(const std::string& code) {
    if (code.find("from typing import") != std::string::npos ||
        code.find("import typing") != std::string::npos) {
        return code;
    }

    static const RE2 any_hint("\\bAny\\b");
    std::vector<std::string> hints;
    if (RE2::PartialMatch(code, any_hint)) hints.push_back("Any");
    for (const char* generic : {"Callable", "Dict", "List", "Optional", "Set", "Tuple", "Union"}) {
        if (code.find(std::string(generic) + "[") != std::string::npos) hints.push_back(generic);
    }
    if (hints.empty()) return code;

    std::string line = "from typing import ";
    for (size_t i = 0; i < hints.size(); i++) {
        if (i > 0) line += ", ";
        line += hints[i];
    }
    return line + "\n\n" + code;
}

std::string PromptCandidateGenerator::removeDangerousLines(const std::string& code) {
    std::string modules;
    for (const auto& m : blockedModules()) {
        if (!modules.empty()) modules += "|";
        modules += m;
    }
    const RE2 blocked_import("^\\s*(?:import|from)\\s+(?:" + modules + ")\\b");
    static const RE2 dangerous_call(callPattern({"eval", "exec", "__import__"}));

    std::vector<std::string> kept;
    for (const auto& line : splitLines(code)) {
        if (RE2::PartialMatch(line, blocked_import)) continue;
        if (RE2::PartialMatch(line, dangerous_call)) continue;
        kept.push_back(line);
    }
    return joinLines(kept);
}

std::string PromptCandidateGenerator::generate(const ProblemSpec& spec,
                                               const std::string& oracle_source,
                                               const std::optional<std::string>& feedback) {
    const std::string prompt = buildPrompt(spec, oracle_source, feedback);
    logger_->info("Generating code backend={} function={} refinement={}",
                  backend_->name(), spec.function_name, feedback.has_value());

    std::optional<std::string> response;
    try {
        response = backend_->generate(prompt);
    } catch (const GenerationError&) {
        throw;
    } catch (const std::exception& e) {
        throw GenerationError("text generator '" + backend_->name() + "' failed: " + e.what());
    }

    if (!response || trim(*response).empty()) {
        throw GenerationError("text generator '" + backend_->name() + "' returned no response");
    }
    logger_->debug("Raw response response_length={} has_code_block={}",
                   response->size(), response->find("```") != std::string::npos);

    std::string code = removeDangerousLines(extractCode(*response));
    if (trim(code).empty()) {
        throw GenerationError("no code found in response from '" + backend_->name() + "'");
    }
    logger_->info("Code generated code_length={}", code.size());
    return code;
}

} // namespace atdd
