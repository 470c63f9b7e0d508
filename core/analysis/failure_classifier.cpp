#include "analysis/failure_classifier.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <unordered_set>

namespace atdd {

namespace {

const char* const kDidNotRaise = "DID NOT RAISE";

struct KindPattern {
    ErrorKind kind;
    const char* pattern;
};

// Order matters: the first pattern found in the output decides the kind.
const KindPattern kKindTable[] = {
    {ErrorKind::Assertion,     "AssertionError"},
    {ErrorKind::Type,          "TypeError"},
    {ErrorKind::Value,         "ValueError"},
    {ErrorKind::Attribute,     "AttributeError"},
    {ErrorKind::Index,         "IndexError"},
    {ErrorKind::Key,           "KeyError"},
    {ErrorKind::ZeroDivision,  "ZeroDivisionError"},
    {ErrorKind::Name,          "NameError"},
    {ErrorKind::Syntax,        "SyntaxError"},
    {ErrorKind::ImportMissing, "ImportError|ModuleNotFoundError"},
};

const std::vector<std::unique_ptr<RE2>>& compiledKindTable() {
    static const std::vector<std::unique_ptr<RE2>> table = [] {
        std::vector<std::unique_ptr<RE2>> out;
        RE2::Options options;
        options.set_case_sensitive(false);
        for (const auto& entry : kKindTable) {
            out.push_back(std::make_unique<RE2>(entry.pattern, options));
        }
        return out;
    }();
    return table;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::vector<std::string> templateFixes(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:
            return {"Add base case to recursive functions",
                    "Replace infinite loops with bounded iterations",
                    "Optimize algorithm complexity",
                    "Check for infinite recursion"};
        case ErrorKind::Assertion:
            return {"Review function logic and return values",
                    "Check calculations and formulas",
                    "Verify edge case handling",
                    "Test with example inputs manually"};
        case ErrorKind::Type:
            return {"Add type validation for inputs",
                    "Ensure return type matches specification",
                    "Check type conversions (int, str, list, etc.)",
                    "Add type hints to function signature"};
        case ErrorKind::Value:
            return {"Validate input ranges and formats before using them",
                    "Check conversions such as int() and float() on malformed input",
                    "Raise ValueError explicitly for invalid arguments"};
        case ErrorKind::Attribute:
            return {"Check method and attribute names for typos",
                    "Verify the object type before accessing attributes",
                    "Handle None results before attribute access"};
        case ErrorKind::Index:
            return {"Add bounds checking before list access",
                    "Verify list is not empty before indexing",
                    "Use slicing or length checks for safe access",
                    "Check loop ranges and indices"};
        case ErrorKind::Key:
            return {"Use dict.get() with default value",
                    "Check if key exists before access",
                    "Verify dictionary structure",
                    "Handle missing keys gracefully"};
        case ErrorKind::ZeroDivision:
            return {"Add check for zero before division",
                    "Handle edge case where divisor is zero",
                    "Return special value for undefined division"};
        case ErrorKind::Name:
            return {"Define all variables before use",
                    "Check variable names for typos",
                    "Import required modules",
                    "Verify function and variable scope"};
        case ErrorKind::Syntax:
            return {"Fix syntax errors (colons, parentheses, indentation)",
                    "Check for unclosed brackets or quotes",
                    "Verify proper indentation",
                    "Ensure valid Python syntax"};
        case ErrorKind::ImportMissing:
            return {"Ensure the function name matches exactly what's imported in tests",
                    "Check the function is defined in impl.py",
                    "Verify no typos in function name",
                    "Make sure the function name matches the specification"};
        case ErrorKind::LogicError:
            return {"Re-derive the algorithm from the specification",
                    "Trace the simplest failing input by hand"};
        case ErrorKind::PartialFailure:
        case ErrorKind::Unknown:
            break;
    }
    return {};
}

void appendUnique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) out.push_back(value);
}

} // namespace

std::vector<std::string> definedNames(const std::string& source) {
    static const RE2 def_re("(?m)^[ \\t]*(?:async[ \\t]+)?(?:def|class)[ \\t]+(\\w+)");
    std::vector<std::string> names;
    re2::StringPiece input(source);
    std::string name;
    while (RE2::FindAndConsume(&input, def_re, &name)) {
        appendUnique(names, name);
    }
    return names;
}

FailureClassifier::FailureClassifier(ClassifierConfig config, LoggerPtr logger)
    : config_(config), logger_(orNull(std::move(logger))) {}

FailureAnalysis FailureClassifier::classify(const TestOutcome& outcome,
                                            const std::optional<std::string>& candidate_source) const {
    logger_->info("Analyzing test failures failed={} errors={}", outcome.failed, outcome.errored);

    if (!outcome.stderr_text.empty() && outcome.failed == 0 && outcome.passed == 0) {
        logger_->warn("Test collection error detected stderr_preview={}",
                      outcome.stderr_text.substr(0, 500));
    }

    FailureAnalysis analysis;
    analysis.error_kind = classifyKind(outcome);
    for (const auto& failure : outcome.failures) {
        analysis.failing_tests.push_back(failure.test_name.empty() ? "unknown" : failure.test_name);
    }
    analysis.error_messages = extractErrorMessages(outcome);
    analysis.root_cause = rootCauseFor(analysis.error_kind);
    analysis.suggested_fixes = suggestFixes(analysis.error_kind, outcome, candidate_source);

    logger_->info("Analysis completed error_type={} failing_count={}",
                  errorKindName(analysis.error_kind), analysis.failing_tests.size());
    return analysis;
}

ErrorKind FailureClassifier::classifyKind(const TestOutcome& outcome) const {
    if (outcome.timed_out) return ErrorKind::Timeout;

    const std::string output = outcome.combinedOutput();
    if (contains(output, kDidNotRaise)) return ErrorKind::PartialFailure;

    const auto& table = compiledKindTable();
    for (size_t i = 0; i < table.size(); i++) {
        if (RE2::PartialMatch(output, *table[i])) return kKindTable[i].kind;
    }

    if (outcome.failed > 0 && outcome.passed == 0) return ErrorKind::LogicError;
    if (outcome.failed > 0) return ErrorKind::PartialFailure;
    return ErrorKind::Unknown;
}

std::vector<std::string> FailureClassifier::extractErrorMessages(const TestOutcome& outcome) const {
    std::vector<std::string> messages;

    // Missing validation leads, from either stream.
    for (const std::string* stream : {&outcome.stdout_text, &outcome.stderr_text}) {
        if (!contains(*stream, kDidNotRaise)) continue;
        for (const auto& line : splitLines(*stream)) {
            if (contains(line, kDidNotRaise)) {
                appendUnique(messages, "MISSING VALIDATION: " + trim(line).substr(0, config_.stderr_line_chars));
            }
        }
    }

    for (const auto& failure : outcome.failures) {
        if (failure.message.empty()) continue;
        std::string first = failure.message.substr(0, failure.message.find('\n'));
        appendUnique(messages, first.substr(0, config_.failure_message_chars));
    }

    const std::string& err = outcome.stderr_text;
    if (!err.empty()) {
        bool syntax = contains(err, "SyntaxError");
        bool import = contains(err, "ImportError") || contains(err, "ModuleNotFoundError");
        for (const auto& line : splitLines(err)) {
            bool keep = false;
            size_t limit = config_.stderr_line_chars;
            if (syntax) {
                keep = contains(line, "SyntaxError") || contains(line, "^") || contains(line, "File");
            } else if (import) {
                keep = contains(line, "ImportError") || contains(line, "cannot import") ||
                       contains(line, "from impl import");
            } else {
                keep = contains(line, "Error") || contains(line, "ERROR") || contains(line, "Exception");
                limit = config_.failure_message_chars;
            }
            if (keep) {
                std::string cleaned = trim(line).substr(0, limit);
                if (!cleaned.empty()) appendUnique(messages, cleaned);
            }
        }
    }

    if (messages.size() > config_.max_error_messages) {
        messages.resize(config_.max_error_messages);
    }
    return messages;
}

std::vector<std::string> FailureClassifier::suggestFixes(
        ErrorKind kind,
        const TestOutcome& outcome,
        const std::optional<std::string>& candidate_source) const {
    std::vector<std::string> suggestions = templateFixes(kind);

    std::vector<std::string> names;
    for (const auto& failure : outcome.failures) names.push_back(toLower(failure.test_name));
    auto anyName = [&](const char* fragment) {
        return std::any_of(names.begin(), names.end(),
                           [&](const std::string& n) { return contains(n, fragment); });
    };

    if (anyName("raises")) {
        appendUnique(suggestions, "Add input validation and raise appropriate exceptions (ValueError, TypeError)");
        appendUnique(suggestions, "Check for empty inputs, invalid types, and boundary conditions");
    }
    if (anyName("empty"))    appendUnique(suggestions, "Handle empty input case");
    if (anyName("zero"))     appendUnique(suggestions, "Handle zero value case");
    if (anyName("negative")) appendUnique(suggestions, "Handle negative numbers");
    if (anyName("single"))   appendUnique(suggestions, "Handle single element case");
    if (anyName("large"))    appendUnique(suggestions, "Handle large input values");

    if (candidate_source && (kind == ErrorKind::Name || kind == ErrorKind::Attribute ||
                             kind == ErrorKind::ImportMissing)) {
        auto defined = definedNames(*candidate_source);
        std::string hint = "Candidate currently defines: ";
        if (defined.empty()) {
            hint += "(nothing)";
        } else {
            for (size_t i = 0; i < defined.size(); i++) {
                if (i > 0) hint += ", ";
                hint += defined[i];
            }
        }
        appendUnique(suggestions, hint);
    }

    if (contains(outcome.combinedOutput(), kDidNotRaise)) {
        std::vector<std::string> prioritized = {
            "CRITICAL: Add input validation - tests expect exceptions to be raised for invalid inputs",
            "Use isinstance() to check types and raise TypeError for invalid types",
            "Check input constraints (length, values) and raise ValueError when violated",
        };
        for (const auto& s : suggestions) appendUnique(prioritized, s);
        suggestions = std::move(prioritized);
    }

    if (suggestions.empty()) {
        suggestions.push_back("Review implementation against specification");
        suggestions.push_back("Test with failing test inputs manually");
    }
    return suggestions;
}

} // namespace atdd
