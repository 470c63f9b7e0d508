#include "outcome/outcome_parser.hpp"
#include <re2/re2.h>
#include <sstream>
#include <vector>

namespace atdd {

namespace {

const RE2& passedClause() {
    static const RE2 re("(\\d+) passed");
    return re;
}
const RE2& failedClause() {
    static const RE2 re("(\\d+) failed");
    return re;
}
const RE2& errorClause() {
    static const RE2 re("(\\d+) errors?\\b");
    return re;
}
const RE2& skippedClause() {
    static const RE2 re("(\\d+) skipped");
    return re;
}

// "FAILED tests/test_impl.py::TestSuite::test_name" -> test_name
const RE2& failureMarker() {
    static const RE2 re("FAILED[ \\t]+(?:[\\w./\\[\\]-]+::)*(test_\\w+)");
    return re;
}

const char* const kMessageKeywords[] = {
    "AssertionError", "Error:", "Expected", "assert", "FAILED"
};

bool hasAnyClause(const std::string& line) {
    return RE2::PartialMatch(line, passedClause()) ||
           RE2::PartialMatch(line, failedClause()) ||
           RE2::PartialMatch(line, errorClause()) ||
           RE2::PartialMatch(line, skippedClause());
}

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

OutcomeParser::OutcomeParser(OutcomeParserConfig config, LoggerPtr logger)
    : config_(config), logger_(orNull(std::move(logger))) {}

TestOutcome OutcomeParser::parse(const RawExecution& raw) const {
    TestOutcome outcome;
    outcome.stdout_text = raw.stdout_text;
    outcome.stderr_text = raw.stderr_text;
    outcome.exit_code = raw.exit_code;
    outcome.timed_out = raw.timed_out;
    outcome.duration_seconds = raw.duration_seconds;

    const std::string output = raw.stdout_text + raw.stderr_text;

    bool explicit_passed = parseSummary(output, outcome);
    outcome.total = outcome.passed + outcome.failed + outcome.errored + outcome.skipped;

    parseFailures(output, outcome);

    if (outcome.failed > 0 && outcome.failures.empty()) {
        logger_->warn("Failed to extract failure details failed_count={} output_preview={}",
                      outcome.failed, output.substr(0, 1000));
    }

    // Terse runs may print per-test markers without a summary line.
    if (raw.exit_code == 0 && outcome.total == 0 && !explicit_passed) {
        int markers = static_cast<int>(countOccurrences(output, "PASSED"));
        if (markers > 0) {
            outcome.passed = markers;
            outcome.total = markers;
        }
    }

    return outcome;
}

bool OutcomeParser::parseSummary(const std::string& output, TestOutcome& outcome) const {
    std::string summary;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (hasAnyClause(line)) summary = line;  // pytest prints the summary last
    }
    if (summary.empty()) return false;

    int value = 0;
    bool explicit_passed = false;
    if (RE2::PartialMatch(summary, passedClause(), &value)) {
        outcome.passed = value;
        explicit_passed = true;
    }
    if (RE2::PartialMatch(summary, failedClause(), &value)) outcome.failed = value;
    if (RE2::PartialMatch(summary, errorClause(), &value)) outcome.errored = value;
    if (RE2::PartialMatch(summary, skippedClause(), &value)) outcome.skipped = value;
    return explicit_passed;
}

void OutcomeParser::parseFailures(const std::string& output, TestOutcome& outcome) const {
    re2::StringPiece text(output);
    re2::StringPiece groups[2];
    size_t pos = 0;

    while (pos < output.size() &&
           failureMarker().Match(text, pos, output.size(), RE2::UNANCHORED, groups, 2)) {
        size_t match_end = static_cast<size_t>(groups[0].data() - output.data()) + groups[0].size();

        FailureRecord record;
        record.test_name = std::string(groups[1].data(), groups[1].size());
        record.message = extractMessage(output.substr(match_end, config_.failure_window_chars));
        outcome.failures.push_back(std::move(record));

        pos = match_end > pos ? match_end : pos + 1;
    }
}

std::string OutcomeParser::extractMessage(const std::string& window) const {
    std::vector<std::string> error_lines;
    std::istringstream lines(window);
    std::string line;
    while (std::getline(lines, line)) {
        bool keyword = false;
        for (const char* k : kMessageKeywords) {
            if (line.find(k) != std::string::npos) {
                keyword = true;
                break;
            }
        }
        if (!keyword) continue;
        error_lines.push_back(trim(line));
        if (static_cast<int>(error_lines.size()) >= config_.max_message_lines) break;
    }

    if (error_lines.empty()) return "Test failed";

    std::string message;
    for (size_t i = 0; i < error_lines.size(); i++) {
        if (i > 0) message += ' ';
        message += error_lines[i];
    }
    if (message.size() > config_.max_message_chars) {
        message.resize(config_.max_message_chars);
    }
    return message;
}

} // namespace atdd
