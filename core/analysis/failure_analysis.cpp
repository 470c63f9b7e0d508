#include "analysis/failure_analysis.hpp"
#include <sstream>

namespace atdd {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Assertion:      return "assertion";
        case ErrorKind::Type:           return "type";
        case ErrorKind::Value:          return "value";
        case ErrorKind::Attribute:      return "attribute";
        case ErrorKind::Index:          return "index";
        case ErrorKind::Key:            return "key";
        case ErrorKind::ZeroDivision:   return "zeroDivision";
        case ErrorKind::Name:           return "name";
        case ErrorKind::Syntax:         return "syntax";
        case ErrorKind::ImportMissing:  return "importMissing";
        case ErrorKind::Timeout:        return "timeout";
        case ErrorKind::LogicError:     return "logicError";
        case ErrorKind::PartialFailure: return "partialFailure";
        case ErrorKind::Unknown:        return "unknown";
    }
    return "unknown";
}

std::string rootCauseFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:        return "Function runs too long or contains infinite loop";
        case ErrorKind::Assertion:      return "Function returns incorrect values";
        case ErrorKind::Type:           return "Function called with wrong type or returns wrong type";
        case ErrorKind::Value:          return "Function receives or produces invalid values";
        case ErrorKind::Attribute:      return "Accessing non-existent attribute or method";
        case ErrorKind::Index:          return "List/array index out of bounds";
        case ErrorKind::Key:            return "Dictionary key not found";
        case ErrorKind::ZeroDivision:   return "Division by zero in calculation";
        case ErrorKind::Name:           return "Variable or function not defined";
        case ErrorKind::Syntax:         return "Code has syntax errors";
        case ErrorKind::ImportMissing:  return "Missing or incorrect imports";
        case ErrorKind::LogicError:     return "Core logic is incorrect";
        case ErrorKind::PartialFailure: return "Some edge cases not handled correctly";
        case ErrorKind::Unknown:        break;
    }
    return "Unknown error in implementation";
}

std::string FailureAnalysis::feedback(size_t max_items) const {
    std::ostringstream out;
    out << "Error Type: " << errorKindName(error_kind) << "\n";
    out << "\nRoot Cause: " << root_cause << "\n";

    if (!failing_tests.empty()) {
        out << "\nFailing Tests (" << failing_tests.size() << "):\n";
        for (size_t i = 0; i < failing_tests.size() && i < max_items; i++) {
            out << "  - " << failing_tests[i] << "\n";
        }
    }

    if (!error_messages.empty()) {
        out << "\nError Messages:\n";
        for (size_t i = 0; i < error_messages.size() && i < max_items; i++) {
            out << "  " << error_messages[i] << "\n";
        }
    }

    if (!suggested_fixes.empty()) {
        out << "\nSuggested Fixes:\n";
        for (const auto& fix : suggested_fixes) {
            out << "  - " << fix << "\n";
        }
    }

    std::string text = out.str();
    if (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

} // namespace atdd
