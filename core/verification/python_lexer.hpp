#pragma once

#include <optional>
#include <string>
#include <vector>

namespace atdd {

// ─── Logical Line ──────────────────────────────────────────────
// One Python logical line. Physical lines joined by open brackets or
// backslash continuation become a single entry.

struct LogicalLine {
    int line = 0;                 // 1-based physical line where it starts
    int end_line = 0;             // last physical line it spans
    int indent = 0;               // columns, tabs expand to multiples of 8
    bool tab_indent = false;
    std::string text;             // comments removed, string contents masked
    std::vector<std::string> strings;  // contents of masked string literals
    bool has_fstring = false;

    /// True when the line consists of a single string literal (docstring shape).
    bool isStringOnly() const;

    /// First identifier-like word of `text` ("def", "if", "x", ...).
    std::string firstWord() const;
};

struct LexError {
    int line = 0;
    std::string message;
};

struct LexResult {
    std::vector<LogicalLine> lines;
    std::optional<LexError> error;  // lexing stops at the first error
    bool uses_fstrings = false;
};

/// Python Lexer: just enough tokenization to reason about structure
/// without a Python interpreter. String literals are reduced to their
/// quotes (`"abc"` becomes `""`) so that brackets, colons and keywords
/// inside them never confuse later passes.
class PythonLexer {
public:
    LexResult lex(const std::string& source) const;
};

} // namespace atdd
