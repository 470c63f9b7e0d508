#include "verification/verification.hpp"
#include <re2/re2.h>
#include <cctype>
#include <sstream>

namespace atdd {

namespace {

const char* const kBlockKeywords[] = {
    "if", "elif", "else", "for", "while", "def", "class",
    "try", "except", "finally", "with",
};

bool isBlockKeyword(const std::string& word) {
    for (const char* keyword : kBlockKeywords) {
        if (word == keyword) return true;
    }
    return false;
}

std::string leadingWord(const std::string& text, size_t from = 0) {
    size_t i = from;
    while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_')) i++;
    return text.substr(from, i - from);
}

size_t blockColon(const std::string& text);

/// `match` and `case` open a block only as statement headers: a subject
/// follows the keyword and the line has a top-level colon. `match = 1` and
/// `case: int = 0` stay plain statements.
bool isSoftHeader(const std::string& text, const std::string& word) {
    if (word != "match" && word != "case") return false;
    if (text.size() <= word.size()) return false;
    char after = text[word.size()];
    if (after != ' ' && after != '\t' && after != '(' && after != '[' && after != '{' &&
        after != '"' && after != '\'' && after != '-') {
        return false;
    }
    size_t colon = blockColon(text);
    if (colon == std::string::npos || colon <= word.size()) return false;
    size_t subject = text.find_first_not_of(" \t", word.size());
    if (subject == std::string::npos || subject >= colon) return false;
    static const std::string kOperators = "=.,)]}:;+/%<>!&|^@";
    return kOperators.find(text[subject]) == std::string::npos;
}

/// Block keyword opening this line, looking through `async`. Empty if none.
std::string headerKeyword(const std::string& text) {
    std::string word = leadingWord(text);
    if (isSoftHeader(text, word)) return word;
    if (word == "async") {
        size_t next = text.find_first_not_of(" \t", word.size());
        if (next == std::string::npos) return "";
        word = leadingWord(text, next);
        if (word != "def" && word != "for" && word != "with") return "";
    }
    // `else`/`try`/`finally` may only be followed by the colon.
    if (isBlockKeyword(word) && text.size() > word.size()) {
        char after = text[word.size()];
        if (std::isalnum(static_cast<unsigned char>(after)) || after == '_') return "";
        if (after == '.' || after == '=' || after == ',' || after == '[' || after == ')') return "";
    }
    return isBlockKeyword(word) ? word : "";
}

/// Position of the colon that ends a block header, ignoring colons inside
/// brackets and the walrus operator.
size_t blockColon(const std::string& text) {
    int depth = 0;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '(' || c == '[' || c == '{') depth++;
        else if (c == ')' || c == ']' || c == '}') depth--;
        else if (c == ':' && depth == 0) {
            if (i + 1 < text.size() && text[i + 1] == '=') continue;
            return i;
        }
    }
    return std::string::npos;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool bracketsBalanced(const std::string& s) {
    int depth = 0;
    for (char c : s) {
        if (c == '(' || c == '[' || c == '{') depth++;
        else if (c == ')' || c == ']' || c == '}') depth--;
    }
    return depth == 0;
}

bool needsColon(const std::string& stripped) {
    if (stripped.empty()) return false;
    char last = stripped.back();
    if (last == ':' || last == '\\' || last == ',') return false;
    if (stripped.find('#') != std::string::npos) return false;
    std::string word = headerKeyword(stripped);
    if (word.empty()) return false;
    if ((word == "else" || word == "try" || word == "finally") && stripped != word) return false;
    return bracketsBalanced(stripped);
}

} // namespace

// ─── Syntax Checker ────────────────────────────────────────────

SyntaxReport SyntaxChecker::check(const std::string& source) const {
    if (source.find_first_not_of(" \t\r\n\f") == std::string::npos) {
        return {false, 0, "empty source"};
    }

    LexResult lexed = lexer_.lex(source);
    if (lexed.error) {
        return {false, lexed.error->line, lexed.error->message};
    }

    static const RE2 def_header("^(?:async\\s+)?def\\s+[A-Za-z_]\\w*\\s*\\(");
    static const RE2 class_header("^class\\s+[A-Za-z_]\\w*\\s*[(:]");

    std::vector<int> indents{0};
    bool expect_block = false;
    int header_line = 0;
    std::string header_word;

    auto missingBlock = [&](int at) -> SyntaxReport {
        return {false, at, "expected an indented block after '" + header_word +
                           "' statement on line " + std::to_string(header_line)};
    };

    for (const auto& ln : lexed.lines) {
        if (expect_block) {
            if (ln.indent <= indents.back()) return missingBlock(ln.line);
            indents.push_back(ln.indent);
            expect_block = false;
        } else if (ln.indent > indents.back()) {
            return {false, ln.line, "unexpected indent"};
        } else if (ln.indent < indents.back()) {
            while (indents.size() > 1 && ln.indent < indents.back()) indents.pop_back();
            if (ln.indent != indents.back()) {
                return {false, ln.line, "unindent does not match any outer indentation level"};
            }
        }

        std::string word = headerKeyword(ln.text);
        if (word.empty()) continue;

        if (word == "def" && !RE2::PartialMatch(ln.text, def_header)) {
            return {false, ln.line, "invalid syntax in 'def' statement"};
        }
        if (word == "class" && !RE2::PartialMatch(ln.text, class_header)) {
            return {false, ln.line, "invalid syntax in 'class' statement"};
        }

        size_t colon = blockColon(ln.text);
        if (colon == std::string::npos) {
            return {false, ln.line, "expected ':'"};
        }
        if (trim(ln.text.substr(colon + 1)).empty()) {
            expect_block = true;
            header_line = ln.line;
            header_word = word;
        }
    }

    if (expect_block) return missingBlock(header_line);
    return {true, 0, ""};
}

std::string SyntaxChecker::repair(const std::string& source) const {
    std::istringstream in(source);
    std::string line;
    std::string out;
    bool first = true;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string stripped = trim(line);
        if (stripped.rfind("```", 0) == 0) continue;
        if (needsColon(stripped)) {
            line = line.substr(0, line.find_last_not_of(" \t") + 1) + ":";
        }
        if (!first) out += '\n';
        out += line;
        first = false;
    }
    if (!source.empty() && source.back() == '\n') out += '\n';
    return out;
}

// ─── Security rules ────────────────────────────────────────────

const std::vector<std::string>& blockedModules() {
    static const std::vector<std::string> modules = {"os", "subprocess", "importlib", "sys"};
    return modules;
}

const std::vector<std::string>& blockedCalls() {
    static const std::vector<std::string> calls = {"eval", "exec", "compile", "__import__", "open"};
    return calls;
}

std::string callPattern(const std::vector<std::string>& names) {
    std::string alternatives;
    for (const auto& name : names) {
        if (!alternatives.empty()) alternatives += '|';
        alternatives += RE2::QuoteMeta(name);
    }
    return "(?:^|[^.\\w])(?:" + alternatives + ")\\s*\\(";
}

} // namespace atdd
