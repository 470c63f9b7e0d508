#include "verification/python_lexer.hpp"
#include <cctype>

namespace atdd {

namespace {

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isStringPrefix(const std::string& word) {
    if (word.empty() || word.size() > 2) return false;
    for (char c : word) {
        switch (c) {
            case 'r': case 'R': case 'b': case 'B':
            case 'u': case 'U': case 'f': case 'F':
                break;
            default:
                return false;
        }
    }
    return true;
}

char closerFor(char opener) {
    switch (opener) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

void rtrim(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
}

} // namespace

bool LogicalLine::isStringOnly() const {
    if (strings.size() != 1) return false;
    size_t i = 0;
    while (i < text.size() && isStringPrefix(std::string(1, text[i]))) i++;
    if (i >= text.size()) return false;
    char q = text[i];
    if (q != '"' && q != '\'') return false;
    for (size_t j = i; j < text.size(); j++) {
        if (text[j] != q) return false;
    }
    return true;
}

std::string LogicalLine::firstWord() const {
    size_t i = 0;
    while (i < text.size() && isIdentChar(text[i])) i++;
    return text.substr(0, i);
}

LexResult PythonLexer::lex(const std::string& source) const {
    LexResult result;
    const size_t n = source.size();
    size_t i = 0;
    int line = 1;

    LogicalLine current;
    bool open = false;
    std::vector<std::pair<char, int>> brackets;  // opener, line

    auto finish = [&]() {
        if (open) {
            rtrim(current.text);
            current.end_line = line;
            if (!current.text.empty()) result.lines.push_back(std::move(current));
        }
        current = LogicalLine{};
        open = false;
    };
    auto fail = [&](int at, std::string message) {
        result.error = LexError{at, std::move(message)};
    };

    while (i < n) {
        if (!open) {
            int col = 0;
            bool tab = false;
            size_t j = i;
            while (j < n && (source[j] == ' ' || source[j] == '\t' || source[j] == '\f')) {
                if (source[j] == '\t') {
                    tab = true;
                    col = (col / 8 + 1) * 8;
                } else if (source[j] == ' ') {
                    col++;
                }
                j++;
            }
            if (j >= n) break;
            if (source[j] == '\n' || source[j] == '\r' || source[j] == '#') {
                // Blank or comment-only line.
                while (j < n && source[j] != '\n') j++;
                if (j < n) { j++; line++; }
                i = j;
                continue;
            }
            current.line = line;
            current.indent = col;
            current.tab_indent = tab;
            open = true;
            i = j;
        }

        char c = source[i];

        if (c == '#') {
            while (i < n && source[i] != '\n') i++;
            continue;
        }
        if (c == '\r') { i++; continue; }
        if (c == '\\') {
            size_t k = i + 1;
            if (k < n && source[k] == '\r') k++;
            if (k < n && source[k] == '\n') {
                current.text += ' ';
                line++;
                i = k + 1;
                continue;
            }
            if (k >= n) {
                fail(line, "unexpected EOF after line continuation character");
                return result;
            }
            current.text += c;
            i++;
            continue;
        }
        if (c == '\n') {
            i++;
            if (brackets.empty()) {
                finish();
                line++;
            } else {
                current.text += ' ';
                line++;
            }
            continue;
        }

        std::string prefix;
        if (isIdentStart(c)) {
            size_t j = i;
            while (j < n && isIdentChar(source[j])) j++;
            std::string word = source.substr(i, j - i);
            if (j < n && (source[j] == '"' || source[j] == '\'') && isStringPrefix(word)) {
                prefix = word;
                i = j;
                c = source[i];
            } else {
                current.text += word;
                i = j;
                continue;
            }
        }

        if (c == '"' || c == '\'') {
            const int start_line = line;
            const bool triple = i + 2 < n && source[i + 1] == c && source[i + 2] == c;
            const size_t quote_len = triple ? 3 : 1;
            bool raw = false;
            bool fstring = false;
            for (char p : prefix) {
                if (p == 'r' || p == 'R') raw = true;
                if (p == 'f' || p == 'F') fstring = true;
            }

            std::string content;
            size_t j = i + quote_len;
            bool closed = false;
            while (j < n) {
                char d = source[j];
                if (d == '\\' && !raw && j + 1 < n) {
                    if (source[j + 1] == '\n') line++;
                    content += d;
                    content += source[j + 1];
                    j += 2;
                    continue;
                }
                if (d == '\\' && raw && j + 1 < n && source[j + 1] == c) {
                    content += d;
                    content += source[j + 1];
                    j += 2;
                    continue;
                }
                if (triple) {
                    if (d == c && j + 2 < n && source[j + 1] == c && source[j + 2] == c) {
                        closed = true;
                        j += 3;
                        break;
                    }
                } else if (d == c) {
                    closed = true;
                    j += 1;
                    break;
                } else if (d == '\n') {
                    break;
                }
                if (d == '\n') line++;
                content += d;
                j++;
            }
            if (!closed) {
                fail(start_line, triple ? "unterminated triple-quoted string literal"
                                        : "unterminated string literal");
                return result;
            }

            current.text += prefix;
            current.text.append(quote_len * 2, c);
            current.strings.push_back(std::move(content));
            if (fstring) {
                current.has_fstring = true;
                result.uses_fstrings = true;
            }
            i = j;
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            brackets.push_back({c, line});
        } else if (c == ')' || c == ']' || c == '}') {
            if (brackets.empty()) {
                fail(line, std::string("unmatched '") + c + "'");
                return result;
            }
            char opener = brackets.back().first;
            if (closerFor(opener) != c) {
                fail(line, std::string("closing parenthesis '") + c +
                           "' does not match opening parenthesis '" + opener + "'");
                return result;
            }
            brackets.pop_back();
        }
        current.text += c;
        i++;
    }

    if (!brackets.empty()) {
        fail(brackets.back().second, std::string("'") + brackets.back().first + "' was never closed");
        return result;
    }
    finish();
    return result;
}

} // namespace atdd
