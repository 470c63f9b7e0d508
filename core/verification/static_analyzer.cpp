#include "verification/verification.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace atdd {

namespace {

int countMatches(const std::string& text, const RE2& re) {
    int count = 0;
    re2::StringPiece input(text);
    while (RE2::FindAndConsume(&input, re)) count++;
    return count;
}

std::string lower(std::string s) {
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

/// First keyword of a statement with any `async` prefix removed.
std::string statementKeyword(const LogicalLine& ln) {
    std::string word = ln.firstWord();
    if (word == "async") {
        size_t next = ln.text.find_first_not_of(" \t", word.size());
        if (next == std::string::npos) return word;
        size_t end = next;
        while (end < ln.text.size() &&
               (std::isalnum(static_cast<unsigned char>(ln.text[end])) || ln.text[end] == '_')) {
            end++;
        }
        return ln.text.substr(next, end - next);
    }
    return word;
}

bool endsBlockHeader(const LogicalLine& ln) {
    return !ln.text.empty() && ln.text.back() == ':';
}

/// Index one past the last line of the block opened by lines[header].
size_t blockEnd(const std::vector<LogicalLine>& lines, size_t header) {
    size_t k = header + 1;
    while (k < lines.size() && lines[k].indent > lines[header].indent) k++;
    return k;
}

void addUnique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) out.push_back(value);
}

} // namespace

QualityMetrics StaticAnalyzer::analyze(const std::string& source) const {
    QualityMetrics metrics;

    std::istringstream in(source);
    std::string physical;
    while (std::getline(in, physical)) {
        if (!trim(physical).empty()) metrics.line_count++;
    }

    SyntaxReport syntax = syntax_.check(source);
    metrics.has_syntax_error = !syntax.valid;

    LexResult lexed = lexer_.lex(source);
    metrics.complexity = metrics.has_syntax_error ? 0 : complexity(lexed.lines);
    metrics.lint_error_count = lintErrors(source, lexed.lines);
    metrics.security_issue_count = securityIssues(lexed.lines);
    metrics.profile = profile(lexed);
    if (metrics.has_syntax_error) metrics.profile.conclusive = false;
    return metrics;
}

int StaticAnalyzer::complexity(const std::vector<LogicalLine>& lines) const {
    static const RE2 bool_op("\\b(?:and|or)\\b");
    int score = 1;
    for (const auto& ln : lines) {
        std::string keyword = statementKeyword(ln);
        if (keyword == "if" || keyword == "elif" || keyword == "for" ||
            keyword == "while" || keyword == "except") {
            score++;
        }
        score += countMatches(ln.text, bool_op);
    }
    return score;
}

int StaticAnalyzer::lintErrors(const std::string& source, const std::vector<LogicalLine>& lines) const {
    static const RE2 none_compare("[=!]=\\s*None\\b");
    static const RE2 bool_compare("[=!]=\\s*(?:True|False)\\b");
    static const RE2 bare_except("^except\\s*:");

    int errors = 0;

    std::istringstream in(source);
    std::string physical;
    while (std::getline(in, physical)) {
        if (!physical.empty() && physical.back() == '\r') physical.pop_back();
        if (physical.empty()) continue;
        if (physical.back() == ' ' || physical.back() == '\t') errors++;
        if (physical.front() == '\t') errors++;
        if (physical.size() > 100) errors++;
    }

    for (const auto& ln : lines) {
        errors += countMatches(ln.text, none_compare);
        errors += countMatches(ln.text, bool_compare);
        errors += static_cast<int>(std::count(ln.text.begin(), ln.text.end(), ';'));
        if (RE2::PartialMatch(ln.text, bare_except)) errors++;
    }
    return errors;
}

int StaticAnalyzer::securityIssues(const std::vector<LogicalLine>& lines) const {
    static const RE2 calls(callPattern(blockedCalls()));
    static const RE2 from_import("^from\\s+([\\w.]+)\\s+import\\b");

    auto blocked = [](const std::string& module) {
        std::string root = module.substr(0, module.find('.'));
        const auto& modules = blockedModules();
        return std::find(modules.begin(), modules.end(), root) != modules.end();
    };

    int issues = 0;
    for (const auto& ln : lines) {
        std::string keyword = ln.firstWord();
        std::string module;
        if (keyword == "import") {
            std::stringstream names(ln.text.substr(keyword.size()));
            std::string item;
            while (std::getline(names, item, ',')) {
                std::string name = trim(item);
                name = name.substr(0, name.find(' '));
                if (blocked(name)) issues++;
            }
        } else if (RE2::PartialMatch(ln.text, from_import, &module) && blocked(module)) {
            issues++;
        }
        issues += countMatches(ln.text, calls);
    }
    return issues;
}

SourceProfile StaticAnalyzer::profile(const LexResult& lexed) const {
    static const RE2 list_comp("\\[[^\\[\\]]*\\bfor\\b[^\\[\\]]*\\bin\\b");
    static const RE2 dict_comp("\\{[^{}]*:[^{}]*\\bfor\\b[^{}]*\\bin\\b");
    static const RE2 gen_expr("\\([^()\\[\\]{}]*\\bfor\\b[^()\\[\\]]*\\bin\\b");
    static const RE2 bare_except("^except\\s*:");
    static const RE2 magic_number("\\b\\d{3,}\\b");
    static const RE2 def_name("^(?:async\\s+)?def\\s+(\\w+)");
    static const RE2 halving("//=?\\s*2\\b|>>=?\\s*1\\b|/=\\s*2\\b|\\bbisect");

    const auto& lines = lexed.lines;

    SourceProfile profile;
    profile.conclusive = !lexed.error && !lines.empty();

    bool list = false, dict = false, context = false, gen = false, magic = false;
    std::vector<std::pair<int, bool>> blocks;  // indent, is loop

    for (size_t k = 0; k < lines.size(); k++) {
        const LogicalLine& ln = lines[k];
        const std::string keyword = statementKeyword(ln);

        if (RE2::PartialMatch(ln.text, list_comp)) list = true;
        if (RE2::PartialMatch(ln.text, dict_comp)) dict = true;
        if (RE2::PartialMatch(ln.text, gen_expr)) gen = true;
        if (keyword == "with") context = true;
        if (RE2::PartialMatch(ln.text, magic_number)) magic = true;
        if (RE2::PartialMatch(ln.text, halving)) profile.halving = true;

        if (RE2::PartialMatch(ln.text, bare_except)) profile.smells.push_back("bare_except");
        if (keyword == "global") profile.smells.push_back("global_statement");

        // Loop nesting.
        while (!blocks.empty() && blocks.back().first >= ln.indent) blocks.pop_back();
        if (endsBlockHeader(ln)) {
            bool loop = keyword == "for" || keyword == "while";
            if (loop) {
                int depth = 1 + static_cast<int>(std::count_if(
                    blocks.begin(), blocks.end(), [](const auto& b) { return b.second; }));
                profile.max_loop_depth = std::max(profile.max_loop_depth, depth);
            }
            blocks.push_back({ln.indent, loop});
        }

        // Documentation.
        if ((keyword == "def" || keyword == "class") && endsBlockHeader(ln) &&
            k + 1 < lines.size() && lines[k + 1].indent > ln.indent &&
            lines[k + 1].isStringOnly() && trim(lines[k + 1].strings.front()).size() > 10) {
            profile.documented_definitions++;
        }

        std::string name;
        if (keyword != "def" || !RE2::PartialMatch(ln.text, def_name, &name)) continue;

        size_t end = blockEnd(lines, k);
        int last_line = end > k + 1 ? lines[end - 1].end_line : ln.end_line;
        if (last_line - ln.line > 50) profile.smells.push_back("long_function_" + name);

        RE2 self_call("(?:^|[^.\\w])" + RE2::QuoteMeta(name) + "\\s*\\(");
        RecursiveFunction fn;
        fn.name = name;
        for (size_t b = k + 1; b < end; b++) {
            fn.self_calls += countMatches(lines[b].text, self_call);
            if (lower(lines[b].text).find("memo") != std::string::npos) fn.memoized = true;
        }
        for (size_t d = k; d > 0 && lines[d - 1].indent == ln.indent && lines[d - 1].text[0] == '@'; d--) {
            std::string decorator = lower(lines[d - 1].text);
            if (decorator.find("cache") != std::string::npos ||
                decorator.find("memo") != std::string::npos) {
                fn.memoized = true;
            }
        }
        if (fn.self_calls > 0) profile.recursive_functions.push_back(fn);
    }

    if (magic) profile.smells.push_back("magic_numbers");

    if (list) addUnique(profile.idioms, "list_comprehension");
    if (dict) addUnique(profile.idioms, "dict_comprehension");
    if (context) addUnique(profile.idioms, "context_manager");
    if (gen) addUnique(profile.idioms, "generator_expression");
    if (lexed.uses_fstrings) addUnique(profile.idioms, "f_string");

    return profile;
}

bool SourceProfile::hasIdiom(const std::string& idiom) const {
    return std::find(idioms.begin(), idioms.end(), idiom) != idioms.end();
}

} // namespace atdd
